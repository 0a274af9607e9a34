#include "response_translator.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace bridge {
namespace {

static std::optional<nlohmann::json> ParseBackendObject(const std::string& body, ApiError* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = MakeApiError(ErrorKind::kInternal, "Error parsing backend response. Body: " + body);
    return std::nullopt;
  }
  return j;
}

static const nlohmann::json* FirstChoice(const nlohmann::json& j) {
  auto it = j.find("choices");
  if (it == j.end() || !it->is_array() || it->empty()) return nullptr;
  const auto& c = it->front();
  if (!c.is_object()) return nullptr;
  return &c;
}

static std::string CreatedAt(const nlohmann::json& j) {
  auto it = j.find("created");
  if (it != j.end() && it->is_number_integer()) return FormatRfc3339Utc(it->get<int64_t>());
  return FormatRfc3339Utc(0);
}

static bool ReadVector(const nlohmann::json& j, std::vector<double>* out) {
  if (!j.is_array()) return false;
  out->reserve(j.size());
  for (const auto& v : j) {
    if (!v.is_number()) return false;
    out->push_back(v.get<double>());
  }
  return true;
}

}  // namespace

std::string FinishReasonToSource(const std::string& reason) {
  if (reason.empty()) return {};
  if (reason == "stop" || reason == "length" || reason == "content_filter" || reason == "tool_calls") return reason;
  return "unknown";
}

std::string RoleToSource(const std::string& role) {
  return role;
}

std::string JsonString(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) return {};
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

std::optional<Usage> JsonUsage(const nlohmann::json& j) {
  auto it = j.find("usage");
  if (it == j.end() || !it->is_object()) return std::nullopt;
  Usage u;
  // Counters that are missing or out of range stay zero.
  int64_t n = 0;
  if (auto p = it->find("prompt_tokens"); p != it->end() && JsonToInt64(*p, &n)) u.prompt_tokens = n;
  if (auto c = it->find("completion_tokens"); c != it->end() && JsonToInt64(*c, &n)) u.completion_tokens = n;
  return u;
}

nlohmann::json ParseToolArguments(const std::string& text) {
  if (text.empty()) return nlohmann::json::object();
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return nlohmann::json::object();
  return j;
}

std::vector<ToolCall> BackendToolCallsToSource(const nlohmann::json& tool_calls) {
  std::vector<ToolCall> out;
  if (!tool_calls.is_array()) return out;
  int index = 0;
  for (const auto& tc : tool_calls) {
    ToolCall call;
    call.id = JsonString(tc, "id");
    call.type = JsonString(tc, "type");
    if (tc.is_object()) {
      if (auto f = tc.find("function"); f != tc.end() && f->is_object()) {
        call.function.name = JsonString(*f, "name");
        if (auto a = f->find("arguments"); a != f->end()) {
          call.function.arguments = a->is_object() ? *a : ParseToolArguments(a->is_string() ? a->get<std::string>() : "");
        }
      }
    }
    call.function.index = index++;
    out.push_back(std::move(call));
  }
  return out;
}

ApiError UpstreamErrorFromBody(int status, const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    auto it = j.find("error");
    if (it != j.end()) {
      auto message = JsonString(*it, "message");
      if (!message.empty()) return MakeUpstreamError(status, std::move(message));
    }
  }
  return MakeUpstreamError(status, "Upstream error: " + body);
}

std::optional<ChatResponse> TranslateChatResponse(const std::string& body, const std::string& model, ApiError* err) {
  auto j = ParseBackendObject(body, err);
  if (!j) return std::nullopt;
  const auto* choice = FirstChoice(*j);
  if (!choice) {
    if (err) *err = MakeApiError(ErrorKind::kInternal, "Backend response contained no choices.");
    return std::nullopt;
  }

  ChatResponse resp;
  resp.model = model;
  resp.created_at = CreatedAt(*j);
  resp.done = true;
  resp.done_reason = FinishReasonToSource(JsonString(*choice, "finish_reason"));
  resp.usage = JsonUsage(*j);

  const nlohmann::json message = choice->contains("message") ? (*choice)["message"] : nlohmann::json::object();
  resp.message.role = RoleToSource(JsonString(message, "role"));
  resp.message.content = JsonString(message, "content");
  resp.message.thinking = JsonString(message, "reasoning_content");
  if (message.is_object() && message.contains("tool_calls")) {
    resp.message.tool_calls = BackendToolCallsToSource(message["tool_calls"]);
  }
  return resp;
}

std::optional<GenerateResponse> TranslateGenerateResponse(const std::string& body,
                                                          const std::string& model,
                                                          ApiError* err) {
  auto j = ParseBackendObject(body, err);
  if (!j) return std::nullopt;
  const auto* choice = FirstChoice(*j);
  if (!choice) {
    if (err) *err = MakeApiError(ErrorKind::kInternal, "Backend response contained no choices.");
    return std::nullopt;
  }

  GenerateResponse resp;
  resp.model = model;
  resp.created_at = CreatedAt(*j);
  resp.response = JsonString(*choice, "text");
  resp.done = true;
  resp.done_reason = FinishReasonToSource(JsonString(*choice, "finish_reason"));
  resp.usage = JsonUsage(*j);
  return resp;
}

std::optional<EmbedResponse> TranslateEmbedResponse(const std::string& body, const std::string& model, ApiError* err) {
  auto j = ParseBackendObject(body, err);
  if (!j) return std::nullopt;

  EmbedResponse resp;
  resp.model = model;
  if (auto it = j->find("data"); it != j->end() && it->is_array()) {
    for (const auto& d : *it) {
      std::vector<double> vec;
      if (!d.is_object() || !d.contains("embedding") || !ReadVector(d["embedding"], &vec)) {
        if (err) *err = MakeApiError(ErrorKind::kInternal, "Error parsing backend response. Body: " + body);
        return std::nullopt;
      }
      resp.embeddings.push_back(std::move(vec));
    }
  }
  if (auto usage = JsonUsage(*j)) resp.prompt_eval_count = usage->prompt_tokens;
  return resp;
}

std::optional<LegacyEmbeddingsResponse> TranslateLegacyEmbeddingsResponse(const std::string& body, ApiError* err) {
  auto j = ParseBackendObject(body, err);
  if (!j) return std::nullopt;
  auto it = j->find("data");
  if (it == j->end() || !it->is_array() || it->empty()) {
    if (err) *err = MakeApiError(ErrorKind::kInternal, "Backend response contained no embeddings.");
    return std::nullopt;
  }
  LegacyEmbeddingsResponse resp;
  const auto& first = it->front();
  if (!first.is_object() || !first.contains("embedding") || !ReadVector(first["embedding"], &resp.embedding)) {
    if (err) *err = MakeApiError(ErrorKind::kInternal, "Error parsing backend response. Body: " + body);
    return std::nullopt;
  }
  return resp;
}

}  // namespace bridge
