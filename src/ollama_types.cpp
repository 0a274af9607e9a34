#include "ollama_types.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <limits>
#include <string>
#include <utility>

namespace bridge {
namespace {

static int StatusForKind(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kBadRequest:
      return 400;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kNotImplemented:
      return 501;
    case ErrorKind::kUpstream:
      return 502;
    case ErrorKind::kInternal:
      break;
  }
  return 500;
}

static bool Fail(std::string* err, const std::string& message) {
  if (err) *err = message;
  return false;
}

static bool ReadString(const nlohmann::json& j, const char* key, std::string* out, std::string* err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_string()) return Fail(err, std::string("field '") + key + "' must be a string");
  *out = it->get<std::string>();
  return true;
}

static bool ReadBool(const nlohmann::json& j, const char* key, std::optional<bool>* out, std::string* err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_boolean()) return Fail(err, std::string("field '") + key + "' must be a boolean");
  *out = it->get<bool>();
  return true;
}

static bool ReadStringArray(const nlohmann::json& j, const char* key, std::vector<std::string>* out, std::string* err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_array()) return Fail(err, std::string("field '") + key + "' must be an array of strings");
  for (const auto& v : *it) {
    if (!v.is_string()) return Fail(err, std::string("field '") + key + "' must be an array of strings");
    out->push_back(v.get<std::string>());
  }
  return true;
}

static bool ReadOptions(const nlohmann::json& j, nlohmann::json* out, std::string* err) {
  auto it = j.find("options");
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_object()) return Fail(err, "field 'options' must be an object");
  *out = *it;
  return true;
}

static KeepAlive ReadKeepAlive(const nlohmann::json& j) {
  auto it = j.find("keep_alive");
  if (it == j.end()) return {};
  return KeepAlive::FromJson(*it);
}

static bool ParseToolCall(const nlohmann::json& j, ToolCall* out, std::string* err) {
  if (!j.is_object()) return Fail(err, "tool_calls entries must be objects");
  if (!ReadString(j, "id", &out->id, err)) return false;
  if (!ReadString(j, "type", &out->type, err)) return false;
  auto fit = j.find("function");
  if (fit == j.end() || fit->is_null()) return true;
  if (!fit->is_object()) return Fail(err, "field 'function' must be an object");
  const auto& f = *fit;
  if (!ReadString(f, "name", &out->function.name, err)) return false;
  if (auto iit = f.find("index"); iit != f.end() && !iit->is_null()) {
    if (!iit->is_number_integer()) return Fail(err, "field 'index' must be an integer");
    if (!JsonToInt(*iit, &out->function.index)) return Fail(err, "field 'index' is out of range");
  }
  auto ait = f.find("arguments");
  if (ait == f.end() || ait->is_null()) return true;
  if (ait->is_object()) {
    out->function.arguments = *ait;
    return true;
  }
  if (ait->is_string()) {
    // Some clients send the backend-style string form.
    auto parsed = nlohmann::json::parse(ait->get<std::string>(), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
      out->function.arguments = std::move(parsed);
      return true;
    }
  }
  return Fail(err, "field 'arguments' must be an object");
}

static bool ParseMessage(const nlohmann::json& j, Message* out, std::string* err) {
  if (!j.is_object()) return Fail(err, "messages entries must be objects");
  if (!ReadString(j, "role", &out->role, err)) return false;
  if (!ReadString(j, "content", &out->content, err)) return false;
  if (!ReadString(j, "thinking", &out->thinking, err)) return false;
  if (!ReadStringArray(j, "images", &out->images, err)) return false;
  if (!ReadString(j, "tool_call_id", &out->tool_call_id, err)) return false;
  if (!ReadString(j, "tool_name", &out->tool_name, err)) return false;
  auto it = j.find("tool_calls");
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_array()) return Fail(err, "field 'tool_calls' must be an array");
  for (const auto& tc : *it) {
    ToolCall call;
    if (!ParseToolCall(tc, &call, err)) return false;
    out->tool_calls.push_back(std::move(call));
  }
  return true;
}

static bool ParseTool(const nlohmann::json& j, Tool* out, std::string* err) {
  if (!j.is_object()) return Fail(err, "tools entries must be objects");
  if (!ReadString(j, "type", &out->type, err)) return false;
  auto fit = j.find("function");
  if (fit == j.end() || fit->is_null()) return true;
  if (!fit->is_object()) return Fail(err, "field 'function' must be an object");
  if (!ReadString(*fit, "name", &out->function.name, err)) return false;
  if (!ReadString(*fit, "description", &out->function.description, err)) return false;
  if (auto pit = fit->find("parameters"); pit != fit->end()) out->function.parameters = *pit;
  return true;
}

static bool RequireObject(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) return Fail(err, "request body must be a JSON object");
  return true;
}

static std::string FormatTime(std::time_t seconds, long nanos) {
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string out(buf);
  if (nanos > 0) {
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%09ld", nanos);
    std::string f(frac);
    while (!f.empty() && f.back() == '0') f.pop_back();
    out += f;
  }
  out += "Z";
  return out;
}

}  // namespace

ApiError MakeApiError(ErrorKind kind, std::string message) {
  ApiError e;
  e.kind = kind;
  e.status = StatusForKind(kind);
  e.message = std::move(message);
  return e;
}

ApiError MakeUpstreamError(int status, std::string message) {
  ApiError e;
  e.kind = ErrorKind::kUpstream;
  e.status = status;
  e.message = std::move(message);
  return e;
}

KeepAlive KeepAlive::FromJson(const nlohmann::json& j) {
  KeepAlive k;
  if (j.is_null()) return k;
  if (j.is_string()) {
    k.kind = Kind::kText;
    k.text = j.get<std::string>();
  } else if (j.is_number_unsigned()) {
    k.kind = Kind::kUnsigned;
    k.unsigned_integer = j.get<uint64_t>();
  } else if (j.is_number_integer()) {
    k.kind = Kind::kInteger;
    k.integer = j.get<int64_t>();
  } else if (j.is_number_float()) {
    k.kind = Kind::kFloat;
    k.number = j.get<double>();
  } else {
    k.kind = Kind::kOther;
    k.other = j;
  }
  return k;
}

KeepAlive KeepAlive::FromNumericText(std::string text) {
  KeepAlive k;
  k.kind = Kind::kNumericText;
  k.text = std::move(text);
  return k;
}

JsonDirective JsonDirective::FromJson(const nlohmann::json& j) {
  JsonDirective d;
  if (j.is_null()) return d;
  if (j.is_string()) {
    d.kind = Kind::kLiteral;
    d.literal = j.get<std::string>();
  } else if (j.is_object()) {
    d.kind = Kind::kSchema;
  } else {
    d.kind = Kind::kPassthrough;
  }
  d.value = j;
  return d;
}

bool ParseChatRequest(const nlohmann::json& j, ChatRequest* out, std::string* err) {
  if (!RequireObject(j, err)) return false;
  if (!ReadString(j, "model", &out->model, err)) return false;
  if (!ReadBool(j, "stream", &out->stream, err)) return false;
  if (!ReadBool(j, "think", &out->think, err)) return false;
  if (!ReadOptions(j, &out->options, err)) return false;
  if (auto it = j.find("messages"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) return Fail(err, "field 'messages' must be an array");
    for (const auto& m : *it) {
      Message msg;
      if (!ParseMessage(m, &msg, err)) return false;
      out->messages.push_back(std::move(msg));
    }
  }
  if (auto it = j.find("tools"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) return Fail(err, "field 'tools' must be an array");
    for (const auto& t : *it) {
      Tool tool;
      if (!ParseTool(t, &tool, err)) return false;
      out->tools.push_back(std::move(tool));
    }
  }
  if (auto it = j.find("tool_choice"); it != j.end()) out->tool_choice = JsonDirective::FromJson(*it);
  if (auto it = j.find("format"); it != j.end()) out->format = JsonDirective::FromJson(*it);
  out->keep_alive = ReadKeepAlive(j);
  return true;
}

bool ParseGenerateRequest(const nlohmann::json& j, GenerateRequest* out, std::string* err) {
  if (!RequireObject(j, err)) return false;
  if (!ReadString(j, "model", &out->model, err)) return false;
  if (!ReadString(j, "prompt", &out->prompt, err)) return false;
  if (!ReadString(j, "system", &out->system, err)) return false;
  if (!ReadString(j, "template", &out->template_text, err)) return false;
  if (!ReadBool(j, "stream", &out->stream, err)) return false;
  if (!ReadBool(j, "think", &out->think, err)) return false;
  std::optional<bool> raw;
  if (!ReadBool(j, "raw", &raw, err)) return false;
  out->raw = raw.value_or(false);
  if (!ReadStringArray(j, "images", &out->images, err)) return false;
  if (!ReadOptions(j, &out->options, err)) return false;
  if (auto it = j.find("format"); it != j.end()) out->format = JsonDirective::FromJson(*it);
  out->keep_alive = ReadKeepAlive(j);
  return true;
}

bool ParseEmbedRequest(const nlohmann::json& j, EmbedRequest* out, std::string* err) {
  if (!RequireObject(j, err)) return false;
  if (!ReadString(j, "model", &out->model, err)) return false;
  if (!ReadBool(j, "truncate", &out->truncate, err)) return false;
  if (!ReadOptions(j, &out->options, err)) return false;
  if (auto it = j.find("input"); it != j.end() && !it->is_null()) {
    bool ok = it->is_string();
    if (it->is_array()) {
      ok = true;
      for (const auto& v : *it) {
        if (!v.is_string()) ok = false;
      }
    }
    if (!ok) return Fail(err, "field 'input' must be a string or an array of strings");
    out->input = *it;
  }
  out->keep_alive = ReadKeepAlive(j);
  return true;
}

bool ParseLegacyEmbeddingsRequest(const nlohmann::json& j, LegacyEmbeddingsRequest* out, std::string* err) {
  if (!RequireObject(j, err)) return false;
  if (!ReadString(j, "model", &out->model, err)) return false;
  if (!ReadString(j, "prompt", &out->prompt, err)) return false;
  if (!ReadOptions(j, &out->options, err)) return false;
  out->keep_alive = ReadKeepAlive(j);
  return true;
}

bool ParseShowRequest(const nlohmann::json& j, ShowRequest* out, std::string* err) {
  if (!RequireObject(j, err)) return false;
  if (!ReadString(j, "model", &out->model, err)) return false;
  return ReadString(j, "name", &out->name, err);
}

nlohmann::json ToJson(const ToolCall& call) {
  nlohmann::json j;
  if (!call.id.empty()) j["id"] = call.id;
  if (!call.type.empty()) j["type"] = call.type;
  nlohmann::json f;
  if (call.function.index != 0) f["index"] = call.function.index;
  f["name"] = call.function.name;
  f["arguments"] = call.function.arguments;
  j["function"] = std::move(f);
  return j;
}

nlohmann::json ToJson(const Message& message) {
  nlohmann::json j;
  j["role"] = message.role;
  j["content"] = message.content;
  if (!message.thinking.empty()) j["thinking"] = message.thinking;
  if (!message.images.empty()) j["images"] = message.images;
  if (!message.tool_calls.empty()) {
    j["tool_calls"] = nlohmann::json::array();
    for (const auto& tc : message.tool_calls) j["tool_calls"].push_back(ToJson(tc));
  }
  if (!message.tool_call_id.empty()) j["tool_call_id"] = message.tool_call_id;
  if (!message.tool_name.empty()) j["tool_name"] = message.tool_name;
  return j;
}

nlohmann::json ToJson(const ChatResponse& resp) {
  nlohmann::json j;
  j["model"] = resp.model;
  j["created_at"] = resp.created_at;
  j["message"] = ToJson(resp.message);
  j["done"] = resp.done;
  if (!resp.done_reason.empty()) j["done_reason"] = resp.done_reason;
  if (resp.usage) {
    j["prompt_eval_count"] = resp.usage->prompt_tokens;
    j["eval_count"] = resp.usage->completion_tokens;
  }
  return j;
}

nlohmann::json ToJson(const GenerateResponse& resp) {
  nlohmann::json j;
  j["model"] = resp.model;
  j["created_at"] = resp.created_at;
  j["response"] = resp.response;
  j["done"] = resp.done;
  if (!resp.done_reason.empty()) j["done_reason"] = resp.done_reason;
  if (resp.usage) {
    j["prompt_eval_count"] = resp.usage->prompt_tokens;
    j["eval_count"] = resp.usage->completion_tokens;
  }
  return j;
}

nlohmann::json ToJson(const EmbedResponse& resp) {
  nlohmann::json j;
  j["model"] = resp.model;
  j["embeddings"] = resp.embeddings;
  if (resp.prompt_eval_count != 0) j["prompt_eval_count"] = resp.prompt_eval_count;
  return j;
}

nlohmann::json ToJson(const LegacyEmbeddingsResponse& resp) {
  nlohmann::json j;
  j["embedding"] = resp.embedding;
  return j;
}

nlohmann::json ToJson(const ModelDetails& details) {
  nlohmann::json j;
  if (!details.format.empty()) j["format"] = details.format;
  if (!details.family.empty()) j["family"] = details.family;
  if (!details.family.empty() && details.family != "unknown") j["families"] = nlohmann::json::array({details.family});
  if (!details.parameter_size.empty()) j["parameter_size"] = details.parameter_size;
  if (!details.quantization_level.empty()) j["quantization_level"] = details.quantization_level;
  return j;
}

nlohmann::json MakeErrorBody(const std::string& message) {
  nlohmann::json j;
  j["error"] = message;
  return j;
}

std::string DumpJson(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool JsonToInt64(const nlohmann::json& j, int64_t* out) {
  if (j.is_number_unsigned()) {
    const auto v = j.get<uint64_t>();
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
    *out = static_cast<int64_t>(v);
    return true;
  }
  if (!j.is_number_integer()) return false;
  *out = j.get<int64_t>();
  return true;
}

bool JsonToInt(const nlohmann::json& j, int* out) {
  int64_t v = 0;
  if (!JsonToInt64(j, &v)) return false;
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
  *out = static_cast<int>(v);
  return true;
}

std::string FormatRfc3339Utc(int64_t unix_seconds) {
  return FormatTime(static_cast<std::time_t>(unix_seconds), 0);
}

std::string NowRfc3339Utc() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now - secs);
  return FormatTime(static_cast<std::time_t>(secs.count()), static_cast<long>(nanos.count()));
}

std::string HexDigest(const std::string& name) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(name.size() * 2);
  for (unsigned char c : name) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0f]);
  }
  return out;
}

}  // namespace bridge
