#include "request_translator.hpp"

#include <string>
#include <utility>

namespace bridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string SniffImageMime(const std::string& base64) {
  if (StartsWith(base64, "iVBOR")) return "image/png";
  if (StartsWith(base64, "R0lG")) return "image/gif";
  if (StartsWith(base64, "UklG")) return "image/webp";
  return "image/jpeg";
}

static std::string ImageUrl(const std::string& image) {
  if (StartsWith(image, "data:") || StartsWith(image, "http://") || StartsWith(image, "https://")) return image;
  return "data:" + SniffImageMime(image) + ";base64," + image;
}

static nlohmann::json ContentParts(const Message& msg) {
  nlohmann::json parts = nlohmann::json::array();
  if (!msg.content.empty()) parts.push_back({{"type", "text"}, {"text", msg.content}});
  for (const auto& image : msg.images) {
    parts.push_back({{"type", "image_url"}, {"image_url", {{"url", ImageUrl(image)}}}});
  }
  return parts;
}

static void ApplyThink(nlohmann::json* body, const std::optional<bool>& think) {
  if (!think) return;
  (*body)["chat_template_kwargs"] = {{"enable_thinking", *think}};
}

static void ApplyFormat(nlohmann::json* body, const JsonDirective& format) {
  switch (format.kind) {
    case JsonDirective::Kind::kLiteral:
      if (format.literal == "json") (*body)["response_format"] = {{"type", "json_object"}};
      break;
    case JsonDirective::Kind::kSchema:
      (*body)["response_format"] = {{"type", "json_schema"}, {"schema", format.value}};
      break;
    case JsonDirective::Kind::kPassthrough:
    case JsonDirective::Kind::kNone:
      break;
  }
}

}  // namespace

bool MessagesToBackend(const std::vector<Message>& messages, nlohmann::json* out, ApiError* err) {
  *out = nlohmann::json::array();
  for (size_t i = 0; i < messages.size(); i++) {
    const auto& msg = messages[i];
    nlohmann::json m;
    m["role"] = msg.role;
    m["content"] = msg.content;

    if (!msg.images.empty()) {
      if (msg.role != "user") {
        if (err) *err = MakeApiError(ErrorKind::kBadRequest, "Image input is only supported on user messages.");
        return false;
      }
      m["content"] = ContentParts(msg);
    }

    if (!msg.tool_calls.empty()) {
      nlohmann::json calls = nlohmann::json::array();
      size_t valid_index = 0;
      for (const auto& tc : msg.tool_calls) {
        if (tc.function.name.empty()) continue;
        nlohmann::json call;
        call["id"] = tc.id.empty() ? "call_" + std::to_string(i) + "_" + std::to_string(valid_index) : tc.id;
        call["type"] = tc.type.empty() ? "function" : tc.type;
        call["function"] = {{"name", tc.function.name}, {"arguments", tc.function.arguments.dump()}};
        calls.push_back(std::move(call));
        valid_index++;
      }
      if (!calls.empty()) m["tool_calls"] = std::move(calls);
    }

    if (msg.role == "tool") {
      if (!msg.tool_call_id.empty()) {
        m["tool_call_id"] = msg.tool_call_id;
      } else if (!msg.tool_name.empty()) {
        m["tool_call_id"] = "call_" + msg.tool_name + "_" + std::to_string(i);
      }
      // The backend rejects empty tool content.
      if (msg.content.empty()) m["content"] = "null";
    }

    out->push_back(std::move(m));
  }
  return true;
}

nlohmann::json ToolsToBackend(const std::vector<Tool>& tools) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& tool : tools) {
    nlohmann::json f;
    f["name"] = tool.function.name;
    f["description"] = tool.function.description;
    f["parameters"] = tool.function.parameters.is_null() ? nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}}
                                                         : tool.function.parameters;
    out.push_back({{"type", tool.type}, {"function", std::move(f)}});
  }
  return out;
}

void MergeOptions(nlohmann::json* body, const nlohmann::json& options) {
  if (!options.is_object()) return;
  for (auto it = options.begin(); it != options.end(); ++it) {
    if (!body->contains(it.key())) (*body)[it.key()] = it.value();
  }
}

std::optional<nlohmann::json> BuildChatBody(const ChatRequest& req, const std::string& backend_model, ApiError* err) {
  nlohmann::json messages;
  if (!MessagesToBackend(req.messages, &messages, err)) return std::nullopt;

  nlohmann::json body;
  body["model"] = backend_model;
  body["messages"] = std::move(messages);
  body["stream"] = req.stream.value_or(false);
  if (!req.tools.empty()) body["tools"] = ToolsToBackend(req.tools);
  if (req.tool_choice.present()) body["tool_choice"] = req.tool_choice.value;
  ApplyThink(&body, req.think);
  ApplyFormat(&body, req.format);
  MergeOptions(&body, req.options);
  return body;
}

std::optional<nlohmann::json> BuildCompletionBody(const GenerateRequest& req,
                                                  const std::string& backend_model,
                                                  ApiError* err) {
  if (req.raw) {
    if (err) *err = MakeApiError(ErrorKind::kNotImplemented, "Raw mode for /api/generate is not implemented.");
    return std::nullopt;
  }
  if (!req.images.empty()) {
    if (err) *err = MakeApiError(ErrorKind::kNotImplemented, "Image input for /api/generate is not implemented.");
    return std::nullopt;
  }

  std::string prompt = req.prompt;
  if (!req.system.empty()) prompt = req.system + "\n\n" + req.prompt;

  nlohmann::json body;
  body["model"] = backend_model;
  body["prompt"] = std::move(prompt);
  body["stream"] = req.stream.value_or(false);
  ApplyThink(&body, req.think);
  ApplyFormat(&body, req.format);
  MergeOptions(&body, req.options);
  return body;
}

nlohmann::json BuildEmbeddingsBody(const EmbedRequest& req, const std::string& backend_model) {
  nlohmann::json body;
  body["model"] = backend_model;
  body["input"] = req.input;
  MergeOptions(&body, req.options);
  return body;
}

nlohmann::json BuildLegacyEmbeddingsBody(const LegacyEmbeddingsRequest& req, const std::string& backend_model) {
  nlohmann::json body;
  body["model"] = backend_model;
  body["input"] = req.prompt;
  MergeOptions(&body, req.options);
  return body;
}

}  // namespace bridge
