#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

enum class ErrorKind {
  kBadRequest,
  kNotFound,
  kNotImplemented,
  kInternal,
  kUpstream,
};

struct ApiError {
  ErrorKind kind = ErrorKind::kInternal;
  int status = 500;
  std::string message;
};

ApiError MakeApiError(ErrorKind kind, std::string message);
ApiError MakeUpstreamError(int status, std::string message);

// keep_alive arrives as a string, an integer, a float, or (from lexers that keep
// number text) an unparsed numeric string.
struct KeepAlive {
  enum class Kind {
    kAbsent,
    kInteger,
    kUnsigned,
    kFloat,
    kNumericText,
    kText,
    kOther,
  };

  Kind kind = Kind::kAbsent;
  int64_t integer = 0;
  uint64_t unsigned_integer = 0;
  double number = 0.0;
  std::string text;
  nlohmann::json other;

  static KeepAlive FromJson(const nlohmann::json& j);
  static KeepAlive FromNumericText(std::string text);
};

// Polymorphic directive used for "format" and "tool_choice".
struct JsonDirective {
  enum class Kind {
    kNone,
    kLiteral,
    kSchema,
    kPassthrough,
  };

  Kind kind = Kind::kNone;
  std::string literal;
  nlohmann::json value;

  static JsonDirective FromJson(const nlohmann::json& j);
  bool present() const { return kind != Kind::kNone; }
};

struct ToolCallFunction {
  int index = 0;
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
};

struct ToolCall {
  std::string id;
  std::string type;
  ToolCallFunction function;
};

struct Message {
  std::string role;
  std::string content;
  std::string thinking;
  std::vector<std::string> images;
  std::vector<ToolCall> tool_calls;
  std::string tool_call_id;
  std::string tool_name;
};

struct ToolFunction {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct Tool {
  std::string type;
  ToolFunction function;
};

struct ChatRequest {
  std::string model;
  std::vector<Message> messages;
  std::optional<bool> stream;
  std::vector<Tool> tools;
  JsonDirective tool_choice;
  std::optional<bool> think;
  JsonDirective format;
  nlohmann::json options;
  KeepAlive keep_alive;
};

struct GenerateRequest {
  std::string model;
  std::string prompt;
  std::string system;
  std::string template_text;
  std::optional<bool> stream;
  bool raw = false;
  std::optional<bool> think;
  JsonDirective format;
  std::vector<std::string> images;
  nlohmann::json options;
  KeepAlive keep_alive;
};

struct EmbedRequest {
  std::string model;
  nlohmann::json input;
  std::optional<bool> truncate;
  nlohmann::json options;
  KeepAlive keep_alive;
};

struct LegacyEmbeddingsRequest {
  std::string model;
  std::string prompt;
  nlohmann::json options;
  KeepAlive keep_alive;
};

struct ShowRequest {
  std::string model;
  std::string name;
};

struct Usage {
  int64_t prompt_tokens = 0;
  int64_t completion_tokens = 0;
};

struct ChatResponse {
  std::string model;
  std::string created_at;
  Message message;
  bool done = false;
  std::string done_reason;
  std::optional<Usage> usage;
};

struct GenerateResponse {
  std::string model;
  std::string created_at;
  std::string response;
  bool done = false;
  std::string done_reason;
  std::optional<Usage> usage;
};

struct EmbedResponse {
  std::string model;
  std::vector<std::vector<double>> embeddings;
  int64_t prompt_eval_count = 0;
};

struct LegacyEmbeddingsResponse {
  std::vector<double> embedding;
};

struct ModelDetails {
  std::string format = "gguf";
  std::string family;
  std::string parameter_size;
  std::string quantization_level;
};

bool ParseChatRequest(const nlohmann::json& j, ChatRequest* out, std::string* err);
bool ParseGenerateRequest(const nlohmann::json& j, GenerateRequest* out, std::string* err);
bool ParseEmbedRequest(const nlohmann::json& j, EmbedRequest* out, std::string* err);
bool ParseLegacyEmbeddingsRequest(const nlohmann::json& j, LegacyEmbeddingsRequest* out, std::string* err);
bool ParseShowRequest(const nlohmann::json& j, ShowRequest* out, std::string* err);

nlohmann::json ToJson(const ToolCall& call);
nlohmann::json ToJson(const Message& message);
nlohmann::json ToJson(const ChatResponse& resp);
nlohmann::json ToJson(const GenerateResponse& resp);
nlohmann::json ToJson(const EmbedResponse& resp);
nlohmann::json ToJson(const LegacyEmbeddingsResponse& resp);
nlohmann::json ToJson(const ModelDetails& details);

nlohmann::json MakeErrorBody(const std::string& message);

// Serializes for the wire. Invalid UTF-8 in strings is replaced, never thrown.
std::string DumpJson(const nlohmann::json& j);

// Reads an integer that fits the target range; anything else is rejected.
bool JsonToInt(const nlohmann::json& j, int* out);
bool JsonToInt64(const nlohmann::json& j, int64_t* out);

std::string FormatRfc3339Utc(int64_t unix_seconds);
std::string NowRfc3339Utc();
std::string HexDigest(const std::string& name);

}  // namespace bridge
