#pragma once

#include "ollama_types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace bridge {

enum class StreamKind {
  kChat,
  kGenerate,
};

// Turns a backend SSE byte stream into newline-delimited source frames. One
// instance serves exactly one response; Write() buffers, Flush() emits.
class StreamTransformer {
 public:
  using Writer = std::function<bool(const std::string&)>;

  StreamTransformer(StreamKind kind, std::string model, Writer writer);

  void Write(const char* data, size_t len);
  void Write(const std::string& data) { Write(data.data(), data.size()); }

  // Emits frames for every complete line buffered so far. Returns false when
  // the writer refused the bytes.
  bool Flush();

  // End of stream: treats a trailing unterminated line as complete.
  bool Finish();

  bool saw_done_marker() const { return saw_done_marker_; }
  size_t pending_tool_calls() const { return tool_calls_.size(); }

 private:
  struct AccumulatedToolCall {
    std::string id;
    std::string type;
    std::string name;
    std::string arguments;
  };

  void ProcessLine(std::string line, std::string* out);
  void ProcessChatEvent(const nlohmann::json& event, std::string* out);
  void ProcessGenerateEvent(const nlohmann::json& event, std::string* out);
  void Accumulate(const nlohmann::json& delta_calls);
  std::vector<ToolCall> FinalizeToolCalls();
  bool Emit(const std::string& out);

  StreamKind kind_;
  std::string model_;
  Writer writer_;
  std::string buffer_;
  std::map<int, AccumulatedToolCall> tool_calls_;
  bool saw_done_marker_ = false;
};

}  // namespace bridge
