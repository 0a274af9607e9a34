#include "stream_transformer.hpp"

#include "response_translator.hpp"

#include <string>
#include <utility>

namespace bridge {
namespace {

constexpr const char* kDataPrefix = "data: ";
constexpr const char* kDoneMarker = "[DONE]";

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static void AppendFrame(const nlohmann::json& frame, std::string* out) {
  *out += DumpJson(frame);
  *out += "\n";
}

static void AppendError(const std::string& message, std::string* out) {
  AppendFrame(MakeErrorBody("Error transforming stream: " + message), out);
}

// A non-data line survives only in the source error envelope shape.
static bool IsSourceErrorLine(const std::string& line) {
  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;
  auto it = j.find("error");
  return it != j.end() && it->is_string() && !it->get<std::string>().empty();
}

static bool ChoiceOf(const nlohmann::json& event, const nlohmann::json** choice, std::string* err) {
  *choice = nullptr;
  if (!event.is_object()) {
    *err = "event is not a JSON object";
    return false;
  }
  auto it = event.find("choices");
  if (it == event.end() || it->is_null()) return true;
  if (!it->is_array()) {
    *err = "field 'choices' is not an array";
    return false;
  }
  if (it->empty()) return true;
  if (!it->front().is_object()) {
    *err = "choice is not a JSON object";
    return false;
  }
  *choice = &it->front();
  return true;
}

}  // namespace

StreamTransformer::StreamTransformer(StreamKind kind, std::string model, Writer writer)
    : kind_(kind), model_(std::move(model)), writer_(std::move(writer)) {}

void StreamTransformer::Write(const char* data, size_t len) {
  if (saw_done_marker_ || len == 0) return;
  buffer_.append(data, len);
}

bool StreamTransformer::Flush() {
  std::string out;
  size_t start = 0;
  while (!saw_done_marker_) {
    const auto nl = buffer_.find('\n', start);
    if (nl == std::string::npos) break;
    ProcessLine(buffer_.substr(start, nl - start), &out);
    start = nl + 1;
  }
  if (saw_done_marker_) {
    buffer_.clear();
  } else {
    buffer_.erase(0, start);
  }
  return Emit(out);
}

bool StreamTransformer::Finish() {
  if (!Flush()) return false;
  if (saw_done_marker_ || buffer_.empty()) return true;
  std::string out;
  std::string line;
  line.swap(buffer_);
  ProcessLine(std::move(line), &out);
  return Emit(out);
}

bool StreamTransformer::Emit(const std::string& out) {
  if (out.empty()) return true;
  if (!writer_) return false;
  return writer_(out);
}

void StreamTransformer::ProcessLine(std::string line, std::string* out) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  if (line.empty()) return;

  if (!StartsWith(line, kDataPrefix)) {
    if (IsSourceErrorLine(line)) {
      *out += line;
      *out += "\n";
    }
    return;
  }

  const std::string payload = line.substr(std::char_traits<char>::length(kDataPrefix));
  if (payload == kDoneMarker) {
    saw_done_marker_ = true;
    return;
  }

  auto event = nlohmann::json::parse(payload, nullptr, false);
  if (event.is_discarded()) {
    AppendError("invalid JSON in event: " + payload, out);
    return;
  }
  if (kind_ == StreamKind::kChat) {
    ProcessChatEvent(event, out);
  } else {
    ProcessGenerateEvent(event, out);
  }
}

void StreamTransformer::ProcessChatEvent(const nlohmann::json& event, std::string* out) {
  const nlohmann::json* choice = nullptr;
  std::string err;
  if (!ChoiceOf(event, &choice, &err)) {
    AppendError(err, out);
    return;
  }
  if (!choice) return;

  const auto delta_it = choice->find("delta");
  const nlohmann::json delta = delta_it != choice->end() && delta_it->is_object() ? *delta_it : nlohmann::json::object();
  const std::string finish_reason = JsonString(*choice, "finish_reason");

  ChatResponse frame;
  frame.model = model_;
  frame.created_at = NowRfc3339Utc();
  frame.message.role = RoleToSource(JsonString(delta, "role"));
  if (frame.message.role.empty()) frame.message.role = "assistant";
  frame.message.content = JsonString(delta, "content");
  frame.message.thinking = JsonString(delta, "reasoning_content");

  if (auto tc = delta.find("tool_calls"); tc != delta.end()) Accumulate(*tc);

  if (finish_reason.empty()) {
    AppendFrame(ToJson(frame), out);
    return;
  }

  const auto usage = JsonUsage(event);
  std::vector<ToolCall> calls;
  if (!tool_calls_.empty()) calls = FinalizeToolCalls();

  if (calls.empty()) {
    frame.done = true;
    frame.done_reason = FinishReasonToSource(finish_reason);
    frame.usage = usage;
    AppendFrame(ToJson(frame), out);
    return;
  }

  // Tool calls go out in a done=false frame; clients read done_reason, then
  // wait for the terminal frame.
  frame.message.tool_calls = std::move(calls);
  frame.done = false;
  frame.done_reason = "tool_calls";
  AppendFrame(ToJson(frame), out);

  ChatResponse terminal;
  terminal.model = model_;
  terminal.created_at = NowRfc3339Utc();
  terminal.message.role = "assistant";
  terminal.done = true;
  terminal.done_reason = FinishReasonToSource(finish_reason);
  terminal.usage = usage;
  AppendFrame(ToJson(terminal), out);
}

void StreamTransformer::ProcessGenerateEvent(const nlohmann::json& event, std::string* out) {
  const nlohmann::json* choice = nullptr;
  std::string err;
  if (!ChoiceOf(event, &choice, &err)) {
    AppendError(err, out);
    return;
  }
  if (!choice) return;

  const std::string finish_reason = JsonString(*choice, "finish_reason");
  GenerateResponse frame;
  frame.model = model_;
  frame.created_at = NowRfc3339Utc();
  frame.response = JsonString(*choice, "text");
  frame.done = !finish_reason.empty();
  frame.done_reason = FinishReasonToSource(finish_reason);
  if (frame.done) frame.usage = JsonUsage(event);
  AppendFrame(ToJson(frame), out);
}

void StreamTransformer::Accumulate(const nlohmann::json& delta_calls) {
  if (!delta_calls.is_array()) return;
  for (const auto& d : delta_calls) {
    if (!d.is_object()) continue;
    int index = 0;
    if (auto it = d.find("index"); it != d.end() && !it->is_null()) {
      // An index that does not fit would alias another call's slot.
      if (!JsonToInt(*it, &index)) continue;
    }
    auto& acc = tool_calls_[index];

    if (auto id = JsonString(d, "id"); !id.empty()) acc.id = std::move(id);
    if (auto type = JsonString(d, "type"); !type.empty()) acc.type = std::move(type);
    auto fit = d.find("function");
    if (fit == d.end() || !fit->is_object()) continue;
    if (auto name = JsonString(*fit, "name"); !name.empty()) acc.name = std::move(name);
    acc.arguments += JsonString(*fit, "arguments");
  }
}

std::vector<ToolCall> StreamTransformer::FinalizeToolCalls() {
  std::vector<ToolCall> out;
  for (auto& [index, acc] : tool_calls_) {
    if (acc.name.empty()) continue;
    ToolCall call;
    call.id = std::move(acc.id);
    call.type = std::move(acc.type);
    call.function.index = index;
    call.function.name = std::move(acc.name);
    call.function.arguments = ParseToolArguments(acc.arguments);
    out.push_back(std::move(call));
  }
  tool_calls_.clear();
  return out;
}

}  // namespace bridge
