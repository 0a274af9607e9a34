#include "request_normalizer.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace bridge {
namespace {

static std::string Seconds(int64_t n) {
  return std::to_string(n) + "s";
}

// Formats the rounded value directly; a cast to int64_t overflows for large inputs.
static std::string RoundedSeconds(double v) {
  char buf[400];
  std::snprintf(buf, sizeof(buf), "%.0f", std::floor(v + 0.5));
  return std::string(buf) + "s";
}

static bool ParseWholeInt(const std::string& s, int64_t* out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

static bool ParseWholeDouble(const std::string& s, double* out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end == s.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

}  // namespace

std::string NormalizeKeepAlive(const KeepAlive& keep_alive) {
  switch (keep_alive.kind) {
    case KeepAlive::Kind::kAbsent:
      return {};
    case KeepAlive::Kind::kText:
      return keep_alive.text;
    case KeepAlive::Kind::kInteger:
      return Seconds(keep_alive.integer);
    case KeepAlive::Kind::kUnsigned:
      return std::to_string(keep_alive.unsigned_integer) + "s";
    case KeepAlive::Kind::kFloat:
      return RoundedSeconds(keep_alive.number);
    case KeepAlive::Kind::kNumericText: {
      int64_t i = 0;
      if (ParseWholeInt(keep_alive.text, &i)) return Seconds(i);
      double d = 0.0;
      if (ParseWholeDouble(keep_alive.text, &d)) return RoundedSeconds(d);
      return {};
    }
    case KeepAlive::Kind::kOther:
      if (keep_alive.other.is_boolean()) return keep_alive.other.get<bool>() ? "true" : "false";
      return DumpJson(keep_alive.other);
  }
  return {};
}

bool ValidateToolRequest(ChatRequest* req, ApiError* err) {
  for (size_t i = 0; i < req->tools.size(); i++) {
    const auto& tool = req->tools[i];
    if (tool.type != "function") {
      if (err) *err = MakeApiError(ErrorKind::kBadRequest, "tool " + std::to_string(i) + ": only 'function' type is supported");
      return false;
    }
    if (tool.function.name.empty()) {
      if (err) *err = MakeApiError(ErrorKind::kBadRequest, "tool " + std::to_string(i) + ": missing function name");
      return false;
    }
  }

  for (auto& msg : req->messages) {
    if (msg.role != "assistant" || msg.tool_calls.empty()) continue;
    std::vector<ToolCall> valid;
    valid.reserve(msg.tool_calls.size());
    for (auto& tc : msg.tool_calls) {
      if (!tc.function.name.empty()) valid.push_back(std::move(tc));
    }
    msg.tool_calls = std::move(valid);
  }

  std::vector<Message> kept;
  kept.reserve(req->messages.size());
  for (auto& msg : req->messages) {
    if (msg.role == "tool" && msg.tool_call_id.empty() && msg.tool_name.empty()) continue;
    kept.push_back(std::move(msg));
  }
  req->messages = std::move(kept);
  return true;
}

std::optional<double> ParseDurationSeconds(const std::string& text) {
  if (text.empty()) return std::nullopt;
  double bare = 0.0;
  if (ParseWholeDouble(text, &bare)) return bare;

  size_t pos = 0;
  double sign = 1.0;
  if (text[pos] == '-' || text[pos] == '+') {
    if (text[pos] == '-') sign = -1.0;
    pos++;
  }
  if (pos >= text.size()) return std::nullopt;

  double total = 0.0;
  while (pos < text.size()) {
    size_t start = pos;
    while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) pos++;
    if (pos == start) return std::nullopt;
    double value = 0.0;
    if (!ParseWholeDouble(text.substr(start, pos - start), &value)) return std::nullopt;

    size_t unit_start = pos;
    while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) pos++;
    const std::string unit = text.substr(unit_start, pos - unit_start);
    if (unit == "h") {
      total += value * 3600.0;
    } else if (unit == "m") {
      total += value * 60.0;
    } else if (unit == "s") {
      total += value;
    } else if (unit == "ms") {
      total += value / 1000.0;
    } else if (unit == "us") {
      total += value / 1e6;
    } else if (unit == "ns") {
      total += value / 1e9;
    } else {
      return std::nullopt;
    }
  }
  return sign * total;
}

}  // namespace bridge
