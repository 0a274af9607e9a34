#include "model_metadata.hpp"

#include <cctype>
#include <cstdlib>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace bridge {
namespace {

struct Pattern {
  const char* needle;
  const char* value;
};

// Order matters: more specific names come first.
constexpr Pattern kArchitecturePatterns[] = {
    {"qwen3moe", "qwen3moe"}, {"qwen3", "qwen3"},       {"qwen2.5", "qwen2"},     {"qwen2", "qwen2"},
    {"qwq", "qwen2"},         {"qwen", "qwen2"},        {"deepseek-v3", "deepseek2"}, {"deepseek-v2", "deepseek2"},
    {"deepseek", "llama"},    {"mixtral", "llama"},     {"mistral", "llama"},     {"codellama", "llama"},
    {"llama", "llama"},       {"gemma3", "gemma3"},     {"gemma2", "gemma2"},     {"gemma", "gemma"},
    {"phi-3", "phi3"},        {"phi3", "phi3"},         {"phi-4", "phi3"},        {"phi4", "phi3"},
    {"phi", "phi2"},          {"command-r", "command-r"}, {"starcoder2", "starcoder2"}, {"starcoder", "starcoder"},
    {"falcon", "falcon"},     {"gpt-oss", "gpt-oss"},   {"glm4", "glm4"},         {"glm", "chatglm"},
    {"granite", "granite"},   {"olmo", "olmo"},         {"nomic-bert", "nomic-bert"}, {"nomic-embed", "nomic-bert"},
    {"bge", "bert"},          {"mxbai", "bert"},        {"bert", "bert"},
};

constexpr Pattern kFamilyPatterns[] = {
    {"codellama", "llama"}, {"tinyllama", "llama"}, {"mixtral", "llama"}, {"mistral", "llama"},
    {"deepseek-r1", "qwen2"}, {"qwq", "qwen2"},
};

static std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string ToUpper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

static std::string Basename(const std::string& path) {
  auto pos = path.find_last_of("/\\");
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

static std::string MetadataString(const nlohmann::json& meta, const char* key) {
  auto it = meta.find(key);
  if (it == meta.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

static std::string FirstKnown(const std::string& a, const std::string& b) {
  return a != "unknown" ? a : b;
}

}  // namespace

std::string InferArchitecture(const std::string& model_id) {
  const auto lower = ToLower(model_id);
  for (const auto& p : kArchitecturePatterns) {
    if (lower.find(p.needle) != std::string::npos) return p.value;
  }
  return "unknown";
}

std::string InferFamily(const std::string& model_id, const std::string& architecture) {
  const auto lower = ToLower(model_id);
  for (const auto& p : kFamilyPatterns) {
    if (lower.find(p.needle) != std::string::npos) return p.value;
  }
  if (!architecture.empty()) return architecture;
  return "unknown";
}

std::string InferParameterSize(const std::string& model_id) {
  static const std::regex kMoe(R"((?:^|[^a-z0-9])(\d+)x(\d+(?:\.\d+)?)b(?:$|[^a-z0-9]))");
  static const std::regex kDense(R"((?:^|[^a-z0-9.])(\d+(?:\.\d+)?)([bm])(?:$|[^a-z0-9]))");
  const auto lower = ToLower(model_id);
  std::smatch m;
  if (std::regex_search(lower, m, kMoe)) return m[1].str() + "x" + m[2].str() + "B";
  if (std::regex_search(lower, m, kDense)) return m[1].str() + ToUpper(m[2].str());
  return "unknown";
}

std::string InferQuantizationLevel(const std::string& model_id) {
  static const std::regex kQuant(R"((?:^|[^a-z0-9])(i?q\d(?:_[a-z0-9]+)*|bf16|f16|f32)(?:$|[^a-z0-9]))");
  const auto lower = ToLower(model_id);
  std::smatch m;
  if (std::regex_search(lower, m, kQuant)) return ToUpper(m[1].str());
  return "unknown";
}

std::vector<std::string> SplitCommandLine(const std::string& cmd) {
  std::vector<std::string> out;
  std::string cur;
  bool in_token = false;
  char quote = 0;
  for (size_t i = 0; i < cmd.size(); i++) {
    const char c = cmd[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else if (c == '\\' && quote == '"' && i + 1 < cmd.size()) {
        cur.push_back(cmd[++i]);
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '\\' && i + 1 < cmd.size()) {
      const char next = cmd[i + 1];
      i++;
      if (next == '\n') continue;
      if (next == '\r' && i + 1 < cmd.size() && cmd[i + 1] == '\n') {
        i++;
        continue;
      }
      cur.push_back(next);
      in_token = true;
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      in_token = true;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_token) out.push_back(std::move(cur));
      cur.clear();
      in_token = false;
      continue;
    }
    cur.push_back(c);
    in_token = true;
  }
  if (in_token) out.push_back(std::move(cur));
  return out;
}

ModelMetadata ParseLaunchCommand(const std::string& cmd, const std::string& model_id) {
  ModelMetadata meta;
  std::string model_file;
  bool embedding = false;
  bool tools = false;
  bool vision = false;

  const auto args = SplitCommandLine(cmd);
  for (size_t i = 0; i < args.size(); i++) {
    const auto& a = args[i];
    const bool has_value = i + 1 < args.size();
    if ((a == "-m" || a == "--model") && has_value) {
      model_file = Basename(args[++i]);
    } else if ((a == "-c" || a == "--ctx-size") && has_value) {
      meta.context_length = std::atoi(args[++i].c_str());
    } else if (a == "--embedding" || a == "--embeddings") {
      embedding = true;
    } else if (a == "--jinja") {
      tools = true;
    } else if (a == "--mmproj" || a == "-mm") {
      vision = true;
      if (has_value) i++;
    }
  }

  meta.architecture = FirstKnown(InferArchitecture(model_id), InferArchitecture(model_file));
  meta.family = InferFamily(model_id, meta.architecture);
  meta.parameter_size = FirstKnown(InferParameterSize(model_id), InferParameterSize(model_file));
  meta.quantization_level = FirstKnown(InferQuantizationLevel(model_id), InferQuantizationLevel(model_file));

  if (embedding) {
    meta.capabilities.push_back("embedding");
  } else {
    meta.capabilities.push_back("completion");
    if (tools) meta.capabilities.push_back("tools");
    if (vision) meta.capabilities.push_back("vision");
  }
  return meta;
}

ModelMetadata ResolveModelMetadata(const ModelConfig& model) {
  auto meta = ParseLaunchCommand(model.cmd, model.name);
  const auto& m = model.metadata;
  if (auto v = MetadataString(m, "architecture"); !v.empty()) meta.architecture = v;
  if (auto v = MetadataString(m, "family"); !v.empty()) meta.family = v;
  if (auto v = MetadataString(m, "parameterSize"); !v.empty()) meta.parameter_size = v;
  if (auto v = MetadataString(m, "quantizationLevel"); !v.empty()) meta.quantization_level = v;
  if (auto it = m.find("contextLength"); it != m.end() && it->is_number_integer() && it->get<int>() != 0) {
    meta.context_length = it->get<int>();
  }
  if (auto it = m.find("capabilities"); it != m.end() && it->is_array()) {
    std::vector<std::string> caps;
    for (const auto& c : *it) {
      if (c.is_string()) caps.push_back(c.get<std::string>());
    }
    if (!caps.empty()) meta.capabilities = std::move(caps);
  }
  if (meta.capabilities.empty()) meta.capabilities.push_back("completion");
  return meta;
}

ModelDetails ListingDetails(const ModelConfig& model) {
  ModelDetails d;
  const auto& m = model.metadata;
  if (auto v = MetadataString(m, "family"); !v.empty()) {
    d.family = v;
  } else {
    auto arch = MetadataString(m, "architecture");
    if (arch.empty()) arch = InferArchitecture(model.name);
    d.family = InferFamily(model.name, arch);
  }
  d.parameter_size = MetadataString(m, "parameterSize");
  if (d.parameter_size.empty()) d.parameter_size = InferParameterSize(model.name);
  d.quantization_level = MetadataString(m, "quantizationLevel");
  if (d.quantization_level.empty()) d.quantization_level = InferQuantizationLevel(model.name);
  return d;
}

ModelDetails ShowDetails(const ModelMetadata& meta) {
  ModelDetails d;
  d.family = meta.family;
  d.parameter_size = meta.parameter_size;
  d.quantization_level = meta.quantization_level;
  return d;
}

}  // namespace bridge
