#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string TrimSpaces(std::string v) {
  while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
  while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
  return v;
}

static std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      cur = TrimSpaces(std::move(cur));
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  cur = TrimSpaces(std::move(cur));
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static void ReadEnvInt(const char* name, int* out) {
  auto v = GetEnvStr(name);
  if (v.empty()) return;
  const int n = std::atoi(v.c_str());
  if (n > 0) *out = n;
}

static void UpsertModel(BridgeConfig* cfg, ModelConfig model) {
  auto it = std::find_if(cfg->models.begin(), cfg->models.end(),
                         [&](const ModelConfig& m) { return m.name == model.name; });
  if (it != cfg->models.end()) {
    *it = std::move(model);
  } else {
    cfg->models.push_back(std::move(model));
  }
}

static bool ParseModelEntry(const std::string& name, const nlohmann::json& j, ModelConfig* out, std::string* err) {
  auto fail = [&](const std::string& what) {
    if (err) *err = "model '" + name + "': " + what;
    return false;
  };
  if (!j.is_object()) return fail("entry must be an object");
  out->name = name;

  auto proxy = j.find("proxy");
  if (proxy == j.end() || !proxy->is_string() || proxy->get<std::string>().empty()) {
    return fail("missing required field 'proxy'");
  }
  out->proxy = ParseHttpEndpoint(proxy->get<std::string>(), 8080);
  if (out->proxy.scheme != "http") return fail("proxy must be an http:// URL (TLS backends are not supported)");

  if (auto it = j.find("cmd"); it != j.end()) {
    if (!it->is_string()) return fail("'cmd' must be a string");
    out->cmd = it->get<std::string>();
  }
  if (auto it = j.find("useModelName"); it != j.end()) {
    if (!it->is_string()) return fail("'useModelName' must be a string");
    out->use_model_name = it->get<std::string>();
  }
  if (auto it = j.find("unlisted"); it != j.end()) {
    if (!it->is_boolean()) return fail("'unlisted' must be a boolean");
    out->unlisted = it->get<bool>();
  }
  if (auto it = j.find("ttl"); it != j.end()) {
    if (!it->is_number_integer()) return fail("'ttl' must be an integer");
    out->ttl_seconds = it->get<int>();
  }
  if (auto it = j.find("aliases"); it != j.end()) {
    if (!it->is_array()) return fail("'aliases' must be an array of strings");
    for (const auto& a : *it) {
      if (!a.is_string()) return fail("'aliases' must be an array of strings");
      out->aliases.push_back(a.get<std::string>());
    }
  }
  if (auto it = j.find("metadata"); it != j.end()) {
    if (!it->is_object()) return fail("'metadata' must be an object");
    out->metadata = *it;
  }
  return true;
}

static bool CheckUniqueNames(const BridgeConfig& cfg, std::string* err) {
  std::unordered_set<std::string> seen;
  for (const auto& m : cfg.models) seen.insert(m.name);
  for (const auto& m : cfg.models) {
    for (const auto& a : m.aliases) {
      if (!seen.insert(a).second) {
        if (err) *err = "model '" + m.name + "': duplicate alias '" + a + "'";
        return false;
      }
    }
  }
  return true;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

bool LoadModelsFromJson(const nlohmann::json& doc, BridgeConfig* cfg, std::string* err) {
  if (!doc.is_object()) {
    if (err) *err = "config root must be an object";
    return false;
  }
  auto models = doc.find("models");
  if (models == doc.end()) return true;
  if (!models->is_object()) {
    if (err) *err = "'models' must be an object keyed by model name";
    return false;
  }
  for (auto it = models->begin(); it != models->end(); ++it) {
    ModelConfig m;
    if (!ParseModelEntry(it.key(), it.value(), &m, err)) return false;
    UpsertModel(cfg, std::move(m));
  }
  return CheckUniqueNames(*cfg, err);
}

bool LoadModelsFromFile(const std::string& path, BridgeConfig* cfg, std::string* err) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    if (err) *err = "cannot open config file: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  auto doc = nlohmann::json::parse(ss.str(), nullptr, false);
  if (doc.is_discarded()) {
    if (err) *err = "invalid JSON in config file: " + path;
    return false;
  }
  return LoadModelsFromJson(doc, cfg, err);
}

bool ParseModelsCsv(const std::string& csv, BridgeConfig* cfg, std::string* err) {
  for (const auto& item : SplitCsv(csv)) {
    auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= item.size()) {
      if (err) *err = "expected name=url, got '" + item + "'";
      return false;
    }
    ModelConfig m;
    m.name = TrimSpaces(item.substr(0, eq));
    m.proxy = ParseHttpEndpoint(TrimSpaces(item.substr(eq + 1)), 8080);
    if (m.proxy.scheme != "http") {
      if (err) *err = "model '" + m.name + "': proxy must be an http:// URL (TLS backends are not supported)";
      return false;
    }
    UpsertModel(cfg, std::move(m));
  }
  return CheckUniqueNames(*cfg, err);
}

const ModelConfig* FindModelConfig(const BridgeConfig& cfg, const std::string& name_or_alias) {
  if (name_or_alias.empty()) return nullptr;
  for (const auto& m : cfg.models) {
    if (m.name == name_or_alias) return &m;
  }
  for (const auto& m : cfg.models) {
    if (std::find(m.aliases.begin(), m.aliases.end(), name_or_alias) != m.aliases.end()) return &m;
  }
  return nullptr;
}

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  if (auto host = GetEnvStr("OLLAMA_BRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("OLLAMA_BRIDGE_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());
  if (auto path = GetEnvStr("OLLAMA_BRIDGE_CONFIG"); !path.empty()) cfg.config_path = path;
  if (auto ka = GetEnvStr("OLLAMA_KEEP_ALIVE"); !ka.empty()) cfg.default_keep_alive = ka;
  if (auto lr = GetEnvStr("OLLAMA_BRIDGE_LOG_REQUESTS"); !lr.empty()) {
    bool b = false;
    if (TryParseBool(lr, &b)) cfg.log_requests = b;
  }
  ReadEnvInt("OLLAMA_BRIDGE_UPSTREAM_CONNECT_TIMEOUT", &cfg.upstream.connect_seconds);
  ReadEnvInt("OLLAMA_BRIDGE_UPSTREAM_READ_TIMEOUT", &cfg.upstream.read_seconds);
  ReadEnvInt("OLLAMA_BRIDGE_UPSTREAM_WRITE_TIMEOUT", &cfg.upstream.write_seconds);

  if (auto csv = GetEnvStr("OLLAMA_BRIDGE_MODELS"); !csv.empty()) {
    std::string err;
    if (!ParseModelsCsv(csv, &cfg, &err)) std::cout << "[config] OLLAMA_BRIDGE_MODELS ignored error=" << err << "\n";
  }
  return cfg;
}

}  // namespace bridge
