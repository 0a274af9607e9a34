#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace bridge {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 11434;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string base_path;
};

struct UpstreamTimeouts {
  int connect_seconds = 5;
  int read_seconds = 300;
  int write_seconds = 30;
};

struct ModelConfig {
  std::string name;
  HttpEndpoint proxy;
  std::string cmd;
  std::string use_model_name;
  std::vector<std::string> aliases;
  bool unlisted = false;
  int ttl_seconds = 0;
  nlohmann::json metadata = nlohmann::json::object();
};

struct BridgeConfig {
  HttpListenConfig listen;
  std::string config_path;
  std::vector<ModelConfig> models;
  std::string default_keep_alive;
  bool log_requests = false;
  UpstreamTimeouts upstream;
};

BridgeConfig LoadConfigFromEnv();

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

// Appends the models of a {"models": {...}} document. Existing names are replaced.
bool LoadModelsFromJson(const nlohmann::json& doc, BridgeConfig* cfg, std::string* err);
bool LoadModelsFromFile(const std::string& path, BridgeConfig* cfg, std::string* err);

// Parses "name=url,name=url".
bool ParseModelsCsv(const std::string& csv, BridgeConfig* cfg, std::string* err);

const ModelConfig* FindModelConfig(const BridgeConfig& cfg, const std::string& name_or_alias);

}  // namespace bridge
