#pragma once

#include "backend_router.hpp"
#include "config.hpp"
#include "ollama_types.hpp"
#include "stream_transformer.hpp"

#include <httplib.h>

#include <string>

namespace bridge {

class Reply;

class OllamaRouter {
 public:
  OllamaRouter(const BridgeConfig* cfg, IBackendRouter* backends);
  void Register(httplib::Server* server);

 private:
  void HandleChat(const httplib::Request& req, httplib::Response& res);
  void HandleGenerate(const httplib::Request& req, httplib::Response& res);
  void HandleEmbed(const httplib::Request& req, httplib::Response& res);
  void HandleLegacyEmbeddings(const httplib::Request& req, httplib::Response& res);
  void HandleTags(const httplib::Request& req, httplib::Response& res);
  void HandleShow(const httplib::Request& req, httplib::Response& res);
  void HandlePs(const httplib::Request& req, httplib::Response& res);

  std::string EffectiveKeepAlive(const KeepAlive& keep_alive) const;
  void StreamFromBackend(Reply* reply,
                         StreamKind kind,
                         const std::string& canonical_name,
                         const std::string& path,
                         std::string payload,
                         const std::string& display_model);
  void LogRequest(const httplib::Request& req) const;

  const BridgeConfig* cfg_;
  IBackendRouter* backends_;
};

}  // namespace bridge
