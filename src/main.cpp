#include "backend_router.hpp"
#include "config.hpp"
#include "ollama_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);
  auto cfg = bridge::LoadConfigFromEnv();

  if (!cfg.config_path.empty()) {
    std::string err;
    if (!bridge::LoadModelsFromFile(cfg.config_path, &cfg, &err)) {
      std::cout << "[config] path=" << cfg.config_path << " error=" << err << "\n";
      return 1;
    }
  }
  if (cfg.models.empty()) {
    std::cout << "[config] no models configured; set OLLAMA_BRIDGE_CONFIG or OLLAMA_BRIDGE_MODELS\n";
  }
  for (const auto& m : cfg.models) {
    std::cout << "[config] model=" << m.name << " proxy=" << m.proxy.scheme << "://" << m.proxy.host << ":"
              << m.proxy.port << m.proxy.base_path << " use_model_name="
              << (m.use_model_name.empty() ? "-" : m.use_model_name) << " aliases=" << m.aliases.size()
              << " unlisted=" << (m.unlisted ? 1 : 0) << " ttl=" << m.ttl_seconds << "\n";
  }

  bridge::HttpBackendRouter backends(&cfg);
  bridge::OllamaRouter router(&cfg, &backends);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] exception=" << message << "\n";
    res.status = 500;
    res.set_content(bridge::DumpJson(bridge::MakeErrorBody(message)), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
    } else {
      message = "bad request";
    }
    res.set_content(bridge::DumpJson(bridge::MakeErrorBody(message)), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(cfg.upstream.read_seconds);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
