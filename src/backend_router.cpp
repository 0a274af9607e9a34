#include "backend_router.hpp"

#include "request_normalizer.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace bridge {
namespace {

// Longer keep-alives are treated as "never expires" and capped here.
constexpr double kMaxIdleSeconds = 100.0 * 365 * 24 * 3600;

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const UpstreamTimeouts& t) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(t.connect_seconds);
  cli->set_read_timeout(t.read_seconds);
  cli->set_write_timeout(t.write_seconds);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

}  // namespace

const char* BackendStateName(BackendState state) {
  switch (state) {
    case BackendState::kStopped:
      return "stopped";
    case BackendState::kStarting:
      return "starting";
    case BackendState::kReady:
      return "ready";
    case BackendState::kStopping:
      return "stopping";
  }
  return "unknown";
}

HttpBackendRouter::HttpBackendRouter(const BridgeConfig* cfg) : cfg_(cfg) {}

std::optional<ResolvedBackend> HttpBackendRouter::Resolve(const std::string& model, std::string* err) {
  const auto* m = FindModelConfig(*cfg_, model);
  if (!m) {
    if (err) *err = "could not find suitable backend for model '" + model + "'";
    return std::nullopt;
  }
  ResolvedBackend r;
  r.canonical_name = m->name;
  r.backend_model = m->use_model_name.empty() ? m->name : m->use_model_name;
  r.config = m;
  return r;
}

void HttpBackendRouter::MarkState(const std::string& name, BackendState state, bool touch) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& rt = runtime_[name];
  rt.state = state;
  if (touch) rt.last_activity_unix = NowSeconds();
}

std::optional<BackendResponse> HttpBackendRouter::Forward(const std::string& canonical_name,
                                                          const std::string& path,
                                                          const std::string& body,
                                                          std::string* err) {
  const auto* m = FindModelConfig(*cfg_, canonical_name);
  if (!m) {
    if (err) *err = "unknown backend '" + canonical_name + "'";
    return std::nullopt;
  }
  MarkState(m->name, BackendState::kStarting, false);

  auto cli = MakeClient(m->proxy, cfg_->upstream);
  httplib::Headers headers = {{"Accept", "application/json"}};
  const auto full_path = JoinPath(m->proxy.base_path, path);
  auto res = cli->Post(full_path, headers, body, "application/json");
  if (!res) {
    MarkState(m->name, BackendState::kStopped, false);
    if (err) *err = m->name + ": failed to connect to " + m->proxy.host + ":" + std::to_string(m->proxy.port) + " (" +
                    httplib::to_string(res.error()) + ")";
    std::cout << "[backend] model=" << m->name << " path=" << full_path << " error=" << httplib::to_string(res.error())
              << "\n";
    return std::nullopt;
  }
  MarkState(m->name, BackendState::kReady, true);
  std::cout << "[backend] model=" << m->name << " path=" << full_path << " status=" << res->status << "\n";

  BackendResponse out;
  out.status = res->status;
  out.body = res->body;
  out.content_type = res->get_header_value("Content-Type");
  return out;
}

bool HttpBackendRouter::ForwardStream(const std::string& canonical_name,
                                      const std::string& path,
                                      const std::string& body,
                                      const std::function<void(int status)>& on_status,
                                      const std::function<bool(const char* data, size_t len)>& on_data,
                                      std::string* err) {
  const auto* m = FindModelConfig(*cfg_, canonical_name);
  if (!m) {
    if (err) *err = "unknown backend '" + canonical_name + "'";
    return false;
  }
  MarkState(m->name, BackendState::kStarting, false);

  auto cli = MakeClient(m->proxy, cfg_->upstream);
  const auto full_path = JoinPath(m->proxy.base_path, path);
  int status = 0;

  httplib::Request req;
  req.method = "POST";
  req.path = full_path;
  req.body = body;
  req.set_header("Content-Type", "application/json");
  req.set_header("Accept", "application/json, text/event-stream");
  req.response_handler = [&](const httplib::Response& response) {
    status = response.status;
    if (on_status) on_status(response.status);
    return true;
  };
  req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) { return on_data(data, len); };

  auto result = cli->send(req);
  if (result.error() != httplib::Error::Success && result.error() != httplib::Error::Canceled) {
    MarkState(m->name, status == 0 ? BackendState::kStopped : BackendState::kReady, status != 0);
    if (err) *err = m->name + ": " + httplib::to_string(result.error());
    std::cout << "[backend] model=" << m->name << " path=" << full_path << " stream=1 error="
              << httplib::to_string(result.error()) << "\n";
    return false;
  }
  MarkState(m->name, BackendState::kReady, true);
  std::cout << "[backend] model=" << m->name << " path=" << full_path << " stream=1 status=" << status << "\n";
  return true;
}

void HttpBackendRouter::NoteKeepAlive(const std::string& canonical_name, const std::string& keep_alive) {
  if (keep_alive.empty()) return;
  std::lock_guard<std::mutex> lock(mu_);
  runtime_[canonical_name].keep_alive = keep_alive;
}

int64_t HttpBackendRouter::IdleSeconds(const ModelConfig& model, const Runtime& rt) const {
  if (auto d = ParseDurationSeconds(rt.keep_alive); d && *d > 0) {
    return static_cast<int64_t>(std::llround(std::min(*d, kMaxIdleSeconds)));
  }
  return model.ttl_seconds > 0 ? model.ttl_seconds : 0;
}

std::vector<BackendStatus> HttpBackendRouter::Status() const {
  std::vector<BackendStatus> out;
  const int64_t now = NowSeconds();
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& m : cfg_->models) {
    auto it = runtime_.find(m.name);
    if (it == runtime_.end()) continue;
    const auto& rt = it->second;

    BackendStatus s;
    s.name = m.name;
    s.state = rt.state;
    s.last_activity_unix = rt.last_activity_unix;
    const int64_t idle = IdleSeconds(m, rt);
    if (idle > 0) {
      const int64_t expires = rt.last_activity_unix + idle;
      if (rt.last_activity_unix != 0 && expires < now) {
        // Past its idle window: reported as unloaded.
        s.state = BackendState::kStopped;
        s.expires_at_unix = now + idle;
      } else if (rt.last_activity_unix == 0) {
        s.expires_at_unix = now + idle;
      } else {
        s.expires_at_unix = expires;
      }
    }
    out.push_back(std::move(s));
  }
  return out;
}

}  // namespace bridge
