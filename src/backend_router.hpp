#pragma once

#include "config.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bridge {

enum class BackendState {
  kStopped,
  kStarting,
  kReady,
  kStopping,
};

const char* BackendStateName(BackendState state);

struct ResolvedBackend {
  std::string canonical_name;
  std::string backend_model;
  const ModelConfig* config = nullptr;
};

struct BackendResponse {
  int status = 0;
  std::string body;
  std::string content_type;
};

struct BackendStatus {
  std::string name;
  BackendState state = BackendState::kStopped;
  int64_t last_activity_unix = 0;
  int64_t expires_at_unix = 0;
};

class IBackendRouter {
 public:
  virtual ~IBackendRouter() = default;

  virtual std::optional<ResolvedBackend> Resolve(const std::string& model, std::string* err) = 0;
  virtual std::optional<BackendResponse> Forward(const std::string& canonical_name,
                                                 const std::string& path,
                                                 const std::string& body,
                                                 std::string* err) = 0;
  virtual bool ForwardStream(const std::string& canonical_name,
                             const std::string& path,
                             const std::string& body,
                             const std::function<void(int status)>& on_status,
                             const std::function<bool(const char* data, size_t len)>& on_data,
                             std::string* err) = 0;
  virtual void NoteKeepAlive(const std::string& canonical_name, const std::string& keep_alive) = 0;
  virtual std::vector<BackendStatus> Status() const = 0;
};

// Forwards to the configured proxy endpoint of each model over plain HTTP.
class HttpBackendRouter : public IBackendRouter {
 public:
  explicit HttpBackendRouter(const BridgeConfig* cfg);

  std::optional<ResolvedBackend> Resolve(const std::string& model, std::string* err) override;
  std::optional<BackendResponse> Forward(const std::string& canonical_name,
                                         const std::string& path,
                                         const std::string& body,
                                         std::string* err) override;
  bool ForwardStream(const std::string& canonical_name,
                     const std::string& path,
                     const std::string& body,
                     const std::function<void(int status)>& on_status,
                     const std::function<bool(const char* data, size_t len)>& on_data,
                     std::string* err) override;
  void NoteKeepAlive(const std::string& canonical_name, const std::string& keep_alive) override;
  std::vector<BackendStatus> Status() const override;

 private:
  struct Runtime {
    BackendState state = BackendState::kStopped;
    int64_t last_activity_unix = 0;
    std::string keep_alive;
  };

  void MarkState(const std::string& name, BackendState state, bool touch);
  int64_t IdleSeconds(const ModelConfig& model, const Runtime& rt) const;

  const BridgeConfig* cfg_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Runtime> runtime_;
};

}  // namespace bridge
