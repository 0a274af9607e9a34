#include "ollama_router.hpp"

#include "model_metadata.hpp"
#include "request_normalizer.hpp"
#include "request_translator.hpp"
#include "response_translator.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace bridge {

constexpr const char* kNotImplementedMessage = "This Ollama API endpoint is not implemented in ollama_bridge.";
constexpr const char* kZeroTime = "0001-01-01T00:00:00Z";

// Response writer for one request. The allow-origin header is written at most
// once no matter how many paths reach it.
class Reply {
 public:
  Reply(const httplib::Request& req, httplib::Response* res, const char* op) : req_(req), res_(res), op_(op) {}

  void AllowOrigin() {
    if (origin_written_) return;
    origin_written_ = true;
    const auto origin = req_.get_header_value("Origin");
    if (!origin.empty() && !res_->has_header("Access-Control-Allow-Origin")) {
      res_->set_header("Access-Control-Allow-Origin", origin);
    }
  }

  void Json(int status, const nlohmann::json& body) {
    AllowOrigin();
    res_->status = status;
    res_->set_content(DumpJson(body), "application/json");
  }

  void Text(int status, const std::string& body) {
    AllowOrigin();
    res_->status = status;
    res_->set_content(body, "text/plain; charset=utf-8");
  }

  void Error(const ApiError& e) {
    std::cout << "[ollama] op=" << op_ << " status=" << e.status << " error=" << e.message << "\n";
    Json(e.status, MakeErrorBody(e.message));
  }

  void BadRequest(const std::string& message) { Error(MakeApiError(ErrorKind::kBadRequest, message)); }

  httplib::Response* response() { return res_; }

 private:
  const httplib::Request& req_;
  httplib::Response* res_;
  const char* op_;
  bool origin_written_ = false;
};

namespace {

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  const auto k = ToLowerAscii(key);
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "api_key" || k == "x-api-key") {
    return "<redacted>";
  }
  return value;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static bool IsSuccess(int status) {
  return status >= 200 && status < 300;
}

// Parses the body into T; on failure the 400 is already sent.
template <typename T>
static bool DecodeBody(const httplib::Request& req,
                       Reply* reply,
                       bool (*parse)(const nlohmann::json&, T*, std::string*),
                       T* out) {
  auto j = nlohmann::json::parse(req.body, nullptr, false);
  if (j.is_discarded()) {
    reply->BadRequest("Invalid request: malformed JSON body");
    return false;
  }
  std::string err;
  if (!parse(j, out, &err)) {
    reply->BadRequest("Invalid request: " + err);
    return false;
  }
  return true;
}

static std::optional<ResolvedBackend> ResolveOrReply(IBackendRouter* backends, const std::string& model, Reply* reply) {
  if (model.empty()) {
    reply->BadRequest("Model name is required.");
    return std::nullopt;
  }
  std::string err;
  auto resolved = backends->Resolve(model, &err);
  if (!resolved) reply->Error(MakeApiError(ErrorKind::kInternal, "Error selecting model process: " + err));
  return resolved;
}

// Buffered round trip; returns the body of a 2xx answer or sends the error.
static std::optional<std::string> ForwardOrReply(IBackendRouter* backends,
                                                 const std::string& canonical_name,
                                                 const std::string& path,
                                                 const std::string& payload,
                                                 Reply* reply) {
  std::string err;
  auto resp = backends->Forward(canonical_name, path, payload, &err);
  if (!resp) {
    reply->Error(MakeApiError(ErrorKind::kUpstream, "Error forwarding request to backend: " + err));
    return std::nullopt;
  }
  if (!IsSuccess(resp->status)) {
    reply->Error(UpstreamErrorFromBody(resp->status, resp->body));
    return std::nullopt;
  }
  return std::move(resp->body);
}

static void LogOperation(const char* op, const std::string& model, bool stream, const std::string& keep_alive) {
  std::cout << "[ollama] op=" << op << " model=" << model << " stream=" << (stream ? 1 : 0)
            << " keep_alive=" << (keep_alive.empty() ? "-" : keep_alive) << "\n";
}

}  // namespace

OllamaRouter::OllamaRouter(const BridgeConfig* cfg, IBackendRouter* backends) : cfg_(cfg), backends_(backends) {}

void OllamaRouter::LogRequest(const httplib::Request& req) const {
  std::cout << "[request] " << req.method << " " << req.path << "\n";
  if (!cfg_->log_requests) return;
  for (const auto& it : req.headers) {
    std::cout << "  " << it.first << ": " << RedactHeaderValue(it.first, it.second) << "\n";
  }
  if (!req.body.empty()) std::cout << "  body: " << TruncateForLog(req.body, 2000) << "\n";
}

std::string OllamaRouter::EffectiveKeepAlive(const KeepAlive& keep_alive) const {
  auto normalized = NormalizeKeepAlive(keep_alive);
  if (!normalized.empty() || cfg_->default_keep_alive.empty()) return normalized;
  normalized = NormalizeKeepAlive(KeepAlive::FromNumericText(cfg_->default_keep_alive));
  return normalized.empty() ? cfg_->default_keep_alive : normalized;
}

void OllamaRouter::StreamFromBackend(Reply* reply,
                                     StreamKind kind,
                                     const std::string& canonical_name,
                                     const std::string& path,
                                     std::string payload,
                                     const std::string& display_model) {
  reply->AllowOrigin();
  auto* res = reply->response();
  res->status = 200;
  res->set_header("Cache-Control", "no-cache");
  res->set_chunked_content_provider(
      "application/x-ndjson",
      [this, kind, canonical_name, path, payload = std::move(payload), display_model](size_t, httplib::DataSink& sink) {
        auto write_bytes = [&](const std::string& s) -> bool {
          if (sink.is_writable && !sink.is_writable()) return false;
          if (!sink.write) return false;
          return sink.write(s.data(), s.size());
        };

        try {
          StreamTransformer transformer(kind, display_model, write_bytes);
          int status = 0;
          std::string error_body;
          std::string err;
          const bool ok = backends_->ForwardStream(
              canonical_name, path, payload, [&](int s) { status = s; },
              [&](const char* data, size_t len) {
                if (!IsSuccess(status)) {
                  error_body.append(data, len);
                  return true;
                }
                transformer.Write(data, len);
                return transformer.Flush();
              },
              &err);

          if (!ok) {
            write_bytes(DumpJson(MakeErrorBody("Error forwarding request to backend: " + err)) + "\n");
          } else if (!IsSuccess(status)) {
            const auto e = UpstreamErrorFromBody(status, error_body);
            std::cout << "[ollama] stream upstream_status=" << status << " error=" << e.message << "\n";
            write_bytes(DumpJson(MakeErrorBody(e.message)) + "\n");
          } else {
            transformer.Finish();
          }
        } catch (const std::exception& e) {
          std::cout << "[ollama] stream exception=" << e.what() << "\n";
          sink.done();
          return false;
        }
        sink.done();
        return true;
      });
}

void OllamaRouter::HandleChat(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "chat");
  ChatRequest chat;
  if (!DecodeBody(req, &reply, &ParseChatRequest, &chat)) return;

  ApiError aerr;
  if (!ValidateToolRequest(&chat, &aerr)) return reply.Error(aerr);
  const auto keep_alive = EffectiveKeepAlive(chat.keep_alive);

  auto resolved = ResolveOrReply(backends_, chat.model, &reply);
  if (!resolved) return;
  backends_->NoteKeepAlive(resolved->canonical_name, keep_alive);

  auto body = BuildChatBody(chat, resolved->backend_model, &aerr);
  if (!body) return reply.Error(aerr);

  const bool stream = chat.stream.value_or(false);
  LogOperation("chat", chat.model, stream, keep_alive);
  if (stream) {
    StreamFromBackend(&reply, StreamKind::kChat, resolved->canonical_name, "/v1/chat/completions", body->dump(),
                      chat.model);
    return;
  }

  auto upstream = ForwardOrReply(backends_, resolved->canonical_name, "/v1/chat/completions", body->dump(), &reply);
  if (!upstream) return;
  auto out = TranslateChatResponse(*upstream, chat.model, &aerr);
  if (!out) return reply.Error(aerr);
  reply.Json(200, ToJson(*out));
}

void OllamaRouter::HandleGenerate(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "generate");
  GenerateRequest gen;
  if (!DecodeBody(req, &reply, &ParseGenerateRequest, &gen)) return;
  const auto keep_alive = EffectiveKeepAlive(gen.keep_alive);

  if (gen.model.empty()) return reply.BadRequest("Model name is required.");
  ApiError aerr;
  auto body = BuildCompletionBody(gen, gen.model, &aerr);
  if (!body) return reply.Error(aerr);

  auto resolved = ResolveOrReply(backends_, gen.model, &reply);
  if (!resolved) return;
  backends_->NoteKeepAlive(resolved->canonical_name, keep_alive);
  (*body)["model"] = resolved->backend_model;

  const bool stream = gen.stream.value_or(false);
  LogOperation("generate", gen.model, stream, keep_alive);
  if (stream) {
    StreamFromBackend(&reply, StreamKind::kGenerate, resolved->canonical_name, "/v1/completions", body->dump(),
                      gen.model);
    return;
  }

  auto upstream = ForwardOrReply(backends_, resolved->canonical_name, "/v1/completions", body->dump(), &reply);
  if (!upstream) return;
  auto out = TranslateGenerateResponse(*upstream, gen.model, &aerr);
  if (!out) return reply.Error(aerr);
  reply.Json(200, ToJson(*out));
}

void OllamaRouter::HandleEmbed(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "embed");
  EmbedRequest embed;
  if (!DecodeBody(req, &reply, &ParseEmbedRequest, &embed)) return;
  const auto keep_alive = EffectiveKeepAlive(embed.keep_alive);

  auto resolved = ResolveOrReply(backends_, embed.model, &reply);
  if (!resolved) return;
  backends_->NoteKeepAlive(resolved->canonical_name, keep_alive);
  LogOperation("embed", embed.model, false, keep_alive);

  const auto body = BuildEmbeddingsBody(embed, resolved->backend_model);
  auto upstream = ForwardOrReply(backends_, resolved->canonical_name, "/v1/embeddings", body.dump(), &reply);
  if (!upstream) return;
  ApiError aerr;
  auto out = TranslateEmbedResponse(*upstream, embed.model, &aerr);
  if (!out) return reply.Error(aerr);
  reply.Json(200, ToJson(*out));
}

void OllamaRouter::HandleLegacyEmbeddings(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "embeddings");
  LegacyEmbeddingsRequest embed;
  if (!DecodeBody(req, &reply, &ParseLegacyEmbeddingsRequest, &embed)) return;
  const auto keep_alive = EffectiveKeepAlive(embed.keep_alive);

  if (embed.model.empty()) return reply.BadRequest("Model name is required.");
  if (embed.prompt.empty()) return reply.BadRequest("Prompt is required.");
  auto resolved = ResolveOrReply(backends_, embed.model, &reply);
  if (!resolved) return;
  backends_->NoteKeepAlive(resolved->canonical_name, keep_alive);
  LogOperation("embeddings", embed.model, false, keep_alive);

  const auto body = BuildLegacyEmbeddingsBody(embed, resolved->backend_model);
  auto upstream = ForwardOrReply(backends_, resolved->canonical_name, "/v1/embeddings", body.dump(), &reply);
  if (!upstream) return;
  ApiError aerr;
  auto out = TranslateLegacyEmbeddingsResponse(*upstream, &aerr);
  if (!out) return reply.Error(aerr);
  reply.Json(200, ToJson(*out));
}

void OllamaRouter::HandleTags(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "tags");
  const auto now = NowRfc3339Utc();
  nlohmann::json models = nlohmann::json::array();
  for (const auto& m : cfg_->models) {
    if (m.unlisted) continue;
    models.push_back({{"name", m.name},
                      {"model", m.name},
                      {"modified_at", now},
                      {"size", 0},
                      {"digest", HexDigest(m.name)},
                      {"details", ToJson(ListingDetails(m))}});
  }
  std::sort(models.begin(), models.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
    return a["name"].get<std::string>() < b["name"].get<std::string>();
  });
  reply.Json(200, {{"models", std::move(models)}});
}

void OllamaRouter::HandleShow(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "show");
  ShowRequest show;
  if (!DecodeBody(req, &reply, &ParseShowRequest, &show)) return;

  const auto name = show.model.empty() ? show.name : show.model;
  if (name.empty()) return reply.BadRequest("Model name is required.");
  const auto* m = FindModelConfig(*cfg_, name);
  if (!m) return reply.Error(MakeApiError(ErrorKind::kNotFound, "Model '" + name + "' not found."));

  const auto meta = ResolveModelMetadata(*m);
  nlohmann::json model_info;
  model_info["general.architecture"] = meta.architecture;
  model_info["llama.context_length"] = meta.context_length > 0 ? meta.context_length : 2048;

  nlohmann::json out;
  out["details"] = ToJson(ShowDetails(meta));
  out["model_info"] = std::move(model_info);
  out["capabilities"] = meta.capabilities;
  out["modified_at"] = NowRfc3339Utc();
  reply.Json(200, out);
}

void OllamaRouter::HandlePs(const httplib::Request& req, httplib::Response& res) {
  LogRequest(req);
  Reply reply(req, &res, "ps");
  nlohmann::json models = nlohmann::json::array();
  for (const auto& s : backends_->Status()) {
    if (s.state != BackendState::kReady) continue;
    const auto* m = FindModelConfig(*cfg_, s.name);
    if (!m) continue;
    models.push_back({{"name", s.name},
                      {"model", s.name},
                      {"size", 0},
                      {"digest", HexDigest(s.name)},
                      {"details", ToJson(ListingDetails(*m))},
                      {"expires_at", s.expires_at_unix > 0 ? FormatRfc3339Utc(s.expires_at_unix) : kZeroTime},
                      {"size_vram", 0}});
  }
  reply.Json(200, {{"models", std::move(models)}});
}

void OllamaRouter::Register(httplib::Server* server) {
  auto heartbeat = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    Reply(req, &res, "heartbeat").Text(200, "Ollama is running");
  };
  auto not_implemented = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    Reply(req, &res, "unsupported").Error(MakeApiError(ErrorKind::kNotImplemented, kNotImplementedMessage));
  };

  server->Get("/", heartbeat);
  server->Get("/api/version", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    Reply(req, &res, "version").Json(200, {{"version", "0.0.0"}});
  });
  server->Get("/api/tags", [this](const httplib::Request& req, httplib::Response& res) { HandleTags(req, res); });
  server->Post("/api/show", [this](const httplib::Request& req, httplib::Response& res) { HandleShow(req, res); });
  server->Get("/api/ps", [this](const httplib::Request& req, httplib::Response& res) { HandlePs(req, res); });
  server->Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) { HandleChat(req, res); });
  server->Post("/api/generate",
               [this](const httplib::Request& req, httplib::Response& res) { HandleGenerate(req, res); });
  server->Post("/api/embed", [this](const httplib::Request& req, httplib::Response& res) { HandleEmbed(req, res); });
  server->Post("/api/embeddings",
               [this](const httplib::Request& req, httplib::Response& res) { HandleLegacyEmbeddings(req, res); });

  server->Post("/api/create", not_implemented);
  server->Post("/api/copy", not_implemented);
  server->Post("/api/pull", not_implemented);
  server->Post("/api/push", not_implemented);
  server->Delete("/api/delete", not_implemented);
  server->Get(R"(/api/blobs/([^/]+))", not_implemented);
  server->Post(R"(/api/blobs/([^/]+))", not_implemented);
}

}  // namespace bridge
