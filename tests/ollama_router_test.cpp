#include <gtest/gtest.h>

#include "ollama_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace bridge;

namespace {

// Scripted backend: canned replies per path, records what was sent.
class FakeBackendRouter : public IBackendRouter {
 public:
  explicit FakeBackendRouter(const BridgeConfig* cfg) : cfg_(cfg) {}

  std::optional<ResolvedBackend> Resolve(const std::string& model, std::string* err) override {
    const auto* m = FindModelConfig(*cfg_, model);
    if (!m) {
      *err = "could not find suitable backend for model '" + model + "'";
      return std::nullopt;
    }
    ResolvedBackend r;
    r.canonical_name = m->name;
    r.backend_model = m->use_model_name.empty() ? m->name : m->use_model_name;
    r.config = m;
    return r;
  }

  std::optional<BackendResponse> Forward(const std::string& canonical_name,
                                         const std::string& path,
                                         const std::string& body,
                                         std::string* err) override {
    last_model = canonical_name;
    last_path = path;
    last_body = nlohmann::json::parse(body);
    if (transport_error) {
      *err = "connection refused";
      return std::nullopt;
    }
    BackendResponse res;
    res.status = status;
    res.body = replies[path];
    return res;
  }

  bool ForwardStream(const std::string& canonical_name,
                     const std::string& path,
                     const std::string& body,
                     const std::function<void(int status)>& on_status,
                     const std::function<bool(const char* data, size_t len)>& on_data,
                     std::string* err) override {
    last_model = canonical_name;
    last_path = path;
    last_body = nlohmann::json::parse(body);
    if (transport_error) {
      *err = "connection refused";
      return false;
    }
    on_status(status);
    for (const auto& chunk : stream_chunks) {
      if (!on_data(chunk.data(), chunk.size())) break;
    }
    return true;
  }

  void NoteKeepAlive(const std::string& canonical_name, const std::string& keep_alive) override {
    keep_alives[canonical_name] = keep_alive;
  }

  std::vector<BackendStatus> Status() const override { return statuses; }

  int status = 200;
  bool transport_error = false;
  std::map<std::string, std::string> replies;
  std::vector<std::string> stream_chunks;
  std::vector<BackendStatus> statuses;
  std::map<std::string, std::string> keep_alives;
  std::string last_model;
  std::string last_path;
  nlohmann::json last_body;

 private:
  const BridgeConfig* cfg_;
};

}  // namespace

class OllamaRouterTest : public ::testing::Test {
 protected:
  OllamaRouterTest() : backends_(&cfg_), router_(&cfg_, &backends_) {}

  void SetUp() override {
    ModelConfig llama;
    llama.name = "llama3-8b";
    llama.use_model_name = "meta-llama/Llama-3-8B-Instruct";
    llama.aliases = {"llama3"};
    llama.cmd = "llama-server -m llama3-8b-q4_k_m.gguf -c 8192 --jinja";
    cfg_.models.push_back(llama);

    ModelConfig hidden;
    hidden.name = "aaa-hidden";
    hidden.unlisted = true;
    cfg_.models.push_back(hidden);

    ModelConfig qwen;
    qwen.name = "qwen3-4b";
    cfg_.models.push_back(qwen);

    router_.Register(&server_);
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    while (!server_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  void TearDown() override {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  httplib::Result Post(const std::string& path, const nlohmann::json& body, const httplib::Headers& headers = {}) {
    httplib::Client cli("127.0.0.1", port_);
    return cli.Post(path, headers, body.dump(), "application/json");
  }

  httplib::Result Get(const std::string& path, const httplib::Headers& headers = {}) {
    httplib::Client cli("127.0.0.1", port_);
    return cli.Get(path, headers);
  }

  static std::vector<nlohmann::json> Lines(const std::string& body) {
    std::vector<nlohmann::json> out;
    size_t start = 0;
    while (start < body.size()) {
      auto nl = body.find('\n', start);
      if (nl == std::string::npos) nl = body.size();
      out.push_back(nlohmann::json::parse(body.substr(start, nl - start)));
      start = nl + 1;
    }
    return out;
  }

  BridgeConfig cfg_;
  FakeBackendRouter backends_;
  OllamaRouter router_;
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
};

TEST_F(OllamaRouterTest, HeartbeatAndVersion) {
  auto root = Get("/");
  ASSERT_TRUE(root);
  EXPECT_EQ(root->status, 200);
  EXPECT_EQ(root->body, "Ollama is running");

  auto version = Get("/api/version");
  ASSERT_TRUE(version);
  EXPECT_EQ(nlohmann::json::parse(version->body)["version"], "0.0.0");
}

TEST_F(OllamaRouterTest, AllowOriginIsEchoedOnce) {
  auto res = Get("/api/version", {{"Origin", "http://localhost:3000"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value_count("Access-Control-Allow-Origin"), 1u);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "http://localhost:3000");

  auto err = Post("/api/chat", {{"model", ""}}, {{"Origin", "http://a"}});
  ASSERT_TRUE(err);
  EXPECT_EQ(err->status, 400);
  EXPECT_EQ(err->get_header_value_count("Access-Control-Allow-Origin"), 1u);

  auto none = Get("/api/version");
  ASSERT_TRUE(none);
  EXPECT_FALSE(none->has_header("Access-Control-Allow-Origin"));
}

TEST_F(OllamaRouterTest, ChatRoundTrip) {
  backends_.replies["/v1/chat/completions"] =
      R"({"created":1700000000,"choices":[{"message":{"role":"assistant","content":"Hello!"},"finish_reason":"stop"}],)"
      R"("usage":{"prompt_tokens":3,"completion_tokens":2}})";
  auto res = Post("/api/chat", {{"model", "llama3"},
                                {"messages", {{{"role", "user"}, {"content", "hi"}}}},
                                {"keep_alive", 300}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  EXPECT_EQ(backends_.last_model, "llama3-8b");
  EXPECT_EQ(backends_.last_body["model"], "meta-llama/Llama-3-8B-Instruct");
  EXPECT_EQ(backends_.last_body["stream"], false);
  EXPECT_EQ(backends_.keep_alives["llama3-8b"], "300s");

  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["model"], "llama3");
  EXPECT_EQ(j["message"]["content"], "Hello!");
  EXPECT_EQ(j["done_reason"], "stop");
  EXPECT_EQ(j["eval_count"], 2);
}

TEST_F(OllamaRouterTest, ChatErrors) {
  auto malformed = Post("/api/chat", nlohmann::json::array());
  ASSERT_TRUE(malformed);
  EXPECT_EQ(malformed->status, 400);

  auto unknown = Post("/api/chat", {{"model", "ghost"}, {"messages", nlohmann::json::array()}});
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->status, 500);
  EXPECT_EQ(nlohmann::json::parse(unknown->body)["error"],
            "Error selecting model process: could not find suitable backend for model 'ghost'");

  auto bad_tool = Post("/api/chat", {{"model", "llama3"},
                                     {"messages", nlohmann::json::array()},
                                     {"tools", {{{"type", "code"}, {"function", {{"name", "x"}}}}}}});
  ASSERT_TRUE(bad_tool);
  EXPECT_EQ(bad_tool->status, 400);
  EXPECT_EQ(nlohmann::json::parse(bad_tool->body)["error"], "tool 0: only 'function' type is supported");

  backends_.status = 429;
  backends_.replies["/v1/chat/completions"] = R"({"error":{"message":"too many requests"}})";
  auto upstream = Post("/api/chat", {{"model", "llama3"}, {"messages", nlohmann::json::array()}});
  ASSERT_TRUE(upstream);
  EXPECT_EQ(upstream->status, 429);
  EXPECT_EQ(nlohmann::json::parse(upstream->body)["error"], "too many requests");

  backends_.transport_error = true;
  auto down = Post("/api/chat", {{"model", "llama3"}, {"messages", nlohmann::json::array()}});
  ASSERT_TRUE(down);
  EXPECT_EQ(down->status, 502);
}

TEST_F(OllamaRouterTest, StreamingChatWithToolCall) {
  backends_.stream_chunks = {
      "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\",\"tool_calls\":[{\"index\":0,\"id\":\"call_1\","
      "\"type\":\"function\",\"function\":{\"name\":\"get_time\",\"arguments\":\"{\\\"tz\\\":\"}}]}}]}\n\n",
      "data: {\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":0,\"function\":{\"arguments\":\"\\\"UTC\\\"}\"}}]}}]}\n",
      "\ndata: {\"choices\":[{\"delta\":{},\"finish_reason\":\"tool_calls\"}],\"usage\":{\"prompt_tokens\":4,"
      "\"completion_tokens\":6}}\n\ndata: [DONE]\n\n",
  };
  auto res = Post("/api/chat", {{"model", "llama3"},
                                {"stream", true},
                                {"messages", {{{"role", "user"}, {"content", "time?"}}}},
                                {"tools", {{{"type", "function"}, {"function", {{"name", "get_time"}}}}}}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/x-ndjson");
  EXPECT_EQ(backends_.last_body["stream"], true);

  const auto frames = Lines(res->body);
  ASSERT_EQ(frames.size(), 4u);
  EXPECT_EQ(frames[2]["done_reason"], "tool_calls");
  EXPECT_FALSE(frames[2]["done"].get<bool>());
  EXPECT_EQ(frames[2]["message"]["tool_calls"][0]["id"], "call_1");
  EXPECT_EQ(frames[2]["message"]["tool_calls"][0]["function"]["arguments"], nlohmann::json({{"tz", "UTC"}}));
  EXPECT_TRUE(frames[3]["done"].get<bool>());
  EXPECT_EQ(frames[3]["eval_count"], 6);
}

TEST_F(OllamaRouterTest, StreamingUpstreamErrorBecomesFrame) {
  backends_.status = 500;
  backends_.stream_chunks = {R"({"error":{"message":"out of memory"}})"};
  auto res = Post("/api/generate", {{"model", "qwen3-4b"}, {"prompt", "x"}, {"stream", true}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  const auto frames = Lines(res->body);
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0]["error"], "out of memory");
}

TEST_F(OllamaRouterTest, InvalidUtf8FromBackendIsReplacedNotFatal) {
  backends_.status = 429;
  backends_.replies["/v1/chat/completions"] = std::string("slow down ") + "\xfe\xff";
  auto limited = Post("/api/chat", {{"model", "llama3"}, {"messages", nlohmann::json::array()}});
  ASSERT_TRUE(limited);
  EXPECT_EQ(limited->status, 429);
  auto body = nlohmann::json::parse(limited->body, nullptr, false);
  ASSERT_FALSE(body.is_discarded()) << limited->body;
  EXPECT_EQ(body["error"].get<std::string>().rfind("Upstream error: slow down ", 0), 0u);

  backends_.status = 200;
  backends_.stream_chunks = {
      std::string("data: {\"choices\":[{\"delta\":{\"content\":\"") + "\xff" + "\"}}]}\n\n",
      "data: {\"choices\":[{\"delta\":{\"content\":\"after\"},\"finish_reason\":\"stop\"}]}\n\ndata: [DONE]\n\n",
  };
  auto res = Post("/api/chat", {{"model", "llama3"}, {"stream", true}, {"messages", nlohmann::json::array()}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  const auto frames = Lines(res->body);
  ASSERT_GE(frames.size(), 2u);
  EXPECT_EQ(frames[0]["error"].get<std::string>().rfind("Error transforming stream: ", 0), 0u);
  EXPECT_EQ(frames[1]["message"]["content"], "after");
  EXPECT_TRUE(frames.back()["done"].get<bool>());
}

TEST_F(OllamaRouterTest, GenerateRoundTrip) {
  backends_.replies["/v1/completions"] = R"({"choices":[{"text":"42","finish_reason":"stop"}]})";
  auto res = Post("/api/generate", {{"model", "qwen3-4b"}, {"system", "Answer."}, {"prompt", "meaning?"}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  EXPECT_EQ(backends_.last_path, "/v1/completions");
  EXPECT_EQ(backends_.last_body["prompt"], "Answer.\n\nmeaning?");
  EXPECT_EQ(backends_.last_body["model"], "qwen3-4b");
  EXPECT_EQ(nlohmann::json::parse(res->body)["response"], "42");

  auto raw = Post("/api/generate", {{"model", "qwen3-4b"}, {"prompt", "x"}, {"raw", true}});
  ASSERT_TRUE(raw);
  EXPECT_EQ(raw->status, 501);
}

TEST_F(OllamaRouterTest, EmbedAndLegacyEmbeddings) {
  backends_.replies["/v1/embeddings"] = R"({"data":[{"embedding":[0.5,0.25]}],"usage":{"prompt_tokens":2}})";
  auto embed = Post("/api/embed", {{"model", "qwen3-4b"}, {"input", "hello"}});
  ASSERT_TRUE(embed);
  ASSERT_EQ(embed->status, 200) << embed->body;
  auto j = nlohmann::json::parse(embed->body);
  EXPECT_EQ(j["embeddings"].size(), 1u);
  EXPECT_EQ(j["prompt_eval_count"], 2);

  auto legacy = Post("/api/embeddings", {{"model", "qwen3-4b"}, {"prompt", "hello"}});
  ASSERT_TRUE(legacy);
  ASSERT_EQ(legacy->status, 200);
  EXPECT_EQ(backends_.last_body["input"], "hello");
  EXPECT_DOUBLE_EQ(nlohmann::json::parse(legacy->body)["embedding"][1].get<double>(), 0.25);

  auto missing = Post("/api/embeddings", {{"model", "qwen3-4b"}});
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 400);
}

TEST_F(OllamaRouterTest, TagsAreSortedAndSkipUnlisted) {
  auto res = Get("/api/tags");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  auto models = nlohmann::json::parse(res->body)["models"];
  ASSERT_EQ(models.size(), 2u);
  EXPECT_EQ(models[0]["name"], "llama3-8b");
  EXPECT_EQ(models[1]["name"], "qwen3-4b");
  EXPECT_EQ(models[0]["details"]["family"], "llama");
  EXPECT_EQ(models[0]["details"]["parameter_size"], "8B");
  EXPECT_EQ(models[0]["digest"].get<std::string>().size(), 18u);
}

TEST_F(OllamaRouterTest, ShowDescribesModel) {
  auto res = Post("/api/show", {{"model", "llama3"}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["details"]["quantization_level"], "Q4_K_M");
  EXPECT_EQ(j["model_info"]["general.architecture"], "llama");
  EXPECT_EQ(j["model_info"]["llama.context_length"], 8192);
  EXPECT_EQ(j["capabilities"], nlohmann::json({"completion", "tools"}));

  auto missing = Post("/api/show", {{"model", "ghost"}});
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
}

TEST_F(OllamaRouterTest, PsListsReadyBackends) {
  BackendStatus ready;
  ready.name = "llama3-8b";
  ready.state = BackendState::kReady;
  ready.expires_at_unix = 1700000000;
  BackendStatus idle;
  idle.name = "qwen3-4b";
  idle.state = BackendState::kStopped;
  backends_.statuses = {ready, idle};

  auto res = Get("/api/ps");
  ASSERT_TRUE(res);
  auto models = nlohmann::json::parse(res->body)["models"];
  ASSERT_EQ(models.size(), 1u);
  EXPECT_EQ(models[0]["name"], "llama3-8b");
  EXPECT_EQ(models[0]["expires_at"], "2023-11-14T22:13:20Z");
}

TEST_F(OllamaRouterTest, UnsupportedEndpointsReturn501) {
  auto pull = Post("/api/pull", {{"model", "llama3"}});
  ASSERT_TRUE(pull);
  EXPECT_EQ(pull->status, 501);
  EXPECT_TRUE(nlohmann::json::parse(pull->body).contains("error"));

  httplib::Client cli("127.0.0.1", port_);
  auto del = cli.Delete("/api/delete");
  ASSERT_TRUE(del);
  EXPECT_EQ(del->status, 501);
}
