#include <gtest/gtest.h>

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace bridge;

TEST(ParseHttpEndpointTest, SplitsUrl) {
  auto ep = ParseHttpEndpoint("http://10.0.0.5:9000/v1/", 8080);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "10.0.0.5");
  EXPECT_EQ(ep.port, 9000);
  EXPECT_EQ(ep.base_path, "/v1");

  auto bare = ParseHttpEndpoint("localhost", 8080);
  EXPECT_EQ(bare.host, "localhost");
  EXPECT_EQ(bare.port, 8080);
  EXPECT_EQ(bare.base_path, "");

  auto tls = ParseHttpEndpoint("https://api.example.com", 443);
  EXPECT_EQ(tls.scheme, "https");
  EXPECT_EQ(tls.port, 443);
}

class ModelConfigTest : public ::testing::Test {
 protected:
  BridgeConfig cfg_;
  std::string err_;
};

TEST_F(ModelConfigTest, LoadsModelsFromJson) {
  auto doc = nlohmann::json::parse(R"({
    "models": {
      "qwen3-8b": {
        "proxy": "http://127.0.0.1:9001",
        "cmd": "llama-server -m qwen3-8b-q4_k_m.gguf --port 9001",
        "useModelName": "Qwen/Qwen3-8B",
        "aliases": ["qwen3", "default"],
        "ttl": 300,
        "metadata": {"contextLength": 40960}
      },
      "embedder": {"proxy": "http://127.0.0.1:9002", "unlisted": true}
    }
  })");
  ASSERT_TRUE(LoadModelsFromJson(doc, &cfg_, &err_)) << err_;
  ASSERT_EQ(cfg_.models.size(), 2u);

  const auto* qwen = FindModelConfig(cfg_, "qwen3-8b");
  ASSERT_NE(qwen, nullptr);
  EXPECT_EQ(qwen->proxy.port, 9001);
  EXPECT_EQ(qwen->use_model_name, "Qwen/Qwen3-8B");
  EXPECT_EQ(qwen->ttl_seconds, 300);
  EXPECT_EQ(qwen->metadata["contextLength"], 40960);

  EXPECT_EQ(FindModelConfig(cfg_, "default"), qwen);
  const auto* embedder = FindModelConfig(cfg_, "embedder");
  ASSERT_NE(embedder, nullptr);
  EXPECT_TRUE(embedder->unlisted);
  EXPECT_EQ(FindModelConfig(cfg_, "missing"), nullptr);
  EXPECT_EQ(FindModelConfig(cfg_, ""), nullptr);
}

TEST_F(ModelConfigTest, RejectsEntryWithoutProxy) {
  auto doc = nlohmann::json::parse(R"({"models": {"broken": {"cmd": "llama-server"}}})");
  EXPECT_FALSE(LoadModelsFromJson(doc, &cfg_, &err_));
  EXPECT_EQ(err_, "model 'broken': missing required field 'proxy'");
}

TEST_F(ModelConfigTest, RejectsWrongFieldTypes) {
  auto doc = nlohmann::json::parse(R"({"models": {"m": {"proxy": "http://h:1", "ttl": "5m"}}})");
  EXPECT_FALSE(LoadModelsFromJson(doc, &cfg_, &err_));
  EXPECT_EQ(err_, "model 'm': 'ttl' must be an integer");
}

TEST_F(ModelConfigTest, RejectsAliasCollidingWithModel) {
  auto doc = nlohmann::json::parse(R"({"models": {
    "a": {"proxy": "http://h:1"},
    "b": {"proxy": "http://h:2", "aliases": ["a"]}
  }})");
  EXPECT_FALSE(LoadModelsFromJson(doc, &cfg_, &err_));
  EXPECT_EQ(err_, "model 'b': duplicate alias 'a'");
}

TEST_F(ModelConfigTest, RejectsTlsProxy) {
  auto doc = nlohmann::json::parse(R"({"models": {"cloud": {"proxy": "https://api.example.com/v1"}}})");
  EXPECT_FALSE(LoadModelsFromJson(doc, &cfg_, &err_));
  EXPECT_EQ(err_, "model 'cloud': proxy must be an http:// URL (TLS backends are not supported)");

  EXPECT_FALSE(ParseModelsCsv("cloud=https://api.example.com", &cfg_, &err_));
  EXPECT_EQ(err_, "model 'cloud': proxy must be an http:// URL (TLS backends are not supported)");
  EXPECT_TRUE(cfg_.models.empty());
}

TEST_F(ModelConfigTest, ParsesCsvList) {
  ASSERT_TRUE(ParseModelsCsv("llama3=http://127.0.0.1:8081, qwen = http://127.0.0.1:8082/v1", &cfg_, &err_)) << err_;
  ASSERT_EQ(cfg_.models.size(), 2u);
  EXPECT_EQ(cfg_.models[1].name, "qwen");
  EXPECT_EQ(cfg_.models[1].proxy.base_path, "/v1");

  ASSERT_TRUE(ParseModelsCsv("llama3=http://127.0.0.1:9999", &cfg_, &err_));
  ASSERT_EQ(cfg_.models.size(), 2u);
  EXPECT_EQ(FindModelConfig(cfg_, "llama3")->proxy.port, 9999);

  EXPECT_FALSE(ParseModelsCsv("nourl", &cfg_, &err_));
  EXPECT_EQ(err_, "expected name=url, got 'nourl'");
}

TEST_F(ModelConfigTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "ollama_bridge_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"models": {"m": {"proxy": "http://127.0.0.1:7000"}}})";
  }
  ASSERT_TRUE(LoadModelsFromFile(path, &cfg_, &err_)) << err_;
  EXPECT_EQ(cfg_.models.size(), 1u);
  std::remove(path.c_str());

  EXPECT_FALSE(LoadModelsFromFile(path, &cfg_, &err_));
  EXPECT_EQ(err_, "cannot open config file: " + path);
}
