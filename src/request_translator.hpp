#pragma once

#include "ollama_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bridge {

bool MessagesToBackend(const std::vector<Message>& messages, nlohmann::json* out, ApiError* err);
nlohmann::json ToolsToBackend(const std::vector<Tool>& tools);

// Adds every option key the body does not already carry.
void MergeOptions(nlohmann::json* body, const nlohmann::json& options);

std::optional<nlohmann::json> BuildChatBody(const ChatRequest& req, const std::string& backend_model, ApiError* err);
std::optional<nlohmann::json> BuildCompletionBody(const GenerateRequest& req,
                                                  const std::string& backend_model,
                                                  ApiError* err);
nlohmann::json BuildEmbeddingsBody(const EmbedRequest& req, const std::string& backend_model);
nlohmann::json BuildLegacyEmbeddingsBody(const LegacyEmbeddingsRequest& req, const std::string& backend_model);

}  // namespace bridge
