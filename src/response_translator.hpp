#pragma once

#include "ollama_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bridge {

std::string FinishReasonToSource(const std::string& reason);
std::string RoleToSource(const std::string& role);

// Backend tool calls keep their ids; each gets its positional index.
std::vector<ToolCall> BackendToolCallsToSource(const nlohmann::json& tool_calls);

// Parses a fragment buffer as a JSON object, falling back to an empty object.
nlohmann::json ParseToolArguments(const std::string& text);

ApiError UpstreamErrorFromBody(int status, const std::string& body);

std::optional<ChatResponse> TranslateChatResponse(const std::string& body, const std::string& model, ApiError* err);
std::optional<GenerateResponse> TranslateGenerateResponse(const std::string& body,
                                                          const std::string& model,
                                                          ApiError* err);
std::optional<EmbedResponse> TranslateEmbedResponse(const std::string& body, const std::string& model, ApiError* err);
std::optional<LegacyEmbeddingsResponse> TranslateLegacyEmbeddingsResponse(const std::string& body, ApiError* err);

// Null-tolerant accessors shared with the stream engine.
std::string JsonString(const nlohmann::json& j, const char* key);
std::optional<Usage> JsonUsage(const nlohmann::json& j);

}  // namespace bridge
