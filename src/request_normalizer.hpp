#pragma once

#include "ollama_types.hpp"

#include <optional>
#include <string>

namespace bridge {

// Canonical duration string for keep_alive. Empty means "no override".
std::string NormalizeKeepAlive(const KeepAlive& keep_alive);

// Rejects non-function tools, then drops nameless tool calls and orphaned tool
// responses. Running it twice yields the same request as running it once.
bool ValidateToolRequest(ChatRequest* req, ApiError* err);

std::optional<double> ParseDurationSeconds(const std::string& text);

}  // namespace bridge
