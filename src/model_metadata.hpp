#pragma once

#include "config.hpp"
#include "ollama_types.hpp"

#include <string>
#include <vector>

namespace bridge {

struct ModelMetadata {
  std::string architecture = "unknown";
  std::string family = "unknown";
  std::string parameter_size = "unknown";
  std::string quantization_level = "unknown";
  int context_length = 0;
  std::vector<std::string> capabilities;
};

std::string InferArchitecture(const std::string& model_id);
std::string InferFamily(const std::string& model_id, const std::string& architecture);
std::string InferParameterSize(const std::string& model_id);
std::string InferQuantizationLevel(const std::string& model_id);

std::vector<std::string> SplitCommandLine(const std::string& cmd);
ModelMetadata ParseLaunchCommand(const std::string& cmd, const std::string& model_id);

// Inference from the launch command, overridden by the configured metadata.
ModelMetadata ResolveModelMetadata(const ModelConfig& model);

// Name-only view used by the listing endpoints.
ModelDetails ListingDetails(const ModelConfig& model);
ModelDetails ShowDetails(const ModelMetadata& meta);

}  // namespace bridge
