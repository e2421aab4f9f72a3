#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "backend.hpp"

class Config;

// Build the backend named by backend.type. "auto" picks docker when the
// docker CLI answers, otherwise local.
Result<std::shared_ptr<Backend>> create_backend(const Config& config);

// Parse "local" | "docker" | "ssh"; nullopt for anything else.
std::optional<BackendType> parse_backend_type(const std::string& name);
