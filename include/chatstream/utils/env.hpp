#pragma once

#include <optional>
#include <string>

namespace chatstream::utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is not set.
 */
std::optional<std::string> read_env(const std::string& name);

/// Returns the trimmed value of `name`, or `fallback` when unset or blank.
std::string read_env_or(const std::string& name, const std::string& fallback);

}  // namespace chatstream::utils
