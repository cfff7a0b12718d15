#pragma once

#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatstream::testing {

inline void set_env(const std::string& name, const std::string& value) {
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  ::setenv(name.c_str(), value.c_str(), 1);
#endif
}

inline void unset_env(const std::string& name) {
#if defined(_WIN32)
  _putenv_s(name.c_str(), "");
#else
  ::unsetenv(name.c_str());
#endif
}

/// Sets (or unsets, for std::nullopt) one variable and restores the previous
/// value on destruction.
class EnvVarGuard {
public:
  EnvVarGuard(std::string name, std::optional<std::string> value) : name_(std::move(name)) {
    if (const char* existing = std::getenv(name_.c_str())) {
      previous_ = std::string(existing);
    }
    if (value.has_value()) {
      set_env(name_, *value);
    } else {
      unset_env(name_);
    }
  }

  EnvVarGuard(const EnvVarGuard&) = delete;
  EnvVarGuard& operator=(const EnvVarGuard&) = delete;

  ~EnvVarGuard() {
    if (previous_.has_value()) {
      set_env(name_, *previous_);
    } else {
      unset_env(name_);
    }
  }

private:
  std::string name_;
  std::optional<std::string> previous_;
};

/// Clears every variable ResponseStreamClient reads so tests see only the
/// options they pass.
class ClientEnvGuard {
public:
  ClientEnvGuard() {
    for (const char* name : {"OPENAI_API_KEY", "OPENAI_BASE_URL", "OPENAI_ORG_ID", "OPENAI_PROJECT_ID",
                             "CHATSTREAM_LOG"}) {
      guards_.push_back(std::make_unique<EnvVarGuard>(name, std::nullopt));
    }
  }

private:
  std::vector<std::unique_ptr<EnvVarGuard>> guards_;
};

}  // namespace chatstream::testing
