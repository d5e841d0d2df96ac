#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace amlnet::core {

// Rejected before any traversal starts (bad ids, out-of-range parameters).
struct InvalidRequest : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Malformed configuration or snapshot documents.
struct ConfigError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Recoverable failures travel as values next to a (partial or empty) result.
enum class ErrorCode {
  StoreUnavailable = 1,
  StoreTimeout = 2,
  Cancelled = 3,
  NetworkBuildFailed = 4
};

struct Error {
  ErrorCode code {ErrorCode::StoreUnavailable};
  std::string message {};
};

[[nodiscard]] inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::StoreUnavailable: return "store_unavailable";
    case ErrorCode::StoreTimeout: return "store_timeout";
    case ErrorCode::Cancelled: return "cancelled";
    case ErrorCode::NetworkBuildFailed: return "network_build_failed";
  }
  return "store_unavailable";
}

// Value returned by every GraphStore call. `value` is empty when `error` is set.
template <typename T>
struct StoreResult {
  T value {};
  std::optional<Error> error {};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  [[nodiscard]] static StoreResult success(T v) { return StoreResult{std::move(v), std::nullopt}; }
  [[nodiscard]] static StoreResult failure(ErrorCode code, std::string message) {
    return StoreResult{T{}, Error{code, std::move(message)}};
  }
};

} // namespace amlnet::core
