/**
 * @file error.hpp
 * @brief Error codes, exception hierarchy and Result type for request
 * authentication
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace frontdoor {

/**
 * @brief Error codes for programmatic error handling
 */
enum class AuthErrorCode : uint32_t {
  SUCCESS = 0,
  NO_POLICY_PROVIDED = 1000,
  NO_TOKEN = 1001,
  MALFORMED_TOKEN = 1002,
  INVALID_BASE64 = 1003,
  UNSUPPORTED_ALGORITHM = 2000,
  INVALID_SIGNATURE = 2001,
  USED_TOO_EARLY = 2002,
  USED_TOO_LATE = 2003,
  EXPIRY_TOO_FAR = 2004,
  CLAIMS_REJECTED = 2005,
  CERTIFICATE_FETCH_FAILED = 3000,
  NO_VALID_SCOPE = 4000,
  MISMATCHED_CLIENT_ID = 4001,
  BACKEND_ERROR = 4002,
  CACHE_ERROR = 5000,
  IO_ERROR = 5001,
  INVALID_CONFIG = 6000
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(AuthErrorCode code) noexcept {
  switch (code) {
    case AuthErrorCode::SUCCESS:
      return "Success";
    case AuthErrorCode::NO_POLICY_PROVIDED:
      return "No scopes, audiences or client IDs provided";
    case AuthErrorCode::NO_TOKEN:
      return "No token found";
    case AuthErrorCode::MALFORMED_TOKEN:
      return "Malformed token";
    case AuthErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case AuthErrorCode::UNSUPPORTED_ALGORITHM:
      return "Unsupported algorithm";
    case AuthErrorCode::INVALID_SIGNATURE:
      return "Invalid token signature";
    case AuthErrorCode::USED_TOO_EARLY:
      return "Token used too early";
    case AuthErrorCode::USED_TOO_LATE:
      return "Token used too late";
    case AuthErrorCode::EXPIRY_TOO_FAR:
      return "Token expiry is too far in the future";
    case AuthErrorCode::CLAIMS_REJECTED:
      return "Token claims rejected";
    case AuthErrorCode::CERTIFICATE_FETCH_FAILED:
      return "Certificate fetch failed";
    case AuthErrorCode::NO_VALID_SCOPE:
      return "No valid scope";
    case AuthErrorCode::MISMATCHED_CLIENT_ID:
      return "Mismatched client ID";
    case AuthErrorCode::BACKEND_ERROR:
      return "Identity backend error";
    case AuthErrorCode::CACHE_ERROR:
      return "Cache backend error";
    case AuthErrorCode::IO_ERROR:
      return "Input/output error";
    case AuthErrorCode::INVALID_CONFIG:
      return "Invalid configuration";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all authentication errors
 */
class AuthError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit AuthError(AuthErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] AuthErrorCode errorCode() const noexcept {
    return error_code_;
  }

 private:
  AuthErrorCode error_code_;
};

class NoPolicyProvidedError : public AuthError {
 public:
  NoPolicyProvidedError() : AuthError(AuthErrorCode::NO_POLICY_PROVIDED) {}
};

class NoTokenError : public AuthError {
 public:
  NoTokenError() : AuthError(AuthErrorCode::NO_TOKEN) {}
};

/**
 * @brief Wrong segment count, undecodable segment or unparsable JSON
 */
class MalformedTokenError : public AuthError {
 public:
  MalformedTokenError() : AuthError(AuthErrorCode::MALFORMED_TOKEN) {}
  explicit MalformedTokenError(std::string_view details)
      : AuthError(AuthErrorCode::MALFORMED_TOKEN,
                  std::string("Malformed token: ") + std::string(details)) {}
};

class InvalidBase64Error : public AuthError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : AuthError(
            AuthErrorCode::INVALID_BASE64,
            std::string("Invalid base64 encoding: ") + std::string(details)) {}
};

class UnsupportedAlgorithmError : public AuthError {
 public:
  explicit UnsupportedAlgorithmError(std::string_view algorithm)
      : AuthError(
            AuthErrorCode::UNSUPPORTED_ALGORITHM,
            std::string("Unsupported algorithm: ") + std::string(algorithm)) {}
};

/**
 * @brief No certificate in the active set verifies the signature
 */
class InvalidSignatureError : public AuthError {
 public:
  InvalidSignatureError() : AuthError(AuthErrorCode::INVALID_SIGNATURE) {}
};

class UsedTooEarlyError : public AuthError {
 public:
  UsedTooEarlyError() : AuthError(AuthErrorCode::USED_TOO_EARLY) {}
};

class UsedTooLateError : public AuthError {
 public:
  UsedTooLateError() : AuthError(AuthErrorCode::USED_TOO_LATE) {}
};

class ExpiryTooFarError : public AuthError {
 public:
  ExpiryTooFarError() : AuthError(AuthErrorCode::EXPIRY_TOO_FAR) {}
};

class ClaimsRejectedError : public AuthError {
 public:
  ClaimsRejectedError() : AuthError(AuthErrorCode::CLAIMS_REJECTED) {}
};

class CertificateFetchError : public AuthError {
 public:
  explicit CertificateFetchError(std::string_view details)
      : AuthError(AuthErrorCode::CERTIFICATE_FETCH_FAILED,
                  std::string("Certificate fetch failed: ") +
                      std::string(details)) {}
};

class NoValidScopeError : public AuthError {
 public:
  NoValidScopeError() : AuthError(AuthErrorCode::NO_VALID_SCOPE) {}
};

class MismatchedClientIdError : public AuthError {
 public:
  explicit MismatchedClientIdError(std::string_view clientId)
      : AuthError(AuthErrorCode::MISMATCHED_CLIENT_ID,
                  std::string("Mismatched client ID: ") +
                      std::string(clientId)) {}
};

/**
 * @brief The identity backend refused or failed a scope query
 */
class BackendError : public AuthError {
 public:
  explicit BackendError(std::string_view details)
      : AuthError(AuthErrorCode::BACKEND_ERROR, details) {}
};

class CacheError : public AuthError {
 public:
  explicit CacheError(std::string_view details)
      : AuthError(AuthErrorCode::CACHE_ERROR,
                  std::string("Cache backend error: ") + std::string(details)) {
  }
};

/**
 * @brief Exception for transport-level I/O errors
 */
class IoError : public AuthError {
 public:
  explicit IoError(std::string_view details)
      : AuthError(AuthErrorCode::IO_ERROR,
                  std::string("Input/output error: ") + std::string(details)) {}
};

class InvalidConfigError : public AuthError {
 public:
  explicit InvalidConfigError(std::string_view details)
      : AuthError(AuthErrorCode::INVALID_CONFIG,
                  std::string("Invalid configuration: ") +
                      std::string(details)) {}
};

/**
 * @brief Result type for better error handling without exceptions
 * Inspired by Rust's Result and C++23's std::expected
 */
template <typename T, typename E = AuthError>
class Result {
 public:
  // Constructors
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  // Static factory methods
  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  // Query methods
  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws if error)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T& value() & {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  // Safe value access
  const T& valueOr(const T& defaultValue) const& noexcept {
    return isSuccess() ? std::get<T>(data_) : defaultValue;
  }

  // Error access
  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using AuthResult = Result<T, AuthError>;

}  // namespace frontdoor
