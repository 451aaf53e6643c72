/**
 * @file request_context.hpp
 * @brief Per-request authentication state: the presented token and a
 * single-scope cache of backend answers
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "identity_backend.hpp"

namespace frontdoor {

/**
 * @brief Extract the token from an Authorization header value
 *
 * The value must consist of exactly two whitespace-separated fields, the
 * first being "Bearer" or "OAuth" in any case.
 * @return The token, or an empty string for any other shape
 */
std::string parseAuthorizationHeader(std::string_view header);

/**
 * @brief Authentication state of one in-flight request
 *
 * Created at request entry and discarded at request exit. The scope cache
 * holds at most one entry: querying a new scope drops whatever was cached
 * before the backend is asked.
 */
class RequestContext {
 public:
  RequestContext(std::string authorizationHeader, IdentityBackend& backend);

  RequestContext(const RequestContext&) = delete;
  RequestContext& operator=(const RequestContext&) = delete;

  [[nodiscard]] const std::string& authorizationHeader() const noexcept {
    return authorizationHeader_;
  }

  /**
   * @brief Token parsed from the Authorization header, empty if none
   */
  [[nodiscard]] const std::string& token() const noexcept { return token_; }

  /**
   * @brief Client ID the token was issued to under @p scope
   * @throws NoTokenError if the request carries no token
   * @throws BackendError if the backend rejects the token for @p scope
   */
  std::string currentOAuthClientId(const std::string& scope);

  /**
   * @brief User the token belongs to under @p scope
   * @throws NoTokenError if the request carries no token
   * @throws BackendError if the backend rejects the token for @p scope
   */
  AuthenticatedIdentity currentOAuthUser(const std::string& scope);

  /**
   * @brief Scope currently held by the cache, if any
   */
  [[nodiscard]] std::optional<std::string> cachedScope() const;

 private:
  OAuthUserInfo lookup(const std::string& scope);

  struct CachedResponse {
    std::string scope;
    OAuthUserInfo info;
  };

  std::string authorizationHeader_;
  std::string token_;
  IdentityBackend& backend_;

  mutable std::mutex mutex_;
  std::optional<CachedResponse> cached_;
};

}  // namespace frontdoor
