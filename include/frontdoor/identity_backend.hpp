/**
 * @file identity_backend.hpp
 * @brief Identity/authorization backend seam for opaque access tokens
 */

#pragma once

#include <string>

#include "error.hpp"

namespace frontdoor {

/**
 * @brief What the backend knows about an access token under one scope
 */
struct OAuthUserInfo {
  std::string clientId;    ///< Client the token was issued to
  std::string email;       ///< User email
  std::string userId;      ///< Stable user identifier
  std::string authDomain;  ///< Authentication domain, e.g. "gmail.com"
  bool isAdmin = false;    ///< Whether the user administers the application

  bool operator==(const OAuthUserInfo& other) const = default;
};

/**
 * @brief The caller as resolved by the authentication pipeline
 *
 * An identity token only yields the email; the remaining fields are filled
 * on the access-token path.
 */
struct AuthenticatedIdentity {
  std::string email;
  std::string userId;
  std::string authDomain;
  bool isAdmin = false;
  std::string clientId;

  bool operator==(const AuthenticatedIdentity& other) const = default;
};

/**
 * @brief Abstract "current OAuth user for scope" query
 *
 * A hosted deployment answers it with a platform RPC, a local one with the
 * tokeninfo endpoint (see TokeninfoBackend).
 */
class IdentityBackend {
 public:
  virtual ~IdentityBackend() = default;

  /**
   * @brief Resolve @p token under @p scope
   * @throws BackendError if the token is not valid for the scope or the
   * backend could not be reached
   */
  virtual OAuthUserInfo queryOAuthUser(const std::string& token,
                                       const std::string& scope) = 0;
};

}  // namespace frontdoor
