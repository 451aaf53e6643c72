/**
 * @file tokeninfo_backend.hpp
 * @brief IdentityBackend backed by the OAuth2 tokeninfo endpoint
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "config.hpp"
#include "http_client.hpp"
#include "identity_backend.hpp"

namespace frontdoor {

/**
 * @brief Decoded tokeninfo response
 */
struct Tokeninfo {
  std::string issuedTo;
  std::string audience;
  std::string userId;
  std::string scope;  ///< Space-separated granted scopes
  int64_t expiresIn = 0;
  std::string email;
  bool verifiedEmail = false;
  std::string accessType;
  std::string errorDescription;
};

/**
 * @brief Decode a tokeninfo JSON document
 * @throws BackendError if the document is not a JSON object
 */
Tokeninfo parseTokeninfo(std::string_view document);

/**
 * @brief Resolves access tokens with GET <url>?access_token=<token>
 *
 * Intended for local deployments. A token is accepted only if it has not
 * expired, carries a verified non-empty email and was granted the requested
 * scope.
 */
class TokeninfoBackend : public IdentityBackend {
 public:
  TokeninfoBackend(std::shared_ptr<HttpClient> http,
                   std::string tokeninfoUrl = DEFAULT_TOKENINFO_URL);

  OAuthUserInfo queryOAuthUser(const std::string& token,
                               const std::string& scope) override;

  /**
   * @brief Fetch and check tokeninfo without matching a scope
   * @throws BackendError on transport failure, non-200 status, an expired
   * token or an unverified or empty email
   */
  Tokeninfo fetchTokeninfo(const std::string& token);

 private:
  std::shared_ptr<HttpClient> http_;
  std::string tokeninfoUrl_;
};

}  // namespace frontdoor
