/**
 * @file authenticator.hpp
 * @brief Top-level request authentication: identity-token path with
 * fallback to the access-token path
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "access_token_resolver.hpp"
#include "claims_validator.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "error.hpp"
#include "identity_backend.hpp"
#include "request_context.hpp"
#include "signed_token.hpp"

namespace frontdoor {

/**
 * @brief What a service method accepts
 */
struct AuthPolicy {
  std::vector<std::string> scopes;     ///< Tried in order
  std::vector<std::string> audiences;  ///< Identity token audiences
  std::vector<std::string> clientIds;  ///< Allowed client IDs

  [[nodiscard]] bool empty() const noexcept {
    return scopes.empty() && audiences.empty() && clientIds.empty();
  }
};

/**
 * @brief Decides who the caller of a request is
 *
 * One instance is shared by the whole service; per-request state lives in
 * the RequestContext passed to authenticate().
 */
class Authenticator {
 public:
  /**
   * @param verifier Identity token verifier
   * @param clock Time source for token lifetime checks
   * @param config Supplies the email scope that selects the identity-token
   * path and the issuer the claims must name
   */
  explicit Authenticator(
      SignedTokenVerifier& verifier,
      std::shared_ptr<Clock> clock = std::make_shared<SystemClock>(),
      AuthConfig config = {});

  /**
   * @brief Authenticate the request behind @p ctx against @p policy
   *
   * When the policy asks for exactly the email scope and names client IDs,
   * the token is first tried as an identity token. Any failure there falls
   * back to the access-token path, whose outcome is final.
   * @return The caller, or the terminal error (NoPolicyProvided, NoToken,
   * NoValidScope, MismatchedClientId)
   */
  AuthResult<AuthenticatedIdentity> authenticate(
      RequestContext& ctx, const AuthPolicy& policy) const;

  /**
   * @brief Identity-token path alone
   * @return Identity carrying only the email claim
   * @throws AuthError subclasses from verification, ClaimsRejectedError if
   * the claims do not satisfy the policy
   */
  AuthenticatedIdentity currentIdTokenUser(
      std::string_view token, const std::vector<std::string>& audiences,
      const std::vector<std::string>& clientIds, int64_t now) const;

  /**
   * @brief Access-token path alone
   * @throws NoValidScopeError, MismatchedClientIdError, BackendError
   */
  AuthenticatedIdentity currentBearerTokenUser(
      RequestContext& ctx, const std::vector<std::string>& scopes,
      const std::vector<std::string>& clientIds) const;

 private:
  bool identityTokenApplies(const AuthPolicy& policy) const;

  SignedTokenVerifier& verifier_;
  std::shared_ptr<Clock> clock_;
  AuthConfig config_;
  ClaimsValidator validator_;
  AccessTokenResolver resolver_;
};

}  // namespace frontdoor
