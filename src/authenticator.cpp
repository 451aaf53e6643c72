#include "frontdoor/authenticator.hpp"

#include "frontdoor/logging.hpp"

namespace frontdoor {

Authenticator::Authenticator(SignedTokenVerifier& verifier,
                             std::shared_ptr<Clock> clock, AuthConfig config)
    : verifier_(verifier),
      clock_(std::move(clock)),
      config_(std::move(config)),
      validator_(config_) {
  if (!clock_) {
    throw std::invalid_argument("Authenticator requires a clock");
  }
}

AuthResult<AuthenticatedIdentity> Authenticator::authenticate(
    RequestContext& ctx, const AuthPolicy& policy) const {
  using Outcome = AuthResult<AuthenticatedIdentity>;

  if (policy.empty()) {
    return Outcome::error(NoPolicyProvidedError());
  }

  const auto& token = ctx.token();
  if (token.empty()) {
    return Outcome::error(NoTokenError());
  }

  if (identityTokenApplies(policy)) {
    try {
      return Outcome::success(currentIdTokenUser(
          token, policy.audiences, policy.clientIds, clock_->nowSeconds()));
    } catch (const AuthError& e) {
      FD_LOG_DEBUG("Identity token rejected, trying access token: {}",
                   e.what());
    }
  }

  try {
    return Outcome::success(
        currentBearerTokenUser(ctx, policy.scopes, policy.clientIds));
  } catch (const AuthError& e) {
    FD_LOG_INFO("Request authentication failed: {}", e.what());
    return Outcome::error(e);
  }
}

AuthenticatedIdentity Authenticator::currentIdTokenUser(
    std::string_view token, const std::vector<std::string>& audiences,
    const std::vector<std::string>& clientIds, int64_t now) const {
  auto claims = verifier_.verify(token, now);
  if (!validator_.accept(claims, audiences, clientIds)) {
    throw ClaimsRejectedError();
  }

  AuthenticatedIdentity identity;
  identity.email = claims.email;
  return identity;
}

AuthenticatedIdentity Authenticator::currentBearerTokenUser(
    RequestContext& ctx, const std::vector<std::string>& scopes,
    const std::vector<std::string>& clientIds) const {
  auto match = resolver_.resolveScope(ctx, scopes, clientIds);
  return resolver_.resolveUser(ctx, match.scope);
}

bool Authenticator::identityTokenApplies(const AuthPolicy& policy) const {
  return policy.scopes.size() == 1 &&
         policy.scopes.front() == config_.emailScope &&
         !policy.clientIds.empty();
}

}  // namespace frontdoor
