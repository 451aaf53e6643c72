#include "frontdoor/access_token_resolver.hpp"

#include <algorithm>

#include "frontdoor/logging.hpp"

namespace frontdoor {

ScopeMatch AccessTokenResolver::resolveScope(
    RequestContext& ctx, const std::vector<std::string>& scopes,
    const std::vector<std::string>& clientIds) const {
  for (const auto& scope : scopes) {
    std::string clientId;
    try {
      clientId = ctx.currentOAuthClientId(scope);
    } catch (const AuthError& e) {
      FD_LOG_DEBUG("Token not valid for scope {}: {}", scope, e.what());
      continue;
    }

    if (std::find(clientIds.begin(), clientIds.end(), clientId) ==
        clientIds.end()) {
      FD_LOG_WARN("Client ID {} is not allowed for scope {}", clientId, scope);
      throw MismatchedClientIdError(clientId);
    }
    return ScopeMatch{scope, clientId};
  }
  throw NoValidScopeError();
}

AuthenticatedIdentity AccessTokenResolver::resolveUser(
    RequestContext& ctx, const std::string& scope) const {
  return ctx.currentOAuthUser(scope);
}

}  // namespace frontdoor
