/**
 * @file access_token_resolver.hpp
 * @brief Scope and client ID matching for opaque access tokens
 */

#pragma once

#include <string>
#include <vector>

#include "error.hpp"
#include "identity_backend.hpp"
#include "request_context.hpp"

namespace frontdoor {

/**
 * @brief First scope under which the token resolved, and its client
 */
struct ScopeMatch {
  std::string scope;
  std::string clientId;

  bool operator==(const ScopeMatch& other) const = default;
};

/**
 * @brief Resolves an access token into a scope, a client and a user
 */
class AccessTokenResolver {
 public:
  /**
   * @brief Find the first candidate scope the token is valid for
   *
   * Scopes are tried in order; a backend rejection moves on to the next
   * one. The first scope that resolves decides the outcome: its client ID
   * must be one of @p clientIds.
   * @throws MismatchedClientIdError if the resolved client is not allowed
   * @throws NoValidScopeError if no candidate scope resolves
   */
  ScopeMatch resolveScope(RequestContext& ctx,
                          const std::vector<std::string>& scopes,
                          const std::vector<std::string>& clientIds) const;

  /**
   * @brief Resolve the user for a scope found by resolveScope()
   *
   * Served from the request's scope cache when @p scope is the one cached.
   */
  AuthenticatedIdentity resolveUser(RequestContext& ctx,
                                    const std::string& scope) const;
};

}  // namespace frontdoor
