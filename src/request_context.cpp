#include "frontdoor/request_context.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "frontdoor/logging.hpp"

namespace frontdoor {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

}  // namespace

std::string parseAuthorizationHeader(std::string_view header) {
  std::istringstream stream{std::string(header)};
  std::vector<std::string> fields;
  std::string field;
  while (stream >> field) {
    fields.push_back(field);
  }
  if (fields.size() != 2) {
    return {};
  }

  auto scheme = toLower(fields[0]);
  if (scheme != "bearer" && scheme != "oauth") {
    return {};
  }
  return fields[1];
}

RequestContext::RequestContext(std::string authorizationHeader,
                               IdentityBackend& backend)
    : authorizationHeader_(std::move(authorizationHeader)),
      token_(parseAuthorizationHeader(authorizationHeader_)),
      backend_(backend) {}

std::string RequestContext::currentOAuthClientId(const std::string& scope) {
  return lookup(scope).clientId;
}

AuthenticatedIdentity RequestContext::currentOAuthUser(
    const std::string& scope) {
  auto info = lookup(scope);
  return AuthenticatedIdentity{info.email, info.userId, info.authDomain,
                               info.isAdmin, info.clientId};
}

std::optional<std::string> RequestContext::cachedScope() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cached_) {
    return std::nullopt;
  }
  return cached_->scope;
}

OAuthUserInfo RequestContext::lookup(const std::string& scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cached_ && cached_->scope == scope) {
    return cached_->info;
  }

  // Only one scope is cached at a time
  cached_.reset();

  if (token_.empty()) {
    throw NoTokenError();
  }

  FD_LOG_TRACE("Querying identity backend for scope {}", scope);
  auto info = backend_.queryOAuthUser(token_, scope);
  cached_ = CachedResponse{scope, info};
  return info;
}

}  // namespace frontdoor
