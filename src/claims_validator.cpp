#include "frontdoor/claims_validator.hpp"

#include <algorithm>

#include "frontdoor/logging.hpp"

namespace frontdoor {

namespace {

bool contains(const std::vector<std::string>& values,
              const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

ClaimsValidator::ClaimsValidator() : expectedIssuer_(GOOGLE_ISSUER) {}

ClaimsValidator::ClaimsValidator(const AuthConfig& config)
    : expectedIssuer_(config.expectedIssuer) {}

ClaimsValidator& ClaimsValidator::withExpectedIssuer(std::string issuer) {
  expectedIssuer_ = std::move(issuer);
  return *this;
}

bool ClaimsValidator::accept(const TokenClaims& claims,
                             const std::vector<std::string>& audiences,
                             const std::vector<std::string>& clientIds) const {
  if (claims.issuer != expectedIssuer_) {
    FD_LOG_WARN("Issuer was not valid: {}", claims.issuer);
    return false;
  }

  if (claims.audience.empty() || claims.authorizedParty.empty()) {
    FD_LOG_WARN("Missing aud or azp claim");
    return false;
  }

  // aud and azp only diverge for some client platforms
  if (claims.authorizedParty != claims.audience &&
      !contains(audiences, claims.audience)) {
    FD_LOG_WARN("Audience not allowed: {}", claims.audience);
    return false;
  }

  if (clientIds.empty()) {
    FD_LOG_WARN("No allowed client IDs specified, id_token is rejected");
    return false;
  }
  if (!contains(clientIds, claims.authorizedParty)) {
    FD_LOG_WARN("Client ID is not allowed: {}", claims.authorizedParty);
    return false;
  }

  if (claims.email.empty()) {
    FD_LOG_WARN("Token has no email claim");
    return false;
  }
  return true;
}

}  // namespace frontdoor
