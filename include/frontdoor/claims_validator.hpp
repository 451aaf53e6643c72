/**
 * @file claims_validator.hpp
 * @brief Policy checks over the claims of a verified identity token
 */

#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "signed_token.hpp"

namespace frontdoor {

/**
 * @brief Validator for identity token claims with configurable issuer
 *
 * Rejections are reported as a false return and logged; the token has
 * already passed signature verification by the time it gets here.
 */
class ClaimsValidator {
 private:
  std::string expectedIssuer_;  ///< Required "iss" value

 public:
  /**
   * @brief Construct a validator expecting the production issuer
   */
  ClaimsValidator();

  /**
   * @brief Construct a validator expecting the configured issuer
   */
  explicit ClaimsValidator(const AuthConfig& config);

  /**
   * @brief Set expected token issuer
   * @param issuer Required "iss" value
   * @return Reference to this validator for chaining
   */
  ClaimsValidator& withExpectedIssuer(std::string issuer);

  /**
   * @brief Check claims against the caller's policy
   * @param claims Claims of a verified token
   * @param audiences Audiences accepted when "aud" differs from "azp"
   * @param clientIds Accepted authorized parties
   * @return true if every rule holds
   */
  bool accept(const TokenClaims& claims,
              const std::vector<std::string>& audiences,
              const std::vector<std::string>& clientIds) const;

  [[nodiscard]] const std::string& expectedIssuer() const noexcept {
    return expectedIssuer_;
  }
};

}  // namespace frontdoor
