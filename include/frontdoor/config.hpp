/**
 * @file config.hpp
 * @brief Authentication pipeline configuration
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "error.hpp"

namespace frontdoor {

/// Tolerance applied to iat/exp to absorb clock drift
constexpr int64_t CLOCK_SKEW_SECS = 300;
/// Longest lifetime (exp - iat) accepted for an identity token
constexpr int64_t MAX_TOKEN_LIFETIME_SECS = 86400;

constexpr const char* DEFAULT_CERT_URI =
    "https://www.googleapis.com/service_accounts/v1/metadata/raw/"
    "federated-signon@system.gserviceaccount.com";
constexpr const char* DEFAULT_TOKENINFO_URL =
    "https://www.googleapis.com/oauth2/v2/tokeninfo";
constexpr const char* EMAIL_SCOPE =
    "https://www.googleapis.com/auth/userinfo.email";
constexpr const char* GOOGLE_ISSUER = "accounts.google.com";
constexpr const char* CERT_NAMESPACE = "__verify_jwt";

/**
 * @brief Settings shared by every stage of the pipeline
 *
 * Defaults reproduce the production identity provider; tests and local
 * deployments override individual fields.
 */
struct AuthConfig {
  std::string certUri = DEFAULT_CERT_URI;
  std::string tokeninfoUrl = DEFAULT_TOKENINFO_URL;
  std::string emailScope = EMAIL_SCOPE;
  std::string expectedIssuer = GOOGLE_ISSUER;
  std::string certNamespace = CERT_NAMESPACE;
  int64_t clockSkewSecs = CLOCK_SKEW_SECS;
  int64_t maxTokenLifetimeSecs = MAX_TOKEN_LIFETIME_SECS;
  std::chrono::seconds httpTimeout{10};
  std::string logLevel = "info";

  AuthConfig& withCertUri(std::string uri);
  AuthConfig& withTokeninfoUrl(std::string url);
  AuthConfig& withEmailScope(std::string scope);
  AuthConfig& withExpectedIssuer(std::string issuer);
  AuthConfig& withCertNamespace(std::string ns);
  AuthConfig& withClockSkew(int64_t seconds);
  AuthConfig& withMaxTokenLifetime(int64_t seconds);
  AuthConfig& withHttpTimeout(std::chrono::seconds timeout);
  AuthConfig& withLogLevel(std::string level);

  /**
   * @brief Check internal consistency
   * @throws InvalidConfigError naming the first offending field
   */
  void validate() const;

  /**
   * @brief Push logLevel into the process logger
   */
  void applyLogLevel() const;

  /**
   * @brief Build a configuration from a JSON object
   *
   * Recognised keys: cert_uri, tokeninfo_url, email_scope, expected_issuer,
   * cert_namespace, clock_skew_secs, max_token_lifetime_secs,
   * http_timeout_secs, log_level. Missing keys keep their defaults.
   * @throws InvalidConfigError on wrong types or invalid values
   */
  static AuthConfig fromJson(const nlohmann::json& j);

  /**
   * @brief Parse a JSON document and build a configuration from it
   * @throws InvalidConfigError if the text is not valid JSON
   */
  static AuthConfig fromJsonString(const std::string& text);
};

}  // namespace frontdoor
