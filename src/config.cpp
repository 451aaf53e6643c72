#include "frontdoor/config.hpp"

#include <nlohmann/json.hpp>

#include "frontdoor/logging.hpp"

using json = nlohmann::json;

namespace frontdoor {

AuthConfig& AuthConfig::withCertUri(std::string uri) {
  certUri = std::move(uri);
  return *this;
}

AuthConfig& AuthConfig::withTokeninfoUrl(std::string url) {
  tokeninfoUrl = std::move(url);
  return *this;
}

AuthConfig& AuthConfig::withEmailScope(std::string scope) {
  emailScope = std::move(scope);
  return *this;
}

AuthConfig& AuthConfig::withExpectedIssuer(std::string issuer) {
  expectedIssuer = std::move(issuer);
  return *this;
}

AuthConfig& AuthConfig::withCertNamespace(std::string ns) {
  certNamespace = std::move(ns);
  return *this;
}

AuthConfig& AuthConfig::withClockSkew(int64_t seconds) {
  clockSkewSecs = seconds;
  return *this;
}

AuthConfig& AuthConfig::withMaxTokenLifetime(int64_t seconds) {
  maxTokenLifetimeSecs = seconds;
  return *this;
}

AuthConfig& AuthConfig::withHttpTimeout(std::chrono::seconds timeout) {
  httpTimeout = timeout;
  return *this;
}

AuthConfig& AuthConfig::withLogLevel(std::string level) {
  logLevel = std::move(level);
  return *this;
}

void AuthConfig::validate() const {
  if (certUri.empty()) {
    throw InvalidConfigError("cert_uri must not be empty");
  }
  if (tokeninfoUrl.empty()) {
    throw InvalidConfigError("tokeninfo_url must not be empty");
  }
  if (emailScope.empty()) {
    throw InvalidConfigError("email_scope must not be empty");
  }
  if (expectedIssuer.empty()) {
    throw InvalidConfigError("expected_issuer must not be empty");
  }
  if (certNamespace.empty()) {
    throw InvalidConfigError("cert_namespace must not be empty");
  }
  if (clockSkewSecs < 0) {
    throw InvalidConfigError("clock_skew_secs must not be negative");
  }
  if (maxTokenLifetimeSecs <= 0) {
    throw InvalidConfigError("max_token_lifetime_secs must be positive");
  }
  if (httpTimeout.count() <= 0) {
    throw InvalidConfigError("http_timeout_secs must be positive");
  }
}

void AuthConfig::applyLogLevel() const {
  logging::Logger::getInstance().setLogLevel(logLevel);
}

namespace {

void readString(const json& j, const char* key, std::string& out) {
  if (!j.contains(key)) return;
  if (!j[key].is_string()) {
    throw InvalidConfigError(std::string(key) + " must be a string");
  }
  out = j[key].get<std::string>();
}

void readInteger(const json& j, const char* key, int64_t& out) {
  if (!j.contains(key)) return;
  if (!j[key].is_number_integer()) {
    throw InvalidConfigError(std::string(key) + " must be an integer");
  }
  out = j[key].get<int64_t>();
}

}  // namespace

AuthConfig AuthConfig::fromJson(const json& j) {
  if (!j.is_object()) {
    throw InvalidConfigError("configuration must be a JSON object");
  }

  AuthConfig config;
  readString(j, "cert_uri", config.certUri);
  readString(j, "tokeninfo_url", config.tokeninfoUrl);
  readString(j, "email_scope", config.emailScope);
  readString(j, "expected_issuer", config.expectedIssuer);
  readString(j, "cert_namespace", config.certNamespace);
  readString(j, "log_level", config.logLevel);
  readInteger(j, "clock_skew_secs", config.clockSkewSecs);
  readInteger(j, "max_token_lifetime_secs", config.maxTokenLifetimeSecs);

  int64_t timeout = config.httpTimeout.count();
  readInteger(j, "http_timeout_secs", timeout);
  config.httpTimeout = std::chrono::seconds{timeout};

  config.validate();
  return config;
}

AuthConfig AuthConfig::fromJsonString(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw InvalidConfigError(e.what());
  }
  return fromJson(j);
}

}  // namespace frontdoor
