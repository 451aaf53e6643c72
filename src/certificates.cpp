#include "frontdoor/certificates.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <regex>

#include "frontdoor/logging.hpp"

using json = nlohmann::json;

namespace frontdoor {

namespace {

std::string stringField(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return {};
  }
  if (!j[key].is_string()) {
    throw CertificateFetchError(std::string("field ") + key +
                                " is not a string");
  }
  return j[key].get<std::string>();
}

std::optional<int64_t> parseInteger(std::string_view text) {
  int64_t value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

CertificateSet parseCertificates(std::string_view document) {
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error& e) {
    throw CertificateFetchError(std::string("cannot decode: ") + e.what());
  }
  if (!j.is_object()) {
    throw CertificateFetchError("document is not a JSON object");
  }

  CertificateSet certs;
  if (!j.contains("keyvalues") || j["keyvalues"].is_null()) {
    return certs;
  }
  const auto& keyvalues = j["keyvalues"];
  if (!keyvalues.is_array()) {
    throw CertificateFetchError("keyvalues is not an array");
  }

  certs.reserve(keyvalues.size());
  for (const auto& kv : keyvalues) {
    if (!kv.is_object()) {
      throw CertificateFetchError("keyvalues entry is not an object");
    }
    certs.push_back(Certificate{stringField(kv, "algorithm"),
                                stringField(kv, "exponent"),
                                stringField(kv, "modulus"),
                                stringField(kv, "keyid")});
  }
  return certs;
}

int64_t parseMaxAge(std::string_view cacheControl) {
  static const std::regex max_age_re(R"(\s*max-age\s*=\s*(\d+)\s*)",
                                     std::regex::icase);

  size_t start = 0;
  while (start <= cacheControl.size()) {
    size_t comma = cacheControl.find(',', start);
    if (comma == std::string_view::npos) comma = cacheControl.size();

    std::string directive(cacheControl.substr(start, comma - start));
    std::smatch match;
    if (std::regex_match(directive, match, max_age_re)) {
      auto value = parseInteger(match[1].str());
      return value.value_or(0);
    }
    start = comma + 1;
  }
  return 0;
}

std::chrono::seconds certExpirationTime(
    const std::optional<std::string>& cacheControl,
    const std::optional<std::string>& age) {
  if (!cacheControl || !age) {
    return std::chrono::seconds{0};
  }

  int64_t maxAge = parseMaxAge(*cacheControl);
  if (maxAge <= 0) {
    return std::chrono::seconds{0};
  }

  auto ageSecs = parseInteger(*age);
  if (!ageSecs) {
    return std::chrono::seconds{0};
  }

  int64_t remaining = maxAge - *ageSecs;
  return std::chrono::seconds{remaining > 0 ? remaining : 0};
}

CertificateCache::CertificateCache(std::shared_ptr<HttpClient> http,
                                   std::shared_ptr<CacheStore> store,
                                   std::string ns)
    : http_(std::move(http)),
      store_(std::move(store)),
      namespace_(std::move(ns)) {
  if (!http_ || !store_) {
    throw std::invalid_argument(
        "CertificateCache requires a transport and a store");
  }
}

CertificateCache::CertificateCache(std::shared_ptr<HttpClient> http,
                                   std::shared_ptr<CacheStore> store,
                                   const AuthConfig& config)
    : CertificateCache(std::move(http), std::move(store),
                       config.certNamespace) {}

CertificateSet CertificateCache::getCertificates(const std::string& sourceUri) {
  bool storeHealthy = true;
  if (auto cached = lookup(sourceUri, storeHealthy)) {
    return std::move(*cached);
  }
  return fetch(sourceUri, storeHealthy);
}

std::optional<CertificateSet> CertificateCache::lookup(
    const std::string& sourceUri, bool& storeHealthy) {
  std::optional<std::string> cached;
  try {
    cached = store_->get(namespace_, sourceUri);
  } catch (const CacheError& e) {
    FD_LOG_WARN("Certificate cache lookup failed for {}: {}", sourceUri,
                e.what());
    storeHealthy = false;
    return std::nullopt;
  }

  if (!cached) {
    FD_LOG_DEBUG("Certificate cache miss for {}", sourceUri);
    return std::nullopt;
  }
  return parseCertificates(*cached);
}

CertificateSet CertificateCache::fetch(const std::string& sourceUri,
                                       bool storeHealthy) {
  HttpResponse response;
  try {
    response = http_->get(sourceUri);
  } catch (const IoError& e) {
    throw CertificateFetchError(e.what());
  }

  if (response.status != 200) {
    throw CertificateFetchError("unexpected HTTP status " +
                                std::to_string(response.status));
  }

  auto certs = parseCertificates(response.body);

  auto ttl = certExpirationTime(response.header("cache-control"),
                                response.header("age"));
  if (ttl.count() <= 0) {
    FD_LOG_DEBUG("Certificates from {} are not cacheable", sourceUri);
    return certs;
  }
  if (!storeHealthy) {
    return certs;
  }

  try {
    store_->set(namespace_, sourceUri, response.body, ttl);
    FD_LOG_DEBUG("Cached certificates from {} for {}s", sourceUri,
                 ttl.count());
  } catch (const CacheError& e) {
    FD_LOG_WARN("Failed to cache certificates from {}: {}", sourceUri,
                e.what());
  }
  return certs;
}

}  // namespace frontdoor
