/**
 * @file certificates.hpp
 * @brief Identity provider signing certificates and their freshness-aware
 * cache
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cache_store.hpp"
#include "config.hpp"
#include "error.hpp"
#include "http_client.hpp"

namespace frontdoor {

/**
 * @brief One RSA signing key as published by the identity provider
 */
struct Certificate {
  std::string algorithm;    ///< Key algorithm label ("RSA", "RS256")
  std::string exponentB64;  ///< Public exponent, standard base64
  std::string modulusB64;   ///< Modulus, standard base64
  std::string keyId;        ///< Provider key identifier

  bool operator==(const Certificate& other) const = default;
};

/**
 * @brief Ordered set of signing keys; a signature is valid if any key
 * verifies it
 */
using CertificateSet = std::vector<Certificate>;

/**
 * @brief Decode a certificate document
 *
 * Format: {"keyvalues": [{"algorithm", "exponent", "modulus", "keyid"}, ...]}.
 * A missing or null "keyvalues" yields an empty set; missing key fields are
 * left empty.
 * @throws CertificateFetchError if the document is not a JSON object of that
 * shape
 */
CertificateSet parseCertificates(std::string_view document);

/**
 * @brief Extract the max-age directive from a Cache-Control header
 * @return max-age in seconds, or 0 when absent or not a non-negative integer
 */
int64_t parseMaxAge(std::string_view cacheControl);

/**
 * @brief Remaining freshness of a response: max-age minus Age
 * @return Remaining lifetime, or 0 when either header is missing or
 * malformed or the response is already stale
 */
std::chrono::seconds certExpirationTime(
    const std::optional<std::string>& cacheControl,
    const std::optional<std::string>& age);

/**
 * @brief Fetches and caches signing certificates, honoring HTTP freshness
 * headers
 *
 * One instance is owned by the service process and shared by all requests.
 * Concurrent misses may fetch in parallel; entries are replaced wholesale.
 */
class CertificateCache {
 public:
  /**
   * @param http Transport used on a cache miss
   * @param store Backing cache
   * @param ns Cache namespace isolating certificate entries
   */
  CertificateCache(std::shared_ptr<HttpClient> http,
                   std::shared_ptr<CacheStore> store,
                   std::string ns = CERT_NAMESPACE);

  /**
   * @brief Cache whose namespace is taken from @p config
   */
  CertificateCache(std::shared_ptr<HttpClient> http,
                   std::shared_ptr<CacheStore> store, const AuthConfig& config);

  /**
   * @brief Return the certificate set published at @p sourceUri
   * @throws CertificateFetchError on transport failure, non-200 status or an
   * undecodable document
   */
  CertificateSet getCertificates(const std::string& sourceUri);

  [[nodiscard]] const std::string& cacheNamespace() const noexcept {
    return namespace_;
  }

 private:
  std::optional<CertificateSet> lookup(const std::string& sourceUri,
                                       bool& storeHealthy);
  CertificateSet fetch(const std::string& sourceUri, bool storeHealthy);

  std::shared_ptr<HttpClient> http_;
  std::shared_ptr<CacheStore> store_;
  std::string namespace_;
};

}  // namespace frontdoor
