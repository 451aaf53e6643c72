/**
 * @file signed_token.hpp
 * @brief Decoding and RS256 verification of signed identity tokens
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "certificates.hpp"
#include "config.hpp"
#include "error.hpp"

namespace frontdoor {

/**
 * @brief Decoded first segment of a signed token
 */
struct TokenHeader {
  std::string algorithm;  ///< "alg"
};

/**
 * @brief Decoded second segment of a signed token
 */
struct TokenClaims {
  std::string audience;         ///< "aud"
  std::string authorizedParty;  ///< "azp", the client ID
  std::string email;            ///< "email"
  std::string issuer;           ///< "iss"
  int64_t issuedAt = 0;         ///< "iat", unix seconds
  int64_t expiresAt = 0;        ///< "exp", unix seconds

  bool operator==(const TokenClaims& other) const = default;
};

/**
 * @brief The three raw segments of a compact signed token
 */
struct TokenSegments {
  std::string_view header;
  std::string_view payload;
  std::string_view signature;
};

/**
 * @brief Split a compact token on '.'
 * @throws MalformedTokenError unless there are exactly three segments
 */
TokenSegments splitToken(std::string_view token);

/**
 * @brief Re-pad and base64url-decode one token segment
 * @throws MalformedTokenError if the segment is not base64url
 */
std::vector<uint8_t> decodeSegment(std::string_view segment);

TokenHeader decodeHeader(std::string_view segment);
TokenClaims decodeClaims(std::string_view segment);

/**
 * @brief Check whether @p signature is a valid RS256 signature of a digest
 * under @p cert
 *
 * Only the low-order 32 bytes of the recovered message take part in the
 * comparison.
 * @throws CryptoError or InvalidBase64Error if the key material is unusable
 */
bool signatureMatches(const Certificate& cert,
                      std::span<const uint8_t> signature,
                      std::span<const uint8_t> digest);

/**
 * @brief Verifies signed identity tokens against the provider certificates
 *
 * Verification does not mutate shared state apart from the certificate
 * cache, so one instance serves concurrent requests.
 */
class SignedTokenVerifier {
 public:
  SignedTokenVerifier(CertificateCache& certificates, AuthConfig config = {});

  /**
   * @brief Verify @p token at time @p now
   * @param token Compact token (header.payload.signature)
   * @param now Current time, unix seconds
   * @return The decoded claims
   * @throws MalformedTokenError, UnsupportedAlgorithmError,
   * CertificateFetchError, InvalidSignatureError, UsedTooEarlyError,
   * ExpiryTooFarError, UsedTooLateError
   */
  TokenClaims verify(std::string_view token, int64_t now) const;

 private:
  void checkTimestamps(const TokenClaims& claims, int64_t now) const;

  CertificateCache& certificates_;
  AuthConfig config_;
};

}  // namespace frontdoor
