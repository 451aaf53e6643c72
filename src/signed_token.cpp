#include "frontdoor/signed_token.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

#include "frontdoor/base64.hpp"
#include "frontdoor/crypto.hpp"
#include "frontdoor/logging.hpp"

using json = nlohmann::json;

namespace frontdoor {

namespace {

json parseSegmentJson(std::string_view segment, const char* what) {
  auto bytes = decodeSegment(segment);
  try {
    return json::parse(bytes.begin(), bytes.end());
  } catch (const json::parse_error&) {
    throw MalformedTokenError(std::string(what) + " is not valid JSON");
  }
}

std::string optionalString(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return {};
  }
  if (!j[key].is_string()) {
    throw MalformedTokenError(std::string("claim ") + key +
                              " is not a string");
  }
  return j[key].get<std::string>();
}

// 9999-12-31T23:59:59Z
constexpr int64_t MAX_TIMESTAMP_SECS = 253402300799;

int64_t optionalTimestamp(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return 0;
  }
  const auto& value = j[key];
  if (!value.is_number_integer()) {
    throw MalformedTokenError(std::string("claim ") + key +
                              " is not an integer");
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() > static_cast<uint64_t>(MAX_TIMESTAMP_SECS)) {
    throw MalformedTokenError(std::string("claim ") + key +
                              " is out of range");
  }
  auto seconds = value.get<int64_t>();
  if (seconds < 0 || seconds > MAX_TIMESTAMP_SECS) {
    throw MalformedTokenError(std::string("claim ") + key +
                              " is out of range");
  }
  return seconds;
}

}  // namespace

TokenSegments splitToken(std::string_view token) {
  if (std::count(token.begin(), token.end(), '.') != 2) {
    throw MalformedTokenError("expected 3 segments");
  }
  auto first = token.find('.');
  auto second = token.find('.', first + 1);
  return TokenSegments{token.substr(0, first),
                       token.substr(first + 1, second - first - 1),
                       token.substr(second + 1)};
}

std::vector<uint8_t> decodeSegment(std::string_view segment) {
  try {
    return base64UrlDecode(addBase64Pad(segment));
  } catch (const InvalidBase64Error& e) {
    throw MalformedTokenError(e.what());
  }
}

TokenHeader decodeHeader(std::string_view segment) {
  auto j = parseSegmentJson(segment, "header");
  if (!j.is_object()) {
    throw MalformedTokenError("header is not a JSON object");
  }
  return TokenHeader{optionalString(j, "alg")};
}

TokenClaims decodeClaims(std::string_view segment) {
  auto j = parseSegmentJson(segment, "payload");
  if (!j.is_object()) {
    throw MalformedTokenError("payload is not a JSON object");
  }

  TokenClaims claims;
  claims.audience = optionalString(j, "aud");
  claims.authorizedParty = optionalString(j, "azp");
  claims.email = optionalString(j, "email");
  claims.issuer = optionalString(j, "iss");
  claims.issuedAt = optionalTimestamp(j, "iat");
  claims.expiresAt = optionalTimestamp(j, "exp");
  return claims;
}

bool signatureMatches(const Certificate& cert,
                      std::span<const uint8_t> signature,
                      std::span<const uint8_t> digest) {
  auto exponent = base64ToBigNum(cert.exponentB64);
  auto modulus = base64ToBigNum(cert.modulusB64);
  auto sig = bigNumFromBytes(signature);

  auto recovered = rsaRecover(sig.get(), exponent.get(), modulus.get());
  auto fitted = leftFit(recovered, crypto_constants::SHA256_DIGEST_SIZE);
  return std::equal(fitted.begin(), fitted.end(), digest.begin(),
                    digest.end());
}

SignedTokenVerifier::SignedTokenVerifier(CertificateCache& certificates,
                                         AuthConfig config)
    : certificates_(certificates), config_(std::move(config)) {}

TokenClaims SignedTokenVerifier::verify(std::string_view token,
                                        int64_t now) const {
  auto segments = splitToken(token);

  auto header = decodeHeader(segments.header);
  if (header.algorithm != "RS256") {
    throw UnsupportedAlgorithmError(header.algorithm);
  }

  auto claims = decodeClaims(segments.payload);

  auto certs = certificates_.getCertificates(config_.certUri);

  auto signature = decodeSegment(segments.signature);

  std::string signedPart(token.substr(
      0, segments.header.size() + 1 + segments.payload.size()));
  auto digest = leftFit(
      hashSha256(std::span<const uint8_t>(
          reinterpret_cast<const uint8_t*>(signedPart.data()),
          signedPart.size())),
      crypto_constants::SHA256_DIGEST_SIZE);

  bool verified = false;
  for (const auto& cert : certs) {
    try {
      if (signatureMatches(cert, signature, digest)) {
        verified = true;
        break;
      }
    } catch (const AuthError& e) {
      FD_LOG_WARN("Skipping unusable certificate {}: {}", cert.keyId,
                  e.what());
    }
  }
  if (!verified) {
    throw InvalidSignatureError();
  }

  checkTimestamps(claims, now);
  return claims;
}

void SignedTokenVerifier::checkTimestamps(const TokenClaims& claims,
                                          int64_t now) const {
  if (claims.issuedAt == 0) {
    throw MalformedTokenError("missing iat claim");
  }
  // Timestamps are bounded by decodeClaims, so only differences are taken
  if (claims.issuedAt - now > config_.clockSkewSecs) {
    throw UsedTooEarlyError();
  }

  if (claims.expiresAt == 0) {
    throw MalformedTokenError("missing exp claim");
  }
  if (claims.expiresAt - claims.issuedAt >= config_.maxTokenLifetimeSecs) {
    throw ExpiryTooFarError();
  }
  if (now - claims.expiresAt > config_.clockSkewSecs) {
    throw UsedTooLateError();
  }
}

}  // namespace frontdoor
