/**
 * @file crypto.hpp
 * @brief Hashing and RSA signature recovery primitives for RS256 tokens
 */

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "error.hpp"

// Forward declarations for OpenSSL types
typedef struct bignum_st BIGNUM;

namespace frontdoor {

namespace crypto_constants {
constexpr size_t SHA256_DIGEST_SIZE = 32;  ///< SHA-256 output size in bytes
}  // namespace crypto_constants

/**
 * @brief RAII wrapper for OpenSSL BIGNUM
 */
struct BigNumDeleter {
  void operator()(BIGNUM* bn) const noexcept;
};
using BigNum = std::unique_ptr<BIGNUM, BigNumDeleter>;

/**
 * @brief Compute SHA-256 hash
 * @param data Input data
 * @return Hash bytes
 */
std::vector<uint8_t> hashSha256(std::span<const uint8_t> data);

/**
 * @brief Fit a big-endian byte string into exactly @p width bytes
 *
 * Longer inputs keep their low-order (rightmost) @p width bytes, shorter
 * inputs are zero-padded on the left.
 */
std::vector<uint8_t> leftFit(std::span<const uint8_t> bytes, size_t width);

/**
 * @brief Build an unsigned big integer from big-endian bytes
 * @throws CryptoError on allocation failure
 */
BigNum bigNumFromBytes(std::span<const uint8_t> bytes);

/**
 * @brief Decode a standard-base64 string into an unsigned big integer
 *
 * The input is re-padded before decoding; an empty string yields zero.
 * @throws InvalidBase64Error if the input is not base64
 */
BigNum base64ToBigNum(std::string_view encoded);

/**
 * @brief Big-endian bytes of a big integer, without leading zeros
 */
std::vector<uint8_t> bigNumToBytes(const BIGNUM* bn);

/**
 * @brief RSA public-key operation: signature^exponent mod modulus
 * @return Big-endian bytes of the recovered message representative
 * @throws CryptoError if the modulus is zero or the operation fails
 */
std::vector<uint8_t> rsaRecover(const BIGNUM* signature,
                                const BIGNUM* exponent,
                                const BIGNUM* modulus);

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public AuthError {
 public:
  explicit CryptoError(std::string_view details)
      : AuthError(AuthErrorCode::INVALID_SIGNATURE,
                  std::string("Cryptographic operation failed: ") +
                      std::string(details)) {}
};

}  // namespace frontdoor
