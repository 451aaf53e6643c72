#include "frontdoor/crypto.hpp"

#include <openssl/bn.h>
#include <openssl/sha.h>

#include <algorithm>

#include "frontdoor/base64.hpp"

namespace frontdoor {

void BigNumDeleter::operator()(BIGNUM* bn) const noexcept {
  if (bn) BN_free(bn);
}

namespace {

/**
 * @brief RAII wrapper for OpenSSL contexts
 */
template <typename T, void (*Deleter)(T*)>
class OpenSSLWrapper {
 public:
  explicit OpenSSLWrapper(T* ptr) : ptr_(ptr) {}
  ~OpenSSLWrapper() {
    if (ptr_) Deleter(ptr_);
  }

  OpenSSLWrapper(const OpenSSLWrapper&) = delete;
  OpenSSLWrapper& operator=(const OpenSSLWrapper&) = delete;

  T* get() const noexcept { return ptr_; }

 private:
  T* ptr_;
};

using BnCtxWrapper = OpenSSLWrapper<BN_CTX, BN_CTX_free>;

}  // namespace

std::vector<uint8_t> hashSha256(std::span<const uint8_t> data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), hash.data());
  return hash;
}

std::vector<uint8_t> leftFit(std::span<const uint8_t> bytes, size_t width) {
  std::vector<uint8_t> fitted(width, 0);
  if (bytes.size() >= width) {
    std::copy(bytes.end() - static_cast<std::ptrdiff_t>(width), bytes.end(),
              fitted.begin());
  } else {
    std::copy(bytes.begin(), bytes.end(),
              fitted.begin() +
                  static_cast<std::ptrdiff_t>(width - bytes.size()));
  }
  return fitted;
}

BigNum bigNumFromBytes(std::span<const uint8_t> bytes) {
  BigNum bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn) {
    throw CryptoError("Failed to create BIGNUM");
  }
  return bn;
}

BigNum base64ToBigNum(std::string_view encoded) {
  auto bytes = base64StdDecode(addBase64Pad(encoded));
  return bigNumFromBytes(bytes);
}

std::vector<uint8_t> bigNumToBytes(const BIGNUM* bn) {
  std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(bn)));
  if (!bytes.empty()) {
    BN_bn2bin(bn, bytes.data());
  }
  return bytes;
}

std::vector<uint8_t> rsaRecover(const BIGNUM* signature,
                                const BIGNUM* exponent,
                                const BIGNUM* modulus) {
  if (BN_is_zero(modulus)) {
    throw CryptoError("RSA modulus is zero");
  }

  BnCtxWrapper ctx(BN_CTX_new());
  BigNum result(BN_new());
  if (!ctx.get() || !result) {
    throw CryptoError("Failed to allocate BIGNUM context");
  }

  if (BN_mod_exp(result.get(), signature, exponent, modulus, ctx.get()) != 1) {
    throw CryptoError("Modular exponentiation failed");
  }
  return bigNumToBytes(result.get());
}

}  // namespace frontdoor
