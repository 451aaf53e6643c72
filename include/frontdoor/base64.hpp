/**
 * @file base64.hpp
 * @brief Base64 (URL-safe and standard alphabet) encoding and decoding
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace frontdoor {

/**
 * @brief Implementation for base64url encoding from span
 * @param data Input byte span
 * @return Base64url string without padding
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Implementation for standard base64 encoding from span
 * @param data Input byte span
 * @return Padded standard base64 string
 */
std::string base64StdEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for data types suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode data as base64url
 * @param data Input bytes
 * @return Base64url string
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Encode data as standard (RFC 4648 section 4) base64
 */
template <Base64Data T>
std::string base64StdEncode(const T& data) {
  return base64StdEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode base64url string
 * @param data Base64url string, padded or not
 * @return Decoded bytes
 * @throws InvalidBase64Error on invalid characters, misplaced or excess
 * padding, or a length that cannot encode whole bytes
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

/**
 * @brief Decode standard base64 string
 * @throws InvalidBase64Error under the same rules as base64UrlDecode
 */
std::vector<uint8_t> base64StdDecode(std::string_view data);

/**
 * @brief Pad a base64 segment with '=' up to a multiple of 4
 *
 * Only lengths congruent to 2 or 3 mod 4 are padded; a length congruent to 1
 * can never be valid base64 and is returned untouched.
 */
std::string addBase64Pad(std::string_view data);

}  // namespace frontdoor
