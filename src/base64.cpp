#include "frontdoor/base64.hpp"

#include <array>

namespace frontdoor {

// Base64 encoding/decoding alphabets
static constexpr std::string_view base64_chars_url =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
static constexpr std::string_view base64_chars_std =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

namespace {

using DecodeTable = std::array<int8_t, 256>;

constexpr DecodeTable makeDecodeTable(std::string_view alphabet) {
  DecodeTable table{};
  for (size_t i = 0; i < table.size(); ++i) table[i] = -1;
  for (size_t i = 0; i < alphabet.size(); ++i) {
    table[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr DecodeTable url_decode_table = makeDecodeTable(base64_chars_url);
constexpr DecodeTable std_decode_table = makeDecodeTable(base64_chars_std);

std::string encodeWith(std::span<const uint8_t> data,
                       std::string_view alphabet, bool pad) {
  std::string result;
  // Pre-allocate capacity for performance (base64 expansion factor ~1.33)
  result.reserve(((data.size() + 2) / 3) * 4);

  int val = 0, valb = -6;
  for (uint8_t c : data) {
    val = (val << 8) + c;
    valb += 8;
    while (valb >= 0) {
      result.push_back(alphabet[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  if (pad) {
    while (result.size() % 4 != 0) result.push_back('=');
  }
  return result;
}

std::vector<uint8_t> decodeWith(std::string_view encoded,
                                const DecodeTable& table) {
  // '=' may only close the input, at most twice, on a 4-character boundary
  size_t padding = 0;
  while (padding < encoded.size() &&
         encoded[encoded.size() - 1 - padding] == '=') {
    ++padding;
  }
  if (padding > 2 || (padding > 0 && encoded.size() % 4 != 0)) {
    throw InvalidBase64Error("Invalid padding in base64 string");
  }

  auto body = encoded.substr(0, encoded.size() - padding);
  if (body.size() % 4 == 1) {
    throw InvalidBase64Error("Truncated base64 string");
  }

  std::vector<uint8_t> result;
  result.reserve((body.size() * 3) / 4);  // Reserve estimated size

  int val = 0, valb = -8;
  for (char c : body) {
    // Use lookup table for O(1) character validation and conversion
    int8_t decoded = table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }

    val = ((val << 6) + decoded) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

}  // namespace

std::string base64UrlEncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_url, false);
}

std::string base64StdEncodeImpl(std::span<const uint8_t> data) {
  return encodeWith(data, base64_chars_std, true);
}

std::vector<uint8_t> base64UrlDecode(std::string_view encoded) {
  return decodeWith(encoded, url_decode_table);
}

std::vector<uint8_t> base64StdDecode(std::string_view encoded) {
  return decodeWith(encoded, std_decode_table);
}

std::string addBase64Pad(std::string_view data) {
  std::string padded(data);
  switch (padded.size() % 4) {
    case 2:
      padded += "==";
      break;
    case 3:
      padded += "=";
      break;
    default:
      break;
  }
  return padded;
}

}  // namespace frontdoor
