/**
 * @file http_client.hpp
 * @brief Blocking HTTP GET transport used for certificate and tokeninfo fetches
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"

namespace frontdoor {

/**
 * @brief HTTP response with case-insensitive header lookup
 */
struct HttpResponse {
  long status = 0;   ///< HTTP status code
  std::string body;  ///< Response body
  std::map<std::string, std::string> headers;  ///< Lower-cased header names

  /**
   * @brief Set a header, replacing any previous value
   */
  void setHeader(std::string_view name, std::string_view value);

  /**
   * @brief Look up a header by name, ignoring case
   * @return Header value, or nullopt if absent
   */
  [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

/**
 * @brief Abstract HTTP transport
 */
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  /**
   * @brief Perform a GET request
   * @param url Absolute URL
   * @return Response (any status code)
   * @throws IoError on transport failure (DNS, connect, timeout, TLS)
   */
  virtual HttpResponse get(const std::string& url) = 0;
};

/**
 * @brief libcurl-backed HttpClient
 *
 * Each call uses its own easy handle, so one instance can be shared by
 * concurrent requests.
 */
class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(
      std::chrono::seconds timeout = std::chrono::seconds{10});

  HttpResponse get(const std::string& url) override;

 private:
  std::chrono::seconds timeout_;
};

/**
 * @brief Percent-encode a string for use as a URL query value
 */
std::string urlQueryEscape(std::string_view value);

}  // namespace frontdoor
