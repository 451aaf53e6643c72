#include "frontdoor/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "frontdoor/logging.hpp"

namespace frontdoor {

namespace {

struct CurlGlobal {
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
};

void ensureCurlGlobal() {
  static CurlGlobal global;
}

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept {
    if (handle) curl_easy_cleanup(handle);
  }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

std::string toLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lowered;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

size_t writeBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* response = static_cast<HttpResponse*>(userp);
  response->body.append(data, size * nmemb);
  return size * nmemb;
}

size_t writeHeader(char* data, size_t size, size_t nmemb, void* userp) {
  auto* response = static_cast<HttpResponse*>(userp);
  std::string_view line(data, size * nmemb);

  // A new status line starts a new header block (redirects, 100-continue)
  if (line.starts_with("HTTP/")) {
    response->headers.clear();
    return size * nmemb;
  }

  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    response->setHeader(trim(line.substr(0, colon)),
                        trim(line.substr(colon + 1)));
  }
  return size * nmemb;
}

void setOption(CURL* handle, CURLoption option, auto value,
               const char* name) {
  if (curl_easy_setopt(handle, option, value) != CURLE_OK) {
    throw IoError(std::string("Failed to set ") + name);
  }
}

}  // namespace

void HttpResponse::setHeader(std::string_view name, std::string_view value) {
  headers[toLower(name)] = std::string(value);
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
  auto it = headers.find(toLower(name));
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout)
    : timeout_(timeout) {
  ensureCurlGlobal();
}

HttpResponse CurlHttpClient::get(const std::string& url) {
  CurlEasyPtr handle(curl_easy_init());
  if (!handle) {
    throw IoError("Failed to create a new curl handle");
  }

  HttpResponse response;
  setOption(handle.get(), CURLOPT_URL, url.c_str(), "CURLOPT_URL");
  setOption(handle.get(), CURLOPT_HTTPGET, 1L, "CURLOPT_HTTPGET");
  setOption(handle.get(), CURLOPT_FOLLOWLOCATION, 1L,
            "CURLOPT_FOLLOWLOCATION");
  setOption(handle.get(), CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
  setOption(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()),
            "CURLOPT_TIMEOUT");
  setOption(handle.get(), CURLOPT_WRITEFUNCTION, &writeBody,
            "CURLOPT_WRITEFUNCTION");
  setOption(handle.get(), CURLOPT_WRITEDATA, &response, "CURLOPT_WRITEDATA");
  setOption(handle.get(), CURLOPT_HEADERFUNCTION, &writeHeader,
            "CURLOPT_HEADERFUNCTION");
  setOption(handle.get(), CURLOPT_HEADERDATA, &response, "CURLOPT_HEADERDATA");

  CURLcode rv = curl_easy_perform(handle.get());
  if (rv != CURLE_OK) {
    throw IoError(std::string("GET failed: ") + curl_easy_strerror(rv));
  }

  rv = curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE,
                         &response.status);
  if (rv != CURLE_OK) {
    throw IoError(curl_easy_strerror(rv));
  }

  FD_LOG_DEBUG("GET {} replied with {}", url, response.status);
  return response;
}

std::string urlQueryEscape(std::string_view value) {
  static constexpr std::string_view hex = "0123456789ABCDEF";
  std::string escaped;
  escaped.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped.push_back(static_cast<char>(c));
    } else {
      escaped.push_back('%');
      escaped.push_back(hex[c >> 4]);
      escaped.push_back(hex[c & 0x0F]);
    }
  }
  return escaped;
}

}  // namespace frontdoor
