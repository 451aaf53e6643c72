#include "frontdoor/tokeninfo_backend.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <sstream>

#include "frontdoor/logging.hpp"

using json = nlohmann::json;

namespace frontdoor {

namespace {

template <typename T>
T fieldOr(const json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::type_error&) {
    throw BackendError(std::string("tokeninfo field ") + key +
                       " has the wrong type");
  }
}

int64_t integerFieldOr(const json& j, const char* key, int64_t fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer() ||
      (it->is_number_unsigned() &&
       it->get<uint64_t>() >
           static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
    throw BackendError(std::string("tokeninfo field ") + key +
                       " is not a 64-bit integer");
  }
  return it->get<int64_t>();
}

bool hasScope(const std::string& granted, const std::string& scope) {
  std::istringstream stream(granted);
  std::string s;
  while (stream >> s) {
    if (s == scope) {
      return true;
    }
  }
  return false;
}

}  // namespace

Tokeninfo parseTokeninfo(std::string_view document) {
  json j;
  try {
    j = json::parse(document);
  } catch (const json::parse_error& e) {
    throw BackendError(std::string("cannot decode tokeninfo: ") + e.what());
  }
  if (!j.is_object()) {
    throw BackendError("tokeninfo is not a JSON object");
  }

  Tokeninfo ti;
  ti.issuedTo = fieldOr<std::string>(j, "issued_to", "");
  ti.audience = fieldOr<std::string>(j, "audience", "");
  ti.userId = fieldOr<std::string>(j, "user_id", "");
  ti.scope = fieldOr<std::string>(j, "scope", "");
  ti.expiresIn = integerFieldOr(j, "expires_in", 0);
  ti.email = fieldOr<std::string>(j, "email", "");
  ti.verifiedEmail = fieldOr<bool>(j, "verified_email", false);
  ti.accessType = fieldOr<std::string>(j, "access_type", "");
  ti.errorDescription = fieldOr<std::string>(j, "error_description", "");
  return ti;
}

TokeninfoBackend::TokeninfoBackend(std::shared_ptr<HttpClient> http,
                                   std::string tokeninfoUrl)
    : http_(std::move(http)), tokeninfoUrl_(std::move(tokeninfoUrl)) {
  if (!http_) {
    throw std::invalid_argument("TokeninfoBackend requires a transport");
  }
}

Tokeninfo TokeninfoBackend::fetchTokeninfo(const std::string& token) {
  auto url = tokeninfoUrl_ + "?access_token=" + urlQueryEscape(token);
  FD_LOG_DEBUG("Fetching token info from {}", tokeninfoUrl_);

  HttpResponse response;
  try {
    response = http_->get(url);
  } catch (const IoError& e) {
    throw BackendError(e.what());
  }
  FD_LOG_DEBUG("Tokeninfo replied with status {}", response.status);

  auto ti = parseTokeninfo(response.body);
  if (response.status != 200) {
    std::string msg = "Error fetching tokeninfo (status " +
                      std::to_string(response.status) + ")";
    if (!ti.errorDescription.empty()) {
      msg += ": " + ti.errorDescription;
    }
    throw BackendError(msg);
  }

  if (ti.expiresIn <= 0) {
    throw BackendError("Token is expired");
  }
  if (!ti.verifiedEmail) {
    throw BackendError("Unverified email " + ti.email);
  }
  if (ti.email.empty()) {
    throw BackendError("Invalid email address");
  }
  return ti;
}

OAuthUserInfo TokeninfoBackend::queryOAuthUser(const std::string& token,
                                               const std::string& scope) {
  auto ti = fetchTokeninfo(token);
  if (!hasScope(ti.scope, scope)) {
    throw BackendError("No scope matches: expected one of \"" + ti.scope +
                       "\", got \"" + scope + "\"");
  }

  OAuthUserInfo info;
  info.clientId = ti.issuedTo;
  info.email = ti.email;
  info.userId = ti.userId;
  return info;
}

}  // namespace frontdoor
