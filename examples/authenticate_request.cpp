/**
 * @file authenticate_request.cpp
 * @brief Authenticate one Authorization header against the production
 * identity provider
 *
 * Usage:
 *   authenticate_request "Bearer <token>" [--scope S]... [--audience A]...
 *                        [--client-id C]... [--config file.json]
 *
 * Without --scope the email scope is used. The certificate cache lives for
 * the duration of the process, and access tokens are resolved through the
 * tokeninfo endpoint.
 */

#include "frontdoor/authenticator.hpp"
#include "frontdoor/cache_store.hpp"
#include "frontdoor/certificates.hpp"
#include "frontdoor/http_client.hpp"
#include "frontdoor/logging.hpp"
#include "frontdoor/tokeninfo_backend.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace frontdoor;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " \"<scheme> <token>\" [--scope S]... [--audience A]..."
                 " [--client-id C]... [--config file.json]\n";
}

AuthConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InvalidConfigError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return AuthConfig::fromJsonString(buffer.str());
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    std::string header = argv[1];
    AuthPolicy policy;
    std::string configPath;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            printUsage(argv[0]);
            return 2;
        }
        std::string value = argv[++i];
        if (arg == "--scope") {
            policy.scopes.push_back(value);
        } else if (arg == "--audience") {
            policy.audiences.push_back(value);
        } else if (arg == "--client-id") {
            policy.clientIds.push_back(value);
        } else if (arg == "--config") {
            configPath = value;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    try {
        AuthConfig config = configPath.empty() ? AuthConfig() : loadConfig(configPath);
        config.applyLogLevel();
        if (policy.scopes.empty()) {
            policy.scopes.push_back(config.emailScope);
        }

        auto http = std::make_shared<CurlHttpClient>(config.httpTimeout);
        CertificateCache certificates(http, std::make_shared<InMemoryCacheStore>(), config);
        SignedTokenVerifier verifier(certificates, config);
        Authenticator authenticator(verifier, std::make_shared<SystemClock>(), config);
        TokeninfoBackend backend(http, config.tokeninfoUrl);

        RequestContext ctx(header, backend);
        auto result = authenticator.authenticate(ctx, policy);
        if (result.isError()) {
            std::cerr << "Rejected (" << static_cast<uint32_t>(result.error().errorCode())
                      << "): " << result.error().what() << "\n";
            return 1;
        }

        const auto& identity = result.value();
        std::cout << "email:       " << identity.email << "\n";
        if (!identity.userId.empty()) {
            std::cout << "user id:     " << identity.userId << "\n";
            std::cout << "client id:   " << identity.clientId << "\n";
        }
        if (!identity.authDomain.empty()) {
            std::cout << "auth domain: " << identity.authDomain << "\n";
        }
        return 0;
    } catch (const AuthError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
