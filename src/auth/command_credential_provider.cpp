/*
 * gcrdl/src/auth/command_credential_provider.cpp
 *
 * ICredentialProvider backed by an external command (e.g. "gcloud auth print-access-token").
 * The token is the last non-empty line the command prints. Revocation and introspection use
 * the Google OAuth2 endpoints.
 */

#include <gcrdl/auth/credential_manager.h>
#include <gcrdl/http/http_client.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <sstream>

#include <sys/wait.h>

namespace gcrdl::auth {

namespace {

constexpr const char* kRevokeUrl = "https://oauth2.googleapis.com/revoke";
constexpr const char* kTokenInfoUrl = "https://oauth2.googleapis.com/tokeninfo";

std::string trim(std::string s) {
    const auto* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

class CommandCredentialProvider final : public ICredentialProvider {
public:
    CommandCredentialProvider(std::string command, http::IHttpClient& http)
        : command_(std::move(command)), http_(http) {}

    Result<std::string> requestToken(bool interactive) override {
        if (command_.empty()) {
            return Error{ErrorCode::AuthConfigError, "No token command configured"};
        }
        spdlog::debug("Requesting token via '{}' (interactive={})", command_, interactive);

        const std::string cmd = command_ + " 2>&1";
        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) {
            return Error{ErrorCode::AuthConfigError,
                         fmt::format("Failed to run token command '{}'", command_)};
        }
        char buffer[4096];
        std::string output;
        while (fgets(buffer, sizeof(buffer), pipe)) {
            output += buffer;
        }
        const int status = pclose(pipe);
        const int exitCode = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

        if (exitCode != 0) {
            const auto text = trim(output);
            if (exitCode == 127) {
                return Error{ErrorCode::AuthConfigError,
                             fmt::format("Token command not found: {}", command_)};
            }
            return Error{classifyCredentialError(text),
                         fmt::format("Token command exited with {}: {}", exitCode, text)};
        }

        std::istringstream lines(output);
        std::string line;
        std::string token;
        while (std::getline(lines, line)) {
            if (auto t = trim(line); !t.empty()) {
                token = std::move(t);
            }
        }
        if (token.empty()) {
            return Error{ErrorCode::AuthConfigError, "Token command printed nothing"};
        }
        return token;
    }

    Result<void> revokeToken(const std::string& token) override {
        http::HttpRequest req;
        req.method = "POST";
        req.url = kRevokeUrl;
        req.headers.push_back({"Content-Type", "application/x-www-form-urlencoded"});
        req.body = "token=" + http::urlEncode(token);

        auto res = http_.send(req);
        if (!res) {
            return res.error();
        }
        if (!res.value().ok()) {
            return http::errorFromResponse(res.value(), "revoke");
        }
        return Result<void>();
    }

    Result<std::chrono::seconds> remainingLifetime(const std::string& token) override {
        http::HttpRequest req;
        req.url = std::string(kTokenInfoUrl) + "?access_token=" + http::urlEncode(token);

        auto res = http_.send(req);
        if (!res) {
            return res.error();
        }
        const auto& response = res.value();
        if (!response.ok()) {
            // tokeninfo answers 400 for an expired or unknown token.
            return http::errorFromResponse(response, "tokeninfo");
        }

        auto doc = nlohmann::json::parse(response.bodyText(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object() || !doc.contains("expires_in")) {
            return Error{ErrorCode::InvalidData, "tokeninfo response has no expires_in"};
        }
        const auto& v = doc["expires_in"];
        long long seconds = 0;
        if (v.is_number_integer()) {
            seconds = v.get<long long>();
        } else if (v.is_string()) {
            try {
                seconds = std::stoll(v.get<std::string>());
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidData, "tokeninfo expires_in is not a number"};
            }
        } else {
            return Error{ErrorCode::InvalidData, "tokeninfo expires_in is not a number"};
        }
        return std::chrono::seconds(std::max(0LL, seconds));
    }

private:
    std::string command_;
    http::IHttpClient& http_;
};

} // namespace

std::unique_ptr<ICredentialProvider> makeCommandCredentialProvider(std::string command,
                                                                   http::IHttpClient& http) {
    return std::make_unique<CommandCredentialProvider>(std::move(command), http);
}

} // namespace gcrdl::auth
