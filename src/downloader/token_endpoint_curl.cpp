/*
 * token_endpoint_curl.cpp
 *
 * OAuth2 token exchange: application/x-www-form-urlencoded POST with libcurl, JSON answer
 * parsed with nlohmann::json. Form values and the returned token are never logged.
 */

#include <geofetch/downloader/downloader.hpp>

#include "curl_global.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace geofetch::downloader {

using json = nlohmann::json;

Expected<TokenResponse> parseTokenResponse(std::string_view body) {
    json doc;
    try {
        doc = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::AuthenticationError,
                     std::string("malformed token response: ") + e.what()};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::AuthenticationError, "malformed token response: not an object"};
    }

    auto it = doc.find("access_token");
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        return Error{ErrorCode::AuthenticationError, "token response lacks access_token"};
    }

    TokenResponse out;
    out.accessToken = it->get<std::string>();

    // expires_in is optional (RFC 6749 section 5.1); the authenticator applies its default
    if (auto exp = doc.find("expires_in"); exp != doc.end() && !exp->is_null()) {
        if (exp->is_number()) {
            out.expiresIn = std::chrono::seconds(exp->get<std::int64_t>());
        } else if (exp->is_string()) {
            try {
                out.expiresIn = std::chrono::seconds(std::stoll(exp->get<std::string>()));
            } catch (const std::exception&) {
                return Error{ErrorCode::AuthenticationError,
                             "token response has invalid expires_in"};
            }
        } else {
            return Error{ErrorCode::AuthenticationError, "token response has invalid expires_in"};
        }
        if (out.expiresIn->count() <= 0) {
            return Error{ErrorCode::AuthenticationError,
                         "token response has non-positive expires_in"};
        }
    }

    if (auto tt = doc.find("token_type"); tt != doc.end() && tt->is_string()) {
        out.tokenType = tt->get<std::string>();
    }
    return out;
}

namespace {

size_t collect_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string encode_form(CURL* curl, const std::vector<std::pair<std::string, std::string>>& form) {
    std::string out;
    for (const auto& [name, value] : form) {
        if (!out.empty())
            out.push_back('&');
        char* k = curl_easy_escape(curl, name.c_str(), static_cast<int>(name.size()));
        char* v = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
        if (k)
            out += k;
        out.push_back('=');
        if (v)
            out += v;
        curl_free(k);
        curl_free(v);
    }
    return out;
}

class CurlTokenEndpoint final : public ITokenEndpoint {
public:
    Expected<TokenResponse> exchange(const TokenRequest& request) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string form = encode_form(curl, request.form);
        std::string body;
        curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");

        curl_easy_setopt(curl, CURLOPT_URL, request.tokenUrl.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(form.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
        if (!request.tls.caPath.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.tls.caPath.c_str());
        }
        if (request.proxy && !request.proxy->empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
        }

        CURLcode rc = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            Error err{rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::NetworkError,
                      std::string("token endpoint: ") + curl_easy_strerror(rc)};
            return err;
        }
        if (status < 200 || status >= 300) {
            spdlog::debug("token endpoint {} answered HTTP {}", request.tokenUrl, status);
            return Error{ErrorCode::AuthenticationError,
                         "token endpoint answered HTTP " + std::to_string(status)};
        }
        return parseTokenResponse(body);
    }
};

} // namespace

std::shared_ptr<ITokenEndpoint> makeCurlTokenEndpoint() {
    ensureCurlGlobalInit();
    return std::make_shared<CurlTokenEndpoint>();
}

} // namespace geofetch::downloader
