/*
 * geofetch/src/downloader/downloader_types.cpp
 *
 * Name tables for public enums and small URL/header helpers shared by the transfer path.
 */

#include <geofetch/downloader/downloader.hpp>

#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace geofetch::downloader {

std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::ConfigurationError:
            return "configuration_error";
        case ErrorCode::MissingCredential:
            return "missing_credential";
        case ErrorCode::UnknownProvider:
            return "unknown_provider";
        case ErrorCode::AuthenticationError:
            return "authentication_error";
        case ErrorCode::TransientProviderError:
            return "transient_provider_error";
        case ErrorCode::NetworkError:
            return "network_error";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::TlsVerificationFailed:
            return "tls_verification_failed";
        case ErrorCode::ServerError:
            return "server_error";
        case ErrorCode::IoError:
            return "io_error";
        case ErrorCode::ChecksumMismatch:
            return "checksum_mismatch";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

std::string_view outcomeStatusName(OutcomeStatus s) noexcept {
    switch (s) {
        case OutcomeStatus::Success:
            return "success";
        case OutcomeStatus::SoftFailure:
            return "soft_failure";
        case OutcomeStatus::HardFailure:
            return "hard_failure";
    }
    return "hard_failure";
}

std::string_view requestStateName(RequestState s) noexcept {
    switch (s) {
        case RequestState::Pending:
            return "pending";
        case RequestState::InFlight:
            return "in_flight";
        case RequestState::SoftFailed:
            return "soft_failed";
        case RequestState::Succeeded:
            return "succeeded";
        case RequestState::Failed:
            return "failed";
        case RequestState::Abandoned:
            return "abandoned";
    }
    return "failed";
}

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percentEncode(std::string_view in) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0xF]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    return out;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Reject names that would escape the destination directory
bool isSafeFilename(std::string_view name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos;
}

} // namespace

std::string_view withoutQuery(std::string_view url) noexcept {
    return url.substr(0, url.find_first_of("?#"));
}

std::string appendQueryParameters(std::string_view url,
                                  const std::vector<std::pair<std::string, std::string>>& params) {
    if (params.empty())
        return std::string(url);

    std::string_view fragment;
    if (auto hash = url.find('#'); hash != std::string_view::npos) {
        fragment = url.substr(hash);
        url = url.substr(0, hash);
    }

    std::string out(url);
    char sep = (out.find('?') == std::string::npos) ? '?' : '&';
    if (!out.empty() && (out.back() == '?' || out.back() == '&'))
        sep = '\0';
    for (const auto& [name, value] : params) {
        if (sep != '\0')
            out.push_back(sep);
        out += percentEncode(name);
        out.push_back('=');
        out += percentEncode(value);
        sep = '&';
    }
    out.append(fragment);
    return out;
}

std::optional<std::string> filenameFromContentDisposition(std::string_view value) {
    // RFC 6266: prefer filename*=UTF-8''<pct-encoded>, then filename="..." or filename=token
    std::optional<std::string> plain;
    std::size_t pos = 0;
    while (pos < value.size()) {
        auto semi = value.find(';', pos);
        auto part = trimView(value.substr(pos, semi == std::string_view::npos ? std::string_view::npos
                                                                            : semi - pos));
        pos = (semi == std::string_view::npos) ? value.size() : semi + 1;

        auto eq = part.find('=');
        if (eq == std::string_view::npos)
            continue;
        std::string key(trimView(part.substr(0, eq)));
        for (auto& c : key)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        auto val = trimView(part.substr(eq + 1));

        if (key == "filename*") {
            auto quote = val.find("''");
            if (quote != std::string_view::npos) {
                auto decoded = percentDecode(val.substr(quote + 2));
                if (isSafeFilename(decoded))
                    return decoded;
            }
        } else if (key == "filename") {
            if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
                val = val.substr(1, val.size() - 2);
            std::string name(val);
            if (isSafeFilename(name))
                plain = std::move(name);
        }
    }
    return plain;
}

std::optional<std::string> filenameFromUrl(std::string_view url) {
    if (auto cut = url.find_first_of("?#"); cut != std::string_view::npos)
        url = url.substr(0, cut);
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return std::nullopt;
        url = url.substr(pathStart);
    }
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto slash = url.rfind('/');
    auto segment = (slash == std::string_view::npos) ? url : url.substr(slash + 1);
    auto decoded = percentDecode(segment);
    if (!isSafeFilename(decoded))
        return std::nullopt;
    return decoded;
}

std::optional<std::chrono::seconds> parseRetryAfter(std::string_view value,
                                                    std::chrono::system_clock::time_point now) {
    value = trimView(value);
    if (value.empty())
        return std::nullopt;

    std::int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec == std::errc() && ptr == value.data() + value.size()) {
        if (seconds < 0)
            return std::nullopt;
        return std::chrono::seconds(seconds);
    }

    // IMF-fixdate: "Sun, 06 Nov 1994 08:49:37 GMT"
    std::tm tm{};
    std::istringstream in{std::string(value)};
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail())
        return std::nullopt;
    const auto when = std::chrono::system_clock::from_time_t(::timegm(&tm));
    if (when <= now)
        return std::chrono::seconds(0);
    return std::chrono::duration_cast<std::chrono::seconds>(when - now);
}

} // namespace geofetch::downloader
