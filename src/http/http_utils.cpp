/**
 * @file http_utils.cpp
 * @brief URL and timestamp helper implementation
 */

#include "jobwire/http/http_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace jobwire::http_utils {

namespace {

auto default_port(const std::string& scheme) -> uint16_t {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    return 0;
}

auto malformed(const std::string& url, const std::string& reason) -> unexpected {
    return unexpected{error{error_code::malformed_url,
        "Malformed URL '" + url + "': " + reason}};
}

auto parse_int(const std::string& text, std::size_t pos, std::size_t len, int& out) -> bool {
    if (pos + len > text.size()) return false;
    const char* begin = text.data() + pos;
    auto [ptr, ec] = std::from_chars(begin, begin + len, out);
    return ec == std::errc{} && ptr == begin + len;
}

}  // namespace

// ============================================================================
// URL Utilities
// ============================================================================

auto parse_url(const std::string& url) -> result<parsed_url> {
    if (url.empty()) {
        return malformed(url, "empty");
    }
    if (std::any_of(url.begin(), url.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return malformed(url, "contains whitespace");
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return malformed(url, "missing scheme");
    }

    parsed_url parsed;
    parsed.scheme = url.substr(0, scheme_end);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (default_port(parsed.scheme) == 0) {
        return malformed(url, "unsupported scheme '" + parsed.scheme + "'");
    }

    auto authority_begin = scheme_end + 3;
    auto authority_end = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(authority_begin,
        authority_end == std::string::npos ? std::string::npos : authority_end - authority_begin);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return malformed(url, "unterminated IPv6 literal");
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return malformed(url, "unexpected characters after host");
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (parsed.host.empty()) {
        return malformed(url, "missing host");
    }

    parsed.port = default_port(parsed.scheme);
    if (!port_text.empty()) {
        int port = 0;
        if (!parse_int(port_text, 0, port_text.size(), port) || port <= 0 || port > 65535) {
            return malformed(url, "invalid port '" + port_text + "'");
        }
        parsed.port = static_cast<uint16_t>(port);
    }

    if (authority_end == std::string::npos) {
        parsed.path = "/";
        return parsed;
    }

    auto rest = url.substr(authority_end);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.erase(fragment);
    }
    auto question = rest.find('?');
    if (question != std::string::npos) {
        parsed.query = rest.substr(question + 1);
        rest.erase(question);
    }
    parsed.path = rest.empty() ? "/" : rest;
    return parsed;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::uppercase
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

auto build_query_string(const std::map<std::string, std::string>& query) -> std::string {
    std::string out;
    for (const auto& [key, value] : query) {
        if (!out.empty()) {
            out += '&';
        }
        out += url_encode(key);
        out += '=';
        out += url_encode(value);
    }
    return out;
}

auto join_url(const std::string& base, const std::string& path) -> std::string {
    if (path.empty()) {
        return base;
    }
    std::string joined = base;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    if (path.front() != '/') {
        joined += '/';
    }
    joined += path;
    return joined;
}

auto strip_query(const std::string& url) -> std::string {
    auto pos = url.find_first_of("?#");
    return pos == std::string::npos ? url : url.substr(0, pos);
}

// ============================================================================
// Time Utilities
// ============================================================================

auto parse_iso8601(const std::string& value)
    -> std::optional<std::chrono::system_clock::time_point> {
    // YYYY-MM-DDTHH:MM:SS
    if (value.size() < 19 || value[4] != '-' || value[7] != '-' ||
        (value[10] != 'T' && value[10] != 't' && value[10] != ' ') ||
        value[13] != ':' || value[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_int(value, 0, 4, year) || !parse_int(value, 5, 2, month) ||
        !parse_int(value, 8, 2, day) || !parse_int(value, 11, 2, hour) ||
        !parse_int(value, 14, 2, minute) || !parse_int(value, 17, 2, second)) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::chrono::milliseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        int scale = 100;
        int millis = 0;
        std::size_t digits = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (scale > 0) {
                millis += (value[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        fraction = std::chrono::milliseconds{millis};
    }

    std::chrono::minutes offset{0};
    if (pos < value.size()) {
        char tz = value[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int off_hour = 0, off_minute = 0;
            if (!parse_int(value, pos + 1, 2, off_hour)) {
                return std::nullopt;
            }
            std::size_t minute_pos = pos + 3;
            if (minute_pos < value.size() && value[minute_pos] == ':') {
                ++minute_pos;
            }
            if (!parse_int(value, minute_pos, 2, off_minute)) {
                return std::nullopt;
            }
            offset = std::chrono::hours{off_hour} + std::chrono::minutes{off_minute};
            if (tz == '-') {
                offset = -offset;
            }
            pos = minute_pos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
              std::chrono::minutes{minute} + std::chrono::seconds{second} + fraction - offset;

    // Dates past the system clock's range
    constexpr auto limit = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::duration::max());
    if (tp.time_since_epoch() > limit || tp.time_since_epoch() < -limit) {
        return std::nullopt;
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
}

}  // namespace jobwire::http_utils
