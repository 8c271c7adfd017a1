#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace pinfetch {

    /// @brief The logical destination of a fetch, derived once from its URL.
    struct Target {
        /// Lowercased scheme ("http", "https", or whatever the URL said).
        std::string scheme;
        /// Host as written in the URL, IPv6 brackets removed.
        std::string host;
        /// Never empty after resolve_target().
        std::string port;
        /// Path + optional query, fragment removed. "/" when the URL has none.
        std::string target{"/"};
        /// True if the port came from the URL rather than the scheme default.
        bool explicit_port{false};

        bool https() const noexcept { return scheme == "https"; }
    };

    namespace url_utils {

        inline std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// @brief Default port for a scheme, nullopt for unknown schemes.
        /// @param scheme Compared case-insensitively.
        inline std::optional<std::string> default_port_for_scheme(
            std::string_view scheme) {
            const std::string s = to_lower(scheme);
            if (s == "https") return std::string("443");
            if (s == "http") return std::string("80");
            return std::nullopt;
        }

        /// @brief Join host and port as "host:port", bracketing IPv6
        /// literals ("[::1]:443").
        inline std::string join_host_port(std::string_view host,
                                          std::string_view port) {
            std::string out;
            out.reserve(host.size() + port.size() + 3);
            if (host.find(':') != std::string_view::npos) {
                out.push_back('[');
                out.append(host);
                out.push_back(']');
            } else {
                out.append(host);
            }
            out.push_back(':');
            out.append(port);
            return out;
        }

        /// @brief Value for the Host header: the logical host, with the port
        /// only when the URL spelled one out.
        inline std::string host_header_value(const Target& t) {
            if (t.explicit_port) return join_host_port(t.host, t.port);
            if (t.host.find(':') != std::string::npos) return "[" + t.host + "]";
            return t.host;
        }

        inline bool is_valid_scheme(std::string_view s) {
            if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
                return false;
            return std::all_of(s.begin(), s.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '+' || c == '-' || c == '.';
            });
        }

        /// @brief Every '%' must be followed by two hex digits.
        inline bool has_valid_escapes(std::string_view s) {
            for (std::size_t i = 0; i < s.size(); ++i) {
                if (s[i] != '%') continue;
                if (i + 2 >= s.size() ||
                    !std::isxdigit(static_cast<unsigned char>(s[i + 1])) ||
                    !std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
                    return false;
                }
                i += 2;
            }
            return true;
        }

        inline bool is_valid_host_text(std::string_view host) {
            return host.find_first_of(" \t<>\"{}|\\^`") == std::string_view::npos;
        }

        inline bool is_valid_port_text(std::string_view port) {
            if (port.size() > 5) return false;
            if (!std::all_of(port.begin(), port.end(), [](unsigned char c) {
                    return std::isdigit(c);
                }))
                return false;
            return port.empty() || std::stoul(std::string(port)) <= 65535;
        }

    }  // namespace url_utils

    /// @brief Parse a URL into a Target and pick its port.
    ///
    /// Port policy: an explicit port in the URL wins; otherwise the scheme
    /// default (http 80, https 443); otherwise the URL is rejected with
    /// UnknownScheme. An empty explicit port ("http://h:/") counts as absent.
    /// @return The Target, or InvalidUrl / MissingHost / UnknownScheme.
    inline Result<Target> resolve_target(std::string_view url) {
        using R = Result<Target>;
        using Code = Error::Code;

        for (unsigned char c : url) {
            if (c < 0x20 || c == 0x7f)
                return R::fail(Code::InvalidUrl,
                               "URL contains control characters");
        }
        if (!url_utils::has_valid_escapes(url))
            return R::fail(Code::InvalidUrl, "URL has a malformed % escape");

        // scheme ":" only counts if it comes before any '/', '?' or '#'
        std::string_view rest = url;
        std::string scheme;
        const auto colon = url.find(':');
        const auto delim = url.find_first_of("/?#");
        if (colon != std::string_view::npos &&
            (delim == std::string_view::npos || colon < delim)) {
            const std::string_view s = url.substr(0, colon);
            if (s.empty())
                return R::fail(Code::InvalidUrl, "missing protocol scheme");
            if (!url_utils::is_valid_scheme(s))
                return R::fail(Code::InvalidUrl,
                               "malformed scheme \"" + std::string(s) + "\"");
            scheme = url_utils::to_lower(s);
            rest = url.substr(colon + 1);
        }

        if (auto hash = rest.find('#'); hash != std::string_view::npos)
            rest = rest.substr(0, hash);

        if (rest.rfind("//", 0) != 0)
            return R::fail(Code::MissingHost,
                           "URL missing host: \"" + std::string(url) + "\"");
        rest.remove_prefix(2);

        const auto path_start = rest.find_first_of("/?");
        std::string_view authority = rest.substr(0, path_start);
        std::string_view path = path_start == std::string_view::npos
                                    ? std::string_view{}
                                    : rest.substr(path_start);

        // Credentials are never used; drop them.
        if (auto at = authority.rfind('@'); at != std::string_view::npos)
            authority.remove_prefix(at + 1);

        std::string_view host;
        std::string_view port;
        if (!authority.empty() && authority.front() == '[') {
            const auto close = authority.find(']');
            if (close == std::string_view::npos)
                return R::fail(Code::InvalidUrl, "missing ']' in host");
            host = authority.substr(1, close - 1);
            const std::string_view after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':')
                    return R::fail(Code::InvalidUrl,
                                   "unexpected text after ']' in host");
                port = after.substr(1);
            }
        } else {
            host = authority;
            if (auto c = authority.rfind(':'); c != std::string_view::npos) {
                host = authority.substr(0, c);
                port = authority.substr(c + 1);
            }
            if (host.find(':') != std::string_view::npos)
                return R::fail(Code::InvalidUrl,
                               "IPv6 host must be enclosed in brackets");
        }

        if (!url_utils::is_valid_port_text(port))
            return R::fail(Code::InvalidUrl,
                           "invalid port \"" + std::string(port) + "\"");
        if (host.empty())
            return R::fail(Code::MissingHost,
                           "URL missing host: \"" + std::string(url) + "\"");
        if (!url_utils::is_valid_host_text(host))
            return R::fail(Code::InvalidUrl,
                           "invalid character in host \"" + std::string(host) +
                               "\"");

        Target out;
        out.scheme = std::move(scheme);
        out.host = std::string(host);
        out.target = path.empty() ? "/" : std::string(path);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');

        if (!port.empty()) {
            out.port = std::string(port);
            out.explicit_port = true;
        } else if (auto def = url_utils::default_port_for_scheme(out.scheme)) {
            out.port = std::move(*def);
        } else {
            return R::fail(Code::UnknownScheme,
                           "unknown url scheme \"" + out.scheme + "\"");
        }

        return R::ok(std::move(out));
    }

}  // namespace pinfetch
