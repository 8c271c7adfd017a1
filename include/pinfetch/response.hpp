#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pinfetch {

    /// @brief Header name -> values, in the order they were received.
    /// Names are canonicalized ("content-type" -> "Content-Type").
    using HeaderMap = std::map<std::string, std::vector<std::string>>;

    /**
     * @brief Represents a fully drained HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief Reason phrase as sent by the server. */
        std::string reason;
        /** @brief HTTP version, 11 for HTTP/1.1. */
        unsigned version{11};
        /** @brief Response headers, multiple values per name preserved. */
        HeaderMap headers;
        /** @brief Response body. */
        std::string body;

        /** @brief Physical address the serving connection was dialed to. */
        std::string dial_address;
        /** @brief True if the request rode on a pooled connection. */
        bool reused_connection{false};

        /// @brief "200 OK"
        std::string status() const {
            std::string out = std::to_string(status_code);
            if (!reason.empty()) {
                out += ' ';
                out += reason;
            }
            return out;
        }

        /// @brief "HTTP/1.1"
        std::string protocol() const {
            return "HTTP/" + std::to_string(version / 10) + "." +
                   std::to_string(version % 10);
        }

        /// @brief First value of a header, empty if absent.
        std::string header(std::string_view name) const;
    };

    /// @brief Canonical MIME header key: first letter and letters after '-'
    /// uppercased, the rest lowercased. Names with characters outside the
    /// token set are returned unchanged.
    inline std::string canonical_header_key(std::string_view name) {
        std::string out(name);
        for (unsigned char c : out) {
            if (c <= ' ' || c >= 0x7f || c == ':') return out;
        }
        bool upper = true;
        for (char& c : out) {
            const auto uc = static_cast<unsigned char>(c);
            c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
            upper = (c == '-');
        }
        return out;
    }

    inline std::string Response::header(std::string_view name) const {
        auto it = headers.find(canonical_header_key(name));
        if (it == headers.end() || it->second.empty()) return {};
        return it->second.front();
    }

    /// @brief Convert a Boost.Beast HTTP response to a pinfetch::Response.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());
        out.reason = std::string(beast_res.reason());
        if (out.reason.empty()) {
            out.reason = std::string(
                boost::beast::http::obsolete_reason(beast_res.result()));
        }
        out.version = beast_res.version();

        for (const auto& field : beast_res.base()) {
            out.headers[canonical_header_key(std::string(field.name_string()))]
                .push_back(std::string(field.value()));
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace pinfetch
