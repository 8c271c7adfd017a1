#pragma once
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <map>
#include <string>
#include <string_view>

#include "endpoint.hpp"
#include "result.hpp"
#include "target.hpp"

namespace pinfetch {

    /// @brief A request ready for the transport. Its identity (target, Host
    /// header, TLS peer) is fixed here and never depends on a dial override.
    struct PreparedRequest {
        Target target;
        Endpoint endpoint;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    namespace request_utils {

        inline bool is_token_char(unsigned char c) {
            if (c >= '0' && c <= '9') return true;
            if ((c | 0x20) >= 'a' && (c | 0x20) <= 'z') return true;
            return std::string_view("!#$%&'*+-.^_`|~").find(
                       static_cast<char>(c)) != std::string_view::npos;
        }

        inline bool is_valid_header_name(std::string_view name) {
            if (name.empty()) return false;
            for (unsigned char c : name) {
                if (!is_token_char(c)) return false;
            }
            return true;
        }

        inline bool is_valid_header_value(std::string_view value) {
            for (unsigned char c : value) {
                if ((c < 0x20 && c != '\t') || c == 0x7f) return false;
            }
            return true;
        }

        /// @brief Percent-encode bytes that may not appear raw in a request
        /// line (space, controls, non-ASCII). Existing escapes are kept.
        inline std::string escape_request_target(std::string_view t) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(t.size());
            for (unsigned char c : t) {
                if (c <= 0x20 || c >= 0x7f) {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0f]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
            }
            return out;
        }

    }  // namespace request_utils

    /// @brief Build a GET for `target`.
    /// @param user_agent Left for the transport to fill in when empty.
    /// @param headers Extra headers; Host may not be among them.
    /// @return RequestBuildFailed for schemes the transport cannot speak or
    /// invalid header text.
    inline Result<PreparedRequest> prepare_get(
        const Target& target, const std::string& user_agent,
        const std::map<std::string, std::string>& headers = {}) {
        namespace http = boost::beast::http;
        using R = Result<PreparedRequest>;

        if (target.scheme != "http" && target.scheme != "https") {
            return R::fail(Error::Code::RequestBuildFailed,
                           "unsupported protocol scheme \"" + target.scheme +
                               "\"");
        }

        PreparedRequest out;
        out.target = target;
        out.endpoint = endpoint_for(target);

        auto& req = out.beast_req;
        req.version(11);
        req.method(http::verb::get);
        req.target(request_utils::escape_request_target(target.target));
        req.set(http::field::host, url_utils::host_header_value(target));
        if (!user_agent.empty()) req.set(http::field::user_agent, user_agent);
        req.keep_alive(true);

        for (const auto& [name, value] : headers) {
            if (!request_utils::is_valid_header_name(name)) {
                return R::fail(Error::Code::RequestBuildFailed,
                               "invalid header name \"" + name + "\"");
            }
            if (!request_utils::is_valid_header_value(value)) {
                return R::fail(Error::Code::RequestBuildFailed,
                               "invalid value for header \"" + name + "\"");
            }
            if (url_utils::to_lower(name) == "host") {
                return R::fail(Error::Code::RequestBuildFailed,
                               "the Host header follows the URL and cannot "
                               "be set");
            }
            req.set(name, value);
        }

        return R::ok(std::move(out));
    }

}  // namespace pinfetch
