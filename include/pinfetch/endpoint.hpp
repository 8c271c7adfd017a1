#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include "config.hpp"
#include "target.hpp"

namespace pinfetch {

    /// @brief Logical endpoint: the pooling key and the TLS identity.
    /// @note Never contains the dial override.
    struct Endpoint {
        std::string host;
        std::string port;
        bool https{false};

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        std::string address() const {
            return url_utils::join_host_port(host, port);
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }
    };

    inline Endpoint endpoint_for(const Target& t) {
        Endpoint ep{t.host, t.port, t.https()};
        ep.normalize_default_port();
        ep.normalize_host();
        return ep;
    }

    inline bool is_ip_literal(std::string_view host) {
        boost::system::error_code ec;
        (void)boost::asio::ip::make_address(std::string(host), ec);
        return !ec;
    }

    /// @brief Set SNI to the logical host. IP literals get no SNI (RFC 6066).
    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (is_ip_literal(host)) return true;
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Make the handshake check the certificate against `host`.
    /// @note `host` is always the logical host, never the dial address.
    inline bool set_expected_peer(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        SSL* ssl = stream.native_handle();
        int ok = 0;
        if (is_ip_literal(host)) {
            ok = X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl),
                                               host.c_str());
        } else {
            SSL_set_hostflags(ssl, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
            ok = SSL_set1_host(ssl, host.c_str());
        }
        if (ok != 1) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Offer ALPN. Beast speaks HTTP/1.x only, so that is all we offer.
    inline bool set_alpn(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        boost::system::error_code& ec) {
        static constexpr unsigned char protos[] = {
            8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
        // Note: returns 0 on success, unlike most of OpenSSL.
        if (SSL_set_alpn_protos(stream.native_handle(), protos,
                                sizeof(protos)) != 0) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Certificate verification result after a handshake attempt.
    inline long verify_result(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream) {
        return SSL_get_verify_result(stream.native_handle());
    }

    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        const TransportConfiguration& cfg) {
        try {
            ssl_context.set_default_verify_paths();
            if (cfg.ca_file) ssl_context.load_verify_file(*cfg.ca_file);
            if (!cfg.ca_pem.empty()) {
                ssl_context.add_certificate_authority(
                    boost::asio::buffer(cfg.ca_pem));
            }
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to load trusted certificates: ") +
                e.what());
        }

        ssl_context.set_verify_mode(cfg.verify_tls
                                        ? boost::asio::ssl::verify_peer
                                        : boost::asio::ssl::verify_none);
    }

}  // namespace pinfetch

namespace std {
    template <>
    struct hash<pinfetch::Endpoint> {
        size_t operator()(pinfetch::Endpoint const& e) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(e.https);
            h *= 1099511628211ull;
            mix(e.host);
            mix(e.port);
            return h;
        }
    };
}  // namespace std
