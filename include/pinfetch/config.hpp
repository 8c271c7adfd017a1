#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace pinfetch {
    /**
     * @brief Configuration for the shared, connection-pooling Transport.
     */
    struct TransportConfiguration {
        /** @brief Bound on resolving + connecting one dial address. */
        std::chrono::milliseconds connect_timeout{500};

        /** @brief Bound on each read/write after the connection is up.
         *  Unset means no deadline once the connection is established. */
        std::optional<std::chrono::milliseconds> read_timeout;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"pinfetch/1.0"};

        /** @brief Maximum size of a response body in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(64) * 1024U *
                                   1024U};

        /** @brief Whether to verify peer certificates and hostnames. */
        bool verify_tls{true};

        /** @brief Extra PEM file of trusted CAs, on top of system roots. */
        std::optional<std::string> ca_file;

        /** @brief Extra trusted CA certificates as in-memory PEM. */
        std::string ca_pem;

        /** @brief Idle connections kept per logical endpoint. */
        std::size_t max_idle_per_endpoint{2};

        /** @brief Idle connection time-to-live. */
        std::chrono::milliseconds connection_idle_ttl{90000};
    };

    /**
     * @brief Configuration for a FetchExecutor.
     */
    struct FetchConfiguration {
        /** @brief Close the transport's idle connections when a fetch ends. */
        bool close_idle_after_fetch{true};

        /** @brief Extra request headers. Host is not overridable. */
        std::map<std::string, std::string> headers;
    };
}  // namespace pinfetch
