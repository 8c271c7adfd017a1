#pragma once
#include <cstdint>
#include <string>

namespace pinfetch {
    /**
     * @brief Represents an error that ended a fetch.
     *
     * `code` names the failure class, `reason` refines dial and read
     * failures (timeout, refusal, TLS validation, cancellation...).
     */
    struct Error {
        /** @brief Failure classes, in the order a fetch can hit them. */
        enum class Code : std::uint8_t {
            InvalidUrl,         /**< The URL is malformed. */
            MissingHost,        /**< The URL has no host component. */
            UnknownScheme,      /**< Unknown scheme and no explicit port. */
            RequestBuildFailed, /**< The request could not be built. */
            DialFailure,        /**< Connect or TLS handshake failed. */
            TransportFailure,   /**< Write or header read failed. */
            ReadFailure,        /**< Draining the response body failed. */
        };

        /** @brief Refinement of a dial/transport/read failure. */
        enum class Reason : std::uint8_t {
            None,
            Timeout,
            ConnectionRefused,
            TlsValidation,
            TlsHandshake,
            Cancelled,
            Network,
            BodyTooLarge,
            Protocol,
        };

        /** @brief The failure class. */
        Code code{Code::InvalidUrl};
        /** @brief Refinement, Reason::None for input errors. */
        Reason reason{Reason::None};
        /** @brief A descriptive error message. */
        std::string message;
    };

    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::MissingHost:
                return "MissingHost";
            case Error::Code::UnknownScheme:
                return "UnknownScheme";
            case Error::Code::RequestBuildFailed:
                return "RequestBuildFailed";
            case Error::Code::DialFailure:
                return "DialFailure";
            case Error::Code::TransportFailure:
                return "TransportFailure";
            case Error::Code::ReadFailure:
                return "ReadFailure";
        }
        return "Unknown";
    }

    inline const char* to_string(Error::Reason reason) {
        switch (reason) {
            case Error::Reason::None:
                return "none";
            case Error::Reason::Timeout:
                return "timeout";
            case Error::Reason::ConnectionRefused:
                return "connection refused";
            case Error::Reason::TlsValidation:
                return "tls validation";
            case Error::Reason::TlsHandshake:
                return "tls handshake";
            case Error::Reason::Cancelled:
                return "cancelled";
            case Error::Reason::Network:
                return "network";
            case Error::Reason::BodyTooLarge:
                return "body too large";
            case Error::Reason::Protocol:
                return "protocol";
        }
        return "unknown";
    }

    /// @brief True for failures detected before any network activity.
    inline constexpr bool is_input_error(Error::Code code) noexcept {
        return code == Error::Code::InvalidUrl ||
               code == Error::Code::MissingHost ||
               code == Error::Code::UnknownScheme;
    }

    /// @brief One-line rendering, e.g. "DialFailure{timeout}: ...".
    inline std::string describe(const Error& e) {
        std::string out = to_string(e.code);
        if (e.reason != Error::Reason::None) {
            out += '{';
            out += to_string(e.reason);
            out += '}';
        }
        if (!e.message.empty()) {
            out += ": ";
            out += e.message;
        }
        return out;
    }
}  // namespace pinfetch
