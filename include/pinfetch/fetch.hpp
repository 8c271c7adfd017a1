#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

#include "pinfetch/config.hpp"
#include "pinfetch/response.hpp"
#include "pinfetch/result.hpp"
#include "pinfetch/round_tripper.hpp"

namespace pinfetch {

    /// @brief Progress of a single fetch.
    enum class FetchState : std::uint8_t {
        Unstarted,
        Resolving,
        Dialing,
        AwaitingHeaders,
        ReadingBody,
        Done,
        Failed,
    };

    const char* to_string(FetchState state);

    /// @brief One GET to perform.
    struct FetchRequest {
        /// Absolute http(s) URL; Host header and TLS identity come from it.
        std::string url;
        /// Physical address to dial instead of the URL host. The URL's port
        /// is kept. Empty means no override.
        std::optional<std::string> dial_override;
        /// Stop requests abort the fetch wherever it is.
        std::stop_token cancel;
        std::optional<std::chrono::steady_clock::time_point> deadline;
    };

    /// @brief What a successful fetch hands to the report layer.
    struct FetchResult {
        std::string status;  ///< "200 OK"
        int status_code{0};
        std::string protocol;  ///< "HTTP/1.1"
        HeaderMap headers;
        std::string body;
        std::size_t body_size{0};
        std::string dial_address;
        bool reused_connection{false};
    };

    /**
     * @brief Performs exactly one GET per call over a shared RoundTripper.
     *
     * The override only changes where the connection is dialed. The request
     * target and Host header are built from the URL alone.
     */
    class FetchExecutor {
       public:
        using Observer = std::function<void(FetchState)>;

        explicit FetchExecutor(RoundTripper& transport,
                               FetchConfiguration cfg = {});

        /**
         * @brief Resolve, dial, send and drain.
         * @param observer Called on every state change. May run on the
         * transport's I/O thread.
         * @return InvalidUrl / MissingHost / UnknownScheme /
         * RequestBuildFailed before any network activity, DialFailure,
         * TransportFailure or ReadFailure after.
         */
        Result<FetchResult> fetch(const FetchRequest& request,
                                  const Observer& observer = {}) const;

        [[nodiscard]] const FetchConfiguration& config() const noexcept {
            return cfg_;
        }

       private:
        RoundTripper& transport_;
        FetchConfiguration cfg_;
    };

}  // namespace pinfetch
