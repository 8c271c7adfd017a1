#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <string>
#include <string_view>

#include "endpoint.hpp"
#include "request_context.hpp"
#include "result.hpp"

namespace pinfetch {

    /// @brief Physical address a connection is opened to.
    struct DialTarget {
        std::string host;
        std::string port;

        std::string address() const {
            return url_utils::join_host_port(host, port);
        }
    };

    /// @brief Host part of a dial override.
    ///
    /// Overrides are meant to be bare hosts or IPs. When one carries a port
    /// anyway ("10.0.0.1:99", "[::1]:99") the port is dropped; bare IPv6
    /// literals ("::1") are returned unchanged.
    std::string override_host(std::string_view override_address);

    /// @brief Where to dial for `logical` under `ctx`.
    ///
    /// Without an override this is the logical host and port. With one it is
    /// the override's host and the *logical* port.
    DialTarget dial_target_for(const RequestContext& ctx,
                               const Endpoint& logical);

    /// @brief Outcome of a successful dial.
    struct DialResult {
        std::string dial_address;
        boost::asio::ip::tcp::endpoint remote;
    };

    /**
     * @brief Connection-establishing function that honours a RequestContext's
     * dial override.
     *
     * Only the TCP destination changes. Everything above the socket (SNI,
     * certificate verification, Host header) keeps using the logical
     * endpoint, which the caller owns.
     */
    class Dialer {
       public:
        /**
         * @param ex Executor the resolver, timers and streams run on.
         * @param connect_timeout Bound on resolve + connect.
         */
        Dialer(boost::asio::any_io_executor ex,
               std::chrono::milliseconds connect_timeout);

        /**
         * @brief Open `stream` to the physical address for `logical`.
         * @return DialFailure with reason Timeout, ConnectionRefused,
         * Cancelled or Network on failure.
         */
        boost::asio::awaitable<Result<DialResult>> dial(
            const RequestContext& ctx, const Endpoint& logical,
            boost::beast::tcp_stream& stream) const;

        std::chrono::milliseconds connect_timeout() const noexcept {
            return m_connect_timeout;
        }

       private:
        boost::asio::any_io_executor m_ex;
        std::chrono::milliseconds m_connect_timeout;
    };

}  // namespace pinfetch
