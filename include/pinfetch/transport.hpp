#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <thread>

#include "pinfetch/config.hpp"
#include "pinfetch/connection/connection_pool.hpp"
#include "pinfetch/dialer.hpp"
#include "pinfetch/round_tripper.hpp"

namespace pinfetch {

    /**
     * @brief Shared, connection-pooling HTTP/HTTPS transport.
     *
     * Owns one I/O thread on which every socket operation runs. `round_trip`
     * may be called concurrently from any thread except that I/O thread;
     * each call blocks until its own exchange is done. Idle connections are
     * pooled by logical endpoint.
     *
     * Construct it once and hand it to every FetchExecutor that should share
     * connections. There is no global instance.
     */
    class Transport : public RoundTripper {
       public:
        /**
         * @brief Start the I/O thread and set up TLS.
         * @throws std::runtime_error if the configured CA material can't be
         * loaded.
         */
        explicit Transport(TransportConfiguration cfg = {});

        ~Transport() override;

        Transport(const Transport&) = delete;
        Transport& operator=(const Transport&) = delete;

        Result<Response> round_trip(const PreparedRequest& req,
                                    const RequestContext& ctx) override;

        void close_idle_connections() override;

        /**
         * @brief Coroutine form of round_trip. Must be awaited on executor().
         */
        boost::asio::awaitable<Result<Response>> async_round_trip(
            PreparedRequest req, RequestContext ctx);

        /// @brief The transport's I/O executor.
        boost::asio::any_io_executor executor() { return io_.get_executor(); }

        [[nodiscard]] const TransportConfiguration& config() const noexcept {
            return cfg_;
        }

        [[nodiscard]] const ConnectionPoolMetrics& metrics() const noexcept {
            return pool_.metrics();
        }

        /// @brief Idle pooled connections for a logical endpoint.
        [[nodiscard]] std::size_t idle_connections(
            const Endpoint& ep) const {
            return pool_.idle_count(ep);
        }

       private:
        TransportConfiguration cfg_;
        boost::asio::io_context io_{1};
        boost::asio::ssl::context ssl_ctx_;
        Dialer dialer_;
        ConnectionPool pool_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
            work_;
        std::thread thread_;
    };

}  // namespace pinfetch
