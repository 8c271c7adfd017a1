#pragma once

#include <openssl/x509.h>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/log/trivial.hpp>
#include <optional>
#include <string>
#include <variant>

#include "pinfetch/config.hpp"
#include "pinfetch/connection/io_bounds.hpp"
#include "pinfetch/dialer.hpp"
#include "pinfetch/endpoint.hpp"
#include "pinfetch/request.hpp"
#include "pinfetch/request_context.hpp"
#include "pinfetch/response.hpp"
#include "pinfetch/result.hpp"

namespace pinfetch {

    /**
     * @brief A single network connection for one logical endpoint.
     *
     * The TCP destination comes from the Dialer and may be an override; the
     * TLS peer identity and Host header always come from the logical
     * endpoint. All methods run on the transport's I/O thread.
     */
    class Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        /**
         * @brief Constructs an unconnected Connection.
         * @param executor The executor to use.
         * @param ssl_ctx The SSL context for HTTPS.
         * @param endpoint The logical endpoint.
         * @param cfg Read timeout and body limit are taken from here.
         */
        Connection(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context& ssl_ctx, Endpoint endpoint,
                   const TransportConfiguration& cfg)
            : m_ex(std::move(executor)),
              m_ssl_ctx(ssl_ctx),
              m_endpoint(std::move(endpoint)),
              m_read_timeout(cfg.read_timeout),
              m_max_body_bytes(cfg.max_body_bytes) {
            m_endpoint.normalize_default_port();
            m_endpoint.normalize_host();
        }

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept { close(); }

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept {
            boost::system::error_code ec;
            if (auto* s = std::get_if<HttpStream>(&m_stream)) {
                s->socket().shutdown(tcp::socket::shutdown_both, ec);
                s->socket().close(ec);
            } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
                auto& sock = boost::beast::get_lowest_layer(*s).socket();
                sock.shutdown(tcp::socket::shutdown_both, ec);
                sock.close(ec);
            }
            m_stream.emplace<std::monostate>();
        }

        /// @brief Abort whatever operation is pending on the socket.
        void cancel_io() noexcept {
            if (auto* s = std::get_if<HttpStream>(&m_stream)) {
                s->cancel();
            } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
                boost::beast::get_lowest_layer(*s).cancel();
            }
        }

        /**
         * @brief Perform one HTTP exchange, connecting first if needed.
         *
         * On any failure the connection is closed so it cannot be reused.
         * A reused connection that turns out to be closed by the peer before
         * the server saw the request is replaced by one fresh dial.
         */
        boost::asio::awaitable<Result<Response>> round_trip(
            const PreparedRequest& preq, const RequestContext& ctx,
            const Dialer& dialer) {
            if (preq.endpoint != m_endpoint) {
                co_return Result<Response>::fail(
                    Error::Code::RequestBuildFailed,
                    "PreparedRequest endpoint does not match Connection "
                    "endpoint");
            }

            auto connected = co_await ensure_connected(ctx, dialer);
            if (connected.has_error())
                co_return Result<Response>::propagate(connected);

            bool unseen = false;
            auto res = co_await exchange_any(preq, ctx, unseen);
            if (res.has_error() && unseen && connected.value() && !ctx.done()) {
                BOOST_LOG_TRIVIAL(debug)
                    << "pooled connection to " << m_endpoint.address()
                    << " via " << m_dial_address
                    << " was closed by the peer, dialing again";
                close();
                connected = co_await ensure_connected(ctx, dialer);
                if (connected.has_error())
                    co_return Result<Response>::propagate(connected);
                res = co_await exchange_any(preq, ctx, unseen);
            }
            if (auto* r = res.value_ptr()) {
                r->dial_address = m_dial_address;
                r->reused_connection = connected.value();
            }
            co_return res;
        }

        /// @brief The logical endpoint this connection is tied to.
        const Endpoint& endpoint() const noexcept { return m_endpoint; }

        /// @brief Physical address of the current socket, empty if closed.
        const std::string& dial_address() const noexcept {
            return m_dial_address;
        }

        /**
         * @brief Checks if the connection is currently open.
         */
        bool is_healthy() const noexcept {
            return std::visit(
                [](auto const& s) -> bool {
                    using T = std::decay_t<decltype(s)>;

                    if constexpr (std::is_same_v<T, std::monostate>) {
                        return false;
                    } else if constexpr (std::is_same_v<T, HttpStream>) {
                        return s.socket().is_open();
                    } else {
                        return boost::beast::get_lowest_layer(s)
                            .socket()
                            .is_open();
                    }
                },
                m_stream);
        }

        /**
         * @brief Open, and not closed by the peer while it sat idle.
         *
         * Peeks without blocking: a live idle HTTP/1.1 connection has nothing
         * to read. EOF, an error or unsolicited bytes (a TLS close_notify)
         * mean the peer is gone.
         */
        bool is_reusable() noexcept {
            if (!is_healthy()) return false;
            tcp::socket& sock =
                m_endpoint.https ? boost::beast::get_lowest_layer(
                                       std::get<HttpsStream>(m_stream))
                                       .socket()
                                 : std::get<HttpStream>(m_stream).socket();

            boost::system::error_code ec;
            const bool was_non_blocking = sock.non_blocking();
            sock.non_blocking(true, ec);
            if (ec) return false;
            char c;
            sock.receive(boost::asio::buffer(&c, 1),
                         tcp::socket::message_peek, ec);
            boost::system::error_code restore_ec;
            sock.non_blocking(was_non_blocking, restore_ec);
            return ec == boost::asio::error::would_block && !restore_ec;
        }

       private:
        /// @return true if an existing connection was reused.
        boost::asio::awaitable<Result<bool>> ensure_connected(
            const RequestContext& ctx, const Dialer& dialer) {
            const RequestTrace* trace = ctx.trace();

            if (is_healthy()) {
                BOOST_LOG_TRIVIAL(debug) << "reusing connection to "
                                         << m_endpoint.address() << " via "
                                         << m_dial_address;
                if (trace && trace->connected)
                    trace->connected(m_dial_address, true);
                co_return Result<bool>::ok(true);
            }

            close();
            m_dial_address.clear();

            HttpStream tcp_stream(m_ex);
            auto dialed = co_await dialer.dial(ctx, m_endpoint, tcp_stream);
            if (dialed.has_error()) co_return Result<bool>::propagate(dialed);

            if (!m_endpoint.https) {
                m_stream.emplace<HttpStream>(std::move(tcp_stream));
                m_dial_address = dialed.value().dial_address;
                if (trace && trace->connected)
                    trace->connected(m_dial_address, false);
                co_return Result<bool>::ok(false);
            }

            m_stream.emplace<HttpsStream>(std::move(tcp_stream), m_ssl_ctx);
            auto& s = std::get<HttpsStream>(m_stream);
            const std::string& dial_address = dialed.value().dial_address;

            boost::system::error_code ec;
            // Identity is the logical host even when dialing an override.
            if (!set_sni(s, m_endpoint.host, ec) ||
                !set_expected_peer(s, m_endpoint.host, ec) ||
                !set_alpn(s, ec)) {
                close();
                co_return Result<bool>::fail(
                    Error::Code::DialFailure, Error::Reason::TlsHandshake,
                    "tls setup for " + m_endpoint.host + ": " + ec.message());
            }

            std::optional<Expiry> bound;
            {
                StopBinding on_stop(m_ex, ctx.cancellation(),
                                [this] { cancel_io(); });
                bound = arm(boost::beast::get_lowest_layer(s), ctx);
                co_await s.async_handshake(
                    boost::asio::ssl::stream_base::client,
                    boost::asio::redirect_error(boost::asio::use_awaitable,
                                                ec));
            }

            if (ec) {
                const long vr = verify_result(s);
                Error::Reason reason = Error::Reason::TlsHandshake;
                std::string message = ec.message();
                if (ctx.cancellation().stop_requested() ||
                    ec == boost::beast::error::timeout) {
                    reason = classify_io(ec, ctx, bound);
                } else if (vr != X509_V_OK) {
                    reason = Error::Reason::TlsValidation;
                    message = "certificate is not valid for " +
                              m_endpoint.host + ": " +
                              X509_verify_cert_error_string(vr);
                }
                close();
                co_return Result<bool>::fail(
                    Error::Code::DialFailure, reason,
                    "tls handshake with " + dial_address + ": " + message);
            }

            boost::beast::get_lowest_layer(s).expires_never();
            m_dial_address = dial_address;
            if (trace && trace->connected)
                trace->connected(m_dial_address, false);
            co_return Result<bool>::ok(false);
        }

        boost::asio::awaitable<Result<Response>> exchange_any(
            const PreparedRequest& preq, const RequestContext& ctx,
            bool& unseen) {
            if (m_endpoint.https)
                co_return co_await exchange(std::get<HttpsStream>(m_stream),
                                            preq, ctx, unseen);
            co_return co_await exchange(std::get<HttpStream>(m_stream), preq,
                                        ctx, unseen);
        }

        /// @param unseen Set when the exchange failed because the peer had
        /// closed the connection before sending any part of a response.
        template <typename S>
        boost::asio::awaitable<Result<Response>> exchange(
            S& stream, const PreparedRequest& preq, const RequestContext& ctx,
            bool& unseen) {
            namespace http = boost::beast::http;
            namespace net = boost::asio;

            auto& lowest = boost::beast::get_lowest_layer(stream);
            StopBinding on_stop(m_ex, ctx.cancellation(),
                                [this] { cancel_io(); });
            boost::system::error_code ec;
            unseen = false;

            auto bound = arm(lowest, ctx);
            co_await http::async_write(
                stream, preq.beast_req,
                net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                close();
                unseen = peer_closed(ec) && !ctx.done();
                co_return io_error(before_headers_code(ec, ctx, bound), ec,
                                   ctx, bound, "write request");
            }

            http::response_parser<http::string_body> parser;
            parser.body_limit(m_max_body_bytes);
            m_buffer.clear();

            bound = arm(lowest, ctx);
            co_await http::async_read_header(
                stream, m_buffer, parser,
                net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                close();
                unseen = !parser.got_some() && peer_closed(ec) && !ctx.done();
                // A declared Content-Length over the limit fails here already.
                const auto code = ec == boost::beast::http::error::body_limit
                                      ? Error::Code::ReadFailure
                                      : before_headers_code(ec, ctx, bound);
                co_return io_error(code, ec, ctx, bound,
                                   "read response headers");
            }

            if (const RequestTrace* t = ctx.trace(); t && t->headers_received)
                t->headers_received(
                    static_cast<int>(parser.get().result_int()));

            bound = arm(lowest, ctx);
            co_await http::async_read(
                stream, m_buffer, parser,
                net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                close();
                co_return io_error(Error::Code::ReadFailure, ec, ctx, bound,
                                   "read response body");
            }
            lowest.expires_never();

            auto beast_res = parser.release();
            if (!beast_res.keep_alive()) close();

            co_return Result<Response>::ok(
                parse_beast_response(std::move(beast_res)));
        }

        /// @brief Apply the read timeout / request deadline to the next
        /// operation on `lowest`.
        std::optional<Expiry> arm(boost::beast::tcp_stream& lowest,
                                  const RequestContext& ctx) const {
            auto bound = expiry_for(ctx, m_read_timeout);
            if (bound)
                lowest.expires_at(bound->at);
            else
                lowest.expires_never();
            return bound;
        }

        static Error::Reason classify_io(const boost::system::error_code& ec,
                                         const RequestContext& ctx,
                                         const std::optional<Expiry>& bound) {
            if (ctx.cancellation().stop_requested())
                return Error::Reason::Cancelled;
            if (ec == boost::beast::error::timeout) {
                return (bound && bound->deadline_bound)
                           ? Error::Reason::Cancelled
                           : Error::Reason::Timeout;
            }
            if (ec == boost::beast::http::error::body_limit)
                return Error::Reason::BodyTooLarge;
            if (ec.category() ==
                boost::beast::http::make_error_code(
                    boost::beast::http::error::bad_version)
                    .category())
                return Error::Reason::Protocol;
            return Error::Reason::Network;
        }

        static bool peer_closed(const boost::system::error_code& ec) {
            return ec == boost::beast::http::error::end_of_stream ||
                   ec == boost::asio::error::eof ||
                   ec == boost::asio::error::connection_reset ||
                   ec == boost::asio::error::broken_pipe ||
                   ec == boost::asio::ssl::error::stream_truncated;
        }

        /// Cancelled before headers counts against the dial.
        static Error::Code before_headers_code(
            const boost::system::error_code& ec, const RequestContext& ctx,
            const std::optional<Expiry>& bound) {
            return classify_io(ec, ctx, bound) == Error::Reason::Cancelled
                       ? Error::Code::DialFailure
                       : Error::Code::TransportFailure;
        }

        static Result<Response> io_error(Error::Code code,
                                         const boost::system::error_code& ec,
                                         const RequestContext& ctx,
                                         const std::optional<Expiry>& bound,
                                         const std::string& what) {
            return Result<Response>::fail(code, classify_io(ec, ctx, bound),
                                          what + ": " + ec.message());
        }

        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context& m_ssl_ctx;

        Endpoint m_endpoint{};
        std::optional<std::chrono::milliseconds> m_read_timeout;
        std::size_t m_max_body_bytes;

        std::string m_dial_address;
        boost::beast::flat_buffer m_buffer{};

        Stream m_stream;
    };

}  // namespace pinfetch
