#include "pinfetch/dialer.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/log/trivial.hpp>
#include <memory>

#include "pinfetch/connection/io_bounds.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace pinfetch {

    namespace {

        Result<DialResult> dial_error(Error::Reason reason,
                                      const std::string& address,
                                      const std::string& what) {
            return Result<DialResult>::fail(Error::Code::DialFailure, reason,
                                            "dial " + address + ": " + what);
        }

        /// Timeout and cancellation look alike at the socket level; tell
        /// them apart from the request's own state.
        Error::Reason classify(const boost::system::error_code& ec,
                               const RequestContext& ctx, bool timed_out,
                               const std::optional<Expiry>& bound) {
            if (ctx.cancellation().stop_requested())
                return Error::Reason::Cancelled;
            if (timed_out || ec == beast::error::timeout) {
                return (bound && bound->deadline_bound)
                           ? Error::Reason::Cancelled
                           : Error::Reason::Timeout;
            }
            if (ec == net::error::connection_refused)
                return Error::Reason::ConnectionRefused;
            return Error::Reason::Network;
        }

    }  // namespace

    std::string override_host(std::string_view a) {
        if (!a.empty() && a.front() == '[') {
            const auto close = a.find(']');
            if (close != std::string_view::npos)
                return std::string(a.substr(1, close - 1));
            return std::string(a);
        }
        // Exactly one ':' means host:port. More than one is a bare IPv6.
        const auto first = a.find(':');
        if (first != std::string_view::npos && first == a.rfind(':'))
            return std::string(a.substr(0, first));
        return std::string(a);
    }

    DialTarget dial_target_for(const RequestContext& ctx,
                               const Endpoint& logical) {
        if (const auto& ov = ctx.dial_override(); ov && !ov->empty())
            return DialTarget{override_host(*ov), logical.port};
        return DialTarget{logical.host, logical.port};
    }

    Dialer::Dialer(boost::asio::any_io_executor ex,
                   std::chrono::milliseconds connect_timeout)
        : m_ex(std::move(ex)), m_connect_timeout(connect_timeout) {}

    net::awaitable<Result<DialResult>> Dialer::dial(
        const RequestContext& ctx, const Endpoint& logical,
        beast::tcp_stream& stream) const {
        const DialTarget to = dial_target_for(ctx, logical);
        const std::string address = to.address();

        if (const RequestTrace* t = ctx.trace(); t && t->dial_start)
            t->dial_start(address);

        BOOST_LOG_TRIVIAL(debug)
            << "dial " << address << " for " << logical.address()
            << (ctx.dial_override() ? " (override)" : "");

        const std::optional<Expiry> bound =
            expiry_for(ctx, m_connect_timeout);
        if (ctx.cancellation().stop_requested() ||
            (bound && bound->at <= std::chrono::steady_clock::now())) {
            co_return dial_error(
                classify(beast::error::timeout, ctx, true, bound), address,
                "aborted before connecting");
        }

        boost::system::error_code ec;

        // The resolver has no built-in deadline; a timer cancels it instead.
        auto resolver = std::make_shared<tcp::resolver>(m_ex);
        auto timed_out = std::make_shared<bool>(false);
        net::steady_timer guard(m_ex);
        if (bound) {
            guard.expires_at(bound->at);
            guard.async_wait([weak = std::weak_ptr<tcp::resolver>(resolver),
                              timed_out](const boost::system::error_code& e) {
                if (e) return;
                *timed_out = true;
                if (auto r = weak.lock()) r->cancel();
            });
        }

        tcp::resolver::results_type results;
        {
            StopBinding on_stop(m_ex, ctx.cancellation(),
                                [resolver] { resolver->cancel(); });

            // Literal addresses never touch DNS.
            auto flags = tcp::resolver::numeric_service;
            if (is_ip_literal(to.host)) flags |= tcp::resolver::numeric_host;

            results = co_await resolver->async_resolve(
                to.host, to.port, flags,
                net::redirect_error(net::use_awaitable, ec));
        }
        guard.cancel();

        if (ec) {
            co_return dial_error(classify(ec, ctx, *timed_out, bound), address,
                                 "resolve: " + ec.message());
        }

        {
            StopBinding on_stop(m_ex, ctx.cancellation(),
                                [&stream] { stream.cancel(); });

            if (bound)
                stream.expires_at(bound->at);
            else
                stream.expires_never();

            co_await stream.async_connect(
                results, net::redirect_error(net::use_awaitable, ec));
        }
        stream.expires_never();

        if (ec) {
            const auto reason = classify(ec, ctx, false, bound);
            BOOST_LOG_TRIVIAL(debug)
                << "dial " << address << " failed: " << ec.message();
            co_return dial_error(reason, address, ec.message());
        }

        DialResult out;
        out.dial_address = address;
        boost::system::error_code ep_ec;
        out.remote = stream.socket().remote_endpoint(ep_ec);
        co_return Result<DialResult>::ok(std::move(out));
    }

}  // namespace pinfetch
