#include "pinfetch/transport.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/log/trivial.hpp>
#include <exception>
#include <future>
#include <memory>

namespace net = boost::asio;

namespace pinfetch {

    Transport::Transport(TransportConfiguration cfg)
        : cfg_(std::move(cfg)),
          ssl_ctx_(net::ssl::context::tls_client),
          dialer_(io_.get_executor(), cfg_.connect_timeout),
          pool_(io_.get_executor(), ssl_ctx_, cfg_),
          work_(net::make_work_guard(io_)) {
        init_tls_on_ssl_context(ssl_ctx_, cfg_);

        thread_ = std::thread([this] { io_.run(); });
        BOOST_LOG_TRIVIAL(debug)
            << "transport started, connect timeout "
            << cfg_.connect_timeout.count() << "ms, "
            << cfg_.max_idle_per_endpoint << " idle per endpoint";
    }

    Transport::~Transport() {
        // Pool teardown runs on the I/O thread so it never races a request.
        net::post(io_, [this] { pool_.shutdown(); });
        work_.reset();
        if (thread_.joinable()) thread_.join();
        BOOST_LOG_TRIVIAL(debug) << "transport stopped";
    }

    net::awaitable<Result<Response>> Transport::async_round_trip(
        PreparedRequest req, RequestContext ctx) {
        req.endpoint.normalize_default_port();
        req.endpoint.normalize_host();
        if (req.beast_req.find(boost::beast::http::field::user_agent) ==
            req.beast_req.end())
            req.beast_req.set(boost::beast::http::field::user_agent,
                              cfg_.user_agent);

        if (ctx.done()) {
            co_return Result<Response>::fail(Error::Code::DialFailure,
                                             Error::Reason::Cancelled,
                                             "request cancelled before dialing");
        }

        auto lease = pool_.acquire(req.endpoint);
        if (!lease || !*lease) {
            co_return Result<Response>::fail(Error::Code::DialFailure,
                                             Error::Reason::Network,
                                             "transport is shut down");
        }

        // The lease goes back to the pool (or is dropped) when this frame ends.
        co_return co_await (*lease)->round_trip(req, ctx, dialer_);
    }

    Result<Response> Transport::round_trip(const PreparedRequest& req,
                                           const RequestContext& ctx) {
        if (io_.get_executor().running_in_this_thread()) {
            return Result<Response>::fail(
                Error::Code::TransportFailure, Error::Reason::Network,
                "blocking round_trip called from the transport's own thread");
        }

        auto done = std::make_shared<std::promise<Result<Response>>>();
        auto fut = done->get_future();

        net::co_spawn(
            io_,
            [this, req, ctx, done]() -> net::awaitable<void> {
                auto res = co_await async_round_trip(req, ctx);
                done->set_value(std::move(res));
            },
            [done](std::exception_ptr e) {
                if (e) done->set_exception(e);
            });

        return fut.get();
    }

    void Transport::close_idle_connections() {
        if (io_.get_executor().running_in_this_thread()) {
            pool_.close_idle();
            return;
        }
        std::promise<void> done;
        auto fut = done.get_future();
        net::post(io_, [this, &done] {
            pool_.close_idle();
            done.set_value();
        });
        fut.get();
    }

}  // namespace pinfetch
