#pragma once

#include <boost/log/trivial.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include "request.hpp"
#include "request_context.hpp"
#include "response.hpp"
#include "result.hpp"

namespace pinfetch {

    /**
     * @brief Executes one prepared request and returns a drained response.
     *
     * Implementations must be safe to call from several threads at once.
     */
    class RoundTripper {
       public:
        virtual ~RoundTripper() = default;

        /**
         * @brief Perform the exchange described by `req` under `ctx`.
         * @param req Logical request. Its Host header and endpoint are fixed.
         * @param ctx Per-request dial override, cancellation, deadline, trace.
         */
        virtual Result<Response> round_trip(const PreparedRequest& req,
                                            const RequestContext& ctx) = 0;

        /// @brief Close pooled connections that are not in use.
        virtual void close_idle_connections() = 0;
    };

    /**
     * @brief Decorator that logs every request passing through it.
     *
     * Sits between the executor and the shared transport. Does not change
     * the request or the context.
     */
    class LoggingRoundTripper : public RoundTripper {
       public:
        explicit LoggingRoundTripper(std::shared_ptr<RoundTripper> base)
            : base_(std::move(base)) {
            if (!base_)
                throw std::invalid_argument(
                    "LoggingRoundTripper needs a base round tripper");
        }

        Result<Response> round_trip(const PreparedRequest& req,
                                    const RequestContext& ctx) override {
            const auto started = std::chrono::steady_clock::now();
            BOOST_LOG_TRIVIAL(info)
                << "GET " << (req.endpoint.https ? "https://" : "http://")
                << req.endpoint.address() << req.beast_req.target()
                << (ctx.dial_override() ? " via " + *ctx.dial_override()
                                        : std::string());

            auto res = base_->round_trip(req, ctx);

            const auto ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started)
                    .count();
            if (auto* r = res.value_ptr()) {
                BOOST_LOG_TRIVIAL(info)
                    << r->status() << " from " << r->dial_address << " in "
                    << ms << "ms" << (r->reused_connection ? " (reused)" : "")
                    << ", " << r->body.size() << " bytes";
            } else {
                BOOST_LOG_TRIVIAL(warning)
                    << "request to " << req.endpoint.address() << " failed in "
                    << ms << "ms: " << describe(res.error());
            }
            return res;
        }

        void close_idle_connections() override {
            BOOST_LOG_TRIVIAL(debug) << "closing idle connections";
            base_->close_idle_connections();
        }

       private:
        std::shared_ptr<RoundTripper> base_;
    };

}  // namespace pinfetch
