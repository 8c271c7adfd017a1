#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

#include "pinfetch/request_context.hpp"

namespace pinfetch {

    /// @brief When an I/O phase must give up, and why.
    struct Expiry {
        std::chrono::steady_clock::time_point at;
        /// True when the request deadline, not the phase timeout, is the
        /// tighter bound. Expiry then counts as cancellation.
        bool deadline_bound{false};
    };

    /// @brief Tighter of `phase_timeout` from now and the context deadline.
    /// @return nullopt when neither bound applies.
    inline std::optional<Expiry> expiry_for(
        const RequestContext& ctx,
        std::optional<std::chrono::milliseconds> phase_timeout) {
        const auto now = std::chrono::steady_clock::now();
        std::optional<Expiry> out;
        if (phase_timeout) out = Expiry{now + *phase_timeout, false};
        if (const auto& dl = ctx.deadline(); dl && (!out || *dl <= out->at))
            out = Expiry{*dl, true};
        return out;
    }

    /**
     * @brief Aborts a request's pending I/O when its stop token fires.
     *
     * The stop callback may run on any thread, so it only posts `on_stop` to
     * the transport's executor. Destruction disarms the posted handler too;
     * both run on the executor's single thread, so a late abort never
     * touches a stream the request no longer owns.
     */
    class StopBinding {
       public:
        StopBinding(boost::asio::any_io_executor ex, std::stop_token token,
                    std::function<void()> on_stop)
            : slot_(std::make_shared<std::function<void()>>(
                  std::move(on_stop))),
              callback_(std::move(token), Poster{std::move(ex), slot_}) {}

        StopBinding(const StopBinding&) = delete;
        StopBinding& operator=(const StopBinding&) = delete;

        ~StopBinding() { *slot_ = nullptr; }

       private:
        using Slot = std::shared_ptr<std::function<void()>>;

        struct Poster {
            boost::asio::any_io_executor ex;
            Slot slot;

            void operator()() const {
                boost::asio::post(ex, [slot = slot] {
                    if (*slot) (*slot)();
                });
            }
        };

        Slot slot_;
        std::stop_callback<Poster> callback_;
    };

}  // namespace pinfetch
