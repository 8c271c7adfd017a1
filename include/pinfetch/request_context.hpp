#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace pinfetch {

    /**
     * @brief Observation hooks fired by the transport while a request runs.
     *
     * Hooks run on the transport's I/O thread and must not block. Any hook
     * may be left empty.
     */
    struct RequestTrace {
        /// A new connection is about to be dialed to this physical address.
        std::function<void(std::string_view dial_address)> dial_start;
        /// A connection is ready. For reused connections `dial_address` is
        /// the address the connection was originally dialed to.
        std::function<void(std::string_view dial_address, bool reused)>
            connected;
        /// The status line and headers have been parsed.
        std::function<void(int status_code)> headers_received;
    };

    /**
     * @brief Immutable per-request execution context.
     *
     * Carries what the low-level dialer needs but the request itself must not
     * expose: the optional dial override, the cancellation token, an absolute
     * deadline and trace hooks. Each `with_*` call returns a new context and
     * leaves the original untouched, so two requests sharing a transport can
     * never observe each other's values.
     */
    class RequestContext {
       public:
        using clock = std::chrono::steady_clock;

        RequestContext() = default;

        /// @brief Attach a literal dial address (bare host or IP, no port).
        /// @note Not validated here; a bad address fails when dialing.
        [[nodiscard]] RequestContext with_dial_override(
            std::string address) const {
            RequestContext out(*this);
            out.m_dial_override = std::move(address);
            return out;
        }

        /// @brief The attached dial override, if any.
        [[nodiscard]] const std::optional<std::string>& dial_override()
            const noexcept {
            return m_dial_override;
        }

        /// @brief Attach the token whose stop request aborts the request.
        [[nodiscard]] RequestContext with_cancellation(
            std::stop_token token) const {
            RequestContext out(*this);
            out.m_cancel = std::move(token);
            return out;
        }

        [[nodiscard]] const std::stop_token& cancellation() const noexcept {
            return m_cancel;
        }

        [[nodiscard]] RequestContext with_deadline(
            clock::time_point deadline) const {
            RequestContext out(*this);
            out.m_deadline = deadline;
            return out;
        }

        [[nodiscard]] const std::optional<clock::time_point>& deadline()
            const noexcept {
            return m_deadline;
        }

        [[nodiscard]] RequestContext with_trace(RequestTrace trace) const {
            RequestContext out(*this);
            out.m_trace = std::make_shared<const RequestTrace>(std::move(trace));
            return out;
        }

        [[nodiscard]] const RequestTrace* trace() const noexcept {
            return m_trace.get();
        }

        /// @brief True once the token fired or the deadline passed.
        [[nodiscard]] bool done() const {
            return m_cancel.stop_requested() ||
                   (m_deadline && clock::now() >= *m_deadline);
        }

       private:
        std::optional<std::string> m_dial_override;
        std::stop_token m_cancel;
        std::optional<clock::time_point> m_deadline;
        std::shared_ptr<const RequestTrace> m_trace;
    };

}  // namespace pinfetch
