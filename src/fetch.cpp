#include "pinfetch/fetch.hpp"

#include <atomic>
#include <boost/log/trivial.hpp>
#include <exception>
#include <memory>

#include "pinfetch/request.hpp"
#include "pinfetch/request_context.hpp"
#include "pinfetch/target.hpp"

namespace pinfetch {

    const char* to_string(FetchState state) {
        switch (state) {
            case FetchState::Unstarted:
                return "Unstarted";
            case FetchState::Resolving:
                return "Resolving";
            case FetchState::Dialing:
                return "Dialing";
            case FetchState::AwaitingHeaders:
                return "AwaitingHeaders";
            case FetchState::ReadingBody:
                return "ReadingBody";
            case FetchState::Done:
                return "Done";
            case FetchState::Failed:
                return "Failed";
        }
        return "Unknown";
    }

    namespace {

        /// Tracks the current state and forwards changes to the observer.
        /// Shared with the trace hooks, which fire on the I/O thread.
        class StateTracker {
           public:
            explicit StateTracker(const FetchExecutor::Observer& observer)
                : observer_(observer) {}

            void enter(FetchState s) {
                const FetchState prev = state_.exchange(s);
                if (prev == s) return;
                BOOST_LOG_TRIVIAL(debug)
                    << "fetch " << to_string(prev) << " -> " << to_string(s);
                if (observer_) observer_(s);
            }

            FetchState current() const { return state_.load(); }

           private:
            const FetchExecutor::Observer& observer_;
            std::atomic<FetchState> state_{FetchState::Unstarted};
        };

        /// Closes the transport's idle connections when the fetch ends.
        class IdleCloser {
           public:
            IdleCloser(RoundTripper& transport, bool enabled)
                : transport_(transport), enabled_(enabled) {}

            IdleCloser(const IdleCloser&) = delete;
            IdleCloser& operator=(const IdleCloser&) = delete;

            ~IdleCloser() {
                if (!enabled_) return;
                try {
                    transport_.close_idle_connections();
                } catch (const std::exception& e) {
                    BOOST_LOG_TRIVIAL(warning)
                        << "closing idle connections failed: " << e.what();
                }
            }

           private:
            RoundTripper& transport_;
            bool enabled_;
        };

    }  // namespace

    FetchExecutor::FetchExecutor(RoundTripper& transport,
                                 FetchConfiguration cfg)
        : transport_(transport), cfg_(std::move(cfg)) {}

    Result<FetchResult> FetchExecutor::fetch(const FetchRequest& request,
                                             const Observer& observer) const {
        auto tracker = std::make_shared<StateTracker>(observer);
        auto failed = [&](const Error& e) {
            BOOST_LOG_TRIVIAL(debug)
                << "fetch failed while " << to_string(tracker->current())
                << ": " << describe(e);
            tracker->enter(FetchState::Failed);
            return Result<FetchResult>::err(e);
        };

        tracker->enter(FetchState::Resolving);
        auto target = resolve_target(request.url);
        if (target.has_error()) return failed(target.error());

        auto prepared = prepare_get(target.value(), {}, cfg_.headers);
        if (prepared.has_error()) return failed(prepared.error());

        RequestContext ctx = RequestContext{}.with_cancellation(request.cancel);
        if (request.dial_override && !request.dial_override->empty())
            ctx = ctx.with_dial_override(*request.dial_override);
        if (request.deadline) ctx = ctx.with_deadline(*request.deadline);

        RequestTrace trace;
        trace.dial_start = [](std::string_view address) {
            BOOST_LOG_TRIVIAL(debug) << "dialing " << address;
        };
        trace.connected = [tracker](std::string_view address, bool reused) {
            BOOST_LOG_TRIVIAL(debug) << (reused ? "reusing " : "connected to ")
                                     << address;
            tracker->enter(FetchState::AwaitingHeaders);
        };
        trace.headers_received = [tracker](int status) {
            BOOST_LOG_TRIVIAL(debug) << "headers received, status " << status;
            tracker->enter(FetchState::ReadingBody);
        };
        ctx = ctx.with_trace(std::move(trace));

        IdleCloser closer(transport_, cfg_.close_idle_after_fetch);

        tracker->enter(FetchState::Dialing);
        auto res = transport_.round_trip(prepared.value(), ctx);
        if (res.has_error()) return failed(res.error());

        Response& r = res.value();
        FetchResult out;
        out.status = r.status();
        out.status_code = r.status_code;
        out.protocol = r.protocol();
        out.headers = std::move(r.headers);
        out.body_size = r.body.size();
        out.body = std::move(r.body);
        out.dial_address = std::move(r.dial_address);
        out.reused_connection = r.reused_connection;

        tracker->enter(FetchState::Done);
        return Result<FetchResult>::ok(std::move(out));
    }

}  // namespace pinfetch
