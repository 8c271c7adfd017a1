#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include "pinfetch/config.hpp"
#include "pinfetch/connection/connection.hpp"
#include "pinfetch/connection/connection_pool_types.hpp"
#include "pinfetch/endpoint.hpp"

namespace pinfetch {

    /**
     * Thread-safe pool of HTTP/HTTPS connections keyed by logical endpoint.
     *
     * KEYING:
     * - Buckets are keyed by {https, host, port} of the URL, never by the
     *   dial address. A request for the same logical endpoint may reuse a
     *   connection dialed under another request's override; TLS identity
     *   was checked against the logical host either way.
     *
     * INVARIANTS:
     * 1. A connection is either idle or leased, never both
     * 2. A leased connection belongs to exactly one in-flight request
     * 3. Only open connections are put back on the idle list
     * 4. An idle connection seen closed by the peer is dropped at checkout
     *
     * LIFECYCLE:
     * 1. Construction: pool is alive
     * 2. acquire() hands out Leases, Lease destruction releases
     * 3. shutdown() (or destruction): Leases become inert, idle connections
     *    are closed
     */
    class ConnectionPool {
       public:
        using Conn = Connection;

        /// @brief Exclusive handle on a pooled connection. Returns it to the
        /// pool on destruction.
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            Conn* operator->() const noexcept { return get(); }

            Conn& operator*() const { return *get(); }

            /// @brief The underlying connection, or nullptr if inert
            Conn* get() const noexcept {
                auto st = state_.lock();
                if (!st || !st->alive.load(std::memory_order_acquire))
                    return nullptr;
                return conn_;
            }

            explicit operator bool() const noexcept { return get() != nullptr; }

            Endpoint const& endpoint() const noexcept { return endpoint_; }

            std::uint64_t id() const noexcept { return id_; }

           private:
            friend class ConnectionPool;

            /// @brief Shared with the pool to detect shutdown
            struct State {
                std::atomic<bool> alive{true};
            };

            Lease(std::weak_ptr<State> st, Conn* c, Endpoint ep,
                  std::uint64_t id,
                  std::function<void(Endpoint const&, std::uint64_t)> ret)
                : state_(std::move(st)),
                  conn_(c),
                  endpoint_(std::move(ep)),
                  id_(id),
                  return_to_pool_(std::move(ret)) {}

            void reset() noexcept {
                auto st = state_.lock();
                if (!conn_) return;

                // Pool already gone: don't call back into it.
                if (!st || !st->alive.load(std::memory_order_acquire)) {
                    conn_ = nullptr;
                    return;
                }
                if (return_to_pool_) return_to_pool_(endpoint_, id_);
                conn_ = nullptr;
            }

            void move_from(Lease&& other) noexcept {
                state_ = std::move(other.state_);
                conn_ = other.conn_;
                endpoint_ = std::move(other.endpoint_);
                id_ = other.id_;
                return_to_pool_ = std::move(other.return_to_pool_);
                other.conn_ = nullptr;
                other.id_ = 0;
            }

            std::weak_ptr<State> state_;
            Conn* conn_{nullptr};
            Endpoint endpoint_{};
            std::uint64_t id_{0};
            std::function<void(Endpoint const&, std::uint64_t)> return_to_pool_;
        };

        ConnectionPool(boost::asio::any_io_executor ex,
                       boost::asio::ssl::context& ssl_ctx,
                       TransportConfiguration cfg)
            : ex_(std::move(ex)),
              ssl_ctx_(ssl_ctx),
              cfg_(std::move(cfg)),
              state_(std::make_shared<typename Lease::State>()) {}

        ~ConnectionPool() { shutdown(); }

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /// @brief Lease an idle connection for `ep`, or a fresh unconnected
        /// one. Returns nullopt only after shutdown().
        std::optional<Lease> acquire(Endpoint ep) {
            normalize_(ep);
            std::lock_guard<std::mutex> lk(mu_);
            if (!state_->alive.load(std::memory_order_acquire))
                return std::nullopt;

            auto now = std::chrono::steady_clock::now();
            prune_idle_locked_(now);

            auto& b = buckets_[ep];

            while (!b.idle.empty()) {
                IdleEntry entry = std::move(b.idle.back());
                b.idle.pop_back();
                metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);

                if (!entry.conn || !entry.conn->is_healthy()) {
                    metrics_.connection_dropped_unhealthy.fetch_add(
                        1, std::memory_order_relaxed);
                    continue;
                }
                if (!entry.conn->is_reusable()) {
                    entry.conn->close();
                    metrics_.connection_dropped_stale.fetch_add(
                        1, std::memory_order_relaxed);
                    continue;
                }

                metrics_.connection_reused.fetch_add(1,
                                                     std::memory_order_relaxed);
                return lease_locked_(b, ep, std::move(entry.conn));
            }

            metrics_.connection_created.fetch_add(1, std::memory_order_relaxed);
            return lease_locked_(b, ep,
                                 std::make_unique<Conn>(ex_, ssl_ctx_, ep, cfg_));
        }

        /// @brief Close every idle connection. Leased ones are untouched.
        void close_idle() {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [_, bucket] : buckets_) {
                for (auto& e : bucket.idle) {
                    if (e.conn) e.conn->close();
                    metrics_.connection_closed_idle.fetch_add(
                        1, std::memory_order_relaxed);
                }
                metrics_.total_idle.fetch_sub(bucket.idle.size(),
                                              std::memory_order_relaxed);
                bucket.idle.clear();
            }
        }

        /// @brief Make outstanding Leases inert, close idle connections and
        /// abort I/O on leased ones.
        /// @note Leased connections stay allocated until the pool is destroyed
        /// since their requests may still be unwinding.
        void shutdown() {
            if (!state_->alive.exchange(false, std::memory_order_acq_rel))
                return;
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [_, bucket] : buckets_) {
                for (auto& e : bucket.idle) {
                    if (e.conn) e.conn->close();
                }
                metrics_.total_idle.fetch_sub(bucket.idle.size(),
                                              std::memory_order_relaxed);
                bucket.idle.clear();
                for (auto& [__, up] : bucket.in_use) {
                    if (up) up->cancel_io();
                }
            }
        }

        /// @brief Idle connections currently held for `ep`.
        std::size_t idle_count(Endpoint ep) const {
            normalize_(ep);
            std::lock_guard<std::mutex> lk(mu_);
            auto it = buckets_.find(ep);
            return it == buckets_.end() ? 0 : it->second.idle.size();
        }

        ConnectionPoolMetrics const& metrics() const { return metrics_; }

       private:
        struct IdleEntry {
            std::unique_ptr<Conn> conn;
            std::chrono::steady_clock::time_point last_used;
        };

        struct Bucket {
            std::deque<IdleEntry> idle;  ///< Oldest first
            std::unordered_map<std::uint64_t, std::unique_ptr<Conn>> in_use;
        };

        static void normalize_(Endpoint& ep) {
            ep.normalize_default_port();
            ep.normalize_host();
        }

        Lease lease_locked_(Bucket& b, Endpoint const& ep,
                            std::unique_ptr<Conn> conn) {
            Conn* raw = conn.get();
            auto id = next_id_++;
            b.in_use.emplace(id, std::move(conn));
            metrics_.total_in_use.fetch_add(1, std::memory_order_relaxed);
            return Lease(state_, raw, ep, id,
                         [this](Endpoint const& e, std::uint64_t id_) {
                             release(e, id_);
                         });
        }

        void prune_idle_locked_(std::chrono::steady_clock::time_point now) {
            if (cfg_.connection_idle_ttl.count() <= 0) return;

            for (auto& [_, b] : buckets_) {
                while (!b.idle.empty()) {
                    auto const& front = b.idle.front();
                    if (now - front.last_used < cfg_.connection_idle_ttl) break;
                    if (front.conn) front.conn->close();
                    b.idle.pop_front();
                    metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);
                    metrics_.connection_pruned.fetch_add(
                        1, std::memory_order_relaxed);
                }
            }
        }

        void release(Endpoint const& ep, std::uint64_t id) noexcept {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = buckets_.find(ep);
            if (it == buckets_.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto& b = it->second;
            auto it2 = b.in_use.find(id);
            if (it2 == b.in_use.end()) {
                metrics_.release_invalid_id.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            auto up = std::move(it2->second);
            b.in_use.erase(it2);
            metrics_.total_in_use.fetch_sub(1, std::memory_order_relaxed);

            // Failed exchanges close their connection; those are dropped here.
            if (!up || !up->is_healthy()) {
                metrics_.connection_dropped_unhealthy.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            if (b.idle.size() >= cfg_.max_idle_per_endpoint) {
                up->close();
                metrics_.connection_dropped_idle_limit.fetch_add(
                    1, std::memory_order_relaxed);
                return;
            }

            b.idle.push_back(
                IdleEntry{std::move(up), std::chrono::steady_clock::now()});
            metrics_.total_idle.fetch_add(1, std::memory_order_relaxed);
        }

        boost::asio::any_io_executor ex_;     ///< Executor for connections
        boost::asio::ssl::context& ssl_ctx_;  ///< SSL context for HTTPS
        TransportConfiguration cfg_;

        mutable std::mutex mu_;
        std::unordered_map<Endpoint, Bucket> buckets_;
        std::uint64_t next_id_{1};

        std::shared_ptr<typename Lease::State> state_;
        ConnectionPoolMetrics metrics_;
    };

}  // namespace pinfetch
