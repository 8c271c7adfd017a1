#pragma once

#include <atomic>
#include <cstdint>

namespace pinfetch {

    /// @brief Counters describing connection pool behaviour
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_in_use{0};  ///< Currently leased out
        std::atomic<std::size_t> total_idle{0};    ///< Currently idle

        // Counters (cumulative)
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_pruned{0};   ///< Idle TTL hit
        std::atomic<std::uint64_t> connection_dropped_unhealthy{
            0};  ///< Closed or failed on release
        std::atomic<std::uint64_t> connection_dropped_stale{
            0};  ///< Closed by the peer while idle
        std::atomic<std::uint64_t> connection_dropped_idle_limit{
            0};  ///< Per-endpoint idle limit reached
        std::atomic<std::uint64_t> connection_closed_idle{
            0};  ///< Closed by close_idle()
        std::atomic<std::uint64_t> release_invalid_id{
            0};  ///< Released unknown connection
    };

}  // namespace pinfetch
