#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace pinfetch {

    /// @brief Minimum severity written to the log.
    enum class log_level_t : std::uint8_t {
        debug,
        info,
        warning,
        error,
        critical,
    };

    /// Parsed and printed by name ("debug", "info", ...) so the level can be
    /// given on the command line.
    std::ostream& operator<<(std::ostream& o, const log_level_t& l);
    std::istream& operator>>(std::istream& in, log_level_t& l);

    /**
     * @brief Configure the process-wide Boost.Log core.
     * @param level Records below this severity are dropped.
     * @param log_file Append to this file instead of writing to stderr.
     * @throws std::runtime_error if the log file cannot be opened.
     */
    void init_logging(log_level_t level,
                      const std::optional<std::string>& log_file = {});

}  // namespace pinfetch
