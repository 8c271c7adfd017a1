#pragma once

#include <iosfwd>

#include "pinfetch/error.hpp"
#include "pinfetch/fetch.hpp"

namespace pinfetch {

    /**
     * @brief Print a fetch outcome in the command-line report format:
     *
     *     Status: 200 OK
     *     Protocol: HTTP/1.1
     *     Headers:
     *       Content-Type: text/plain
     *     Body length: 5 bytes
     *
     * Header names are printed sorted, one line per value.
     */
    void write_report(std::ostream& out, const FetchResult& result);

    /// @brief One-line diagnostic for a failed fetch, e.g.
    /// "dial failure (timeout): dial 10.0.0.1:443: ...".
    void write_diagnostic(std::ostream& out, const Error& error);

    /// @brief Process exit status for a failure class: 1 for bad input,
    /// 2 when the request can't be built, 3 for dial and transport
    /// failures, 4 when reading the body fails.
    int exit_code_for(const Error& error);

}  // namespace pinfetch
