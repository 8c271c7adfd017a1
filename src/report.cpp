#include "pinfetch/report.hpp"

#include <ostream>

namespace pinfetch {

    void write_report(std::ostream& out, const FetchResult& result) {
        out << "Status: " << result.status << '\n';
        out << "Protocol: " << result.protocol << '\n';
        out << "Headers:\n";
        // HeaderMap is ordered, so names come out sorted.
        for (const auto& [name, values] : result.headers) {
            for (const auto& value : values) {
                out << "  " << name << ": " << value << '\n';
            }
        }
        out << "Body length: " << result.body_size << " bytes\n";
    }

    void write_diagnostic(std::ostream& out, const Error& error) {
        switch (error.code) {
            case Error::Code::InvalidUrl:
                out << "invalid URL";
                break;
            case Error::Code::MissingHost:
                out << "URL has no host";
                break;
            case Error::Code::UnknownScheme:
                out << "unknown scheme and no port";
                break;
            case Error::Code::RequestBuildFailed:
                out << "cannot build request";
                break;
            case Error::Code::DialFailure:
                out << "dial failure";
                break;
            case Error::Code::TransportFailure:
                out << "transport failure";
                break;
            case Error::Code::ReadFailure:
                out << "failed to read body";
                break;
        }
        if (error.reason != Error::Reason::None)
            out << " (" << to_string(error.reason) << ')';
        out << ": " << error.message << '\n';
    }

    int exit_code_for(const Error& error) {
        if (is_input_error(error.code)) return 1;
        switch (error.code) {
            case Error::Code::RequestBuildFailed:
                return 2;
            case Error::Code::DialFailure:
            case Error::Code::TransportFailure:
                return 3;
            case Error::Code::ReadFailure:
                return 4;
            default:
                return 1;
        }
    }

}  // namespace pinfetch
