#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "pinfetch/config.hpp"
#include "pinfetch/fetch.hpp"
#include "pinfetch/logging.hpp"
#include "pinfetch/report.hpp"
#include "pinfetch/round_tripper.hpp"
#include "pinfetch/transport.hpp"

namespace {

    constexpr auto usage = "Usage: pinfetch [options] <url> [address]\n";
    constexpr auto about =
        "Fetch <url> once. When [address] is given, connect to it instead of "
        "the URL host,\nwhile the Host header and TLS verification still use "
        "the URL host.\n";

    /// "Name: value" -> {Name, value}
    bool split_header(const std::string& line, std::string& name,
                      std::string& value) {
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        name = line.substr(0, colon);
        auto first = line.find_first_not_of(" \t", colon + 1);
        value = first == std::string::npos ? std::string() : line.substr(first);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            value.pop_back();
        return true;
    }

}  // namespace

int main(int argc, char* argv[]) {
    namespace po = boost::program_options;
    using pinfetch::log_level_t;

    std::string url;
    std::string address;
    std::uint32_t connect_timeout_ms{500};
    std::uint32_t read_timeout_ms{0};
    std::uint32_t max_time_ms{0};
    std::string ca_file;
    std::vector<std::string> header_lines;
    bool keep_idle{false};
    log_level_t log_level{log_level_t::warning};
    std::string log_file;

    po::options_description opts("Options");
    // clang-format off
    opts.add_options()
        ("help,h", "print this message and exit")
        ("connect-timeout", po::value(&connect_timeout_ms)
             ->default_value(connect_timeout_ms), "connect timeout in ms")
        ("read-timeout", po::value(&read_timeout_ms),
             "per read/write timeout in ms (default: none)")
        ("max-time", po::value(&max_time_ms),
             "deadline for the whole fetch in ms (default: none)")
        ("ca-file", po::value(&ca_file), "extra trusted CA certificates (PEM)")
        ("header,H", po::value(&header_lines)->composing(),
             "extra request header \"Name: value\", repeatable")
        ("keep-idle", po::bool_switch(&keep_idle),
             "do not close idle connections after the fetch")
        ("log-level,v", po::value(&log_level)->default_value(log_level),
             "{debug, info, warning, error, critical}")
        ("log-file,l", po::value(&log_file)->default_value("", "stderr"),
             "log file name")
        ;
    // clang-format on

    po::options_description positional_opts;
    // clang-format off
    positional_opts.add_options()
        ("url", po::value(&url)->required())
        ("address", po::value(&address))
        ;
    // clang-format on

    po::options_description all;
    all.add(opts).add(positional_opts);
    po::positional_options_description pos;
    pos.add("url", 1).add("address", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(pos)
                      .run(),
                  vm);
        if (vm.count("help")) {
            std::cout << usage << about << '\n' << opts;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "pinfetch: " << e.what() << '\n' << usage;
        return 1;
    }

    pinfetch::TransportConfiguration transport_cfg;
    transport_cfg.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
    if (vm.count("read-timeout"))
        transport_cfg.read_timeout = std::chrono::milliseconds(read_timeout_ms);
    if (!ca_file.empty()) transport_cfg.ca_file = ca_file;

    pinfetch::FetchConfiguration fetch_cfg;
    fetch_cfg.close_idle_after_fetch = !keep_idle;
    for (const auto& line : header_lines) {
        std::string name, value;
        if (!split_header(line, name, value)) {
            std::cerr << "pinfetch: malformed header \"" << line
                      << "\", expected \"Name: value\"\n"
                      << usage;
            return 1;
        }
        fetch_cfg.headers[name] = value;
    }

    try {
        pinfetch::init_logging(
            log_level, log_file.empty() ? std::nullopt
                                        : std::optional<std::string>(log_file));
    } catch (const std::exception& e) {
        std::cerr << "pinfetch: " << e.what() << '\n';
        return 1;
    }

    std::shared_ptr<pinfetch::Transport> transport;
    try {
        transport = std::make_shared<pinfetch::Transport>(transport_cfg);
    } catch (const std::exception& e) {
        std::cerr << "pinfetch: " << e.what() << '\n';
        return 1;
    }
    pinfetch::LoggingRoundTripper round_tripper(transport);
    pinfetch::FetchExecutor executor(round_tripper, fetch_cfg);

    std::stop_source cancel;
    // Lives on the transport's thread; only touched there after this.
    boost::asio::signal_set signals(transport->executor(), SIGINT, SIGTERM);
    signals.async_wait(
        [cancel](const boost::system::error_code& ec, int signo) mutable {
            if (ec) return;
            BOOST_LOG_TRIVIAL(warning) << "signal " << signo << ", cancelling";
            cancel.request_stop();
        });
    auto stop_signals = [&] {
        std::promise<void> done;
        boost::asio::post(transport->executor(), [&] {
            boost::system::error_code ec;
            signals.cancel(ec);
            done.set_value();
        });
        done.get_future().wait();
    };

    pinfetch::FetchRequest request;
    request.url = url;
    if (!address.empty()) request.dial_override = address;
    request.cancel = cancel.get_token();
    if (vm.count("max-time")) {
        request.deadline = std::chrono::steady_clock::now() +
                           std::chrono::milliseconds(max_time_ms);
    }

    BOOST_LOG_TRIVIAL(info) << "fetching " << url
                            << (address.empty() ? "" : " via " + address);

    auto res = executor.fetch(request);
    stop_signals();
    if (res.has_error()) {
        pinfetch::write_diagnostic(std::cerr, res.error());
        return pinfetch::exit_code_for(res.error());
    }

    pinfetch::write_report(std::cout, res.value());
    return 0;
}
