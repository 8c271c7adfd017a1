#include "pinfetch/logging.hpp"

#include <array>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace pinfetch {

    namespace {

        constexpr std::array<const char*, 5> level_name = {
            "debug", "info", "warning", "error", "critical",
        };

        boost::log::trivial::severity_level to_severity(log_level_t l) {
            namespace trivial = boost::log::trivial;
            switch (l) {
                case log_level_t::debug:
                    return trivial::debug;
                case log_level_t::info:
                    return trivial::info;
                case log_level_t::warning:
                    return trivial::warning;
                case log_level_t::error:
                    return trivial::error;
                case log_level_t::critical:
                    return trivial::fatal;
            }
            return trivial::warning;
        }

    }  // namespace

    std::ostream& operator<<(std::ostream& o, const log_level_t& l) {
        return o << level_name[static_cast<std::size_t>(l)];
    }

    std::istream& operator>>(std::istream& in, log_level_t& l) {
        std::string tmp;
        if (!(in >> tmp)) return in;
        for (std::size_t i = 0; i < level_name.size(); ++i) {
            if (tmp == std::string_view(level_name[i])) {
                l = static_cast<log_level_t>(i);
                return in;
            }
        }
        in.setstate(std::ios::failbit);
        return in;
    }

    void init_logging(log_level_t level,
                      const std::optional<std::string>& log_file) {
        namespace logging = boost::log;
        namespace sinks = boost::log::sinks;
        namespace expr = boost::log::expressions;
        using backend_t = sinks::text_ostream_backend;

        auto backend = boost::make_shared<backend_t>();
        if (log_file) {
            auto file = boost::make_shared<std::ofstream>(*log_file,
                                                          std::ios::app);
            if (!*file)
                throw std::runtime_error("cannot open log file " + *log_file);
            backend->add_stream(file);
            backend->auto_flush(true);
        } else {
            backend->add_stream(
                boost::shared_ptr<std::ostream>(&std::clog,
                                                boost::null_deleter()));
        }

        auto sink = boost::make_shared<sinks::synchronous_sink<backend_t>>(
            backend);
        sink->set_formatter(
            expr::stream
            << expr::format_date_time<boost::posix_time::ptime>(
                   "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "] "
            << expr::smessage);

        auto core = logging::core::get();
        core->remove_all_sinks();
        core->add_sink(sink);
        core->set_filter(logging::trivial::severity >= to_severity(level));
        logging::add_common_attributes();
    }

}  // namespace pinfetch
