// Logger.cpp — консоль + файл с ротацией + syslog, детерминированный shutdown.

#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/syslog_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

namespace
{
    namespace logging  = boost::log;
    namespace sinks    = boost::log::sinks;
    namespace expr     = boost::log::expressions;
    namespace trivial  = boost::log::trivial;
    namespace keywords = boost::log::keywords;

    // Синхронные sinks: процесс делает fork() для адаптера, фоновые потоки логгера там не нужны.
    using file_sink_t   = sinks::synchronous_sink<sinks::text_file_backend>;
    using cout_sink_t   = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using syslog_sink_t = sinks::synchronous_sink<sinks::syslog_backend>;

    /// @brief Форматтер: "TS [level] message". Тэг добавляется макросом в начало message.
    logging::formatter MakeFormatter()
    {
        return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                "%Y-%m-%d %H:%M:%S.%f")
            << " [" << trivial::severity << "] "
            << expr::smessage;
    }

    boost::shared_ptr<file_sink_t>   g_file_sink;
    boost::shared_ptr<cout_sink_t>   g_cout_sink;
    boost::shared_ptr<syslog_sink_t> g_syslog_sink;
}

namespace Logger
{
    Guard::Guard(const Options &opts)
        : opts_(opts)
    {
        auto core = logging::core::get();
        core->add_global_attribute("TimeStamp", logging::attributes::local_clock());
        core->set_filter(trivial::severity >= opts_.min_severity);

        if (opts_.enable_console)
        {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
            backend->auto_flush(true);

            g_cout_sink = boost::make_shared<cout_sink_t>(backend);
            g_cout_sink->set_formatter(MakeFormatter());
            core->add_sink(g_cout_sink);
        }

        if (!opts_.directory.empty())
        {
            EnableFile(opts_.directory);
        }
        if (opts_.enable_syslog)
        {
            EnableSyslog();
        }
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        core->flush();

        if (g_syslog_sink)
        {
            core->remove_sink(g_syslog_sink);
            g_syslog_sink.reset();
        }
        if (g_file_sink)
        {
            g_file_sink->flush();
            core->remove_sink(g_file_sink);
            g_file_sink.reset();
        }
        if (g_cout_sink)
        {
            core->remove_sink(g_cout_sink);
            g_cout_sink.reset();
        }
    }

    void Guard::SetMinSeverity(severity_t level)
    {
        opts_.min_severity = level;
        logging::core::get()->set_filter(trivial::severity >= level);
    }

    void Guard::EnableFile(const std::string &directory)
    {
        if (g_file_sink || directory.empty())
        {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            LOGW("logger") << "Cannot create log directory " << directory << ": " << ec.message();
            return;
        }
        opts_.directory = directory;

        auto backend = boost::make_shared<sinks::text_file_backend>(
            keywords::file_name     = directory + "/" + opts_.base_filename + "_%Y-%m-%d_%H-%M-%S.%N.log",
            keywords::rotation_size = opts_.rotation_size_bytes,
            keywords::open_mode     = std::ios_base::app
        );
        backend->set_file_collector(sinks::file::make_collector(
            keywords::target   = directory,
            keywords::max_size = opts_.max_total_size_bytes
        ));
        backend->scan_for_files();
        backend->auto_flush(true);

        g_file_sink = boost::make_shared<file_sink_t>(backend);
        g_file_sink->set_formatter(MakeFormatter());
        logging::core::get()->add_sink(g_file_sink);
    }

    void Guard::EnableSyslog()
    {
        if (g_syslog_sink)
        {
            return;
        }

        auto backend = boost::make_shared<sinks::syslog_backend>(
            keywords::facility = sinks::syslog::daemon,
            keywords::use_impl = sinks::syslog::native
        );

        sinks::syslog::custom_severity_mapping<severity_t> mapping("Severity");
        mapping[trivial::trace]   = sinks::syslog::debug;
        mapping[trivial::debug]   = sinks::syslog::debug;
        mapping[trivial::info]    = sinks::syslog::info;
        mapping[trivial::warning] = sinks::syslog::warning;
        mapping[trivial::error]   = sinks::syslog::error;
        mapping[trivial::fatal]   = sinks::syslog::critical;
        backend->set_severity_mapper(mapping);

        g_syslog_sink = boost::make_shared<syslog_sink_t>(backend);
        g_syslog_sink->set_formatter(expr::stream << opts_.app_name << ": " << expr::smessage);
        logging::core::get()->add_sink(g_syslog_sink);
        opts_.enable_syslog = true;
    }

    std::optional<severity_t> ParseSeverity(const std::string &name)
    {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

        if (s == "trace")                   return trivial::trace;
        if (s == "debug")                   return trivial::debug;
        if (s == "info")                    return trivial::info;
        if (s == "warning" || s == "warn")  return trivial::warning;
        if (s == "error")                   return trivial::error;
        if (s == "fatal")                   return trivial::fatal;
        return std::nullopt;
    }

    void FlushAll()
    {
        logging::core::get()->flush();
    }
}
