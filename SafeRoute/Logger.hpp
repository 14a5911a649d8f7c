#pragma once

// Logger.hpp — Boost.Log: консоль + файл с ротацией, каналы по подсистемам.
// Usage: LOGI("tunnel") << "up: " << ifname;

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/shared_ptr.hpp>

#include <cstddef>
#include <string>

namespace Logger
{
    using Severity      = boost::log::trivial::severity_level;
    using ChannelLogger = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;
    using ConsoleSink   = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    using FileSink      = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

    struct Options
    {
        std::string app_name       = "SafeRoute";
        std::string directory      = "logs";
        std::string base_filename  = "saferoute";
        Severity    file_min_severity    = boost::log::trivial::info;
        Severity    console_min_severity = boost::log::trivial::info;
        bool        enable_file    = true;
        std::size_t rotation_bytes = 10 * 1024 * 1024;
    };

    /// Process-wide logger; records carry "Channel" and "Severity".
    ChannelLogger &Get();

    /**
     * @brief RAII-установка синков. Пока Guard жив, записи идут в консоль и файл.
     */
    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        boost::shared_ptr<ConsoleSink> console_sink_;
        boost::shared_ptr<FileSink>    file_sink_;
    };
} // namespace Logger

#define SR_LOG_SEV(channel, level) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(channel), ::boost::log::trivial::level)

#define LOGT(channel) SR_LOG_SEV(channel, trace)
#define LOGD(channel) SR_LOG_SEV(channel, debug)
#define LOGI(channel) SR_LOG_SEV(channel, info)
#define LOGW(channel) SR_LOG_SEV(channel, warning)
#define LOGE(channel) SR_LOG_SEV(channel, error)
