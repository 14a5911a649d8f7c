#include "SafeRoute/Logger.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace expr    = boost::log::expressions;
namespace sinks   = boost::log::sinks;

BOOST_LOG_ATTRIBUTE_KEYWORD(channel_kw, "Channel", std::string)

namespace
{
    auto MakeFormatter()
    {
        return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "]"
            << " [" << channel_kw << "] "
            << expr::smessage;
    }
}

namespace Logger
{
    ChannelLogger &Get()
    {
        static ChannelLogger logger(logging::keywords::channel = std::string("main"));
        return logger;
    }

    Guard::Guard(const Options &options)
    {
        auto core = logging::core::get();
        logging::add_common_attributes();
        core->add_global_attribute("App", logging::attributes::constant<std::string>(options.app_name));

        // консоль
        auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        console_backend->auto_flush(true);

        console_sink_ = boost::make_shared<ConsoleSink>(console_backend);
        console_sink_->set_formatter(MakeFormatter());
        console_sink_->set_filter(logging::trivial::severity >= options.console_min_severity);
        core->add_sink(console_sink_);

        if (!options.enable_file)
        {
            return;
        }

        // файл с ротацией по размеру и по суткам
        std::error_code ec;
        std::filesystem::create_directories(options.directory, ec);
        if (ec)
        {
            LOGW("log") << "Cannot create log directory " << options.directory
                        << ": " << ec.message() << " (file sink disabled)";
            return;
        }

        const std::string pattern = (std::filesystem::path(options.directory) /
                                     (options.base_filename + "_%Y%m%d_%N.log")).string();

        auto file_backend = boost::make_shared<sinks::text_file_backend>(
            logging::keywords::file_name           = pattern,
            logging::keywords::rotation_size       = options.rotation_bytes,
            logging::keywords::time_based_rotation = sinks::file::rotation_at_time_point(0, 0, 0),
            logging::keywords::open_mode           = std::ios_base::app);
        file_backend->auto_flush(true);

        file_sink_ = boost::make_shared<FileSink>(file_backend);
        file_sink_->set_formatter(MakeFormatter());
        file_sink_->set_filter(logging::trivial::severity >= options.file_min_severity);
        core->add_sink(file_sink_);

        LOGD("log") << "Logger ready: app=" << options.app_name << " dir=" << options.directory;
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        if (file_sink_)
        {
            core->remove_sink(file_sink_);
            file_sink_->flush();
            file_sink_.reset();
        }
        if (console_sink_)
        {
            core->remove_sink(console_sink_);
            console_sink_->flush();
            console_sink_.reset();
        }
    }
} // namespace Logger
