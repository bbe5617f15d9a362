#include "Mylogger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <iostream>
#include <mutex>

namespace logging = boost::log;
namespace keywords = boost::log::keywords;

namespace
{
    std::once_flag g_init_flag;

    logging::trivial::severity_level parse_level(const std::string &level)
    {
        logging::trivial::severity_level parsed = logging::trivial::info;
        if (!logging::trivial::from_string(level.c_str(), level.size(), parsed))
        {
            std::cerr << "Unknown log level '" << level << "', using info" << std::endl;
            return logging::trivial::info;
        }
        return parsed;
    }
}

MyLogger::MyLogger(const std::string &channel)
    : channel_(channel),
      logger_(keywords::channel = channel)
{
}

void MyLogger::init(const std::string &level, const std::string &file)
{
    std::call_once(g_init_flag, [&]()
                   {
        const auto format = "[%TimeStamp%] [%Severity%] [%Channel%]: %Message%";

        logging::add_console_log(std::clog, keywords::format = format);
        if (!file.empty())
        {
            logging::add_file_log(
                keywords::file_name = file,
                keywords::format = format,
                keywords::auto_flush = true);
        }
        logging::add_common_attributes(); });

    set_level(level);
}

void MyLogger::set_level(const std::string &level)
{
    logging::core::get()->set_filter(logging::trivial::severity >= parse_level(level));
}

void MyLogger::debug(const std::string &msg)
{
    log(logging::trivial::debug, msg);
}

void MyLogger::info(const std::string &msg)
{
    log(logging::trivial::info, msg);
}

void MyLogger::warning(const std::string &msg)
{
    log(logging::trivial::warning, msg);
}

void MyLogger::error(const std::string &msg)
{
    log(logging::trivial::error, msg);
}

void MyLogger::log(logging::trivial::severity_level level, const std::string &msg)
{
    BOOST_LOG_SEV(logger_, level) << msg;
}
