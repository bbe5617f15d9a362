#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <memory>
#include <string>

#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>

// Logging handle handed to every component at construction.
// All handles share the process-wide Boost.Log core configured by init().
class MyLogger
{
public:
    explicit MyLogger(const std::string &channel);

    // Configure sinks once per process. An empty file name means console only.
    // Recognised levels: trace, debug, info, warning, error, fatal.
    static void init(const std::string &level, const std::string &file = "");
    static void set_level(const std::string &level);

    static std::shared_ptr<MyLogger> create(const std::string &channel)
    {
        return std::make_shared<MyLogger>(channel);
    }

    void debug(const std::string &msg);
    void info(const std::string &msg);
    void warning(const std::string &msg);
    void error(const std::string &msg);

    const std::string &channel() const { return channel_; }

private:
    void log(boost::log::trivial::severity_level level, const std::string &msg);

    std::string channel_;
    boost::log::sources::severity_channel_logger_mt<boost::log::trivial::severity_level, std::string> logger_;
};

#endif // MYLOGGER_HPP
