#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../emitter/emitter.hpp"
#include "../logger/Mylogger.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    json load(const std::string &filepath);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback = "");
    bool get_config_bool(const std::string &key, const json &j, bool fallback = false);
    double get_config_double(const std::string &key, const json &j, double fallback = 0.0);
    std::vector<std::string> get_config_string_list(const std::string &key, const json &j,
                                                    const std::vector<std::string> &fallback = {});
};

struct WatchConfig
{
    std::string log_level = "info";
    std::string log_file;
    double delay_seconds = 0.0;
    std::vector<emitter::WatchOptions> watches;
};

// Builds the program configuration; unusable entries are logged and skipped.
WatchConfig load_watch_config(const json &j);

#endif // LOAD_CONFIG_HPP
