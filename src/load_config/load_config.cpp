#include "load_config.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

namespace
{
    MyLogger &config_logger()
    {
        static MyLogger logger("config");
        return logger;
    }
}

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            config_logger().error("Unable to open configuration file: " + filepath);
            throw std::runtime_error("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            config_logger().info("Configuration file loaded successfully: " + filepath);
            config_logger().debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            config_logger().error("JSON parse error in file " + filepath + ": " + e.what());
        }
        return json();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        try
        {
            if (!j.contains(key))
            {
                config_logger().debug("Key not found in JSON, using default: " + key);
                return fallback;
            }
            if (!j.at(key).is_string())
            {
                config_logger().error("Key is not a string: " + key);
                return fallback;
            }
            return j.at(key).get<std::string>();
        }
        catch (const std::exception &e)
        {
            config_logger().error("Error retrieving string value for key '" + key + "': " + e.what());
            return fallback;
        }
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j.at(key).is_boolean())
        {
            config_logger().error("Key is not a boolean: " + key);
            return fallback;
        }
        return j.at(key).get<bool>();
    }

    double get_config_double(const std::string &key, const json &j, double fallback)
    {
        if (!j.contains(key))
            return fallback;
        if (!j.at(key).is_number())
        {
            config_logger().error("Key is not a number: " + key);
            return fallback;
        }
        return j.at(key).get<double>();
    }

    std::vector<std::string> get_config_string_list(const std::string &key, const json &j,
                                                    const std::vector<std::string> &fallback)
    {
        if (!j.contains(key))
            return fallback;

        const json &value = j.at(key);
        if (!value.is_array())
        {
            config_logger().error("Key is not a list: " + key);
            return fallback;
        }

        std::vector<std::string> result;
        for (const auto &item : value)
        {
            if (!item.is_string())
            {
                config_logger().error("Non-string entry in list '" + key + "' ignored: " + item.dump());
                continue;
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }
}

WatchConfig load_watch_config(const json &j)
{
    WatchConfig config;
    config.log_level = ConfigReader::get_config_string("log_level", j, config.log_level);
    config.log_file = ConfigReader::get_config_string("log_file", j);
    config.delay_seconds = ConfigReader::get_config_double("delay_seconds", j, 0.0);
    if (config.delay_seconds < 0)
    {
        config_logger().error("delay_seconds must not be negative, using 0");
        config.delay_seconds = 0.0;
    }

    if (!j.contains("watches") || !j.at("watches").is_array())
    {
        config_logger().warning("No watches configured");
        return config;
    }

    for (const auto &entry : j.at("watches"))
    {
        if (!entry.is_object())
        {
            config_logger().error("Watch entry is not an object, skipped: " + entry.dump());
            continue;
        }

        std::string path = ConfigReader::get_config_string("path", entry);
        if (path.empty())
        {
            config_logger().error("Watch entry without path skipped: " + entry.dump());
            continue;
        }

        emitter::WatchOptions options;
        options.path = path;
        options.recursive = ConfigReader::get_config_bool("recursive", entry, true);
        options.suppress_history = ConfigReader::get_config_bool("suppress_history", entry, false);
        options.case_sensitive = ConfigReader::get_config_bool("case_sensitive", entry, true);
        options.patterns = ConfigReader::get_config_string_list("patterns", entry, {"**"});
        options.ignore_patterns = ConfigReader::get_config_string_list("ignore_patterns", entry);

        if (entry.contains("event_filter"))
        {
            std::set<events::EventKind> kinds;
            for (const auto &name : ConfigReader::get_config_string_list("event_filter", entry))
            {
                if (auto kind = events::kind_from_string(name))
                    kinds.insert(*kind);
                else
                    config_logger().warning("Unknown event kind '" + name + "' in filter of " + path + " ignored");
            }
            options.event_filter = kinds;
        }

        config.watches.push_back(options);
    }
    return config;
}
