// src/ticker/utils/config.cpp
#include "ticker/utils/config.hpp"
#include "ticker/utils/logger.hpp"

#include <fstream>

namespace ticker {
namespace utils {

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        Logger::warn() << "Could not open config file " << filename << Logger::endl;
        return false;
    }

    load_from_stream(file);
    return true;
}

void Config::load_from_stream(std::istream& in) {
    values_.clear();

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            Logger::debug() << "Ignoring config line without '=': " << line << Logger::endl;
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        values_[key] = value;
    }
}

bool Config::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_value;
}

bool configure_logging(const Config& config) {
    if (!config.has("log_level")) {
        return true;
    }

    std::string name = config.get("log_level", std::string());
    auto level = parse_log_level(name);
    if (!level) {
        Logger::warn() << "Unknown log_level '" << name << "', keeping "
                       << log_level_name(Logger::level()) << Logger::endl;
        return false;
    }

    Logger::set_level(*level);
    return true;
}

} // namespace utils
} // namespace ticker
