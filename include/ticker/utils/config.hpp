// include/ticker/utils/config.hpp
#pragma once
#include <istream>
#include <sstream>
#include <string>
#include <unordered_map>

namespace ticker {
namespace utils {

// Flat key=value settings. Lines starting with '#' and blank lines are ignored.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;

public:
    Config() = default;

    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& in);

    bool has(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }
        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

// Applies "log_level" to the Logger. Returns false if the value is not a
// known level, leaving the current level in place.
bool configure_logging(const Config& config);

} // namespace utils
} // namespace ticker
