// include/augur/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <memory>
#include <fstream>
#include <sstream>

namespace augur {
namespace utils {

class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    static std::string trim(const std::string& text);

public:
    Config() = default;
    
    // Singleton access
    static std::shared_ptr<Config> instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_shared<Config>();
        }
        return instance_;
    }
    
    // key=value lines, '#' starts a comment line
    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& input);
    
    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
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
    
    // Specialized for string to avoid stringstream
    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // Positive whole number; throws std::invalid_argument for zero, negatives or junk
    size_t get_count(const std::string& key, size_t default_value) const;

    // Accepts true/false, yes/no, on/off and 1/0
    bool get_bool(const std::string& key, bool default_value) const;

    // Comma separated list with surrounding whitespace and empty items removed
    std::vector<std::string> get_list(const std::string& key) const;

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    // Entries under "prefix." with the prefix stripped
    std::unordered_map<std::string, std::string> with_prefix(const std::string& prefix) const;
    
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }
};

} // namespace utils
} // namespace augur
