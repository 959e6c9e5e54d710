// src/augur/utils/config.cpp
#include "augur/utils/config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace augur {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

std::string Config::trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    load_from_stream(file);
    return true;
}

void Config::load_from_stream(std::istream& input) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();

    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }
    }
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string value = get(key, std::string());
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return default_value;
}

size_t Config::get_count(const std::string& key, size_t default_value) const {
    if (!has(key)) {
        return default_value;
    }

    // Signed parse so "-1" is rejected rather than wrapped
    const std::string text = get(key, std::string());
    std::istringstream iss(text);
    long long value = 0;
    if (!(iss >> value) || !(iss >> std::ws).eof() || value <= 0) {
        throw std::invalid_argument(key + " must be a positive whole number, got '" + text + "'");
    }
    return static_cast<size_t>(value);
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    std::stringstream ss(get(key, std::string()));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::unordered_map<std::string, std::string> Config::with_prefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string lead = prefix + ".";
    std::unordered_map<std::string, std::string> result;
    for (const auto& [key, value] : values_) {
        if (key.size() > lead.size() && key.compare(0, lead.size(), lead) == 0) {
            result[key.substr(lead.size())] = value;
        }
    }
    return result;
}

} // namespace utils
} // namespace augur
