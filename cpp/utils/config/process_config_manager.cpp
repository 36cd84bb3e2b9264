#include "process_config_manager.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

std::string ConfigValue::as_string() const {
    switch (type_) {
        case ConfigType::STRING: return string_value_;
        case ConfigType::INT: return std::to_string(int_value_);
    }
    return "";
}

int ConfigValue::as_int() const {
    switch (type_) {
        case ConfigType::STRING: {
            size_t consumed = 0;
            int value = std::stoi(string_value_, &consumed);
            if (consumed != string_value_.size()) {
                throw std::invalid_argument("not an integer: " + string_value_);
            }
            return value;
        }
        case ConfigType::INT: return int_value_;
    }
    return 0;
}

bool ProcessConfigManager::load_config(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        config_data_.clear();
        validation_errors_.assign(1, "Cannot open file: " + config_file);
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();

    return load_config_from_string(content.str());
}

bool ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    config_data_.clear();
    validation_errors_.clear();

    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (is_section_line(line)) {
            current_section = extract_section_name(line);
            config_data_[current_section];
        } else if (is_key_value_line(line)) {
            if (current_section.empty()) {
                validation_errors_.push_back("Key-value pair found outside of section: " + line);
                continue;
            }

            auto [key, value] = extract_key_value(line);
            if (key.empty()) {
                validation_errors_.push_back("Empty key in section [" + current_section + "]");
                continue;
            }
            config_data_[current_section][key] = ConfigValue(value);
        } else {
            validation_errors_.push_back("Unrecognized line " + std::to_string(line_number) + ": " + line);
        }
    }

    return validation_errors_.empty();
}

ConfigValue ProcessConfigManager::get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return default_value;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }

    return key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key, const std::string& default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_string();
}

int ProcessConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_int();
}

std::string ProcessConfigManager::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ProcessConfigManager::is_section_line(const std::string& line) {
    return line.length() >= 3 && line[0] == '[' && line[line.length() - 1] == ']';
}

bool ProcessConfigManager::is_key_value_line(const std::string& line) {
    return line.find('=') != std::string::npos;
}

std::string ProcessConfigManager::extract_section_name(const std::string& line) {
    return trim(line.substr(1, line.length() - 2));
}

std::pair<std::string, std::string> ProcessConfigManager::extract_key_value(const std::string& line) {
    size_t eq_pos = line.find('=');
    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    return {key, value};
}

} // namespace config
