#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace config {

// Configuration value types
enum class ConfigType {
    STRING,
    INT
};

// Configuration value wrapper
class ConfigValue {
public:
    ConfigValue() : type_(ConfigType::STRING) {}
    ConfigValue(const std::string& value) : type_(ConfigType::STRING), string_value_(value) {}
    ConfigValue(int value) : type_(ConfigType::INT), int_value_(value) {}

    // Getters; string conversions throw std::invalid_argument / std::out_of_range
    std::string as_string() const;
    int as_int() const;

private:
    ConfigType type_;
    std::string string_value_;
    int int_value_{0};
};

/**
 * INI-style configuration: "[section]" headers, "key = value" pairs,
 * '#' and ';' comment lines. Keys outside a section and unrecognized
 * lines are reported as validation errors.
 */
class ProcessConfigManager {
public:
    ProcessConfigManager() = default;

    // Configuration loading
    bool load_config(const std::string& config_file);
    bool load_config_from_string(const std::string& config_content);

    // Value access
    ConfigValue get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const;

    // Convenience methods
    std::string get_string(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& section, const std::string& key, int default_value = 0) const;

    const std::vector<std::string>& get_validation_errors() const { return validation_errors_; }

private:
    std::map<std::string, std::map<std::string, ConfigValue>> config_data_;
    std::vector<std::string> validation_errors_;

    // Parsing helpers
    static std::string trim(const std::string& str);
    static bool is_section_line(const std::string& line);
    static bool is_key_value_line(const std::string& line);
    static std::string extract_section_name(const std::string& line);
    static std::pair<std::string, std::string> extract_key_value(const std::string& line);
};

} // namespace config
