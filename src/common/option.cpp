#include "common/option.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace retryable {

namespace {

constexpr const char* DEFAULT_RETRYABLE_CONFIG_FILE = "retryable.conf";

// ENV first, then options, then retryable.conf in the working directory
std::string ResolveConfigFilePath(const Options& options, const std::string& file_path) {
    if (!file_path.empty()) {
        return file_path;
    }
    auto env_path = GetOptionFromEnv(RETRYABLE_OPTIONS_FILE_PATH);
    if (!env_path.empty()) {
        return env_path;
    }
    auto option_path = GetOptionValue<std::string>(options, RETRYABLE_OPTIONS_FILE_PATH);
    if (!option_path.empty()) {
        return option_path;
    }
    return (std::filesystem::current_path() / DEFAULT_RETRYABLE_CONFIG_FILE).string();
}

// The whole trimmed string must be consumed; overflow is reported as invalid_argument too.
template <typename T, typename Convert>
T ParseNumber(const std::string& raw, const char* type_name, Convert convert) {
    auto str = TrimCopy(raw);
    size_t pos = 0;
    T result{};
    try {
        result = convert(str, &pos);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + std::string(type_name) + ": " + raw);
    }
    if (pos != str.size()) {
        throw std::invalid_argument("Invalid value for " + std::string(type_name) + ": " + raw);
    }
    return result;
}

} // namespace

int ParseInt(const std::any& value) {
    if (value.type() == typeid(int)) {
        return std::any_cast<int>(value);
    }
    if (value.type() == typeid(std::string)) {
        return ParseNumber<int>(std::any_cast<std::string>(value), "int", [](const std::string& str, size_t* pos) {
            return std::stoi(str, pos);
        });
    }
    throw std::invalid_argument("Invalid type for int");
}

std::string ParseString(const std::any& value) {
    if (value.type() == typeid(std::string)) {
        return std::any_cast<std::string>(value);
    }
    if (value.type() == typeid(const char*)) {
        return std::any_cast<const char*>(value);
    }
    if (value.type() == typeid(std::string_view)) {
        return std::string(std::any_cast<std::string_view>(value));
    }
    SPDLOG_ERROR("Invalid type for string, got type: {}", value.type().name());
    throw std::invalid_argument("Invalid type for string");
}

bool ParseBool(const std::any& value) {
    if (value.type() == typeid(bool)) {
        return std::any_cast<bool>(value);
    }
    if (value.type() != typeid(std::string)) {
        throw std::invalid_argument("Invalid type for bool: " + std::string(value.type().name()));
    }

    auto str = ToLower(TrimCopy(std::any_cast<std::string>(value)));
    if (str == "true" || str == "1" || str == "yes") {
        return true;
    }
    if (str == "false" || str == "0" || str == "no") {
        return false;
    }
    throw std::invalid_argument("Invalid value for bool: " + str);
}

double ParseDouble(const std::any& value) {
    if (value.type() == typeid(double)) {
        return std::any_cast<double>(value);
    }
    if (value.type() == typeid(std::string)) {
        return ParseNumber<double>(
            std::any_cast<std::string>(value), "double", [](const std::string& str, size_t* pos) {
                return std::stod(str, pos);
            });
    }
    throw std::invalid_argument("Invalid type for double");
}

std::any ParseValue(ValueType type, const std::any& value) {
    switch (type) {
        case ValueType::INT:
            return ParseInt(value);
        case ValueType::STRING:
            return ParseString(value);
        case ValueType::BOOL:
            return ParseBool(value);
        case ValueType::DOUBLE:
            return ParseDouble(value);
        default:
            throw std::invalid_argument("Invalid type for value: " + std::to_string(type));
    }
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value) {
    if (value.empty()) {
        SPDLOG_INFO("Option {} is empty! Skip it.", name);
        return;
    }
    auto [it, inserted] = options.insert_or_assign(name, value);
    if (!inserted) {
        SPDLOG_WARN("Option {} exists! Update it to {}.", name, it->second);
    }
}

std::string GetOptionFromEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    return env_value != nullptr ? std::string(env_value) : "";
}

void LoadOptions(Options& options) {
    auto load_mode = GetOptionFromEnv(RETRYABLE_OPTIONS_LOAD_MODE);
    if (load_mode.empty()) {
        load_mode = GetOptionValue<std::string>(options, RETRYABLE_OPTIONS_LOAD_MODE);
    }

    load_mode = ToUpper(TrimCopy(load_mode));
    if (load_mode == "ENV") {
        LoadOptionsFromEnv(options);
    } else if (load_mode == "FILE") {
        LoadOptionsFromFile(options);
    } else {
        SPDLOG_ERROR("Invalid load mode: {}", load_mode);
    }
}

void LoadOptionsFromEnv(Options& options) {
    for (const auto& [name, def] : OptionRegistry::Instance().Snapshot()) {
        const char* env_value = std::getenv(name.c_str());
        if (env_value != nullptr) {
            PutOptionValue(options, name, env_value);
        }
    }

    SPDLOG_INFO("Load options from ENV: {}", ToString(options));
}

void LoadOptionsFromFile(Options& options, std::string file_path) {
    file_path = ResolveConfigFilePath(options, file_path);

    std::ifstream config_file(file_path);
    if (!config_file.is_open()) {
        SPDLOG_WARN("Config file not found: {}. Skip load options from file.", file_path);
        return;
    }

    const auto& registry = OptionRegistry::Instance();
    std::string line;
    int line_number = 0;
    while (std::getline(config_file, line)) {
        line_number++;
        auto trimmed = TrimCopy(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        auto entry = SplitKeyValue(trimmed);
        if (!entry.has_value()) {
            SPDLOG_WARN("Invalid config line {} in {}: {} (missing '=')", line_number, file_path, trimmed);
            continue;
        }
        if (!registry.Contains(entry->first)) {
            SPDLOG_WARN("Unknown option in config file line {}: {} (skipping)", line_number, entry->first);
            continue;
        }
        PutOptionValue(options, entry->first, entry->second);
    }

    SPDLOG_INFO("Load options from file [{}]: {}", file_path, ToString(options));
}

} // namespace retryable
