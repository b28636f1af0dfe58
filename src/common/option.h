#pragma once

#include <any>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace retryable {

// Options is a map of config items <config_name, config_value>
using Options = std::unordered_map<std::string, std::string>;

inline std::ostream& operator<<(std::ostream& os, const Options& options) {
    os << "{";
    bool first = true;
    for (const auto& [name, value] : options) {
        os << (first ? "" : ", ") << name << ": " << value;
        first = false;
    }
    return os << "}";
}

inline std::string ToString(const Options& options) {
    std::ostringstream oss;
    oss << options;
    return oss.str();
}

enum ValueType : uint8_t { INT = 0, STRING = 1, BOOL = 2, DOUBLE = 3, UNKNOWN = 255 };

struct OptionDef {
    ValueType value_type;
    std::string default_value;
};

/*
 * Process-wide table of known options. Entries are added during static
 * initialization by the OPTION macro and never removed.
 */
class OptionRegistry {
 public:
    static OptionRegistry& Instance() {
        static OptionRegistry registry;
        return registry;
    }

    void Register(const std::string& name, ValueType type, const std::string& default_value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = defs_.try_emplace(name, OptionDef{type, default_value});
        if (!inserted && (it->second.value_type != type || it->second.default_value != default_value)) {
            SPDLOG_ERROR(
                "Option {} already defined with different definition: old(type={}, default={}), new(type={}, "
                "default={})",
                name,
                static_cast<int>(it->second.value_type),
                it->second.default_value,
                static_cast<int>(type),
                default_value);
        }
    }

    std::optional<OptionDef> Find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = defs_.find(name);
        if (it == defs_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Contains(const std::string& name) const { return Find(name).has_value(); }

    std::unordered_map<std::string, OptionDef> Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return defs_;
    }

 private:
    OptionRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OptionDef> defs_;
};

struct OptionRegistrar {
    OptionRegistrar(const std::string& name, ValueType type, const std::string& default_value) {
        OptionRegistry::Instance().Register(name, type, default_value);
    }
};

#define OPTION(name, type, default_value) \
    inline const std::string name = #name; \
    inline const ::retryable::OptionRegistrar option_reg_##name(name, type, default_value);

/********** Option definition: [Option Name, Option Type, Default Value] ***********/
OPTION(RETRYABLE_OPTIONS_LOAD_MODE, STRING, "ENV") // ENV, FILE
OPTION(RETRYABLE_OPTIONS_FILE_PATH, STRING, "") // Config file path

// Retry Options
OPTION(RETRYABLE_MAX_ATTEMPTS, INT, "3")
OPTION(RETRYABLE_BASE_DELAY_SEC, DOUBLE, "1.0")
OPTION(RETRYABLE_BACKOFF, STRING, "LINEAR") // LINEAR, EXPONENTIAL
OPTION(RETRYABLE_JITTER, BOOL, "false")
OPTION(RETRYABLE_MAX_DELAY_SEC, DOUBLE, "0") // <= 0: no cap

// Log Options
OPTION(RETRYABLE_LOG_DIR, STRING, "/tmp/retryable")
OPTION(RETRYABLE_LOG_LEVEL, STRING, "INFO") // DEBUG, INFO, WARNING, ERROR
OPTION(RETRYABLE_LOG_TO_CONSOLE, BOOL, "false")
OPTION(RETRYABLE_LOG_TO_FILE, BOOL, "true")
OPTION(RETRYABLE_LOG_MAX_FILE_DAYS, INT, "5") // 5 days
/********** Option definition: [Option Name, Option Type, Default Value] ***********/

// Value parsers, all throw std::invalid_argument on bad input
int ParseInt(const std::any& value);
std::string ParseString(const std::any& value);
bool ParseBool(const std::any& value);
double ParseDouble(const std::any& value);
std::any ParseValue(ValueType type, const std::any& value);

/*
 * Typed value of an option: the entry in options if present, else the
 * registered default. Unknown options and empty defaults yield T{}.
 */
template <typename T>
T GetOptionValue(const Options& options, const std::string& name) {
    auto def = OptionRegistry::Instance().Find(name);
    if (!def.has_value()) {
        SPDLOG_ERROR("Option definition for {} not found", name);
        return T{};
    }

    auto opt_iter = options.find(name);
    if (opt_iter != options.end()) {
        return std::any_cast<T>(ParseValue(def->value_type, opt_iter->second));
    }
    if (def->default_value.empty()) {
        return T{};
    }
    return std::any_cast<T>(ParseValue(def->value_type, def->default_value));
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value);

// Utils for config
std::string GetOptionFromEnv(const std::string& name);
void LoadOptions(Options& options);
void LoadOptionsFromEnv(Options& options);
void LoadOptionsFromFile(Options& options, std::string file_path = "");

} // namespace retryable
