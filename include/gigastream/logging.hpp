#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "gigastream/config.hpp"
#include "spdlog/logger.h"

namespace gigastream {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

using Fields = std::vector<KeyValue>;

enum class Format {
    Text,
    Json
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

inline KeyValue kv(const std::string& key, const char* value) {
    return {key, value ? value : ""};
}

spdlog::level::level_enum parse_level(std::string value);
Format parse_format(std::string value);
Format format();

// Text renders `message [k=v, k="v w"]`; Json renders the body of a JSON
// object whose braces come from the sink pattern.
std::string render(const std::string& message, const Fields& fields, Format as);

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline bool should_log(spdlog::level::level_enum level) {
    auto logger = get_logger();
    return logger && logger->should_log(level);
}

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                const Fields& fields) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, render(message, fields, format()));
    }
}

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, render(message, Fields(items), format()));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

// Prefixes every line with a fixed set of fields, e.g. a session id.
class Scope {
public:
    explicit Scope(Fields base = {}) : base_(std::move(base)) {}

    void trace(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        emit(spdlog::level::trace, message, items);
    }
    void debug(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        emit(spdlog::level::debug, message, items);
    }
    void info(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        emit(spdlog::level::info, message, items);
    }
    void warn(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        emit(spdlog::level::warn, message, items);
    }
    void error(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        emit(spdlog::level::err, message, items);
    }

    const Fields& fields() const { return base_; }

private:
    void emit(spdlog::level::level_enum level,
              const std::string& message,
              std::initializer_list<KeyValue> items) const {
        Fields fields = base_;
        fields.insert(fields.end(), items.begin(), items.end());
        log(level, message, fields);
    }

    Fields base_;
};

}

using logging::kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
