#include "gigastream/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace gigastream::logging {

namespace {

constexpr const char* kLoggerName = "gigastream";
constexpr const char* kTextPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
constexpr const char* kJsonPattern = "{\"time\":\"%Y-%m-%dT%H:%M:%S.%e\",\"level\":\"%l\",%v}";

std::atomic<Format> g_format{Format::Text};

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::string render_text(const std::string& message, const Fields& fields) {
    std::string context;
    for (const auto& field : fields) {
        if (!context.empty()) {
            context += ", ";
        }
        context += field.key;
        context += '=';
        if (field.value.find(' ') != std::string::npos) {
            context += '"';
            context += field.value;
            context += '"';
        } else {
            context += field.value;
        }
    }
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

std::string render_json(const std::string& message, const Fields& fields) {
    nlohmann::ordered_json body;
    body["message"] = message;
    for (const auto& field : fields) {
        body[field.key] = field.value;
    }
    auto dumped = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    // Braces come from the sink pattern.
    return dumped.substr(1, dumped.size() - 2);
}

}

spdlog::level::level_enum parse_level(std::string value) {
    value = upper(std::move(value));
    if (value == "TRACE") return spdlog::level::trace;
    if (value == "DEBUG") return spdlog::level::debug;
    if (value == "WARN" || value == "WARNING") return spdlog::level::warn;
    if (value == "ERROR") return spdlog::level::err;
    if (value == "CRITICAL") return spdlog::level::critical;
    if (value == "OFF") return spdlog::level::off;
    return spdlog::level::info;
}

Format parse_format(std::string value) {
    value = upper(std::move(value));
    if (value == "JSON") return Format::Json;
    if (value.empty() || value == "TEXT") return Format::Text;
    throw std::invalid_argument("unknown log format: " + value);
}

Format format() {
    return g_format.load();
}

std::string render(const std::string& message, const Fields& fields, Format as) {
    return as == Format::Json ? render_json(message, fields) : render_text(message, fields);
}

void init(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_filename) {
        const std::filesystem::path log_path(*config.log_filename);
        if (!log_path.parent_path().empty()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string(),
                                                                            true));
    }

    if (spdlog::get(kLoggerName)) {
        spdlog::drop(kLoggerName);
    }
    const auto log_format = parse_format(config.log_format);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(log_format == Format::Json ? kJsonPattern : kTextPattern);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_level(parse_level(config.log_level));
    g_format = log_format;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    return spdlog::default_logger();
}

}
