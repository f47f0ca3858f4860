/**
 * @file logger.cpp
 * @brief spdlog-backed structured records (JSON lines or key=value text).
 */
#include "meshnode/obs/logger.hpp"

#include <algorithm>

#include <json/writer.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace meshnode::obs {

    namespace {

    // time/level come from the spdlog pattern; %v is the record body without braces.
    constexpr const char* kJsonPattern = R"({"time":"%Y-%m-%dT%H:%M:%S.%fZ","level":"%l",%v})";
    constexpr const char* kTextPattern = "%Y-%m-%dT%H:%M:%S.%eZ %^%-7l%$ %v";

    spdlog::level::level_enum to_spdlog(LogLevel l) noexcept {
        switch (l) {
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:  return spdlog::level::info;
            case LogLevel::Warn:  return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
        }
        return spdlog::level::info;
    }

    std::string compact(const Json::Value& v) {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"]    = true;
        return Json::writeString(b, v);
    }

    std::string quote_if_needed(const std::string& s) {
        const bool plain = !s.empty() && std::none_of(s.begin(), s.end(), [](char c) {
            return c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t';
        });
        return plain ? s : compact(Json::Value(s));
    }

    // Objects flatten to dotted keys: request_headers.Accept=...
    void append_text(std::string& out, const std::string& key, const Json::Value& v) {
        if (v.isObject()) {
            for (const auto& name : v.getMemberNames()) append_text(out, key + "." + name, v[name]);
            return;
        }
        out.push_back(' ');
        out += key;
        out.push_back('=');
        out += v.isString() ? quote_if_needed(v.asString()) : compact(v);
    }

    } // namespace

    meshnode_detail::expected<LogLevel, std::string> parse_log_level(std::string_view s) {
        if (s == "debug") return LogLevel::Debug;
        if (s == "info")  return LogLevel::Info;
        if (s == "warn")  return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return meshnode_detail::unexpected(
            "log-level must be one of [debug, info, warn, error], got \"" + std::string(s) + "\"");
    }

    meshnode_detail::expected<LogFormat, std::string> parse_log_format(std::string_view s) {
        if (s == "json") return LogFormat::Json;
        if (s == "text") return LogFormat::Text;
        return meshnode_detail::unexpected(
            "log-format must be one of [json, text], got \"" + std::string(s) + "\"");
    }

    const char* to_string(LogLevel l) noexcept {
        switch (l) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
        }
        return "info";
    }

    const char* to_string(LogFormat f) noexcept {
        return f == LogFormat::Text ? "text" : "json";
    }

    Logger::Logger(std::shared_ptr<spdlog::logger> backend, LogFormat format, Fields context)
        : backend_(std::move(backend)), format_(format), context_(std::move(context)) {}

    Logger Logger::with(Fields more) const {
        Logger child{*this};
        child.context_.insert(child.context_.end(),
                              std::make_move_iterator(more.begin()),
                              std::make_move_iterator(more.end()));
        return child;
    }

    bool Logger::enabled(LogLevel level) const noexcept {
        return backend_ && backend_->should_log(to_spdlog(level));
    }

    void Logger::debug(std::string_view msg, const Fields& fields) const { emit(LogLevel::Debug, msg, fields); }
    void Logger::info (std::string_view msg, const Fields& fields) const { emit(LogLevel::Info,  msg, fields); }
    void Logger::warn (std::string_view msg, const Fields& fields) const { emit(LogLevel::Warn,  msg, fields); }
    void Logger::error(std::string_view msg, const Fields& fields) const { emit(LogLevel::Error, msg, fields); }

    void Logger::emit(LogLevel level, std::string_view msg, const Fields& fields) const {
        if (!enabled(level)) return;

        std::string payload;
        if (format_ == LogFormat::Json) {
            Json::Value record(Json::objectValue);
            for (const auto& f : context_) record[f.key] = f.value;
            for (const auto& f : fields)   record[f.key] = f.value;
            record["msg"] = std::string(msg);
            payload = compact(record);
            // strip the outer braces; the pattern supplies them around time/level
            payload = payload.substr(1, payload.size() - 2);
        } else {
            payload.assign(msg);
            for (const auto& f : context_) append_text(payload, f.key, f.value);
            for (const auto& f : fields)   append_text(payload, f.key, f.value);
        }
        backend_->log(to_spdlog(level), spdlog::string_view_t{payload.data(), payload.size()});
    }

    Logger make_logger(std::shared_ptr<spdlog::sinks::sink> sink,
                       LogLevel level, LogFormat format, std::string_view service) {
        auto backend = std::make_shared<spdlog::logger>("meshnode", std::move(sink));
        backend->set_pattern(format == LogFormat::Json ? kJsonPattern : kTextPattern,
                             spdlog::pattern_time_type::utc);
        backend->set_level(to_spdlog(level));
        backend->flush_on(spdlog::level::debug);
        return Logger{std::move(backend), format, Fields{{"service", std::string(service)}}};
    }

    Logger make_logger(LogLevel level, LogFormat format, std::string_view service) {
        std::shared_ptr<spdlog::sinks::sink> sink;
        if (format == LogFormat::Text) sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        else                           sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        return make_logger(std::move(sink), level, format, service);
    }

} // namespace meshnode::obs
