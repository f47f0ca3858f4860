#pragma once
/**
 * @file logger.hpp
 * @brief Structured logging facade backed by spdlog.
 * @details Records are a message plus key/value fields. Two renderings:
 *          - Json: one object per line {"time":..,"level":..,"msg":..,<fields>}
 *          - Text: "<time> <level> <msg> key=value ..."
 *          Child loggers created with with() carry context fields (service,
 *          request_id, ...) into every record.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <json/value.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/sink.h>

#include "meshnode/compat/expected.hpp"

namespace meshnode::obs {

    /// Severity accepted by --log-level.
    enum class LogLevel : std::uint8_t { Debug = 0, Info, Warn, Error };

    /// Rendering accepted by --log-format.
    enum class LogFormat : std::uint8_t { Json = 0, Text };

    [[nodiscard]] meshnode_detail::expected<LogLevel, std::string>  parse_log_level(std::string_view s);
    [[nodiscard]] meshnode_detail::expected<LogFormat, std::string> parse_log_format(std::string_view s);
    const char* to_string(LogLevel l) noexcept;
    const char* to_string(LogFormat f) noexcept;

    /** @struct Field
     *  @brief One key/value attribute. Objects render as nested JSON or dotted keys in text.
     */
    struct Field {
        std::string key;
        Json::Value value;
    };
    using Fields = std::vector<Field>;

    /** @class Logger
     *  @brief Cheap-to-copy handle: shared spdlog backend + context fields.
     *  @note A default-constructed Logger discards everything.
     */
    class Logger {
    public:
        Logger() = default;
        Logger(std::shared_ptr<spdlog::logger> backend, LogFormat format, Fields context = {});

        /// Child logger with extra context fields appended.
        [[nodiscard]] Logger with(Fields more) const;

        void debug(std::string_view msg, const Fields& fields = {}) const;
        void info (std::string_view msg, const Fields& fields = {}) const;
        void warn (std::string_view msg, const Fields& fields = {}) const;
        void error(std::string_view msg, const Fields& fields = {}) const;

        [[nodiscard]] bool enabled(LogLevel level) const noexcept;
        [[nodiscard]] LogFormat format() const noexcept { return format_; }

    private:
        void emit(LogLevel level, std::string_view msg, const Fields& fields) const;

        std::shared_ptr<spdlog::logger> backend_;
        LogFormat format_{LogFormat::Json};
        Fields    context_;
    };

    /// Logger writing to stdout, tagged with service=<service>.
    Logger make_logger(LogLevel level, LogFormat format, std::string_view service);

    /// Logger writing to an arbitrary spdlog sink (tests capture via ostream_sink).
    Logger make_logger(std::shared_ptr<spdlog::sinks::sink> sink,
                       LogLevel level, LogFormat format, std::string_view service);

} // namespace meshnode::obs
