#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshcache::log {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const;
    void set_minimum_level(Level level);
    // nullptr restores std::clog.
    void set_sink(std::ostream* sink);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    bool enabled_{true};
    Level minimum_{Level::Info};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

inline void log_event(StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace meshcache::log
