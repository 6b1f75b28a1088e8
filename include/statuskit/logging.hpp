#ifndef STATUSKIT_LOGGING_HPP
#define STATUSKIT_LOGGING_HPP

#include <source_location>
#include <string>
#include <string_view>

namespace statuskit {

    using DebugLogSink = void (*)(std::string_view message);
    using ErrorLogSink = void (*)(std::string_view message);

    std::string format_log_entry(std::string_view context, std::string_view message);
    std::string format_debug_entry(std::string_view context, std::string_view message);
    std::string format_log_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());
    std::string format_debug_entry_with_location(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_debug_log_sink(DebugLogSink sink);
    void        clear_debug_log_sink();
    void        set_debug_logging(bool enabled);
    bool        debug_logging_enabled();
    void        debug_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

    void        set_error_log_sink(ErrorLogSink sink);
    void        clear_error_log_sink();
    void        error_log(std::string_view context, std::string_view message, const std::source_location& location = std::source_location::current());

} // namespace statuskit

#endif // STATUSKIT_LOGGING_HPP
