#include "statuskit/notifications.hpp"

#include "statuskit/logging.hpp"

namespace statuskit {

    void TmuxNotifier::notify(std::string_view message) {
        const auto shown = client_.display_message(message, kToastDuration);
        if (!shown) {
            debug_log("notify", format_tmux_error(shown.error()));
        }
    }

    std::string missing_dependency_text(std::string_view widget, const std::vector<std::string>& missing) {
        std::string message = "[statuskit] ";
        message += widget;
        message += ": missing ";
        message += missing.size() == 1 ? "dependency " : "dependencies ";
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) {
                message += ", ";
            }
            message += missing[i];
        }
        return message;
    }

} // namespace statuskit
