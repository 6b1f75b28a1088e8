#ifndef STATUSKIT_NOTIFICATIONS_HPP
#define STATUSKIT_NOTIFICATIONS_HPP

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include "statuskit/tmux.hpp"

namespace statuskit {

    inline constexpr std::chrono::milliseconds kToastDuration{5000};

    class Notifier {
      public:
        virtual ~Notifier()                              = default;
        virtual void notify(std::string_view message) = 0;
    };

    class TmuxNotifier final : public Notifier {
      public:
        explicit TmuxNotifier(TmuxClient& client) : client_(client) {}

        void notify(std::string_view message) override;

      private:
        TmuxClient& client_;
    };

    std::string missing_dependency_text(std::string_view widget, const std::vector<std::string>& missing);

} // namespace statuskit

#endif // STATUSKIT_NOTIFICATIONS_HPP
