#ifndef STATUSKIT_OPTION_SOURCE_HPP
#define STATUSKIT_OPTION_SOURCE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace statuskit {

    // Read-only view of host (tmux) user options. A value is returned only
    // when the option was explicitly set.
    class OptionSource {
      public:
        virtual ~OptionSource()                                              = default;
        virtual std::optional<std::string> get(std::string_view name) const = 0;
    };

    class MapOptionSource final : public OptionSource {
      public:
        MapOptionSource() = default;
        explicit MapOptionSource(std::unordered_map<std::string, std::string> values) : values_(std::move(values)) {}

        std::optional<std::string> get(std::string_view name) const override {
            const auto it = values_.find(std::string(name));
            if (it == values_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void set(std::string name, std::string value) {
            values_[std::move(name)] = std::move(value);
        }

        void erase(std::string_view name) {
            values_.erase(std::string(name));
        }

      private:
        std::unordered_map<std::string, std::string> values_;
    };

} // namespace statuskit

#endif // STATUSKIT_OPTION_SOURCE_HPP
