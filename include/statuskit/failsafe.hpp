#ifndef STATUSKIT_FAILSAFE_HPP
#define STATUSKIT_FAILSAFE_HPP

#include <exception>
#include <string_view>
#include <utility>

namespace statuskit::failsafe {

    // Runs fn and reports any exception through on_error instead of letting it
    // escape. Returns false when fn threw.
    template <typename F, typename OnError>
    [[nodiscard]] bool guard(F&& fn, OnError&& on_error, std::string_view context) noexcept {
        try {
            std::forward<F>(fn)();
            return true;
        } catch (const std::exception& ex) {
            try {
                std::forward<OnError>(on_error)(context, ex.what());
            } catch (...) {}
        } catch (...) {
            try {
                std::forward<OnError>(on_error)(context, "unknown exception");
            } catch (...) {}
        }
        return false;
    }

} // namespace statuskit::failsafe

#endif // STATUSKIT_FAILSAFE_HPP
