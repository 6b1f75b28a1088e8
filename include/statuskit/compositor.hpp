#ifndef STATUSKIT_COMPOSITOR_HPP
#define STATUSKIT_COMPOSITOR_HPP

#include <string>
#include <string_view>
#include <vector>

#include "statuskit/config.hpp"

namespace statuskit {

    inline constexpr std::string_view kRightSeparator        = "\uE0B2";
    inline constexpr std::string_view kLeftSeparatorRounded  = "\uE0B6";

    // Colors are concrete tmux values; an empty color makes tmux inherit.
    struct Segment {
        std::string name;
        std::string content;
        std::string icon;
        std::string accent;
        std::string accent_icon;
        std::string accent_strong;
        std::string accent_subtle;
        bool        has_threshold = false;
    };

    struct RenderOptions {
        std::string    status_bg;
        bool           transparent     = false;
        SeparatorStyle separator_style = SeparatorStyle::kRounded;
        Spacing        spacing         = Spacing::kNone;
        std::string    right_separator        = std::string(kRightSeparator);
        std::string    left_separator_rounded = std::string(kLeftSeparatorRounded);
        std::string    text_color;
        std::string    spacing_bg;
        std::string    spacing_fg_transparent;
    };

    std::string render_segments(const std::vector<Segment>& segments, const RenderOptions& options);

} // namespace statuskit

#endif // STATUSKIT_COMPOSITOR_HPP
