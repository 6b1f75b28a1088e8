#include "statuskit/compositor.hpp"

namespace statuskit {

    namespace {

        struct Fill {
            const std::string& icon_bg;
            const std::string& content_bg;
            const std::string& text;
        };

        Fill segment_fill(const Segment& segment, const RenderOptions& options) {
            if (segment.has_threshold && !segment.accent_subtle.empty()) {
                return Fill{segment.accent_subtle, segment.accent, segment.accent_strong};
            }
            return Fill{segment.accent_icon, segment.accent, options.text_color};
        }

        void append_style(std::string& out, std::string_view fg, std::string_view bg, bool bold = false) {
            out.append("#[fg=");
            out.append(fg);
            out.append(",bg=");
            out.append(bg);
            if (bold) {
                out.append(",bold");
            }
            out.push_back(']');
        }

    } // namespace

    std::string render_segments(const std::vector<Segment>& segments, const RenderOptions& options) {
        std::string out;
        if (segments.empty()) {
            return out;
        }

        const bool        spaced   = options.spacing != Spacing::kNone;
        const std::string gap_bg   = options.transparent ? std::string("default") : options.spacing_bg;
        const std::string gap_fg   = options.transparent ? options.spacing_fg_transparent : options.spacing_bg;
        const std::string first_bg = options.transparent ? std::string("default") : options.status_bg;
        std::string       prev;

        for (size_t i = 0; i < segments.size(); ++i) {
            const auto& segment = segments[i];

            if (spaced && i > 0) {
                out.push_back(' ');
                append_style(out, gap_fg, prev);
                out.append(options.right_separator);
                out.append("#[bg=");
                out.append(gap_bg);
                out.append("]#[none]");
                prev = gap_bg;
            }

            const auto fill = segment_fill(segment, options);

            if (i == 0) {
                append_style(out, fill.icon_bg, first_bg);
                out.append(options.separator_style == SeparatorStyle::kRounded ? options.left_separator_rounded : options.right_separator);
            } else {
                append_style(out, fill.icon_bg, prev);
                out.append(options.right_separator);
            }
            out.append("#[none]");

            append_style(out, fill.text, fill.icon_bg, true);
            out.append(segment.icon);
            out.push_back(' ');

            append_style(out, fill.content_bg, fill.icon_bg);
            out.append(options.right_separator);
            out.append("#[none]");

            append_style(out, fill.text, fill.content_bg, true);
            out.push_back(' ');
            out.append(segment.content);
            out.push_back(' ');
            if (i + 1 < segments.size()) {
                out.append("#[none]");
            }

            prev = fill.content_bg;
        }
        return out;
    }

} // namespace statuskit
