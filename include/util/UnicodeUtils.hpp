#pragma once

#include <memory>
#include <string>
#include <vector>
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

namespace halo::util {

/// Terminal column width of one code point: 0 for combining marks and
/// controls, 2 for East Asian wide/fullwidth, 1 otherwise
inline int codepoint_width(UChar32 c) {
    if (c == 0 || u_iscntrl(c)) {
        return 0;
    }
    int8_t category = u_charType(c);
    if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK || category == U_FORMAT_CHAR) {
        return 0;
    }
    int ea = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (ea == U_EA_WIDE || ea == U_EA_FULLWIDTH) {
        return 2;
    }
    return 1;
}

inline int display_width(const icu::UnicodeString& text) {
    int width = 0;
    for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
        width += codepoint_width(text.char32At(i));
    }
    return width;
}

inline int display_width(const std::string& text) {
    return display_width(icu::UnicodeString::fromUTF8(text));
}

namespace detail {

inline std::string to_utf8(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

inline icu::UnicodeString trim_trailing_space(const icu::UnicodeString& text) {
    int32_t end = text.length();
    while (end > 0 && u_isWhitespace(text.charAt(end - 1))) {
        --end;
    }
    return icu::UnicodeString(text, 0, end);
}

// Split a segment wider than `width` at code point boundaries
inline void hard_split(const icu::UnicodeString& segment, int width,
                       std::vector<std::string>& lines, icu::UnicodeString& line, int& line_width) {
    for (int32_t i = 0; i < segment.length(); i = segment.moveIndex32(i, 1)) {
        UChar32 c = segment.char32At(i);
        int w = codepoint_width(c);
        if (line_width + w > width && line_width > 0) {
            lines.push_back(to_utf8(trim_trailing_space(line)));
            line.remove();
            line_width = 0;
        }
        line.append(c);
        line_width += w;
    }
}

}  // namespace detail

/// Wrap UTF-8 text into lines of at most `width` terminal columns, breaking
/// at ICU line-break opportunities (spaces, CJK boundaries, hyphens) and
/// honouring explicit newlines. Words longer than a line are split.
inline std::vector<std::string> wrap_text(const std::string& text, int width) {
    std::vector<std::string> lines;
    if (text.empty() || width <= 0) {
        return lines;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> breaker(
        icu::BreakIterator::createLineInstance(icu::Locale::getDefault(), status)
    );

    icu::UnicodeString line;
    int line_width = 0;

    if (U_FAILURE(status) || !breaker) {
        // Fallback: break purely on width
        detail::hard_split(unicode_text, width, lines, line, line_width);
        if (!line.isEmpty()) {
            lines.push_back(detail::to_utf8(detail::trim_trailing_space(line)));
        }
        return lines;
    }

    breaker->setText(unicode_text);

    int32_t start = breaker->first();
    for (int32_t end = breaker->next(); end != icu::BreakIterator::DONE; start = end, end = breaker->next()) {
        icu::UnicodeString segment(unicode_text, start, end - start);
        bool hard_break = breaker->getRuleStatus() >= UBRK_LINE_HARD;

        icu::UnicodeString visible = detail::trim_trailing_space(segment);
        int visible_width = display_width(visible);

        if (line_width > 0 && line_width + visible_width > width) {
            lines.push_back(detail::to_utf8(detail::trim_trailing_space(line)));
            line.remove();
            line_width = 0;
        }

        if (visible_width > width) {
            detail::hard_split(visible, width, lines, line, line_width);
        } else {
            line.append(visible);
            line_width += visible_width;
        }

        // Trailing spaces only count while there is room for them
        int space_width = display_width(segment) - visible_width;
        if (!hard_break && space_width > 0 && line_width + space_width <= width) {
            line.append(icu::UnicodeString(segment, visible.length()));
            line_width += space_width;
        }

        if (hard_break) {
            lines.push_back(detail::to_utf8(detail::trim_trailing_space(line)));
            line.remove();
            line_width = 0;
        }
    }

    if (!line.isEmpty()) {
        lines.push_back(detail::to_utf8(detail::trim_trailing_space(line)));
    }

    return lines;
}

} // namespace halo::util
