#include "ui/Formatting.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace halo::ui {

namespace {

// Length of a CSI sequence (\x1B[...<final>) starting at i, or 0
size_t csi_length(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') {
        return 0;
    }
    size_t j = i + 2;
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) {
        j++;
    }
    if (j < s.size()) j++; // Skip final byte
    return j - i;
}

size_t utf8_len(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1; // Invalid, skip
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (size_t esc = csi_length(s, i)) {
            i += esc;
            continue;
        }
        size_t len = std::min(utf8_len(s[i]), s.size() - i);
        cols += halo::util::display_width(s.substr(i, len));
        i += len;
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    size_t i = 0;

    while (i < s.size()) {
        if (size_t esc = csi_length(s, i)) {
            out.append(s, i, esc);
            i += esc;
            continue;
        }

        size_t len = std::min(utf8_len(s[i]), s.size() - i);
        int w = halo::util::display_width(s.substr(i, len));
        if (seen + w > cols) break;

        out.append(s, i, len);
        i += len;
        seen += w;
    }

    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);

    if (cols == w) {
        return s; // Perfect fit
    }

    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    // Truncate with ellipsis
    if (w <= 1) {
        return take_cols(s, w);
    }

    std::string cut = take_cols(s, w - 1) + "…";
    int cut_cols = display_cols(cut);
    return cut_cols < w ? cut + std::string(w - cut_cols, ' ') : cut;
}

int center_offset(const std::string& s, int width) {
    return std::max(0, (width - display_cols(s)) / 2);
}

} // namespace halo::ui
