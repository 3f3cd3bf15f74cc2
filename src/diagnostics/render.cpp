// ============================================================
// ソース文脈の描画 実装
// ============================================================

#include "render.hpp"

#include "common/debug/diag.hpp"

#include <fmt/format.h>

namespace caret {
namespace render {

size_t gutter_width(uint32_t line) {
    size_t digits = 1;
    while (line >= 10) {
        line /= 10;
        ++digits;
    }
    return digits;
}

std::string point_underline(size_t offset) {
    debug::diag::log(debug::diag::Id::PointUnderline, fmt::format("offset={}", offset),
                     debug::Level::Trace);

    std::string result(offset, ' ');
    result += POINT_MARKER;
    return result;
}

std::string span_underline(size_t offset, size_t width) {
    debug::diag::log(debug::diag::Id::SpanUnderline,
                     fmt::format("offset={} width={}", offset, width), debug::Level::Trace);

    std::string result(offset, ' ');
    if (width > 1) {
        result += '^';
        result.append(width - 2, '-');
        result += '^';
    } else {
        result += '^';
    }
    return result;
}

std::string report(LineColumn loc, std::string_view line_text, std::string_view underline,
                   std::string_view message) {
    debug::diag::log(debug::diag::Id::Report, fmt::format("{}:{}", loc.line, loc.column));

    std::string spacing(gutter_width(loc.line), ' ');

    std::string result = fmt::format("{}--> {}:{}\n", spacing, loc.line, loc.column);
    result += fmt::format("{} |\n", spacing);
    result += fmt::format("{} | {}\n", loc.line, line_text);
    result += fmt::format("{} | {}\n", spacing, underline);
    result += fmt::format("{} |\n", spacing);
    result += fmt::format("{} = {}", spacing, message);
    return result;
}

}  // namespace render
}  // namespace caret
