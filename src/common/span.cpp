// ============================================================
// Span 実装
// ============================================================

#include "span.hpp"

#include "debug/pos.hpp"

#include <fmt/format.h>

namespace caret {

std::optional<Span> Span::make(std::string_view input, size_t start, size_t end) {
    if (start > end) {
        debug::pos::log(debug::pos::Id::Inverted, fmt::format("start={} end={}", start, end),
                        debug::Level::Warn);
        return std::nullopt;
    }
    // 両端とも有効な位置であること
    if (!Position::make(input, start) || !Position::make(input, end)) {
        return std::nullopt;
    }
    return Span(input, start, end);
}

Position Span::start_pos() const {
    return Position(input_, start_);
}

Position Span::end_pos() const {
    return Position(input_, end_);
}

}  // namespace caret
