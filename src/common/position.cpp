// ============================================================
// Position 実装
// ============================================================

#include "position.hpp"

#include "debug/pos.hpp"
#include "span.hpp"

#include <fmt/format.h>

namespace caret {

namespace {

// UTF-8 の継続バイトか
bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::optional<Position> Position::make(std::string_view input, size_t pos) {
    if (pos > input.size()) {
        debug::pos::log(debug::pos::Id::OutOfRange,
                        fmt::format("pos={} len={}", pos, input.size()), debug::Level::Warn);
        return std::nullopt;
    }
    if (pos < input.size() && is_continuation(input[pos])) {
        debug::pos::log(debug::pos::Id::NotCharBoundary, fmt::format("pos={}", pos),
                        debug::Level::Warn);
        return std::nullopt;
    }
    debug::pos::log(debug::pos::Id::Make, fmt::format("pos={}", pos), debug::Level::Trace);
    return Position(input, pos);
}

LineColumn Position::line_col() const {
    uint32_t line = 1;
    uint32_t column = 1;

    for (size_t i = 0; i < pos_; ++i) {
        char c = input_[i];
        if (c == '\n') {
            ++line;
            column = 1;
        } else if (c == '\r' && i + 1 < pos_ && input_[i + 1] == '\n') {
            // "\r\n" は次の '\n' で改行として数える
            continue;
        } else if (!is_continuation(c)) {
            ++column;
        }
    }

    return LineColumn{line, column};
}

std::string_view Position::line_of() const {
    size_t start = 0;
    if (pos_ > 0) {
        size_t nl = input_.rfind('\n', pos_ - 1);
        if (nl != std::string_view::npos) {
            start = nl + 1;
        }
    }

    size_t end = input_.find('\n', pos_);
    if (end == std::string_view::npos) {
        end = input_.size();
    }

    // 改行文字を除去
    if (end > start && input_[end - 1] == '\r') {
        --end;
    }

    return input_.substr(start, end - start);
}

std::optional<Span> Position::span(const Position& other) const {
    if (!same_input(other)) {
        debug::pos::log(debug::pos::Id::InputMismatch, debug::Level::Warn);
        return std::nullopt;
    }
    return Span::make(input_, pos_, other.pos_);
}

}  // namespace caret
