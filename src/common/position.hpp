#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace caret {

class Span;

/// ハッシュ値の合成
inline size_t hash_combine(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

/// 行・列情報（エラー表示用）
struct LineColumn {
    uint32_t line;    // 1-indexed
    uint32_t column;  // 1-indexed（コードポイント単位）

    bool operator==(const LineColumn& other) const {
        return line == other.line && column == other.column;
    }
    bool operator!=(const LineColumn& other) const { return !(*this == other); }
};

/// 入力テキスト内の位置
/// 入力は借用するだけでコピーしない。入力の寿命は呼び出し側が保証する。
class Position {
   public:
    /// オフセットから作成（範囲外・文字境界外なら nullopt）
    static std::optional<Position> make(std::string_view input, size_t pos);

    /// 入力の先頭
    static Position from_start(std::string_view input) { return Position(input, 0); }

    /// バイトオフセット
    size_t pos() const { return pos_; }

    /// 借用している入力全体
    std::string_view input() const { return input_; }

    /// 行・列を計算（"\r\n" は1つの改行として数える）
    LineColumn line_col() const;

    /// この位置を含む行（改行文字は含まない）
    std::string_view line_of() const;

    /// この位置から other までの Span（入力が異なる・逆順なら nullopt）
    std::optional<Span> span(const Position& other) const;

    /// 同じ入力を指しているか
    bool same_input(const Position& other) const {
        return input_.data() == other.input_.data() && input_.size() == other.input_.size();
    }

    bool operator==(const Position& other) const {
        return same_input(other) && pos_ == other.pos_;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

   private:
    friend class Span;

    Position(std::string_view input, size_t pos) : input_(input), pos_(pos) {}

    std::string_view input_;
    size_t pos_;
};

}  // namespace caret

/// 入力の同一性とオフセットでハッシュ（operator== と一致）
namespace std {

template <>
struct hash<caret::Position> {
    size_t operator()(const caret::Position& pos) const {
        size_t seed = std::hash<const char*>{}(pos.input().data());
        seed = caret::hash_combine(seed, std::hash<size_t>{}(pos.input().size()));
        return caret::hash_combine(seed, std::hash<size_t>{}(pos.pos()));
    }
};

}  // namespace std
