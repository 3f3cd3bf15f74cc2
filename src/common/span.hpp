#pragma once

#include "position.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace caret {

/// ソースコード内の範囲 [start, end)
class Span {
   public:
    /// 範囲を作成（start > end、範囲外、文字境界外なら nullopt）
    static std::optional<Span> make(std::string_view input, size_t start, size_t end);

    size_t start() const { return start_; }  // 開始オフセット（バイト）
    size_t end() const { return end_; }      // 終了オフセット（バイト）

    size_t length() const { return end_ - start_; }
    bool is_empty() const { return start_ == end_; }

    Position start_pos() const;
    Position end_pos() const;

    /// 開始・終了位置に分割
    std::pair<Position, Position> split() const { return {start_pos(), end_pos()}; }

    /// 範囲内のテキスト
    std::string_view as_str() const { return input_.substr(start_, end_ - start_); }

    std::string_view input() const { return input_; }

    bool operator==(const Span& other) const {
        return input_.data() == other.input_.data() && input_.size() == other.input_.size() &&
               start_ == other.start_ && end_ == other.end_;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }

   private:
    Span(std::string_view input, size_t start, size_t end)
        : input_(input), start_(start), end_(end) {}

    std::string_view input_;
    size_t start_;
    size_t end_;
};

}  // namespace caret

namespace std {

template <>
struct hash<caret::Span> {
    size_t operator()(const caret::Span& span) const {
        size_t seed = std::hash<const char*>{}(span.input().data());
        seed = caret::hash_combine(seed, std::hash<size_t>{}(span.input().size()));
        seed = caret::hash_combine(seed, std::hash<size_t>{}(span.start()));
        return caret::hash_combine(seed, std::hash<size_t>{}(span.end()));
    }
};

}  // namespace std
