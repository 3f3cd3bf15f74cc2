#pragma once

// ============================================================
// 構文解析エラー - 3種類のエラー形状と報告の整形
// ============================================================

#include "common/debug/diag.hpp"
#include "common/position.hpp"
#include "common/span.hpp"
#include "message.hpp"
#include "render.hpp"

#include <fmt/format.h>

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace caret {

/// マッチャーが生成する構文エラー
/// 最深到達位置で期待した/拒否したルールを保持する（順序はそのまま）
template <typename R>
struct ParsingError {
    std::vector<R> positives;  // 期待したルール
    std::vector<R> negatives;  // 拒否したルール
    Position pos;              // 最深到達位置

    bool operator==(const ParsingError& other) const {
        return positives == other.positives && negatives == other.negatives && pos == other.pos;
    }
};

/// 位置付きのカスタムエラー
struct CustomErrorPos {
    std::string message;
    Position pos;

    bool operator==(const CustomErrorPos& other) const {
        return message == other.message && pos == other.pos;
    }
};

/// 範囲付きのカスタムエラー
struct CustomErrorSpan {
    std::string message;
    Span span;

    bool operator==(const CustomErrorSpan& other) const {
        return message == other.message && span == other.span;
    }
};

/// 解析エラー
/// R はルール識別子（等値比較・コピー・{fmt} での表示ができる型）
template <typename R>
class Error {
   public:
    using Kind = std::variant<ParsingError<R>, CustomErrorPos, CustomErrorSpan>;

    static Error parsing_error(std::vector<R> positives, std::vector<R> negatives,
                               Position pos) {
        return Error(ParsingError<R>{std::move(positives), std::move(negatives), pos});
    }

    static Error custom_pos(std::string message, Position pos) {
        return Error(CustomErrorPos{std::move(message), pos});
    }

    static Error custom_span(std::string message, Span span) {
        return Error(CustomErrorSpan{std::move(message), span});
    }

    const Kind& kind() const { return kind_; }

    bool is_parsing_error() const { return std::holds_alternative<ParsingError<R>>(kind_); }
    bool is_custom_pos() const { return std::holds_alternative<CustomErrorPos>(kind_); }
    bool is_custom_span() const { return std::holds_alternative<CustomErrorSpan>(kind_); }

    /// 構文エラーのルールを f で名前付けし、CustomErrorPos に変換する
    /// カスタムエラーに対しては何もしない
    template <typename F>
    Error renamed_rules(F&& f) && {
        if (auto* parsing = std::get_if<ParsingError<R>>(&kind_)) {
            debug::diag::log(debug::diag::Id::Rename,
                             fmt::format("{} positives, {} negatives", parsing->positives.size(),
                                         parsing->negatives.size()));
            std::string message =
                parsing_error_message(parsing->positives, parsing->negatives, f);
            return custom_pos(std::move(message), parsing->pos);
        }
        debug::diag::log(debug::diag::Id::RenameSkipped, debug::Level::Trace);
        return std::move(*this);
    }

    template <typename F>
    Error renamed_rules(F&& f) const& {
        return Error(*this).renamed_rules(std::forward<F>(f));
    }

    /// 報告末尾に表示するメッセージ
    std::string message() const {
        if (auto* parsing = std::get_if<ParsingError<R>>(&kind_)) {
            return parsing_error_message(parsing->positives, parsing->negatives,
                                         [](const R& rule) { return default_rule_name(rule); });
        }
        if (auto* custom = std::get_if<CustomErrorPos>(&kind_)) {
            return custom->message;
        }
        return std::get<CustomErrorSpan>(kind_).message;
    }

    /// 報告の基準位置（範囲エラーは開始位置）
    Position anchor_position() const {
        return std::visit(
            [](const auto& e) -> Position {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, CustomErrorSpan>) {
                    return e.span.split().first;
                } else {
                    return e.pos;
                }
            },
            kind_);
    }

    /// offset 個の空白に続く下線
    std::string underline(size_t offset) const {
        if (auto* custom = std::get_if<CustomErrorSpan>(&kind_)) {
            return render::span_underline(offset, custom->span.end() - custom->span.start());
        }
        return render::point_underline(offset);
    }

    /// ソース文脈付きの報告全体
    std::string to_string() const {
        Position pos = anchor_position();
        LineColumn loc = pos.line_col();
        return render::report(loc, pos.line_of(), underline(loc.column - 1), message());
    }

    /// 一行の説明
    std::string_view description() const {
        if (auto* custom = std::get_if<CustomErrorPos>(&kind_)) {
            return custom->message;
        }
        if (auto* custom = std::get_if<CustomErrorSpan>(&kind_)) {
            return custom->message;
        }
        return "parsing error";
    }

    bool operator==(const Error& other) const { return kind_ == other.kind_; }
    bool operator!=(const Error& other) const { return !(*this == other); }

   private:
    explicit Error(Kind kind) : kind_(std::move(kind)) {}

    Kind kind_;
};

template <typename R>
std::ostream& operator<<(std::ostream& out, const Error<R>& error) {
    return out << error.to_string();
}

}  // namespace caret

namespace fmt {

/// fmt::format("{}", error) で報告全体を出力
template <typename R>
struct formatter<caret::Error<R>> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const caret::Error<R>& error, FormatContext& ctx) const -> decltype(ctx.out()) {
        return formatter<std::string_view>::format(error.to_string(), ctx);
    }
};

}  // namespace fmt

namespace std {

/// R のハッシュが必要。kind() の形状と中身から計算する
template <typename R>
struct hash<caret::Error<R>> {
    size_t operator()(const caret::Error<R>& error) const {
        size_t seed = std::hash<size_t>{}(error.kind().index());
        std::visit(
            [&seed](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, caret::ParsingError<R>>) {
                    for (const auto& rule : e.positives) {
                        seed = caret::hash_combine(seed, std::hash<R>{}(rule));
                    }
                    // positives と negatives の境界
                    seed = caret::hash_combine(seed, e.positives.size());
                    for (const auto& rule : e.negatives) {
                        seed = caret::hash_combine(seed, std::hash<R>{}(rule));
                    }
                    seed = caret::hash_combine(seed, std::hash<caret::Position>{}(e.pos));
                } else if constexpr (std::is_same_v<T, caret::CustomErrorPos>) {
                    seed = caret::hash_combine(seed, std::hash<std::string>{}(e.message));
                    seed = caret::hash_combine(seed, std::hash<caret::Position>{}(e.pos));
                } else {
                    seed = caret::hash_combine(seed, std::hash<std::string>{}(e.message));
                    seed = caret::hash_combine(seed, std::hash<caret::Span>{}(e.span));
                }
            },
            error.kind());
        return seed;
    }
};

}  // namespace std
