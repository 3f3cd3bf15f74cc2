#pragma once

// ============================================================
// 診断メッセージ - 期待/非期待ルールの列挙
// ============================================================

#include "common/debug/diag.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace caret {

/// 文字列・文字として扱うルール型か
template <typename R>
inline constexpr bool is_text_rule_v =
    std::is_same_v<R, std::string> || std::is_same_v<R, std::string_view> ||
    std::is_same_v<R, const char*> || std::is_same_v<R, char*> || std::is_same_v<R, char>;

/// ルールのデフォルト表示（デバッグ形式）
/// 文字列・文字は "{:?}" で引用符付き・エスケープ済み、それ以外は "{}"
template <typename R>
std::string default_rule_name(const R& rule) {
    if constexpr (is_text_rule_v<R>) {
        return fmt::format("{:?}", rule);
    } else {
        return fmt::format("{}", rule);
    }
}

/// ルール列を英語の列挙として整形
///   1件:    "a"
///   2件:    "a or b"
///   3件以上: "a, b, or c"
/// 空の列は空文字列になる。呼び出し順は先頭から一度ずつ。
template <typename R, typename F>
std::string enumerate(const std::vector<R>& rules, F&& f) {
    switch (rules.size()) {
        case 0:
            return "";
        case 1:
            return f(rules[0]);
        case 2: {
            std::string first = f(rules[0]);
            std::string second = f(rules[1]);
            return fmt::format("{} or {}", first, second);
        }
        default: {
            std::vector<std::string> head;
            head.reserve(rules.size() - 1);
            for (size_t i = 0; i + 1 < rules.size(); ++i) {
                head.push_back(f(rules[i]));
            }
            std::string last = f(rules.back());
            return fmt::format("{}, or {}", fmt::join(head, ", "), last);
        }
    }
}

/// 構文エラーのメッセージを組み立てる
template <typename R, typename F>
std::string parsing_error_message(const std::vector<R>& positives, const std::vector<R>& negatives,
                                  F&& f) {
    bool has_negatives = !negatives.empty();
    bool has_positives = !positives.empty();

    if (has_negatives && has_positives) {
        std::string unexpected = enumerate(negatives, f);
        std::string expected = enumerate(positives, f);
        return fmt::format("unexpected {}; expected {}", unexpected, expected);
    }
    if (has_negatives) {
        return fmt::format("unexpected {}", enumerate(negatives, f));
    }
    if (has_positives) {
        return fmt::format("expected {}", enumerate(positives, f));
    }

    debug::diag::log_message(debug::diag::Id::UnknownError, "positives and negatives are empty");
    return "unknown parsing error";
}

}  // namespace caret
