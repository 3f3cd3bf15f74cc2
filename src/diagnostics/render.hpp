#pragma once

// ============================================================
// ソース文脈の描画 - 行番号ガター・下線
// ============================================================

#include "common/position.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace caret {
namespace render {

/// 点位置を示す固定マーカー
inline constexpr std::string_view POINT_MARKER = "^---";

/// 行番号の10進桁数
size_t gutter_width(uint32_t line);

/// 点位置用の下線: offset 個の空白 + "^---"
std::string point_underline(size_t offset);

/// 範囲用の下線: offset 個の空白 + "^--...--^"（幅1以下は "^"）
std::string span_underline(size_t offset, size_t width);

/// 報告ブロックを組み立てる（末尾改行なし）
///
///  --> 2:2
///   |
/// 2 | cd
///   |  ^---
///   |
///   = message
std::string report(LineColumn loc, std::string_view line_text, std::string_view underline,
                   std::string_view message);

}  // namespace render
}  // namespace caret
