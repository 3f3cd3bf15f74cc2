#pragma once

#include "../debug.hpp"

#include <string>

namespace caret::debug::diag {

/// 診断メッセージ・整形のメッセージID
enum class Id {
    Rename,
    RenameSkipped,
    UnknownError,
    Report,
    SpanUnderline,
    PointUnderline,
};

/// メッセージテーブル
inline const char* messages[] = {
    // Rename
    "Renaming rules of parsing error",
    // RenameSkipped
    "Rename skipped for custom error",
    // UnknownError
    "No attempts recorded",
    // Report
    "Rendering report",
    // SpanUnderline
    "Span underline",
    // PointUnderline
    "Point underline",
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)];
}

inline void log(Id id, ::caret::debug::Level level = ::caret::debug::Level::Debug) {
    if (!::caret::debug::enabled(level))
        return;
    ::caret::debug::log(::caret::debug::Stage::Render, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::caret::debug::Level level = ::caret::debug::Level::Debug) {
    if (!::caret::debug::enabled(level))
        return;
    ::caret::debug::log(::caret::debug::Stage::Render, level,
                        std::string(get(id)) + ": " + detail);
}

/// Message 段階への出力
inline void log_message(Id id, const std::string& detail,
                        ::caret::debug::Level level = ::caret::debug::Level::Trace) {
    if (!::caret::debug::enabled(level))
        return;
    ::caret::debug::log(::caret::debug::Stage::Message, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace caret::debug::diag
