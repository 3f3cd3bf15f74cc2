#pragma once

#include "../debug.hpp"

#include <string>

namespace caret::debug::pos {

/// Position/Span メッセージID
enum class Id {
    Make,
    OutOfRange,
    NotCharBoundary,
    Inverted,
    InputMismatch,
};

/// メッセージテーブル
inline const char* messages[] = {
    // Make
    "Creating position",
    // OutOfRange
    "Offset out of range",
    // NotCharBoundary
    "Offset is not on a character boundary",
    // Inverted
    "Span start is after end",
    // InputMismatch
    "Positions refer to different inputs",
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)];
}

inline void log(Id id, ::caret::debug::Level level = ::caret::debug::Level::Debug) {
    if (!::caret::debug::enabled(level))
        return;
    ::caret::debug::log(::caret::debug::Stage::Position, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::caret::debug::Level level = ::caret::debug::Level::Debug) {
    if (!::caret::debug::enabled(level))
        return;
    ::caret::debug::log(::caret::debug::Stage::Position, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace caret::debug::pos
