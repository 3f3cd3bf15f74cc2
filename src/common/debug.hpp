#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace caret::debug {

/// デバッグモードフラグ
inline bool g_debug_mode = false;

/// デバッグレベル
enum class Level { Trace, Debug, Info, Warn, Error };

/// 現在のデバッグレベル
inline Level g_debug_level = Level::Debug;

/// 出力先（nullptr なら std::cerr）
inline std::ostream* g_sink = nullptr;

/// 診断ライブラリの処理段階
enum class Stage { Position, Message, Render };

/// 段階を文字列に変換
inline const char* stage_str(Stage s) {
    switch (s) {
        case Stage::Position:
            return "POSITION";
        case Stage::Message:
            return "MESSAGE";
        case Stage::Render:
            return "RENDER";
    }
    return "UNKNOWN";
}

/// レベルを文字列に変換
inline const char* level_str(Level l) {
    switch (l) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

/// 出力が有効か
inline bool enabled(Level level) {
    return g_debug_mode && level >= g_debug_level;
}

/// デバッグ出力
inline void log(Stage stage, Level level, const char* msg) {
    if (!enabled(level))
        return;
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[" << stage_str(stage) << "] ";
    // WARN 以上だけレベル名を付ける
    if (level >= Level::Warn) {
        out << level_str(level) << ": ";
    }
    out << msg << std::endl;
}

inline void log(Stage stage, Level level, const std::string& msg) {
    log(stage, level, msg.c_str());
}

/// 設定関数
inline void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}
inline void set_level(Level level) {
    g_debug_level = level;
}
inline void set_sink(std::ostream* sink) {
    g_sink = sink;
}

/// レベル名か
inline bool is_level_name(const std::string& s) {
    return s == "trace" || s == "debug" || s == "info" || s == "warn" || s == "error";
}

/// レベル解析
inline Level parse_level(const std::string& s) {
    if (s == "trace")
        return Level::Trace;
    if (s == "debug")
        return Level::Debug;
    if (s == "info")
        return Level::Info;
    if (s == "warn")
        return Level::Warn;
    if (s == "error")
        return Level::Error;
    return Level::Debug;
}

/// 環境変数から設定を読み込む
/// CARET_DEBUG=1 で有効化、CARET_DEBUG=<level> でレベルも指定
inline void configure_from_env(const char* var = "CARET_DEBUG") {
    const char* value = std::getenv(var);
    if (value == nullptr || value[0] == '\0')
        return;
    std::string s(value);
    if (s == "0")
        return;
    set_debug_mode(true);
    if (is_level_name(s)) {
        set_level(parse_level(s));
    }
}

}  // namespace caret::debug
