#pragma once
#include <string>

/**
 * Minimal ANSI terminal helper.
 *
 * Colors can be switched off globally through term::g_enabled (--no-color).
 * Cursor movement is never switched off: the renderer's repaint relies on it.
 */

namespace term {

inline bool g_enabled = true;

inline const char* reset()   { return g_enabled ? "\x1b[0m"  : ""; }
inline const char* bold()    { return g_enabled ? "\x1b[1m"  : ""; }
inline const char* header()  { return g_enabled ? "\x1b[95m" : ""; }
inline const char* cyan()    { return g_enabled ? "\x1b[96m" : ""; }
inline const char* green()   { return g_enabled ? "\x1b[92m" : ""; }
inline const char* yellow()  { return g_enabled ? "\x1b[93m" : ""; }
inline const char* red()     { return g_enabled ? "\x1b[91m" : ""; }

// Cursor up one line, then clear that line.
inline const char* erase_line_above() { return "\x1b[A\x1b[K"; }

inline std::string colorize(const std::string& s, const char* color) {
    if (!g_enabled) return s;
    return std::string(color) + s + reset();
}

} // namespace term
