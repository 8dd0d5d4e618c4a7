#pragma once
#include <string>

namespace kpmdos {

/**
 Minimal console logger

 Info messages go to stdout and warnings to stderr. Debug messages are compiled in
 only when `KPMDOS_DEBUG` is defined.
 */
class Log {
public:
    /// info
    static void i(std::string const& str, bool new_line = true, int width = 0);
    /// warning
    static void w(std::string const& str);
    /// debug
#ifdef KPMDOS_DEBUG
    static void d(std::string const& str, bool new_line = true, int width = 0) {
        i("[debug] " + str, new_line, width);
    }
#else
    static void d(std::string const&, bool = true, int = 0) { /* pass */ }
#endif
};

} // namespace kpmdos
