#include "utils/Log.hpp"

#include <iostream>
#include <mutex>

namespace kpmdos {

namespace {
    // Messages may come from the worker threads of a KPM computation
    std::mutex log_mutex;
}

void Log::i(std::string const& str, bool new_line, int width) {
    std::lock_guard<std::mutex> lk(log_mutex);
    if (width) {
        std::cout.setf(std::ios::left);
        std::cout.width(width);
    }
    std::cout << str;

    if (new_line)
        std::cout << std::endl;
    std::cout.width(0);
}

void Log::w(std::string const& str) {
    std::lock_guard<std::mutex> lk(log_mutex);
    std::cerr << "Warning: " << str << std::endl;
}

} // namespace kpmdos
