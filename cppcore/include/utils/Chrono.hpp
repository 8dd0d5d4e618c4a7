#pragma once
#include <string>
#include <chrono>
#include <ostream>

namespace kpmdos {

/**
 High resolution timer (below 1 microsecond accuracy)

 The elapsed time of several `tic()`/`toc()` intervals may be summed with `+=` which
 is used to report the total time spent over multiple refinement calls.
 */
class Chrono {
public:
    using clock = std::chrono::steady_clock;

    Chrono() { tic(); };

    void tic() { tic_time = clock::now(); }

    Chrono& toc() {
        elapsed = clock::now() - tic_time;
        return *this;
    }

    template<class Fn>
    Chrono& timeit(Fn lambda) {
        tic(); lambda(); toc();
        return *this;
    }

    Chrono& operator+=(Chrono const& other) {
        elapsed += other.elapsed;
        return *this;
    }

    void reset() { elapsed = std::chrono::nanoseconds{0}; }

    double elapsed_seconds() const {
        return 1e-9 * static_cast<double>(elapsed.count());
    }

    /// Human readable duration, e.g. "0.35ms", "12ms", "1.5s" or "2:04"
    std::string str() const;

    friend std::ostream& operator<<(std::ostream& os, Chrono const& chrono) {
        return os << chrono.str();
    }

private:
    clock::time_point tic_time;
    std::chrono::nanoseconds elapsed{0};
};

} // namespace kpmdos
