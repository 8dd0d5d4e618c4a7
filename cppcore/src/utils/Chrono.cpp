#include "utils/Chrono.hpp"

#include <fmt/format.h>

namespace kpmdos {

std::string Chrono::str() const {
    using namespace std::chrono;
    using fmilli = duration<double, std::milli>;
    using fseconds = duration<double>;

    if (elapsed < milliseconds{1}) {
        return fmt::format("{:.2f}ms", duration_cast<fmilli>(elapsed).count());
    } else if (elapsed < milliseconds{10}) {
        return fmt::format("{:.1f}ms", duration_cast<fmilli>(elapsed).count());
    } else if (elapsed < milliseconds{100}) {
        return fmt::format("{}ms", duration_cast<milliseconds>(elapsed).count());
    } else if (elapsed < seconds{10}) {
        return fmt::format("{:.2f}s", duration_cast<fseconds>(elapsed).count());
    } else if (elapsed < seconds{60}) {
        return fmt::format("{:.1f}s", duration_cast<fseconds>(elapsed).count());
    }

    auto const min = duration_cast<minutes>(elapsed);
    auto const sec = duration_cast<seconds>(elapsed) - min;
    if (min < hours{1}) {
        return fmt::format("{}:{:02}", min.count(), sec.count());
    }

    auto const hr = duration_cast<hours>(min);
    return fmt::format("{}:{:02}:{:02}", hr.count(), (min - hr).count(), sec.count());
}

} // namespace kpmdos
