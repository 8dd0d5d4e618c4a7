#include "kpm/Stats.hpp"

#include <fmt/format.h>

namespace kpmdos { namespace kpm {

namespace {
    /// Convert number to string with SI suffix, e.g.: 14226 -> 14.2k, 5395984 -> 5.4M
    std::string with_suffix(double number) {
        struct Pair {
            double value;
            char const* suffix;
        };
        static constexpr Pair mapping[] = {{1e9, "G"}, {1e6, "M"}, {1e3, "k"}};

        for (auto const& bucket : mapping) {
            if (number > 0.999 * bucket.value) {
                return fmt::format("{:.3g}{}", number / bucket.value, bucket.suffix);
            }
        }
        return fmt::format("{:.3g}", number);
    }
}

std::string format_report(std::string const& msg, Chrono const& time, bool shortform) {
    auto const fmt_str = shortform ? "{:s} [{}] " : "- {:<80s} | {}\n";
    return fmt::format(fmt::runtime(fmt_str), msg, time.str());
}

void Stats::add(idx_t products, Chrono const& timer) {
    num_products += products;
    moments_timer += timer;
}

double Stats::mvps() const {
    auto const seconds = moments_timer.elapsed_seconds();
    return seconds > 0 ? static_cast<double>(num_products) / seconds : 0.0;
}

std::string Stats::report(bool shortform) const {
    auto const fmt_str = shortform ? "{} x {} @ {}mvps"
                                   : "KPM calculated {} moments for {} random vectors "
                                     "at {} matrix-vector products per second";
    auto const msg = fmt::format(fmt::runtime(fmt_str), num_moments, num_vectors,
                                 with_suffix(mvps()));
    return format_report(msg, moments_timer, shortform);
}

}} // namespace kpmdos::kpm
