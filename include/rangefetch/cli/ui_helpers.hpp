#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace rangefetch::cli::ui {

inline bool stderr_is_tty() {
    return ::isatty(::fileno(stderr)) != 0;
}

inline std::string progress_bar(double fraction, size_t width, std::string_view filled = "#",
                                std::string_view empty = "-") {
    if (width == 0)
        return std::string();

    double f = std::clamp(fraction, 0.0, 1.0);
    const size_t fill_cells = static_cast<size_t>(std::llround(f * static_cast<double>(width)));
    std::string out;
    out.reserve(width + 2);
    out.push_back('[');
    for (size_t i = 0; i < fill_cells; ++i)
        out.append(filled);
    for (size_t i = 0; i < width - fill_cells; ++i)
        out.append(empty);
    out.push_back(']');
    return out;
}

inline std::string format_bytes(uint64_t bytes, int precision = 1) {
    if (bytes == 0)
        return "0 B";

    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double value = static_cast<double>(bytes);
    int unit_idx = 0;

    while (value >= 1024.0 && unit_idx < 5) {
        value /= 1024.0;
        ++unit_idx;
    }

    std::ostringstream oss;
    if (unit_idx == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(precision) << value << " " << units[unit_idx];
    }
    return oss.str();
}

} // namespace rangefetch::cli::ui
