// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef timing_hpp
#define timing_hpp

#include <chrono>
#include <ostream>

namespace heredity { namespace utils {

struct TimeInterval
{
    using Clock = std::chrono::steady_clock;
    Clock::time_point start, end;
};

// Milliseconds below one second, otherwise hours, minutes and seconds, e.g. "2m 5s"
inline std::ostream& operator<<(std::ostream& os, const TimeInterval& interval)
{
    using namespace std::chrono;
    const auto elapsed = interval.end - interval.start;
    if (elapsed < seconds {1}) {
        return os << duration_cast<milliseconds>(elapsed).count() << "ms";
    }
    const auto total_seconds = duration_cast<seconds>(elapsed).count();
    const auto hours = total_seconds / 3600;
    const auto minutes = (total_seconds / 60) % 60;
    if (hours > 0) os << hours << "h ";
    if (hours > 0 || minutes > 0) os << minutes << "m ";
    return os << total_seconds % 60 << 's';
}

} // namespace utils
} // namespace heredity

#endif
