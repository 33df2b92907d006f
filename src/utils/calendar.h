#pragma once

#include "model/types.h"
#include <chrono>
#include <cstdio>
#include <string>

namespace fin {

constexpr int64_t kSecondsPerDay = 86400;

struct CivilDate {
    int year;
    unsigned month;  // 1..12
    unsigned day;    // 1..31
};

class Calendar {
public:
    // Days since 1970-01-01 for a proleptic Gregorian date
    static EpochDay days_from_civil(int y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static CivilDate civil_from_days(EpochDay z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return {static_cast<int>(y + (m <= 2)), m, d};
    }

    // Calendar day of a timestamp; time of day is discarded
    static EpochDay day_of(EpochSeconds ts) {
        EpochDay d = ts / kSecondsPerDay;
        if (ts % kSecondsPerDay < 0) --d;
        return d;
    }

    static EpochSeconds start_of_day(EpochDay day) {
        return day * kSecondsPerDay;
    }

    static std::string format_date(EpochDay day) {
        CivilDate c = civil_from_days(day);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", c.year, c.month, c.day);
        return buf;
    }

    static std::string format_timestamp(EpochSeconds ts) {
        EpochDay day = day_of(ts);
        int64_t secs = ts - start_of_day(day);
        CivilDate c = civil_from_days(day);
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                      c.year, c.month, c.day,
                      static_cast<int>(secs / 3600),
                      static_cast<int>((secs % 3600) / 60),
                      static_cast<int>(secs % 60));
        return buf;
    }

    static EpochSeconds now() {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }
};

} // namespace fin
