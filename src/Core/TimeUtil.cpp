/**
 * @file TimeUtil.cpp
 * @brief Implementation file.
 */
#include "Core/TimeUtil.h"
#include "Domain/ControlDefaults.h"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>

namespace {

int64_t floorDiv(int64_t a, int64_t b)
{
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool parseField(const char*& p, long maxValue, uint8_t& out)
{
    if (!isdigit((unsigned char)p[0]) || !isdigit((unsigned char)p[1])) return false;
    const long v = (p[0] - '0') * 10 + (p[1] - '0');
    if (v > maxValue) return false;
    out = (uint8_t)v;
    p += 2;
    return true;
}

}  // namespace

EpochMs TimeUtil::dayStartMs(EpochMs t)
{
    return floorDiv(t, ControlDefaults::MsPerDay) * ControlDefaults::MsPerDay;
}

int64_t TimeUtil::timeOfDayMs(EpochMs t)
{
    return t - dayStartMs(t);
}

EpochMs TimeUtil::fromUtc(int year, int month, int day, int hour, int minute, int second, int millis)
{
    struct tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    // timegm normalizes out-of-range fields (hour 24 is the next day).
    const time_t secs = timegm(&t);
    return (EpochMs)secs * ControlDefaults::MsPerSecond + millis;
}

bool TimeUtil::parseTimeOfDay(const char* text, TimeOfDay& out)
{
    if (!text) return false;
    const char* p = text;
    TimeOfDay tod{};

    if (!parseField(p, 23, tod.hour)) return false;
    if (*p++ != ':') return false;
    if (!parseField(p, 59, tod.minute)) return false;
    if (*p == ':') {
        ++p;
        if (!parseField(p, 59, tod.second)) return false;
    }
    if (*p != '\0') return false;

    out = tod;
    return true;
}

bool TimeUtil::formatIso8601(EpochMs t, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    const int64_t secs = floorDiv(t, ControlDefaults::MsPerSecond);
    const unsigned ms = (unsigned)(t - secs * ControlDefaults::MsPerSecond);

    const time_t tt = (time_t)secs;
    struct tm utc{};
    if (!gmtime_r(&tt, &utc)) return false;

    const int wrote = snprintf(out, outLen, "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                               utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                               utc.tm_hour, utc.tm_min, utc.tm_sec, ms);
    return (wrote > 0) && ((size_t)wrote < outLen);
}
