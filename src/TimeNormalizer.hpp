#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <date/date.h>

namespace chartwheel {

// Calendar fields; year uses astronomical numbering (0 = 1 BC).
struct CivilDateTime {
    int year{}, month{}, day{};
    int hour{}, minute{}, second{};

    double decimalHour() const { return hour + minute / 60.0 + second / 3600.0; }
    std::string str() const;     // "YYYY-MM-DD HH:MM"
    std::string isoUtc() const;  // "YYYY-MM-DDTHH:MMZ"
};

// Julian Day referenced to Universal Time.
class Moment {
public:
    explicit Moment(double jd_ut) : jd_ut(jd_ut) {}
    double julianDayUT() const { return jd_ut; }
private:
    double jd_ut;
};

struct TimezoneSpec {
    bool fixed{true};
    double offsetHours{0.0};  // used when fixed, never DST-adjusted
    std::string tzid;         // IANA name, used when !fixed

    static TimezoneSpec fixedOffset(double hours) { return { true, hours, {} }; }
    static TimezoneSpec named(std::string zone) { return { false, 0.0, std::move(zone) }; }
};

struct NormalizedTime {
    Moment moment{0.0};
    CivilDateTime local;
    CivilDateTime utc;
    double utcOffsetHours{};
    std::string zoneLabel;   // "UTC-5 (fixed)" or the zone name
};

// Parse "[+-]YYYY-MM-DD" and "HH:MM[:SS]"; throws MalformedInputError.
CivilDateTime parseCivil(const std::string& date, const std::string& time);

// "YYYY-MM-DD HH:MM[:SS]" in one string, as the export range is given.
CivilDateTime parseCivil(const std::string& dateTime);

NormalizedTime resolveLocalTime(const CivilDateTime& local, const TimezoneSpec& tz);
NormalizedTime normalizeUtc(date::sys_seconds utc);

Moment normalize(const std::string& dateText, const std::string& timeText, const TimezoneSpec& tz);

double julianDay(const CivilDateTime& utc);
date::sys_seconds toSysTime(const CivilDateTime& utc);

} // namespace chartwheel
