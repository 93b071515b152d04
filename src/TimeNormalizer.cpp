#include "TimeNormalizer.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

#include <date/tz.h>
#include <spdlog/spdlog.h>

extern "C" {
#include "swephexp.h"
}

#include "Errors.hpp"
#include "Strings.hpp"

namespace chartwheel {

namespace {

constexpr double kMaxUtcOffsetHours = 18.0;
constexpr int kMaxYear = 30000;

void putDate(std::ostream& os, const CivilDateTime& c) {
    if (c.year < 0) os << '-';
    os << std::setfill('0') << std::setw(4) << std::abs(c.year) << '-'
        << std::setw(2) << c.month << '-' << std::setw(2) << c.day;
}

CivilDateTime fromSysTime(date::sys_seconds t) {
    auto dp = date::floor<date::days>(t);
    date::year_month_day ymd{ dp };
    date::hh_mm_ss<std::chrono::seconds> tod{ t - dp };
    CivilDateTime c;
    c.year = (int)ymd.year();
    c.month = (int)(unsigned)ymd.month();
    c.day = (int)(unsigned)ymd.day();
    c.hour = (int)tod.hours().count();
    c.minute = (int)tod.minutes().count();
    c.second = (int)tod.seconds().count();
    return c;
}

date::local_seconds toLocalTime(const CivilDateTime& c) {
    return date::local_days{ date::year{ c.year } / c.month / c.day }
        + std::chrono::hours{ c.hour } + std::chrono::minutes{ c.minute } + std::chrono::seconds{ c.second };
}

std::string fixedLabel(double hours) {
    std::ostringstream os;
    os << "UTC" << std::showpos;
    if (hours == std::floor(hours)) os << (int)hours;
    else os << std::fixed << std::setprecision(2) << hours;
    os << " (fixed)";
    return os.str();
}

} // namespace

std::string CivilDateTime::str() const {
    std::ostringstream os;
    putDate(os, *this);
    os << ' ' << std::setw(2) << hour << ':' << std::setw(2) << minute;
    if (second != 0) os << ':' << std::setw(2) << second;
    return os.str();
}

std::string CivilDateTime::isoUtc() const {
    std::ostringstream os;
    putDate(os, *this);
    os << 'T' << std::setw(2) << hour << ':' << std::setw(2) << minute << 'Z';
    return os.str();
}

CivilDateTime parseCivil(const std::string& dateText, const std::string& timeText) {
    static const std::regex kDate(R"(^([+-]?\d{1,5})-(\d{1,2})-(\d{1,2})$)");
    static const std::regex kTime(R"(^(\d{1,2}):(\d{2})(?::(\d{2}))?$)");

    std::smatch dm, tm;
    const std::string d = trim(dateText), t = trim(timeText);
    if (!std::regex_match(d, dm, kDate))
        throw MalformedInputError("malformed date '" + dateText + "', expected YYYY-MM-DD");
    if (!std::regex_match(t, tm, kTime))
        throw MalformedInputError("malformed time '" + timeText + "', expected HH:MM[:SS]");

    CivilDateTime c;
    c.year = std::stoi(dm[1].str());
    c.month = std::stoi(dm[2].str());
    c.day = std::stoi(dm[3].str());
    c.hour = std::stoi(tm[1].str());
    c.minute = std::stoi(tm[2].str());
    c.second = tm[3].matched ? std::stoi(tm[3].str()) : 0;
    if (std::abs(c.year) > kMaxYear)
        throw MalformedInputError("year out of range: " + d);

    date::year_month_day ymd{ date::year{ c.year }, date::month{ (unsigned)c.month }, date::day{ (unsigned)c.day } };
    if (c.month < 1 || c.month > 12 || c.day < 1 || !ymd.ok())
        throw MalformedInputError("date out of calendar range: " + d);
    if (c.hour > 23 || c.minute > 59 || c.second > 59)
        throw MalformedInputError("time out of range: " + t);
    return c;
}

CivilDateTime parseCivil(const std::string& dateTime) {
    auto s = trim(dateTime);
    auto sep = s.find_first_of(" T");
    if (sep == std::string::npos)
        throw MalformedInputError("malformed date/time '" + dateTime + "', expected YYYY-MM-DD HH:MM");
    return parseCivil(s.substr(0, sep), s.substr(sep + 1));
}

date::sys_seconds toSysTime(const CivilDateTime& utc) {
    return date::sys_seconds{ toLocalTime(utc).time_since_epoch() };
}

double julianDay(const CivilDateTime& utc) {
    return swe_julday(utc.year, utc.month, utc.day, utc.decimalHour(), SE_GREG_CAL);
}

NormalizedTime resolveLocalTime(const CivilDateTime& local, const TimezoneSpec& tz) {
    const date::local_seconds lt = toLocalTime(local);
    date::sys_seconds st;
    NormalizedTime out;

    if (tz.fixed) {
        if (!std::isfinite(tz.offsetHours) || std::fabs(tz.offsetHours) > kMaxUtcOffsetHours) {
            std::ostringstream os;
            os << "UTC offset out of range: " << tz.offsetHours;
            throw MalformedInputError(os.str());
        }
        std::chrono::seconds offset{ std::lround(tz.offsetHours * 3600.0) };
        st = date::sys_seconds{ lt.time_since_epoch() - offset };
        out.utcOffsetHours = tz.offsetHours;
        out.zoneLabel = fixedLabel(tz.offsetHours);
    }
    else {
        const date::time_zone* zone = nullptr;
        try {
            zone = date::locate_zone(tz.tzid);  // throws if unknown tzid
        }
        catch (const std::exception& e) {
            spdlog::debug("locate_zone({}) failed: {}", tz.tzid, e.what());
            throw UnknownTimezoneError(tz.tzid);
        }
        // folds pick the earlier instant, gaps map to the transition
        st = zone->to_sys(lt, date::choose::earliest);
        out.utcOffsetHours = (lt.time_since_epoch() - st.time_since_epoch()).count() / 3600.0;
        out.zoneLabel = tz.tzid;
    }

    out.local = local;
    out.utc = fromSysTime(st);
    out.moment = Moment(julianDay(out.utc));
    spdlog::debug("normalized {} [{}] -> {} UTC, JD {:.5f}", local.str(), out.zoneLabel, out.utc.str(),
        out.moment.julianDayUT());
    return out;
}

NormalizedTime normalizeUtc(date::sys_seconds utc) {
    NormalizedTime out;
    out.utc = fromSysTime(utc);
    out.local = out.utc;
    out.utcOffsetHours = 0.0;
    out.zoneLabel = "UTC";
    out.moment = Moment(julianDay(out.utc));
    return out;
}

Moment normalize(const std::string& dateText, const std::string& timeText, const TimezoneSpec& tz) {
    return resolveLocalTime(parseCivil(dateText, timeText), tz).moment;
}

} // namespace chartwheel
