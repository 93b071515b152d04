#include "Angles.hpp"

#include <iomanip>
#include <sstream>

namespace chartwheel {

const char* const SIGN_NAMES[12] = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces"
};

const char* const SIGN_GLYPHS[12] = {
    u8"♈︎", u8"♉︎", u8"♊︎", u8"♋︎", u8"♌︎", u8"♍︎",
    u8"♎︎", u8"♏︎", u8"♐︎", u8"♑︎", u8"♒︎", u8"♓︎"
};

DMS toDMS(double degrees) {
    double d = std::floor(degrees);
    double mfull = (degrees - d) * 60.0;
    double m = std::floor(mfull);
    double s = (mfull - m) * 60.0;
    return { (int)d, (int)m, s };
}

int signIndex(double lon) {
    return static_cast<int>(norm360(lon) / 30.0) % 12;
}

std::string fmtLongitude(double lon, bool asciiDegrees) {
    lon = norm360(lon);
    int signIdx = signIndex(lon);
    double within = std::fmod(lon, 30.0);
    auto dms = toDMS(within);
    std::ostringstream os;
    os << SIGN_NAMES[signIdx] << " "
        << dms.deg << (asciiDegrees ? " deg " : u8"° ") << std::setfill('0')
        << std::setw(2) << dms.min << "' "
        << std::fixed << std::setprecision(2) << dms.sec << "\"";
    return os.str();
}

std::string fmtZodiac(double lon, bool asciiDegrees) {
    lon = norm360(lon);
    int si = signIndex(lon);
    double x = lon - si * 30.0;
    int d = (int)x;
    double mfull = (x - d) * 60.0;
    int m = (int)mfull;
    int s = (int)std::lround((mfull - m) * 60.0);
    if (s == 60) { s = 0; ++m; }
    if (m == 60) { m = 0; ++d; }
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << d << (asciiDegrees ? "d" : u8"°")
        << std::setw(2) << m << "'" << std::setw(2) << s << "\" " << SIGN_NAMES[si];
    return os.str();
}

} // namespace chartwheel
