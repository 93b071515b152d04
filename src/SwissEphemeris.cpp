#include "SwissEphemeris.hpp"

#include <filesystem>
#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

extern "C" {
#include "swephexp.h"
}

#include "Errors.hpp"

namespace chartwheel {

namespace {

std::mutex& sweMutex() {
    static std::mutex m;
    return m;
}

int sweBody(Body body, NodeType node) {
    switch (body) {
    case Body::Sun:       return SE_SUN;
    case Body::Moon:      return SE_MOON;
    case Body::Mercury:   return SE_MERCURY;
    case Body::Venus:     return SE_VENUS;
    case Body::Mars:      return SE_MARS;
    case Body::Jupiter:   return SE_JUPITER;
    case Body::Saturn:    return SE_SATURN;
    case Body::Uranus:    return SE_URANUS;
    case Body::Neptune:   return SE_NEPTUNE;
    case Body::Pluto:     return SE_PLUTO;
    case Body::NorthNode: return node == NodeType::Mean ? SE_MEAN_NODE : SE_TRUE_NODE;
    case Body::SouthNode: break;
    }
    throw std::invalid_argument(std::string("no Swiss Ephemeris body for ") + bodyName(body));
}

int sweSiderealMode(SiderealFrame frame) {
    switch (frame) {
    case SiderealFrame::FaganBradley: return SE_SIDM_FAGAN_BRADLEY;
    case SiderealFrame::Lahiri:       return SE_SIDM_LAHIRI;
    case SiderealFrame::DeLuce:       return SE_SIDM_DELUCE;
    case SiderealFrame::Raman:        return SE_SIDM_RAMAN;
    case SiderealFrame::Krishnamurti: return SE_SIDM_KRISHNAMURTI;
    case SiderealFrame::Yukteshwar:   return SE_SIDM_YUKTESHWAR;
    }
    return SE_SIDM_FAGAN_BRADLEY;
}

} // namespace

SwissEphemeris::SwissEphemeris(const std::string& ephePath) {
    std::lock_guard<std::mutex> lock(sweMutex());
    if (ephePath.empty()) {
        swe_set_ephe_path(nullptr);  // SE_EPHE_PATH env or library default
        spdlog::debug("Swiss Ephemeris using default ephemeris path");
        return;
    }
    namespace fs = std::filesystem;
    fs::path ephe = ephePath;
    if (!ephe.is_absolute())
        ephe = fs::weakly_canonical(fs::current_path() / ephe);
    path = ephe.string();
    swe_set_ephe_path(path.c_str());
    spdlog::debug("Swiss Ephemeris path set to {}", path);
}

SwissEphemeris::~SwissEphemeris() {
    std::lock_guard<std::mutex> lock(sweMutex());
    swe_close(); // free memory allocated by Swiss Ephemeris
}

EclipticPosition SwissEphemeris::position(const Moment& t, Body body, Center center, NodeType node) const {
    if (isNode(body) && center == Center::Heliocentric)
        throw UnsupportedFrameError(std::string(bodyName(body)) + " is defined only in the geocentric frame");

    int32 flags = SEFLG_SWIEPH | SEFLG_SPEED;
    if (center == Center::Heliocentric) flags |= SEFLG_HELCTR;

    double xx[6]; char serr[AS_MAXCH] = { 0 };
    int32 rc;
    {
        std::lock_guard<std::mutex> lock(sweMutex());
        rc = swe_calc_ut(t.julianDayUT(), sweBody(body, node), flags, xx, serr);
    }
    if (rc < 0)
        throw EphemerisRangeError(body, std::string("swe_calc_ut: ") + serr);
    if (serr[0] != '\0')
        spdlog::debug("swe_calc_ut({}): {}", bodyName(body), serr);

    EclipticPosition p;
    p.longitude = xx[0];
    p.latitude = xx[1];
    p.distance = xx[2];
    p.speed = xx[3];
    return p;
}

double SwissEphemeris::ayanamsa(const Moment& t, SiderealFrame frame) const {
    double daya = 0.0; char serr[AS_MAXCH] = { 0 };
    int32 rc;
    {
        std::lock_guard<std::mutex> lock(sweMutex());
        swe_set_sid_mode(sweSiderealMode(frame), 0, 0);
        rc = swe_get_ayanamsa_ex_ut(t.julianDayUT(), SEFLG_SWIEPH, &daya, serr);
    }
    if (rc < 0)
        throw EphemerisRangeError(std::string("swe_get_ayanamsa_ex_ut: ") + serr);
    return daya;
}

OracleHouses SwissEphemeris::houses(const Moment& t, double lat, double lon, char hsys) const {
    double cusps[13]; // house cusps 1..12 (0 unused)
    double ascmc[10]; // ascmc[SE_ASC], ascmc[SE_MC], ...
    int rc;
    {
        std::lock_guard<std::mutex> lock(sweMutex());
        rc = swe_houses_ex(t.julianDayUT(), SEFLG_SWIEPH, lat, lon, hsys, cusps, ascmc);
    }
    // Placidus has no solution inside the polar circles; the library then
    // substitutes Porphyry cusps and reports ERR
    if (rc == ERR)
        throw HouseSystemDegenerateError(std::string("swe_houses_ex failed for house system '") + hsys + "'");

    OracleHouses H;
    for (int i = 0; i < 12; ++i) H.cusps[i] = cusps[i + 1];
    H.ascendant = ascmc[SE_ASC];
    H.midheaven = ascmc[SE_MC];
    return H;
}

std::string SwissEphemeris::name() const {
    char version[AS_MAXCH] = { 0 };
    swe_version(version);
    return std::string("Swiss Ephemeris ") + version;
}

} // namespace chartwheel
