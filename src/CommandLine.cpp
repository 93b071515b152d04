#include "CommandLine.hpp"

#include <spdlog/spdlog.h>

#include "Errors.hpp"
#include "HouseCalculator.hpp"
#include "Strings.hpp"

namespace chartwheel {

bpo::options_description commandLineOptions() {
    bpo::options_description options("chartwheel options");
    options.add_options()
        ("help,h", "Print this help")
        ("command", bpo::value<std::string>(), "chart or export")
        ("config,c", bpo::value<std::string>(), "YAML file with chart defaults")
        ("date", bpo::value<std::string>(), "Local date, YYYY-MM-DD")
        ("time", bpo::value<std::string>(), "Local time, HH:MM[:SS]")
        ("tz", bpo::value<std::string>(), "IANA zone, e.g. America/New_York")
        ("offset", bpo::value<double>(), "Fixed UTC offset in hours, e.g. -5")
        ("lat", bpo::value<double>(), "Latitude in degrees, south negative")
        ("lon", bpo::value<double>(), "Longitude in degrees, west negative")
        ("houses", bpo::value<std::string>(), "House system: E, EQUAL_ASC_MID or P")
        ("wheel", "Print the chart wheel geometry")
        ("grid", "Print the aspect grid")
        ("start", bpo::value<std::string>(), "Export start, \"YYYY-MM-DD HH:MM\" UTC")
        ("end", bpo::value<std::string>(), "Export end, \"YYYY-MM-DD HH:MM\" UTC, inclusive")
        ("step", bpo::value<std::string>(), "Export step: hour, 6h or day")
        ("zodiac", bpo::value<std::string>(), "tropical or sidereal")
        ("center", bpo::value<std::string>(), "geo or helio")
        ("nodes", bpo::value<std::string>(), "true, mean or none")
        ("frame", bpo::value<std::string>(), "Sidereal frame, e.g. fagan_bradley, lahiri")
        ("ayanamsa-offset", bpo::value<double>(), "Degrees added to the frame's ayanamsa")
        ("orb", bpo::value<double>(), "Default orb in degrees")
        ("orbs", bpo::value<std::string>(), "Per-aspect orbs, e.g. 8,5,6,6,8")
        ("ephe", bpo::value<std::string>(), "Directory with Swiss Ephemeris .se1 files")
        ("log-level", bpo::value<std::string>(), "trace, debug, info, warn, error or off")
        ("ascii", "Write 'deg' instead of the degree sign")
        ;
    return options;
}

bpo::variables_map parseCommandLine(int argc, const char* const argv[], const bpo::options_description& options) {
    bpo::positional_options_description pod;
    pod.add("command", 1);

    bpo::variables_map vm;
    try {
        bpo::command_line_parser parser(argc, argv);
        parser.options(options).positional(pod);
        bpo::store(parser.run(), vm);
        vm.notify();
    }
    catch (const bpo::error& e) {
        throw MalformedInputError(e.what());
    }
    return vm;
}

ChartConfig applyOptions(ChartConfig c, const bpo::variables_map& vm) {
    if (vm.count("tz")) { c.timezone = vm["tz"].as<std::string>(); c.useFixedOffset = false; }
    if (vm.count("offset")) { c.fixedUtcOffset = vm["offset"].as<double>(); c.useFixedOffset = true; }
    if (vm.count("center")) c.center = parseCenter(vm["center"].as<std::string>());
    if (vm.count("houses")) c.houseSystem = parseHouseSystem(vm["houses"].as<std::string>());
    if (vm.count("zodiac")) c.zodiac = parseZodiacMode(vm["zodiac"].as<std::string>());
    if (vm.count("frame")) c.frame = parseSiderealFrame(vm["frame"].as<std::string>());
    if (vm.count("ayanamsa-offset")) c.ayanamsaOffset = vm["ayanamsa-offset"].as<double>();
    if (vm.count("nodes")) {
        const auto& nodes = vm["nodes"].as<std::string>();
        if (toLower(trim(nodes)) == "none") c.includeNodes = false;
        else { c.includeNodes = true; c.nodeType = parseNodeType(nodes); }
    }
    if (vm.count("orb")) c.orb = vm["orb"].as<double>();
    if (vm.count("orbs")) c.orbs = vm["orbs"].as<std::string>();
    if (vm.count("ephe")) c.ephemerisPath = vm["ephe"].as<std::string>();
    if (vm.count("log-level")) c.logLevel = vm["log-level"].as<std::string>();
    return c;
}

ChartRequest chartRequest(const ChartConfig& config, const bpo::variables_map& vm) {
    ChartRequest req = config.request();
    if (vm.count("date")) req.date = vm["date"].as<std::string>();
    if (vm.count("time")) req.time = vm["time"].as<std::string>();
    if (vm.count("lat") != vm.count("lon"))
        throw MalformedInputError("--lat and --lon must be given together");
    if (vm.count("lat"))
        req.location = GeoLocation{ vm["lat"].as<double>(), vm["lon"].as<double>() };
    return req;
}

ExportOptions exportRequest(const ChartConfig& config, const bpo::variables_map& vm) {
    if (!vm.count("start") || !vm.count("end"))
        throw MalformedInputError("export needs --start and --end");
    ExportOptions opt;
    opt.start = parseCivil(vm["start"].as<std::string>());
    opt.end = parseCivil(vm["end"].as<std::string>());
    if (vm.count("step")) opt.step = parseExportStep(vm["step"].as<std::string>());
    opt.resolver = config.request().resolver;
    opt.zodiac = config.zodiac;
    opt.includeNodes = config.includeNodes;
    return opt;
}

ChartSnapshot computeChartForDisplay(const EphemerisOracle& oracle, ChartRequest request,
                                     const std::string& fallbackZone) {
    auto local = parseCivil(request.date, request.time);
    NormalizedTime time;
    try {
        time = resolveLocalTime(local, request.timezone);
    }
    catch (const UnknownTimezoneError& e) {
        if (request.timezone.fixed || fallbackZone.empty() || request.timezone.tzid == fallbackZone) throw;
        spdlog::warn("{}; falling back to {}", e.what(), fallbackZone);
        request.timezone = TimezoneSpec::named(fallbackZone);
        time = resolveLocalTime(local, request.timezone);
    }

    auto location = request.location;
    request.location.reset();
    ChartSnapshot S = computeChart(oracle, time, request);

    if (location) {
        try {
            S.houses = computeHouses(oracle, time.moment, location->latitude, location->longitude,
                request.houseSystem);
        }
        catch (const HouseSystemDegenerateError& e) {
            spdlog::warn("{}; chart shown without houses", e.what());
        }
    }
    return S;
}

} // namespace chartwheel
