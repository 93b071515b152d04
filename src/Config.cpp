#include "Config.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "Errors.hpp"

namespace chartwheel {

namespace {

template <typename T>
T scalar(const YAML::Node& root, const char* key, const T& fallback) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) return fallback;
    try {
        return node.as<T>();
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

// Enumerated values go through the same parsers as the command line.
template <typename T>
T choice(const YAML::Node& root, const char* key, T (*parse)(const std::string&), T fallback) {
    const auto text = scalar<std::string>(root, key, std::string());
    if (text.empty()) return fallback;
    try {
        return parse(text);
    }
    catch (const MalformedInputError& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

} // namespace

TimezoneSpec ChartConfig::timezoneSpec() const {
    return useFixedOffset ? TimezoneSpec::fixedOffset(fixedUtcOffset) : TimezoneSpec::named(timezone);
}

ChartRequest ChartConfig::request() const {
    ChartRequest r;
    r.timezone = timezoneSpec();
    r.resolver.frame = frame;
    r.resolver.ayanamsaOffset = ayanamsaOffset;
    r.resolver.center = center;
    r.resolver.nodeType = nodeType;
    r.zodiac = zodiac;
    r.includeNodes = includeNodes;
    r.houseSystem = houseSystem;
    r.aspects = withOrbs(defaultAspects(), orb, orbs);
    return r;
}

ChartConfig loadConfigFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed YAML: ") + e.what());
    }

    ChartConfig c;
    if (!root || root.IsNull()) return c;
    if (!root.IsMap()) throw ConfigError("config root must be a mapping");

    c.timezone = scalar(root, "timezone", c.timezone);
    c.useFixedOffset = scalar(root, "use_fixed_offset", c.useFixedOffset);
    c.fixedUtcOffset = scalar(root, "fixed_utc_offset", c.fixedUtcOffset);
    c.center = choice(root, "center", parseCenter, c.center);
    c.houseSystem = choice(root, "house_system", parseHouseSystem, c.houseSystem);
    c.zodiac = choice(root, "zodiac", parseZodiacMode, c.zodiac);
    c.frame = choice(root, "sidereal_frame", parseSiderealFrame, c.frame);
    c.ayanamsaOffset = scalar(root, "ayanamsa_offset", c.ayanamsaOffset);
    c.includeNodes = scalar(root, "include_nodes", c.includeNodes);
    c.nodeType = choice(root, "node_type", parseNodeType, c.nodeType);
    c.orb = scalar(root, "orb", c.orb);
    c.orbs = scalar(root, "orbs", c.orbs);
    c.ephemerisPath = scalar(root, "ephemeris_path", c.ephemerisPath);
    c.logLevel = scalar(root, "log_level", c.logLevel);

    // surface bad orb lists when the file is read, not at the first chart
    try {
        (void)withOrbs(defaultAspects(), c.orb, c.orbs);
    }
    catch (const MalformedInputError& e) {
        throw ConfigError(std::string("config key 'orbs': ") + e.what());
    }
    return c;
}

ChartConfig loadConfigFile(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    spdlog::debug("loading config from {}", path);
    return loadConfigFromString(ss.str());
}

} // namespace chartwheel
