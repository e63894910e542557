#include "app_config.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "dla_simulation.h"

using nlohmann::json;

// Enums are stored by tag name. Walks the cyclic order starting at `first`.
template <typename E, typename TagFn>
static E enumFromTag(const json& j, E first, TagFn tag, const char* what) {
    const std::string str = j.get<std::string>();
    E v = first;
    do {
        if (str == tag(v)) return v;
        v = next(v);
    } while (v != first);
    throw std::runtime_error(std::string("Unknown ") + what + ": " + str);
}

void to_json(json& j, NeighborhoodType v) { j = toString(v); }
void from_json(const json& j, NeighborhoodType& v) {
    v = enumFromTag(j, NeighborhoodType::VonNeumann, [](NeighborhoodType e) { return toString(e); }, "neighborhood");
}
void to_json(json& j, SpawnMode v) { j = toString(v); }
void from_json(const json& j, SpawnMode& v) {
    v = enumFromTag(j, SpawnMode::Circle, [](SpawnMode e) { return toString(e); }, "spawn mode");
}
void to_json(json& j, BoundaryBehavior v) { j = toString(v); }
void from_json(const json& j, BoundaryBehavior& v) {
    v = enumFromTag(j, BoundaryBehavior::Clamp, [](BoundaryBehavior e) { return toString(e); }, "boundary behavior");
}
void to_json(json& j, ColorMode v) { j = toString(v); }
void from_json(const json& j, ColorMode& v) {
    v = enumFromTag(j, ColorMode::Age, [](ColorMode e) { return toString(e); }, "color mode");
}
void to_json(json& j, SeedPattern v) { j = tagOf(v); }
void from_json(const json& j, SeedPattern& v) {
    v = enumFromTag(j, SeedPattern::Point, [](SeedPattern e) { return tagOf(e); }, "seed pattern");
}
void to_json(json& j, ColorScheme v) { j = toString(v); }
void from_json(const json& j, ColorScheme& v) {
    v = enumFromTag(j, ColorScheme::Ice, [](ColorScheme e) { return toString(e); }, "color scheme");
}

void to_json(json& j, const WalkSettings& s) {
    j = json{
        {"walk_step_size", s.walkStepSize},
        {"walk_bias_angle", s.walkBiasAngle},
        {"walk_bias_strength", s.walkBiasStrength},
        {"radial_bias", s.radialBias},
        {"adaptive_step", s.adaptiveStep},
        {"adaptive_step_factor", s.adaptiveStepFactor},
        {"lattice_walk", s.latticeWalk},
        {"neighborhood", s.neighborhood},
        {"multi_contact_min", s.multiContactMin},
        {"tip_stickiness", s.tipStickiness},
        {"side_stickiness", s.sideStickiness},
        {"stickiness_gradient", s.stickinessGradient},
        {"spawn_mode", s.spawnMode},
        {"boundary_behavior", s.boundaryBehavior},
        {"spawn_radius_offset", s.spawnRadiusOffset},
        {"escape_multiplier", s.escapeMultiplier},
        {"min_spawn_radius", s.minSpawnRadius},
        {"max_walk_iterations", s.maxWalkIterations},
        {"color_mode", s.colorMode},
        {"highlight_recent", s.highlightRecent},
        {"invert_colors", s.invertColors},
    };
}

void from_json(const json& j, WalkSettings& s) {
    j.at("walk_step_size").get_to(s.walkStepSize);
    j.at("walk_bias_angle").get_to(s.walkBiasAngle);
    j.at("walk_bias_strength").get_to(s.walkBiasStrength);
    j.at("radial_bias").get_to(s.radialBias);
    j.at("adaptive_step").get_to(s.adaptiveStep);
    j.at("adaptive_step_factor").get_to(s.adaptiveStepFactor);
    j.at("lattice_walk").get_to(s.latticeWalk);
    j.at("neighborhood").get_to(s.neighborhood);
    j.at("multi_contact_min").get_to(s.multiContactMin);
    j.at("tip_stickiness").get_to(s.tipStickiness);
    j.at("side_stickiness").get_to(s.sideStickiness);
    j.at("stickiness_gradient").get_to(s.stickinessGradient);
    j.at("spawn_mode").get_to(s.spawnMode);
    j.at("boundary_behavior").get_to(s.boundaryBehavior);
    j.at("spawn_radius_offset").get_to(s.spawnRadiusOffset);
    j.at("escape_multiplier").get_to(s.escapeMultiplier);
    j.at("min_spawn_radius").get_to(s.minSpawnRadius);
    j.at("max_walk_iterations").get_to(s.maxWalkIterations);
    j.at("color_mode").get_to(s.colorMode);
    j.at("highlight_recent").get_to(s.highlightRecent);
    j.at("invert_colors").get_to(s.invertColors);
}

void to_json(json& j, const AppConfig& c) {
    j = json{
        {"version", c.version},
        {"settings", c.settings},
        {"seed_pattern", c.seedPattern},
        {"stickiness", c.stickiness},
        {"num_particles", c.numParticles},
        {"color_scheme", c.colorScheme},
        {"steps_per_frame", c.stepsPerFrame},
        {"color_by_age", c.colorByAge},
    };
}

void from_json(const json& j, AppConfig& c) {
    j.at("version").get_to(c.version);
    j.at("settings").get_to(c.settings);
    j.at("seed_pattern").get_to(c.seedPattern);
    j.at("stickiness").get_to(c.stickiness);
    j.at("num_particles").get_to(c.numParticles);
    j.at("color_scheme").get_to(c.colorScheme);
    j.at("steps_per_frame").get_to(c.stepsPerFrame);
    j.at("color_by_age").get_to(c.colorByAge);
}

AppConfig AppConfig::capture(const DlaSimulation& sim, ColorScheme scheme, int stepsPerFrame, bool colorByAge) {
    AppConfig c;
    c.settings = sim.settings();
    c.seedPattern = sim.seedPattern();
    c.stickiness = sim.stickiness();
    c.numParticles = sim.numParticles();
    c.colorScheme = scheme;
    c.stepsPerFrame = stepsPerFrame;
    c.colorByAge = colorByAge;
    return c;
}

void AppConfig::applyTo(DlaSimulation& sim) const {
    sim.setSettings(settings);
    sim.setSeedPattern(seedPattern);
    sim.setStickiness(stickiness);
    sim.setNumParticles(numParticles);
}

bool AppConfig::saveToFile(const std::string& path, std::string& error) const {
    std::string text;
    try {
        text = json(*this).dump(2);
    } catch (const json::exception& e) {
        error = std::string("Failed to serialize config: ") + e.what();
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to write config file: cannot open " + path;
        return false;
    }
    out << text << '\n';
    out.flush();
    if (!out) {
        error = "Failed to write config file: " + path;
        return false;
    }
    spdlog::info("Exported config to {}", path);
    return true;
}

bool AppConfig::loadFromFile(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to read config file: cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        out = json::parse(ss.str()).get<AppConfig>();
    } catch (const std::exception& e) {
        error = std::string("Failed to parse config file: ") + e.what();
        return false;
    }
    if (out.version != kConfigVersion) {
        spdlog::warn("Config {} has version {}, expected {}", path, out.version, kConfigVersion);
    }
    spdlog::info("Imported config from {}", path);
    return true;
}
