// Versioned JSON snapshot of everything the user can tune:
// walk settings, seed, base stickiness, particle count and viewer options.
#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "color_lut.h"
#include "seed_patterns.h"
#include "walk_settings.h"

class DlaSimulation;

constexpr int kConfigVersion = 1;

struct AppConfig {
    int version = kConfigVersion;
    WalkSettings settings;
    SeedPattern seedPattern = SeedPattern::Point;
    float stickiness = 1.0f;
    std::size_t numParticles = 5000;
    ColorScheme colorScheme = ColorScheme::Ice;
    int stepsPerFrame = 5;
    bool colorByAge = true;

    // Captures the simulation-side fields; viewer fields are left as given
    static AppConfig capture(const DlaSimulation& sim, ColorScheme scheme, int stepsPerFrame, bool colorByAge);
    // Copies settings, seed, stickiness and particle count into sim (no reset)
    void applyTo(DlaSimulation& sim) const;

    // On failure return false and fill error with a readable message
    bool saveToFile(const std::string& path, std::string& error) const;
    static bool loadFromFile(const std::string& path, AppConfig& out, std::string& error);
};

// ADL hooks for nlohmann::json
void to_json(nlohmann::json& j, NeighborhoodType v);
void from_json(const nlohmann::json& j, NeighborhoodType& v);
void to_json(nlohmann::json& j, SpawnMode v);
void from_json(const nlohmann::json& j, SpawnMode& v);
void to_json(nlohmann::json& j, BoundaryBehavior v);
void from_json(const nlohmann::json& j, BoundaryBehavior& v);
void to_json(nlohmann::json& j, ColorMode v);
void from_json(const nlohmann::json& j, ColorMode& v);
void to_json(nlohmann::json& j, SeedPattern v);
void from_json(const nlohmann::json& j, SeedPattern& v);
void to_json(nlohmann::json& j, ColorScheme v);
void from_json(const nlohmann::json& j, ColorScheme& v);
void to_json(nlohmann::json& j, const WalkSettings& s);
void from_json(const nlohmann::json& j, WalkSettings& s);
void to_json(nlohmann::json& j, const AppConfig& c);
void from_json(const nlohmann::json& j, AppConfig& c);
