// Named parameter sets: a built-in catalog plus user presets stored as JSON
// files under $XDG_CONFIG_HOME/dla-simulation/presets.
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "seed_patterns.h"
#include "walk_settings.h"

class DlaSimulation;

struct Preset {
    std::string name;
    std::string description;
    WalkSettings settings;
    SeedPattern seedPattern = SeedPattern::Point;
    float baseStickiness = 1.0f;
    std::size_t numParticles = 5000;

    // Replaces the simulation's settings and restarts it on the preset seed
    void applyTo(DlaSimulation& sim) const;
};

void to_json(nlohmann::json& j, const Preset& p);
void from_json(const nlohmann::json& j, Preset& p);

class PresetManager {
public:
    // Empty directory = default user preset location
    explicit PresetManager(const std::string& directory = "");

    const std::vector<Preset>& builtin() const { return builtin_; }
    const std::vector<Preset>& user() const { return user_; }
    std::vector<const Preset*> allPresets() const;
    std::vector<std::string> names() const;
    // Case-insensitive; nullptr when nothing matches
    const Preset* find(const std::string& name) const;

    bool savePreset(const Preset& preset, std::string& error);
    bool deletePreset(const std::string& name, std::string& error);
    void reloadUserPresets();

    const std::string& directory() const { return dir_; }
    static std::string defaultDirectory();
    // Keeps [A-Za-z0-9_-], everything else becomes '_'
    static std::string sanitizeFileName(const std::string& name);

private:
    std::string dir_;
    std::vector<Preset> builtin_;
    std::vector<Preset> user_;

    void loadBuiltinPresets();
};
