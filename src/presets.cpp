#include "presets.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "app_config.h"
#include "dla_simulation.h"

namespace fs = std::filesystem;
using nlohmann::json;

void Preset::applyTo(DlaSimulation& sim) const {
    sim.setSettings(settings);
    sim.setStickiness(baseStickiness);
    sim.setNumParticles(std::min(numParticles, sim.maxParticles()));
    sim.resetWithSeed(seedPattern);
}

void to_json(json& j, const Preset& p) {
    j = json{
        {"name", p.name},
        {"description", p.description},
        {"settings", p.settings},
        {"seed_pattern", p.seedPattern},
        {"base_stickiness", p.baseStickiness},
        {"num_particles", p.numParticles},
    };
}

void from_json(const json& j, Preset& p) {
    j.at("name").get_to(p.name);
    j.at("description").get_to(p.description);
    j.at("settings").get_to(p.settings);
    j.at("seed_pattern").get_to(p.seedPattern);
    j.at("base_stickiness").get_to(p.baseStickiness);
    j.at("num_particles").get_to(p.numParticles);
}

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

PresetManager::PresetManager(const std::string& directory)
    : dir_(directory.empty() ? defaultDirectory() : directory) {
    loadBuiltinPresets();
    reloadUserPresets();
}

std::string PresetManager::defaultDirectory() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) return (fs::path(xdg) / "dla-simulation" / "presets").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return (fs::path(home) / ".config" / "dla-simulation" / "presets").string();
    }
    return (fs::path("dla-simulation") / "presets").string();
}

std::string PresetManager::sanitizeFileName(const std::string& name) {
    std::string out(name);
    for (char& c : out) {
        if (!(std::isalnum((unsigned char)c) || c == '-' || c == '_')) c = '_';
    }
    return out;
}

void PresetManager::loadBuiltinPresets() {
    auto make = [](const char* name, const char* desc, const WalkSettings& s,
                   SeedPattern seed, float stick, std::size_t n) {
        Preset p;
        p.name = name; p.description = desc; p.settings = s;
        p.seedPattern = seed; p.baseStickiness = stick; p.numParticles = n;
        return p;
    };

    builtin_.clear();
    builtin_.push_back(make("Classic", "Standard DLA with default settings", WalkSettings{}, SeedPattern::Point, 1.0f, 5000));

    WalkSettings s;
    s.multiContactMin = 2; s.neighborhood = NeighborhoodType::Moore;
    builtin_.push_back(make("Dense", "Compact structures with multiple contact requirement", s, SeedPattern::Point, 1.0f, 5000));

    s = WalkSettings{};
    s.walkStepSize = 3.0f; s.tipStickiness = 1.0f; s.sideStickiness = 0.3f;
    builtin_.push_back(make("Dendritic", "Thin, branching dendrite patterns", s, SeedPattern::Point, 0.3f, 5000));

    s = WalkSettings{};
    s.walkStepSize = 2.0f; s.neighborhood = NeighborhoodType::VonNeumann;
    builtin_.push_back(make("Snowflake", "Symmetric snowflake-like growth", s, SeedPattern::Cross, 0.8f, 5000));

    s = WalkSettings{};
    s.walkStepSize = 1.5f; s.tipStickiness = 0.5f; s.sideStickiness = 1.0f; s.neighborhood = NeighborhoodType::Moore;
    builtin_.push_back(make("Coral", "Thick, coral-like structures", s, SeedPattern::Ring, 0.7f, 5000));

    s = WalkSettings{};
    s.walkBiasAngle = 45.0f; s.walkBiasStrength = 0.3f;
    builtin_.push_back(make("Wind-swept", "Asymmetric growth with directional bias", s, SeedPattern::Point, 0.8f, 5000));

    s = WalkSettings{};
    s.walkStepSize = 2.5f; s.escapeMultiplier = 3.0f;
    builtin_.push_back(make("Fractal Forest", "Multiple growth centers competing", s, SeedPattern::Scatter, 0.4f, 8000));

    s = WalkSettings{};
    s.spawnMode = SpawnMode::Edges; s.boundaryBehavior = BoundaryBehavior::Bounce;
    builtin_.push_back(make("Edge Growth", "Particles spawn from grid edges", s, SeedPattern::Point, 0.9f, 5000));

    s = WalkSettings{};
    s.neighborhood = NeighborhoodType::VonNeumann; s.walkStepSize = 1.5f;
    builtin_.push_back(make("Angular", "Sharp, angular growth patterns", s, SeedPattern::Point, 1.0f, 5000));

    s = WalkSettings{};
    s.neighborhood = NeighborhoodType::Extended; s.multiContactMin = 3; s.walkStepSize = 1.0f;
    builtin_.push_back(make("Blob", "Dense, blob-like structures", s, SeedPattern::Block, 1.0f, 5000));

    s = WalkSettings{};
    s.stickinessGradient = -0.3f;
    builtin_.push_back(make("Gradient", "Dense core with sparse edges", s, SeedPattern::Point, 1.0f, 5000));

    s = WalkSettings{};
    s.spawnMode = SpawnMode::Top; s.radialBias = 0.1f;
    builtin_.push_back(make("Rain", "Particles fall from top edge", s, SeedPattern::Line, 0.8f, 5000));
}

void PresetManager::reloadUserPresets() {
    user_.clear();
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return;

    for (const fs::directory_entry& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().extension() != ".json") continue;
        std::ifstream in(entry.path());
        if (!in) {
            spdlog::warn("Skipping unreadable preset {}", entry.path().string());
            continue;
        }
        try {
            user_.push_back(json::parse(in).get<Preset>());
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed preset {}: {}", entry.path().string(), e.what());
        }
    }
    if (ec) spdlog::warn("Could not list presets in {}: {}", dir_, ec.message());
    std::sort(user_.begin(), user_.end(), [](const Preset& a, const Preset& b) { return a.name < b.name; });
}

std::vector<const Preset*> PresetManager::allPresets() const {
    std::vector<const Preset*> all;
    for (const Preset& p : builtin_) all.push_back(&p);
    for (const Preset& p : user_) all.push_back(&p);
    return all;
}

std::vector<std::string> PresetManager::names() const {
    std::vector<std::string> out;
    for (const Preset* p : allPresets()) out.push_back(p->name);
    return out;
}

const Preset* PresetManager::find(const std::string& name) const {
    for (const Preset* p : allPresets()) {
        if (iequals(p->name, name)) return p;
    }
    return nullptr;
}

bool PresetManager::savePreset(const Preset& preset, std::string& error) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        error = "Failed to create presets directory: " + ec.message();
        return false;
    }
    const fs::path path = fs::path(dir_) / (sanitizeFileName(preset.name) + ".json");
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        error = "Failed to write preset file: cannot open " + path.string();
        return false;
    }
    try {
        out << json(preset).dump(2) << '\n';
    } catch (const json::exception& e) {
        error = std::string("Failed to serialize preset: ") + e.what();
        return false;
    }
    if (!out) {
        error = "Failed to write preset file: " + path.string();
        return false;
    }

    auto it = std::find_if(user_.begin(), user_.end(), [&](const Preset& p) { return p.name == preset.name; });
    if (it == user_.end()) user_.push_back(preset); else *it = preset;
    spdlog::info("Saved preset '{}' to {}", preset.name, path.string());
    return true;
}

bool PresetManager::deletePreset(const std::string& name, std::string& error) {
    user_.erase(std::remove_if(user_.begin(), user_.end(), [&](const Preset& p) { return p.name == name; }),
                user_.end());
    const fs::path path = fs::path(dir_) / (sanitizeFileName(name) + ".json");
    std::error_code ec;
    if (fs::exists(path, ec) && !fs::remove(path, ec)) {
        error = "Failed to delete preset file: " + ec.message();
        return false;
    }
    if (ec) {
        error = "Failed to delete preset file: " + ec.message();
        return false;
    }
    return true;
}
