#include <cstdint>
#include <cstdio>
#include <vector>
#include <string>
#include <algorithm>

#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif

#include <GLFW/glfw3.h>

#include <imgui.h>
#include <imgui/backends/imgui_impl_glfw.h>
#include <imgui/backends/imgui_impl_opengl2.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "app_config.h"
#include "braille_sampler.h"
#include "color_lut.h"
#include "dla_simulation.h"
#include "presets.h"
#include "renderer.h"

struct UIState {
    int stepsPerFrame = 5;
    ColorScheme colorScheme = ColorScheme::Ice;
    ColorLut lut = buildLut(ColorScheme::Ice);
    bool colorByAge = true;
    RenderSettings render;
    char configPath[256] = "dla-config.json";
    char presetName[64] = "My Preset";
    int selectedPreset = 0;
    std::string status;
    bool statusIsError = false;

    void setScheme(ColorScheme s) { colorScheme = s; lut = buildLut(s); }
    void report(bool ok, const std::string& msg) { status = msg; statusIsError = !ok; }
};

static void glfwErrorCallback(int error, const char* description) {
    spdlog::error("GLFW Error {}: {}", error, description);
}

static void applyConfig(const AppConfig& cfg, DlaSimulation& sim, UIState& ui) {
    cfg.applyTo(sim);
    ui.setScheme(cfg.colorScheme);
    ui.stepsPerFrame = std::max(1, std::min(cfg.stepsPerFrame, 50));
    ui.colorByAge = cfg.colorByAge;
    sim.reset();
}

// Slider bound to a clamped adjust helper: returns the requested delta
static bool sliderDelta(const char* label, float cur, float lo, float hi, const char* fmt, float& delta) {
    float v = cur;
    if (!ImGui::SliderFloat(label, &v, lo, hi, fmt)) return false;
    delta = v - cur;
    return true;
}

static bool sliderDeltaInt(const char* label, int cur, int lo, int hi, int& delta) {
    int v = cur;
    if (!ImGui::SliderInt(label, &v, lo, hi)) return false;
    delta = v - cur;
    return true;
}

// "<" value ">" row for cyclic enums; returns -1, 0 or +1
static int cycleRow(const char* label, const char* value) {
    int dir = 0;
    ImGui::PushID(label);
    if (ImGui::ArrowButton("prev", ImGuiDir_Left)) dir = -1;
    ImGui::SameLine();
    if (ImGui::ArrowButton("next", ImGuiDir_Right)) dir = +1;
    ImGui::SameLine();
    ImGui::Text("%s: %s", label, value);
    ImGui::PopID();
    return dir;
}

static void handleKeys(DlaSimulation& sim, UIState& ui, GLFWwindow* window) {
    ImGuiIO& io = ImGui::GetIO();
    if (io.WantTextInput) return;
    WalkSettings& s = sim.settings();

    if (ImGui::IsKeyPressed(ImGuiKey_Q) || ImGui::IsKeyPressed(ImGuiKey_Escape)) glfwSetWindowShouldClose(window, 1);
    if (ImGui::IsKeyPressed(ImGuiKey_Space)) sim.togglePause();
    if (ImGui::IsKeyPressed(ImGuiKey_R)) sim.reset();

    static const struct { ImGuiKey key; SeedPattern pattern; } kSeedKeys[] = {
        {ImGuiKey_1, SeedPattern::Point},      {ImGuiKey_2, SeedPattern::Line},
        {ImGuiKey_3, SeedPattern::Cross},      {ImGuiKey_4, SeedPattern::Circle},
        {ImGuiKey_5, SeedPattern::Ring},       {ImGuiKey_6, SeedPattern::Block},
        {ImGuiKey_7, SeedPattern::MultiPoint}, {ImGuiKey_8, SeedPattern::Starburst},
        {ImGuiKey_9, SeedPattern::NoisePatch}, {ImGuiKey_0, SeedPattern::Scatter},
    };
    for (const auto& k : kSeedKeys) {
        if (ImGui::IsKeyPressed(k.key)) sim.resetWithSeed(k.pattern);
    }

    if (ImGui::IsKeyPressed(ImGuiKey_C)) ui.setScheme(next(ui.colorScheme));
    if (ImGui::IsKeyPressed(ImGuiKey_A)) ui.colorByAge = !ui.colorByAge;
    if (ImGui::IsKeyPressed(ImGuiKey_M)) s.colorMode = next(s.colorMode);
    if (ImGui::IsKeyPressed(ImGuiKey_I)) s.toggleInvertColors();
    if (ImGui::IsKeyPressed(ImGuiKey_N)) s.neighborhood = next(s.neighborhood);
    if (ImGui::IsKeyPressed(ImGuiKey_B)) s.boundaryBehavior = next(s.boundaryBehavior);
    if (ImGui::IsKeyPressed(ImGuiKey_S)) s.spawnMode = next(s.spawnMode);
    if (ImGui::IsKeyPressed(ImGuiKey_W)) s.adjustWalkStepSize(0.5f);
    if (ImGui::IsKeyPressed(ImGuiKey_E)) s.adjustWalkStepSize(-0.5f);
    if (ImGui::IsKeyPressed(ImGuiKey_LeftBracket)) s.adjustHighlightRecent(-5);
    if (ImGui::IsKeyPressed(ImGuiKey_RightBracket)) s.adjustHighlightRecent(5);
    if (ImGui::IsKeyPressed(ImGuiKey_Equal) || ImGui::IsKeyPressed(ImGuiKey_KeypadAdd))
        ui.stepsPerFrame = std::min(ui.stepsPerFrame + 1, 50);
    if (ImGui::IsKeyPressed(ImGuiKey_Minus) || ImGui::IsKeyPressed(ImGuiKey_KeypadSubtract))
        ui.stepsPerFrame = std::max(ui.stepsPerFrame - 1, 1);
}

static void drawSidebar(DlaSimulation& sim, UIState& ui, PresetManager& presets, float height) {
    ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(360.0f, height), ImGuiCond_Always);
    ImGuiWindowFlags sidebarFlags = ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                    ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoCollapse;
    if (!ImGui::Begin("Controls", nullptr, sidebarFlags)) { ImGui::End(); return; }

    WalkSettings& s = sim.settings();
    float df = 0.0f; int di = 0;

    // Simulation
    if (ImGui::Button(sim.paused() ? "Resume" : "Pause")) sim.togglePause();
    ImGui::SameLine();
    if (ImGui::Button("Step")) {
        const bool wasPaused = sim.paused();
        sim.setPaused(false);
        sim.step();
        sim.setPaused(wasPaused);
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset")) sim.reset();
    ImGui::SliderInt("Speed (steps/frame)", &ui.stepsPerFrame, 1, 50);
    ImGui::ProgressBar(std::min(sim.progress(), 1.0f), ImVec2(-1, 0));
    ImGui::Text("Particles: %zu / %zu  (grid %dx%d)", sim.particlesStuck(), sim.numParticles(), sim.width(), sim.height());
    ImGui::Text("Max radius: %.1f  %s", sim.maxRadius(), sim.isComplete() ? "[complete]" : "");
    {
        int n = (int)sim.numParticles();
        if (sliderDeltaInt("Target particles", n, 100, (int)sim.maxParticles(), di)) sim.adjustParticles(di);
    }
    if (sliderDelta("Stickiness", sim.stickiness(), 0.1f, 1.0f, "%.2f", df)) sim.adjustStickiness(df);

    if (ImGui::CollapsingHeader("Movement", ImGuiTreeNodeFlags_DefaultOpen)) {
        if (sliderDelta("Walk step", s.walkStepSize, 0.5f, 5.0f, "%.1f", df)) s.adjustWalkStepSize(df);
        if (sliderDelta("Bias direction", s.walkBiasAngle, 0.0f, 359.0f, "%.0f deg", df)) s.adjustWalkBiasAngle(df);
        if (sliderDelta("Bias force", s.walkBiasStrength, 0.0f, 0.5f, "%.2f", df)) s.adjustWalkBiasStrength(df);
        if (sliderDelta("Radial bias", s.radialBias, -0.3f, 0.3f, "%.2f", df)) s.adjustRadialBias(df);
        ImGui::Checkbox("Adaptive step", &s.adaptiveStep);
        if (sliderDelta("Adaptive factor", s.adaptiveStepFactor, 1.0f, 10.0f, "%.1f", df)) s.adjustAdaptiveStepFactor(df);
        ImGui::Checkbox("Lattice walk", &s.latticeWalk);
    }
    if (ImGui::CollapsingHeader("Sticking", ImGuiTreeNodeFlags_DefaultOpen)) {
        int d = cycleRow("Neighborhood", toString(s.neighborhood));
        if (d > 0) s.neighborhood = next(s.neighborhood); else if (d < 0) s.neighborhood = prev(s.neighborhood);
        if (sliderDeltaInt("Multi-contact min", s.multiContactMin, 1, 4, di)) s.adjustMultiContactMin(di);
        if (sliderDelta("Tip stickiness", s.tipStickiness, 0.1f, 1.0f, "%.2f", df)) s.adjustTipStickiness(df);
        if (sliderDelta("Side stickiness", s.sideStickiness, 0.1f, 1.0f, "%.2f", df)) s.adjustSideStickiness(df);
        if (sliderDelta("Gradient", s.stickinessGradient, -0.5f, 0.5f, "%.2f", df)) s.adjustStickinessGradient(df);
    }
    if (ImGui::CollapsingHeader("Spawn", ImGuiTreeNodeFlags_DefaultOpen)) {
        int d = cycleRow("Spawn", toString(s.spawnMode));
        if (d > 0) s.spawnMode = next(s.spawnMode); else if (d < 0) s.spawnMode = prev(s.spawnMode);
        d = cycleRow("Boundary", toString(s.boundaryBehavior));
        if (d > 0) s.boundaryBehavior = next(s.boundaryBehavior); else if (d < 0) s.boundaryBehavior = prev(s.boundaryBehavior);
        if (sliderDelta("Spawn offset", s.spawnRadiusOffset, 5.0f, 50.0f, "%.0f", df)) s.adjustSpawnRadiusOffset(df);
        if (sliderDelta("Escape mult", s.escapeMultiplier, 2.0f, 6.0f, "%.1f", df)) s.adjustEscapeMultiplier(df);
        if (sliderDelta("Min spawn radius", s.minSpawnRadius, 20.0f, 100.0f, "%.0f", df)) s.adjustMinSpawnRadius(df);
        if (sliderDeltaInt("Max steps", s.maxWalkIterations, 1000, 50000, di)) s.adjustMaxWalkIterations(di);
        ImGui::Checkbox("Show spawn circle", &ui.render.showSpawnCircle);
    }
    if (ImGui::CollapsingHeader("Visual", ImGuiTreeNodeFlags_DefaultOpen)) {
        int d = cycleRow("Scheme", toString(ui.colorScheme));
        if (d > 0) ui.setScheme(next(ui.colorScheme)); else if (d < 0) ui.setScheme(prev(ui.colorScheme));
        d = cycleRow("Mode", toString(s.colorMode));
        if (d > 0) s.colorMode = next(s.colorMode); else if (d < 0) s.colorMode = prev(s.colorMode);
        ImGui::Checkbox("Color by value", &ui.colorByAge);
        ImGui::SameLine();
        ImGui::Checkbox("Invert", &s.invertColors);
        if (sliderDeltaInt("Highlight recent", s.highlightRecent, 0, 50, di)) s.adjustHighlightRecent(di);
        ImGui::SliderFloat("Dot size", &ui.render.dotSize, 1.0f, 6.0f, "%.1f px");
    }
    if (ImGui::CollapsingHeader("Seed", ImGuiTreeNodeFlags_DefaultOpen)) {
        int d = cycleRow("Pattern", toString(sim.seedPattern()));
        if (d > 0) sim.resetWithSeed(next(sim.seedPattern()));
        else if (d < 0) sim.resetWithSeed(prev(sim.seedPattern()));
    }
    if (ImGui::CollapsingHeader("Presets")) {
        std::vector<std::string> names = presets.names();
        ui.selectedPreset = std::max(0, std::min(ui.selectedPreset, (int)names.size() - 1));
        if (!names.empty() && ImGui::BeginCombo("Preset", names[ui.selectedPreset].c_str())) {
            for (int i = 0; i < (int)names.size(); ++i) {
                if (ImGui::Selectable(names[i].c_str(), i == ui.selectedPreset)) ui.selectedPreset = i;
            }
            ImGui::EndCombo();
        }
        if (ImGui::Button("Apply preset") && !names.empty()) {
            if (const Preset* p = presets.find(names[ui.selectedPreset])) {
                p->applyTo(sim);
                ui.report(true, "Applied preset " + p->name);
            }
        }
        ImGui::InputText("Name", ui.presetName, sizeof(ui.presetName));
        if (ImGui::Button("Save as preset")) {
            Preset p;
            p.name = ui.presetName;
            p.description = "User preset";
            p.settings = sim.settings();
            p.seedPattern = sim.seedPattern();
            p.baseStickiness = sim.stickiness();
            p.numParticles = sim.numParticles();
            std::string err;
            if (presets.savePreset(p, err)) ui.report(true, "Saved preset " + p.name);
            else { spdlog::warn("{}", err); ui.report(false, err); }
        }
        ImGui::SameLine();
        if (ImGui::Button("Delete preset")) {
            std::string err;
            if (presets.deletePreset(ui.presetName, err)) ui.report(true, std::string("Deleted preset ") + ui.presetName);
            else { spdlog::warn("{}", err); ui.report(false, err); }
        }
    }
    if (ImGui::CollapsingHeader("Config", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::InputText("File", ui.configPath, sizeof(ui.configPath));
        if (ImGui::Button("Export")) {
            std::string err;
            AppConfig cfg = AppConfig::capture(sim, ui.colorScheme, ui.stepsPerFrame, ui.colorByAge);
            if (cfg.saveToFile(ui.configPath, err)) ui.report(true, std::string("Saved ") + ui.configPath);
            else { spdlog::warn("{}", err); ui.report(false, err); }
        }
        ImGui::SameLine();
        if (ImGui::Button("Import")) {
            std::string err;
            AppConfig cfg;
            if (AppConfig::loadFromFile(ui.configPath, cfg, err)) {
                applyConfig(cfg, sim, ui);
                ui.report(true, std::string("Loaded ") + ui.configPath);
            } else {
                spdlog::warn("{}", err);
                ui.report(false, err);
            }
        }
    }
    if (!ui.status.empty()) {
        ImGui::Separator();
        ImVec4 col = ui.statusIsError ? ImVec4(1.0f, 0.4f, 0.35f, 1.0f) : ImVec4(0.5f, 0.9f, 0.5f, 1.0f);
        ImGui::TextColored(col, "%s", ui.status.c_str());
    }
    ImGui::End();
}

// Runs the simulation without a window and prints the braille frame
static int runHeadless(DlaSimulation& sim, const UIState& ui, int cols, int rows, long maxSteps, bool ansi) {
    long steps = 0;
    while (steps < maxSteps && sim.step()) ++steps;
    spdlog::info("Headless run: {} particles after {} walkers", sim.particlesStuck(), steps);

    BrailleRenderOptions opts;
    opts.colorMode = sim.settings().colorMode;
    opts.highlightRecent = sim.settings().highlightRecent;
    opts.invertColors = sim.settings().invertColors;
    opts.colorByValue = ui.colorByAge;
    std::vector<GlyphCell> cells = renderToBraille(sim, cols, rows, ui.lut, opts);

    std::vector<std::string> lines(rows, std::string());
    std::vector<int> lineCol(rows, 0);
    for (const GlyphCell& c : cells) {
        std::string& line = lines[c.y];
        line.append((std::size_t)(c.x - lineCol[c.y]), ' ');
        if (ansi) {
            char esc[32];
            std::snprintf(esc, sizeof(esc), "\x1b[38;2;%d;%d;%dm", c.color.r, c.color.g, c.color.b);
            line += esc;
        }
        line += brailleUtf8(c.pattern);
        lineCol[c.y] = c.x + 1;
    }
    for (const std::string& line : lines) std::printf("%s%s\n", line.c_str(), ansi ? "\x1b[0m" : "");
    return 0;
}

int main(int argc, char** argv) {
    cxxopts::Options options(argv[0], "Diffusion-limited aggregation viewer");
    options.add_options()
        ("p,particles", "Number of particles to aggregate", cxxopts::value<long>()->default_value("5000"))
        ("s,stickiness", "Base stickiness (0.1-1.0)", cxxopts::value<float>()->default_value("1.0"))
        ("seed", "Seed pattern (point, line, cross, circle, ring, block, noise, scatter, multipoint, starburst)",
            cxxopts::value<std::string>()->default_value("point"))
        ("speed", "Steps per frame (1-50)", cxxopts::value<int>()->default_value("5"))
        ("config", "Import a JSON config at startup", cxxopts::value<std::string>())
        ("preset", "Apply a named preset at startup", cxxopts::value<std::string>())
        ("rng-seed", "Random seed, 0 = nondeterministic", cxxopts::value<uint32_t>()->default_value("0"))
        ("print", "Run without a window and print the result as braille text")
        ("cols", "Canvas columns for --print", cxxopts::value<int>()->default_value("80"))
        ("rows", "Canvas rows for --print", cxxopts::value<int>()->default_value("40"))
        ("max-steps", "Walker budget for --print", cxxopts::value<long>()->default_value("2000000"))
        ("no-color", "Plain braille output for --print")
        ("log-level", "trace, debug, info, warn, error", cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    cxxopts::ParseResult args;
    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::fprintf(stderr, "%s\n%s\n", e.what(), options.help().c_str());
        return 1;
    }
    if (args.count("help")) {
        std::printf("%s\n", options.help().c_str());
        return 0;
    }
    spdlog::set_level(spdlog::level::from_str(args["log-level"].as<std::string>()));

    const bool headless = args.count("print") > 0;
    int cols = std::max(1, args["cols"].as<int>());
    int rows = std::max(1, args["rows"].as<int>());
    std::pair<int, int> simSize = calculateSimulationSize(cols, rows);

    DlaParams params;
    params.width = simSize.first;
    params.height = simSize.second;
    params.rngSeed = args["rng-seed"].as<uint32_t>();
    DlaSimulation sim(params);
    UIState ui;

    const long requested = args["particles"].as<long>();
    sim.setNumParticles((std::size_t)std::max(100L, std::min(requested, (long)sim.maxParticles())));
    sim.setStickiness(clampf(args["stickiness"].as<float>(), 0.1f, 1.0f));
    ui.stepsPerFrame = std::max(1, std::min(args["speed"].as<int>(), 50));
    sim.resetWithSeed(seedPatternFromName(args["seed"].as<std::string>()));

    PresetManager presets;
    if (args.count("preset")) {
        const std::string name = args["preset"].as<std::string>();
        if (const Preset* p = presets.find(name)) {
            p->applyTo(sim);
            spdlog::info("Applied preset {}", p->name);
        } else {
            spdlog::warn("Unknown preset '{}'", name);
        }
    }
    if (args.count("config")) {
        AppConfig cfg;
        std::string err;
        if (AppConfig::loadFromFile(args["config"].as<std::string>(), cfg, err)) applyConfig(cfg, sim, ui);
        else spdlog::warn("{}", err);
    }

    if (headless) return runHeadless(sim, ui, cols, rows, args["max-steps"].as<long>(), !args.count("no-color"));

    glfwSetErrorCallback(glfwErrorCallback);
    if (!glfwInit()) { spdlog::error("Failed to initialize GLFW"); return 1; }
    GLFWwindow* window = glfwCreateWindow(1280, 720, "DLA Simulation", nullptr, nullptr);
    if (!window) { spdlog::error("Failed to create window"); glfwTerminate(); return 1; }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    // Setup ImGui
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 5.0f;
    style.GrabRounding = 4.0f;
    style.WindowRounding = 7.0f;
    style.WindowTitleAlign = ImVec2(0.5f, 0.5f);

    spdlog::info("Viewer started: grid {}x{}, {} particles, seed {}",
                 sim.width(), sim.height(), sim.numParticles(), toString(sim.seedPattern()));

    std::vector<GlyphCell> cells;
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        int fbW, fbH; glfwGetFramebufferSize(window, &fbW, &fbH);

        // Keep the grid at one cell per braille dot of the current canvas
        Viewport vp; Renderer2D::computeViewport(fbW, fbH, ui.render, vp);
        std::pair<int, int> want = calculateSimulationSize(vp.canvasCols, vp.canvasRows);
        if (want.first != sim.width() || want.second != sim.height()) {
            spdlog::info("Resizing grid {}x{} -> {}x{}", sim.width(), sim.height(), want.first, want.second);
            sim.resize(want.first, want.second);
        }

        for (int i = 0; i < ui.stepsPerFrame; ++i) {
            if (!sim.step()) break;
        }

        BrailleRenderOptions opts;
        opts.colorMode = sim.settings().colorMode;
        opts.highlightRecent = sim.settings().highlightRecent;
        opts.invertColors = sim.settings().invertColors;
        opts.colorByValue = ui.colorByAge;
        cells = renderToBraille(sim, vp.canvasCols, vp.canvasRows, ui.lut, opts);

        Renderer2D::drawBackground();
        Renderer2D::drawDomain(vp, ui.render);
        Renderer2D::drawGlyphCells(cells, vp, ui.render);
        Renderer2D::drawSpawnCircle(sim, vp, ui.render);

        ImGui_ImplOpenGL2_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        handleKeys(sim, ui, window);
        drawSidebar(sim, ui, presets, (float)fbH);

        ImGui::Render();
        ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
