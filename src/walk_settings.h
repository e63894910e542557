// Tunables for the random walk, sticking, spawn/boundary and coloring.
// Every adjust helper clamps to the documented range; the fields themselves
// are plain data so a whole WalkSettings can be copied, persisted or replaced.
#pragma once
#include <cstddef>
#include "policies.h"

struct WalkSettings {
    // Movement
    float walkStepSize = 1.0f;        // [0.5, 5.0]
    float walkBiasAngle = 0.0f;       // degrees, wraps in [0, 360)
    float walkBiasStrength = 0.0f;    // [0, 0.5], 0 = isotropic
    float radialBias = 0.0f;          // [-0.3, 0.3], >0 inward, <0 outward
    bool adaptiveStep = false;
    float adaptiveStepFactor = 3.0f;  // [1, 10]
    bool latticeWalk = true;

    // Sticking
    NeighborhoodType neighborhood = NeighborhoodType::VonNeumann;
    int multiContactMin = 1;          // [1, 4]
    float tipStickiness = 1.0f;       // [0.1, 1.0]
    float sideStickiness = 1.0f;      // [0.1, 1.0]
    float stickinessGradient = 0.0f;  // [-0.5, 0.5] per 100 cells

    // Spawn / boundary
    SpawnMode spawnMode = SpawnMode::Circle;
    BoundaryBehavior boundaryBehavior = BoundaryBehavior::Absorb;
    float spawnRadiusOffset = 10.0f;  // [5, 50]
    float escapeMultiplier = 3.0f;    // [2, 6]
    float minSpawnRadius = 15.0f;     // [20, 100] once adjusted
    int maxWalkIterations = 10000;    // [1000, 50000]

    // Visual
    ColorMode colorMode = ColorMode::Age;
    int highlightRecent = 0;          // [0, 50]
    bool invertColors = false;

    void adjustWalkStepSize(float d);
    void adjustWalkBiasAngle(float d);
    void adjustWalkBiasStrength(float d);
    void adjustRadialBias(float d);
    void adjustAdaptiveStepFactor(float d);
    void adjustMultiContactMin(int d);
    void adjustTipStickiness(float d);
    void adjustSideStickiness(float d);
    void adjustStickinessGradient(float d);
    void adjustSpawnRadiusOffset(float d);
    void adjustEscapeMultiplier(float d);
    void adjustMinSpawnRadius(float d);
    void adjustMaxWalkIterations(int d);
    void adjustHighlightRecent(int d);
    void toggleAdaptiveStep() { adaptiveStep = !adaptiveStep; }
    void toggleLatticeWalk() { latticeWalk = !latticeWalk; }
    void toggleInvertColors() { invertColors = !invertColors; }

    // Probability that a qualifying contact attaches. Interpolates between tip
    // and side stickiness by neighbor density, scales by the distance gradient
    // and the base stickiness, and clamps to [0, 1].
    float effectiveStickiness(int neighborCount, float distanceFromCenter, float baseStickiness) const;
};
