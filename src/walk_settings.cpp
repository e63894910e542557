#include "walk_settings.h"
#include <cmath>

void WalkSettings::adjustWalkStepSize(float d) { walkStepSize = clampf(walkStepSize + d, 0.5f, 5.0f); }

void WalkSettings::adjustWalkBiasAngle(float d) {
    float a = std::fmod(walkBiasAngle + d, 360.0f);
    if (a < 0.0f) a += 360.0f;
    walkBiasAngle = a >= 360.0f ? 0.0f : a;
}

void WalkSettings::adjustWalkBiasStrength(float d) { walkBiasStrength = clampf(walkBiasStrength + d, 0.0f, 0.5f); }
void WalkSettings::adjustRadialBias(float d) { radialBias = clampf(radialBias + d, -0.3f, 0.3f); }
void WalkSettings::adjustAdaptiveStepFactor(float d) { adaptiveStepFactor = clampf(adaptiveStepFactor + d, 1.0f, 10.0f); }
void WalkSettings::adjustMultiContactMin(int d) { multiContactMin = clampi(multiContactMin + d, 1, 4); }
void WalkSettings::adjustTipStickiness(float d) { tipStickiness = clampf(tipStickiness + d, 0.1f, 1.0f); }
void WalkSettings::adjustSideStickiness(float d) { sideStickiness = clampf(sideStickiness + d, 0.1f, 1.0f); }
void WalkSettings::adjustStickinessGradient(float d) { stickinessGradient = clampf(stickinessGradient + d, -0.5f, 0.5f); }
void WalkSettings::adjustSpawnRadiusOffset(float d) { spawnRadiusOffset = clampf(spawnRadiusOffset + d, 5.0f, 50.0f); }
void WalkSettings::adjustEscapeMultiplier(float d) { escapeMultiplier = clampf(escapeMultiplier + d, 2.0f, 6.0f); }
void WalkSettings::adjustMinSpawnRadius(float d) { minSpawnRadius = clampf(minSpawnRadius + d, 20.0f, 100.0f); }
void WalkSettings::adjustMaxWalkIterations(int d) { maxWalkIterations = clampi(maxWalkIterations + d, 1000, 50000); }
void WalkSettings::adjustHighlightRecent(int d) { highlightRecent = clampi(highlightRecent + d, 0, 50); }

float WalkSettings::effectiveStickiness(int neighborCount, float distanceFromCenter, float baseStickiness) const {
    const float ratio = (float)neighborCount / (float)maxNeighbors(neighborhood);
    const float directional = tipStickiness * (1.0f - ratio) + sideStickiness * ratio;
    const float gradient = 1.0f + (distanceFromCenter / 100.0f) * stickinessGradient;
    return clampf(baseStickiness * directional * gradient, 0.0f, 1.0f);
}
