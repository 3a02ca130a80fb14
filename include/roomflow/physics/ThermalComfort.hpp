#pragma once

#include "roomflow/core/Types.hpp"

namespace roomflow::physics {

struct ComfortConditions {
    Real metabolicRate = 1.2;       // met
    Real clothing = 0.5;            // clo
    Real relativeHumidity = 50.0;   // %
};

struct ThermalComfortIndex {
    Real pmv = 0.0;     // Predicted mean vote, [-3, 3]
    Real ppd = 5.0;     // Predicted percentage dissatisfied, [5, 100] %
};

// Fanger PMV with air temperature taken as the mean radiant temperature.
// Result clamped to [-3, 3].
Real predictedMeanVote(Real airTemperature, Real airSpeed,
                       const ComfortConditions& conditions = ComfortConditions());

// PPD = 100 - 95 exp(-0.03353 PMV^4 - 0.2179 PMV^2)
Real predictedPercentageDissatisfied(Real pmv);

ThermalComfortIndex evaluateComfort(Real airTemperature, Real airSpeed,
                                    const ComfortConditions& conditions = ComfortConditions());

} // namespace roomflow::physics
