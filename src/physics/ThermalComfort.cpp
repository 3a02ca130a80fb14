#include "roomflow/physics/ThermalComfort.hpp"
#include <algorithm>
#include <cmath>

namespace roomflow::physics {

namespace {

constexpr Real MET_TO_WATTS = 58.15;    // W/m^2 per met
constexpr Real CLO_TO_SI = 0.155;       // m^2 K/W per clo

} // namespace

// ISO 7730 formulation with the clothing surface temperature found by
// fixed-point iteration. No external work.
Real predictedMeanVote(Real airTemperature, Real airSpeed, const ComfortConditions& conditions) {
    const double ta = airTemperature;
    const double tr = airTemperature;
    const double vel = std::max(airSpeed, Real(0));
    const double m = conditions.metabolicRate * MET_TO_WATTS;
    const double icl = conditions.clothing * CLO_TO_SI;

    // Water vapour partial pressure, Pa
    const double pa = conditions.relativeHumidity * 10 * std::exp(16.6536 - 4030.183 / (ta + 235));

    // Clothing area factor
    const double fcl = icl <= 0.078 ? 1 + 1.29 * icl : 1.05 + 0.645 * icl;

    // Forced convection coefficient
    const double hcf = 12.1 * std::sqrt(vel);

    const double taa = ta + 273;
    const double tra = tr + 273;

    // Clothing surface temperature
    const double p1 = icl * fcl;
    const double p2 = p1 * 3.96;
    const double p3 = p1 * 100;
    const double p4 = p1 * taa;
    const double p5 = 308.7 - 0.028 * m + p2 * std::pow(tra / 100, 4);

    double xn = (taa + (35.5 - ta) / (3.5 * icl + 0.1)) / 100;
    double xf = xn;
    double hc = hcf;
    for (int n = 0; n < 150; ++n) {
        xf = (xf + xn) / 2;
        const double hcn = 2.38 * std::pow(std::abs(100 * xf - taa), 0.25);
        hc = std::max(hcf, hcn);
        xn = (p5 + p4 * hc - p2 * std::pow(xf, 4)) / (100 + p3 * hc);
        if (std::abs(xn - xf) < 0.00015) break;
    }
    const double tcl = 100 * xn - 273;

    // Heat loss components
    const double hl1 = 3.05e-3 * (5733 - 6.99 * m - pa);                 // skin diffusion
    const double hl2 = m > MET_TO_WATTS ? 0.42 * (m - MET_TO_WATTS) : 0.0;  // sweating
    const double hl3 = 1.7e-5 * m * (5867 - pa);                         // latent respiration
    const double hl4 = 0.0014 * m * (34 - ta);                           // dry respiration
    const double hl5 = 3.96 * fcl * (std::pow(xn, 4) - std::pow(tra / 100, 4));  // radiation
    const double hl6 = fcl * hc * (tcl - ta);                            // convection

    const double ts = 0.303 * std::exp(-0.036 * m) + 0.028;
    const double pmv = ts * (m - hl1 - hl2 - hl3 - hl4 - hl5 - hl6);

    if (!std::isfinite(pmv)) {
        return pmv < 0 ? Real(-3) : Real(3);
    }
    return static_cast<Real>(std::clamp(pmv, -3.0, 3.0));
}

Real predictedPercentageDissatisfied(Real pmv) {
    const Real pmv2 = pmv * pmv;
    return 100 - 95 * std::exp(-0.03353 * pmv2 * pmv2 - 0.2179 * pmv2);
}

ThermalComfortIndex evaluateComfort(Real airTemperature, Real airSpeed,
                                    const ComfortConditions& conditions) {
    ThermalComfortIndex index;
    index.pmv = predictedMeanVote(airTemperature, airSpeed, conditions);
    index.ppd = predictedPercentageDissatisfied(index.pmv);
    return index;
}

} // namespace roomflow::physics
