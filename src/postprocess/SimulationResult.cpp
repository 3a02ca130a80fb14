#include "roomflow/postprocess/SimulationResult.hpp"
#include <iomanip>
#include <sstream>

namespace roomflow {

std::string SimulationResult::summary() const {
    const FlowStatistics& s = statistics;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "status " << toString(status) << " after " << iterations << " iterations"
       << " (residual " << std::scientific << finalResidual() << std::fixed << ")\n"
       << "  velocity      max " << s.maxVelocity << " m/s, avg " << s.avgVelocity << " m/s\n"
       << "  temperature   min " << s.minTemperature << ", max " << s.maxTemperature
       << ", avg " << s.avgTemperature << " C\n"
       << "  uniformity    " << s.uniformity << ", mixing " << s.mixingEfficiency << "\n"
       << "  air changes   " << s.airChangeRate << " 1/h\n"
       << "  pressure drop " << std::scientific << s.pressureDrop << std::fixed << "\n"
       << "  comfort       PMV " << s.comfort.pmv << ", PPD " << s.comfort.ppd << " %";
    return ss.str();
}

} // namespace roomflow
