#include "engine/plant/scenario_sweep.hpp"

#include "engine/core/logging.hpp"

#include <sstream>
#include <utility>

namespace skid {

std::vector<SweepRow> run_scenario_sweep(const SweepConfig& cfg,
                                         const PipelineSettings& base,
                                         const PipelineTables& tables) {
    cfg.validate();

    const std::size_t n = cfg.point_count();
    std::vector<SweepRow> rows;
    rows.reserve(n);

    std::size_t failed = 0;
    for (std::size_t i = 0; i < n; ++i) {
        SweepRow row;
        row.main_power_kW = cfg.from_kW + static_cast<double>(i) * cfg.step_kW;

        PipelineSettings s = base;
        s.main_engine.main_power_kW = row.main_power_kW;
        try {
            row.result = run_pipeline(s, tables);
            row.report = build_selection_report(row.result, s, tables);
            row.ok = true;
        } catch (const Error& e) {
            row.ok = false;
            row.code = e.code();
            row.message = e.message();
            ++failed;
            log(LogLevel::WARN, "sweep",
                "point " + std::to_string(row.main_power_kW) + " kW rejected: " + e.message());
        }
        rows.push_back(std::move(row));
    }

    std::ostringstream oss;
    oss << "sweep " << cfg.from_kW << ".." << cfg.to_kW << " step " << cfg.step_kW
        << ": " << n << " points, " << failed << " rejected";
    log(LogLevel::INFO, "sweep", oss.str());
    return rows;
}

} // namespace skid
