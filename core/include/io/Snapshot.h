#ifndef IO_SNAPSHOT_H
#define IO_SNAPSHOT_H

#include "kernel/Model.h"
#include "modules/PolicySweep.h"
#include <cstdint>
#include <string>
#include <iosfwd>
#include <vector>

// JSON export for model state (agents optional)
std::string modelToJson(const Model& model, bool includeAgents = false);

// Full time series of one country: header `step,<metric...>`, one row per step.
// Throws std::out_of_range for an unknown country.
void writeMetricsCsv(const MetricsStore& store, std::uint32_t country, std::ostream& out);

// One CSV row per country for the latest step: generation,country,<metric...>
void logMetricsHeader(std::ostream& out);
void logMetrics(const Model& model, std::ostream& out);

// One row per sweep outcome: levers followed by the averaged indicators
void writeSweepCsv(const std::vector<SweepOutcome>& outcomes, std::ostream& out);

#endif
