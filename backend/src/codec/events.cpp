#include "codec/events.hpp"

std::string_view to_string(BenchmarkStatus s) noexcept
{
    switch (s) {
        case BenchmarkStatus::Started:   return "started";
        case BenchmarkStatus::Running:   return "running";
        case BenchmarkStatus::Completed: return "completed";
        case BenchmarkStatus::Failed:    return "failed";
        case BenchmarkStatus::Alert:     return "alert";
    }
    return "running";
}

bool parse_status(std::string_view s, BenchmarkStatus& out) noexcept
{
    if (s == "started")   { out = BenchmarkStatus::Started;   return true; }
    if (s == "running")   { out = BenchmarkStatus::Running;   return true; }
    if (s == "completed") { out = BenchmarkStatus::Completed; return true; }
    if (s == "failed")    { out = BenchmarkStatus::Failed;    return true; }
    if (s == "alert")     { out = BenchmarkStatus::Alert;     return true; }
    return false;
}

const BenchmarkMetricDef* find_benchmark_metric(std::string_view name) noexcept
{
    for (const auto& def : kBenchmarkMetrics) {
        if (def.name == name) return &def;
    }
    return nullptr;
}
