#include "metrics/metric_store.hpp"
#include "util/text_format.hpp"

#include <sstream>

namespace
{
    std::string_view help_for(std::string_view name)
    {
        if (name == "trades_total") return "Total number of trades";
        if (name == "volume_total") return "Total trading volume";
        if (name == "last_trade_ts_seconds") return "Timestamp of the last received trade";
        if (name == "benchmark_status_events_total") return "Benchmark status notices by status";
        if (const BenchmarkMetricDef* def = find_benchmark_metric(name)) return def->help;
        return "";
    }
}

std::string render_exposition(const MetricSnapshot& snap)
{
    std::ostringstream out;
    const std::string* current = nullptr;

    for (const auto& [key, sample] : snap) {
        if (!current || *current != key.name) {
            current = &key.name;
            out << "# HELP " << key.name << " " << help_for(key.name) << "\n";
            out << "# TYPE " << key.name << " "
                << (sample.kind == MetricKind::Counter ? "counter" : "gauge") << "\n";
        }
        out << key.name;
        if (!key.labels.empty()) {
            out << "{";
            bool first = true;
            for (const auto& [k, v] : key.labels) {
                if (!first) out << ",";
                first = false;
                out << k << "=\"" << label_escape(v) << "\"";
            }
            out << "}";
        }
        out << " ";
        write_number(out, sample.value);
        out << "\n";
    }
    return out.str();
}
