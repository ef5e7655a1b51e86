#include "codec/message_codec.hpp"
#include "errors.hpp"
#include "util/text_format.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <map>
#include <type_traits>
#include <utility>

using json = nlohmann::json;

namespace
{
    // Flat view of the top-level object, collected in one pass so field
    // order on the wire never matters.
    struct RawFields
    {
        std::map<std::string, std::string, std::less<>> strings;
        std::map<std::string, double, std::less<>> numbers;
        std::map<std::string, std::string, std::less<>> bad; // field -> reason
        std::optional<Labels> labels;
    };

    DecodeResult fail(std::string field, std::string reason)
    {
        DecodeResult r;
        r.error = DecodeError{std::move(field), std::move(reason)};
        return r;
    }

    DecodeResult success(Event ev)
    {
        DecodeResult r;
        r.event = std::move(ev);
        return r;
    }

    std::optional<DecodeError> find_string(const RawFields& f, std::string_view key, std::string& out)
    {
        auto it = f.strings.find(key);
        if (it != f.strings.end()) {
            out = it->second;
            return std::nullopt;
        }
        auto bad = f.bad.find(key);
        if (bad != f.bad.end()) return DecodeError{std::string(key), bad->second};
        if (f.numbers.count(key)) return DecodeError{std::string(key), "expected a string"};
        return DecodeError{std::string(key), "missing field"};
    }

    std::optional<DecodeError> find_number(const RawFields& f, std::string_view key, double& out)
    {
        auto it = f.numbers.find(key);
        if (it != f.numbers.end()) {
            if (!std::isfinite(it->second)) {
                return DecodeError{std::string(key), "expected a finite number"};
            }
            out = it->second;
            return std::nullopt;
        }
        auto bad = f.bad.find(key);
        if (bad != f.bad.end()) return DecodeError{std::string(key), bad->second};
        if (f.strings.count(key)) return DecodeError{std::string(key), "expected a number"};
        return DecodeError{std::string(key), "missing field"};
    }

    bool present(const RawFields& f, std::string_view key)
    {
        return f.strings.count(key) || f.numbers.count(key) || f.bad.count(key);
    }

    DecodeResult decode_trade(const RawFields& f)
    {
        TradeEvent t;

        std::string side;
        if (auto err = find_string(f, "side", side)) return fail(err->field, err->reason);
        if (side == "buy") {
            t.side = Side::Buy;
        } else if (side == "sell") {
            t.side = Side::Sell;
        } else {
            return fail("side", "unknown side '" + side + "'");
        }

        if (auto err = find_number(f, "qty", t.quantity)) return fail(err->field, err->reason);
        if (t.quantity < 0.0) return fail("qty", "quantity must be >= 0");

        if (auto err = find_number(f, "ts", t.timestamp)) return fail(err->field, err->reason);

        return success(t);
    }

    DecodeResult decode_benchmark(RawFields& f)
    {
        BenchmarkEvent b;

        if (auto err = find_string(f, "metric_name", b.metric_name)) return fail(err->field, err->reason);
        const BenchmarkMetricDef* def = find_benchmark_metric(b.metric_name);
        if (!def) return fail("metric_name", "unknown benchmark metric '" + b.metric_name + "'");

        if (auto err = find_number(f, "value", b.value)) return fail(err->field, err->reason);
        if (def->kind == MetricKind::Counter && b.value < 0.0) {
            return fail("value", "counter increment must be >= 0");
        }

        auto bad = f.bad.find(std::string_view("labels"));
        if (bad != f.bad.end()) return fail("labels", bad->second);
        if (f.labels) {
            b.labels = std::move(*f.labels);
        } else if (present(f, "labels")) {
            return fail("labels", "expected an object of strings");
        }

        return success(std::move(b));
    }

    DecodeResult decode_status(const RawFields& f)
    {
        BenchmarkStatusEvent s;

        std::string status;
        if (auto err = find_string(f, "status", status)) return fail(err->field, err->reason);
        if (!parse_status(status, s.status)) return fail("status", "unknown status '" + status + "'");

        if (auto err = find_string(f, "test_name", s.test_name)) return fail(err->field, err->reason);

        if (present(f, "message")) {
            if (auto err = find_string(f, "message", s.message)) return fail(err->field, err->reason);
        }
        if (present(f, "ts")) {
            if (auto err = find_number(f, "ts", s.timestamp)) return fail(err->field, err->reason);
        }
        return success(std::move(s));
    }

    void check_finite(double v, const char* what)
    {
        if (!std::isfinite(v)) {
            throw EncodingError(std::string("encode: ") + what + " is not finite");
        }
    }
}

std::string MessageCodec::encode(const Event& ev)
{
    json j;
    std::visit([&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TradeEvent>) {
            check_finite(e.quantity, "qty");
            check_finite(e.timestamp, "ts");
            if (e.quantity < 0.0) throw EncodingError("encode: qty must be >= 0");
            j["type"] = "trade";
            j["side"] = std::string(to_string(e.side));
            j["qty"]  = e.quantity;
            j["ts"]   = e.timestamp;
        } else if constexpr (std::is_same_v<T, BenchmarkEvent>) {
            const BenchmarkMetricDef* def = find_benchmark_metric(e.metric_name);
            if (!def) throw EncodingError("encode: unknown benchmark metric '" + e.metric_name + "'");
            check_finite(e.value, "value");
            if (def->kind == MetricKind::Counter && e.value < 0.0) {
                throw EncodingError("encode: counter increment must be >= 0");
            }
            for (const auto& [k, v] : e.labels) {
                if (!valid_label_name(k)) throw EncodingError("encode: invalid label name '" + k + "'");
            }
            j["type"]        = "benchmark";
            j["metric_name"] = e.metric_name;
            j["value"]       = e.value;
            j["labels"]      = e.labels;
        } else {
            check_finite(e.timestamp, "ts");
            j["type"]      = "benchmark_status";
            j["status"]    = std::string(to_string(e.status));
            j["test_name"] = e.test_name;
            j["message"]   = e.message;
            j["ts"]        = e.timestamp;
        }
    }, ev);
    return j.dump();
}

DecodeResult MessageCodec::decode(std::string_view raw)
{
    simdjson::padded_string pj(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    if (auto err = parser_.iterate(pj).get(doc)) {
        return fail("$", simdjson::error_message(err));
    }

    simdjson::ondemand::object obj;
    if (doc.get_object().get(obj)) {
        return fail("$", "payload is not a JSON object");
    }

    RawFields f;
    for (auto field_res : obj) {
        simdjson::ondemand::field field;
        if (auto err = std::move(field_res).get(field)) return fail("$", simdjson::error_message(err));

        std::string_view key_sv;
        if (auto err = field.unescaped_key().get(key_sv)) return fail("$", simdjson::error_message(err));
        std::string key(key_sv);

        simdjson::ondemand::value& val = field.value();
        simdjson::ondemand::json_type type;
        if (auto err = val.type().get(type)) return fail(key, simdjson::error_message(err));

        switch (type) {
            case simdjson::ondemand::json_type::string: {
                std::string_view sv;
                if (auto err = val.get_string().get(sv)) return fail(key, simdjson::error_message(err));
                f.strings[key] = std::string(sv);
                break;
            }
            case simdjson::ondemand::json_type::number: {
                double d = 0;
                if (val.get_double().get(d)) {
                    f.bad[key] = "expected a finite number";
                } else {
                    f.numbers[key] = d;
                }
                break;
            }
            case simdjson::ondemand::json_type::object: {
                if (key != "labels") {
                    f.bad[key] = "unexpected object";
                    break;
                }
                simdjson::ondemand::object lobj;
                if (auto err = val.get_object().get(lobj)) return fail(key, simdjson::error_message(err));
                Labels labels;
                std::string labels_bad;
                for (auto lf_res : lobj) {
                    simdjson::ondemand::field lf;
                    if (auto err = std::move(lf_res).get(lf)) return fail("labels", simdjson::error_message(err));
                    std::string_view lk;
                    if (auto err = lf.unescaped_key().get(lk)) return fail("labels", simdjson::error_message(err));
                    std::string label_key(lk);
                    if (!valid_label_name(label_key)) {
                        if (labels_bad.empty()) labels_bad = "invalid label name '" + label_key + "'";
                        continue;
                    }
                    std::string_view lv;
                    if (lf.value().get_string().get(lv)) {
                        if (labels_bad.empty()) labels_bad = "label values must be strings";
                        continue;
                    }
                    labels[label_key] = std::string(lv);
                }
                if (labels_bad.empty()) {
                    f.labels = std::move(labels);
                } else {
                    f.bad[key] = std::move(labels_bad);
                }
                break;
            }
            default:
                f.bad[key] = "unexpected value type";
                break;
        }
    }

    if (!doc.at_end()) {
        return fail("$", "trailing content after payload");
    }

    std::string type;
    if (auto err = find_string(f, "type", type)) return fail(err->field, err->reason);

    if (type == "trade") return decode_trade(f);
    if (type == "benchmark") return decode_benchmark(f);
    if (type == "benchmark_status") return decode_status(f);
    return fail("type", "unknown message type '" + type + "'");
}
