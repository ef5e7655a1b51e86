#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <string_view>

#include "ingest/ingestion_service.hpp"
#include "metrics/metric_store.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

inline void handle_request(const IngestionService& ingest,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "trade-telemetry/0.1");

    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        res.result(http::status::bad_request);
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"error":"bad request"})";
        return;
    }

    urls::url_view url = *parsed_result;
    const bool readable = req.method() == http::verb::get;

    // /metrics
    if (readable && url.path() == "/metrics") {
        res.result(http::status::ok);
        res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
        res.body() = render_exposition(ingest.snapshot());
        return;
    }

    // /health
    if (readable && url.path() == "/health") {
        const IngestionHealth h = ingest.health();
        nlohmann::json j = {
            {"running", h.running},
            {"bind_address", h.bind_address},
            {"state", std::string(to_string(h.state))},
            {"frames_received", h.frames_received},
            {"events_applied", h.events_applied},
            {"decode_errors", h.decode_errors},
            {"frames_dropped", h.frames_dropped},
        };
        res.result(h.running ? http::status::ok : http::status::service_unavailable);
        res.set(http::field::content_type, "application/json");
        res.body() = j.dump();
        return;
    }

    // 404
    res.result(http::status::not_found);
    res.set(http::field::content_type, "application/json");
    res.body() = R"({"error":"not found"})";
}
