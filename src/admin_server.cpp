#include "admin_server.hpp"
#include <iostream>

AdminServer::AdminServer(const SinkStats& stats, FlushRequest flush_request)
    : stats_(stats)
    , flush_request_(std::move(flush_request)) {
}

void AdminServer::setupRoutes(crow::SimpleApp& app) {
    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "OK");
    });

    CROW_ROUTE(app, "/ready")
    ([this]() {
        if (!stats_.ready) {
            return crow::response(503, "Consumer not ready");
        }
        return crow::response(200, "OK");
    });

    // The flush itself runs on the consumer thread, the writer manager is not shared
    CROW_ROUTE(app, "/flush").methods("POST"_method)
    ([this]() {
        std::cout << "Flush requested via HTTP endpoint" << std::endl;
        if (!flush_request_) {
            return crow::response(503, "Flush not available");
        }
        flush_request_();
        return crow::response(202, "Flush requested, offsets are committed once sealed");
    });

    CROW_ROUTE(app, "/stats")
    ([this]() {
        crow::json::wvalue stats;
        stats["ready"] = stats_.ready.load();
        stats["messages_consumed"] = stats_.messages_consumed.load();
        stats["conversion_errors"] = stats_.conversion_errors.load();
        stats["dead_lettered"] = stats_.dead_lettered.load();
        stats["batches"] = stats_.batches.load();
        stats["commits"] = stats_.commits.load();
        stats["rollbacks"] = stats_.rollbacks.load();
        stats["retries"] = stats_.retries.load();
        stats["sealed_objects"] = stats_.sealed_objects.load();
        stats["buffered_records"] = stats_.buffered_records.load();
        stats["open_writers"] = stats_.open_writers.load();
        stats["assigned_partitions"] = stats_.assigned_partitions.load();
        return crow::response(200, stats);
    });
}

void AdminServer::start(int port) {
    crow::SimpleApp app;
    setupRoutes(app);

    std::cout << "Admin server running on port " << port << std::endl;
    std::cout << "  POST /flush - Seal all buffered objects" << std::endl;
    std::cout << "  GET /stats - Sink statistics" << std::endl;
    std::cout << "  GET /health - Health check" << std::endl;

    app.port(port).multithreaded().run();
}
