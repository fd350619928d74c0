#ifndef ADMIN_SERVER_HPP
#define ADMIN_SERVER_HPP

#include "consumer/sink_stats.hpp"
#include "crow.h"
#include <functional>

// Health, readiness, stats and flush endpoints
class AdminServer {
public:
    using FlushRequest = std::function<void()>;

    AdminServer(const SinkStats& stats, FlushRequest flush_request);

    void start(int port);

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

private:
    const SinkStats& stats_;
    FlushRequest flush_request_;
};

#endif // ADMIN_SERVER_HPP
