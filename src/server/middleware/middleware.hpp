#ifndef GEOPLACE_SERVER_MIDDLEWARE_MIDDLEWARE_HPP
#define GEOPLACE_SERVER_MIDDLEWARE_MIDDLEWARE_HPP

#include <crow.h>
#include <chrono>

#include <spdlog/spdlog.h>

namespace geoplace::server::middleware {

/**
 * @brief CORS middleware
 *
 * Adds permissive CORS headers to every response while `enabled` is set.
 */
struct CORS {
    struct context {};

    bool enabled = true;

    void before_handle(crow::request& /*req*/, crow::response& /*res*/,
                       context& /*ctx*/) {
        // CORS headers are set in after_handle
    }

    void after_handle(crow::request& /*req*/, crow::response& res,
                      context& /*ctx*/) {
        if (!enabled) {
            return;
        }
        res.add_header("Access-Control-Allow-Origin", "*");
        res.add_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.add_header("Access-Control-Allow-Headers", "Content-Type");
        res.add_header("Access-Control-Max-Age", "3600");
    }
};

/**
 * @brief Request logging middleware
 */
struct RequestLogger {
    struct context {
        std::chrono::steady_clock::time_point start_time;
    };

    void before_handle(crow::request& req, crow::response& /*res*/,
                       context& ctx) {
        ctx.start_time = std::chrono::steady_clock::now();
        spdlog::debug("Incoming request: {} {}", crow::method_name(req.method),
                      req.raw_url);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        spdlog::info("Request completed: {} {} - Status: {} - Duration: {}ms",
                     crow::method_name(req.method), req.raw_url, res.code,
                     duration.count());
    }
};

}  // namespace geoplace::server::middleware

#endif  // GEOPLACE_SERVER_MIDDLEWARE_MIDDLEWARE_HPP
