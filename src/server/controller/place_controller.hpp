/*
 * place_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-5-12

Description: HTTP routes for place lookups

**************************************************/

#ifndef GEOPLACE_SERVER_CONTROLLER_PLACE_CONTROLLER_HPP
#define GEOPLACE_SERVER_CONTROLLER_PLACE_CONTROLLER_HPP

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "controller.hpp"
#include "place/service/query_service.hpp"

namespace geoplace::server::controller {

/// Page size used when `limit` is omitted
inline constexpr int64_t kDefaultLimit = 10;

/**
 * @brief Exposes QueryService over HTTP
 *
 * Routes:
 *   GET /info?id=            place by geonameid
 *   GET /?skip=&limit=       page of places in index order
 *   GET /diff?name_1=&name_2= comparison of two places by name
 *   GET /help?name_part=&limit= alternate-name autocomplete
 *   GET /health              index statistics
 *
 * Handlers are public so they can be exercised without a running server.
 */
class PlaceController : public Controller {
public:
    explicit PlaceController(std::shared_ptr<const service::QueryService> service);

    [[nodiscard]] auto name() const -> std::string_view override {
        return "place";
    }

    void registerRoutes(ServerApp& app) override;

    [[nodiscard]] auto handleInfo(const crow::request& req) const
        -> crow::response;
    [[nodiscard]] auto handleList(const crow::request& req) const
        -> crow::response;
    [[nodiscard]] auto handleDiff(const crow::request& req) const
        -> crow::response;
    [[nodiscard]] auto handleHelp(const crow::request& req) const
        -> crow::response;
    [[nodiscard]] auto handleHealth(const crow::request& req) const
        -> crow::response;

private:
    /**
     * @brief Run a handler body, mapping exceptions to error responses
     *
     * InvalidQueryError maps to 400, TimezoneLookupError and any other
     * std::exception to 500.
     */
    static auto handleQueryAction(const std::string& command,
                                  const std::function<crow::response()>& func)
        -> crow::response;

    /// Absent parameter, parsed value, or the 400 response for a bad value
    using IntParam = std::expected<std::optional<int64_t>, crow::response>;

    /**
     * @brief Read an integer query parameter
     *
     * @return std::nullopt if the parameter is absent, or an
     *         invalid_field_value response naming it if it is not an integer
     */
    static auto intParam(const crow::request& req, const char* name)
        -> IntParam;

    std::shared_ptr<const service::QueryService> service_;
};

}  // namespace geoplace::server::controller

#endif  // GEOPLACE_SERVER_CONTROLLER_PLACE_CONTROLLER_HPP
