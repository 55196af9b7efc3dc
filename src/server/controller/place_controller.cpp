/*
 * place_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "place_controller.hpp"

#include <charconv>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../utils/response.hpp"
#include "exception/exception.hpp"

namespace geoplace::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

PlaceController::PlaceController(
    std::shared_ptr<const service::QueryService> service)
    : service_(std::move(service)) {
    if (!service_) {
        THROW_INVALID_ARGUMENT("PlaceController requires a query service");
    }
}

void PlaceController::registerRoutes(ServerApp& app) {
    CROW_ROUTE(app, "/info")
        .methods("GET"_method)(
            [this](const crow::request& req) { return handleInfo(req); });
    CROW_ROUTE(app, "/")
        .methods("GET"_method)(
            [this](const crow::request& req) { return handleList(req); });
    CROW_ROUTE(app, "/diff")
        .methods("GET"_method)(
            [this](const crow::request& req) { return handleDiff(req); });
    CROW_ROUTE(app, "/help")
        .methods("GET"_method)(
            [this](const crow::request& req) { return handleHelp(req); });
    CROW_ROUTE(app, "/health")
        .methods("GET"_method)(
            [this](const crow::request& req) { return handleHealth(req); });
}

auto PlaceController::handleQueryAction(
    const std::string& command, const std::function<crow::response()>& func)
    -> crow::response {
    try {
        return func();
    } catch (const InvalidQueryError& e) {
        spdlog::warn("Rejected {} request: {}", command, e.what());
        return ResponseBuilder::invalidQuery(e.what());
    } catch (const TimezoneLookupError& e) {
        spdlog::error("Timezone lookup failed in {}: {}", command, e.what());
        return ResponseBuilder::internalError(e.what());
    } catch (const std::exception& e) {
        spdlog::error("Exception occurred while executing {}: {}", command,
                      e.what());
        return ResponseBuilder::internalError(e.what());
    }
}

auto PlaceController::intParam(const crow::request& req, const char* name)
    -> IntParam {
    const char* raw = req.url_params.get(name);
    if (raw == nullptr) {
        return std::optional<int64_t>{};
    }
    std::string_view text(raw);
    int64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        spdlog::warn("Query parameter '{}' is not an integer: '{}'", name,
                     text);
        return std::unexpected(
            ResponseBuilder::invalidFieldValue(name, "integer"));
    }
    return std::optional<int64_t>{value};
}

auto PlaceController::handleInfo(const crow::request& req) const
    -> crow::response {
    return handleQueryAction("info", [&]() -> crow::response {
        auto id = intParam(req, "id");
        if (!id) {
            return std::move(id).error();
        }
        if (!id->has_value()) {
            return ResponseBuilder::missingField("id");
        }
        auto place = service_->getById(**id);
        if (!place) {
            return ResponseBuilder::notFound("Place", std::to_string(**id));
        }
        return ResponseBuilder::success((*place)->toJson());
    });
}

auto PlaceController::handleList(const crow::request& req) const
    -> crow::response {
    return handleQueryAction("list", [&]() -> crow::response {
        auto skip = intParam(req, "skip");
        if (!skip) {
            return std::move(skip).error();
        }
        auto limit = intParam(req, "limit");
        if (!limit) {
            return std::move(limit).error();
        }

        nlohmann::json places = nlohmann::json::array();
        for (const auto& place : service_->getPage(
                 skip->value_or(0), limit->value_or(kDefaultLimit))) {
            places.push_back(place->toJson());
        }
        return ResponseBuilder::success(places);
    });
}

auto PlaceController::handleDiff(const crow::request& req) const
    -> crow::response {
    return handleQueryAction("diff", [&]() -> crow::response {
        const char* first = req.url_params.get("name_1");
        if (first == nullptr) {
            return ResponseBuilder::missingField("name_1");
        }
        const char* second = req.url_params.get("name_2");
        if (second == nullptr) {
            return ResponseBuilder::missingField("name_2");
        }

        auto result = service_->compare(first, second);
        if (!result) {
            return ResponseBuilder::notFound(
                "Place", std::string(first) + ", " + second);
        }
        return ResponseBuilder::success(result->toJson());
    });
}

auto PlaceController::handleHelp(const crow::request& req) const
    -> crow::response {
    return handleQueryAction("help", [&]() -> crow::response {
        const char* prefix = req.url_params.get("name_part");
        if (prefix == nullptr) {
            return ResponseBuilder::missingField("name_part");
        }
        auto limit = intParam(req, "limit");
        if (!limit) {
            return std::move(limit).error();
        }
        return ResponseBuilder::success(
            service_->prefixSearch(prefix, limit->value_or(kDefaultLimit)));
    });
}

auto PlaceController::handleHealth(const crow::request& /*req*/) const
    -> crow::response {
    return handleQueryAction("health", [&]() -> crow::response {
        return ResponseBuilder::success(
            {{"status", "ok"},
             {"places", service_->size()},
             {"index", service_->placeIndex().stats().toJson()}});
    });
}

}  // namespace geoplace::server::controller
