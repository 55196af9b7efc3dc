#ifndef GEOPLACE_SERVER_UTILS_RESPONSE_HPP
#define GEOPLACE_SERVER_UTILS_RESPONSE_HPP

#include <crow.h>
#include <string>
#include <nlohmann/json.hpp>

namespace geoplace::server::utils {

/**
 * @brief Utility class for creating standardized API responses
 *
 * Success bodies are `{"status": "success", "data": ...}`; error bodies
 * are `{"status": "error", "error": {"code": ..., "message": ...}}`.
 */
class ResponseBuilder {
public:
    /**
     * @brief Create a successful JSON response
     */
    static crow::response success(const nlohmann::json& data, int code = 200) {
        nlohmann::json body = {
            {"status", "success"},
            {"data", data}
        };
        return makeJsonResponse(body, code);
    }

    /**
     * @brief Create an error response
     */
    static crow::response error(const std::string& code,
                               const std::string& message,
                               int httpCode = 400,
                               const nlohmann::json& details = nullptr) {
        nlohmann::json errorObj = {
            {"code", code},
            {"message", message}
        };
        if (!details.is_null()) {
            errorObj["details"] = details;
        }

        nlohmann::json body = {
            {"status", "error"},
            {"error", errorObj}
        };
        return makeJsonResponse(body, httpCode);
    }

    /**
     * @brief Missing required query parameter (400)
     */
    static crow::response missingField(const std::string& fieldName,
                                      const std::string& requirement = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!requirement.empty()) {
            details["requirement"] = requirement;
        }
        return error("missing_required_field",
                    "Required field '" + fieldName + "' is missing.",
                    400,
                    details);
    }

    /**
     * @brief Invalid query parameter value (400)
     */
    static crow::response invalidFieldValue(const std::string& fieldName,
                                           const std::string& constraint = "") {
        nlohmann::json details = {{"field", fieldName}};
        if (!constraint.empty()) {
            details["constraint"] = constraint;
        }
        return error("invalid_field_value",
                    "Field '" + fieldName + "' has an invalid value.",
                    400,
                    details);
    }

    /**
     * @brief Query rejected by validation (400)
     *
     * Used when the offending parameter is only known from the message.
     */
    static crow::response invalidQuery(const std::string& message) {
        return error("invalid_field_value", message, 400);
    }

    /**
     * @brief Internal server error (500)
     */
    static crow::response internalError(const std::string& message = "An unexpected error occurred") {
        return error("internal_error", message, 500);
    }

    /**
     * @brief Not found error (404)
     */
    static crow::response notFound(const std::string& resource, const std::string& identifier = "") {
        std::string message = resource + " not found";
        if (!identifier.empty()) {
            message += ": " + identifier;
        }
        return error("not_found", message, 404);
    }

private:
    static crow::response makeJsonResponse(const nlohmann::json& body, int code) {
        crow::response res(code);
        res.set_header("Content-Type", "application/json");
        res.write(body.dump());
        return res;
    }
};

}  // namespace geoplace::server::utils

#endif  // GEOPLACE_SERVER_UTILS_RESPONSE_HPP
