#ifndef GEOPLACE_SERVER_CONTROLLER_CONTROLLER_HPP
#define GEOPLACE_SERVER_CONTROLLER_CONTROLLER_HPP

#include <string_view>

#include "../app.hpp"

namespace geoplace::server::controller {

/**
 * @brief Interface of an HTTP route group
 *
 * MainServer owns one instance per group and calls registerRoutes() once
 * before the application starts listening.
 */
class Controller {
public:
    virtual ~Controller() = default;

    /// Short name used in startup logs
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    virtual void registerRoutes(ServerApp& app) = 0;
};

}  // namespace geoplace::server::controller

#endif  // GEOPLACE_SERVER_CONTROLLER_CONTROLLER_HPP
