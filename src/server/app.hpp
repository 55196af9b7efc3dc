#ifndef GEOPLACE_SERVER_APP_HPP
#define GEOPLACE_SERVER_APP_HPP

#include <crow.h>

#include "middleware/middleware.hpp"

namespace geoplace::server {

/**
 * @brief Central HTTP application type with middleware stack
 *
 * Middleware execution order (before_handle):
 *   1. CORS - Response headers only
 *   2. RequestLogger - Log request timing
 *
 * Note: after_handle runs in reverse order
 */
using ServerApp = crow::App<middleware::CORS, middleware::RequestLogger>;

}  // namespace geoplace::server

#endif  // GEOPLACE_SERVER_APP_HPP
