#ifndef GEOPLACE_SERVER_MAIN_SERVER_HPP
#define GEOPLACE_SERVER_MAIN_SERVER_HPP

#include <memory>
#include <vector>

#include "app.hpp"
#include "config/server_config.hpp"
#include "controller/controller.hpp"
#include "place/service/query_service.hpp"

namespace geoplace::server {

/**
 * @brief Main server application class
 *
 * Loads the dataset into an immutable index, wires the query service into
 * the controllers and serves HTTP until stopped. Construction fails with
 * the loader's exception if the dataset cannot be indexed, so no request
 * is ever served from a partial index.
 */
class MainServer {
public:
    using Config = config::ServerConfig;

    /**
     * @brief Construct main server with configuration
     *
     * @throws DatasetUnavailableError, MalformedRecordError from the loader
     */
    explicit MainServer(const Config& config);

    /**
     * @brief Start serving (blocking)
     *
     * Returns once Crow's own SIGINT/SIGTERM handling stops the app.
     */
    void start();

    /**
     * @brief Flush and release logging after start() has returned
     */
    void shutdown();

    /**
     * @brief Get the HTTP application instance
     */
    ServerApp& getApp() { return app_; }

    [[nodiscard]] auto getService() const
        -> std::shared_ptr<const service::QueryService> {
        return service_;
    }

private:
    void initializeLogging();
    void initializeIndex();
    void initializeMiddleware();
    void initializeControllers();

    Config config_;
    ServerApp app_;
    std::shared_ptr<const service::QueryService> service_;
    std::vector<std::unique_ptr<controller::Controller>> controllers_;
};

}  // namespace geoplace::server

#endif  // GEOPLACE_SERVER_MAIN_SERVER_HPP
