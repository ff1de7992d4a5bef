#pragma once

#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "capture_coordinator.hpp"
#include "image_storage.hpp"

/**
 * @brief Parse the optional JSON body of POST /capture
 *
 * An empty body, "null" and "{}" all mean "use the defaults".
 *
 * @throws validation_error for malformed JSON or mistyped fields
 */
capture_request parse_capture_request(const std::string& body);

/**
 * @brief Response body for a finished capture
 */
nlohmann::json capture_outcome_to_json(const capture_outcome& outcome);

/**
 * @brief HTTP front end of the camera service
 *
 *   GET  /health                  liveness, independent of the cameras
 *   POST /capture                 capture, store and describe a new image
 *   GET  /api/images/<filename>   stored image bytes
 */
class http_server {
public:
    http_server(const capture_coordinator& coordinator, const image_storage& storage, int worker_threads);

    http_server(const http_server&) = delete;
    http_server& operator=(const http_server&) = delete;

    /**
     * @brief Serve until stop() is called
     *
     * @return false if the socket could not be bound
     */
    bool listen(const std::string& host, int port);

    /**
     * @brief Bind an ephemeral port, serve with listen_after_bind()
     *
     * @return the bound port, or -1
     */
    int bind_to_any_port(const std::string& host);
    bool listen_after_bind();

    void stop();
    bool is_running() const;

private:
    void register_routes();
    void handle_capture(const httplib::Request& req, httplib::Response& res) const;
    void handle_image(const httplib::Request& req, httplib::Response& res) const;

    const capture_coordinator& m_coordinator;
    const image_storage& m_storage;
    httplib::Server m_server;
};
