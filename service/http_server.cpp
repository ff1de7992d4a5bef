#include "http_server.hpp"

#include <spdlog/spdlog.h>

#include "cameras/camera_errors.hpp"
#include "service_errors.hpp"

namespace {

const char* const JSON_CONTENT_TYPE = "application/json";

void send_error(httplib::Response& res, int status, const std::string& detail)
{
    res.status = status;
    nlohmann::json body{{"detail", detail}};
    res.set_content(body.dump(), JSON_CONTENT_TYPE);
}

std::optional<std::string> optional_string(const nlohmann::json& body, const char* key)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw validation_error(std::string("Field '") + key + "' must be a string.");
    }
    return it->get<std::string>();
}

} // namespace

capture_request parse_capture_request(const std::string& body)
{
    capture_request request;
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return request;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        throw validation_error("Request body must be valid JSON.");
    }

    if (json.is_null()) {
        return request;
    }
    if (!json.is_object()) {
        throw validation_error("Request body must be a JSON object.");
    }

    request.resolution = optional_string(json, "resolution");
    request.format = optional_string(json, "format");

    auto quality = json.find("quality");
    if (quality != json.end() && !quality->is_null()) {
        if (!quality->is_number_integer()) {
            throw validation_error("Field 'quality' must be an integer.");
        }
        const auto value = quality->get<long long>();
        if (value < 1 || value > 100) {
            throw validation_error("Quality must be between 1 and 100.");
        }
        request.quality = static_cast<int>(value);
    }

    auto use_extra = json.find("use_extra");
    if (use_extra != json.end() && !use_extra->is_null()) {
        if (!use_extra->is_boolean()) {
            throw validation_error("Field 'use_extra' must be a boolean.");
        }
        request.use_extra = use_extra->get<bool>();
    }
    return request;
}

nlohmann::json capture_outcome_to_json(const capture_outcome& outcome)
{
    nlohmann::json body{
        {"image_id", outcome.primary.image_id},
        {"image_url_or_path", outcome.primary.image_url_or_path},
        {"timestamp", format_utc_timestamp(outcome.timestamp)},
    };

    if (outcome.images) {
        nlohmann::json images = nlohmann::json::array();
        for (const auto& image : *outcome.images) {
            nlohmann::json entry{
                {"index", image.index},
                {"image_id", image.image_id},
                {"image_url_or_path", image.image_url_or_path},
            };
            images.push_back(std::move(entry));
        }
        body["images"] = std::move(images);
    }
    return body;
}

http_server::http_server(const capture_coordinator& coordinator, const image_storage& storage, int worker_threads)
    : m_coordinator(coordinator),
      m_storage(storage)
{
    const size_t threads = static_cast<size_t>(worker_threads > 0 ? worker_threads : 1);
    m_server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    register_routes();
}

void http_server::register_routes()
{
    m_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json out{{"status", "healthy"}, {"service", "camera"}};
        res.set_content(out.dump(), JSON_CONTENT_TYPE);
    });

    m_server.Post("/capture", [this](const httplib::Request& req, httplib::Response& res) {
        handle_capture(req, res);
    });

    m_server.Get(R"(/api/images/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_image(req, res);
    });
}

void http_server::handle_capture(const httplib::Request& req, httplib::Response& res) const
{
    try {
        capture_request request = parse_capture_request(req.body);
        capture_outcome outcome = m_coordinator.capture(request);
        res.set_content(capture_outcome_to_json(outcome).dump(), JSON_CONTENT_TYPE);
    } catch (const validation_error& e) {
        send_error(res, 400, e.what());
    } catch (const camera_capture_error&) {
        send_error(res, 500, "Camera capture failed.");
    } catch (const std::exception& e) {
        spdlog::error("Capture request failed: {}", e.what());
        send_error(res, 500, "Internal server error.");
    }
}

void http_server::handle_image(const httplib::Request& req, httplib::Response& res) const
{
    const std::string filename = req.matches[1];
    try {
        std::string bytes = m_storage.load_image(filename);
        res.set_content(std::move(bytes), image_storage::guess_media_type(filename));
    } catch (const invalid_image_reference_error& e) {
        spdlog::warn("Rejected image reference '{}'", filename);
        send_error(res, 400, e.what());
    } catch (const image_not_found_error& e) {
        send_error(res, 404, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Image fetch failed for '{}': {}", filename, e.what());
        send_error(res, 500, "Internal server error.");
    }
}

bool http_server::listen(const std::string& host, int port)
{
    spdlog::info("HTTP server listening on {}:{}", host, port);
    return m_server.listen(host, port);
}

int http_server::bind_to_any_port(const std::string& host)
{
    return m_server.bind_to_any_port(host);
}

bool http_server::listen_after_bind()
{
    return m_server.listen_after_bind();
}

void http_server::stop()
{
    m_server.stop();
}

bool http_server::is_running() const
{
    return m_server.is_running();
}
