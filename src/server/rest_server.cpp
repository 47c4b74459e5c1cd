#include "gigastream/server/rest_server.hpp"

#include <stdexcept>

#include "gigastream/logging.hpp"
#include "gigastream/metrics.hpp"

namespace gigastream {

namespace {

constexpr const char* kSessionRoute = R"(/sessions/([A-Za-z0-9_-]+))";

std::string header_value(const httplib::Request& request, const std::string& name) {
    const auto it = request.headers.find(name);
    return it == request.headers.end() ? std::string{} : it->second;
}

}

RestServer::RestServer(const Config& config, RestHandlers handlers)
    : config_(config),
      handlers_(std::move(handlers)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();
    install_routes(*server_);

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error(
                "REST server failed to listen",
                {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::install_routes(httplib::Server& server) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server.Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server.Post("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body = nlohmann::json::object();
        if (!req.body.empty()) {
            try {
                body = nlohmann::json::parse(req.body);
            } catch (const std::exception& ex) {
                logging::error(
                    "Failed to parse /sessions request",
                    {kv("error", ex.what())});
                res.status = 400;
                res.set_content(R"({"message":"invalid request body"})", "application/json");
                return;
            }
        }
        dispatch("/sessions", res, [&]() { return handlers_.create_session(body); });
    });

    server.Post(std::string(kSessionRoute) + "/audio",
                [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        const AudioUpload upload{header_value(req, "Content-Type"), req.body};
        dispatch("/sessions/audio", res,
                 [&]() { return handlers_.append_audio(session_id, upload); });
    });

    server.Get(std::string(kSessionRoute) + "/results",
               [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        dispatch("/sessions/results", res,
                 [&]() { return handlers_.session_results(session_id); });
    });

    server.Post(std::string(kSessionRoute) + "/reset",
                [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        dispatch("/sessions/reset", res,
                 [&]() { return handlers_.reset_session(session_id); });
    });

    server.Delete(kSessionRoute, [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        dispatch("/sessions/delete", res,
                 [&]() { return handlers_.delete_session(session_id); });
    });

    server.Post("/segment", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const AudioUpload upload{header_value(req, "Content-Type"), req.body};
        dispatch("/segment", res, [&]() { return handlers_.segment(upload); });
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::dispatch(const char* route,
                          httplib::Response& response,
                          const std::function<RestResponse()>& handler) const {
    try {
        write_json(response, handler());
    } catch (const std::invalid_argument& ex) {
        logging::warn(
            "Rejected request",
            {kv("route", route),
             kv("error", ex.what())});
        write_json(response, {400, {{"message", ex.what()}}});
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to handle request",
            {kv("route", route),
             kv("error", ex.what())});
        write_json(response, {500, {{"message", "internal error"}}});
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
