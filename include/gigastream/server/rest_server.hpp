#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "gigastream/config.hpp"

namespace gigastream {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

struct AudioUpload {
    std::string content_type;
    std::string body;
};

struct RestHandlers {
    std::function<RestResponse(const nlohmann::json&)> create_session;
    std::function<RestResponse(const std::string&, const AudioUpload&)> append_audio;
    std::function<RestResponse(const std::string&)> session_results;
    std::function<RestResponse(const std::string&)> reset_session;
    std::function<RestResponse(const std::string&)> delete_session;
    std::function<RestResponse(const AudioUpload&)> segment;
};

class RestServer {
public:
    RestServer(const Config& config, RestHandlers handlers);

    void start();
    void stop();

    // Registers the routes on an externally owned server. start() calls it.
    void install_routes(httplib::Server& server);

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;
    void dispatch(const char* route,
                  httplib::Response& response,
                  const std::function<RestResponse()>& handler) const;

    const Config& config_;
    RestHandlers handlers_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
