#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

namespace docqa::test {

/// A request as the collaborator server saw it.
struct CapturedRequest {
    std::string method;
    std::string path;
    std::string body;
    std::string api_key;
    std::string authorization;
};

/// In-process HTTP server on an ephemeral loopback port, standing in for an
/// embedding server, a vector store or a rerank server. Every request is
/// recorded and answered by `respond`.
class LocalHttpServer {
public:
    using Responder = std::function<void(const httplib::Request&, httplib::Response&)>;

    explicit LocalHttpServer(Responder respond) : respond_(std::move(respond)) {
        auto handler = [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard lock(mutex_);
                captured_.push_back(CapturedRequest{
                    req.method, req.path, req.body,
                    req.get_header_value("api-key"),
                    req.get_header_value("Authorization"),
                });
            }
            respond_(req, res);
        };
        server_.Get(".*", handler);
        server_.Post(".*", handler);

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~LocalHttpServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    [[nodiscard]] auto url() const -> std::string {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    [[nodiscard]] auto requests() const -> std::vector<CapturedRequest> {
        std::lock_guard lock(mutex_);
        return captured_;
    }

private:
    Responder respond_;
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<CapturedRequest> captured_;
};

/// Loopback port nothing listens on.
inline constexpr const char* kUnreachableUrl = "http://127.0.0.1:1";

} // namespace docqa::test
