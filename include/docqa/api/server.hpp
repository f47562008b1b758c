#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>

#include "docqa/core/config.hpp"
#include "docqa/core/error.hpp"
#include "docqa/retrieval/pipeline.hpp"

namespace docqa::api {

using boost::asio::awaitable;
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using json = nlohmann::json;

/// Parsed body of `POST /retrieve`.
struct RetrieveRequest {
    std::string query;
    std::optional<size_t> k;
    bool include_prompt = false;
};

/// Validates a `/retrieve` body: a JSON object with a string `query`, an
/// optional positive integer `k` and an optional boolean `prompt`.
auto parse_retrieve_request(std::string_view body) -> Result<RetrieveRequest>;

/// HTTP status an error code is reported with.
auto error_status(ErrorCode code) -> unsigned;

/// `{"error": {"code": ..., "message": ...}}`
auto error_body(const Error& error) -> json;

/// Transport-independent response produced by the router.
struct ApiResponse {
    unsigned status = 200;
    json body;
    std::string allow;  // Allow header for 405 responses
};

/// Thin HTTP/1.1 front end over a RetrievalPipeline.
///
/// Routes:
///   POST /retrieve  {"query": "...", "k": 8, "prompt": false}
///   GET  /health
class ApiServer {
public:
    ApiServer(net::io_context& ioc, ServerConfig config,
              retrieval::RetrievalPipeline& pipeline);

    /// Binds, listens and serves until stop() is called.
    auto start() -> awaitable<void>;

    /// Stops accepting connections. In-flight requests run to completion.
    void stop();

    /// Routes one request. Exposed for tests; the connection handler
    /// calls it for every parsed request.
    auto handle_request(http::verb method, std::string_view target,
                        std::string_view body) -> awaitable<ApiResponse>;

    /// Port the acceptor is bound to, 0 before start(). Useful with port 0.
    [[nodiscard]] auto local_port() const -> uint16_t;

    [[nodiscard]] auto connection_count() const noexcept -> size_t { return active_connections_; }
    [[nodiscard]] auto is_running() const noexcept -> bool { return running_; }

private:
    auto accept_loop() -> awaitable<void>;
    auto handle_connection(tcp::socket socket) -> awaitable<void>;
    auto handle_retrieve(std::string_view body) -> awaitable<ApiResponse>;
    auto handle_health() const -> ApiResponse;

    net::io_context& ioc_;
    ServerConfig config_;
    retrieval::RetrievalPipeline& pipeline_;
    std::optional<tcp::acceptor> acceptor_;
    size_t active_connections_ = 0;
    bool running_ = false;
};

} // namespace docqa::api
