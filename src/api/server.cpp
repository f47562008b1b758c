#include "docqa/api/server.hpp"

#include "docqa/core/logger.hpp"
#include "docqa/core/utils.hpp"
#include "docqa/retrieval/prompt.hpp"

#include <chrono>
#include <exception>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#ifndef DOCQA_VERSION_STRING
#define DOCQA_VERSION_STRING "0.1.0-dev"
#endif

namespace docqa::api {

namespace beast = boost::beast;

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(30);

auto error_response(const Error& error) -> ApiResponse {
    return ApiResponse{.status = error_status(error.code()), .body = error_body(error), .allow = {}};
}

/// Keeps the active connection count right on every exit path.
class ConnectionCounter {
public:
    explicit ConnectionCounter(size_t& count) : count_(count) { ++count_; }
    ~ConnectionCounter() { --count_; }

    ConnectionCounter(const ConnectionCounter&) = delete;
    ConnectionCounter& operator=(const ConnectionCounter&) = delete;

private:
    size_t& count_;
};

auto internal_error_response(std::string detail) -> ApiResponse {
    return ApiResponse{
        .status = 500,
        .body = error_body(make_error(ErrorCode::InternalError,
                                      "Internal server error", std::move(detail))),
        .allow = {},
    };
}

auto method_not_allowed(std::string allow) -> ApiResponse {
    return ApiResponse{
        .status = 405,
        .body = error_body(make_error(ErrorCode::InvalidArgument, "Method not allowed")),
        .allow = std::move(allow),
    };
}

} // anonymous namespace

auto parse_retrieve_request(std::string_view body) -> Result<RetrieveRequest> {
    json parsed;
    try {
        parsed = json::parse(body);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Request body is not valid JSON", e.what()));
    }
    if (!parsed.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Request body must be a JSON object"));
    }

    RetrieveRequest request;

    auto query = parsed.find("query");
    if (query == parsed.end() || !query->is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Field 'query' must be a string"));
    }
    request.query = query->get<std::string>();

    if (auto k = parsed.find("k"); k != parsed.end() && !k->is_null()) {
        if (!k->is_number_integer() || k->get<int64_t>() < 1) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Field 'k' must be a positive integer"));
        }
        request.k = k->get<size_t>();
    }

    if (auto prompt = parsed.find("prompt"); prompt != parsed.end() && !prompt->is_null()) {
        if (!prompt->is_boolean()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                "Field 'prompt' must be a boolean"));
        }
        request.include_prompt = prompt->get<bool>();
    }

    return request;
}

auto error_status(ErrorCode code) -> unsigned {
    switch (code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::SerializationError:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::BackendUnavailable:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::Timeout:
        case ErrorCode::RerankModelError:
            return 502;
        case ErrorCode::IndexUnavailable:
            return 503;
        default:
            return 500;
    }
}

auto error_body(const Error& error) -> json {
    return json{
        {"error", {
            {"code", error_code_to_string(error.code())},
            {"message", error.what()},
        }},
    };
}

// ===========================================================================
// ApiServer
// ===========================================================================

ApiServer::ApiServer(net::io_context& ioc, ServerConfig config,
                     retrieval::RetrievalPipeline& pipeline)
    : ioc_(ioc), config_(std::move(config)), pipeline_(pipeline) {}

auto ApiServer::start() -> awaitable<void> {
    auto address = (config_.bind == BindMode::All)
        ? net::ip::make_address("0.0.0.0")
        : net::ip::make_address("127.0.0.1");

    auto endpoint = tcp::endpoint{address, config_.port};

    acceptor_.emplace(ioc_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(net::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(net::socket_base::max_listen_connections);

    running_ = true;
    LOG_INFO("API server listening on {}:{}", address.to_string(), config_.port);

    co_await accept_loop();
}

void ApiServer::stop() {
    if (!running_) return;
    running_ = false;

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
        if (ec) {
            LOG_DEBUG("Acceptor close: {}", ec.message());
        }
    }
    LOG_INFO("API server stopped ({} connections still open)", active_connections_);
}

auto ApiServer::local_port() const -> uint16_t {
    if (!acceptor_ || !acceptor_->is_open()) return 0;
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

auto ApiServer::accept_loop() -> awaitable<void> {
    while (running_) {
        auto [ec, socket] = co_await acceptor_->async_accept(
            net::as_tuple(net::use_awaitable));
        if (ec) {
            if (!running_) break;  // Expected during shutdown.
            LOG_ERROR("Accept error: {}", ec.message());
            continue;
        }

        if (active_connections_ >= config_.max_connections) {
            LOG_WARN("Max connections ({}) reached, rejecting", config_.max_connections);
            boost::system::error_code close_ec;
            socket.close(close_ec);
            continue;
        }

        boost::asio::co_spawn(
            ioc_,
            handle_connection(std::move(socket)),
            boost::asio::detached);
    }
}

auto ApiServer::handle_connection(tcp::socket socket) -> awaitable<void> {
    ConnectionCounter counter(active_connections_);
    auto conn_id = utils::generate_id(12);

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(config_.max_body_bytes);

        stream.expires_after(kReadTimeout);
        auto [read_ec, bytes] = co_await http::async_read(
            stream, buffer, parser, net::as_tuple(net::use_awaitable));

        ApiResponse api;
        bool keep_alive = false;
        unsigned version = 11;

        if (read_ec == http::error::body_limit) {
            LOG_WARN("Connection {}: request body exceeds {} bytes",
                     conn_id, config_.max_body_bytes);
            api = ApiResponse{
                .status = 413,
                .body = error_body(make_error(ErrorCode::InvalidArgument,
                    "Request body too large")),
                .allow = {},
            };
        } else if (read_ec) {
            if (read_ec != http::error::end_of_stream) {
                LOG_DEBUG("Connection {}: read failed: {}", conn_id, read_ec.message());
            }
            break;
        } else {
            const auto& req = parser.get();
            keep_alive = req.keep_alive();
            version = req.version();
            std::string_view target(req.target().data(), req.target().size());
            auto verb = http::to_string(req.method());
            LOG_DEBUG("Connection {}: {} {}", conn_id,
                      std::string_view(verb.data(), verb.size()), target);
            try {
                api = co_await handle_request(req.method(), target, req.body());
            } catch (const std::exception& e) {
                LOG_ERROR("Connection {}: request failed: {}", conn_id, e.what());
                api = internal_error_response(e.what());
            }
        }

        http::response<http::string_body> res{static_cast<http::status>(api.status), version};
        res.set(http::field::server, "docqa/" DOCQA_VERSION_STRING);
        res.set(http::field::content_type, "application/json");
        if (!config_.cors_allow_origin.empty()) {
            res.set(http::field::access_control_allow_origin, config_.cors_allow_origin);
            res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
            res.set(http::field::access_control_allow_headers, "Content-Type");
        }
        if (!api.allow.empty()) {
            res.set(http::field::allow, api.allow);
        }
        if (api.status != 204) {
            res.body() = api.body.dump(-1, ' ', false, json::error_handler_t::replace);
        }
        res.keep_alive(keep_alive);
        res.prepare_payload();

        auto [write_ec, written] = co_await http::async_write(
            stream, res, net::as_tuple(net::use_awaitable));
        if (write_ec) {
            LOG_DEBUG("Connection {}: write failed: {}", conn_id, write_ec.message());
            break;
        }
        if (!keep_alive) break;
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

auto ApiServer::handle_request(http::verb method, std::string_view target,
                               std::string_view body) -> awaitable<ApiResponse> {
    auto path = target.substr(0, target.find('?'));

    // CORS preflight.
    if (method == http::verb::options) {
        co_return ApiResponse{.status = 204, .body = nullptr, .allow = {}};
    }

    if (path == "/retrieve") {
        if (method != http::verb::post) co_return method_not_allowed("POST, OPTIONS");
        try {
            co_return co_await handle_retrieve(body);
        } catch (const std::exception& e) {
            LOG_ERROR("Retrieve raised: {}", e.what());
            co_return internal_error_response(e.what());
        }
    }

    if (path == "/health") {
        if (method != http::verb::get) co_return method_not_allowed("GET, OPTIONS");
        co_return handle_health();
    }

    co_return error_response(make_error(ErrorCode::NotFound, "No such route",
                                        std::string(path)));
}

auto ApiServer::handle_retrieve(std::string_view body) -> awaitable<ApiResponse> {
    auto request = parse_retrieve_request(body);
    if (!request) {
        co_return error_response(request.error());
    }

    auto result = co_await pipeline_.retrieve(request->query, request->k);
    if (!result) {
        LOG_WARN("Retrieve failed: {}", result.error().what());
        co_return error_response(result.error());
    }

    json payload = *result;
    if (request->include_prompt) {
        payload["prompt"] = retrieval::build_prompt(result->contexts, request->query);
    }
    co_return ApiResponse{.status = 200, .body = std::move(payload), .allow = {}};
}

auto ApiServer::handle_health() const -> ApiResponse {
    const auto& lexical = pipeline_.context().lexical;
    return ApiResponse{
        .status = 200,
        .body = json{
            {"status", "ok"},
            {"corpus_size", lexical ? lexical->size() : 0},
        },
        .allow = {},
    };
}

} // namespace docqa::api
