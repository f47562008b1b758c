#include "docqa/infra/http_client.hpp"
#include "docqa/core/logger.hpp"

#include <httplib.h>

#include <mutex>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace docqa::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        // Read timeouts surface as Read errors in httplib; both mean the
        // collaborator did not answer in time.
        auto code = (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read)
            ? ErrorCode::Timeout
            : ErrorCode::ConnectionFailed;
        return std::unexpected(
            make_error(code, "HTTP request failed", httplib::to_string(err)));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }
    return response;
}

auto to_httplib_headers(const std::map<std::string, std::string>& headers)
    -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : headers) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

struct HttpClient::Impl {
    boost::asio::any_io_executor blocking_executor;
    HttpClientConfig config;
    std::unique_ptr<httplib::Client> client;
    std::mutex mutex;

    Impl(boost::asio::any_io_executor executor, HttpClientConfig config_)
        : blocking_executor(std::move(executor)), config(std::move(config_)) {
        client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
        client->set_keep_alive(true);

        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }

        client->set_default_headers(to_httplib_headers(config.default_headers));

        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }
};

HttpClient::HttpClient(boost::asio::any_io_executor blocking_executor,
                       HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(blocking_executor), std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    // Offload the synchronous httplib call to the blocking pool.
    auto result = co_await boost::asio::co_spawn(
        impl_->blocking_executor,
        [impl = impl_.get(), p = std::string(path), hdrs = to_httplib_headers(headers)]()
            -> boost::asio::awaitable<Result<HttpResponse>> {
            std::lock_guard lock(impl->mutex);
            LOG_DEBUG("GET {}{}", impl->config.base_url, p);
            auto res = impl->client->Get(p, hdrs);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);

    co_return result;
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    auto result = co_await boost::asio::co_spawn(
        impl_->blocking_executor,
        [impl = impl_.get(), p = std::string(path), b = std::string(body),
         ct = std::string(content_type), hdrs = to_httplib_headers(headers)]()
            -> boost::asio::awaitable<Result<HttpResponse>> {
            std::lock_guard lock(impl->mutex);
            LOG_DEBUG("POST {}{} ({} bytes)", impl->config.base_url, p, b.size());
            auto res = impl->client->Post(p, hdrs, b, ct);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);

    co_return result;
}

void HttpClient::set_default_header(std::string key, std::string value) {
    std::lock_guard lock(impl_->mutex);
    impl_->config.default_headers[std::move(key)] = std::move(value);
    impl_->client->set_default_headers(to_httplib_headers(impl_->config.default_headers));
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace docqa::infra
