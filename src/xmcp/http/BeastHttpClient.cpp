//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/xmcp/http/BeastHttpClient.cpp
// Purpose: HTTP/HTTPS client using Boost.Beast coroutines and OpenSSL
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "xmcp/http/BeastHttpClient.hpp"
#include "xmcp/http/Multipart.h"
#include "xmcp/http/Url.h"

namespace xmcp::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct OutgoingRequest {
    bhttp::verb method{bhttp::verb::get};
    std::string url;
    Headers headers;
    std::optional<std::string> body;
    std::string contentType;
};

struct RawResponse {
    HttpResponse response;
    std::string location;
};

bool isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string hostHeader(const UrlParts& u) {
    const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    std::string host = (u.host.find(':') != std::string::npos) ? "[" + u.host + "]" : u.host;
    return defaultPort ? host : host + ":" + u.port;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){
        return std::tolower(x) == std::tolower(y);
    });
}

} // namespace

class BeastHttpClient::Impl {
public:
    BeastHttpClient::Options opts;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    ssl::context sslCtx{ssl::context::tls_client};

    explicit Impl(const BeastHttpClient::Options& o) : opts(o) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
        if (userProvidedCA) {
            try {
                if (!opts.caFile.empty()) { sslCtx.load_verify_file(opts.caFile); }
                if (!opts.caPath.empty()) { sslCtx.add_verify_path(opts.caPath); }
            } catch (const boost::system::system_error& e) {
                throw std::invalid_argument(std::string("HTTPS: failed to load user-provided CA file/path: ") + e.what());
            }
        } else {
            boost::system::error_code ec;
            sslCtx.set_default_verify_paths(ec);
            if (ec) {
                LOG_WARN("HTTPS: set_default_verify_paths failed: {}", ec.message());
            }
        }
        sslCtx.set_verify_mode(ssl::verify_peer);

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() { ioc.run(); });
    }

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    bhttp::request<bhttp::string_body> buildRequest(const OutgoingRequest& r, const UrlParts& u) const {
        bhttp::request<bhttp::string_body> req{r.method, u.target, 11};
        req.set(bhttp::field::host, hostHeader(u));
        req.set(bhttp::field::user_agent, opts.userAgent);
        req.set(bhttp::field::connection, "close");
        for (const auto& h : r.headers) {
            req.set(h.name, h.value);
        }
        if (r.body.has_value()) {
            req.set(bhttp::field::content_type, r.contentType);
            req.body() = r.body.value();
        }
        req.prepare_payload();
        return req;
    }

    // Writes the request and reads the response; the read timeout restarts after every chunk received.
    template <class Stream>
    net::awaitable<RawResponse> coRoundTrip(Stream& stream, beast::tcp_stream& lowest,
                                            bhttp::request<bhttp::string_body>& req) {
        lowest.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await bhttp::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer buffer;
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(opts.maxResponseBytes);
        co_await bhttp::async_read_header(stream, buffer, parser, net::use_awaitable);
        while (!parser.is_done()) {
            lowest.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
            co_await bhttp::async_read_some(stream, buffer, parser, net::use_awaitable);
        }
        auto& res = parser.get();
        RawResponse out;
        out.response.status = static_cast<int>(res.result_int());
        out.response.contentType = std::string(res[bhttp::field::content_type]);
        out.location = std::string(res[bhttp::field::location]);
        out.response.body = std::move(res.body());
        co_return out;
    }

    net::awaitable<RawResponse> coExchange(OutgoingRequest r) {
        UrlParts u = parseUrl(r.url);
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        auto req = buildRequest(r, u);
        LOG_DEBUG("HTTP {} {}://{}{}", std::string(bhttp::to_string(r.method)), u.scheme, hostHeader(u), u.target);

        boost::system::error_code ec;
        if (u.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.serverName.c_str())) {
                throw HttpError("HTTPS: failed to set SNI hostname " + u.serverName);
            }
            if (!::SSL_set1_host(stream.native_handle(), u.serverName.c_str())) {
                throw HttpError("HTTPS: failed to set verification hostname " + u.serverName);
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            RawResponse out = co_await coRoundTrip(stream, stream.next_layer(), req);
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec) { LOG_DEBUG("HTTPS: socket shutdown: {}", ec.message()); }
            co_return out;
        }
        beast::tcp_stream stream(executor);
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);
        RawResponse out = co_await coRoundTrip(stream, stream, req);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec) { LOG_DEBUG("HTTP: socket shutdown: {}", ec.message()); }
        co_return out;
    }

    RawResponse send(OutgoingRequest r) {
        const std::string what = std::string(bhttp::to_string(r.method)) + " " + r.url;
        auto fut = net::co_spawn(ioc, coExchange(std::move(r)), net::use_future);
        try {
            return fut.get();
        } catch (const HttpError&) {
            throw;
        } catch (const boost::system::system_error& e) {
            LOG_WARN("HTTP transport failure for {}: {}", what, e.code().message());
            throw HttpError(what + " failed: " + e.code().message());
        } catch (const std::invalid_argument& e) {
            throw HttpError(what + " failed: " + e.what());
        }
    }
};

BeastHttpClient::BeastHttpClient(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
}

BeastHttpClient::~BeastHttpClient() {
    FUNC_SCOPE();
}

HttpResponse BeastHttpClient::Get(const std::string& url, const Headers& headers) {
    FUNC_SCOPE();
    std::string current = url;
    Headers hdrs = headers;
    for (int hop = 0; hop <= pImpl->opts.maxRedirects; ++hop) {
        RawResponse raw = pImpl->send(OutgoingRequest{bhttp::verb::get, current, hdrs, std::nullopt, {}});
        if (!isRedirect(raw.response.status) || raw.location.empty()) {
            return std::move(raw.response);
        }
        std::string next = resolveLocation(current, raw.location);
        if (parseUrl(next).host != parseUrl(current).host) {
            // Credentials never follow a redirect to another host
            std::erase_if(hdrs, [](const HeaderKV& h){ return iequals(h.name, "Authorization"); });
        }
        LOG_DEBUG("HTTP redirect {} -> {}", raw.response.status, next);
        current = std::move(next);
    }
    throw HttpError(std::format("GET {} failed: more than {} redirects", url, pImpl->opts.maxRedirects));
}

HttpResponse BeastHttpClient::Post(const std::string& url, const Headers& headers,
                                   const std::optional<std::string>& jsonBody) {
    FUNC_SCOPE();
    return pImpl->send(OutgoingRequest{bhttp::verb::post, url, headers, jsonBody, "application/json"}).response;
}

HttpResponse BeastHttpClient::PostMultipart(const std::string& url, const Headers& headers,
                                            const std::vector<FormField>& fields, const FilePart& file) {
    FUNC_SCOPE();
    MultipartBody mp = encodeMultipart(fields, file, makeBoundary());
    return pImpl->send(OutgoingRequest{bhttp::verb::post, url, headers, std::move(mp.body), mp.contentType}).response;
}

HttpResponse BeastHttpClient::Delete(const std::string& url, const Headers& headers) {
    FUNC_SCOPE();
    return pImpl->send(OutgoingRequest{bhttp::verb::delete_, url, headers, std::nullopt, {}}).response;
}

} // namespace xmcp::http
