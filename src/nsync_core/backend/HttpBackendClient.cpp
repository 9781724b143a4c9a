/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "nsync_core/backend/HttpBackendClient.hpp"
#include "common_types/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace
{
const std::string LOGIN_PATH = "/ws.v1/login";
const std::string JSON_CONTENT_TYPE = "application/json";
const std::string FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

/// Run the io_context until the pending operation completes; rethrow its error.
void
runToCompletion(asio::io_context& ioc, const beast::error_code& ec)
{
    ioc.restart();
    ioc.run();
    if (ec)
    {
        throw beast::system_error(ec);
    }
}

template <class Stream>
http::response<http::string_body>
exchange(asio::io_context& ioc,
         Stream& stream,
         http::request<http::string_body>& req,
         std::chrono::seconds timeout)
{
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    runToCompletion(ioc, ec);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
    runToCompletion(ioc, ec);
    return res;
}

template <class Stream>
void
connect(asio::io_context& ioc,
        Stream& stream,
        const tcp::resolver::results_type& results,
        std::chrono::seconds timeout)
{
    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout);
    beast::get_lowest_layer(stream).async_connect(
        results,
        [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runToCompletion(ioc, ec);
}

bool
isRedirect(unsigned status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string
describe(unsigned status, const std::string& body)
{
    std::string text = "HTTP " + std::to_string(status);
    if (!body.empty())
    {
        text += " " + body.substr(0, 256);
    }
    return text;
}
} // namespace

HttpBackendClient::HttpBackendClient(std::vector<ControllerEndpoint> endpoints,
                                     HttpClientOptions options)
    : m_endpoints(std::move(endpoints)),
      m_options(options),
      m_cookies(m_endpoints.size())
{
    if (m_endpoints.empty())
    {
        throw std::invalid_argument("HttpBackendClient requires at least one endpoint");
    }
    if (m_options.concurrentConnections < 1)
    {
        m_options.concurrentConnections = 1;
    }
}

std::string
HttpBackendClient::urlEncode(const std::string& value)
{
    std::ostringstream oss;
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            oss << c;
        }
        else
        {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string
HttpBackendClient::buildQueryTarget(const QueryRequest& request,
                                    const std::optional<std::string>& cursor,
                                    int pageLength)
{
    std::vector<std::string> params;
    if (!request.fields.empty())
    {
        std::string fields;
        for (const auto& field : request.fields)
        {
            fields += (fields.empty() ? "" : ",") + urlEncode(field);
        }
        params.push_back("fields=" + fields);
    }
    for (const auto& relation : request.relations)
    {
        params.push_back("relations=" + urlEncode(relation));
    }
    for (const auto& tag : request.tags)
    {
        if (tag.value)
        {
            params.push_back("tag=" + urlEncode(*tag.value));
        }
        params.push_back("tag_scope=" + urlEncode(tag.scope));
    }
    params.push_back("_page_length=" + std::to_string(pageLength));
    if (cursor)
    {
        params.push_back("_page_cursor=" + urlEncode(*cursor));
    }

    std::string target = request.path + "?";
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        target += (i == 0 ? "" : "&") + params[i];
    }
    return target;
}

QueryPage
HttpBackendClient::query(const QueryRequest& request, const std::optional<std::string>& cursor)
{
    json page = execute("GET", buildQueryTarget(request, cursor, m_options.pageLength), std::nullopt);

    QueryPage result;
    if (page.contains("results") && page.at("results").is_array())
    {
        for (const auto& item : page.at("results"))
        {
            result.results.push_back(item);
        }
    }
    if (page.contains("page_cursor") && page.at("page_cursor").is_string())
    {
        std::string next = page.at("page_cursor").get<std::string>();
        if (!next.empty())
        {
            result.nextCursor = next;
        }
    }
    return result;
}

json
HttpBackendClient::read(const std::string& path, const std::vector<std::string>& relations)
{
    std::string target = path;
    for (std::size_t i = 0; i < relations.size(); ++i)
    {
        target += (i == 0 ? "?" : "&") + std::string("relations=") + urlEncode(relations[i]);
    }
    return execute("GET", target, std::nullopt);
}

json
HttpBackendClient::create(const std::string& path, const json& spec)
{
    return execute("POST", path, spec);
}

json
HttpBackendClient::update(const std::string& path, const json& fields)
{
    return execute("PUT", path, fields);
}

void
HttpBackendClient::remove(const std::string& path)
{
    execute("DELETE", path, std::nullopt);
}

json
HttpBackendClient::attach(const std::string& path, const json& attachment)
{
    return execute("PUT", path, attachment);
}

void
HttpBackendClient::acquireSlot()
{
    std::unique_lock<std::mutex> lock(m_slotMutex);
    m_slotCv.wait(lock, [this]() { return m_inFlight < m_options.concurrentConnections; });
    ++m_inFlight;
}

void
HttpBackendClient::releaseSlot()
{
    {
        std::lock_guard<std::mutex> lock(m_slotMutex);
        --m_inFlight;
    }
    m_slotCv.notify_one();
}

json
HttpBackendClient::execute(const std::string& method,
                           const std::string& target,
                           const std::optional<json>& body)
{
    struct SlotGuard
    {
        HttpBackendClient& client;
        explicit SlotGuard(HttpBackendClient& c)
            : client(c)
        {
            client.acquireSlot();
        }
        ~SlotGuard()
        {
            client.releaseSlot();
        }
    } slot(*this);

    std::string payload;
    if (body)
    {
        try
        {
            payload = body->dump();
        }
        catch (const json::type_error& e)
        {
            throw BackendError("Cannot encode " + method + " " + target + " body: " + e.what());
        }
    }
    const std::string contentType = body ? JSON_CONTENT_TYPE : "";
    const int attempts = m_endpoints.front().retries + 1;
    std::string lastError = "no attempt made";

    for (int attempt = 0; attempt < attempts; ++attempt)
    {
        std::size_t index;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            index = m_activeEndpoint;
        }
        const ControllerEndpoint& endpoint = m_endpoints[index];

        try
        {
            std::string cookie = sessionCookie(index);
            HttpResult result = send(endpoint, method, target, payload, contentType, cookie);
            if (result.status == 401 || result.status == 403)
            {
                SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                    "Session on {} rejected, logging in again",
                                    endpoint.address());
                cookie = login(index);
                result = send(endpoint, method, target, payload, contentType, cookie);
            }

            if (result.status >= 200 && result.status < 300)
            {
                if (result.body.empty())
                {
                    return json::object();
                }
                return json::parse(result.body);
            }
            if (result.status == 404)
            {
                throw ResourceNotFound(target);
            }
            if (result.status >= 500)
            {
                lastError = describe(result.status, result.body);
                SPDLOG_LOGGER_WARN(Logger::instance(),
                                   "{} {} failed on controller {}: {}",
                                   method,
                                   target,
                                   endpoint.address(),
                                   lastError);
                failover(index);
                continue;
            }
            throw BackendError("Controller " + endpoint.address() + " rejected " + method + " " +
                                   target + ": " + describe(result.status, result.body),
                               static_cast<int>(result.status));
        }
        catch (const boost::system::system_error& e)
        {
            lastError = e.what();
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "{} {} failed on controller {} (attempt {}/{}): {}",
                               method,
                               target,
                               endpoint.address(),
                               attempt + 1,
                               attempts,
                               lastError);
            failover(index);
        }
        catch (const json::parse_error& e)
        {
            throw BackendError("Controller " + endpoint.address() +
                               " returned malformed JSON for " + target + ": " + e.what());
        }
    }

    SPDLOG_LOGGER_ERROR(Logger::instance(),
                        "{} {} failed after {} attempt(s): {}",
                        method,
                        target,
                        attempts,
                        lastError);
    throw BackendError("Request " + method + " " + target + " failed after " +
                       std::to_string(attempts) + " attempt(s): " + lastError);
}

HttpBackendClient::HttpResult
HttpBackendClient::send(const ControllerEndpoint& endpoint,
                        const std::string& method,
                        const std::string& target,
                        const std::string& body,
                        const std::string& contentType,
                        const std::string& cookie)
{
    ControllerEndpoint current = endpoint;
    std::string currentTarget = target;

    for (int hop = 0;; ++hop)
    {
        HttpResult result = sendOnce(current, method, currentTarget, body, contentType, cookie);
        if (!isRedirect(result.status))
        {
            return result;
        }
        if (hop >= endpoint.redirects)
        {
            throw BackendError("Too many redirects for " + method + " " + target,
                               static_cast<int>(result.status));
        }
        if (result.location.empty())
        {
            throw BackendError("Redirect without location for " + method + " " + target,
                               static_cast<int>(result.status));
        }

        currentTarget = resolveRedirect(current, result.location);
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Following redirect to {}{}",
                            current.address(),
                            currentTarget);
    }
}

std::string
HttpBackendClient::resolveRedirect(ControllerEndpoint& current, const std::string& location)
{
    auto schemeEnd = location.find("://");
    if (schemeEnd == std::string::npos)
    {
        return location;
    }

    bool https = location.compare(0, schemeEnd, "https") == 0;
    std::string rest = location.substr(schemeEnd + 3);
    auto pathBegin = rest.find('/');
    std::string authority = rest.substr(0, pathBegin);
    std::string target = pathBegin == std::string::npos ? "/" : rest.substr(pathBegin);

    auto colon = authority.find(':');
    std::string host = authority.substr(0, colon);
    if (host.empty())
    {
        throw BackendError("Redirect location has no host: " + location);
    }

    int port = https ? 443 : 80;
    if (colon != std::string::npos)
    {
        try
        {
            port = utils::parseIntStrict(authority.substr(colon + 1));
        }
        catch (const std::invalid_argument&)
        {
            throw BackendError("Redirect location has an invalid port: " + location);
        }
        if (port < 1 || port > 65535)
        {
            throw BackendError("Redirect location port out of range: " + location);
        }
    }

    current.host = host;
    current.port = static_cast<uint16_t>(port);
    return target;
}

HttpBackendClient::HttpResult
HttpBackendClient::sendOnce(const ControllerEndpoint& endpoint,
                            const std::string& method,
                            const std::string& target,
                            const std::string& body,
                            const std::string& contentType,
                            const std::string& cookie)
{
    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown)
    {
        throw std::invalid_argument("Unsupported HTTP method: " + method);
    }

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, JSON_CONTENT_TYPE);
    if (!contentType.empty())
    {
        req.set(http::field::content_type, contentType);
    }
    if (!cookie.empty())
    {
        req.set(http::field::cookie, cookie);
    }
    req.body() = body;
    req.prepare_payload();

    asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port));

    http::response<http::string_body> res;
    if (m_options.useHttps)
    {
        ssl::context sslCtx{ssl::context::tls_client};
        sslCtx.set_default_verify_paths();

        beast::ssl_stream<beast::tcp_stream> stream{ioc, sslCtx};
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str()))
        {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        asio::error::get_ssl_category()),
                                      "Failed to set SNI");
        }

        connect(ioc, stream, results, endpoint.httpTimeout);

        beast::error_code ec;
        beast::get_lowest_layer(stream).expires_after(endpoint.httpTimeout);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        runToCompletion(ioc, ec);

        res = exchange(ioc, stream, req, endpoint.requestTimeout);

        beast::error_code shutdownEc;
        beast::get_lowest_layer(stream).expires_after(endpoint.httpTimeout);
        stream.async_shutdown([&shutdownEc](beast::error_code e) { shutdownEc = e; });
        ioc.restart();
        ioc.run();
        if (shutdownEc && shutdownEc != asio::ssl::error::stream_truncated)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "TLS shutdown with {} reported: {}",
                                endpoint.address(),
                                shutdownEc.message());
        }
    }
    else
    {
        beast::tcp_stream stream{ioc};
        connect(ioc, stream, results, endpoint.httpTimeout);
        res = exchange(ioc, stream, req, endpoint.requestTimeout);

        beast::error_code shutdownEc;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdownEc);
        if (shutdownEc && shutdownEc != beast::errc::not_connected)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "Socket shutdown with {} reported: {}",
                                endpoint.address(),
                                shutdownEc.message());
        }
    }

    HttpResult result;
    result.status = res.result_int();
    result.body = std::move(res.body());
    result.location = std::string(res[http::field::location]);
    result.setCookie = std::string(res[http::field::set_cookie]);
    return result;
}

std::string
HttpBackendClient::login(std::size_t endpointIndex)
{
    const ControllerEndpoint& endpoint = m_endpoints[endpointIndex];
    const std::string form =
        "username=" + urlEncode(endpoint.user) + "&password=" + urlEncode(endpoint.password);

    HttpResult result = send(endpoint, "POST", LOGIN_PATH, form, FORM_CONTENT_TYPE, "");
    if (result.status < 200 || result.status >= 300)
    {
        throw BackendError("Login to controller " + endpoint.address() + " failed: " +
                               describe(result.status, ""),
                           static_cast<int>(result.status));
    }

    std::string cookie = result.setCookie.substr(0, result.setCookie.find(';'));
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_cookies[endpointIndex] = cookie;
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Logged in to controller {}", endpoint.address());
    return cookie;
}

std::string
HttpBackendClient::sessionCookie(std::size_t endpointIndex)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_cookies[endpointIndex].empty())
        {
            return m_cookies[endpointIndex];
        }
    }
    return login(endpointIndex);
}

void
HttpBackendClient::failover(std::size_t fromIndex)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_cookies[fromIndex].clear();
    if (m_endpoints.size() > 1 && m_activeEndpoint == fromIndex)
    {
        m_activeEndpoint = (fromIndex + 1) % m_endpoints.size();
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Switching to controller {}",
                           m_endpoints[m_activeEndpoint].address());
    }
}
