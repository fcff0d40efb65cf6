// SPDX-License-Identifier: Apache-2.0
#include "HttpClient.hpp"

#include <core/JsonUtils.hpp>

#include <httplib.h>

#include <format>

namespace callscribe
{

namespace
{

    auto toHttplibHeaders(HttpHeaders const& headers) -> httplib::Headers
    {
        auto result = httplib::Headers {};
        for (auto const& [name, value]: headers)
            result.emplace(name, value);
        return result;
    }

    auto makeClient(std::string const& origin, std::chrono::seconds timeout) -> httplib::Client
    {
        auto client = httplib::Client(origin);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
        client.set_follow_location(true);
        return client;
    }

    auto transportError(std::string_view method, std::string const& url, httplib::Error error) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::IoError, std::format("{} {} failed: {}", method, url, httplib::to_string(error)));
    }

} // namespace

auto splitUrl(std::string_view url) -> Result<UrlParts>
{
    auto const schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("Not an absolute URL: {}", url));

    auto const scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https")
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL scheme: {}", scheme));

    auto const authorityStart = schemeEnd + 3;
    auto const pathStart = url.find_first_of("/?", authorityStart);
    auto const authority =
        url.substr(authorityStart, pathStart == std::string_view::npos ? std::string_view::npos : pathStart - authorityStart);
    if (authority.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("URL has no host: {}", url));

    auto target = pathStart == std::string_view::npos ? std::string("/") : std::string(url.substr(pathStart));
    if (target.starts_with('?'))
        target.insert(0, "/");

    return UrlParts {
        .scheme = std::string(scheme),
        .origin = std::format("{}://{}", scheme, authority),
        .target = std::move(target),
    };
}

HttplibClient::HttplibClient(std::chrono::seconds timeout): _timeout(timeout)
{
}

auto HttplibClient::get(std::string const& url, HttpHeaders const& headers) -> Result<HttpResponse>
{
    auto parts = splitUrl(url);
    if (!parts)
        return std::unexpected(parts.error());

    try
    {
        auto client = makeClient(parts->origin, _timeout);
        auto response = client.Get(parts->target, toHttplibHeaders(headers));
        if (!response)
            return transportError("GET", url, response.error());
        return HttpResponse { .status = response->status, .body = std::move(response->body) };
    }
    catch (std::exception const& e)
    {
        return makeError(ErrorCode::IoError, std::format("GET {} failed: {}", url, e.what()));
    }
}

auto HttplibClient::post(std::string const& url,
                         HttpHeaders const& headers,
                         std::string const& body,
                         std::string const& contentType) -> Result<HttpResponse>
{
    auto parts = splitUrl(url);
    if (!parts)
        return std::unexpected(parts.error());

    try
    {
        auto client = makeClient(parts->origin, _timeout);
        auto response = client.Post(parts->target, toHttplibHeaders(headers), body, contentType);
        if (!response)
            return transportError("POST", url, response.error());
        return HttpResponse { .status = response->status, .body = std::move(response->body) };
    }
    catch (std::exception const& e)
    {
        return makeError(ErrorCode::IoError, std::format("POST {} failed: {}", url, e.what()));
    }
}

auto extractErrorMessage(std::string_view body) -> std::string
{
    auto payload = json::parse(body);
    if (!payload)
    {
        auto const start = body.find_first_not_of(" \t\n\r");
        if (start == std::string_view::npos)
            return {};
        return std::string(body.substr(start, body.find_last_not_of(" \t\n\r") - start + 1));
    }

    if (!payload->is_object())
        return {};
    if (payload->contains("error") && (*payload)["error"].is_object())
    {
        if (auto message = json::getOptionalString((*payload)["error"], "message"))
            return *message;
    }
    return json::getStringOr(*payload, "message", "");
}

auto encodeMultipart(std::vector<FormPart> const& parts, std::string_view boundary) -> MultipartBody
{
    auto body = std::string {};
    for (auto const& part: parts)
    {
        body += std::format("--{}\r\n", boundary);
        if (part.filename.empty())
            body += std::format("Content-Disposition: form-data; name=\"{}\"\r\n", part.name);
        else
            body += std::format(
                "Content-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n", part.name, part.filename);
        if (!part.contentType.empty())
            body += std::format("Content-Type: {}\r\n", part.contentType);
        body += "\r\n";
        body += part.content;
        body += "\r\n";
    }
    body += std::format("--{}--\r\n", boundary);

    return MultipartBody {
        .contentType = std::format("multipart/form-data; boundary={}", boundary),
        .body = std::move(body),
    };
}

} // namespace callscribe
