// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe
{

/// @brief A URL split into the parts an HTTP client needs.
struct UrlParts
{
    std::string scheme; ///< "http" or "https"
    std::string origin; ///< "scheme://host[:port]"
    std::string target; ///< Path and query, at least "/".
};

/// @brief Splits an absolute http(s) URL.
[[nodiscard]] auto splitUrl(std::string_view url) -> Result<UrlParts>;

struct HttpResponse
{
    int status = 0;
    std::string body;
};

using HttpHeaders = std::multimap<std::string, std::string>;

/// @brief Minimal blocking HTTP client used by the transcription backends.
///
/// A response with any status is a success; only transport failures are errors.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual auto get(std::string const& url, HttpHeaders const& headers) -> Result<HttpResponse> = 0;

    [[nodiscard]] virtual auto post(std::string const& url,
                                    HttpHeaders const& headers,
                                    std::string const& body,
                                    std::string const& contentType) -> Result<HttpResponse> = 0;
};

/// @brief HttpClient backed by cpp-httplib.
class HttplibClient final: public HttpClient
{
  public:
    explicit HttplibClient(std::chrono::seconds timeout);

    [[nodiscard]] auto get(std::string const& url, HttpHeaders const& headers) -> Result<HttpResponse> override;
    [[nodiscard]] auto post(std::string const& url,
                            HttpHeaders const& headers,
                            std::string const& body,
                            std::string const& contentType) -> Result<HttpResponse> override;

  private:
    std::chrono::seconds _timeout;
};

/// @brief One part of a multipart/form-data body.
struct FormPart
{
    std::string name;
    std::string content;
    std::string filename;    ///< Empty for plain fields.
    std::string contentType; ///< Empty for plain fields.
};

/// @brief An encoded multipart/form-data request body.
struct MultipartBody
{
    std::string contentType; ///< "multipart/form-data; boundary=..."
    std::string body;
};

/// @brief Pulls a human-readable message out of an error response body.
///
/// Looks for "error.message", then "message" in a JSON object body. A body that is not JSON
/// is returned trimmed. A JSON body without either field yields an empty string.
[[nodiscard]] auto extractErrorMessage(std::string_view body) -> std::string;

[[nodiscard]] auto encodeMultipart(std::vector<FormPart> const& parts, std::string_view boundary) -> MultipartBody;

} // namespace callscribe
