#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lan_watch::protocol
{
    inline constexpr std::size_t MAX_REQUEST_HEAD = 16 * 1024; // 16KB
    inline constexpr std::string_view HEAD_TERMINATOR = "\r\n\r\n";

    enum class StatusCode : int
    {
        Ok = 200,
        BadRequest = 400,
        NotFound = 404,
        MethodNotAllowed = 405,
        RequestHeaderFieldsTooLarge = 431,
        InternalServerError = 500
    };

    struct Request
    {
        std::string method;
        std::string target;
        std::string version;
        std::vector<std::pair<std::string, std::string>> headers;

        // Target without the query string.
        std::string Path() const;
        std::optional<std::string> Header(std::string_view name) const;
    };

    struct Response
    {
        StatusCode status = StatusCode::Ok;
        std::string content_type = "text/plain; charset=utf-8";
        std::string body;
        std::vector<std::pair<std::string, std::string>> extra_headers;
    };

    std::string_view ReasonPhrase(StatusCode status);

    // Parses everything before the blank line that ends a request head.
    std::optional<Request> ParseRequestHead(std::string_view head);

    std::string SerializeResponse(const Response &resp, bool include_body = true);

    Response MakeErrorResponse(StatusCode status);
}
