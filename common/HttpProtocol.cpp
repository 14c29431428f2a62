#include "HttpProtocol.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lan_watch::protocol
{
    namespace
    {
        std::string_view Trim(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
                s.remove_suffix(1);
            return s;
        }

        bool EqualsIgnoreCase(std::string_view a, std::string_view b)
        {
            if (a.size() != b.size())
                return false;
            return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                              { return std::tolower(static_cast<unsigned char>(x)) ==
                                       std::tolower(static_cast<unsigned char>(y)); });
        }

        bool IsToken(std::string_view s)
        {
            if (s.empty())
                return false;
            return std::all_of(s.begin(), s.end(), [](char c)
                               { return std::isupper(static_cast<unsigned char>(c)) != 0; });
        }
    }

    std::string Request::Path() const
    {
        auto pos = target.find_first_of("?#");
        return pos == std::string::npos ? target : target.substr(0, pos);
    }

    std::optional<std::string> Request::Header(std::string_view name) const
    {
        for (const auto &h : headers)
        {
            if (EqualsIgnoreCase(h.first, name))
                return h.second;
        }
        return std::nullopt;
    }

    std::string_view ReasonPhrase(StatusCode status)
    {
        switch (status)
        {
        case StatusCode::Ok:
            return "OK";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        }
        return "Unknown";
    }

    std::optional<Request> ParseRequestHead(std::string_view head)
    {
        auto line_end = head.find("\r\n");
        std::string_view request_line = head.substr(0, line_end);

        auto first_space = request_line.find(' ');
        if (first_space == std::string_view::npos)
            return std::nullopt;
        auto second_space = request_line.find(' ', first_space + 1);
        if (second_space == std::string_view::npos)
            return std::nullopt;

        Request req;
        req.method = std::string(request_line.substr(0, first_space));
        req.target = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));
        req.version = std::string(request_line.substr(second_space + 1));

        if (!IsToken(req.method) || req.target.empty() || req.target.front() != '/')
            return std::nullopt;
        if (req.version != "HTTP/1.0" && req.version != "HTTP/1.1")
            return std::nullopt;

        std::size_t offset = (line_end == std::string_view::npos) ? head.size() : line_end + 2;
        while (offset < head.size())
        {
            auto next = head.find("\r\n", offset);
            std::string_view line = head.substr(offset, next == std::string_view::npos ? std::string_view::npos : next - offset);
            offset = (next == std::string_view::npos) ? head.size() : next + 2;

            if (line.empty())
                break;

            auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
                return std::nullopt;

            req.headers.emplace_back(std::string(Trim(line.substr(0, colon))),
                                     std::string(Trim(line.substr(colon + 1))));
        }

        return req;
    }

    std::string SerializeResponse(const Response &resp, bool include_body)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << static_cast<int>(resp.status) << ' ' << ReasonPhrase(resp.status) << "\r\n";
        out << "Content-Type: " << resp.content_type << "\r\n";
        out << "Content-Length: " << resp.body.size() << "\r\n";
        out << "Cache-Control: no-store\r\n";
        for (const auto &h : resp.extra_headers)
        {
            out << h.first << ": " << h.second << "\r\n";
        }
        out << "Connection: close\r\n\r\n";

        if (include_body)
            out << resp.body;

        return out.str();
    }

    Response MakeErrorResponse(StatusCode status)
    {
        Response resp;
        resp.status = status;
        resp.body = std::to_string(static_cast<int>(status)) + " " + std::string(ReasonPhrase(status)) + "\n";
        return resp;
    }
}
