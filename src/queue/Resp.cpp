// SPDX-License-Identifier: Apache-2.0
#include "Resp.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace callscribe::resp
{

namespace
{

    /// @brief Nesting limit for arrays, guards against hostile input.
    constexpr auto MaxDepth = 16;

    auto parseInteger(std::string_view text) -> std::optional<std::int64_t>
    {
        auto value = std::int64_t { 0 };
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            return std::nullopt;
        return value;
    }

    // NOLINTNEXTLINE(misc-no-recursion)
    auto decodeAt(std::string_view buffer, size_t& pos, int depth) -> Result<std::optional<Reply>>
    {
        if (depth > MaxDepth)
            return makeError(ErrorCode::ProtocolError, "RESP reply nested too deeply");
        if (pos >= buffer.size())
            return std::optional<Reply> {};

        auto const lineEnd = buffer.find("\r\n", pos);
        if (lineEnd == std::string_view::npos)
            return std::optional<Reply> {};

        auto const marker = buffer[pos];
        auto const line = buffer.substr(pos + 1, lineEnd - pos - 1);
        auto next = lineEnd + 2;

        switch (marker)
        {
            case '+':
                pos = next;
                return std::optional<Reply> { Reply { .type = ReplyType::SimpleString, .text = std::string(line) } };
            case '-':
                pos = next;
                return std::optional<Reply> { Reply { .type = ReplyType::Error, .text = std::string(line) } };
            case ':': {
                auto const value = parseInteger(line);
                if (!value)
                    return makeError(ErrorCode::ProtocolError, std::format("Invalid RESP integer: '{}'", line));
                pos = next;
                return std::optional<Reply> { Reply { .type = ReplyType::Integer, .integer = *value } };
            }
            case '$': {
                auto const length = parseInteger(line);
                if (!length || *length < -1)
                    return makeError(ErrorCode::ProtocolError, std::format("Invalid RESP bulk length: '{}'", line));
                if (*length == -1)
                {
                    pos = next;
                    return std::optional<Reply> { Reply { .type = ReplyType::Nil } };
                }
                auto const size = static_cast<size_t>(*length);
                if (buffer.size() < next + size + 2)
                    return std::optional<Reply> {};
                if (buffer.substr(next + size, 2) != "\r\n")
                    return makeError(ErrorCode::ProtocolError, "RESP bulk string is not CRLF-terminated");
                pos = next + size + 2;
                return std::optional<Reply> {
                    Reply { .type = ReplyType::BulkString, .text = std::string(buffer.substr(next, size)) }
                };
            }
            case '*': {
                auto const count = parseInteger(line);
                if (!count || *count < -1)
                    return makeError(ErrorCode::ProtocolError, std::format("Invalid RESP array length: '{}'", line));
                if (*count == -1)
                {
                    pos = next;
                    return std::optional<Reply> { Reply { .type = ReplyType::Nil } };
                }
                auto reply = Reply { .type = ReplyType::Array };
                // The smallest element ("+\r\n") takes three bytes, so cap the reservation by the input left.
                auto const remaining = buffer.size() > next ? buffer.size() - next : size_t { 0 };
                reply.elements.reserve(std::min(static_cast<size_t>(*count), remaining / 3));
                for (auto i = std::int64_t { 0 }; i < *count; ++i)
                {
                    auto element = decodeAt(buffer, next, depth + 1);
                    if (!element)
                        return std::unexpected(element.error());
                    if (!element->has_value())
                        return std::optional<Reply> {};
                    reply.elements.push_back(std::move(**element));
                }
                pos = next;
                return std::optional<Reply> { std::move(reply) };
            }
            default:
                return makeError(ErrorCode::ProtocolError,
                                 std::format("Unexpected RESP type marker: 0x{:02x}", static_cast<unsigned char>(marker)));
        }
    }

} // namespace

auto encodeCommand(std::vector<std::string> const& args) -> std::string
{
    auto out = std::format("*{}\r\n", args.size());
    for (auto const& arg: args)
    {
        out += std::format("${}\r\n", arg.size());
        out += arg;
        out += "\r\n";
    }
    return out;
}

auto decodeReply(std::string_view buffer, size_t& consumed) -> Result<std::optional<Reply>>
{
    auto pos = size_t { 0 };
    auto reply = decodeAt(buffer, pos, 0);
    if (reply && reply->has_value())
        consumed = pos;
    return reply;
}

// NOLINTNEXTLINE(misc-no-recursion)
auto describe(Reply const& reply) -> std::string
{
    switch (reply.type)
    {
        case ReplyType::SimpleString: return reply.text;
        case ReplyType::Error: return std::format("(error) {}", reply.text);
        case ReplyType::Integer: return std::format("(integer) {}", reply.integer);
        case ReplyType::BulkString: return std::format("\"{}\"", reply.text);
        case ReplyType::Nil: return "(nil)";
        case ReplyType::Array: {
            auto out = std::string("[");
            for (auto i = size_t { 0 }; i < reply.elements.size(); ++i)
            {
                if (i > 0)
                    out += ", ";
                out += describe(reply.elements[i]);
            }
            out += "]";
            return out;
        }
    }
    return "?";
}

} // namespace callscribe::resp
