// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe::resp
{

/// @brief Kind of a RESP2 reply.
enum class ReplyType
{
    SimpleString,
    Error,
    Integer,
    BulkString,
    Array,
    Nil,
};

/// @brief A decoded RESP2 reply.
struct Reply
{
    ReplyType type = ReplyType::Nil;
    std::string text; ///< Payload of simple strings, errors and bulk strings.
    std::int64_t integer = 0;
    std::vector<Reply> elements;

    [[nodiscard]] auto isNil() const noexcept -> bool { return type == ReplyType::Nil; }
    [[nodiscard]] auto isError() const noexcept -> bool { return type == ReplyType::Error; }
};

/// @brief Encodes a command as a RESP2 array of bulk strings.
[[nodiscard]] auto encodeCommand(std::vector<std::string> const& args) -> std::string;

/// @brief Decodes one reply from the front of @p buffer.
///
/// @param buffer Bytes received so far.
/// @param consumed Set to the number of bytes the reply occupied on success.
/// @return The reply, nothing if @p buffer does not yet hold a complete reply,
///         or a ProtocolError for malformed input.
[[nodiscard]] auto decodeReply(std::string_view buffer, size_t& consumed) -> Result<std::optional<Reply>>;

/// @brief Renders a reply for log and error messages.
[[nodiscard]] auto describe(Reply const& reply) -> std::string;

} // namespace callscribe::resp
