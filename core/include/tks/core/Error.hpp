/**
 * @file Error.hpp
 * @brief Error codes and the Error value carried by Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_ERROR_HPP
    #define TKS_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <format>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace tks::core {

/**
 * @brief Failure categories reported by the synchronization stack.
 *
 * The first group covers local misuse of an API, the second covers
 * payloads received from a peer, the last one the transport.
 */
enum class ErrorCode : u16 {
    None = 0,

    InvalidArgument,   ///< Caller passed an unknown peer, handle or value.
    NotFound,          ///< Lookup of a peer, entity or input id failed.
    AlreadyExists,     ///< Peer or entity registered twice.

    BufferUnderflow,   ///< Read past the end of a received payload.
    CorruptedData,     ///< Payload decoded but contradicts the local schema.
    ProtocolViolation, ///< Bad magic, unknown message kind or misrouted packet.

    NetworkDisconnected,
};

/**
 * @brief Short uppercase name of @p code, used in log lines.
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::None:                return "NONE";
    case ErrorCode::InvalidArgument:     return "INVALID_ARGUMENT";
    case ErrorCode::NotFound:            return "NOT_FOUND";
    case ErrorCode::AlreadyExists:       return "ALREADY_EXISTS";
    case ErrorCode::BufferUnderflow:     return "BUFFER_UNDERFLOW";
    case ErrorCode::CorruptedData:       return "CORRUPTED_DATA";
    case ErrorCode::ProtocolViolation:   return "PROTOCOL_VIOLATION";
    case ErrorCode::NetworkDisconnected: return "NETWORK_DISCONNECTED";
    }
    return "UNKNOWN";
}

/**
 * @brief True for codes raised while decoding data sent by a peer.
 *
 * Such errors drop the offending payload; they never stop the world.
 */
[[nodiscard]] constexpr bool isRemoteFault(ErrorCode code) noexcept
{
    return code == ErrorCode::BufferUnderflow
        || code == ErrorCode::CorruptedData
        || code == ErrorCode::ProtocolViolation;
}

/**
 * @brief Error value: a code, a message and the place it was raised.
 */
class Error final {
public:
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Prefix the message with @p context ("peer 3", "entity 12").
     *
     * Keeps the code and the original location.
     */
    [[nodiscard]] Error within(std::string_view context) &&
    {
        _message = std::format("{}: {}", context, _message);
        return std::move(*this);
    }

    /// "CODE message" as written to the log.
    [[nodiscard]] std::string describe() const
    {
        return std::format("{} {}", toString(_code), _message);
    }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

using Unexpected = std::unexpected<Error>;

[[nodiscard]] inline Unexpected makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return Unexpected(Error{code, std::move(message), loc});
}

} // namespace tks::core

#endif // TKS_CORE_ERROR_HPP
