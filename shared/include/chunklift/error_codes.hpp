/**
 * ChunkLift - Shared error codes used across the transfer layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace chunklift
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        CreateSessionFailed = 1,
        AuthenticationFailed = 2,
        SessionExpired = 3,
        Cancelled = 4,
        RetriesExhausted = 5,
        FileIo = 6,
        PersistenceFailed = 7,
        InvalidResponse = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace chunklift
