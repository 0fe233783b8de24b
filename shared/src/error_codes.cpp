#include "chunklift/error_codes.hpp"

#include <array>

namespace chunklift
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::CreateSessionFailed, "create_session_failed"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::SessionExpired, "session_expired"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::RetriesExhausted, "retries_exhausted"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::PersistenceFailed, "persistence_failed"},
            {ErrorCode::InvalidResponse, "invalid_response"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace chunklift
