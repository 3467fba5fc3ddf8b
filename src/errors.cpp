#include <cloudget/errors.hpp>

namespace cloudget
{
    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::CG_OK:
                return "Ok";
            case ErrorCode::CG_BADFUNCARG:
                return "BadArgument";
            case ErrorCode::CG_UNSUPPORTED_URL:
                return "UnsupportedUrl";
            case ErrorCode::CG_PROBE_FAILED:
            case ErrorCode::CG_NO_CONFIRM_TOKEN:
                return "ProbeFailed";
            case ErrorCode::CG_CHUNK_FETCH_FAILED:
                return "ChunkFetchFailed";
            case ErrorCode::CG_CURL:
                return "CurlError";
            case ErrorCode::CG_CURLM:
                return "CurlMultiError";
            case ErrorCode::CG_BADSTATUS:
                return "BadStatus";
            case ErrorCode::CG_TIMEOUT:
                return "Timeout";
            case ErrorCode::CG_SIZE_MISMATCH:
                return "SizeMismatch";
            case ErrorCode::CG_HASH_MISMATCH:
                return "HashMismatch";
            case ErrorCode::CG_INTERRUPTED:
                return "UserCancelled";
            case ErrorCode::CG_FILE:
                return "FileError";
            case ErrorCode::CG_CONFIG:
                return "ConfigError";
            default:
                return "UnknownError";
        }
    }
}
