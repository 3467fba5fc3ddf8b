#ifndef CLOUDGET_ENUMS_HPP
#define CLOUDGET_ENUMS_HPP

#include <string>

#define PARTEXT ".cgpart"
#define RESUMEEXT ".resume"
#define EMPTY_SHA "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"

namespace cloudget
{
    enum class DownloadState
    {
        // The chunk is waiting to be dispatched (or waiting for its retry delay).
        kWAITING,
        // The transfer is running.
        kRUNNING,
        // The transfer is successfully finished.
        kFINISHED,
        // The transfer is finished without success.
        kFAILED,
        // The transfer was stopped because a sibling failed or the user interrupted.
        kCANCELLED,
    };

    enum class ChecksumType
    {
        kSHA1,
        kSHA256,
        kSHA512,
        kMD5
    };

    enum class ErrorCode
    {
        // everything is ok
        CG_OK,
        // bad function argument (e.g. non-positive chunk size)
        CG_BADFUNCARG,
        // no service accepts the URL or the URL does not match a known share-link shape
        CG_UNSUPPORTED_URL,
        // the metadata request failed
        CG_PROBE_FAILED,
        // an interstitial page was served but no confirmation token could be found in it
        CG_NO_CONFIRM_TOKEN,
        // a byte range could not be fetched within the attempt budget
        CG_CHUNK_FETCH_FAILED,
        // cURL error
        CG_CURL,
        // cURL multi handle error
        CG_CURLM,
        // HTTP returned a status code which does not represent success
        CG_BADSTATUS,
        // the overall session deadline was exceeded
        CG_TIMEOUT,
        // the artifact does not have the expected size
        CG_SIZE_MISMATCH,
        // the artifact does not have the expected checksum
        CG_HASH_MISMATCH,
        // download was interrupted by signal or cancelled by the user
        CG_INTERRUPTED,
        // file operation error (cannot open, write, rename, ...)
        CG_FILE,
        // invalid configuration file or value
        CG_CONFIG,
        // (xx) unknown error - sentinel of error codes enum
        CG_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };

    struct Checksum
    {
        ChecksumType type;
        std::string checksum;
    };
}

#endif
