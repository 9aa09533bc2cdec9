#ifndef DUMPLOADER_ENUMS_HPP
#define DUMPLOADER_ENUMS_HPP

#include <optional>
#include <string>
#include <string_view>

#define PARTEXT ".dlpart"

namespace dumploader
{
    // Durable status of a file, as recorded by the StateStore.
    enum class FileStatus
    {
        // Known to the store, nothing downloaded (or a verified file that must be refetched).
        kPENDING,
        // A transfer was started and may have left a partial file behind.
        kIN_PROGRESS,
        // The file passed its integrity check.
        kVERIFIED,
        // The last transfer ended without success.
        kFAILED,
    };

    enum class TransferState
    {
        // The transfer is waiting for a free slot (or for its retry delay to elapse).
        kWAITING,
        // The transfer is running.
        kRUNNING,
        // The transfer is successfully finished.
        kFINISHED,
        // The transfer is finished without success.
        kFAILED,
        // The transfer was stopped by an interrupt and may be resumed by a later run.
        kINTERRUPTED,
    };

    enum class HeaderCbState
    {
        // Default state
        kDEFAULT,
        // HTTP headers with OK state
        kHTTP_STATE_OK,
        // Download was interrupted (e.g. Content-Length doesn't match
        // expected size etc.)
        kINTERRUPTED,
        // All headers which we were looking for are already found
        kDONE
    };

    enum class TransferStatus
    {
        kSUCCESSFUL,
        kFAILED,
        // Stopped by an interrupt, the state was left InProgress.
        kINTERRUPTED,
        // Never started because the run was interrupted first.
        kNOT_STARTED,
    };

    enum class ChecksumType
    {
        kSHA1,
        kSHA256,
        kMD5
    };

    enum class ErrorCode
    {
        // everything is ok
        DL_OK,
        // the remote listing could not be retrieved (network or HTTP failure)
        DL_MANIFEST_UNAVAILABLE,
        // the remote listing is malformed
        DL_MANIFEST_PARSE,
        // the remote listing has no entries
        DL_MANIFEST_EMPTY,
        // some error that should be temporary and next try could work
        // (HTTP status codes 500, 502-504, operation timeout, ...)
        DL_TRANSIENT_TRANSFER,
        // the transfer cannot succeed (404, retries exhausted, ...)
        DL_PERMANENT_TRANSFER,
        // downloaded data does not match the expected size or checksum
        DL_BAD_CHECKSUM,
        // a persisted state entry could not be read
        DL_STATE_CORRUPTION,
        // a state transition that is not allowed was requested
        DL_STATE_TRANSITION,
        // the destination file could not be written (disk full, permission, ...)
        DL_DESTINATION_WRITE,
        // a path escapes the output directory or is otherwise unusable
        DL_BAD_PATH,
        // bad URL specified
        DL_BAD_URL,
        // download was interrupted by signal or by request
        DL_INTERRUPTED,
        // input output error
        DL_IO,
        // invalid configuration value
        DL_CONFIG,
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

    inline bool operator==(const Checksum& lhs, const Checksum& rhs)
    {
        return lhs.type == rhs.type && lhs.checksum == rhs.checksum;
    }

    inline bool operator!=(const Checksum& lhs, const Checksum& rhs)
    {
        return !(lhs == rhs);
    }

    inline const char* to_string(FileStatus status)
    {
        switch (status)
        {
            case FileStatus::kPENDING:
                return "pending";
            case FileStatus::kIN_PROGRESS:
                return "in_progress";
            case FileStatus::kVERIFIED:
                return "verified";
            case FileStatus::kFAILED:
                return "failed";
        }
        return "pending";
    }

    inline std::optional<FileStatus> file_status_from_string(std::string_view str)
    {
        if (str == "pending")
            return FileStatus::kPENDING;
        if (str == "in_progress")
            return FileStatus::kIN_PROGRESS;
        if (str == "verified")
            return FileStatus::kVERIFIED;
        if (str == "failed")
            return FileStatus::kFAILED;
        return std::nullopt;
    }

    inline const char* to_string(ChecksumType type)
    {
        switch (type)
        {
            case ChecksumType::kSHA1:
                return "sha1";
            case ChecksumType::kSHA256:
                return "sha256";
            case ChecksumType::kMD5:
                return "md5";
        }
        return "sha256";
    }

    inline std::optional<ChecksumType> checksum_type_from_string(std::string_view str)
    {
        if (str == "sha1")
            return ChecksumType::kSHA1;
        if (str == "sha256")
            return ChecksumType::kSHA256;
        if (str == "md5")
            return ChecksumType::kMD5;
        return std::nullopt;
    }

    inline const char* to_string(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::DL_OK:
                return "ok";
            case ErrorCode::DL_MANIFEST_UNAVAILABLE:
                return "manifest_unavailable";
            case ErrorCode::DL_MANIFEST_PARSE:
                return "manifest_parse_error";
            case ErrorCode::DL_MANIFEST_EMPTY:
                return "manifest_empty";
            case ErrorCode::DL_TRANSIENT_TRANSFER:
                return "transient_transfer_error";
            case ErrorCode::DL_PERMANENT_TRANSFER:
                return "permanent_transfer_error";
            case ErrorCode::DL_BAD_CHECKSUM:
                return "bad_checksum";
            case ErrorCode::DL_STATE_CORRUPTION:
                return "state_corruption";
            case ErrorCode::DL_STATE_TRANSITION:
                return "state_transition";
            case ErrorCode::DL_DESTINATION_WRITE:
                return "destination_write_error";
            case ErrorCode::DL_BAD_PATH:
                return "bad_path";
            case ErrorCode::DL_BAD_URL:
                return "bad_url";
            case ErrorCode::DL_INTERRUPTED:
                return "interrupted";
            case ErrorCode::DL_IO:
                return "io_error";
            case ErrorCode::DL_CONFIG:
                return "config_error";
        }
        return "unknown";
    }
}

#endif
