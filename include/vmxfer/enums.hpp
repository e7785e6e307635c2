#ifndef VMXFER_ENUMS_HPP
#define VMXFER_ENUMS_HPP

#include <string>

#define CHECKPOINT_EXT ".checkpoint"
#define CHECKPOINT_TMPEXT ".tmp"

namespace vmxfer
{
    enum class FileStatus
    {
        // No byte of the file is known to be on disk.
        kPENDING,
        // A worker was writing the file (or died while doing so).
        kDOWNLOADING,
        // The file is complete and its size matches the recorded total size.
        kCOMPLETED,
        // The last attempt failed; the file will be restarted from scratch.
        kFAILED,
    };

    enum class ResumeAction
    {
        // File is already complete on disk, no network I/O needed.
        kSKIP,
        // Continue a partial file with a range request.
        kRESUME,
        // Download the whole file again from offset 0.
        kRESTART,
    };

    /** vmxfer return/error codes */
    enum class ErrorCode
    {
        // everything is ok
        XF_OK,
        // bad function argument
        XF_BADARG,
        // the pool's cancellation token was already triggered
        XF_POOL_SHUTTING_DOWN,
        // the bounded task queue has no free slot
        XF_QUEUE_FULL,
        // the pool was already closed
        XF_POOL_CLOSED,
        // the pool was already started
        XF_POOL_STARTED,
        // no such file (checkpoint, source file, ...)
        XF_NOT_FOUND,
        // a checkpoint could not be parsed
        XF_CORRUPT,
        // cannot create a directory for the destination
        XF_CANNOTCREATEDIR,
        // file operation error (open, truncate, permissions, ...)
        XF_FILE,
        // input output error
        XF_IO,
        // cURL error
        XF_CURL,
        // HTTP or FTP returned a status code which does not represent success
        XF_BADSTATUS,
        // the server refused the requested byte range (HTTP 416)
        XF_RANGE_NOT_SATISFIABLE,
        // interrupted by the cancellation token
        XF_CANCELLED,
        // fewer bytes were written to disk than received
        XF_SHORT_WRITE,
        // the finished file does not have the expected size
        XF_SIZE_MISMATCH,
        // bad checksum
        XF_BADCHECKSUM,
        // the retry policy gave up
        XF_RETRIES_EXHAUSTED,
        // (xx) unknown error - sentinel of error codes enum
        XF_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };

    inline const char* to_string(FileStatus status) noexcept
    {
        switch (status)
        {
            case FileStatus::kPENDING:
                return "pending";
            case FileStatus::kDOWNLOADING:
                return "downloading";
            case FileStatus::kCOMPLETED:
                return "completed";
            case FileStatus::kFAILED:
                return "failed";
        }
        return "pending";
    }

    inline const char* to_string(ResumeAction action) noexcept
    {
        switch (action)
        {
            case ResumeAction::kSKIP:
                return "skip";
            case ResumeAction::kRESUME:
                return "resume";
            case ResumeAction::kRESTART:
                return "restart";
        }
        return "restart";
    }
}

#endif
