#ifndef VMXFER_FETCHER_HPP
#define VMXFER_FETCHER_HPP

#include <cstddef>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <vmxfer/cancellation.hpp>
#include <vmxfer/errors.hpp>
#include <vmxfer/export.hpp>

namespace vmxfer
{
    class Context;

    struct FetchRequest
    {
        std::string url;
        // first byte wanted, 0 for the whole resource
        std::size_t offset = 0;
        CancellationToken token;
    };

    struct ResponseInfo
    {
        // HTTP status, the last server reply for ftp, 0 for file://
        long status = 0;
        // true if the body starts at the requested offset, false if the source ignored the
        // range and sends the whole resource
        bool range_honored = true;
        // length of the body about to be delivered, if announced
        std::optional<std::size_t> content_length;
    };

    // Receives one response. Returning false from either callback aborts the fetch.
    class VMXFER_API FetchSink
    {
    public:
        virtual ~FetchSink() = default;

        // Called once, before the first body byte.
        virtual bool on_response(const ResponseInfo& info) = 0;
        virtual bool on_data(const char* data, std::size_t size) = 0;
    };

    // Source of bytes for a transfer task.
    class VMXFER_API Fetcher
    {
    public:
        virtual ~Fetcher() = default;

        // On failure the error carries its retry marking. A fetch aborted by the sink fails with
        // XF_IO, the sink is expected to know why.
        virtual tl::expected<void, TransferError> fetch(const FetchRequest& request,
                                                        FetchSink& sink)
            = 0;
    };

    // http(s), ftp and file URLs through libcurl.
    class VMXFER_API CurlFetcher : public Fetcher
    {
    public:
        explicit CurlFetcher(const Context& ctx);

        tl::expected<void, TransferError> fetch(const FetchRequest& request,
                                                FetchSink& sink) override;

    private:
        const Context& m_ctx;
    };

    // Error for a non-2xx response. 408, 429 and most 5xx are retryable, everything else is not.
    // 416 is reported as XF_RANGE_NOT_SATISFIABLE.
    VMXFER_API TransferError http_status_error(long status, const std::string& url);

    VMXFER_API TransferError sink_aborted_error(const std::string& url);
}

#endif
