#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <vmxfer/context.hpp>
#include <vmxfer/curl.hpp>
#include <vmxfer/fetcher.hpp>
#include <vmxfer/utils.hpp>

#include "curl_internal.hpp"

namespace vmxfer
{
    namespace
    {
        bool is_http_url(const std::string& url)
        {
            auto lurl = to_lower(url);
            return starts_with(lurl, "http://") || starts_with(lurl, "https://");
        }

        bool is_success_status(long status, bool http)
        {
            if (http)
                return status / 100 == 2;
            // ftp reports the last server reply (150 or 125 once the body flows), file:// reports
            // 0; real failures of these protocols surface as a CURLcode
            return status < 400;
        }

        // State shared with the curl callbacks of one transfer.
        struct TransferState
        {
            CURLHandle* handle = nullptr;
            FetchSink* sink = nullptr;
            const FetchRequest* request = nullptr;
            bool http = false;
            bool notified = false;
            bool sink_aborted = false;
            long bad_status = 0;

            // Returns false if the body must not be delivered.
            bool notify()
            {
                if (notified)
                    return !sink_aborted && bad_status == 0;
                notified = true;

                ResponseInfo info;
                info.status = handle->getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
                if (!is_success_status(info.status, http))
                {
                    bad_status = info.status;
                    return false;
                }
                if (http && request->offset > 0)
                    info.range_honored = (info.status == 206);
                auto length = handle->getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
                if (length && length.value() >= 0)
                    info.content_length = static_cast<std::size_t>(length.value());

                if (!sink->on_response(info))
                {
                    sink_aborted = true;
                    return false;
                }
                return true;
            }
        };

        std::size_t write_callback(char* buffer, std::size_t size, std::size_t nitems, void* self)
        {
            auto* state = static_cast<TransferState*>(self);
            const std::size_t total = size * nitems;
            if (!state->notify())
                return 0;
            if (!state->sink->on_data(buffer, total))
            {
                state->sink_aborted = true;
                return 0;
            }
            return total;
        }

        int progress_callback(
            void* self, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t, curl_off_t)
        {
            auto* state = static_cast<TransferState*>(self);
            return state->request->token.cancelled() ? 1 : 0;
        }

        bool is_transient_curl_error(CURLcode code)
        {
            switch (code)
            {
                case CURLE_COULDNT_RESOLVE_HOST:
                case CURLE_COULDNT_CONNECT:
                case CURLE_OPERATION_TIMEDOUT:
                case CURLE_PARTIAL_FILE:
                case CURLE_GOT_NOTHING:
                case CURLE_SEND_ERROR:
                case CURLE_RECV_ERROR:
                case CURLE_SSL_CONNECT_ERROR:
                case CURLE_HTTP2:
                case CURLE_HTTP2_STREAM:
                    return true;
                default:
                    return false;
            }
        }

        TransferError curl_transfer_error(CURLcode code,
                                          const std::string& url,
                                          const std::string& details)
        {
            std::string error = fmt::format(
                "CURL error ({}): {} for {} [{}]", code, curl_easy_strerror(code), url, details);
            if (is_fatal_curl_error(code))
                return TransferError{ ErrorLevel::FATAL, ErrorCode::XF_CURL, error, Retry::kNON_RETRYABLE };
            if (code == CURLE_OPERATION_TIMEDOUT)
                return TransferError{ ErrorLevel::SERIOUS, ErrorCode::XF_CURL, error, Retry::kRETRYABLE };
            if (is_transient_curl_error(code))
                return TransferError{ ErrorLevel::INFO, ErrorCode::XF_CURL, error, Retry::kRETRYABLE };
            // left to the retry policy's text classification
            return TransferError{ ErrorLevel::INFO, ErrorCode::XF_CURL, error };
        }
    }

    TransferError http_status_error(long status, const std::string& url)
    {
        std::string phrase = http_reason_phrase(status);
        std::string reason = phrase.empty()
                                 ? fmt::format("HTTP {} for {}", status, url)
                                 : fmt::format("HTTP {} {} for {}", status, phrase, url);

        bool transient = false;
        if (status == 408 || status == 429)
            transient = true;
        else if (status / 100 == 5)
            transient = (status != 501 && status != 505 && status != 511);

        if (transient)
            return TransferError{ ErrorLevel::INFO, ErrorCode::XF_BADSTATUS, reason, Retry::kRETRYABLE };
        if (status == 416)
        {
            return TransferError{
                ErrorLevel::SERIOUS, ErrorCode::XF_RANGE_NOT_SATISFIABLE, reason, Retry::kNON_RETRYABLE
            };
        }
        return TransferError{
            ErrorLevel::SERIOUS, ErrorCode::XF_BADSTATUS, reason, Retry::kNON_RETRYABLE
        };
    }

    TransferError sink_aborted_error(const std::string& url)
    {
        return TransferError{ ErrorLevel::INFO,
                              ErrorCode::XF_IO,
                              fmt::format("Transfer of {} aborted by receiver", url),
                              Retry::kNON_RETRYABLE };
    }

    CurlFetcher::CurlFetcher(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    tl::expected<void, TransferError> CurlFetcher::fetch(const FetchRequest& request,
                                                         FetchSink& sink)
    {
        if (request.token.cancelled())
            return tl::make_unexpected(cancelled_error(request.url));

        CURLHandle handle(m_ctx, request.url);

        TransferState state;
        state.handle = &handle;
        state.sink = &sink;
        state.request = &request;
        state.http = is_http_url(request.url);

        if (request.offset > 0)
        {
            // CURLOPT_RESUME_FROM would fail the transfer when an HTTP server ignores the range,
            // a plain Range header lets the sink restart from the full body instead.
            if (state.http)
                handle.setopt(CURLOPT_RANGE, fmt::format("{}-", request.offset));
            else
                handle.setopt(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(request.offset));
        }

        handle.setopt(CURLOPT_WRITEFUNCTION, write_callback);
        handle.setopt(CURLOPT_WRITEDATA, static_cast<void*>(&state));
        handle.setopt(CURLOPT_XFERINFOFUNCTION, progress_callback);
        handle.setopt(CURLOPT_XFERINFODATA, static_cast<void*>(&state));
        handle.setopt(CURLOPT_NOPROGRESS, 0L);

        spdlog::debug("Fetching {} from offset {}", request.url, request.offset);
        CURLcode code = handle.perform();

        if (request.token.cancelled())
            return tl::make_unexpected(cancelled_error(request.url));
        if (state.sink_aborted)
            return tl::make_unexpected(sink_aborted_error(request.url));
        if (state.bad_status != 0)
            return tl::make_unexpected(http_status_error(state.bad_status, request.url));
        if (code != CURLE_OK)
            return tl::make_unexpected(
                curl_transfer_error(code, request.url, handle.error_message()));

        // an empty body never reached the write callback
        if (!state.notify())
        {
            if (state.bad_status != 0)
                return tl::make_unexpected(http_status_error(state.bad_status, request.url));
            return tl::make_unexpected(sink_aborted_error(request.url));
        }

        Response response;
        response.fill_values(handle);
        spdlog::debug("Finished {}: {} at {}/s",
                      response.effective_url,
                      format_bytes(static_cast<std::uintmax_t>(std::max<curl_off_t>(response.downloaded_size, 0))),
                      format_bytes(static_cast<std::uintmax_t>(std::max<curl_off_t>(response.average_speed, 0))));
        return {};
    }
}
