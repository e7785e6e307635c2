#include <atomic>
#include <memory>

#include <spdlog/spdlog.h>

#include <vmxfer/context.hpp>
#include <vmxfer/curl.hpp>
#include <vmxfer/utils.hpp>

#include "curl_internal.hpp"

namespace vmxfer
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }


    /**************
     * CURLHandle*
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, static_cast<long>(ctx.chunk_size));
        // workers run on their own threads, signals would be delivered to any of them
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            // Windows SSL backend doesn't support this
            CURLcode verifystatus = curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYSTATUS, 0L);
            if (verifystatus != CURLE_OK && verifystatus != CURLE_NOT_BUILT_IN)
                throw curl_error("Could not initialize CURL handle");

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }
        }

        if (!ctx.user_agent.empty())
            user_agent(ctx.user_agent);
        add_headers(ctx.additional_httpheaders);

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url, ctx.proxy_map);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const proxy_map_type& proxies)
    {
        setopt(CURLOPT_URL, url);
        const auto match = proxy_match(proxies, url);
        if (match)
        {
            setopt(CURLOPT_PROXY, match.value());
        }
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLcode CURLHandle::perform()
    {
        errorbuffer[0] = '\0';
        return curl_easy_perform(handle());
    }

    std::string CURLHandle::error_message() const
    {
        return std::string(errorbuffer);
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    /************
     * Response *
     ************/

    void Response::fill_values(CURLHandle& handle)
    {
        average_speed = handle.getinfo<curl_off_t>(CURLINFO_SPEED_DOWNLOAD_T).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        downloaded_size = handle.getinfo<curl_off_t>(CURLINFO_SIZE_DOWNLOAD_T).value_or(0);
    }

    const char* http_reason_phrase(long status) noexcept
    {
        switch (status)
        {
            case 200:
                return "OK";
            case 206:
                return "Partial Content";
            case 400:
                return "Bad Request";
            case 401:
                return "Unauthorized";
            case 403:
                return "Forbidden";
            case 404:
                return "Not Found";
            case 407:
                return "Proxy Authentication Required";
            case 408:
                return "Request Timeout";
            case 410:
                return "Gone";
            case 416:
                return "Range Not Satisfiable";
            case 429:
                return "Too Many Requests";
            case 500:
                return "Internal Server Error";
            case 501:
                return "Not Implemented";
            case 502:
                return "Bad Gateway";
            case 503:
                return "Service Unavailable";
            case 504:
                return "Gateway Timeout";
            case 505:
                return "HTTP Version Not Supported";
            case 511:
                return "Network Authentication Required";
            default:
                return "";
        }
    }

    namespace
    {
        struct CURLUrlDeleter
        {
            void operator()(CURLU* u) const
            {
                curl_url_cleanup(u);
            }
        };

        std::string url_part(CURLU* u, CURLUPart what)
        {
            char* part = nullptr;
            if (curl_url_get(u, what, &part, 0) != CURLUE_OK || part == nullptr)
                return {};
            std::string result(part);
            curl_free(part);
            return result;
        }
    }

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url)
    {
        // Same lookup order as requests.utils.select_proxy()
        if (proxies.empty())
        {
            return std::nullopt;
        }

        std::unique_ptr<CURLU, CURLUrlDeleter> handler(curl_url());
        if (!handler || curl_url_set(handler.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
        {
            return std::nullopt;
        }
        auto scheme = url_part(handler.get(), CURLUPART_SCHEME);
        auto host = url_part(handler.get(), CURLUPART_HOST);
        std::vector<std::string> options;

        if (host.empty())
        {
            options = {
                scheme,
                "all",
            };
        }
        else
        {
            options = { scheme + "://" + host, scheme, "all://" + host, "all" };
        }

        for (auto& option : options)
        {
            auto proxy = proxies.find(option);
            if (proxy != proxies.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    bool is_fatal_curl_error(CURLcode code) noexcept
    {
        switch (code)
        {
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_BAD_FUNCTION_ARGUMENT:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_FILESIZE_EXCEEDED:
            case CURLE_INTERFACE_FAILED:
            case CURLE_NOT_BUILT_IN:
            case CURLE_OUT_OF_MEMORY:
            // case CURLE_RECV_ERROR:  // See RhBug: 1219817
            // case CURLE_SEND_ERROR:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_SSL_CRL_BADFILE:
            case CURLE_WRITE_ERROR:
            case CURLE_FILE_COULDNT_READ_FILE:
            case CURLE_REMOTE_FILE_NOT_FOUND:
            case CURLE_LOGIN_DENIED:
            case CURLE_REMOTE_ACCESS_DENIED:
                return true;
            default:
                return false;
        }
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "vmxfer::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res
                    = curl_global_sslset((curl_sslbackend) ssl_backend.value(), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                    if (res == CURLSSLSET_UNKNOWN_BACKEND)
                        throw curl_error("unknown curl ssl backend");
                    else if (res == CURLSSLSET_NO_BACKENDS)
                        throw curl_error("no curl ssl backend available");
                    else if (res == CURLSSLSET_TOO_LATE)
                        throw curl_error("curl ssl backend set too late");
                    else
                        throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
