#ifndef VMXFER_SRC_CURL_INTERNAL_HPP
#define VMXFER_SRC_CURL_INTERNAL_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <tl/expected.hpp>

#include <vmxfer/export.hpp>
#include <vmxfer/curl.hpp>

namespace vmxfer
{
    class Context;
    using proxy_map_type = std::map<std::string, std::string>;

    class VMXFER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "download error");
    };

    class VMXFER_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& url(const std::string& url, const proxy_map_type& proxies);
        CURLHandle& user_agent(const std::string& user_agent);

        // Runs the transfer with the options set so far.
        CURLcode perform();

        // Message written by curl for the last failure, may be empty.
        std::string error_message() const;

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option);

    std::optional<std::string> proxy_match(const proxy_map_type& proxies, const std::string& url);

    // Transport failures after which another attempt cannot succeed.
    bool is_fatal_curl_error(CURLcode code) noexcept;
}

namespace vmxfer::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
