#ifndef VMXFER_CURL_HPP
#define VMXFER_CURL_HPP

#include <string>

extern "C"
{
#include <curl/curl.h>
}

#include <vmxfer/export.hpp>

namespace vmxfer
{
    class CURLHandle;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        nss = CURLSSLBACKEND_NSS,
        gskit = CURLSSLBACKEND_GSKIT,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Summary of a finished curl transfer.
    struct VMXFER_API Response
    {
        std::string effective_url;
        curl_off_t average_speed = -1;
        curl_off_t downloaded_size = -1;

        void fill_values(CURLHandle& handle);
    };

    // Reason phrase for an HTTP status, empty if unknown.
    VMXFER_API const char* http_reason_phrase(long status) noexcept;
}

#endif
