#ifndef DUMPLOADER_SRC_CURL_INTERNAL_HPP
#define DUMPLOADER_SRC_CURL_INTERNAL_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

namespace dumploader
{
    class Context;

    class curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what, CURLcode code = CURLE_OK);
        CURLcode code() const;

    private:
        CURLcode m_code;
    };

    // Outcome of a blocking request whose body was kept in memory.
    struct Response
    {
        long http_status = 0;
        std::string effective_url;
        std::string content;

        // 2xx for HTTP, any completed transfer for file:// URLs (which have no status).
        bool ok() const;
    };

    // Easy handle configured from a Context. Used blocking for listing documents (`perform`)
    // or added to a multi handle by the TransferEngine, which installs its own callbacks.
    class CURLHandle
    {
    public:
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& accept_encoding();

        // Bodies larger than `bytes` abort `perform`, 0 means no limit.
        CURLHandle& max_body_size(std::size_t bytes);

        // Throws `curl_error` if the transfer itself fails. HTTP errors are reported in the
        // response.
        Response perform();

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        CURL* handle()
        {
            return m_handle;
        }

        const std::string& url() const
        {
            return m_url;
        }

        const char* errorbuffer() const noexcept
        {
            return m_errorbuffer;
        }

    private:
        void apply_transport_settings(const Context& ctx);

        static std::size_t append_body(char* buffer,
                                       std::size_t size,
                                       std::size_t nitems,
                                       CURLHandle* self);

        CURL* m_handle = nullptr;
        std::string m_url;
        char m_errorbuffer[CURL_ERROR_SIZE];

        std::string m_body;
        std::size_t m_max_body_size = 0;
        bool m_body_too_large = false;
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode rc;
        if constexpr (std::is_same<T, std::string>())
        {
            rc = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            rc = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else if constexpr (std::is_same<T, int>())
        {
            rc = curl_easy_setopt(m_handle, opt, static_cast<long>(val));
        }
        else
        {
            rc = curl_easy_setopt(m_handle, opt, val);
        }
        if (rc != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl_easy_setopt failed for {}: {}", m_url, curl_easy_strerror(rc)),
                rc);
        }
        return *this;
    }
}

#endif
