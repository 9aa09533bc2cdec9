#include <spdlog/spdlog.h>

#include <dumploader/context.hpp>
#include <dumploader/utils.hpp>

#include "curl_internal.hpp"

namespace dumploader
{
    curl_error::curl_error(const std::string& what, CURLcode code)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    CURLcode curl_error::code() const
    {
        return m_code;
    }

    bool Response::ok() const
    {
        if (http_status == 0)
        {
            return starts_with(effective_url, "file:");
        }
        return http_status / 100 == 2;
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : m_handle(curl_easy_init())
        , m_url(url)
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        m_errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, static_cast<char*>(m_errorbuffer));
        setopt(CURLOPT_URL, url);
        apply_transport_settings(ctx);
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
    }

    void CURLHandle::apply_transport_settings(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        setopt(CURLOPT_USERAGENT, fmt::format("{} {}", ctx.user_agent, curl_version()));
        setopt(CURLOPT_FILETIME, ctx.preserve_filetime);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled for {}", m_url);
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);
        }

        if (ctx.verbosity > 2)
        {
            setopt(CURLOPT_VERBOSE, 1L);
        }
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        const CURLcode rc = curl_easy_getinfo(m_handle, option, &val);
        if (rc != CURLE_OK)
        {
            return tl::unexpected(rc);
        }
        return val;
    }

    // curl_off_t is one of these two.
    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<long long, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        char* val = nullptr;
        const CURLcode rc = curl_easy_getinfo(m_handle, option, &val);
        if (rc != CURLE_OK)
        {
            return tl::unexpected(rc);
        }
        return val ? std::string(val) : std::string();
    }

    CURLHandle& CURLHandle::accept_encoding()
    {
        setopt(CURLOPT_ACCEPT_ENCODING, std::string());
        return *this;
    }

    CURLHandle& CURLHandle::max_body_size(std::size_t bytes)
    {
        m_max_body_size = bytes;
        return *this;
    }

    std::size_t CURLHandle::append_body(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        CURLHandle* self)
    {
        const std::size_t all = size * nitems;
        if (self->m_max_body_size > 0 && self->m_body.size() + all > self->m_max_body_size)
        {
            self->m_body_too_large = true;
            return 0;
        }
        self->m_body.append(buffer, all);
        return all;
    }

    Response CURLHandle::perform()
    {
        m_body.clear();
        m_body_too_large = false;
        setopt(CURLOPT_WRITEFUNCTION, &CURLHandle::append_body);
        setopt(CURLOPT_WRITEDATA, this);

        const CURLcode rc = curl_easy_perform(m_handle);
        if (m_body_too_large)
        {
            throw curl_error(fmt::format("{} is larger than {}", m_url, format_bytes(m_max_body_size)),
                             CURLE_FILESIZE_EXCEEDED);
        }
        if (rc != CURLE_OK)
        {
            throw curl_error(fmt::format("{} [{}]", curl_easy_strerror(rc), m_errorbuffer), rc);
        }

        Response response;
        response.http_status = getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        response.effective_url = getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or(m_url);
        response.content = std::move(m_body);
        if (!response.ok())
        {
            spdlog::debug("Received {} for {}", response.http_status, response.effective_url);
        }
        return response;
    }
}
