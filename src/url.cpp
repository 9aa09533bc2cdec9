#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include <dumploader/url.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    URLHandler::URLHandler(const std::string& url)
        : m_url(url)
        , m_handle(curl_url())
        , m_has_scheme(false)
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }

        if (!url.empty())
        {
            m_has_scheme = has_scheme(url);
            const unsigned int flags = m_has_scheme ? 0U : CURLU_DEFAULT_SCHEME;
            CURLUcode uc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), flags);
            if (uc != CURLUE_OK)
            {
                curl_url_cleanup(m_handle);
                throw std::runtime_error(fmt::format("Could not parse URL '{}'", url));
            }
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_url(rhs.m_url)
        , m_handle(curl_url_dup(rhs.m_handle))
        , m_has_scheme(rhs.m_has_scheme)
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(tmp, *this);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs)
        : m_url(std::move(rhs.m_url))
        , m_handle(std::exchange(rhs.m_handle, nullptr))
        , m_has_scheme(rhs.m_has_scheme)
    {
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs)
    {
        std::swap(m_url, rhs.m_url);
        std::swap(m_handle, rhs.m_handle);
        std::swap(m_has_scheme, rhs.m_has_scheme);
        return *this;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    std::string URLHandler::port() const
    {
        return get_part(CURLUPART_PORT);
    }

    std::string URLHandler::query() const
    {
        return get_part(CURLUPART_QUERY);
    }

    URLHandler& URLHandler::set_scheme(const std::string& scheme)
    {
        set_part(CURLUPART_SCHEME, scheme);
        return *this;
    }

    URLHandler& URLHandler::set_host(const std::string& host)
    {
        set_part(CURLUPART_HOST, host);
        return *this;
    }

    URLHandler& URLHandler::set_path(const std::string& path)
    {
        set_part(CURLUPART_PATH, path);
        return *this;
    }

    URLHandler& URLHandler::set_port(const std::string& port)
    {
        set_part(CURLUPART_PORT, port);
        return *this;
    }

    std::string URLHandler::get_part(CURLUPart part) const
    {
        char* scheme = nullptr;
        auto rc = curl_url_get(m_handle, part, &scheme, 0);
        if (!rc)
        {
            std::string res(scheme);
            curl_free(scheme);
            return res;
        }
        return "";
    }

    void URLHandler::set_part(CURLUPart part, const std::string& s)
    {
        auto rc = curl_url_set(m_handle, part, s.c_str(), CURLU_URLENCODE);
        if (rc != CURLUE_OK)
        {
            throw std::runtime_error(fmt::format("Could not set URL part to '{}'", s));
        }
    }

    bool has_scheme(const std::string& url)
    {
        const auto pos = url.find("://");
        if (pos == std::string::npos || pos == 0)
        {
            return false;
        }
        return std::all_of(url.begin(),
                           url.begin() + static_cast<std::ptrdiff_t>(pos),
                           [](unsigned char c) { return std::isalnum(c) || c == '+' || c == '-'
                                                        || c == '.'; });
    }

    std::string join_url(const std::string& base, const std::string& path)
    {
        if (base.empty() || has_scheme(path))
        {
            return path;
        }
        if (path.empty())
        {
            return base;
        }

        std::string res = base;
        if (!ends_with(res, "/"))
        {
            res += '/';
        }
        std::size_t start = 0;
        while (start < path.size() && path[start] == '/')
        {
            ++start;
        }
        res += path.substr(start);
        return res;
    }

    std::string resolve_url(const std::string& base_url, const std::string& link)
    {
        if (has_scheme(link))
        {
            return link;
        }

        CURLU* handle = curl_url();
        if (handle == nullptr)
        {
            throw std::bad_alloc();
        }

        std::string result;
        if (curl_url_set(handle, CURLUPART_URL, base_url.c_str(), 0) == CURLUE_OK
            && curl_url_set(handle, CURLUPART_URL, link.c_str(), 0) == CURLUE_OK)
        {
            char* out = nullptr;
            if (curl_url_get(handle, CURLUPART_URL, &out, 0) == CURLUE_OK)
            {
                result = out;
                curl_free(out);
            }
        }
        curl_url_cleanup(handle);

        if (result.empty())
        {
            throw std::runtime_error(
                fmt::format("Could not resolve '{}' against '{}'", link, base_url));
        }
        return result;
    }

    std::string url_decode(const std::string& str)
    {
        auto hex_value = [](char c) -> int
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        };

        std::string res;
        res.reserve(str.size());
        for (std::size_t i = 0; i < str.size(); ++i)
        {
            if (str[i] == '%' && i + 2 < str.size())
            {
                const int hi = hex_value(str[i + 1]);
                const int lo = hex_value(str[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    res += static_cast<char>(hi * 16 + lo);
                    i += 2;
                    continue;
                }
            }
            res += str[i];
        }
        return res;
    }

    std::string path_to_url(const std::string& path)
    {
        static const std::string file_scheme = "file://";
        if (starts_with(path, file_scheme))
        {
            return path;
        }

        std::string abs_path = fs::absolute(path).lexically_normal().generic_string();
#ifdef _WIN32
        abs_path = "/" + abs_path;
#endif
        replace_all(abs_path, " ", "%20");
        return file_scheme + abs_path;
    }
}
