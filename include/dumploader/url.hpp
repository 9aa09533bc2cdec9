#ifndef DUMPLOADER_URL_HPP
#define DUMPLOADER_URL_HPP

#include <string>

#include <dumploader/export.hpp>

extern "C"
{
#include <curl/curl.h>
}

namespace dumploader
{
    // Thin RAII wrapper over libcurl's URL API.
    class DUMPLOADER_API URLHandler
    {
    public:
        URLHandler(const std::string& url = "");
        ~URLHandler();

        URLHandler(const URLHandler&);
        URLHandler& operator=(const URLHandler&);
        URLHandler(URLHandler&&);
        URLHandler& operator=(URLHandler&&);

        std::string url() const;

        std::string scheme() const;
        std::string host() const;
        std::string path() const;
        std::string port() const;
        std::string query() const;

        URLHandler& set_scheme(const std::string& scheme);
        URLHandler& set_host(const std::string& host);
        URLHandler& set_path(const std::string& path);
        URLHandler& set_port(const std::string& port);

    private:
        std::string get_part(CURLUPart part) const;
        void set_part(CURLUPart part, const std::string& s);

        std::string m_url;
        CURLU* m_handle;
        bool m_has_scheme;
    };

    // True if `url` starts with a scheme ("http://", "file://", ...).
    DUMPLOADER_API bool has_scheme(const std::string& url);

    // Joins URL parts with exactly one '/' between them. Absolute URLs given as a later part
    // replace the parts before them.
    DUMPLOADER_API std::string join_url(const std::string& base, const std::string& path);

    template <class... Args>
    std::string join_url(const std::string& base, const std::string& path, const Args&... args)
    {
        return join_url(join_url(base, path), args...);
    }

    // Resolves a (possibly relative) link found in the document at `base_url`.
    DUMPLOADER_API std::string resolve_url(const std::string& base_url, const std::string& link);

    DUMPLOADER_API std::string url_decode(const std::string& str);

    DUMPLOADER_API std::string path_to_url(const std::string& path);
}

#endif
