#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

#include <dumploader/listing.hpp>
#include <dumploader/url.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    namespace
    {
        // nginx: "04-Mar-2023 05:06    123456", apache (plain): "2023-03-04 05:06  123456"
        std::optional<file_time_point> parse_index_time(const std::string& date,
                                                        const char* format)
        {
            std::tm tm = {};
            std::istringstream iss(date);
            iss.imbue(std::locale::classic());
            iss >> std::get_time(&tm, format);
            if (iss.fail())
            {
                return std::nullopt;
            }
#ifdef _WIN32
            const std::time_t t = _mkgmtime(&tm);
#else
            const std::time_t t = timegm(&tm);
#endif
            if (t == static_cast<std::time_t>(-1))
            {
                return std::nullopt;
            }
            return std::chrono::system_clock::from_time_t(t);
        }

        void parse_trailer(const std::string& trailer, IndexEntry& entry)
        {
            static const std::regex nginx_re(
                R"((\d{2}-[A-Za-z]{3}-\d{4} \d{2}:\d{2})\s+(\d+|-))");
            static const std::regex iso_re(R"((\d{4}-\d{2}-\d{2} \d{2}:\d{2})\s+(\d+|-))");

            std::smatch m;
            if (std::regex_search(trailer, m, nginx_re))
            {
                entry.last_modified = parse_index_time(m[1].str(), "%d-%b-%Y %H:%M");
            }
            else if (std::regex_search(trailer, m, iso_re))
            {
                entry.last_modified = parse_index_time(m[1].str(), "%Y-%m-%d %H:%M");
            }
            else
            {
                return;
            }

            // Human readable sizes ("1.2M") are too coarse to verify against and are ignored.
            const std::string size = m[2].str();
            if (!entry.is_directory && size != "-")
            {
                entry.size = std::stoull(size);
            }
        }
    }

    std::vector<IndexEntry> parse_index_entries(const std::string& body)
    {
        static const std::regex anchor_re(
            R"(<a\s+[^>]*?href\s*=\s*["']([^"']*)["'][^>]*>)", std::regex::icase);
        static const std::regex close_re(R"(</a\s*>)", std::regex::icase);

        std::vector<IndexEntry> entries;
        auto begin = std::sregex_iterator(body.begin(), body.end(), anchor_re);
        for (auto it = begin; it != std::sregex_iterator(); ++it)
        {
            const std::smatch& match = *it;
            std::string href = match[1].str();

            if (href.empty() || href[0] == '?' || href[0] == '#' || href[0] == '/'
                || starts_with(href, "../") || href == ".." || href == "./" || has_scheme(href)
                || starts_with(href, "mailto:") || starts_with(href, "javascript:"))
            {
                continue;
            }
            if (starts_with(href, "./"))
            {
                href = href.substr(2);
            }

            IndexEntry entry;
            entry.is_directory = ends_with(href, "/");
            entry.href = href;

            // The size and date follow the closing tag, up to the end of the line.
            const auto after = static_cast<std::size_t>(match.position(0) + match.length(0));
            std::string rest = body.substr(after, 512);
            std::smatch close;
            if (std::regex_search(rest, close, close_re))
            {
                rest = rest.substr(static_cast<std::size_t>(close.position(0) + close.length(0)));
                std::string trailer = rest.substr(0, rest.find('\n'));
                // Strip table markup so both plain and tabular indexes look the same.
                static const std::regex tag_re("<[^>]*>");
                trailer = std::regex_replace(trailer, tag_re, " ");
                parse_trailer(trailer, entry);
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::string HtmlIndexParser::listing_url(const std::string& base_url,
                                             const DatasetId& dataset) const
    {
        std::string url = base_url;
        if (!dataset.dump.empty())
        {
            url = join_url(url, dataset.dump);
        }
        if (!dataset.version.empty() && dataset.version != "latest")
        {
            url = join_url(url, dataset.version);
        }
        if (!ends_with(url, "/"))
        {
            url += '/';
        }
        return url;
    }

    tl::expected<ListingPage, Error> HtmlIndexParser::parse(const std::string& base_url,
                                                            const std::string& page_url,
                                                            const std::string& body,
                                                            const DatasetId&) const
    {
        if (!contains(to_lower(body), "<a "))
        {
            return tl::unexpected(Error{ ErrorLevel::SERIOUS,
                                         ErrorCode::DL_MANIFEST_PARSE,
                                         fmt::format("No index links found at {}", page_url) });
        }

        std::string root = base_url;
        if (!ends_with(root, "/"))
        {
            root += '/';
        }

        ListingPage page;
        for (auto& entry : parse_index_entries(body))
        {
            std::string url;
            try
            {
                url = resolve_url(page_url, entry.href);
            }
            catch (const std::runtime_error& e)
            {
                spdlog::warn("Skipping index link '{}': {}", entry.href, e.what());
                continue;
            }

            if (!starts_with(url, root))
            {
                spdlog::debug("Skipping index link {} outside of {}", url, root);
                continue;
            }

            if (entry.is_directory)
            {
                page.directories.push_back(url);
                continue;
            }

            RemoteFile file;
            file.path = url_decode(url.substr(root.size()));
            file.url = url.substr(root.size());
            if (file.url == file.path)
            {
                file.url.clear();
            }
            file.size = entry.size;
            file.last_modified = entry.last_modified;
            page.files.push_back(std::move(file));
        }
        return page;
    }

    tl::expected<DatasetId, Error> ListingParser::resolve(const std::string&,
                                                          const DatasetId& dataset,
                                                          const fetch_function&) const
    {
        return dataset;
    }

    std::shared_ptr<ListingParser> make_listing_parser(const std::string& format)
    {
        if (format == "dumpstatus")
        {
            return std::make_shared<DumpStatusParser>();
        }
        if (format == "html")
        {
            return std::make_shared<HtmlIndexParser>();
        }
        return nullptr;
    }
}
