#include <deque>
#include <set>

#include <spdlog/spdlog.h>

#include <dumploader/context.hpp>
#include <dumploader/manifest_fetcher.hpp>
#include <dumploader/utils.hpp>

#include "curl_internal.hpp"

namespace dumploader
{
    ManifestFetcher::ManifestFetcher(const Context& ctx, std::shared_ptr<ListingParser> parser)
        : ManifestFetcher(std::move(parser), curl_fetcher(ctx))
    {
    }

    ManifestFetcher::ManifestFetcher(std::shared_ptr<ListingParser> parser, fetch_function fetch)
        : m_parser(std::move(parser))
        , m_fetch(std::move(fetch))
    {
        if (!m_parser)
        {
            throw std::invalid_argument("ManifestFetcher needs a listing parser");
        }
    }

    void ManifestFetcher::set_file_name_filter(std::optional<std::regex> regex)
    {
        m_file_name_filter = std::move(regex);
    }

    void ManifestFetcher::set_max_pages(std::size_t max_pages)
    {
        m_max_pages = max_pages;
    }

    fetch_function ManifestFetcher::curl_fetcher(const Context& ctx)
    {
        return [&ctx](const std::string& url) -> tl::expected<std::string, Error>
        {
            spdlog::debug("Fetching listing {}", url);
            try
            {
                CURLHandle handle(ctx, url);
                handle.accept_encoding().max_body_size(ctx.max_listing_size);
                Response response = handle.perform();
                if (!response.ok())
                {
                    return tl::unexpected(
                        Error{ ErrorLevel::SERIOUS,
                               ErrorCode::DL_MANIFEST_UNAVAILABLE,
                               fmt::format("HTTP {} for {}", response.http_status, url) });
                }
                return response.content;
            }
            catch (const curl_error& e)
            {
                return tl::unexpected(Error{ ErrorLevel::SERIOUS,
                                             ErrorCode::DL_MANIFEST_UNAVAILABLE,
                                             fmt::format("Could not fetch {}: {}", url, e.what()) });
            }
        };
    }

    tl::expected<Manifest, Error> ManifestFetcher::fetch(const std::string& base_url,
                                                         const DatasetId& dataset) const
    {
        auto resolved = m_parser->resolve(base_url, dataset, m_fetch);
        if (!resolved)
        {
            return tl::unexpected(resolved.error());
        }

        Manifest manifest(resolved.value());

        std::deque<std::string> queue{ m_parser->listing_url(base_url, resolved.value()) };
        std::set<std::string> visited;
        std::size_t pages = 0;

        while (!queue.empty())
        {
            std::string url = queue.front();
            queue.pop_front();
            if (!visited.insert(url).second)
            {
                continue;
            }

            if (++pages > m_max_pages)
            {
                return tl::unexpected(
                    Error{ ErrorLevel::SERIOUS,
                           ErrorCode::DL_MANIFEST_PARSE,
                           fmt::format("Listing of {} has more than {} pages",
                                       base_url,
                                       m_max_pages) });
            }

            auto body = m_fetch(url);
            if (!body)
            {
                return tl::unexpected(body.error());
            }

            auto page = m_parser->parse(base_url, url, body.value(), resolved.value());
            if (!page)
            {
                return tl::unexpected(page.error());
            }

            for (auto& file : page->files)
            {
                if (!is_safe_relative_path(file.path))
                {
                    spdlog::warn("Rejecting unsafe path '{}' from {}", file.path, url);
                    continue;
                }
                if (m_file_name_filter && !std::regex_search(file.name(), *m_file_name_filter))
                {
                    spdlog::trace("File {} filtered out", file.path);
                    continue;
                }
                const std::string path = file.path;
                if (!manifest.add(std::move(file)))
                {
                    spdlog::debug("Duplicate listing entry {} from {} ignored", path, url);
                }
            }

            if (page->next_page)
            {
                queue.push_front(page->next_page.value());
            }
            for (auto& dir : page->directories)
            {
                queue.push_back(dir);
            }
        }

        spdlog::info("Manifest of {} has {} files ({})",
                     resolved->to_string(),
                     manifest.size(),
                     format_bytes(manifest.total_size()));

        if (manifest.empty())
        {
            return tl::unexpected(
                Error{ ErrorLevel::INFO,
                       ErrorCode::DL_MANIFEST_EMPTY,
                       fmt::format("Listing of {} has no files", resolved->to_string()) });
        }
        return manifest;
    }
}
