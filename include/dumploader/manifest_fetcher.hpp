#ifndef DUMPLOADER_MANIFEST_FETCHER_HPP
#define DUMPLOADER_MANIFEST_FETCHER_HPP

#include <memory>
#include <optional>
#include <regex>
#include <string>

#include <tl/expected.hpp>

#include <dumploader/export.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/listing.hpp>
#include <dumploader/manifest.hpp>

namespace dumploader
{
    class Context;

    // Builds a flat Manifest out of a (possibly nested or paginated) remote listing.
    class DUMPLOADER_API ManifestFetcher
    {
    public:
        ManifestFetcher(const Context& ctx, std::shared_ptr<ListingParser> parser);
        ManifestFetcher(std::shared_ptr<ListingParser> parser, fetch_function fetch);

        // Only files whose name matches `regex` are kept.
        void set_file_name_filter(std::optional<std::regex> regex);

        // Upper bound on listing documents read during one fetch.
        void set_max_pages(std::size_t max_pages);

        tl::expected<Manifest, Error> fetch(const std::string& base_url,
                                            const DatasetId& dataset) const;

        // Blocking GET of the whole body with the transport settings of `ctx`.
        static fetch_function curl_fetcher(const Context& ctx);

    private:
        std::shared_ptr<ListingParser> m_parser;
        fetch_function m_fetch;
        std::optional<std::regex> m_file_name_filter;
        std::size_t m_max_pages = 10000;
    };
}

#endif
