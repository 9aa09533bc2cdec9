#ifndef DUMPLOADER_LISTING_HPP
#define DUMPLOADER_LISTING_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <dumploader/export.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/manifest.hpp>

namespace dumploader
{
    // Retrieves the body at an URL, errors are `DL_MANIFEST_UNAVAILABLE`.
    using fetch_function = std::function<tl::expected<std::string, Error>(const std::string&)>;

    // What one listing document contains.
    struct ListingPage
    {
        std::vector<RemoteFile> files;
        // Absolute URLs of nested listings (sub directories).
        std::vector<std::string> directories;
        // Absolute URL of the next page of a paginated listing.
        std::optional<std::string> next_page;
    };

    // Strategy turning the listing documents of one mirror format into RemoteFiles.
    class DUMPLOADER_API ListingParser
    {
    public:
        virtual ~ListingParser() = default;

        virtual const char* name() const = 0;

        // Replaces symbolic parts of `dataset` (e.g. version "latest") by concrete values.
        virtual tl::expected<DatasetId, Error> resolve(const std::string& base_url,
                                                       const DatasetId& dataset,
                                                       const fetch_function& fetch) const;

        // URL of the first listing document of `dataset`.
        virtual std::string listing_url(const std::string& base_url,
                                        const DatasetId& dataset) const = 0;

        // Parses the document found at `page_url`. File paths are made relative to `base_url`.
        virtual tl::expected<ListingPage, Error> parse(const std::string& base_url,
                                                       const std::string& page_url,
                                                       const std::string& body,
                                                       const DatasetId& dataset) const = 0;
    };

    // Wikimedia dumps: `{base}/{dump}/{version}/dumpstatus.json` describes every job of a dump
    // version with the size, checksums and location of each of its files.
    class DUMPLOADER_API DumpStatusParser : public ListingParser
    {
    public:
        const char* name() const override
        {
            return "dumpstatus";
        }

        // "latest" becomes the newest version whose job is done.
        tl::expected<DatasetId, Error> resolve(const std::string& base_url,
                                               const DatasetId& dataset,
                                               const fetch_function& fetch) const override;

        std::string listing_url(const std::string& base_url,
                                const DatasetId& dataset) const override;

        tl::expected<ListingPage, Error> parse(const std::string& base_url,
                                               const std::string& page_url,
                                               const std::string& body,
                                               const DatasetId& dataset) const override;

        // Status of `job` in a dumpstatus document, or nothing if it can't be read.
        static std::optional<std::string> job_status(const std::string& body,
                                                     const std::string& job);
    };

    // Apache / nginx autoindex pages.
    class DUMPLOADER_API HtmlIndexParser : public ListingParser
    {
    public:
        const char* name() const override
        {
            return "html";
        }

        // `{base}/{dump}/{version}/`, empty parts and version "latest" are left out.
        std::string listing_url(const std::string& base_url,
                                const DatasetId& dataset) const override;

        tl::expected<ListingPage, Error> parse(const std::string& base_url,
                                               const std::string& page_url,
                                               const std::string& body,
                                               const DatasetId& dataset) const override;
    };

    // One link of an autoindex page.
    struct IndexEntry
    {
        std::string href;
        bool is_directory = false;
        std::optional<std::uintmax_t> size;
        std::optional<file_time_point> last_modified;
    };

    // Links of an autoindex page, without sort, parent or absolute links.
    DUMPLOADER_API std::vector<IndexEntry> parse_index_entries(const std::string& body);

    // "dumpstatus" or "html", nullptr for unknown names.
    DUMPLOADER_API std::shared_ptr<ListingParser> make_listing_parser(const std::string& format);
}

#endif
