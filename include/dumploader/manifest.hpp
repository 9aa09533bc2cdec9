#ifndef DUMPLOADER_MANIFEST_HPP
#define DUMPLOADER_MANIFEST_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>

namespace dumploader
{
    using file_time_point = std::chrono::system_clock::time_point;

    // One file announced by a remote listing.
    struct DUMPLOADER_API RemoteFile
    {
        // Identity: path relative to the mirror root, also the path under the output directory.
        std::string path;
        // Location relative to the mirror root (or absolute URL) when it differs from `path`.
        std::string url;

        std::optional<std::uintmax_t> size;
        std::optional<Checksum> checksum;
        std::optional<file_time_point> last_modified;

        const std::string& location() const
        {
            return url.empty() ? path : url;
        }

        // File name part of `path`.
        std::string name() const;
    };

    // Which dataset a manifest describes, e.g. { "enwiki", "20230301", "articlesdump" }.
    struct DUMPLOADER_API DatasetId
    {
        std::string dump;
        std::string version = "latest";
        std::string job;

        std::string to_string() const;
    };

    // Point in time snapshot of the remote files of a dataset, ordered by insertion and keyed
    // by path.
    class DUMPLOADER_API Manifest
    {
    public:
        using const_iterator = std::vector<RemoteFile>::const_iterator;

        Manifest() = default;
        explicit Manifest(DatasetId dataset);

        // Returns false (and keeps the first entry) if `file.path` is already present.
        bool add(RemoteFile file);

        const RemoteFile* find(const std::string& path) const;
        bool contains(const std::string& path) const;

        const std::vector<RemoteFile>& files() const
        {
            return m_files;
        }

        std::size_t size() const
        {
            return m_files.size();
        }

        bool empty() const
        {
            return m_files.empty();
        }

        const_iterator begin() const
        {
            return m_files.begin();
        }

        const_iterator end() const
        {
            return m_files.end();
        }

        const DatasetId& dataset() const
        {
            return m_dataset;
        }

        void set_dataset(DatasetId dataset)
        {
            m_dataset = std::move(dataset);
        }

        // Sum of the known sizes.
        std::uintmax_t total_size() const;

    private:
        DatasetId m_dataset;
        std::vector<RemoteFile> m_files;
        std::map<std::string, std::size_t> m_index;
    };

    // Parses "2023-03-04 05:06:07" (listing timestamps are UTC).
    DUMPLOADER_API std::optional<file_time_point> parse_utc_timestamp(const std::string& str);
    DUMPLOADER_API std::string format_utc_timestamp(file_time_point tp);
}

#endif
