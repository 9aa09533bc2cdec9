#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <dumploader/listing.hpp>
#include <dumploader/url.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    namespace
    {
        bool is_version_directory(const std::string& name)
        {
            return name.size() == 8
                   && std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; });
        }

        Error parse_error(const std::string& reason)
        {
            return Error{ ErrorLevel::SERIOUS, ErrorCode::DL_MANIFEST_PARSE, reason };
        }
    }

    std::string DumpStatusParser::listing_url(const std::string& base_url,
                                              const DatasetId& dataset) const
    {
        return join_url(base_url, dataset.dump, dataset.version, "dumpstatus.json");
    }

    std::optional<std::string> DumpStatusParser::job_status(const std::string& body,
                                                            const std::string& job)
    {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            return std::nullopt;
        }
        auto jobs = j.find("jobs");
        if (jobs == j.end() || !jobs->is_object())
        {
            return std::nullopt;
        }
        auto it = jobs->find(job);
        if (it == jobs->end() || !it->is_object())
        {
            return std::nullopt;
        }
        return it->value("status", std::string());
    }

    tl::expected<DatasetId, Error> DumpStatusParser::resolve(const std::string& base_url,
                                                             const DatasetId& dataset,
                                                             const fetch_function& fetch) const
    {
        if (dataset.version != "latest")
        {
            if (!is_version_directory(dataset.version))
            {
                return tl::unexpected(Error{
                    ErrorLevel::FATAL,
                    ErrorCode::DL_CONFIG,
                    fmt::format("Version '{}' must be 8 digits or \"latest\"", dataset.version) });
            }
            return dataset;
        }

        const std::string index_url = join_url(base_url, dataset.dump) + "/";
        auto index = fetch(index_url);
        if (!index)
        {
            return tl::unexpected(index.error());
        }

        std::vector<std::string> versions;
        for (const auto& entry : parse_index_entries(index.value()))
        {
            std::string name = entry.href;
            if (ends_with(name, "/"))
            {
                name.pop_back();
            }
            if (entry.is_directory && is_version_directory(name))
            {
                versions.push_back(name);
            }
        }
        std::sort(versions.begin(), versions.end(), std::greater<>());
        spdlog::debug("Found {} versions of {} at {}", versions.size(), dataset.dump, index_url);

        for (const auto& version : versions)
        {
            DatasetId candidate = dataset;
            candidate.version = version;
            auto status_doc = fetch(listing_url(base_url, candidate));
            if (!status_doc)
            {
                spdlog::debug("Skipping version {}: {}", version, status_doc.error().reason);
                continue;
            }
            auto status = job_status(status_doc.value(), dataset.job);
            if (status && *status == "done")
            {
                spdlog::info("Resolved latest version of {} to {}", dataset.dump, version);
                return candidate;
            }
            spdlog::debug("Skipping version {}: job {} is {}",
                          version,
                          dataset.job,
                          status.value_or("missing"));
        }

        return tl::unexpected(
            Error{ ErrorLevel::SERIOUS,
                   ErrorCode::DL_MANIFEST_UNAVAILABLE,
                   fmt::format("No version of {} has a finished {} job", dataset.dump, dataset.job) });
    }

    tl::expected<ListingPage, Error> DumpStatusParser::parse(const std::string&,
                                                             const std::string& page_url,
                                                             const std::string& body,
                                                             const DatasetId& dataset) const
    {
        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return tl::unexpected(
                parse_error(fmt::format("Could not parse JSON from {}: {}", page_url, e.what())));
        }

        if (!j.is_object() || !j.contains("jobs") || !j["jobs"].is_object())
        {
            return tl::unexpected(parse_error(fmt::format("No jobs in {}", page_url)));
        }

        const auto& jobs = j["jobs"];
        auto job_it = jobs.find(dataset.job);
        if (job_it == jobs.end() || !job_it->is_object())
        {
            return tl::unexpected(
                parse_error(fmt::format("Job '{}' not found in {}", dataset.job, page_url)));
        }

        const auto& job = *job_it;
        const std::string status = job.value("status", std::string());
        if (status != "done")
        {
            spdlog::warn("Job {} of {} is not done (status '{}')",
                         dataset.job,
                         dataset.version,
                         status);
        }

        std::optional<file_time_point> updated;
        if (job.contains("updated") && job["updated"].is_string())
        {
            updated = parse_utc_timestamp(job["updated"].get<std::string>());
        }

        ListingPage page;
        if (!job.contains("files"))
        {
            return page;
        }
        if (!job["files"].is_object())
        {
            return tl::unexpected(
                parse_error(fmt::format("Files of job '{}' are not an object", dataset.job)));
        }

        try
        {
            for (const auto& [name, meta] : job["files"].items())
            {
                if (!meta.is_object() || !meta.contains("url"))
                {
                    spdlog::debug("File {} has no URL yet, skipping", name);
                    continue;
                }

                RemoteFile file;
                file.url = meta["url"].get<std::string>();
                std::size_t start = 0;
                while (start < file.url.size() && file.url[start] == '/')
                {
                    ++start;
                }
                file.path = url_decode(file.url.substr(start));

                if (meta.contains("size"))
                {
                    file.size = meta["size"].get<std::uintmax_t>();
                }
                if (meta.contains("sha1"))
                {
                    file.checksum = Checksum{ ChecksumType::kSHA1,
                                              to_lower(meta["sha1"].get<std::string>()) };
                }
                else if (meta.contains("md5"))
                {
                    file.checksum = Checksum{ ChecksumType::kMD5,
                                              to_lower(meta["md5"].get<std::string>()) };
                }
                file.last_modified = updated;
                page.files.push_back(std::move(file));
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::unexpected(parse_error(
                fmt::format("Bad file entry in job '{}' of {}: {}", dataset.job, page_url, e.what())));
        }

        return page;
    }
}
