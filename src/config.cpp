#include <regex>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <dumploader/config.hpp>
#include <dumploader/context.hpp>
#include <dumploader/listing.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/url.hpp>

namespace dumploader
{
    namespace
    {
        Error config_error(const std::string& reason)
        {
            return Error{ ErrorLevel::FATAL, ErrorCode::DL_CONFIG, reason };
        }

        bool is_dump_version(const std::string& version)
        {
            static const std::regex version_regex("^[0-9]{8}$");
            return version == "latest" || std::regex_match(version, version_regex);
        }
    }

    const std::string& RunConfig::primary_mirror() const
    {
        return mirror_urls.empty() ? metadata_url : mirror_urls.front();
    }

    fs::path RunConfig::resolved_state_path() const
    {
        return state_path.empty() ? StateStore::default_path(out_dir) : state_path;
    }

    tl::expected<void, Error> RunConfig::validate() const
    {
        if (out_dir.empty())
        {
            return tl::unexpected(config_error("No output directory given"));
        }
        if (!has_scheme(metadata_url))
        {
            return tl::unexpected(
                config_error(fmt::format("Metadata URL '{}' has no scheme", metadata_url)));
        }
        for (const auto& mirror : mirror_urls)
        {
            if (!has_scheme(mirror))
            {
                return tl::unexpected(
                    config_error(fmt::format("Mirror URL '{}' has no scheme", mirror)));
            }
        }
        if (dataset.dump.empty() || dataset.job.empty())
        {
            return tl::unexpected(config_error("Dump and job names must not be empty"));
        }
        if (!is_dump_version(dataset.version))
        {
            return tl::unexpected(config_error(fmt::format(
                "Version '{}' should be 'latest' or 8 digits (e.g. 20240101)", dataset.version)));
        }
        if (!make_listing_parser(listing_format))
        {
            return tl::unexpected(
                config_error(fmt::format("Unknown listing format '{}'", listing_format)));
        }
        if (!file_name_regex.empty())
        {
            try
            {
                std::regex re(file_name_regex);
            }
            catch (const std::regex_error& e)
            {
                return tl::unexpected(config_error(
                    fmt::format("Invalid file name regex '{}': {}", file_name_regex, e.what())));
            }
        }
        if (concurrency < 1)
        {
            return tl::unexpected(config_error("Concurrency must be at least 1"));
        }
        if (retry_limit < 1)
        {
            return tl::unexpected(config_error("Retry limit must be at least 1"));
        }
        if (!log_level.empty() && spdlog::level::from_str(log_level) == spdlog::level::off
            && log_level != "off")
        {
            return tl::unexpected(config_error(fmt::format("Unknown log level '{}'", log_level)));
        }
        return {};
    }

    void RunConfig::apply(Context& ctx) const
    {
        ctx.max_parallel_downloads = concurrency;
        ctx.retry_limit = retry_limit;
        ctx.disable_ssl = disable_ssl;
        if (!log_level.empty())
        {
            ctx.set_log_level(spdlog::level::from_str(log_level));
        }
        else
        {
            ctx.set_verbosity(verbosity);
        }
    }

    tl::expected<void, Error> load_config_file(const fs::path& path, RunConfig& config)
    {
        spdlog::info("Loading file {}", path.string());
        try
        {
            YAML::Node node = YAML::LoadFile(path.string());
            if (node.IsNull())
            {
                return {};
            }
            if (!node.IsMap())
            {
                return tl::unexpected(config_error(
                    fmt::format("{}: expected a mapping at the top level", path.string())));
            }

            for (YAML::const_iterator it = node.begin(); it != node.end(); ++it)
            {
                const std::string key = it->first.as<std::string>();
                const YAML::Node& value = it->second;

                if (key == "metadata_url")
                    config.metadata_url = value.as<std::string>();
                else if (key == "mirror_url")
                    config.mirror_urls = { value.as<std::string>() };
                else if (key == "mirrors")
                    config.mirror_urls = value.as<std::vector<std::string>>();
                else if (key == "out_dir")
                    config.out_dir = value.as<std::string>();
                else if (key == "state_path")
                    config.state_path = value.as<std::string>();
                else if (key == "dump")
                    config.dataset.dump = value.as<std::string>();
                else if (key == "version")
                    config.dataset.version = value.as<std::string>();
                else if (key == "job")
                    config.dataset.job = value.as<std::string>();
                else if (key == "listing_format")
                    config.listing_format = value.as<std::string>();
                else if (key == "file_name_regex")
                    config.file_name_regex = value.as<std::string>();
                else if (key == "dry_run")
                    config.dry_run = value.as<bool>();
                else if (key == "allow_empty_manifest")
                    config.allow_empty_manifest = value.as<bool>();
                else if (key == "allowed_failures")
                    config.allowed_failures = value.as<std::vector<std::string>>();
                else if (key == "concurrency")
                    config.concurrency = value.as<long>();
                else if (key == "retry_limit")
                    config.retry_limit = value.as<std::size_t>();
                else if (key == "disable_ssl")
                    config.disable_ssl = value.as<bool>();
                else if (key == "verbosity")
                    config.verbosity = value.as<int>();
                else if (key == "log_level")
                    config.log_level = value.as<std::string>();
                else if (key == "json")
                    config.json = value.as<bool>();
                else
                    spdlog::warn("{}: ignoring unknown key '{}'", path.string(), key);
            }
        }
        catch (const YAML::Exception& e)
        {
            return tl::unexpected(
                config_error(fmt::format("Could not read {}: {}", path.string(), e.what())));
        }
        return {};
    }
}
