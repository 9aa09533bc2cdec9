#ifndef DUMPLOADER_CONFIG_HPP
#define DUMPLOADER_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <dumploader/export.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/manifest.hpp>

namespace dumploader
{
    namespace fs = std::filesystem;

    class Context;

    // Everything one Orchestrator run needs to know, passed explicitly instead of being read
    // from the environment.
    struct DUMPLOADER_API RunConfig
    {
        // Where the listing documents are read from.
        std::string metadata_url = "https://dumps.wikimedia.org";
        // Where the files are downloaded from, in order of preference. Empty means
        // `metadata_url`.
        std::vector<std::string> mirror_urls;
        fs::path out_dir;
        // Empty means `StateStore::default_path(out_dir)`.
        fs::path state_path;

        DatasetId dataset{ "enwiki", "latest", "metacurrentdumprecombine" };
        // "dumpstatus" or "html"
        std::string listing_format = "dumpstatus";
        // ECMAScript regex searched in file names, empty keeps every file.
        std::string file_name_regex;

        bool dry_run = false;
        bool allow_empty_manifest = false;
        // Relative paths whose failure does not fail the run.
        std::vector<std::string> allowed_failures;

        long concurrency = 3;
        std::size_t retry_limit = 3;
        bool disable_ssl = false;
        int verbosity = 0;
        // spdlog level name, takes precedence over `verbosity` when set.
        std::string log_level;
        bool json = false;

        const std::string& primary_mirror() const;
        fs::path resolved_state_path() const;

        // Checks every value that would otherwise fail late, errors are `DL_CONFIG`.
        tl::expected<void, Error> validate() const;

        // Copies the transfer settings to `ctx`.
        void apply(Context& ctx) const;
    };

    // Reads a YAML document (flat mapping, keys named like the RunConfig members) over
    // `config`. Keys missing from the document keep their current value.
    DUMPLOADER_API tl::expected<void, Error> load_config_file(const fs::path& path,
                                                              RunConfig& config);
}

#endif
