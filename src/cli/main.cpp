#include <algorithm>
#include <iostream>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <dumploader/dumploader.hpp>
#include <dumploader/utils.hpp>

using namespace dumploader;

namespace
{
    // Exit code of run level errors (manifest, state, configuration).
    constexpr int run_error_exit_code = 2;

    void print_summary(const RunSummary& summary, bool json)
    {
        if (json)
        {
            nlohmann::json j = summary;
            std::cout << j.dump(2) << std::endl;
        }
        else
        {
            std::cout << summary.to_text();
            std::cout.flush();
        }
    }
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Resumable, mirror aware downloader of dump datasets" };
    app.set_version_flag("--version-info", DUMPLOADER_VERSION_STRING);

    // Values are first read in a scratch RunConfig, then copied over the config file values
    // only when given on the command line or in the environment.
    RunConfig cli;
    std::string config_file, out_dir, state_path;
    int verbose = 0;

    app.add_option("-c,--config", config_file, "YAML file with default settings")
        ->check(CLI::ExistingFile);
    auto* o_out_dir = app.add_option("-o,--out-dir", out_dir, "Output directory")
                          ->envname("DUMPLOADER_OUT_DIR");
    auto* o_mirrors
        = app.add_option("-m,--mirror-url",
                         cli.mirror_urls,
                         "Base URL the files are downloaded from, repeat for fallback mirrors")
              ->envname("DUMPLOADER_MIRROR_URL");
    auto* o_metadata = app.add_option("--metadata-url",
                                      cli.metadata_url,
                                      "Base URL the listing documents are read from");
    auto* o_dump = app.add_option("--dump", cli.dataset.dump, "Dump name, e.g. enwiki")
                       ->envname("DUMPLOADER_DUMP");
    auto* o_version = app.add_option("--version",
                                     cli.dataset.version,
                                     "Dump version: 'latest' or a date such as 20240101");
    auto* o_job = app.add_option("--job", cli.dataset.job, "Dump job, e.g. metacurrentdumprecombine")
                      ->envname("DUMPLOADER_JOB");
    auto* o_format = app.add_option("--listing-format",
                                    cli.listing_format,
                                    "Listing format of the metadata URL")
                         ->check(CLI::IsMember({ "dumpstatus", "html" }));
    auto* o_regex = app.add_option("--file-name-regex",
                                   cli.file_name_regex,
                                   "Only download files whose name matches this regex");
    auto* o_state = app.add_option("--state", state_path, "State file location");
    auto* o_concurrency = app.add_option("-j,--concurrency",
                                         cli.concurrency,
                                         "Maximum number of parallel transfers");
    auto* o_retries = app.add_option("--retry-limit",
                                     cli.retry_limit,
                                     "Maximum number of attempts per file");
    auto* o_allowed = app.add_option("--allow-failure",
                                     cli.allowed_failures,
                                     "Relative path whose failure does not fail the run");
    auto* o_dry_run = app.add_flag("-n,--dry-run", cli.dry_run, "Plan only, transfer nothing");
    auto* o_allow_empty = app.add_flag("--allow-empty",
                                       cli.allow_empty_manifest,
                                       "Do not fail when the listing has no files");
    auto* o_json = app.add_flag("--json", cli.json, "Print the summary as JSON");
    auto* o_ssl = app.add_flag("-k", cli.disable_ssl, "Disable SSL verification");
    auto* o_verbose = app.add_flag("-v,--verbose", verbose, "Increase verbosity (repeatable)");
    auto* o_log_level = app.add_option("--log-level",
                                       cli.log_level,
                                       "Log level (trace, debug, info, warn, error, critical, off)")
                            ->envname("DUMPLOADER_LOG");

    CLI11_PARSE(app, argc, argv);

    std::unique_ptr<Context> ctx;
    try
    {
        ctx = std::make_unique<Context>();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Could not initialize: {}", e.what());
        return run_error_exit_code;
    }

    RunConfig config;
    if (!config_file.empty())
    {
        auto loaded = load_config_file(config_file, config);
        if (!loaded)
        {
            loaded.error().log();
            return run_error_exit_code;
        }
    }

    if (*o_out_dir)
        config.out_dir = out_dir;
    if (*o_mirrors)
        config.mirror_urls = cli.mirror_urls;
    if (*o_metadata)
        config.metadata_url = cli.metadata_url;
    if (*o_dump)
        config.dataset.dump = cli.dataset.dump;
    if (*o_version)
        config.dataset.version = cli.dataset.version;
    if (*o_job)
        config.dataset.job = cli.dataset.job;
    if (*o_format)
        config.listing_format = cli.listing_format;
    if (*o_regex)
        config.file_name_regex = cli.file_name_regex;
    if (*o_state)
        config.state_path = state_path;
    if (*o_concurrency)
        config.concurrency = cli.concurrency;
    if (*o_retries)
        config.retry_limit = cli.retry_limit;
    if (*o_allowed)
        config.allowed_failures = cli.allowed_failures;
    if (*o_dry_run)
        config.dry_run = cli.dry_run;
    if (*o_allow_empty)
        config.allow_empty_manifest = cli.allow_empty_manifest;
    if (*o_json)
        config.json = cli.json;
    if (*o_ssl)
        config.disable_ssl = cli.disable_ssl;
    if (*o_verbose)
        config.verbosity = verbose;
    if (*o_log_level)
        config.log_level = cli.log_level;

    auto valid = config.validate();
    if (!valid)
    {
        valid.error().log();
        return run_error_exit_code;
    }
    config.apply(*ctx);

    install_interrupt_handlers();

    Orchestrator orchestrator(*ctx, config);
    tl::expected<RunSummary, Error> summary = tl::unexpected(Error{});
    try
    {
        summary = orchestrator.run();
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Run aborted: {}", e.what());
        return run_error_exit_code;
    }

    if (!summary)
    {
        summary.error().log();
        if (summary.error().code == ErrorCode::DL_INTERRUPTED || is_sig_interrupted())
        {
            return 130;
        }
        return run_error_exit_code;
    }

    print_summary(summary.value(), config.json);
    if (summary->interrupted)
    {
        spdlog::warn("Interrupted, run again to resume");
    }
    else if (!summary->ok())
    {
        spdlog::error("{} files failed", summary->failed);
    }
    return summary->exit_code();
}
