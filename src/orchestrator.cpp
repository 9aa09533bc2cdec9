#include <algorithm>
#include <regex>

#include <spdlog/spdlog.h>

#include <dumploader/context.hpp>
#include <dumploader/manifest_fetcher.hpp>
#include <dumploader/mirror.hpp>
#include <dumploader/orchestrator.hpp>
#include <dumploader/planner.hpp>
#include <dumploader/state_store.hpp>
#include <dumploader/transfer_engine.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    namespace
    {
        // Checksum of a complete local file if it matches what the listing announces.
        std::optional<Checksum> verify_existing(const RemoteFile& remote,
                                                const fs::path& file,
                                                std::uintmax_t size)
        {
            if (remote.size && remote.size.value() != size)
            {
                return std::nullopt;
            }
            if (remote.checksum)
            {
                Checksum computed{ remote.checksum->type,
                                   checksum_file(file, remote.checksum->type) };
                if (computed.checksum.empty()
                    || computed.checksum != to_lower(remote.checksum->checksum))
                {
                    return std::nullopt;
                }
                return computed;
            }
            if (!remote.size)
            {
                // Nothing to compare with.
                return std::nullopt;
            }
            return Checksum{ ChecksumType::kSHA256,
                             checksum_file(file, ChecksumType::kSHA256) };
        }
    }

    Orchestrator::Orchestrator(const Context& ctx, RunConfig config)
        : m_ctx(ctx)
        , m_config(std::move(config))
        , m_fetch(ManifestFetcher::curl_fetcher(ctx))
    {
    }

    void Orchestrator::set_fetch_function(fetch_function fetch)
    {
        m_fetch = std::move(fetch);
    }

    tl::expected<Manifest, Error> Orchestrator::fetch_manifest() const
    {
        auto parser = make_listing_parser(m_config.listing_format);
        if (!parser)
        {
            return tl::unexpected(
                Error{ ErrorLevel::FATAL,
                       ErrorCode::DL_CONFIG,
                       fmt::format("Unknown listing format '{}'", m_config.listing_format) });
        }

        ManifestFetcher fetcher(parser, m_fetch);
        if (!m_config.file_name_regex.empty())
        {
            fetcher.set_file_name_filter(std::regex(m_config.file_name_regex));
        }

        spdlog::info("Fetching the {} listing of {} from {}",
                     parser->name(),
                     m_config.dataset.to_string(),
                     m_config.metadata_url);
        return fetcher.fetch(m_config.metadata_url, m_config.dataset);
    }

    tl::expected<std::size_t, Error> Orchestrator::reconcile(const Manifest& manifest,
                                                             StateStore& store) const
    {
        PlannerOptions options;
        options.out_dir = m_config.out_dir;
        options.state_path = store.path();

        std::size_t adopted = 0;
        for (const auto& remote : manifest)
        {
            auto destination = resolve_under(m_config.out_dir, remote.path);
            if (!destination || reserved_destination(remote.path, destination.value(), options))
            {
                continue;
            }

            std::error_code ec;
            const bool exists = fs::is_regular_file(destination.value(), ec);
            const std::uintmax_t size = exists ? fs::file_size(destination.value(), ec) : 0;
            auto state = store.get(remote.path);

            if (state && state->status == FileStatus::kVERIFIED)
            {
                if (!exists || ec || (state->size && state->size.value() != size))
                {
                    spdlog::warn("Verified file {} is missing or changed on disk, downloading it again",
                                 remote.path);
                    auto reset = store.reset_to_pending(remote.path);
                    if (!reset)
                    {
                        return tl::unexpected(reset.error());
                    }
                }
                continue;
            }

            if (state || !exists || ec)
            {
                continue;
            }

            auto computed = verify_existing(remote, destination.value(), size);
            if (!computed)
            {
                spdlog::info("Existing file {} does not match the listing, downloading it again",
                             remote.path);
                continue;
            }

            spdlog::info("Existing file {} is complete", remote.path);
            auto begun = store.begin_transfer(remote.path);
            if (!begun)
            {
                return tl::unexpected(begun.error());
            }
            auto marked = store.mark_verified(
                remote.path, computed.value(), size, remote.last_modified);
            if (!marked)
            {
                return tl::unexpected(marked.error());
            }
            ++adopted;
        }
        return adopted;
    }

    tl::expected<RunSummary, Error> Orchestrator::run()
    {
        const auto start = std::chrono::steady_clock::now();

        auto valid = m_config.validate();
        if (!valid)
        {
            return tl::unexpected(valid.error());
        }

        RunSummary summary;
        summary.dataset = m_config.dataset;
        summary.dry_run = m_config.dry_run;

        auto manifest = fetch_manifest();
        if (!manifest)
        {
            if (manifest.error().code != ErrorCode::DL_MANIFEST_EMPTY
                || !m_config.allow_empty_manifest)
            {
                return tl::unexpected(manifest.error());
            }
            spdlog::warn("The listing of {} has no files, nothing to do",
                         m_config.dataset.to_string());
            summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            return summary;
        }

        summary.dataset = manifest->dataset();
        summary.manifest_files = manifest->size();

        StateStore store(m_config.resolved_state_path());
        auto loaded = store.load();
        if (!loaded)
        {
            return tl::unexpected(loaded.error());
        }
        if (store.corrupted_entries() > 0)
        {
            spdlog::warn("{} state entries could not be read and were reset",
                         store.corrupted_entries());
        }

        auto adopted = reconcile(manifest.value(), store);
        if (!adopted)
        {
            return tl::unexpected(adopted.error());
        }
        summary.adopted = adopted.value();

        PlannerOptions planner_options;
        planner_options.mirror_url = m_config.primary_mirror();
        planner_options.out_dir = m_config.out_dir;
        planner_options.state_path = store.path();
        Plan plan = dumploader::plan(manifest.value(), store.snapshot(), planner_options);
        summary.planned = plan.tasks.size();
        summary.planned_bytes = plan.planned_bytes();
        summary.up_to_date = plan.up_to_date.size();

        for (const auto& [path, reason] : plan.rejected)
        {
            spdlog::error("Skipping {}: {}", path, reason);
            summary.failures.push_back(FailedFile{ path, reason, false });
            summary.failed++;
        }

        if (m_config.dry_run)
        {
            for (const auto& task : plan.tasks)
            {
                spdlog::info("Would download {} from offset {}", task.source_url, task.resume_offset);
            }
        }
        else if (!plan.tasks.empty())
        {
            for (const auto& path : plan.reset_to_pending)
            {
                spdlog::info("Remote file {} changed, downloading it again", path);
                auto reset = store.reset_to_pending(path);
                if (!reset)
                {
                    return tl::unexpected(reset.error());
                }
            }

            mirror_list mirrors;
            if (m_config.mirror_urls.size() > 1)
            {
                for (const auto& url : m_config.mirror_urls)
                {
                    mirrors.push_back(std::make_shared<Mirror>(m_ctx, url));
                }
            }

            try
            {
                TransferEngine engine(m_ctx, store, std::move(mirrors));
                summary.outcomes = engine.run(plan.tasks);
            }
            catch (const std::runtime_error& e)
            {
                return tl::unexpected(Error{ ErrorLevel::FATAL, ErrorCode::DL_IO, e.what() });
            }
        }

        std::uintmax_t downloaded_bytes = 0;
        for (const auto& outcome : summary.outcomes)
        {
            summary.bytes_transferred += outcome.bytes_transferred;
            switch (outcome.status)
            {
                case TransferStatus::kSUCCESSFUL:
                    summary.succeeded++;
                    downloaded_bytes += outcome.size;
                    break;
                case TransferStatus::kFAILED:
                {
                    const bool allowed
                        = std::find(m_config.allowed_failures.begin(),
                                    m_config.allowed_failures.end(),
                                    outcome.path)
                          != m_config.allowed_failures.end();
                    summary.failures.push_back(FailedFile{
                        outcome.path, outcome.error ? outcome.error->to_string() : "", allowed });
                    summary.failed++;
                    break;
                }
                case TransferStatus::kINTERRUPTED:
                case TransferStatus::kNOT_STARTED:
                    summary.incomplete++;
                    break;
            }
        }
        summary.interrupted = is_sig_interrupted();

        std::uintmax_t existing_bytes = 0;
        for (const auto& path : plan.up_to_date)
        {
            if (const RemoteFile* remote = manifest->find(path))
            {
                existing_bytes += remote->size.value_or(0);
            }
        }

        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        spdlog::info("Downloaded {}/{} files ({}), {} files already up to date ({}) in {} ms",
                     summary.succeeded,
                     summary.planned,
                     format_bytes(downloaded_bytes),
                     summary.up_to_date,
                     format_bytes(existing_bytes),
                     summary.elapsed.count());
        return summary;
    }
}
