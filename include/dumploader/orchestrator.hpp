#ifndef DUMPLOADER_ORCHESTRATOR_HPP
#define DUMPLOADER_ORCHESTRATOR_HPP

#include <tl/expected.hpp>

#include <dumploader/export.hpp>
#include <dumploader/config.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/listing.hpp>
#include <dumploader/manifest.hpp>
#include <dumploader/run_summary.hpp>

namespace dumploader
{
    class Context;
    class StateStore;

    // One run: fetch the manifest, load the state, reconcile it with the files on disk, plan,
    // transfer (unless dry run) and summarize.
    class DUMPLOADER_API Orchestrator
    {
    public:
        Orchestrator(const Context& ctx, RunConfig config);

        // Replaces the HTTP client used for listing documents.
        void set_fetch_function(fetch_function fetch);

        // Errors are run level only (manifest, state or configuration), per file failures are
        // reported in the summary.
        tl::expected<RunSummary, Error> run();

        const RunConfig& config() const
        {
            return m_config;
        }

    private:
        tl::expected<Manifest, Error> fetch_manifest() const;

        // Resets Verified entries whose file is gone or changed size and adopts complete files
        // that have no state yet. Returns the number of adopted files.
        tl::expected<std::size_t, Error> reconcile(const Manifest& manifest,
                                                   StateStore& store) const;

        const Context& m_ctx;
        RunConfig m_config;
        fetch_function m_fetch;
    };
}

#endif
