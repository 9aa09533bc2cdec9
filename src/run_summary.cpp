#include <algorithm>
#include <sstream>

#include <fmt/format.h>

#include <dumploader/run_summary.hpp>

namespace dumploader
{
    namespace
    {
        const char* outcome_status(TransferStatus status)
        {
            switch (status)
            {
                case TransferStatus::kSUCCESSFUL:
                    return "succeeded";
                case TransferStatus::kFAILED:
                    return "failed";
                case TransferStatus::kINTERRUPTED:
                    return "interrupted";
                case TransferStatus::kNOT_STARTED:
                    return "not_started";
            }
            return "not_started";
        }
    }

    bool RunSummary::ok() const
    {
        return !interrupted
               && std::all_of(failures.begin(),
                              failures.end(),
                              [](const FailedFile& f) { return f.allowed; });
    }

    int RunSummary::exit_code() const
    {
        if (interrupted)
        {
            return 130;
        }
        return ok() ? 0 : 1;
    }

    std::string RunSummary::to_text() const
    {
        std::ostringstream out;
        out << "dump=" << dataset.dump << '\n';
        out << "version=" << dataset.version << '\n';
        out << "job=" << dataset.job << '\n';
        out << "dry_run=" << (dry_run ? "true" : "false") << '\n';
        out << "manifest_files=" << manifest_files << '\n';
        out << "planned=" << planned << '\n';
        out << "planned_bytes=" << planned_bytes << '\n';
        out << "succeeded=" << succeeded << '\n';
        out << "failed=" << failed << '\n';
        out << "up_to_date=" << up_to_date << '\n';
        out << "adopted=" << adopted << '\n';
        out << "incomplete=" << incomplete << '\n';
        out << "bytes_transferred=" << bytes_transferred << '\n';
        out << "interrupted=" << (interrupted ? "true" : "false") << '\n';
        out << "elapsed_ms=" << elapsed.count() << '\n';
        for (const auto& outcome : outcomes)
        {
            if (outcome.attempts > 1)
            {
                out << fmt::format("retried_path={} attempts={} status={}\n",
                                   outcome.path,
                                   outcome.attempts,
                                   outcome_status(outcome.status));
            }
        }
        for (const auto& failure : failures)
        {
            out << fmt::format("failed_path={} allowed={} reason={}\n",
                               failure.path,
                               failure.allowed ? "true" : "false",
                               failure.reason);
        }
        return out.str();
    }

    void to_json(nlohmann::json& j, const RunSummary& summary)
    {
        j = nlohmann::json{ { "dump", summary.dataset.dump },
                            { "version", summary.dataset.version },
                            { "job", summary.dataset.job },
                            { "dry_run", summary.dry_run },
                            { "manifest_files", summary.manifest_files },
                            { "planned", summary.planned },
                            { "planned_bytes", summary.planned_bytes },
                            { "succeeded", summary.succeeded },
                            { "failed", summary.failed },
                            { "up_to_date", summary.up_to_date },
                            { "adopted", summary.adopted },
                            { "incomplete", summary.incomplete },
                            { "bytes_transferred", summary.bytes_transferred },
                            { "interrupted", summary.interrupted },
                            { "elapsed_ms", summary.elapsed.count() } };

        nlohmann::json files = nlohmann::json::array();
        for (const auto& outcome : summary.outcomes)
        {
            nlohmann::json f{ { "path", outcome.path },
                              { "status", outcome_status(outcome.status) },
                              { "attempts", outcome.attempts },
                              { "bytes_transferred", outcome.bytes_transferred } };
            if (outcome.status == TransferStatus::kSUCCESSFUL)
            {
                f["size"] = outcome.size;
            }
            if (outcome.error)
            {
                f["error"] = outcome.error->to_string();
            }
            files.push_back(std::move(f));
        }
        j["files"] = std::move(files);

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& failure : summary.failures)
        {
            failures.push_back({ { "path", failure.path },
                                 { "reason", failure.reason },
                                 { "allowed", failure.allowed } });
        }
        j["failures"] = std::move(failures);
    }
}
