#include <algorithm>
#include <chrono>
#include <optional>

#include <spdlog/spdlog.h>

#include <dumploader/planner.hpp>
#include <dumploader/url.hpp>
#include <dumploader/utils.hpp>

namespace dumploader
{
    namespace
    {
        bool is_within(const fs::path& path, const fs::path& dir)
        {
            const fs::path rel = path.lexically_relative(dir);
            return !rel.empty() && *rel.begin() != "..";
        }

        std::chrono::seconds whole_seconds(file_time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch());
        }
    }

    std::optional<std::string> reserved_destination(const std::string& path,
                                                    const fs::path& destination,
                                                    const PlannerOptions& options)
    {
        if (ends_with(path, PARTEXT))
        {
            return std::string("name is reserved for partial downloads");
        }

        const fs::path default_state = StateStore::default_path(options.out_dir);
        if (is_within(destination, default_state.parent_path().lexically_normal()))
        {
            return std::string("path is inside the state directory");
        }

        const fs::path state
            = (options.state_path.empty() ? default_state : options.state_path)
                  .lexically_normal();
        for (const char* suffix : { "", ".tmp", ".corrupt" })
        {
            fs::path reserved = state;
            reserved += suffix;
            if (destination == reserved)
            {
                return std::string("path would overwrite the state file");
            }
        }
        return std::nullopt;
    }

    std::uintmax_t Plan::planned_bytes() const
    {
        std::uintmax_t total = 0;
        for (const auto& task : tasks)
        {
            const std::uintmax_t size = task.expected_size.value_or(0);
            total += size > task.resume_offset ? size - task.resume_offset : 0;
        }
        return total;
    }

    bool remote_changed(const RemoteFile& remote, const LocalFileState& state)
    {
        const bool comparable = remote.checksum && state.checksum
                                && remote.checksum->type == state.checksum->type;
        if (comparable
            && to_lower(remote.checksum->checksum) != to_lower(state.checksum->checksum))
        {
            return true;
        }
        if (remote.size && state.size && remote.size.value() != state.size.value())
        {
            return true;
        }
        // Without comparable checksums a new listing date is the only hint of a same-size change.
        if (!comparable && remote.last_modified && state.remote_modified)
        {
            return whole_seconds(remote.last_modified.value())
                   != whole_seconds(state.remote_modified.value());
        }
        return false;
    }

    void sort_tasks(std::vector<TransferTask>& tasks)
    {
        std::sort(tasks.begin(),
                  tasks.end(),
                  [](const TransferTask& lhs, const TransferTask& rhs)
                  {
                      if (lhs.expected_size.has_value() != rhs.expected_size.has_value())
                      {
                          return lhs.expected_size.has_value();
                      }
                      if (lhs.expected_size && lhs.expected_size.value() != rhs.expected_size.value())
                      {
                          return lhs.expected_size.value() > rhs.expected_size.value();
                      }
                      return lhs.path < rhs.path;
                  });
    }

    Plan plan(const Manifest& manifest,
              const std::map<std::string, LocalFileState>& states,
              const PlannerOptions& options)
    {
        Plan result;

        for (const auto& remote : manifest)
        {
            auto destination = resolve_under(options.out_dir, remote.path);
            if (!destination)
            {
                result.rejected.emplace_back(remote.path, "path escapes the output directory");
                continue;
            }
            auto reserved = reserved_destination(remote.path, destination.value(), options);
            if (reserved)
            {
                result.rejected.emplace_back(remote.path, reserved.value());
                continue;
            }

            TransferTask task;
            task.path = remote.path;
            task.location = remote.location();
            task.source_url = join_url(options.mirror_url, task.location);
            task.destination = destination.value();
            task.expected_size = remote.size;
            task.expected_checksum = remote.checksum;
            task.last_modified = remote.last_modified;

            auto it = states.find(remote.path);
            if (it != states.end())
            {
                const LocalFileState& state = it->second;
                switch (state.status)
                {
                    case FileStatus::kVERIFIED:
                        if (!remote_changed(remote, state))
                        {
                            result.up_to_date.push_back(remote.path);
                            continue;
                        }
                        result.reset_to_pending.push_back(remote.path);
                        break;
                    case FileStatus::kIN_PROGRESS:
                        task.resume_offset = state.bytes_downloaded;
                        if (remote.size && task.resume_offset > remote.size.value())
                        {
                            task.resume_offset = 0;
                        }
                        break;
                    case FileStatus::kPENDING:
                    case FileStatus::kFAILED:
                        break;
                }
            }

            result.tasks.push_back(std::move(task));
        }

        sort_tasks(result.tasks);
        std::sort(result.up_to_date.begin(), result.up_to_date.end());
        std::sort(result.reset_to_pending.begin(), result.reset_to_pending.end());

        spdlog::debug("Planned {} transfers, {} up to date, {} to reset",
                      result.tasks.size(),
                      result.up_to_date.size(),
                      result.reset_to_pending.size());
        return result;
    }
}
