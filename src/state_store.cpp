#include <fstream>
#include <sstream>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

#include <spdlog/spdlog.h>

#include <dumploader/fileio.hpp>
#include <dumploader/state_store.hpp>

namespace dumploader
{
    void to_json(nlohmann::json& j, const LocalFileState& state)
    {
        j = nlohmann::json{ { "status", to_string(state.status) },
                            { "bytes_downloaded", state.bytes_downloaded },
                            { "attempt_count", state.attempt_count } };
        if (state.checksum)
        {
            j["checksum"] = { { "type", to_string(state.checksum->type) },
                              { "value", state.checksum->checksum } };
        }
        if (state.size)
        {
            j["size"] = state.size.value();
        }
        if (state.remote_modified)
        {
            j["remote_modified"] = format_utc_timestamp(state.remote_modified.value());
        }
        if (state.last_attempt)
        {
            j["last_attempt"] = format_utc_timestamp(state.last_attempt.value());
        }
        if (!state.last_error.empty())
        {
            j["last_error"] = state.last_error;
        }
    }

    void from_json(const nlohmann::json& j, LocalFileState& state)
    {
        auto status = file_status_from_string(j.at("status").get<std::string>());
        if (!status)
        {
            throw std::invalid_argument(
                fmt::format("unknown status '{}'", j.at("status").get<std::string>()));
        }
        state.status = status.value();
        state.bytes_downloaded = j.value("bytes_downloaded", std::uintmax_t(0));
        state.attempt_count = j.value("attempt_count", std::size_t(0));
        state.last_error = j.value("last_error", std::string());

        if (j.contains("checksum"))
        {
            const auto& c = j.at("checksum");
            auto type = checksum_type_from_string(c.at("type").get<std::string>());
            if (!type)
            {
                throw std::invalid_argument("unknown checksum type");
            }
            state.checksum = Checksum{ type.value(), c.at("value").get<std::string>() };
        }
        if (j.contains("size"))
        {
            state.size = j.at("size").get<std::uintmax_t>();
        }
        if (j.contains("remote_modified"))
        {
            state.remote_modified
                = parse_utc_timestamp(j.at("remote_modified").get<std::string>());
        }
        if (j.contains("last_attempt"))
        {
            state.last_attempt = parse_utc_timestamp(j.at("last_attempt").get<std::string>());
        }

        // A verified entry always carries what it was verified against.
        if (state.status == FileStatus::kVERIFIED && (!state.checksum || !state.size))
        {
            throw std::invalid_argument("verified entry without checksum or size");
        }
    }

    StateStore::StateStore(fs::path path)
        : m_path(std::move(path))
    {
    }

    fs::path StateStore::default_path(const fs::path& out_dir)
    {
        return out_dir / ".dumploader" / "state.json";
    }

    std::size_t StateStore::corrupted_entries() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_corrupted_entries;
    }

    tl::expected<void, Error> StateStore::load()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states.clear();
        m_corrupted_entries = 0;

        std::error_code ec;
        if (m_path.has_parent_path())
        {
            fs::create_directories(m_path.parent_path(), ec);
            if (ec)
            {
                return tl::unexpected(
                    Error{ ErrorLevel::FATAL,
                           ErrorCode::DL_IO,
                           fmt::format("Could not create state directory {}: {}",
                                       m_path.parent_path().string(),
                                       ec.message()) });
            }
        }

        if (!fs::exists(m_path, ec))
        {
            spdlog::debug("No state file at {}, starting empty", m_path.string());
            return {};
        }

        nlohmann::json j;
        {
            std::ifstream in(m_path, std::ios::binary);
            std::stringstream buffer;
            buffer << in.rdbuf();
            j = nlohmann::json::parse(buffer.str(), nullptr, false);
        }

        if (j.is_discarded() || !j.is_object() || !j.contains("files")
            || !j["files"].is_object())
        {
            fs::path aside = m_path;
            aside += ".corrupt";
            fs::rename(m_path, aside, ec);
            Error err{ ErrorLevel::SERIOUS,
                       ErrorCode::DL_STATE_CORRUPTION,
                       fmt::format("State file {} is unreadable, moved to {}{}",
                                   m_path.string(),
                                   aside.string(),
                                   ec ? " (failed: " + ec.message() + ")" : "") };
            err.log();
            return {};
        }

        if (j.contains("version") && j["version"].is_number_integer()
            && j["version"].get<int>() > format_version)
        {
            spdlog::warn("State file {} was written by a newer version", m_path.string());
        }

        for (const auto& [key, value] : j["files"].items())
        {
            LocalFileState state;
            try
            {
                state = value.get<LocalFileState>();
            }
            catch (const std::exception& e)
            {
                Error{ ErrorLevel::INFO,
                       ErrorCode::DL_STATE_CORRUPTION,
                       fmt::format("State of {} is unreadable ({}), reset to pending", key, e.what()) }
                    .log();
                state = LocalFileState{};
                m_corrupted_entries++;
            }
            state.path = key;
            m_states[key] = std::move(state);
        }

        spdlog::debug("Loaded {} state entries from {}", m_states.size(), m_path.string());
        return {};
    }

    std::optional<LocalFileState> StateStore::get(const std::string& path) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(path);
        if (it == m_states.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, LocalFileState> StateStore::snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_states;
    }

    Error StateStore::transition_error(const std::string& path,
                                       FileStatus from,
                                       const char* operation)
    {
        return Error{ ErrorLevel::SERIOUS,
                      ErrorCode::DL_STATE_TRANSITION,
                      fmt::format("{}: cannot {} from state {}", path, operation, to_string(from)) };
    }

    template <class F>
    tl::expected<void, Error> StateStore::mutate(const std::string& path, F&& f)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_states.find(path);
        const bool existed = it != m_states.end();
        std::optional<LocalFileState> previous;
        if (existed)
        {
            previous = it->second;
        }
        else
        {
            LocalFileState fresh;
            fresh.path = path;
            it = m_states.emplace(path, std::move(fresh)).first;
        }

        auto changed = f(it->second);
        if (changed)
        {
            changed = persist_locked();
        }

        if (!changed)
        {
            if (existed)
            {
                it->second = std::move(previous.value());
            }
            else
            {
                m_states.erase(it);
            }
        }
        return changed;
    }

    tl::expected<void, Error> StateStore::begin_transfer(const std::string& path)
    {
        return mutate(path,
                      [&](LocalFileState& state) -> tl::expected<void, Error>
                      {
                          if (state.status == FileStatus::kVERIFIED)
                          {
                              return tl::unexpected(
                                  transition_error(path, state.status, "begin transfer"));
                          }
                          state.status = FileStatus::kIN_PROGRESS;
                          state.attempt_count++;
                          state.last_attempt = std::chrono::system_clock::now();
                          return {};
                      });
    }

    tl::expected<void, Error> StateStore::record_progress(const std::string& path,
                                                          std::uintmax_t bytes)
    {
        return mutate(path,
                      [&](LocalFileState& state) -> tl::expected<void, Error>
                      {
                          if (state.status != FileStatus::kIN_PROGRESS)
                          {
                              return tl::unexpected(
                                  transition_error(path, state.status, "record progress"));
                          }
                          state.bytes_downloaded = bytes;
                          return {};
                      });
    }

    tl::expected<void, Error> StateStore::mark_verified(
        const std::string& path,
        const Checksum& computed,
        std::uintmax_t size,
        std::optional<file_time_point> remote_modified)
    {
        return mutate(path,
                      [&](LocalFileState& state) -> tl::expected<void, Error>
                      {
                          if (state.status != FileStatus::kIN_PROGRESS)
                          {
                              return tl::unexpected(
                                  transition_error(path, state.status, "mark verified"));
                          }
                          state.status = FileStatus::kVERIFIED;
                          state.checksum = computed;
                          state.size = size;
                          state.remote_modified = remote_modified;
                          state.bytes_downloaded = size;
                          state.last_error.clear();
                          return {};
                      });
    }

    tl::expected<void, Error> StateStore::mark_failed(const std::string& path,
                                                      const std::string& reason)
    {
        return mutate(path,
                      [&](LocalFileState& state) -> tl::expected<void, Error>
                      {
                          if (state.status != FileStatus::kIN_PROGRESS)
                          {
                              return tl::unexpected(
                                  transition_error(path, state.status, "mark failed"));
                          }
                          state.status = FileStatus::kFAILED;
                          state.last_error = reason;
                          return {};
                      });
    }

    tl::expected<void, Error> StateStore::reset_to_pending(const std::string& path)
    {
        return mutate(path,
                      [&](LocalFileState& state) -> tl::expected<void, Error>
                      {
                          if (state.status != FileStatus::kVERIFIED
                              && state.status != FileStatus::kPENDING)
                          {
                              return tl::unexpected(
                                  transition_error(path, state.status, "reset to pending"));
                          }
                          state.status = FileStatus::kPENDING;
                          state.bytes_downloaded = 0;
                          state.size.reset();
                          return {};
                      });
    }

    tl::expected<void, Error> StateStore::persist_locked() const
    {
        nlohmann::json files = nlohmann::json::object();
        for (const auto& [path, state] : m_states)
        {
            files[path] = state;
        }
        const std::string payload
            = nlohmann::json{ { "version", format_version }, { "files", files } }.dump(1);

        auto io_error = [&](const std::string& what, const std::error_code& ec)
        {
            return tl::unexpected(Error{
                ErrorLevel::SERIOUS,
                ErrorCode::DL_IO,
                fmt::format("Could not {} state file {}: {}", what, m_path.string(), ec.message()) });
        };

        fs::path tmp = m_path;
        tmp += ".tmp";

        std::error_code ec;
        {
            FileIO out(tmp, FileIO::Mode::kCREATE, ec);
            if (ec)
            {
                return io_error("open", ec);
            }
            if (out.write(payload.data(), payload.size()) != payload.size())
            {
                return io_error("write", std::error_code(errno, std::generic_category()));
            }
            out.sync(ec);
            if (ec)
            {
                return io_error("sync", ec);
            }
            out.close(ec);
            if (ec)
            {
                return io_error("close", ec);
            }
        }

        fs::rename(tmp, m_path, ec);
        if (ec)
        {
            return io_error("replace", ec);
        }

#ifndef _WIN32
        // The rename itself must reach the disk as well.
        const fs::path dir = m_path.has_parent_path() ? m_path.parent_path() : fs::path(".");
        int dir_fd = ::open(dir.c_str(), O_RDONLY);
        if (dir_fd >= 0)
        {
            ::fsync(dir_fd);
            ::close(dir_fd);
        }
#endif
        return {};
    }
}
