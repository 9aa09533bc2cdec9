#ifndef DUMPLOADER_STATE_STORE_HPP
#define DUMPLOADER_STATE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <dumploader/export.hpp>
#include <dumploader/enums.hpp>
#include <dumploader/errors.hpp>
#include <dumploader/manifest.hpp>

namespace dumploader
{
    namespace fs = std::filesystem;

    // What is known locally about one file of the dataset.
    struct DUMPLOADER_API LocalFileState
    {
        std::string path;
        FileStatus status = FileStatus::kPENDING;
        // Bytes of the partial file known to be on stable storage.
        std::uintmax_t bytes_downloaded = 0;
        // Last checksum computed over the complete file.
        std::optional<Checksum> checksum;
        // Size of the file when it was verified.
        std::optional<std::uintmax_t> size;
        // Modification time the listing announced for the verified file.
        std::optional<file_time_point> remote_modified;
        std::optional<file_time_point> last_attempt;
        std::size_t attempt_count = 0;
        std::string last_error;
    };

    DUMPLOADER_API void to_json(nlohmann::json& j, const LocalFileState& state);
    DUMPLOADER_API void from_json(const nlohmann::json& j, LocalFileState& state);

    // Durable map of relative path to LocalFileState, kept in a JSON document.
    //
    // Every mutating call rewrites the document (temporary file, fsync, rename) before
    // returning, so a crash after a successful call never loses the recorded state. Calls are
    // serialized by one mutex and may come from any thread.
    class DUMPLOADER_API StateStore
    {
    public:
        static constexpr int format_version = 1;

        explicit StateStore(fs::path path);

        StateStore(const StateStore&) = delete;
        StateStore& operator=(const StateStore&) = delete;

        // `{out_dir}/.dumploader/state.json`
        static fs::path default_path(const fs::path& out_dir);

        // Reads the persisted document. A missing file is an empty store; an unreadable file is
        // moved aside to `<path>.corrupt` and the store starts empty; unreadable entries come
        // back as Pending. Only failures to create the state directory are returned.
        tl::expected<void, Error> load();

        const fs::path& path() const
        {
            return m_path;
        }

        // Entries that could not be read by the last `load()` and were reset to Pending.
        std::size_t corrupted_entries() const;

        std::optional<LocalFileState> get(const std::string& path) const;
        std::map<std::string, LocalFileState> snapshot() const;

        // Pending / Failed / InProgress -> InProgress, counts an attempt.
        tl::expected<void, Error> begin_transfer(const std::string& path);

        // InProgress only: durable size of the partial file.
        tl::expected<void, Error> record_progress(const std::string& path, std::uintmax_t bytes);

        // InProgress -> Verified with the checksum computed over the downloaded file.
        tl::expected<void, Error> mark_verified(
            const std::string& path,
            const Checksum& computed,
            std::uintmax_t size,
            std::optional<file_time_point> remote_modified = std::nullopt);

        // InProgress -> Failed. The partial byte count is kept.
        tl::expected<void, Error> mark_failed(const std::string& path, const std::string& reason);

        // Verified -> Pending (remote file changed or local copy gone), no-op on Pending.
        tl::expected<void, Error> reset_to_pending(const std::string& path);

    private:
        template <class F>
        tl::expected<void, Error> mutate(const std::string& path, F&& f);

        tl::expected<void, Error> persist_locked() const;

        static Error transition_error(const std::string& path,
                                      FileStatus from,
                                      const char* operation);

        fs::path m_path;
        std::map<std::string, LocalFileState> m_states;
        std::size_t m_corrupted_entries = 0;
        mutable std::mutex m_mutex;
    };
}

#endif
