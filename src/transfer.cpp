#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#endif

#include <spdlog/spdlog.h>

#include <dumploader/url.hpp>
#include <dumploader/utils.hpp>

#include "transfer.hpp"

namespace dumploader
{
    namespace
    {
        void set_file_mtime(const fs::path& path, std::time_t t, std::error_code& ec)
        {
#ifndef _WIN32
            struct timespec times[2];
            times[0].tv_sec = 0;
            times[0].tv_nsec = UTIME_OMIT;
            times[1].tv_sec = t;
            times[1].tv_nsec = 0;
            if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
            else
            {
                ec.clear();
            }
#else
            const auto age = std::chrono::system_clock::now() - std::chrono::system_clock::from_time_t(t);
            fs::last_write_time(
                path,
                fs::file_time_type::clock::now()
                    - std::chrono::duration_cast<fs::file_time_type::duration>(age),
                ec);
#endif
        }
    }

    std::chrono::steady_clock::duration retry_delay(const Context& ctx, std::size_t attempt)
    {
        using seconds_d = std::chrono::duration<double>;

        const double cap = std::chrono::duration_cast<seconds_d>(ctx.retry_max_timeout).count();
        double delay = std::chrono::duration_cast<seconds_d>(ctx.retry_default_timeout).count();
        for (std::size_t i = 1; i < attempt && delay < cap; ++i)
        {
            delay *= static_cast<double>(ctx.retry_backoff_factor);
        }

        static thread_local std::mt19937 gen{ std::random_device{}() };
        std::uniform_real_distribution<double> jitter(0.75, 1.25);
        delay = std::min(delay * jitter(gen), cap);

        return std::chrono::duration_cast<std::chrono::steady_clock::duration>(seconds_d(delay));
    }

    Transfer::Transfer(const Context& ctx,
                       StateStore& store,
                       TransferTask task,
                       mirror_list& mirrors)
        : m_ctx(ctx)
        , m_store(store)
        , m_task(std::move(task))
        , m_mirrors(mirrors)
    {
        fs::path fn = m_task.destination;
        m_temp_file = fn.replace_extension(fn.extension().string() + PARTEXT);
        m_offset = m_task.resume_offset;
        m_outcome.path = m_task.path;
    }

    Transfer::~Transfer()
    {
        close_target_file();
    }

    void Transfer::close_target_file()
    {
        if (m_outfile)
        {
            std::error_code ec;
            m_outfile->close(ec);
            if (ec)
            {
                spdlog::error("Could not close file {}: {}", m_temp_file.string(), ec.message());
            }
            m_outfile.reset();
        }
    }

    tl::expected<void, Error> Transfer::open_target_file()
    {
        auto write_error = [this](const std::string& what, const std::error_code& ec)
        {
            return tl::unexpected(Error{
                ErrorLevel::FATAL,
                ErrorCode::DL_DESTINATION_WRITE,
                fmt::format("Could not {} {}: {}", what, m_temp_file.string(), ec.message()) });
        };

        std::error_code ec;
        fs::create_directories(m_task.destination.parent_path(), ec);
        if (ec)
        {
            return write_error("create the directory of", ec);
        }

        // Resuming trusts the bytes already on disk, only the final checksum can tell whether
        // they were right.
        bool resume = false;
        if (m_offset > 0)
        {
            const std::uintmax_t existing = fs::file_size(m_temp_file, ec);
            if (!m_task.expected_checksum || !m_ctx.validate_checksum)
            {
                spdlog::info("No checksum to validate a resumed {}, restarting from 0",
                             m_task.path);
            }
            else if (ec || existing < m_offset)
            {
                spdlog::info("Partial file {} is shorter than {} bytes, restarting from 0",
                             m_temp_file.string(),
                             m_offset);
            }
            else
            {
                resume = true;
            }
        }
        if (!resume)
        {
            m_offset = 0;
        }

        spdlog::debug("Opening file {}", m_temp_file.string());
        m_outfile = std::make_unique<FileIO>(
            m_temp_file, resume ? FileIO::Mode::kUPDATE : FileIO::Mode::kCREATE, ec);
        if (ec)
        {
            m_outfile.reset();
            return write_error("open", ec);
        }

        if (resume)
        {
            m_outfile->reset_to(m_offset, ec);
            if (ec)
            {
                return write_error("truncate", ec);
            }
        }
        return {};
    }

    bool Transfer::start(CURLM* multi_handle)
    {
        m_outcome.attempts++;

        if (!m_mirrors.empty())
        {
            // A retry moves on to another mirror when one is available.
            m_mirror = pick_mirror(m_mirrors, m_outcome.attempts > 1 ? m_mirror : nullptr);
            m_url = m_mirror->url_for(m_task.location);
        }
        else
        {
            m_url = m_task.source_url;
        }
        m_outcome.url = m_url;

        auto begun = m_store.begin_transfer(m_task.path);
        if (!begun)
        {
            set_failed(begun.error());
            return false;
        }

        auto opened = open_target_file();
        if (!opened)
        {
            set_failed(opened.error());
            return false;
        }

        m_received = 0;
        m_persisted = m_offset;
        m_last_persist = std::chrono::steady_clock::now();
        m_http_status = 0;
        m_body_started = false;
        m_interrupted = false;
        m_write_errno = 0;
        m_range_rejected = false;
        m_headercb_state = HeaderCbState::kDEFAULT;
        m_headercb_interrupt_reason.clear();
        m_content_length.reset();

        try
        {
            m_curl_handle = std::make_unique<CURLHandle>(m_ctx, m_url);
            CURLHandle& h = *m_curl_handle;

            if (m_offset > 0)
            {
                spdlog::info("Trying to resume {} from offset {}", m_task.path, m_offset);
                // A plain Range header lets a 200 answer through, see on_body_start().
                h.setopt(CURLOPT_RANGE, fmt::format("{}-", m_offset));
            }

            h.setopt(CURLOPT_HEADERFUNCTION, &Transfer::header_callback);
            h.setopt(CURLOPT_HEADERDATA, this);

            h.setopt(CURLOPT_WRITEFUNCTION, &Transfer::write_callback);
            h.setopt(CURLOPT_WRITEDATA, this);

            h.setopt(CURLOPT_XFERINFOFUNCTION, &Transfer::progress_callback);
            h.setopt(CURLOPT_XFERINFODATA, this);
            h.setopt(CURLOPT_NOPROGRESS, 0L);
        }
        catch (const curl_error& e)
        {
            set_failed(Error{ ErrorLevel::FATAL,
                              ErrorCode::DL_PERMANENT_TRANSFER,
                              fmt::format("Could not prepare transfer of {}: {}",
                                          m_url,
                                          e.what()) });
            return false;
        }

        CURLMcode cm_rc = curl_multi_add_handle(multi_handle, m_curl_handle->handle());
        if (cm_rc != CURLM_OK)
        {
            set_failed(Error{ ErrorLevel::FATAL,
                              ErrorCode::DL_PERMANENT_TRANSFER,
                              fmt::format("Could not start transfer of {}: {}",
                                          m_url,
                                          curl_multi_strerror(cm_rc)) });
            return false;
        }

        m_state = TransferState::kRUNNING;
        if (m_mirror)
        {
            m_mirror->begin_transfer();
        }

        spdlog::info("Downloading {} (attempt {}/{})", m_url, m_outcome.attempts, m_ctx.retry_limit);
        return true;
    }

    std::size_t Transfer::header_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          Transfer* self)
    {
        const std::size_t ret = size * nitems;
        std::string_view header(buffer, ret);

        // Every response (redirects included) starts with its own status line.
        if (starts_with(header, "HTTP/"))
        {
            auto parts = split(strip(header), " ", 2);
            self->m_http_status = 0;
            if (parts.size() > 1)
            {
                self->m_http_status = std::strtol(parts[1].c_str(), nullptr, 10);
            }
            self->m_content_length.reset();
            self->m_headercb_state = self->m_http_status / 100 == 2
                                         ? HeaderCbState::kHTTP_STATE_OK
                                         : HeaderCbState::kDEFAULT;
            spdlog::trace("{}: {}", self->m_task.path, strip(header));
            return ret;
        }

        if (self->m_headercb_state != HeaderCbState::kHTTP_STATE_OK)
        {
            return ret;
        }

        auto kv = parse_header(header);
        if (kv.first != "content-length")
        {
            return ret;
        }

        std::uintmax_t content_length = 0;
        try
        {
            content_length = std::stoull(kv.second);
        }
        catch (const std::logic_error&)
        {
            spdlog::debug("Ignoring bad Content-Length '{}'", kv.second);
            return ret;
        }
        self->m_content_length = content_length;

        const auto& expected_size = self->m_task.expected_size;
        if (expected_size)
        {
            std::uintmax_t expected = expected_size.value();
            if (self->m_http_status == 206)
            {
                expected = expected > self->m_offset ? expected - self->m_offset : 0;
            }

            if (content_length != expected)
            {
                self->m_headercb_state = HeaderCbState::kINTERRUPTED;
                self->m_headercb_interrupt_reason
                    = fmt::format("Server reports Content-Length: {} but expected size is: {}",
                                  content_length,
                                  expected);
                // Return error value
                return ret + 1;
            }
            self->m_headercb_state = HeaderCbState::kDONE;
        }
        return ret;
    }

    void Transfer::on_body_start()
    {
        if (m_offset > 0 && m_http_status == 200)
        {
            spdlog::warn("Server ignored the range request for {}, downloading it from the start",
                         m_task.path);
            std::error_code ec;
            m_outfile->reset_to(0, ec);
            if (ec)
            {
                m_write_errno = ec.value();
                return;
            }
            m_offset = 0;
            persist_progress();
        }
    }

    std::size_t Transfer::write_callback(char* buffer,
                                         std::size_t size,
                                         std::size_t nitems,
                                         Transfer* self)
    {
        const std::size_t all = size * nitems;

        if (is_sig_interrupted())
        {
            self->m_interrupted = true;
            return 0;
        }

        if (self->m_headercb_state == HeaderCbState::kINTERRUPTED)
        {
            return 0;
        }

        // Error pages never reach the partial file.
        if (self->m_http_status != 0 && self->m_http_status / 100 != 2)
        {
            return all;
        }

        if (!self->m_body_started)
        {
            self->m_body_started = true;
            self->on_body_start();
            if (self->m_write_errno != 0)
            {
                return 0;
            }
        }

        const std::size_t written = self->m_outfile->write(buffer, all);
        if (written != all)
        {
            self->m_write_errno = errno != 0 ? errno : EIO;
            spdlog::error("Writing file {}: {}",
                          self->m_temp_file.string(),
                          std::strerror(self->m_write_errno));
            return 0;
        }

        self->m_received += all;
        self->maybe_persist_progress();
        return all;
    }

    int Transfer::progress_callback(Transfer* self,
                                    curl_off_t /*total_to_download*/,
                                    curl_off_t /*now_downloaded*/,
                                    curl_off_t /*total_to_upload*/,
                                    curl_off_t /*now_uploaded*/)
    {
        if (is_sig_interrupted())
        {
            self->m_interrupted = true;
            return 1;
        }
        return 0;
    }

    void Transfer::maybe_persist_progress()
    {
        const auto now = std::chrono::steady_clock::now();
        if (durable_size() - m_persisted >= m_ctx.progress_persist_bytes
            || now - m_last_persist >= m_ctx.progress_persist_interval)
        {
            persist_progress();
        }
    }

    void Transfer::persist_progress()
    {
        if (!m_outfile || !m_outfile->open())
        {
            return;
        }

        std::error_code ec;
        m_outfile->sync(ec);
        if (ec)
        {
            spdlog::warn("Could not sync {}: {}", m_temp_file.string(), ec.message());
            return;
        }

        const std::uintmax_t durable = durable_size();
        auto recorded = m_store.record_progress(m_task.path, durable);
        if (!recorded)
        {
            recorded.error().log();
            return;
        }
        m_persisted = durable;
        m_last_persist = std::chrono::steady_clock::now();
        spdlog::trace("{}: {} bytes on disk", m_task.path, durable);
    }

    tl::expected<void, Error> Transfer::check_finished_transfer_status(CURLcode result)
    {
        if (m_interrupted)
        {
            return tl::unexpected(
                Error{ ErrorLevel::INFO, ErrorCode::DL_INTERRUPTED, "Transfer interrupted" });
        }

        if (result != CURLE_OK)
        {
            if (m_headercb_state == HeaderCbState::kINTERRUPTED)
            {
                return tl::unexpected(Error{ ErrorLevel::SERIOUS,
                                             ErrorCode::DL_BAD_CHECKSUM,
                                             m_headercb_interrupt_reason });
            }

            if (m_write_errno != 0)
            {
                return tl::unexpected(Error{ ErrorLevel::FATAL,
                                             ErrorCode::DL_DESTINATION_WRITE,
                                             fmt::format("Could not write {}: {}",
                                                         m_temp_file.string(),
                                                         std::strerror(m_write_errno)) });
            }

            std::string error = fmt::format("CURL error ({}): {} for {} [{}]",
                                            static_cast<int>(result),
                                            curl_easy_strerror(result),
                                            m_url,
                                            m_curl_handle->errorbuffer());
            switch (result)
            {
                case CURLE_BAD_FUNCTION_ARGUMENT:
                case CURLE_FILESIZE_EXCEEDED:
                case CURLE_FILE_COULDNT_READ_FILE:
                case CURLE_LOGIN_DENIED:
                case CURLE_NOT_BUILT_IN:
                case CURLE_OUT_OF_MEMORY:
                case CURLE_REMOTE_ACCESS_DENIED:
                case CURLE_REMOTE_FILE_NOT_FOUND:
                case CURLE_SSL_CACERT_BADFILE:
                case CURLE_SSL_CRL_BADFILE:
                case CURLE_UNSUPPORTED_PROTOCOL:
                case CURLE_URL_MALFORMAT:
                case CURLE_WRITE_ERROR:
                    // Fatal error
                    return tl::unexpected(
                        Error{ ErrorLevel::FATAL, ErrorCode::DL_PERMANENT_TRANSFER, error });
                case CURLE_COULDNT_CONNECT:
                case CURLE_COULDNT_RESOLVE_HOST:
                case CURLE_OPERATION_TIMEDOUT:
                    // Serious error, the mirror is penalized
                    return tl::unexpected(
                        Error{ ErrorLevel::SERIOUS, ErrorCode::DL_TRANSIENT_TRANSFER, error });
                case CURLE_RANGE_ERROR:
                    m_offset = 0;
                    m_received = 0;
                    m_range_rejected = true;
                    return tl::unexpected(
                        Error{ ErrorLevel::INFO, ErrorCode::DL_TRANSIENT_TRANSFER, error });
                default:
                    // Other error are not considered fatal
                    return tl::unexpected(
                        Error{ ErrorLevel::INFO, ErrorCode::DL_TRANSIENT_TRANSFER, error });
            }
        }

        // curl return code is CURLE_OK but we need to check status code
        const long code = m_curl_handle->getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        if (code == 0 || code / 100 == 2)
        {
            return {};
        }

        const std::string reason = fmt::format("Status code: {} for {}", code, m_url);
        if (code == 416 && m_offset > 0)
        {
            // The partial file does not fit the remote file anymore.
            m_offset = 0;
            m_received = 0;
            m_range_rejected = true;
            return tl::unexpected(
                Error{ ErrorLevel::INFO, ErrorCode::DL_TRANSIENT_TRANSFER, reason });
        }
        if (code / 100 == 5 || code == 408 || code == 429)
        {
            return tl::unexpected(
                Error{ ErrorLevel::INFO, ErrorCode::DL_TRANSIENT_TRANSFER, reason });
        }
        return tl::unexpected(
            Error{ ErrorLevel::FATAL, ErrorCode::DL_PERMANENT_TRANSFER, reason });
    }

    tl::expected<Checksum, Error> Transfer::verify()
    {
        auto mismatch = [this](const std::string& reason)
        {
            return tl::unexpected(Error{ ErrorLevel::SERIOUS,
                                         ErrorCode::DL_BAD_CHECKSUM,
                                         fmt::format("{}: {}", m_task.path, reason) });
        };

        std::error_code ec;
        const std::uintmax_t size = fs::file_size(m_temp_file, ec);
        if (ec)
        {
            return tl::unexpected(Error{ ErrorLevel::FATAL,
                                         ErrorCode::DL_DESTINATION_WRITE,
                                         fmt::format("Could not stat {}: {}",
                                                     m_temp_file.string(),
                                                     ec.message()) });
        }

        // Without a listed size the size announced by the server is checked.
        std::optional<std::uintmax_t> expected_size = m_task.expected_size;
        if (!expected_size && m_content_length)
        {
            expected_size = m_offset + m_content_length.value();
        }
        if (expected_size && size != expected_size.value())
        {
            return mismatch(fmt::format(
                "file size {} does not match expected size {}", size, expected_size.value()));
        }

        const bool check_checksum = m_task.expected_checksum && m_ctx.validate_checksum;
        if (!expected_size && !check_checksum)
        {
            return tl::unexpected(
                Error{ ErrorLevel::FATAL,
                       ErrorCode::DL_PERMANENT_TRANSFER,
                       fmt::format("{}: no size or checksum to verify the download against",
                                   m_task.path) });
        }

        auto unreadable = [this]()
        {
            return tl::unexpected(Error{ ErrorLevel::FATAL,
                                         ErrorCode::DL_IO,
                                         fmt::format("Could not read {}", m_temp_file.string()) });
        };

        if (check_checksum)
        {
            const Checksum& expected = m_task.expected_checksum.value();
            Checksum computed{ expected.type, checksum_file(m_temp_file, expected.type) };
            if (computed.checksum.empty())
            {
                return unreadable();
            }
            if (computed.checksum != to_lower(expected.checksum))
            {
                return mismatch(fmt::format("{} {} does not match expected {}",
                                            to_string(expected.type),
                                            computed.checksum,
                                            expected.checksum));
            }
            return computed;
        }

        Checksum computed{ ChecksumType::kSHA256,
                           checksum_file(m_temp_file, ChecksumType::kSHA256) };
        if (computed.checksum.empty())
        {
            return unreadable();
        }
        return computed;
    }

    tl::expected<void, Error> Transfer::finalize(const Checksum& computed, std::uintmax_t size)
    {
        std::error_code ec;
        fs::rename(m_temp_file, m_task.destination, ec);
        if (ec)
        {
            return tl::unexpected(Error{ ErrorLevel::FATAL,
                                         ErrorCode::DL_DESTINATION_WRITE,
                                         fmt::format("Could not move {} to {}: {}",
                                                     m_temp_file.string(),
                                                     m_task.destination.string(),
                                                     ec.message()) });
        }

        if (m_ctx.preserve_filetime)
        {
            std::optional<std::time_t> filetime;
            auto remote_filetime = m_curl_handle->getinfo<curl_off_t>(CURLINFO_FILETIME_T);
            if (remote_filetime && remote_filetime.value() >= 0)
            {
                filetime = static_cast<std::time_t>(remote_filetime.value());
            }
            else if (m_task.last_modified)
            {
                filetime = std::chrono::system_clock::to_time_t(m_task.last_modified.value());
            }

            if (filetime)
            {
                set_file_mtime(m_task.destination, filetime.value(), ec);
                if (ec)
                {
                    spdlog::debug("Could not set the modification time of {}: {}",
                                  m_task.destination.string(),
                                  ec.message());
                }
            }
            else
            {
                spdlog::debug("Unable to get remote time of {}", m_task.path);
            }
        }

        auto marked = m_store.mark_verified(m_task.path, computed, size, m_task.last_modified);
        if (!marked)
        {
            return tl::unexpected(marked.error());
        }
        return {};
    }

    void Transfer::finish(CURLM* multi_handle, CURLcode result)
    {
        curl_multi_remove_handle(multi_handle, m_curl_handle->handle());
        m_outcome.bytes_transferred += m_received;

        auto status = check_finished_transfer_status(result);
        if (!status && status.error().code == ErrorCode::DL_INTERRUPTED)
        {
            abandon(TransferStatus::kINTERRUPTED);
            return;
        }

        tl::expected<Checksum, Error> verified = tl::unexpected(Error{});
        if (status)
        {
            std::error_code ec;
            m_outfile->sync(ec);
            close_target_file();
            if (ec)
            {
                verified = tl::unexpected(Error{ ErrorLevel::FATAL,
                                                 ErrorCode::DL_DESTINATION_WRITE,
                                                 fmt::format("Could not sync {}: {}",
                                                             m_temp_file.string(),
                                                             ec.message()) });
            }
            else
            {
                verified = verify();
            }
        }
        else
        {
            // Keep what was received for the next attempt.
            persist_progress();
            close_target_file();
            verified = tl::unexpected(status.error());
        }

        if (!verified)
        {
            const Error& error = verified.error();
            const bool integrity = error.code == ErrorCode::DL_BAD_CHECKSUM;
            complete_mirror_usage(false, error.is_serious());

            if (integrity)
            {
                std::error_code ec;
                fs::remove(m_temp_file, ec);
                m_offset = 0;
                m_received = 0;
                auto recorded = m_store.record_progress(m_task.path, 0);
                if (!recorded)
                {
                    recorded.error().log();
                }
            }
            else
            {
                // Without a checksum resumed bytes can't be trusted.
                m_offset = m_task.expected_checksum ? durable_size() : 0;
            }

            if (m_range_rejected)
            {
                ++m_range_restarts;
                spdlog::info("{}: {}, downloading it again from the start",
                             m_task.path,
                             error.reason);
                m_state = TransferState::kWAITING;
                m_next_attempt = std::chrono::steady_clock::now();
                return;
            }

            const bool retryable = error.is_transient() || integrity;
            if (retryable && m_outcome.attempts - m_range_restarts < m_ctx.retry_limit)
            {
                set_retrying(error);
            }
            else if (retryable)
            {
                set_failed(Error{ ErrorLevel::SERIOUS,
                                  integrity ? ErrorCode::DL_BAD_CHECKSUM
                                            : ErrorCode::DL_PERMANENT_TRANSFER,
                                  fmt::format("{} (giving up after {} attempts)",
                                              error.reason,
                                              m_outcome.attempts) });
            }
            else
            {
                set_failed(error);
            }
            return;
        }

        std::error_code ec;
        const std::uintmax_t size = fs::file_size(m_temp_file, ec);
        if (ec)
        {
            complete_mirror_usage(false, false);
            set_failed(Error{ ErrorLevel::FATAL,
                              ErrorCode::DL_DESTINATION_WRITE,
                              fmt::format("Could not stat {}: {}",
                                          m_temp_file.string(),
                                          ec.message()) });
            return;
        }
        auto finalized = finalize(verified.value(), size);
        if (!finalized)
        {
            complete_mirror_usage(false, false);
            set_failed(finalized.error());
            return;
        }

        m_outcome.size = size;
        set_finished();
    }

    void Transfer::abandon(TransferStatus status)
    {
        if (m_outfile)
        {
            persist_progress();
            close_target_file();
        }

        m_state = TransferState::kINTERRUPTED;
        m_outcome.status = status;
        if (status == TransferStatus::kINTERRUPTED)
        {
            m_outcome.error = Error{ ErrorLevel::INFO,
                                     ErrorCode::DL_INTERRUPTED,
                                     "interrupted, will resume on the next run" };
            spdlog::warn("Transfer of {} interrupted with {} bytes on disk",
                         m_task.path,
                         durable_size());
        }
    }

    void Transfer::set_retrying(const Error& error)
    {
        const auto delay = retry_delay(m_ctx, m_outcome.attempts);
        spdlog::warn("Attempt {}/{} of {} failed: {}, retrying in {} ms",
                     m_outcome.attempts,
                     m_ctx.retry_limit,
                     m_task.path,
                     error.reason,
                     std::chrono::duration_cast<std::chrono::milliseconds>(delay).count());
        m_state = TransferState::kWAITING;
        m_next_attempt = std::chrono::steady_clock::now() + delay;
    }

    void Transfer::set_failed(Error error)
    {
        close_target_file();

        spdlog::error("Transfer of {} failed: {}", m_task.path, error.reason);
        auto marked = m_store.mark_failed(m_task.path, error.to_string());
        if (!marked)
        {
            marked.error().log();
        }

        m_state = TransferState::kFAILED;
        m_outcome.status = TransferStatus::kFAILED;
        m_outcome.error = std::move(error);
    }

    void Transfer::set_finished()
    {
        complete_mirror_usage(true, false);
        m_state = TransferState::kFINISHED;
        m_outcome.status = TransferStatus::kSUCCESSFUL;
        m_outcome.error.reset();
        spdlog::info("Verified {} ({})", m_task.path, format_bytes(m_outcome.size));
    }

    void Transfer::complete_mirror_usage(bool success, bool serious)
    {
        if (!m_mirror)
        {
            return;
        }
        m_mirror->end_transfer(success, m_received);
        reorder_mirrors(m_mirrors, m_mirror, success, serious);
    }
}
