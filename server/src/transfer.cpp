#include "sftpgate/server/transfer.hpp"

#include <vector>

#include <spdlog/spdlog.h>

namespace sftpgate::server
{

    namespace
    {
        std::size_t endpoint_count(const TransferParams &params)
        {
            return (params.file ? 1u : 0u) + (params.writer ? 1u : 0u) + (params.reader ? 1u : 0u);
        }

        const TransferParams &validated(const TransferParams &params)
        {
            if (endpoint_count(params) > 1)
            {
                throw Error(ErrorCode::GenericFailure, "a transfer accepts at most one endpoint");
            }
            return params;
        }
    } // namespace

    Transfer::Transfer(Connection &connection, TransferParams params)
        : connection_(connection),
          id_(connection.next_transfer_id()),
          type_(validated(params).type),
          file_(std::move(params.file)),
          writer_(std::move(params.writer)),
          reader_(std::move(params.reader)),
          fs_path_(std::move(params.fs_path)),
          request_path_(std::move(params.request_path)),
          initial_size_(params.initial_size),
          max_write_size_(params.max_write_size),
          is_new_file_(params.is_new_file),
          expected_size_(params.expected_size),
          read_error_(std::move(params.read_error)),
          started_(std::chrono::steady_clock::now()),
          started_at_(std::chrono::system_clock::now()),
          min_write_offset_(params.min_write_offset),
          cancel_(std::move(params.cancel))
    {
        connection_.add_transfer(this);
    }

    Transfer::~Transfer()
    {
        connection_.remove_transfer(this);
    }

    std::optional<Error> Transfer::error() const
    {
        std::lock_guard lock(mutex_);
        return error_;
    }

    bool Transfer::is_finished() const
    {
        std::lock_guard lock(mutex_);
        return finished_;
    }

    TransferStatus Transfer::status() const
    {
        return TransferStatus{
            .id = id_,
            .type = type_,
            .virtual_path = request_path_,
            .bytes = type_ == TransferType::Upload ? bytes_received_.load() : bytes_sent_.load(),
            .started = started_at_,
        };
    }

    void Transfer::transfer_error(const Error &error)
    {
        std::function<void()> cancel;
        {
            std::lock_guard lock(mutex_);
            if (error_)
            {
                return;
            }
            error_ = error;
            cancel = std::move(cancel_);
            cancel_ = nullptr;
        }
        if (cancel)
        {
            cancel();
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
        spdlog::warn("{} Unexpected error for transfer, path: \"{}\", error: \"{}\" bytes sent: {}, bytes received: {} "
                     "transfer running since {} ms",
                     connection_.log_prefix(), request_path_, error.what(), bytes_sent_.load(), bytes_received_.load(),
                     elapsed.count());
    }

    std::size_t Transfer::write_at(std::span<const std::uint8_t> data, std::uint64_t offset)
    {
        connection_.update_last_activity();
        if (is_finished())
        {
            throw Error(ErrorCode::TransferClosed);
        }

        const auto min_offset = min_write_offset_.load();
        const auto cursor = min_offset + bytes_received_.load();
        if (offset < min_offset || (!connection_.fs().is_upload_resume_supported() && offset != cursor))
        {
            Error error(ErrorCode::InvalidOffset, "Invalid write offset: " + std::to_string(offset) +
                                                      " minimum valid value: " + std::to_string(min_offset));
            transfer_error(error);
            throw error;
        }
        if (max_write_size_ < 0 ||
            (max_write_size_ > 0 &&
             bytes_received_.load() + data.size() > static_cast<std::uint64_t>(max_write_size_)))
        {
            Error error(ErrorCode::QuotaExceeded);
            transfer_error(error);
            throw error;
        }

        std::size_t written = 0;
        try
        {
            if (writer_)
            {
                written = writer_->write_at(data, offset);
            }
            else if (file_)
            {
                written = file_->write_at(data, offset);
            }
            else
            {
                throw Error(ErrorCode::Unsupported, "transfer has no writable endpoint");
            }
        }
        catch (const Error &error)
        {
            transfer_error(error);
            throw;
        }
        bytes_received_ += written;
        return written;
    }

    std::size_t Transfer::read_at(std::span<std::uint8_t> buffer, std::uint64_t offset)
    {
        connection_.update_last_activity();
        if (is_finished())
        {
            throw Error(ErrorCode::TransferClosed);
        }
        if (read_error_)
        {
            throw *read_error_;
        }

        std::size_t count = 0;
        try
        {
            if (reader_)
            {
                count = reader_->read_at(buffer, offset);
            }
            else if (file_)
            {
                count = file_->read_at(buffer, offset);
            }
            else
            {
                throw Error(ErrorCode::Unsupported, "transfer has no readable endpoint");
            }
        }
        catch (const Error &error)
        {
            if (type_ == TransferType::Download)
            {
                transfer_error(error);
            }
            throw;
        }
        bytes_sent_ += count;
        return count;
    }

    void Transfer::close()
    {
        std::lock_guard close_lock(close_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (finished_)
            {
                throw Error(ErrorCode::TransferClosed);
            }
            finished_ = true;
        }

        const auto io_error = close_io();
        auto result = close_base();
        if (!result)
        {
            result = io_error;
        }
        if (result)
        {
            throw *result;
        }
    }

    std::optional<Error> Transfer::close_io()
    {
        try
        {
            if (file_)
            {
                file_->close();
            }
            else if (writer_)
            {
                writer_->close();
            }
            else if (reader_)
            {
                reader_->close();
            }
        }
        catch (const Error &error)
        {
            transfer_error(error);
            return error;
        }
        return std::nullopt;
    }

    bool Transfer::remove_partial_upload(const char *reason)
    {
        const auto &name = file_->name();
        try
        {
            connection_.fs().remove(name, false);
        }
        catch (const Error &error)
        {
            spdlog::warn("{} {}, unable to remove \"{}\": {}", connection_.log_prefix(), reason, name.string(),
                         error.what());
            return false;
        }
        bytes_received_ = 0;
        min_write_offset_ = 0;
        spdlog::warn("{} {}, removed \"{}\"", connection_.log_prefix(), reason, name.string());
        return true;
    }

    std::optional<Error> Transfer::close_base()
    {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
        int num_files = is_new_file_ ? 1 : 0;

        if (type_ == TransferType::Upload && expected_size_ && !error())
        {
            const auto received = min_write_offset_.load() + bytes_received_.load();
            if (received != *expected_size_)
            {
                transfer_error(Error(ErrorCode::GenericFailure, "size mismatch: expected " +
                                                                    std::to_string(*expected_size_) + " bytes, received " +
                                                                    std::to_string(received)));
            }
        }

        const auto recorded = error();
        if (recorded && recorded->code() == ErrorCode::QuotaExceeded && file_)
        {
            if (file_->name() != fs_path_)
            {
                // The destination was never touched.
                remove_partial_upload("upload denied due to space limit");
                discarded_ = true;
            }
            else if (remove_partial_upload("upload denied due to space limit"))
            {
                --num_files;
            }
        }
        else if (type_ == TransferType::Upload && file_ && file_->name() != fs_path_)
        {
            if (!recorded || connection_.upload_mode() == UploadMode::AtomicWithResume)
            {
                try
                {
                    connection_.fs().rename(file_->name(), fs_path_);
                    spdlog::debug("{} atomic upload completed, rename: \"{}\" -> \"{}\"", connection_.log_prefix(),
                                  file_->name().string(), fs_path_.string());
                }
                catch (const Error &error)
                {
                    transfer_error(error);
                    remove_partial_upload("atomic upload rename failed");
                    discarded_ = true;
                }
            }
            else
            {
                remove_partial_upload("atomic upload failed");
                discarded_ = true;
            }
        }

        log_transfer(elapsed);
        update_quota(num_files);
        connection_.remove_transfer(this);
        return error();
    }

    void Transfer::update_quota(int num_files)
    {
        if (type_ != TransferType::Upload || discarded_)
        {
            return;
        }
        // Streaming backends commit nothing when the upload failed.
        if (!file_ && error())
        {
            return;
        }
        const auto size_diff =
            static_cast<std::int64_t>(bytes_received_.load() + min_write_offset_.load()) - initial_size_;
        if (num_files != 0 || size_diff != 0)
        {
            connection_.update_quota(request_path_, num_files, size_diff);
        }
    }

    void Transfer::log_transfer(std::chrono::milliseconds elapsed) const
    {
        const auto recorded = error();
        const auto bytes = type_ == TransferType::Upload ? bytes_received_.load() : bytes_sent_.load();
        spdlog::info("{} Transfer {}: {} \"{}\" elapsed {} ms, bytes {}, user {}, connection {}, protocol {}{}",
                     connection_.log_prefix(), recorded ? "failed" : "completed", to_string(type_), request_path_,
                     elapsed.count(), bytes, connection_.user().username, connection_.id(),
                     to_string(connection_.protocol()), recorded ? std::string(", error: ") + recorded->what() : std::string());
    }

    CopyResult Transfer::copy_from_reader_to_writer(Writer &dst, Reader &src)
    {
        CopyResult result;
        if (max_write_size_ < 0)
        {
            result.error = Error(ErrorCode::QuotaExceeded);
        }
        else
        {
            std::vector<std::uint8_t> buffer(kCopyBufferSize);
            auto &counter = type_ == TransferType::Upload ? bytes_received_ : bytes_sent_;
            while (true)
            {
                connection_.update_last_activity();
                std::size_t read_count = 0;
                try
                {
                    read_count = src.read(buffer);
                }
                catch (const Error &error)
                {
                    result.error = error;
                    break;
                }
                if (read_count == 0)
                {
                    break;
                }

                std::size_t write_count = 0;
                try
                {
                    write_count = dst.write(std::span<const std::uint8_t>(buffer.data(), read_count));
                }
                catch (const Error &error)
                {
                    result.error = error;
                    break;
                }
                result.written += write_count;
                counter += write_count;
                if (max_write_size_ > 0 && result.written > static_cast<std::uint64_t>(max_write_size_))
                {
                    result.error = Error(ErrorCode::QuotaExceeded);
                    break;
                }
                if (write_count != read_count)
                {
                    result.error = Error(ErrorCode::ShortWrite);
                    break;
                }
            }
        }

        if (result.error)
        {
            transfer_error(*result.error);
        }
        connection_.remove_transfer(this);
        return result;
    }

} // namespace sftpgate::server
