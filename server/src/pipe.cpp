#include "sftpgate/server/pipe.hpp"

#include <algorithm>

namespace sftpgate::server
{

    PipeWriter::PipeWriter(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}

    std::size_t PipeWriter::write_at(std::span<const std::uint8_t> data, std::uint64_t offset)
    {
        std::unique_lock lock(state_->mutex);
        if (state_->write_closed)
        {
            throw Error(ErrorCode::GenericFailure, "write on closed pipe");
        }
        if (offset != state_->written)
        {
            throw Error(ErrorCode::InvalidOffset, "pipe writes must be sequential, expected offset " +
                                                      std::to_string(state_->written) + " got " + std::to_string(offset));
        }

        std::size_t copied = 0;
        while (copied < data.size())
        {
            state_->cv.wait(lock, [this]
                            { return state_->read_closed || state_->buffer.size() < state_->capacity; });
            if (state_->read_closed)
            {
                throw Error(ErrorCode::GenericFailure, "pipe reader closed");
            }
            const auto room = state_->capacity - state_->buffer.size();
            const auto chunk = std::min(room, data.size() - copied);
            state_->buffer.insert(state_->buffer.end(), data.begin() + static_cast<std::ptrdiff_t>(copied),
                                  data.begin() + static_cast<std::ptrdiff_t>(copied + chunk));
            copied += chunk;
            state_->written += chunk;
            state_->cv.notify_all();
        }
        return copied;
    }

    void PipeWriter::close()
    {
        std::unique_lock lock(state_->mutex);
        state_->write_closed = true;
        state_->cv.notify_all();
        state_->cv.wait(lock, [this]
                        { return state_->done; });
        if (state_->done_error)
        {
            throw *state_->done_error;
        }
    }

    void PipeWriter::done(std::optional<Error> error)
    {
        std::lock_guard lock(state_->mutex);
        state_->done = true;
        state_->done_error = std::move(error);
        state_->cv.notify_all();
    }

    void PipeWriter::finish(std::optional<Error> error)
    {
        std::lock_guard lock(state_->mutex);
        state_->write_closed = true;
        state_->write_error = std::move(error);
        state_->cv.notify_all();
    }

    std::uint64_t PipeWriter::bytes_written() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->written;
    }

    PipeReader::PipeReader(std::shared_ptr<detail::PipeState> state) : state_(std::move(state)) {}

    std::size_t PipeReader::read_at(std::span<std::uint8_t> buffer, std::uint64_t offset)
    {
        {
            std::lock_guard lock(state_->mutex);
            if (offset != state_->read)
            {
                throw Error(ErrorCode::Unsupported, "pipe reads must be sequential");
            }
        }
        return read(buffer);
    }

    std::size_t PipeReader::read(std::span<std::uint8_t> buffer)
    {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this]
                        { return state_->read_closed || state_->write_closed || !state_->buffer.empty(); });
        if (state_->read_closed)
        {
            throw Error(ErrorCode::GenericFailure, "read on closed pipe");
        }
        if (state_->buffer.empty())
        {
            if (state_->write_error)
            {
                throw *state_->write_error;
            }
            return 0;
        }
        const auto count = std::min(buffer.size(), state_->buffer.size());
        std::copy_n(state_->buffer.begin(), count, buffer.begin());
        state_->buffer.erase(state_->buffer.begin(), state_->buffer.begin() + static_cast<std::ptrdiff_t>(count));
        state_->read += count;
        state_->cv.notify_all();
        return count;
    }

    void PipeReader::close()
    {
        std::lock_guard lock(state_->mutex);
        state_->read_closed = true;
        state_->cv.notify_all();
    }

    Pipe make_pipe(std::size_t capacity)
    {
        auto state = std::make_shared<detail::PipeState>();
        state->capacity = std::max<std::size_t>(capacity, 1);
        return Pipe{
            .reader = std::make_shared<PipeReader>(state),
            .writer = std::make_shared<PipeWriter>(state),
        };
    }

} // namespace sftpgate::server
