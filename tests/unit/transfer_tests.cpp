#include <atomic>
#include <cassert>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sftpgate/server/transfer.hpp"

#include "test_support.hpp"

using namespace sftpgate;
using namespace sftpgate::server;

namespace
{

    struct UploadTarget
    {
        std::filesystem::path real;
        CreateResult created;
    };

    UploadTarget create_upload(Connection &connection, const std::string &virtual_path, bool atomic)
    {
        auto &fs = connection.fs();
        const auto real = fs.resolve_path(virtual_path);
        const auto file_path = atomic ? fs.atomic_upload_path(real) : real;
        return UploadTarget{.real = real, .created = fs.create(file_path, CreateOptions{.truncate = true})};
    }

    std::size_t count_entries(const std::filesystem::path &dir)
    {
        std::size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            (void)entry;
            ++count;
        }
        return count;
    }

    void test_upload_updates_quota()
    {
        test::TempDir dir("sftpgate_transfer_upload");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        auto target = create_upload(*connection, "/file.txt", false);

        {
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/file.txt",
                                               .type = TransferType::Upload,
                                               .is_new_file = true,
                                               .expected_size = 11,
                                           });
            assert(connection->transfer_count() == 1);
            assert(transfer.write_at(test::bytes_of("hello "), 0) == 6);
            assert(transfer.write_at(test::bytes_of("world"), 6) == 5);
            assert(transfer.bytes_received() == 11);
            assert(connection->active_transfers().front().bytes == 11);
            transfer.close();
            assert(connection->transfer_count() == 0);
            assert(transfer.is_finished());

            // Every close after the first reports the transfer as closed.
            assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::TransferClosed);
            assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("x"), 11); }) ==
                   ErrorCode::TransferClosed);
        }
        assert(test::read_file(target.real) == "hello world");
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 11);
    }

    void test_invalid_offset_without_resume()
    {
        test::TempDir dir("sftpgate_transfer_offset");
        QuotaTracker quota;
        auto fs = std::make_shared<test::NoResumeFilesystem>(dir.path(), false);
        auto connection = test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard, fs);
        auto target = create_upload(*connection, "/file.bin", false);

        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(target.created.file),
                                           .fs_path = target.real,
                                           .request_path = "/file.bin",
                                           .type = TransferType::Upload,
                                           .is_new_file = true,
                                       });
        assert(transfer.write_at(test::bytes_of("abc"), 0) == 3);
        assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("xyz"), 10); }) ==
               ErrorCode::InvalidOffset);
        assert(transfer.bytes_received() == 3);
        assert(transfer.error()->code() == ErrorCode::InvalidOffset);
        assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::InvalidOffset);
        assert(connection->transfer_count() == 0);
    }

    void test_min_write_offset()
    {
        test::TempDir dir("sftpgate_transfer_min_offset");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        test::write_file(dir.path() / "resume.bin", "0123");
        const auto real = connection->fs().resolve_path("/resume.bin");
        auto created = connection->fs().create(real, CreateOptions{.truncate = false});

        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(created.file),
                                           .fs_path = real,
                                           .request_path = "/resume.bin",
                                           .type = TransferType::Upload,
                                           .min_write_offset = 4,
                                           .initial_size = 4,
                                       });
        assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("x"), 2); }) ==
               ErrorCode::InvalidOffset);
    }

    void test_quota_limits()
    {
        test::TempDir dir("sftpgate_transfer_quota");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);

        {
            auto target = create_upload(*connection, "/limited.bin", false);
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/limited.bin",
                                               .type = TransferType::Upload,
                                               .max_write_size = 4,
                                               .is_new_file = true,
                                           });
            assert(transfer.write_at(test::bytes_of("1234"), 0) == 4);
            assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("5"), 4); }) ==
                   ErrorCode::QuotaExceeded);
            assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::QuotaExceeded);
            assert(connection->transfer_count() == 0);
            // The partial upload is removed and nothing is charged.
            assert(!std::filesystem::exists(target.real));
            assert(quota.user_usage("alice").files == 0);
            assert(quota.user_usage("alice").size == 0);
        }

        {
            auto target = create_upload(*connection, "/denied.bin", false);
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/denied.bin",
                                               .type = TransferType::Upload,
                                               .max_write_size = -1,
                                               .is_new_file = true,
                                           });
            assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("a"), 0); }) ==
                   ErrorCode::QuotaExceeded);
            assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::QuotaExceeded);
            assert(connection->transfer_count() == 0);
            assert(!std::filesystem::exists(target.real));
        }
    }

    void test_atomic_upload()
    {
        test::TempDir dir("sftpgate_transfer_atomic");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota, UploadMode::Atomic);
        assert(connection->is_atomic_upload_enabled());

        {
            auto target = create_upload(*connection, "/atomic.txt", true);
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/atomic.txt",
                                               .type = TransferType::Upload,
                                               .is_new_file = true,
                                           });
            assert(transfer.write_at(test::bytes_of("data"), 0) == 4);
            assert(!std::filesystem::exists(target.real));
            transfer.close();
            assert(test::read_file(target.real) == "data");
            assert(count_entries(dir.path()) == 1);
        }

        {
            auto target = create_upload(*connection, "/failed.txt", true);
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/failed.txt",
                                               .type = TransferType::Upload,
                                               .is_new_file = true,
                                           });
            assert(transfer.write_at(test::bytes_of("partial"), 0) == 7);
            transfer.transfer_error(Error(ErrorCode::GenericFailure, "injected failure"));
            // Only the first error is kept.
            transfer.transfer_error(Error(ErrorCode::Eof, "later failure"));
            bool caught = false;
            try
            {
                transfer.close();
            }
            catch (const Error &error)
            {
                caught = error.code() == ErrorCode::GenericFailure &&
                         std::string(error.what()).find("injected failure") != std::string::npos;
            }
            assert(caught);
            assert(connection->transfer_count() == 0);
            // Neither the destination nor the temporary file survive.
            assert(!std::filesystem::exists(target.real));
            assert(count_entries(dir.path()) == 1);
        }
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 4);
    }

    void test_atomic_overwrite_over_quota()
    {
        test::TempDir dir("sftpgate_transfer_atomic_quota");
        test::write_file(dir.path() / "keep.txt", "0123456789");
        QuotaTracker quota;
        quota.update_user("alice", 1, 10);
        auto connection = test::make_connection(test::make_user(dir.path()), quota, UploadMode::Atomic);
        auto target = create_upload(*connection, "/keep.txt", true);
        {
            Transfer transfer(*connection, TransferParams{
                                               .file = std::move(target.created.file),
                                               .fs_path = target.real,
                                               .request_path = "/keep.txt",
                                               .type = TransferType::Upload,
                                               .initial_size = 10,
                                               .max_write_size = 12,
                                           });
            assert(transfer.write_at(test::bytes_of("0123456789"), 0) == 10);
            assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("abc"), 10); }) ==
                   ErrorCode::QuotaExceeded);
            assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::QuotaExceeded);
            assert(connection->transfer_count() == 0);
        }
        // The temporary file is gone and the original keeps its usage.
        assert(test::read_file(target.real) == "0123456789");
        assert(count_entries(dir.path()) == 1);
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 10);
    }

    void test_concurrent_close()
    {
        test::TempDir dir("sftpgate_transfer_concurrent_close");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        auto target = create_upload(*connection, "/race.txt", false);
        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(target.created.file),
                                           .fs_path = target.real,
                                           .request_path = "/race.txt",
                                           .type = TransferType::Upload,
                                           .is_new_file = true,
                                       });
        assert(transfer.write_at(test::bytes_of("12345"), 0) == 5);

        std::atomic<int> succeeded{0};
        std::atomic<int> already_closed{0};
        auto close_once = [&]
        {
            const auto code = test::error_code_of([&] { transfer.close(); });
            if (!code)
            {
                ++succeeded;
            }
            else if (*code == ErrorCode::TransferClosed)
            {
                ++already_closed;
            }
        };
        std::thread first(close_once);
        std::thread second(close_once);
        first.join();
        second.join();

        assert(succeeded == 1);
        assert(already_closed == 1);
        assert(connection->transfer_count() == 0);
        // The quota is charged by the winning close only.
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 5);
    }

    void test_atomic_upload_with_resume_keeps_partial_data()
    {
        test::TempDir dir("sftpgate_transfer_atomic_resume");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota, UploadMode::AtomicWithResume);
        auto target = create_upload(*connection, "/resumable.txt", true);
        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(target.created.file),
                                           .fs_path = target.real,
                                           .request_path = "/resumable.txt",
                                           .type = TransferType::Upload,
                                           .is_new_file = true,
                                       });
        assert(transfer.write_at(test::bytes_of("part"), 0) == 4);
        transfer.transfer_error(Error(ErrorCode::Eof, "connection lost"));
        assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::Eof);
        assert(connection->transfer_count() == 0);
        assert(test::read_file(target.real) == "part");
    }

    void test_size_mismatch()
    {
        test::TempDir dir("sftpgate_transfer_size");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        auto target = create_upload(*connection, "/short.txt", false);
        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(target.created.file),
                                           .fs_path = target.real,
                                           .request_path = "/short.txt",
                                           .type = TransferType::Upload,
                                           .is_new_file = true,
                                           .expected_size = 10,
                                       });
        assert(transfer.write_at(test::bytes_of("abc"), 0) == 3);
        bool caught = false;
        try
        {
            transfer.close();
        }
        catch (const Error &error)
        {
            caught = error.code() == ErrorCode::GenericFailure &&
                     std::string(error.what()).find("size mismatch") != std::string::npos;
        }
        assert(caught);
    }

    void test_download_and_cancel()
    {
        test::TempDir dir("sftpgate_transfer_download");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        test::write_file(dir.path() / "source.txt", "download me");
        const auto real = connection->fs().resolve_path("/source.txt");
        auto opened = connection->fs().open(real, 0);

        int cancelled = 0;
        Transfer transfer(*connection, TransferParams{
                                           .file = std::move(opened.file),
                                           .cancel = [&cancelled] { ++cancelled; },
                                           .fs_path = real,
                                           .request_path = "/source.txt",
                                           .type = TransferType::Download,
                                       });
        std::vector<std::uint8_t> buffer(64);
        const auto count = transfer.read_at(buffer, 0);
        assert(test::string_of(std::span<const std::uint8_t>(buffer.data(), count)) == "download me");
        assert(transfer.read_at(buffer, count) == 0);
        assert(transfer.bytes_sent() == 11);

        transfer.transfer_error(Error(ErrorCode::GenericFailure, "client went away"));
        transfer.transfer_error(Error(ErrorCode::GenericFailure, "again"));
        assert(cancelled == 1);
        assert(test::error_code_of([&] { transfer.close(); }) == ErrorCode::GenericFailure);
        // Downloads never touch the quota.
        assert(quota.user_usage("alice").files == 0);
    }

    void test_read_error_is_reported()
    {
        test::TempDir dir("sftpgate_transfer_read_error");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        Transfer transfer(*connection, TransferParams{
                                           .fs_path = dir.path() / "x",
                                           .request_path = "/x",
                                           .type = TransferType::Upload,
                                           .read_error = Error(ErrorCode::Unsupported, "reads are not supported"),
                                       });
        std::vector<std::uint8_t> buffer(4);
        assert(test::error_code_of([&] { (void)transfer.read_at(buffer, 0); }) == ErrorCode::Unsupported);
        assert(test::error_code_of([&] { (void)transfer.write_at(test::bytes_of("x"), 0); }) == ErrorCode::Unsupported);
    }

    void test_copy_from_reader_to_writer()
    {
        test::TempDir dir("sftpgate_transfer_copy");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);

        {
            test::MockChannel source(std::string(kCopyBufferSize * 2 + 17, 'z'));
            test::MockChannel destination;
            Transfer transfer(*connection, TransferParams{.request_path = "/", .type = TransferType::Download});
            const auto result = transfer.copy_from_reader_to_writer(destination, source);
            assert(!result.error);
            assert(result.written == kCopyBufferSize * 2 + 17);
            assert(destination.output().size() == result.written);
            assert(transfer.bytes_sent() == result.written);
            assert(connection->transfer_count() == 0);
        }

        {
            test::MockChannel source("0123456789");
            test::MockChannel destination;
            Transfer transfer(*connection, TransferParams{
                                               .request_path = "/",
                                               .type = TransferType::Upload,
                                               .max_write_size = 4,
                                           });
            const auto result = transfer.copy_from_reader_to_writer(destination, source);
            assert(result.error && result.error->code() == ErrorCode::QuotaExceeded);
            assert(transfer.error()->code() == ErrorCode::QuotaExceeded);
        }

        {
            test::MockChannel source("payload");
            test::MockChannel destination;
            destination.short_write = true;
            Transfer transfer(*connection, TransferParams{.request_path = "/", .type = TransferType::Download});
            const auto result = transfer.copy_from_reader_to_writer(destination, source);
            assert(result.error && result.error->code() == ErrorCode::ShortWrite);
        }

        {
            // A failed copy records the error through the cancellation path, once.
            test::MockChannel source("abc");
            test::MockChannel destination;
            destination.write_error = Error(ErrorCode::GenericFailure, "channel closed");
            int cancelled = 0;
            Transfer transfer(*connection, TransferParams{
                                               .cancel = [&cancelled] { ++cancelled; },
                                               .request_path = "/",
                                               .type = TransferType::Download,
                                           });
            const auto result = transfer.copy_from_reader_to_writer(destination, source);
            assert(result.error && result.error->code() == ErrorCode::GenericFailure);
            assert(cancelled == 1);
            assert(transfer.error()->code() == ErrorCode::GenericFailure);
            transfer.transfer_error(Error(ErrorCode::Eof, "later"));
            assert(cancelled == 1);
            assert(transfer.error()->code() == ErrorCode::GenericFailure);
        }

        {
            test::MockChannel source;
            source.read_error = Error(ErrorCode::Eof, "channel reset");
            test::MockChannel destination;
            Transfer transfer(*connection, TransferParams{.request_path = "/", .type = TransferType::Upload,
                                                          .max_write_size = -1});
            const auto result = transfer.copy_from_reader_to_writer(destination, source);
            assert(result.error && result.error->code() == ErrorCode::QuotaExceeded);
        }
    }

} // namespace

void run_transfer_tests()
{
    test_upload_updates_quota();
    test_invalid_offset_without_resume();
    test_min_write_offset();
    test_quota_limits();
    test_atomic_upload();
    test_atomic_overwrite_over_quota();
    test_concurrent_close();
    test_atomic_upload_with_resume_keeps_partial_data();
    test_size_mismatch();
    test_download_and_cancel();
    test_read_error_is_reported();
    test_copy_from_reader_to_writer();
}
