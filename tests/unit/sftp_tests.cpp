#include <cassert>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "sftpgate/server/sftp.hpp"

#include "test_support.hpp"

using namespace sftpgate;
using namespace sftpgate::server;

namespace
{

    constexpr std::uint32_t kWriteCreateTrunc = SSH_FXF_WRITE | SSH_FXF_CREAT | SSH_FXF_TRUNC;

    // SSH_FX_* status a failing request is answered with.
    template <typename Fn>
    std::uint32_t status_of(Fn &&fn)
    {
        const auto code = test::error_code_of(std::forward<Fn>(fn));
        return sftp::status_from_error(code.value_or(ErrorCode::Ok));
    }

    void write_text(SftpServer &server, const std::string &handle, std::uint64_t offset, std::string_view text)
    {
        server.write(handle, offset, test::bytes_of(text));
    }

    std::string read_text(SftpServer &server, const std::string &handle, std::uint64_t offset, std::size_t length)
    {
        std::vector<std::uint8_t> buffer(length);
        const auto count = server.read(handle, offset, buffer);
        return test::string_of(std::span<const std::uint8_t>(buffer.data(), count));
    }

    void test_upload_and_download()
    {
        test::TempDir dir("sftpgate_sftp_transfer");
        QuotaTracker quota;
        SftpServer server(test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard, nullptr,
                                                Protocol::Sftp));

        const auto handle = server.open("/upload.txt", kWriteCreateTrunc);
        assert(server.open_handles() == 1);
        write_text(server, handle, 0, "hello ");
        write_text(server, handle, 6, "world");
        assert(server.fstat(handle).size == 11);
        server.close(handle);
        assert(server.open_handles() == 0);
        assert(test::read_file(dir.path() / "upload.txt") == "hello world");
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 11);
        assert(status_of([&] { server.close(handle); }) == SSH_FX_FAILURE);

        const auto reading = server.open("/upload.txt", SSH_FXF_READ);
        assert(read_text(server, reading, 0, 5) == "hello");
        assert(read_text(server, reading, 6, 100) == "world");
        assert(read_text(server, reading, 11, 100).empty());
        assert(status_of([&] { write_text(server, reading, 0, "x"); }) == SSH_FX_PERMISSION_DENIED);
        server.close(reading);

        assert(server.stat("/upload.txt", true).size == 11);
        assert(status_of([&] { (void)server.stat("/missing", true); }) == SSH_FX_NO_SUCH_FILE);
        assert(status_of([&] { (void)server.open("/missing", SSH_FXF_READ); }) == SSH_FX_NO_SUCH_FILE);

        // Overwriting charges only the size difference.
        const auto overwrite = server.open("/upload.txt", kWriteCreateTrunc);
        write_text(server, overwrite, 0, "bye");
        server.close(overwrite);
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 3);

        // Resume appends after the existing content.
        const auto resume = server.open("/upload.txt", SSH_FXF_WRITE);
        write_text(server, resume, 3, "!!");
        server.close(resume);
        assert(test::read_file(dir.path() / "upload.txt") == "bye!!");
        assert(quota.user_usage("alice").size == 5);

        // Writing before the resume point fails, and close reports that first error.
        const auto rewind = server.open("/upload.txt", SSH_FXF_WRITE);
        assert(status_of([&] { write_text(server, rewind, 0, "no"); }) == SSH_FX_FAILURE);
        assert(status_of([&] { server.close(rewind); }) == SSH_FX_FAILURE);
        assert(server.open_handles() == 0);
        assert(test::read_file(dir.path() / "upload.txt") == "bye!!");
        assert(quota.user_usage("alice").size == 5);

        const auto exclusive = SSH_FXF_WRITE | SSH_FXF_CREAT | SSH_FXF_EXCL;
        assert(status_of([&] { (void)server.open("/upload.txt", exclusive); }) == SSH_FX_FAILURE);
    }

    void test_atomic_upload()
    {
        test::TempDir dir("sftpgate_sftp_atomic");
        QuotaTracker quota;
        SftpServer server(test::make_connection(test::make_user(dir.path()), quota, UploadMode::Atomic, nullptr,
                                                Protocol::Sftp));

        const auto handle = server.open("/atomic.bin", kWriteCreateTrunc | SSH_FXF_READ);
        write_text(server, handle, 0, "12345");
        assert(!std::filesystem::exists(dir.path() / "atomic.bin"));
        assert(status_of([&] { (void)read_text(server, handle, 0, 5); }) == SSH_FX_OP_UNSUPPORTED);
        assert(server.fstat(handle).size == 5);
        server.close(handle);
        assert(test::read_file(dir.path() / "atomic.bin") == "12345");

        // Handles left open when the client goes away are closed and committed.
        const auto dangling = server.open("/dangling.bin", kWriteCreateTrunc);
        write_text(server, dangling, 0, "abc");
        server.close_all_handles();
        assert(server.open_handles() == 0);
        assert(test::read_file(dir.path() / "dangling.bin") == "abc");

        std::size_t entries = 0;
        for ([[maybe_unused]] const auto &entry : std::filesystem::directory_iterator(dir.path()))
        {
            ++entries;
        }
        assert(entries == 2);
    }

    void test_permissions_and_quota()
    {
        test::TempDir dir("sftpgate_sftp_permissions");
        test::write_file(dir.path() / "existing.txt", "data");
        QuotaTracker quota;

        {
            SftpServer server(test::make_connection(test::make_user(dir.path(), {"list", "download"}), quota,
                                                    UploadMode::Standard, nullptr, Protocol::Sftp));
            assert(status_of([&] { (void)server.open("/new.txt", kWriteCreateTrunc); }) == SSH_FX_PERMISSION_DENIED);
            assert(status_of([&] { (void)server.open("/existing.txt", kWriteCreateTrunc); }) ==
                   SSH_FX_PERMISSION_DENIED);
            assert(status_of([&] { server.remove("/existing.txt"); }) == SSH_FX_PERMISSION_DENIED);
            assert(status_of([&] { server.mkdir("/dir"); }) == SSH_FX_PERMISSION_DENIED);
            assert(status_of([&] { server.rename("/existing.txt", "/moved.txt"); }) == SSH_FX_PERMISSION_DENIED);
            assert(status_of([&] { server.symlink("/existing.txt", "/link"); }) == SSH_FX_PERMISSION_DENIED);
            assert(server.open_handles() == 0);
        }
        {
            User user = test::make_user(dir.path());
            user.extension_filters.push_back(ExtensionsFilter{.path = "/", .allowed = {}, .denied = {".exe"}});
            SftpServer server(test::make_connection(user, quota, UploadMode::Standard, nullptr, Protocol::Sftp));
            assert(status_of([&] { (void)server.open("/setup.exe", kWriteCreateTrunc); }) == SSH_FX_PERMISSION_DENIED);
        }
        {
            SftpServer server(test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard,
                                                    std::make_shared<test::NoResumeFilesystem>(dir.path(), false),
                                                    Protocol::Sftp));
            assert(status_of([&] { (void)server.open("/existing.txt", SSH_FXF_WRITE); }) == SSH_FX_OP_UNSUPPORTED);
        }
        {
            User user = test::make_user(dir.path());
            user.quota_files = 1;
            QuotaTracker full;
            full.update_user("alice", 1, 4);
            SftpServer server(test::make_connection(user, full, UploadMode::Standard, nullptr, Protocol::Sftp));
            assert(test::error_code_of([&] { (void)server.open("/another.txt", kWriteCreateTrunc); }) ==
                   ErrorCode::QuotaExceeded);
            assert(sftp::status_from_error(ErrorCode::QuotaExceeded) == SSH_FX_FAILURE);
            assert(!std::filesystem::exists(dir.path() / "another.txt"));
        }
        {
            User user = test::make_user(dir.path());
            user.quota_size = 6;
            QuotaTracker usage;
            usage.update_user("alice", 1, 4);
            SftpServer server(test::make_connection(user, usage, UploadMode::Standard, nullptr, Protocol::Sftp));
            const auto handle = server.open("/small.txt", kWriteCreateTrunc);
            write_text(server, handle, 0, "12");
            assert(test::error_code_of([&] { write_text(server, handle, 2, "3"); }) == ErrorCode::QuotaExceeded);
            assert(test::error_code_of([&] { server.close(handle); }) == ErrorCode::QuotaExceeded);
            assert(!std::filesystem::exists(dir.path() / "small.txt"));
            assert(usage.user_usage("alice").files == 1);
            assert(usage.user_usage("alice").size == 4);
        }
    }

    void test_directories()
    {
        test::TempDir dir("sftpgate_sftp_dirs");
        test::write_file(dir.path() / "home" / "a.txt", "aa");
        test::write_file(dir.path() / "home" / "docs" / "b.txt", "b");
        std::filesystem::create_directories(dir.path() / "mapped");
        User user = test::make_user(dir.path() / "home");
        user.virtual_folders.push_back(VirtualFolder{.name = "shared", .virtual_path = "/shared",
                                                     .mapped_path = dir.path() / "mapped"});
        QuotaTracker quota;
        quota.update_user("alice", 2, 3);
        SftpServer server(test::make_connection(user, quota, UploadMode::Standard, nullptr, Protocol::Sftp));

        const auto handle = server.opendir("/");
        std::set<std::string> names;
        for (auto batch = server.readdir(handle); !batch.empty(); batch = server.readdir(handle))
        {
            for (const auto &info : batch)
            {
                names.insert(info.name);
            }
        }
        assert((names == std::set<std::string>{"a.txt", "docs", "shared"}));
        server.close(handle);
        assert(status_of([&] { (void)server.opendir("/a.txt"); }) == SSH_FX_FAILURE);

        assert(server.realpath("/docs/../docs/./") == "/docs");

        server.mkdir("/docs/new");
        assert(std::filesystem::is_directory(dir.path() / "home" / "docs" / "new"));
        server.rmdir("/docs/new");
        assert(!std::filesystem::exists(dir.path() / "home" / "docs" / "new"));
        assert(status_of([&] { server.rmdir("/shared"); }) == SSH_FX_PERMISSION_DENIED);
        assert(status_of([&] { server.rmdir("/"); }) == SSH_FX_PERMISSION_DENIED);
        assert(status_of([&] { server.remove("/docs"); }) == SSH_FX_FAILURE);

        server.rename("/a.txt", "/docs/a.txt");
        assert(std::filesystem::exists(dir.path() / "home" / "docs" / "a.txt"));
        assert(status_of([&] { server.rename("/docs/a.txt", "/docs/b.txt"); }) == SSH_FX_FAILURE);
        assert(status_of([&] { server.rename("/docs/a.txt", "/shared/a.txt"); }) == SSH_FX_OP_UNSUPPORTED);
        assert(status_of([&] { server.rename("/shared", "/elsewhere"); }) == SSH_FX_PERMISSION_DENIED);

        // A relative target is resolved against the link's directory.
        server.symlink("b.txt", "/docs/link");
        assert(server.readlink("/docs/link") == "/docs/b.txt");
        assert(server.stat("/docs/link", false).is_symlink());
        assert(server.stat("/docs/link", true).size == 1);

        server.remove("/docs/b.txt");
        assert(!std::filesystem::exists(dir.path() / "home" / "docs" / "b.txt"));
        assert(quota.user_usage("alice").files == 1);
        assert(quota.user_usage("alice").size == 2);
    }

    void test_readdir_batches()
    {
        test::TempDir dir("sftpgate_sftp_readdir");
        for (int i = 0; i < 150; ++i)
        {
            test::write_file(dir.path() / ("f" + std::to_string(i)), "x");
        }
        QuotaTracker quota;
        SftpServer server(test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard, nullptr,
                                                Protocol::Sftp));
        const auto handle = server.opendir("/");
        assert(server.readdir(handle).size() == 100);
        assert(server.readdir(handle).size() == 50);
        assert(server.readdir(handle).empty());
        assert(status_of([&] { (void)server.readdir("missing"); }) == SSH_FX_FAILURE);
        server.close(handle);
    }

    void test_setstat()
    {
        test::TempDir dir("sftpgate_sftp_setstat");
        test::write_file(dir.path() / "file.txt", "0123456789");
        QuotaTracker quota;
        quota.update_user("alice", 1, 10);
        SftpServer server(test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard, nullptr,
                                                Protocol::Sftp));

        sftp_attributes_struct truncate{};
        truncate.flags = SSH_FILEXFER_ATTR_SIZE;
        truncate.size = 4;
        server.setstat("/file.txt", truncate);
        assert(test::read_file(dir.path() / "file.txt") == "0123");
        assert(quota.user_usage("alice").size == 4);

        sftp_attributes_struct times{};
        times.flags = SSH_FILEXFER_ATTR_ACMODTIME;
        times.atime = 1700000000;
        times.mtime = 1700000000;
        server.setstat("/file.txt", times);
        struct stat st{};
        assert(::stat((dir.path() / "file.txt").c_str(), &st) == 0);
        assert(st.st_mtime == 1700000000);

        const auto handle = server.open("/file.txt", SSH_FXF_READ);
        sftp_attributes_struct mode{};
        mode.flags = SSH_FILEXFER_ATTR_PERMISSIONS;
        mode.permissions = 0600;
        server.fsetstat(handle, mode);
        assert(server.fstat(handle).permissions() == 0600);
        server.close(handle);

        SftpServer limited(test::make_connection(test::make_user(dir.path(), {"list", "download", "upload"}), quota,
                                                 UploadMode::Standard, nullptr, Protocol::Sftp));
        assert(status_of([&] { limited.setstat("/file.txt", mode); }) == SSH_FX_PERMISSION_DENIED);
        assert(status_of([&] { limited.setstat("/file.txt", truncate); }) == SSH_FX_PERMISSION_DENIED);
    }

    void test_attributes_and_long_name()
    {
        FileInfo info;
        info.name = "report.pdf";
        info.mode = S_IFREG | 0644u;
        info.size = 1234;
        info.uid = 1000;
        info.gid = 100;
        info.modified = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        info.accessed = info.modified;

        const auto attrs = sftp::attributes_from_info(info);
        assert((attrs.flags & SSH_FILEXFER_ATTR_SIZE) != 0);
        assert((attrs.flags & SSH_FILEXFER_ATTR_ACMODTIME) != 0);
        assert(attrs.size == 1234);
        assert(attrs.uid == 1000 && attrs.gid == 100);
        assert(attrs.permissions == (S_IFREG | 0644u));
        assert(attrs.mtime == 1700000000);

        const auto line = sftp::long_name(info);
        assert(line.starts_with("-rw-r--r-- 1 "));
        assert(line.ends_with(" report.pdf"));
        assert(line.find("1234") != std::string::npos);
        assert(line.find("Nov 14 22:13") != std::string::npos);

        info.mode = S_IFDIR | 0755u;
        assert(sftp::long_name(info).starts_with("drwxr-xr-x"));

        assert(sftp::status_from_error(ErrorCode::Ok) == SSH_FX_OK);
        assert(sftp::status_from_error(ErrorCode::NotFound) == SSH_FX_NO_SUCH_FILE);
        assert(sftp::status_from_error(ErrorCode::PermissionDenied) == SSH_FX_PERMISSION_DENIED);
        assert(sftp::status_from_error(ErrorCode::QuotaExceeded) == SSH_FX_FAILURE);
        assert(sftp::status_from_error(ErrorCode::Unsupported) == SSH_FX_OP_UNSUPPORTED);
        assert(sftp::status_from_error(ErrorCode::Eof) == SSH_FX_EOF);
    }

} // namespace

void run_sftp_tests()
{
    test_upload_and_download();
    test_atomic_upload();
    test_permissions_and_quota();
    test_directories();
    test_readdir_batches();
    test_setstat();
    test_attributes_and_long_name();
}
