#include <cassert>
#include <csignal>
#include <filesystem>
#include <string>
#include <vector>

#include "sftpgate/server/connection_registry.hpp"
#include "sftpgate/server/process.hpp"
#include "sftpgate/server/ssh_command.hpp"

#include "test_support.hpp"

using namespace sftpgate;
using namespace sftpgate::server;

namespace
{

    std::optional<ErrorCode> run_command(const std::shared_ptr<Connection> &connection, test::MockChannel &channel,
                                         const std::string &payload)
    {
        ConnectionRegistry registry;
        const auto parsed = parse_command_payload(payload);
        auto result = test::error_code_of([&] { dispatch_exec_command(connection, channel, registry, parsed); });
        assert(registry.count() == 0);
        return result;
    }

    std::string read_all(Reader &reader)
    {
        std::string output;
        std::vector<std::uint8_t> buffer(256);
        while (true)
        {
            const auto count = reader.read(buffer);
            if (count == 0)
            {
                return output;
            }
            output.append(reinterpret_cast<const char *>(buffer.data()), count);
        }
    }

    void test_classify_and_enable()
    {
        assert(classify_command("scp").kind == CommandKind::Scp);
        assert(classify_command("sha256sum").kind == CommandKind::Hash);
        assert(classify_command("sha256sum").algorithm == digest::Algorithm::Sha256);
        assert(classify_command("git-upload-pack").kind == CommandKind::GitUploadPack);
        assert(classify_command("sftpgo-copy").kind == CommandKind::Copy);
        assert(classify_command("sftpgo-remove").kind == CommandKind::Remove);
        assert(classify_command("rm").kind == CommandKind::Unsupported);
        assert(supported_ssh_commands().size() == 14);

        const std::vector<std::string> defaults{"md5sum", "sha1sum", "cd", "pwd", "scp"};
        assert(is_command_enabled("md5sum", defaults));
        assert(!is_command_enabled("rsync", defaults));
        assert(is_command_enabled("rsync", {"*"}));
        assert(!is_command_enabled("bash", {"*"}));
        assert(!is_command_enabled("bash", {"bash"}));
    }

    void test_builtin_commands()
    {
        test::TempDir dir("sftpgate_ssh_builtin");
        test::write_file(dir.path() / "file.txt", "abc");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);

        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "md5sum /file.txt"));
            assert(channel.output() == "900150983cd24fb0d6963f7d28e17f72  /file.txt\n");
            assert(channel.exit_status() == 0u);
            assert(connection->protocol() == Protocol::Ssh);
            assert(connection->command() == "md5sum /file.txt");
        }
        {
            test::MockChannel channel("abc");
            assert(!run_command(connection, channel, "sha256sum"));
            assert(channel.output() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad  -\n");
        }
        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "pwd"));
            assert(channel.output() == "/\n");
            test::MockChannel cd_channel;
            assert(!run_command(connection, cd_channel, "cd /anywhere"));
            assert(cd_channel.output().empty());
            assert(cd_channel.exit_status() == 0u);
        }
        {
            test::MockChannel channel;
            assert(run_command(connection, channel, "sha1sum /missing.txt") == ErrorCode::NotFound);
            assert(channel.output().starts_with("sha1sum: /missing.txt "));
            assert(channel.exit_status() == 1u);
        }
        {
            test::MockChannel channel;
            assert(run_command(connection, channel, "ls -la") == ErrorCode::Unsupported);
        }
        {
            User user = test::make_user(dir.path());
            user.extension_filters.push_back(ExtensionsFilter{.path = "/", .allowed = {".zip"}, .denied = {}});
            auto filtered = test::make_connection(user, quota);
            test::MockChannel channel;
            assert(run_command(filtered, channel, "md5sum /file.txt") == ErrorCode::PermissionDenied);
        }
        {
            auto no_list = test::make_connection(test::make_user(dir.path(), {"download"}), quota);
            test::MockChannel channel;
            assert(run_command(no_list, channel, "md5sum /file.txt") == ErrorCode::PermissionDenied);
        }
    }

    void test_scp_dispatch()
    {
        test::TempDir dir("sftpgate_ssh_scp_dispatch");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        test::MockChannel channel(std::string("C0644 2 up.txt\nok") + std::string(1, '\0'));
        assert(!run_command(connection, channel, "scp -t /"));
        assert(connection->protocol() == Protocol::Scp);
        assert(test::read_file(dir.path() / "up.txt") == "ok");
    }

    void test_system_command_arguments()
    {
        test::TempDir dir("sftpgate_ssh_system_args");
        std::filesystem::create_directories(dir.path() / "home" / "dir");
        const auto home = dir.path() / "home";
        QuotaTracker quota;
        ConnectionRegistry registry;
        test::MockChannel channel;

        {
            auto connection = test::make_connection(test::make_user(home), quota);
            SshCommand rsync(connection, channel, registry, "rsync", {"--server", "-a", "/dir/"});
            const auto command = rsync.system_command();
            assert(command.argv.size() == 5);
            assert(command.argv[0] == "rsync");
            assert(command.argv[1] == "--safe-links");
            assert(command.argv[2] == "--server");
            assert(command.argv[4].ends_with("/dir/"));
            assert(command.argv[4].starts_with(home.string()));
            assert(command.quota_check_path == "/dir/quota-check");
        }
        {
            auto connection = test::make_connection(
                test::make_user(home, {"list", "download", "upload", "create_dirs", "overwrite", "delete"}), quota);
            SshCommand rsync(connection, channel, registry, "rsync", {"--server", "/dir/new.txt"});
            const auto command = rsync.system_command();
            assert(command.argv[1] == "--munge-links");
            assert(command.quota_check_path == "/dir/new.txt");
        }
        {
            auto connection = test::make_connection(test::make_user(home), quota);
            SshCommand rsync(connection, channel, registry, "rsync", {"--safe-links", "/dir"});
            assert(rsync.system_command().argv.size() == 3);
        }

        User with_folder = test::make_user(home);
        with_folder.virtual_folders.push_back(VirtualFolder{.name = "vf", .virtual_path = "/vdir",
                                                            .mapped_path = dir.path() / "mapped"});
        std::filesystem::create_directories(dir.path() / "mapped" / "sub");
        auto folder_connection = test::make_connection(with_folder, quota);
        {
            SshCommand git(folder_connection, channel, registry, "git-receive-pack", {"/"});
            bool caught = false;
            try
            {
                (void)git.system_command();
            }
            catch (const Error &error)
            {
                caught = error.code() == ErrorCode::Unsupported &&
                         std::string(error.what()) == "unsupported configuration";
            }
            assert(caught);
        }
        {
            SshCommand rsync(folder_connection, channel, registry, "rsync", {"/vdir/sub"});
            assert(test::error_code_of([&] { (void)rsync.system_command(); }) == ErrorCode::Unsupported);
            SshCommand git(folder_connection, channel, registry, "git-upload-pack", {"/dir"});
            assert(git.system_command().argv.size() == 2);
        }

        User filtered = test::make_user(home);
        filtered.extension_filters.push_back(ExtensionsFilter{.path = "/dir", .allowed = {}, .denied = {".exe"}});
        auto filtered_connection = test::make_connection(filtered, quota);
        SshCommand git(filtered_connection, channel, registry, "git-upload-pack", {"/dir/repo.git"});
        assert(test::error_code_of([&] { (void)git.system_command(); }) == ErrorCode::Unsupported);
    }

    void test_system_command_execution()
    {
        test::TempDir dir("sftpgate_ssh_system_exec");
        const auto work = dir.path() / "work";
        std::filesystem::create_directories(work);
        QuotaTracker quota;
        ConnectionRegistry registry;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);

        {
            test::MockChannel channel("ping");
            SshCommand command(connection, channel, registry, "git-upload-pack", {});
            command.execute_system_command(SystemCommand{.argv = {"cat"}, .fs_path = work, .quota_check_path = "/work/x"});
            assert(channel.output() == "ping");
            assert(channel.exit_status() == 0u);
        }
        {
            test::MockChannel channel;
            SshCommand command(connection, channel, registry, "git-upload-pack", {});
            const auto script = "printf 12345 > '" + (work / "out.bin").string() + "'; echo done >&2; exit 3";
            assert(test::error_code_of([&] {
                       command.execute_system_command(
                           SystemCommand{.argv = {"sh", "-c", script}, .fs_path = work, .quota_check_path = "/work/x"});
                   }) == ErrorCode::GenericFailure);
            assert(channel.stderr_output() == "done\n");
            assert(channel.exit_status() == 1u);
            // Files written by the child are charged even when it fails.
            assert(quota.user_usage("alice").files == 1);
            assert(quota.user_usage("alice").size == 5);
        }
        {
            test::MockChannel channel;
            SshCommand command(connection, channel, registry, "rsync", {});
            assert(test::error_code_of([&] {
                       command.execute_system_command(SystemCommand{
                           .argv = {"sftpgate-no-such-program"}, .fs_path = work, .quota_check_path = "/work/x"});
                   }) == ErrorCode::NotFound);
        }
        {
            auto remote = test::make_connection(test::make_user(dir.path()), quota, UploadMode::Standard,
                                                std::make_shared<test::RemoteFilesystem>(dir.path()));
            test::MockChannel channel;
            assert(run_command(remote, channel, "git-upload-pack /work") == ErrorCode::Unsupported);
        }
        {
            User limited = test::make_user(dir.path());
            limited.quota_files = 1;
            QuotaTracker full;
            full.update_user("alice", 1, 0);
            auto connection_full = test::make_connection(limited, full);
            test::MockChannel channel;
            assert(run_command(connection_full, channel, "rsync --server /work") == ErrorCode::QuotaExceeded);
        }
    }

    void test_size_for_path()
    {
        test::TempDir dir("sftpgate_ssh_size");
        test::write_file(dir.path() / "tree" / "a.bin", "123");
        test::write_file(dir.path() / "tree" / "deep" / "b.bin", "4567");
        QuotaTracker quota;
        ConnectionRegistry registry;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);
        test::MockChannel channel;
        SshCommand command(connection, channel, registry, "rsync", {});

        const auto tree = command.size_for_path(dir.path() / "tree");
        assert(tree.files == 2 && tree.size == 7);
        const auto single = command.size_for_path(dir.path() / "tree" / "a.bin");
        assert(single.files == 1 && single.size == 3);
        const auto missing = command.size_for_path(dir.path() / "nothing");
        assert(missing.files == 0 && missing.size == 0);
    }

    void test_copy_command()
    {
        test::TempDir dir("sftpgate_ssh_copy");
        test::write_file(dir.path() / "src" / "a.txt", "aaaa");
        test::write_file(dir.path() / "src" / "nested" / "b.txt", "bb");
        test::write_file(dir.path() / "single.txt", "single");
        std::filesystem::create_directories(dir.path() / "target");
        QuotaTracker quota;
        auto connection = test::make_connection(test::make_user(dir.path()), quota);

        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "sftpgo-copy /src /dst"));
            assert(channel.output() == "OK\n");
            assert(test::read_file(dir.path() / "dst" / "nested" / "b.txt") == "bb");
            assert(quota.user_usage("alice").files == 2);
            assert(quota.user_usage("alice").size == 6);
        }
        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "sftpgo-copy /single.txt /target/"));
            assert(test::read_file(dir.path() / "target" / "single.txt") == "single");
        }
        {
            test::MockChannel channel;
            assert(run_command(connection, channel, "sftpgo-copy /src /dst") == ErrorCode::GenericFailure);
            assert(channel.output().find("cannot overwrite") != std::string::npos);
        }
        {
            test::MockChannel channel;
            assert(run_command(connection, channel, "sftpgo-copy /src") == ErrorCode::SyntaxError);
        }
        {
            User limited = test::make_user(dir.path());
            limited.quota_files = 3;
            QuotaTracker usage;
            usage.update_user("alice", 2, 0);
            auto limited_connection = test::make_connection(limited, usage);
            test::MockChannel channel;
            assert(run_command(limited_connection, channel, "sftpgo-copy /src /other") == ErrorCode::QuotaExceeded);
            assert(!std::filesystem::exists(dir.path() / "other"));
        }
        {
            User restricted = test::make_user(dir.path(), {"list", "download"});
            restricted.permissions["/target"] = {"*"};
            auto restricted_connection = test::make_connection(restricted, quota);
            test::MockChannel channel;
            assert(run_command(restricted_connection, channel, "sftpgo-copy /single.txt /copy.txt") ==
                   ErrorCode::PermissionDenied);
            test::MockChannel allowed;
            assert(!run_command(restricted_connection, allowed, "sftpgo-copy /single.txt /target/copy.txt"));
        }
    }

    void test_remove_command()
    {
        test::TempDir dir("sftpgate_ssh_remove");
        test::write_file(dir.path() / "gone" / "a.txt", "12345");
        test::write_file(dir.path() / "gone" / "b" / "c.txt", "1");
        test::write_file(dir.path() / "file.txt", "abc");
        std::filesystem::create_directories(dir.path() / "mapped");
        User user = test::make_user(dir.path());
        user.virtual_folders.push_back(VirtualFolder{.name = "vf", .virtual_path = "/parent/vf",
                                                     .mapped_path = dir.path() / "mapped"});
        std::filesystem::create_directories(dir.path() / "parent");
        QuotaTracker quota;
        quota.update_user("alice", 3, 9);
        auto connection = test::make_connection(user, quota);

        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "sftpgo-remove /gone/"));
            assert(channel.output() == "OK\n");
            assert(!std::filesystem::exists(dir.path() / "gone"));
            assert(quota.user_usage("alice").files == 1);
            assert(quota.user_usage("alice").size == 3);
        }
        {
            test::MockChannel channel;
            assert(!run_command(connection, channel, "sftpgo-remove /file.txt"));
            assert(quota.user_usage("alice").files == 0);
            assert(quota.user_usage("alice").size == 0);
        }
        {
            test::MockChannel channel;
            assert(run_command(connection, channel, "sftpgo-remove /") == ErrorCode::PermissionDenied);
            test::MockChannel parent;
            assert(run_command(connection, parent, "sftpgo-remove /parent") == ErrorCode::Unsupported);
            test::MockChannel folder;
            assert(run_command(connection, folder, "sftpgo-remove /parent/vf") == ErrorCode::Unsupported);
            test::MockChannel missing;
            assert(run_command(connection, missing, "sftpgo-remove /missing") == ErrorCode::NotFound);
            test::MockChannel usage;
            assert(run_command(connection, usage, "sftpgo-remove /a /b") == ErrorCode::SyntaxError);
        }
        {
            auto readonly = test::make_connection(test::make_user(dir.path(), {"list", "download"}), quota);
            test::write_file(dir.path() / "keep.txt", "k");
            test::MockChannel channel;
            assert(run_command(readonly, channel, "sftpgo-remove /keep.txt") == ErrorCode::PermissionDenied);
            assert(std::filesystem::exists(dir.path() / "keep.txt"));
        }
    }

    void test_child_process()
    {
        ChildProcess cat({"cat"});
        write_all(cat.stdin_writer(), "through the child");
        cat.close_stdin();
        assert(read_all(cat.stdout_reader()) == "through the child");
        assert(cat.wait() == 0);
        assert(cat.wait() == 0);

        ChildProcess failing({"sh", "-c", "echo err >&2; exit 7"});
        failing.close_stdin();
        assert(read_all(failing.stdout_reader()).empty());
        assert(read_all(failing.stderr_reader()) == "err\n");
        assert(failing.wait() == 7);

        ChildProcess sleeper({"sleep", "30"});
        sleeper.kill();
        assert(sleeper.wait() == 128 + SIGKILL);

        const auto cwd = std::filesystem::temp_directory_path();
        ChildProcess pwd({"pwd"}, cwd);
        const auto printed = read_all(pwd.stdout_reader());
        assert(std::filesystem::equivalent(printed.substr(0, printed.size() - 1), cwd));
        assert(pwd.wait() == 0);

        assert(test::error_code_of([] { ChildProcess missing({"sftpgate-no-such-program"}); }) == ErrorCode::NotFound);
    }

} // namespace

void run_ssh_command_tests()
{
    test_classify_and_enable();
    test_builtin_commands();
    test_scp_dispatch();
    test_system_command_arguments();
    test_system_command_execution();
    test_size_for_path();
    test_copy_command();
    test_remove_command();
    test_child_process();
}
