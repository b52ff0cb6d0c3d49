#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/stat.h>

#include "sftpgate/server/pipe.hpp"
#include "sftpgate/server/user.hpp"

namespace sftpgate::server
{

    struct FileInfo
    {
        std::string name;
        std::uint64_t size{0};
        // st_mode: file type and permission bits.
        std::uint32_t mode{0};
        std::uint32_t uid{0};
        std::uint32_t gid{0};
        std::chrono::system_clock::time_point modified;
        std::chrono::system_clock::time_point accessed;

        bool is_dir() const noexcept;
        bool is_regular() const noexcept;
        bool is_symlink() const noexcept;
        std::uint32_t permissions() const noexcept { return mode & 07777u; }
    };

    // Random access handle; read_at returns fewer bytes than requested only at end of file.
    class File
    {
    public:
        virtual ~File() = default;

        virtual const std::filesystem::path &name() const = 0;
        virtual std::size_t read_at(std::span<std::uint8_t> buffer, std::uint64_t offset) = 0;
        virtual std::size_t write_at(std::span<const std::uint8_t> data, std::uint64_t offset) = 0;
        virtual void close() = 0;
    };

    // Exactly one of file/reader is set.
    struct OpenResult
    {
        std::unique_ptr<File> file;
        std::shared_ptr<PipeReader> reader;
        std::function<void()> cancel;
    };

    // Exactly one of file/writer is set.
    struct CreateResult
    {
        std::unique_ptr<File> file;
        std::shared_ptr<PipeWriter> writer;
        std::function<void()> cancel;
    };

    struct CreateOptions
    {
        bool truncate{true};
        bool read{false};
    };

    struct DirSize
    {
        int files{0};
        std::int64_t size{0};
    };

    enum class WalkAction : std::uint8_t
    {
        Continue,
        Stop
    };

    using WalkFunction = std::function<WalkAction(const std::filesystem::path &, const FileInfo &)>;

    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual std::string name() const = 0;
        virtual bool is_local() const noexcept = 0;
        virtual bool is_upload_resume_supported() const noexcept = 0;
        virtual bool is_atomic_upload_supported() const noexcept = 0;

        // Virtual path to real path; throws PathError when the result escapes its root.
        virtual std::filesystem::path resolve_path(std::string_view virtual_path) const = 0;
        virtual std::string relative_path(const std::filesystem::path &real_path) const = 0;

        virtual FileInfo stat(const std::filesystem::path &path) const = 0;
        virtual FileInfo lstat(const std::filesystem::path &path) const = 0;
        virtual OpenResult open(const std::filesystem::path &path, std::uint64_t offset) = 0;
        virtual CreateResult create(const std::filesystem::path &path, CreateOptions options) = 0;
        virtual void rename(const std::filesystem::path &source, const std::filesystem::path &target) = 0;
        virtual void remove(const std::filesystem::path &path, bool is_dir) = 0;
        virtual void remove_all(const std::filesystem::path &path) = 0;
        virtual void mkdir(const std::filesystem::path &path) = 0;
        virtual void symlink(const std::filesystem::path &target, const std::filesystem::path &link) = 0;
        virtual std::filesystem::path readlink(const std::filesystem::path &path) const = 0;
        virtual void chmod(const std::filesystem::path &path, std::uint32_t mode) = 0;
        virtual void chown(const std::filesystem::path &path, std::uint32_t uid, std::uint32_t gid) = 0;
        virtual void chtimes(const std::filesystem::path &path, std::chrono::system_clock::time_point accessed,
                             std::chrono::system_clock::time_point modified) = 0;
        virtual void truncate(const std::filesystem::path &path, std::uint64_t size) = 0;
        virtual std::vector<FileInfo> read_dir(const std::filesystem::path &path) const = 0;
        // Pre-order walk using lstat; the callback may stop it early.
        virtual void walk(const std::filesystem::path &root, const WalkFunction &callback) const = 0;
        virtual DirSize dir_size(const std::filesystem::path &path) const = 0;
        virtual void copy_tree(const std::filesystem::path &source, const std::filesystem::path &target) = 0;
        virtual std::filesystem::path atomic_upload_path(const std::filesystem::path &path) const = 0;
    };

    class OsFile : public File
    {
    public:
        OsFile(int fd, std::filesystem::path name);
        ~OsFile() override;

        OsFile(const OsFile &) = delete;
        OsFile &operator=(const OsFile &) = delete;

        const std::filesystem::path &name() const override { return name_; }
        std::size_t read_at(std::span<std::uint8_t> buffer, std::uint64_t offset) override;
        std::size_t write_at(std::span<const std::uint8_t> data, std::uint64_t offset) override;
        void close() override;

    private:
        int fd_;
        std::filesystem::path name_;
    };

    class OsFilesystem : public Filesystem
    {
    public:
        explicit OsFilesystem(std::filesystem::path root_dir, std::vector<VirtualFolder> virtual_folders = {});

        std::string name() const override;
        bool is_local() const noexcept override { return true; }
        bool is_upload_resume_supported() const noexcept override { return true; }
        bool is_atomic_upload_supported() const noexcept override { return true; }

        std::filesystem::path resolve_path(std::string_view virtual_path) const override;
        std::string relative_path(const std::filesystem::path &real_path) const override;

        FileInfo stat(const std::filesystem::path &path) const override;
        FileInfo lstat(const std::filesystem::path &path) const override;
        OpenResult open(const std::filesystem::path &path, std::uint64_t offset) override;
        CreateResult create(const std::filesystem::path &path, CreateOptions options) override;
        void rename(const std::filesystem::path &source, const std::filesystem::path &target) override;
        void remove(const std::filesystem::path &path, bool is_dir) override;
        void remove_all(const std::filesystem::path &path) override;
        void mkdir(const std::filesystem::path &path) override;
        void symlink(const std::filesystem::path &target, const std::filesystem::path &link) override;
        std::filesystem::path readlink(const std::filesystem::path &path) const override;
        void chmod(const std::filesystem::path &path, std::uint32_t mode) override;
        void chown(const std::filesystem::path &path, std::uint32_t uid, std::uint32_t gid) override;
        void chtimes(const std::filesystem::path &path, std::chrono::system_clock::time_point accessed,
                     std::chrono::system_clock::time_point modified) override;
        void truncate(const std::filesystem::path &path, std::uint64_t size) override;
        std::vector<FileInfo> read_dir(const std::filesystem::path &path) const override;
        void walk(const std::filesystem::path &root, const WalkFunction &callback) const override;
        DirSize dir_size(const std::filesystem::path &path) const override;
        void copy_tree(const std::filesystem::path &source, const std::filesystem::path &target) override;
        std::filesystem::path atomic_upload_path(const std::filesystem::path &path) const override;

        const std::filesystem::path &root_dir() const noexcept { return root_dir_; }

    private:
        struct MappedPath
        {
            std::filesystem::path base;
            std::filesystem::path real;
        };

        MappedPath map_virtual_path(std::string_view virtual_path) const;
        void check_inside_base(const std::filesystem::path &real, const std::filesystem::path &base,
                               std::string_view virtual_path) const;

        std::filesystem::path root_dir_;
        std::vector<VirtualFolder> virtual_folders_;
    };

    // Prefix of every atomic upload temp file.
    inline constexpr std::string_view kAtomicUploadPrefix = ".sftpgate-upload.";

    FileInfo file_info_from_stat(const std::string &name, const struct stat &st);

} // namespace sftpgate::server
