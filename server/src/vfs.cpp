#include "sftpgate/server/vfs.hpp"

#include <algorithm>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include "sftpgate/crypto.hpp"
#include "sftpgate/error_codes.hpp"
#include "sftpgate/server/vpath.hpp"

namespace sftpgate::server
{

    namespace
    {

        [[noreturn]] void throw_fs_error(const std::error_code &ec, const std::string &context)
        {
            throw Error(error_code_from_errno(ec.value()), context + ": " + ec.message());
        }

        std::chrono::system_clock::time_point to_time_point(const struct timespec &spec)
        {
            using namespace std::chrono;
            return system_clock::time_point(duration_cast<system_clock::duration>(seconds(spec.tv_sec) +
                                                                                  nanoseconds(spec.tv_nsec)));
        }

        struct timespec to_timespec(std::chrono::system_clock::time_point time)
        {
            using namespace std::chrono;
            const auto since_epoch = duration_cast<nanoseconds>(time.time_since_epoch());
            struct timespec spec{};
            spec.tv_sec = static_cast<time_t>(duration_cast<seconds>(since_epoch).count());
            spec.tv_nsec = static_cast<long>((since_epoch - seconds(spec.tv_sec)).count());
            return spec;
        }

        bool is_inside(const std::filesystem::path &path, const std::filesystem::path &base)
        {
            const auto relative = path.lexically_normal().lexically_relative(base.lexically_normal());
            return !relative.empty() && *relative.begin() != "..";
        }

    } // namespace

    bool FileInfo::is_dir() const noexcept
    {
        return S_ISDIR(mode);
    }

    bool FileInfo::is_regular() const noexcept
    {
        return S_ISREG(mode);
    }

    bool FileInfo::is_symlink() const noexcept
    {
        return S_ISLNK(mode);
    }

    FileInfo file_info_from_stat(const std::string &name, const struct stat &st)
    {
        return FileInfo{
            .name = name,
            .size = static_cast<std::uint64_t>(st.st_size),
            .mode = static_cast<std::uint32_t>(st.st_mode),
            .uid = static_cast<std::uint32_t>(st.st_uid),
            .gid = static_cast<std::uint32_t>(st.st_gid),
            .modified = to_time_point(st.st_mtim),
            .accessed = to_time_point(st.st_atim),
        };
    }

    OsFile::OsFile(int fd, std::filesystem::path name) : fd_(fd), name_(std::move(name)) {}

    OsFile::~OsFile()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    std::size_t OsFile::read_at(std::span<std::uint8_t> buffer, std::uint64_t offset)
    {
        if (fd_ < 0)
        {
            throw Error(ErrorCode::GenericFailure, "read on closed file " + name_.string());
        }
        std::size_t total = 0;
        while (total < buffer.size())
        {
            const auto count = ::pread(fd_, buffer.data() + total, buffer.size() - total,
                                       static_cast<off_t>(offset + total));
            if (count < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno(errno, "read " + name_.string());
            }
            if (count == 0)
            {
                break;
            }
            total += static_cast<std::size_t>(count);
        }
        return total;
    }

    std::size_t OsFile::write_at(std::span<const std::uint8_t> data, std::uint64_t offset)
    {
        if (fd_ < 0)
        {
            throw Error(ErrorCode::GenericFailure, "write on closed file " + name_.string());
        }
        std::size_t total = 0;
        while (total < data.size())
        {
            const auto count = ::pwrite(fd_, data.data() + total, data.size() - total,
                                        static_cast<off_t>(offset + total));
            if (count < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno(errno, "write " + name_.string());
            }
            total += static_cast<std::size_t>(count);
        }
        return total;
    }

    void OsFile::close()
    {
        if (fd_ < 0)
        {
            throw Error(ErrorCode::GenericFailure, "file already closed " + name_.string());
        }
        const int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0)
        {
            throw_errno(errno, "close " + name_.string());
        }
    }

    OsFilesystem::OsFilesystem(std::filesystem::path root_dir, std::vector<VirtualFolder> virtual_folders)
        : root_dir_(std::move(root_dir)),
          virtual_folders_(std::move(virtual_folders))
    {
    }

    std::string OsFilesystem::name() const
    {
        return "osfs";
    }

    OsFilesystem::MappedPath OsFilesystem::map_virtual_path(std::string_view virtual_path) const
    {
        const auto cleaned = vpath::clean(virtual_path);
        std::filesystem::path base = root_dir_;
        std::string relative = cleaned;
        for (const auto &folder : virtual_folders_)
        {
            if (folder.virtual_path != "/" && vpath::is_within(cleaned, folder.virtual_path))
            {
                base = folder.mapped_path;
                relative = cleaned.substr(folder.virtual_path.size());
                break;
            }
        }
        if (relative.empty() || relative == "/")
        {
            return MappedPath{.base = base, .real = base};
        }
        return MappedPath{.base = base, .real = base / std::filesystem::path(relative).relative_path()};
    }

    void OsFilesystem::check_inside_base(const std::filesystem::path &real, const std::filesystem::path &base,
                                         std::string_view virtual_path) const
    {
        std::error_code ec;
        const auto canonical_base = std::filesystem::canonical(base, ec);
        if (ec)
        {
            throw Error(ErrorCode::PathError, "unable to resolve root " + base.string() + ": " + ec.message());
        }
        if (real != canonical_base && !is_inside(real, canonical_base))
        {
            throw Error(ErrorCode::PathError, "path \"" + std::string(virtual_path) + "\" is outside the allowed root");
        }
    }

    std::filesystem::path OsFilesystem::resolve_path(std::string_view virtual_path) const
    {
        if (root_dir_.empty() || !root_dir_.is_absolute())
        {
            throw Error(ErrorCode::PathError, "invalid root path \"" + root_dir_.string() + "\"");
        }
        const auto mapped = map_virtual_path(virtual_path);

        std::error_code ec;
        const auto resolved = std::filesystem::canonical(mapped.real, ec);
        if (!ec)
        {
            check_inside_base(resolved, mapped.base, virtual_path);
            return mapped.real;
        }
        if (ec != std::errc::no_such_file_or_directory)
        {
            throw_fs_error(ec, "unable to resolve " + std::string(virtual_path));
        }
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(mapped.real)))
        {
            throw Error(ErrorCode::PathError, "path \"" + std::string(virtual_path) + "\" is a dangling symlink");
        }

        // Missing path: the first existing ancestor must be inside the root.
        auto parent = mapped.real.parent_path();
        while (true)
        {
            const auto ancestor = std::filesystem::canonical(parent, ec);
            if (!ec)
            {
                check_inside_base(ancestor, mapped.base, virtual_path);
                return mapped.real;
            }
            if (ec != std::errc::no_such_file_or_directory || parent == parent.parent_path())
            {
                throw Error(ErrorCode::PathError, "unable to resolve " + std::string(virtual_path) + ": " + ec.message());
            }
            parent = parent.parent_path();
        }
    }

    std::string OsFilesystem::relative_path(const std::filesystem::path &real_path) const
    {
        for (const auto &folder : virtual_folders_)
        {
            if (real_path.lexically_normal() == folder.mapped_path.lexically_normal())
            {
                return folder.virtual_path;
            }
            if (is_inside(real_path, folder.mapped_path))
            {
                const auto relative = real_path.lexically_normal().lexically_relative(folder.mapped_path.lexically_normal());
                return vpath::join(folder.virtual_path, relative.generic_string());
            }
        }
        if (is_inside(real_path, root_dir_))
        {
            const auto relative = real_path.lexically_normal().lexically_relative(root_dir_.lexically_normal());
            return vpath::clean("/" + relative.generic_string());
        }
        return "/";
    }

    FileInfo OsFilesystem::stat(const std::filesystem::path &path) const
    {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0)
        {
            throw_errno(errno, "stat " + path.string());
        }
        return file_info_from_stat(path.filename().string(), st);
    }

    FileInfo OsFilesystem::lstat(const std::filesystem::path &path) const
    {
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0)
        {
            throw_errno(errno, "lstat " + path.string());
        }
        return file_info_from_stat(path.filename().string(), st);
    }

    OpenResult OsFilesystem::open(const std::filesystem::path &path, std::uint64_t /*offset*/)
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            throw_errno(errno, "open " + path.string());
        }
        return OpenResult{.file = std::make_unique<OsFile>(fd, path)};
    }

    CreateResult OsFilesystem::create(const std::filesystem::path &path, CreateOptions options)
    {
        int flags = O_CREAT | O_CLOEXEC | (options.read ? O_RDWR : O_WRONLY);
        if (options.truncate)
        {
            flags |= O_TRUNC;
        }
        const int fd = ::open(path.c_str(), flags, 0666);
        if (fd < 0)
        {
            throw_errno(errno, "create " + path.string());
        }
        return CreateResult{.file = std::make_unique<OsFile>(fd, path)};
    }

    void OsFilesystem::rename(const std::filesystem::path &source, const std::filesystem::path &target)
    {
        if (::rename(source.c_str(), target.c_str()) != 0)
        {
            throw_errno(errno, "rename " + source.string() + " -> " + target.string());
        }
    }

    void OsFilesystem::remove(const std::filesystem::path &path, bool is_dir)
    {
        const int rc = is_dir ? ::rmdir(path.c_str()) : ::unlink(path.c_str());
        if (rc != 0)
        {
            throw_errno(errno, "remove " + path.string());
        }
    }

    void OsFilesystem::remove_all(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec)
        {
            throw_fs_error(ec, "remove " + path.string());
        }
    }

    void OsFilesystem::mkdir(const std::filesystem::path &path)
    {
        if (::mkdir(path.c_str(), 0777) != 0)
        {
            throw_errno(errno, "mkdir " + path.string());
        }
    }

    void OsFilesystem::symlink(const std::filesystem::path &target, const std::filesystem::path &link)
    {
        if (::symlink(target.c_str(), link.c_str()) != 0)
        {
            throw_errno(errno, "symlink " + link.string());
        }
    }

    std::filesystem::path OsFilesystem::readlink(const std::filesystem::path &path) const
    {
        std::error_code ec;
        auto target = std::filesystem::read_symlink(path, ec);
        if (ec)
        {
            throw_fs_error(ec, "readlink " + path.string());
        }
        return target;
    }

    void OsFilesystem::chmod(const std::filesystem::path &path, std::uint32_t mode)
    {
        if (::chmod(path.c_str(), static_cast<mode_t>(mode & 07777u)) != 0)
        {
            throw_errno(errno, "chmod " + path.string());
        }
    }

    void OsFilesystem::chown(const std::filesystem::path &path, std::uint32_t uid, std::uint32_t gid)
    {
        if (::lchown(path.c_str(), static_cast<uid_t>(uid), static_cast<gid_t>(gid)) != 0)
        {
            throw_errno(errno, "chown " + path.string());
        }
    }

    void OsFilesystem::chtimes(const std::filesystem::path &path, std::chrono::system_clock::time_point accessed,
                               std::chrono::system_clock::time_point modified)
    {
        const struct timespec times[2] = {to_timespec(accessed), to_timespec(modified)};
        if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
        {
            throw_errno(errno, "chtimes " + path.string());
        }
    }

    void OsFilesystem::truncate(const std::filesystem::path &path, std::uint64_t size)
    {
        if (::truncate(path.c_str(), static_cast<off_t>(size)) != 0)
        {
            throw_errno(errno, "truncate " + path.string());
        }
    }

    std::vector<FileInfo> OsFilesystem::read_dir(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(path, ec);
        if (ec)
        {
            throw_fs_error(ec, "read dir " + path.string());
        }

        std::vector<FileInfo> entries;
        for (const std::filesystem::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                throw_fs_error(ec, "read dir " + path.string());
            }
            struct stat st{};
            if (::lstat(it->path().c_str(), &st) != 0)
            {
                if (errno == ENOENT)
                {
                    continue;
                }
                throw_errno(errno, "lstat " + it->path().string());
            }
            entries.push_back(file_info_from_stat(it->path().filename().string(), st));
        }
        if (ec)
        {
            throw_fs_error(ec, "read dir " + path.string());
        }
        std::sort(entries.begin(), entries.end(), [](const FileInfo &lhs, const FileInfo &rhs)
                  { return lhs.name < rhs.name; });
        return entries;
    }

    void OsFilesystem::walk(const std::filesystem::path &root, const WalkFunction &callback) const
    {
        const auto root_info = lstat(root);
        if (callback(root, root_info) == WalkAction::Stop || !root_info.is_dir())
        {
            return;
        }

        std::vector<std::filesystem::path> pending{root};
        while (!pending.empty())
        {
            const auto current = std::move(pending.back());
            pending.pop_back();
            for (const auto &entry : read_dir(current))
            {
                const auto child = current / entry.name;
                if (callback(child, entry) == WalkAction::Stop)
                {
                    return;
                }
                if (entry.is_dir())
                {
                    pending.push_back(child);
                }
            }
        }
    }

    DirSize OsFilesystem::dir_size(const std::filesystem::path &path) const
    {
        DirSize result;
        walk(path, [&result](const std::filesystem::path &, const FileInfo &info)
             {
                 if (info.is_regular())
                 {
                     ++result.files;
                     result.size += static_cast<std::int64_t>(info.size);
                 }
                 return WalkAction::Continue; });
        return result;
    }

    void OsFilesystem::copy_tree(const std::filesystem::path &source, const std::filesystem::path &target)
    {
        std::error_code ec;
        std::filesystem::copy(source, target,
                              std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks, ec);
        if (ec)
        {
            throw_fs_error(ec, "copy " + source.string() + " -> " + target.string());
        }
    }

    std::filesystem::path OsFilesystem::atomic_upload_path(const std::filesystem::path &path) const
    {
        return path.parent_path() /
               (std::string(kAtomicUploadPrefix) + crypto::random_hex(8) + "." + path.filename().string());
    }

} // namespace sftpgate::server
