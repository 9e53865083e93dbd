#include "remotefs/server/filesystem.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

#include "remotefs/remote_path.hpp"

namespace remotefs::server
{

    FilesystemError::FilesystemError(remotefs::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    remotefs::ErrorCode error_code_from(const std::error_code &ec) noexcept
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            return remotefs::ErrorCode::NotFound;
        }
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        {
            return remotefs::ErrorCode::PermissionDenied;
        }
        if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        {
            return remotefs::ErrorCode::AlreadyExists;
        }
        if (ec == std::errc::not_a_directory || ec == std::errc::is_a_directory)
        {
            return remotefs::ErrorCode::InvalidPayload;
        }
        return remotefs::ErrorCode::InternalError;
    }

    namespace
    {

        std::uint64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto sctp = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                       std::chrono::system_clock::now());
            return static_cast<std::uint64_t>(std::max<std::int64_t>(0, sctp.time_since_epoch().count()));
        }

    } // namespace

    SessionPaths Filesystem::prepare_session_paths(const std::string &session_id,
                                                   const std::filesystem::path &root) const
    {
        std::filesystem::create_directories(root);
        return SessionPaths{
            .session_id = session_id,
            .root = std::filesystem::weakly_canonical(root),
        };
    }

    std::filesystem::path Filesystem::resolve(const SessionPaths &session, const std::string &requested) const
    {
        const auto path = sanitize(session.root, requested);
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(path, ec)))
        {
            throw FilesystemError(remotefs::ErrorCode::NotFound, "Path does not exist: " + requested);
        }
        return path;
    }

    std::filesystem::path Filesystem::resolve_for_new_entry(const SessionPaths &session,
                                                            const std::string &requested) const
    {
        const auto path = sanitize(session.root, requested);
        if (path == session.root)
        {
            throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "The root cannot be replaced");
        }
        return path;
    }

    std::vector<remotefs::protocol::FileEntry> Filesystem::list_directory(const SessionPaths &session,
                                                                          const std::string &path) const
    {
        const auto target = resolve(session, path);
        if (!std::filesystem::is_directory(target))
        {
            throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "Target is not a directory");
        }
        const auto directory = remotefs::remote_path::normalize(path);
        std::vector<remotefs::protocol::FileEntry> entries;
        for (const auto &entry : std::filesystem::directory_iterator(target))
        {
            const auto name = entry.path().filename().string();
            entries.push_back(entry_from_path(remotefs::remote_path::join(directory, name), entry.path()));
        }
        std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                  {
            if (lhs.is_directory_like() != rhs.is_directory_like())
            {
                return lhs.is_directory_like();
            }
            return lhs.name < rhs.name; });
        return entries;
    }

    remotefs::protocol::FileEntry Filesystem::stat_path(const SessionPaths &session, const std::string &path) const
    {
        const auto target = resolve(session, path);
        return entry_from_path(remotefs::remote_path::normalize(path), target);
    }

    void Filesystem::create_file(const SessionPaths &session, const std::string &path) const
    {
        const auto target = resolve_for_new_entry(session, path);
        ensure_absent(target, path);
        if (!std::filesystem::is_directory(target.parent_path()))
        {
            throw FilesystemError(remotefs::ErrorCode::NotFound, "Parent directory does not exist");
        }
        std::ofstream file(target, std::ios::binary);
        if (!file.is_open())
        {
            throw FilesystemError(remotefs::ErrorCode::PermissionDenied, "Unable to create " + path);
        }
    }

    void Filesystem::create_directory(const SessionPaths &session, const std::string &path) const
    {
        const auto target = resolve_for_new_entry(session, path);
        ensure_absent(target, path);
        std::filesystem::create_directories(target);
    }

    void Filesystem::remove_directory(const SessionPaths &session, const std::string &path) const
    {
        const auto target = resolve(session, path);
        if (target == session.root)
        {
            throw FilesystemError(remotefs::ErrorCode::PermissionDenied, "The root cannot be removed");
        }
        if (!std::filesystem::is_directory(std::filesystem::symlink_status(target)))
        {
            throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "Target is not a directory");
        }
        std::filesystem::remove_all(target);
    }

    void Filesystem::remove_file(const SessionPaths &session, const std::string &path) const
    {
        const auto target = resolve(session, path);
        // Symlinks are removed as links, whatever they point to.
        if (std::filesystem::is_directory(std::filesystem::symlink_status(target)))
        {
            throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "Target is a directory");
        }
        std::filesystem::remove(target);
    }

    void Filesystem::move_path(const SessionPaths &session, const std::string &from, const std::string &to) const
    {
        const auto source = resolve(session, from);
        const auto destination = resolve_for_new_entry(session, to);
        ensure_absent(destination, to);
        std::filesystem::create_directories(destination.parent_path());
        std::filesystem::rename(source, destination);
    }

    void Filesystem::copy_path(const SessionPaths &session, const std::string &from, const std::string &to) const
    {
        const auto source = resolve(session, from);
        const auto destination = resolve_for_new_entry(session, to);
        ensure_absent(destination, to);
        std::filesystem::create_directories(destination.parent_path());
        const auto options = std::filesystem::copy_options::copy_symlinks |
                             (std::filesystem::is_directory(std::filesystem::symlink_status(source))
                                  ? std::filesystem::copy_options::recursive
                                  : std::filesystem::copy_options::none);
        std::filesystem::copy(source, destination, options);
    }

    void Filesystem::change_permissions(const SessionPaths &session, const std::string &path, std::uint32_t mode) const
    {
        const auto target = resolve(session, path);
        std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 07777U),
                                     std::filesystem::perm_options::replace);
    }

    std::filesystem::path Filesystem::sanitize(const std::filesystem::path &base, const std::string &requested) const
    {
        std::filesystem::path relative = remotefs::remote_path::normalize(requested);
        relative = relative.lexically_relative("/");

        std::filesystem::path sanitized = base;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(remotefs::ErrorCode::InvalidPayload, "Path traversal detected");
            }
            sanitized /= part;
        }
        return sanitized;
    }

    void Filesystem::ensure_absent(const std::filesystem::path &target, const std::string &requested) const
    {
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(target, ec)))
        {
            throw FilesystemError(remotefs::ErrorCode::AlreadyExists, "Already exists: " + requested);
        }
    }

    remotefs::protocol::FileEntry Filesystem::entry_from_path(const std::string &remote_path,
                                                              const std::filesystem::path &path)
    {
        remotefs::protocol::FileEntry entry{};
        entry.path = remote_path;
        entry.name = remotefs::remote_path::file_name(remote_path);

        std::error_code ec;
        const auto link_status = std::filesystem::symlink_status(path, ec);
        entry.is_symlink = std::filesystem::is_symlink(link_status);
        if (entry.is_symlink)
        {
            entry.symlink_target = std::filesystem::read_symlink(path, ec).generic_string();
            if (ec)
            {
                entry.symlink_target.reset();
            }
            entry.symlink_target_is_directory = std::filesystem::is_directory(path, ec);
        }
        else
        {
            entry.is_directory = std::filesystem::is_directory(link_status);
        }

        const auto status = std::filesystem::status(path, ec);
        if (!ec)
        {
            entry.permission_bits = static_cast<std::uint32_t>(status.permissions()) & 07777U;
        }
        if (std::filesystem::is_regular_file(status))
        {
            const auto size = std::filesystem::file_size(path, ec);
            entry.size = ec ? 0 : static_cast<std::uint64_t>(size);
        }
        const auto modified = std::filesystem::last_write_time(path, ec);
        if (!ec)
        {
            entry.modified_time = to_unix_time(modified);
        }
        return entry;
    }

} // namespace remotefs::server
