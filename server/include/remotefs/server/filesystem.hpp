#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "remotefs/error_codes.hpp"
#include "remotefs/protocol.hpp"

namespace remotefs::server
{

    struct SessionPaths
    {
        std::string session_id;
        std::filesystem::path root;
    };

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(remotefs::ErrorCode code, std::string message);

        remotefs::ErrorCode code() const noexcept { return code_; }

    private:
        remotefs::ErrorCode code_;
    };

    remotefs::ErrorCode error_code_from(const std::error_code &ec) noexcept;

    // Maps absolute remote paths ("/docs/a.txt") onto a session's sandbox root.
    class Filesystem
    {
    public:
        SessionPaths prepare_session_paths(const std::string &session_id, const std::filesystem::path &root) const;

        std::filesystem::path resolve(const SessionPaths &session, const std::string &requested) const;

        std::filesystem::path resolve_for_new_entry(const SessionPaths &session, const std::string &requested) const;

        // Children of a directory, directories first, then by name.
        std::vector<remotefs::protocol::FileEntry> list_directory(const SessionPaths &session,
                                                                  const std::string &path) const;

        remotefs::protocol::FileEntry stat_path(const SessionPaths &session, const std::string &path) const;

        void create_file(const SessionPaths &session, const std::string &path) const;
        void create_directory(const SessionPaths &session, const std::string &path) const;
        void remove_directory(const SessionPaths &session, const std::string &path) const;
        void remove_file(const SessionPaths &session, const std::string &path) const;
        void move_path(const SessionPaths &session, const std::string &from, const std::string &to) const;
        void copy_path(const SessionPaths &session, const std::string &from, const std::string &to) const;
        void change_permissions(const SessionPaths &session, const std::string &path, std::uint32_t mode) const;

    private:
        std::filesystem::path sanitize(const std::filesystem::path &base, const std::string &requested) const;
        void ensure_absent(const std::filesystem::path &target, const std::string &requested) const;
        static remotefs::protocol::FileEntry entry_from_path(const std::string &remote_path,
                                                             const std::filesystem::path &path);
    };

} // namespace remotefs::server
