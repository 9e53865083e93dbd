/**
 * RemoteFS - Helpers for absolute, slash-separated remote paths.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace remotefs::remote_path
{

    // Backslashes become slashes, repeated and trailing slashes are dropped.
    std::string normalize(std::string_view path);

    bool is_root(std::string_view path) noexcept;

    // Parent of "/a/b" is "/a"; parent of "/a" and of the root is "/".
    std::string parent(std::string_view path);

    std::string join(std::string_view directory, std::string_view name);

    // Last component, splitting on both separators so local paths work too.
    std::string file_name(std::string_view path);

    std::size_t depth(std::string_view path) noexcept;

    bool is_same_or_descendant(std::string_view path, std::string_view ancestor);

} // namespace remotefs::remote_path
