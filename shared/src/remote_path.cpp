#include "remotefs/remote_path.hpp"

namespace remotefs::remote_path
{

    std::string normalize(std::string_view path)
    {
        if (path.empty())
        {
            return "/";
        }
        if (path == ".")
        {
            return ".";
        }
        std::string result;
        result.reserve(path.size() + 1);
        if (path.front() != '/' && path.front() != '\\')
        {
            result.push_back('/');
        }
        for (const char ch : path)
        {
            const char normalized = ch == '\\' ? '/' : ch;
            if (normalized == '/' && !result.empty() && result.back() == '/')
            {
                continue;
            }
            result.push_back(normalized);
        }
        if (result.size() > 1 && result.back() == '/')
        {
            result.pop_back();
        }
        return result;
    }

    bool is_root(std::string_view path) noexcept
    {
        return path.empty() || path == "/" || path == ".";
    }

    std::string parent(std::string_view path)
    {
        const auto normalized = normalize(path);
        const auto last_slash = normalized.find_last_of('/');
        if (last_slash == std::string::npos || last_slash == 0)
        {
            return "/";
        }
        return normalized.substr(0, last_slash);
    }

    std::string join(std::string_view directory, std::string_view name)
    {
        if (is_root(directory))
        {
            return normalize(std::string("/") + std::string(name));
        }
        return normalize(std::string(directory) + "/" + std::string(name));
    }

    std::string file_name(std::string_view path)
    {
        while (!path.empty() && (path.back() == '/' || path.back() == '\\'))
        {
            path.remove_suffix(1);
        }
        const auto last = path.find_last_of("/\\");
        if (last == std::string_view::npos)
        {
            return std::string(path);
        }
        return std::string(path.substr(last + 1));
    }

    std::size_t depth(std::string_view path) noexcept
    {
        std::size_t count = 0;
        bool in_segment = false;
        for (const char ch : path)
        {
            if (ch == '/' || ch == '\\')
            {
                in_segment = false;
            }
            else if (!in_segment)
            {
                in_segment = true;
                ++count;
            }
        }
        return count;
    }

    bool is_same_or_descendant(std::string_view path, std::string_view ancestor)
    {
        const auto normalized_path = normalize(path);
        const auto normalized_ancestor = normalize(ancestor);
        if (is_root(normalized_ancestor))
        {
            return true;
        }
        if (normalized_path == normalized_ancestor)
        {
            return true;
        }
        return normalized_path.size() > normalized_ancestor.size() &&
               normalized_path.compare(0, normalized_ancestor.size(), normalized_ancestor) == 0 &&
               normalized_path[normalized_ancestor.size()] == '/';
    }

} // namespace remotefs::remote_path
