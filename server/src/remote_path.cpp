#include "sftpbridge/server/remote_path.hpp"

#include <vector>

namespace sftpbridge::server::remote_path
{

    std::string normalize(std::string_view path)
    {
        if (path.empty())
        {
            return ".";
        }
        const bool absolute = path.front() == '/';
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (start <= path.size())
        {
            auto end = path.find('/', start);
            if (end == std::string_view::npos)
            {
                end = path.size();
            }
            const auto part = path.substr(start, end - start);
            if (part == "..")
            {
                if (!parts.empty() && parts.back() != "..")
                {
                    parts.pop_back();
                }
                else if (!absolute)
                {
                    parts.push_back(part);
                }
            }
            else if (!part.empty() && part != ".")
            {
                parts.push_back(part);
            }
            start = end + 1;
        }

        std::string result = absolute ? "/" : "";
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0)
            {
                result += '/';
            }
            result += parts[i];
        }
        if (result.empty())
        {
            return ".";
        }
        return result;
    }

    std::string join(std::string_view directory, std::string_view name)
    {
        if (directory.empty())
        {
            return normalize(name);
        }
        std::string combined(directory);
        combined += '/';
        combined += name;
        return normalize(combined);
    }

    std::string parent(std::string_view path)
    {
        const auto normalized = normalize(path);
        const auto slash = normalized.rfind('/');
        if (slash == std::string::npos)
        {
            return ".";
        }
        if (slash == 0)
        {
            return "/";
        }
        return normalized.substr(0, slash);
    }

    std::string basename(std::string_view path)
    {
        const auto normalized = normalize(path);
        if (normalized == "/")
        {
            return normalized;
        }
        const auto slash = normalized.rfind('/');
        return slash == std::string::npos ? normalized : normalized.substr(slash + 1);
    }

} // namespace sftpbridge::server::remote_path
