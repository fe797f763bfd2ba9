#include "path.hh"

#include <cstddef>
#include <utility>

bool path_is_absolute(const std::string& path)
{
    return !path.empty() && path[0] == '/';
}

std::string path_clean(const std::string& path)
{
    if (path.empty())
        return ".";

    bool rooted = path_is_absolute(path);
    std::vector<std::string> parts;
    std::size_t i = 0;

    while (i < path.size())
    {
        std::size_t next = path.find('/', i);
        if (next == std::string::npos)
            next = path.size();

        std::string part = path.substr(i, next - i);
        i = next + 1;

        if (part.empty() || part == ".")
            continue;

        if (part == "..")
        {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();

            // "/.." is "/"
            else if (!rooted)
                parts.push_back(part);

            continue;
        }

        parts.push_back(part);
    }

    std::string result = rooted ? "/" : "";
    for (std::size_t j = 0; j < parts.size(); ++j)
    {
        if (j)
            result += '/';
        result += parts[j];
    }

    if (result.empty())
        return ".";

    return result;
}

std::string path_join(const std::string& dir, const std::string& name)
{
    if (dir.empty() || path_is_absolute(name))
        return path_clean(name);

    if (name.empty())
        return path_clean(dir);

    return path_clean(dir + "/" + name);
}

bool partial_path_match(const std::string& expr, const std::string& path)
{
    if (expr == path)
        return true;

    if (expr.size() >= path.size())
        return false;

    std::size_t start = path.size() - expr.size();

    return path.compare(start, expr.size(), expr) == 0
        && path[start - 1] == '/';
}

void uniq(std::vector<std::string>& sorted)
{
    if (sorted.empty())
        return;

    std::size_t dst = 1;
    for (std::size_t src = 1; src < sorted.size(); ++src)
    {
        if (sorted[src] != sorted[dst - 1])
        {
            if (src != dst)
                sorted[dst] = std::move(sorted[src]);
            ++dst;
        }
    }

    sorted.resize(dst);
}
