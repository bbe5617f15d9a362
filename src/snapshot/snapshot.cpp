#include "snapshot.hpp"

#include <algorithm>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace snapshot
{

    std::optional<EntryInfo> stat_entry(const std::string &path)
    {
        struct stat st;
        if (::lstat(path.c_str(), &st) != 0)
            return std::nullopt;
        return EntryInfo{static_cast<uint64_t>(st.st_ino), S_ISDIR(st.st_mode)};
    }

    DirectorySnapshot::DirectorySnapshot(std::unordered_map<std::string, EntryInfo> entries)
        : entries_(std::move(entries))
    {
    }

    DirectorySnapshot DirectorySnapshot::capture(const std::string &root, bool recursive)
    {
        std::unordered_map<std::string, EntryInfo> entries;

        auto root_info = stat_entry(root);
        if (!root_info)
            return DirectorySnapshot(std::move(entries));
        entries[root] = *root_info;
        if (!root_info->is_directory)
            return DirectorySnapshot(std::move(entries));

        std::error_code ec;
        if (recursive)
        {
            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            {
                std::string path = it->path().string();
                if (auto info = stat_entry(path))
                    entries[path] = *info;
            }
        }
        else
        {
            fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::directory_iterator(); it.increment(ec))
            {
                std::string path = it->path().string();
                if (auto info = stat_entry(path))
                    entries[path] = *info;
            }
        }
        return DirectorySnapshot(std::move(entries));
    }

    std::optional<uint64_t> DirectorySnapshot::inode_of(const std::string &path) const
    {
        auto it = entries_.find(path);
        if (it == entries_.end())
            return std::nullopt;
        return it->second.inode;
    }

    bool DirectorySnapshot::contains(const std::string &path) const
    {
        return entries_.find(path) != entries_.end();
    }

    bool DirectorySnapshot::is_directory(const std::string &path) const
    {
        auto it = entries_.find(path);
        return it != entries_.end() && it->second.is_directory;
    }

    std::vector<std::string> DirectorySnapshot::paths() const
    {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto &entry : entries_)
            result.push_back(entry.first);
        std::sort(result.begin(), result.end());
        return result;
    }

} // namespace snapshot
