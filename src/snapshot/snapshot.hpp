#ifndef SNAPSHOT_HPP
#define SNAPSHOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace snapshot
{

    struct EntryInfo
    {
        uint64_t inode;
        bool is_directory;
    };

    // Point-in-time view of a tree: path -> inode.
    class DirectorySnapshot
    {
    public:
        DirectorySnapshot() = default;
        explicit DirectorySnapshot(std::unordered_map<std::string, EntryInfo> entries);

        // Walks root (and below when recursive). Entries that cannot be
        // stat'ed are skipped.
        static DirectorySnapshot capture(const std::string &root, bool recursive = true);

        std::optional<uint64_t> inode_of(const std::string &path) const;
        bool contains(const std::string &path) const;
        bool is_directory(const std::string &path) const;

        std::vector<std::string> paths() const;
        std::size_t size() const { return entries_.size(); }

    private:
        std::unordered_map<std::string, EntryInfo> entries_;
    };

    // lstat() wrapper; std::nullopt if the path is gone.
    std::optional<EntryInfo> stat_entry(const std::string &path);

} // namespace snapshot

#endif // SNAPSHOT_HPP
