#ifndef EVENTS_HPP
#define EVENTS_HPP

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace events
{

    enum class EventType
    {
        Created,
        Deleted,
        Modified,
        Moved
    };

    enum class FileType
    {
        File,
        Directory
    };

    struct FileSystemEvent
    {
        EventType eventType;
        FileType fileType;
        std::string src_path;
        std::string dest_path; // Moved only
        bool is_synthetic = false;

        bool is_directory() const { return fileType == FileType::Directory; }

        bool operator<(const FileSystemEvent &other) const
        {
            return std::tie(eventType, fileType, src_path, dest_path, is_synthetic) <
                   std::tie(other.eventType, other.fileType, other.src_path, other.dest_path, other.is_synthetic);
        }

        bool operator==(const FileSystemEvent &other) const
        {
            return std::tie(eventType, fileType, src_path, dest_path, is_synthetic) ==
                   std::tie(other.eventType, other.fileType, other.src_path, other.dest_path, other.is_synthetic);
        }

        bool operator!=(const FileSystemEvent &other) const { return !(*this == other); }
    };

    // What an event filter selects on: "file_created", "dir_moved", ...
    struct EventKind
    {
        EventType eventType;
        FileType fileType;

        bool operator<(const EventKind &other) const
        {
            return std::tie(eventType, fileType) < std::tie(other.eventType, other.fileType);
        }

        bool operator==(const EventKind &other) const
        {
            return eventType == other.eventType && fileType == other.fileType;
        }
    };

    FileSystemEvent created(const std::string &path, FileType fileType);
    FileSystemEvent deleted(const std::string &path, FileType fileType);
    FileSystemEvent modified(const std::string &path, FileType fileType);
    FileSystemEvent moved(const std::string &src_path, const std::string &dest_path, FileType fileType);

    EventKind kind_of(const FileSystemEvent &event);
    std::string kind_to_string(const EventKind &kind);
    std::optional<EventKind> kind_from_string(const std::string &name);

    std::string eventTypeToString(EventType type);
    std::string fileTypeToString(FileType type);
    std::string to_string(const FileSystemEvent &event);

    // Created events for everything below src_dir_path, parents before children.
    std::vector<FileSystemEvent> generate_sub_created_events(const std::string &src_dir_path);

    // Moved events for everything now below dest_dir_path, mapped back onto
    // the equivalent path below src_dir_path.
    std::vector<FileSystemEvent> generate_sub_moved_events(const std::string &src_dir_path,
                                                           const std::string &dest_dir_path);

} // namespace events

#endif // EVENTS_HPP
