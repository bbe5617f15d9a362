#include "events.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <system_error>

namespace fs = std::filesystem;

namespace events
{
    namespace
    {
        // Walk dir top-down: the subdirectories and files of one directory are
        // reported before descending. Unreadable directories are skipped.
        void walk(const fs::path &dir,
                  const std::function<void(const fs::path &, FileType)> &visit)
        {
            std::error_code ec;
            fs::directory_iterator it(dir, ec);
            if (ec)
                return;

            std::vector<fs::path> dirs;
            std::vector<fs::path> files;
            for (; it != fs::directory_iterator(); it.increment(ec))
            {
                if (ec)
                    break;
                std::error_code type_ec;
                if (it->is_directory(type_ec) && !it->is_symlink(type_ec))
                    dirs.push_back(it->path());
                else
                    files.push_back(it->path());
            }
            std::sort(dirs.begin(), dirs.end());
            std::sort(files.begin(), files.end());

            for (const auto &d : dirs)
                visit(d, FileType::Directory);
            for (const auto &f : files)
                visit(f, FileType::File);
            for (const auto &d : dirs)
                walk(d, visit);
        }
    }

    FileSystemEvent created(const std::string &path, FileType fileType)
    {
        return FileSystemEvent{EventType::Created, fileType, path, "", false};
    }

    FileSystemEvent deleted(const std::string &path, FileType fileType)
    {
        return FileSystemEvent{EventType::Deleted, fileType, path, "", false};
    }

    FileSystemEvent modified(const std::string &path, FileType fileType)
    {
        return FileSystemEvent{EventType::Modified, fileType, path, "", false};
    }

    FileSystemEvent moved(const std::string &src_path, const std::string &dest_path, FileType fileType)
    {
        return FileSystemEvent{EventType::Moved, fileType, src_path, dest_path, false};
    }

    EventKind kind_of(const FileSystemEvent &event)
    {
        return EventKind{event.eventType, event.fileType};
    }

    std::string eventTypeToString(EventType type)
    {
        switch (type)
        {
        case EventType::Created:
            return "created";
        case EventType::Deleted:
            return "deleted";
        case EventType::Modified:
            return "modified";
        case EventType::Moved:
            return "moved";
        }
        return "unknown";
    }

    std::string fileTypeToString(FileType type)
    {
        return (type == FileType::Directory) ? "dir" : "file";
    }

    std::string kind_to_string(const EventKind &kind)
    {
        return fileTypeToString(kind.fileType) + "_" + eventTypeToString(kind.eventType);
    }

    std::optional<EventKind> kind_from_string(const std::string &name)
    {
        for (auto fileType : {FileType::File, FileType::Directory})
        {
            for (auto eventType : {EventType::Created, EventType::Deleted, EventType::Modified, EventType::Moved})
            {
                EventKind kind{eventType, fileType};
                if (kind_to_string(kind) == name)
                    return kind;
            }
        }
        return std::nullopt;
    }

    std::string to_string(const FileSystemEvent &event)
    {
        std::string out = kind_to_string(kind_of(event)) + ": " + event.src_path;
        if (event.eventType == EventType::Moved)
            out += " -> " + event.dest_path;
        if (event.is_synthetic)
            out += " (synthetic)";
        return out;
    }

    std::vector<FileSystemEvent> generate_sub_created_events(const std::string &src_dir_path)
    {
        std::vector<FileSystemEvent> result;
        walk(src_dir_path, [&result](const fs::path &path, FileType fileType)
             {
            FileSystemEvent event = created(path.string(), fileType);
            event.is_synthetic = true;
            result.push_back(event); });
        return result;
    }

    std::vector<FileSystemEvent> generate_sub_moved_events(const std::string &src_dir_path,
                                                           const std::string &dest_dir_path)
    {
        std::vector<FileSystemEvent> result;
        const fs::path src_root(src_dir_path);
        const fs::path dest_root(dest_dir_path);
        walk(dest_root, [&](const fs::path &path, FileType fileType)
             {
            fs::path relative = path.lexically_relative(dest_root);
            FileSystemEvent event = moved((src_root / relative).string(), path.string(), fileType);
            event.is_synthetic = true;
            result.push_back(event); });
        return result;
    }

} // namespace events
