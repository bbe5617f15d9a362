#include "interpreter.hpp"

#include <cstddef>
#include <filesystem>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;
using events::FileSystemEvent;
using events::FileType;

namespace interpreter
{
    namespace
    {
        FileType file_type(const RawNotification &event)
        {
            return event.is_directory() ? FileType::Directory : FileType::File;
        }
    }

    std::string normalize_root(const std::string &root)
    {
        std::string out = fs::path(root).lexically_normal().string();
        while (out.size() > 1 && out.back() == '/')
            out.pop_back();
        return out;
    }

    std::string dirname(const std::string &path)
    {
        return fs::path(path).parent_path().string();
    }

    std::string RawNotification::describe() const
    {
        static const std::pair<uint32_t, const char *> names[] = {
            {flags::MustScanSubDirs, "must_scan_subdirs"},
            {flags::HistoryDone, "history_done"},
            {flags::RootChanged, "root_changed"},
            {flags::ItemCreated, "created"},
            {flags::ItemRemoved, "removed"},
            {flags::ItemInodeMetaMod, "inode_meta_mod"},
            {flags::ItemRenamed, "renamed"},
            {flags::ItemModified, "modified"},
            {flags::ItemFinderInfoMod, "finder_info_mod"},
            {flags::ItemChangeOwner, "owner_change"},
            {flags::ItemXattrMod, "xattr_mod"},
            {flags::ItemIsFile, "is_file"},
            {flags::ItemIsDir, "is_directory"},
            {flags::ItemIsSymlink, "is_symlink"},
        };

        std::ostringstream out;
        out << "NativeEvent(path=" << path << ", inode=" << inode << ", id=" << event_id << "): ";
        bool first = true;
        for (const auto &name : names)
        {
            if (has(name.first))
            {
                out << (first ? "" : ", ") << name.second;
                first = false;
            }
        }
        return out.str();
    }

    EventInterpreter::EventInterpreter(const std::string &watch_root,
                                       bool recursive,
                                       EventSink &sink,
                                       std::shared_ptr<MyLogger> logger)
        : watch_root_(normalize_root(watch_root)),
          recursive_(recursive),
          sink_(sink),
          logger_(std::move(logger)),
          start_time_(Clock::now())
    {
    }

    void EventInterpreter::set_starting_state(snapshot::DirectorySnapshot state)
    {
        starting_state_ = std::move(state);
    }

    void EventInterpreter::start(Clock::time_point now)
    {
        start_time_ = now;
    }

    bool EventInterpreter::is_historic_created_event(const RawNotification &event) const
    {
        // Only report items created after the stream started.
        bool in_history = fs_view_.count(event.inode) > 0;

        bool before_start = false;
        if (starting_state_)
        {
            auto old_inode = starting_state_->inode_of(event.path);
            before_start = old_inode && *old_inode == event.inode;
        }

        return in_history || before_start;
    }

    bool EventInterpreter::is_in_scope(const FileSystemEvent &event) const
    {
        if (recursive_)
            return true;
        if (event.src_path == watch_root_ || dirname(event.src_path) == watch_root_)
            return true;
        // Moving an item into the root must stay visible.
        return event.eventType == events::EventType::Moved && dirname(event.dest_path) == watch_root_;
    }

    void EventInterpreter::queue_event(const FileSystemEvent &event)
    {
        if (!is_in_scope(event))
        {
            logger_->debug("drop event " + events::to_string(event));
            return;
        }
        logger_->debug("queue_event " + events::to_string(event));
        sink_.queue_event(event);
    }

    void EventInterpreter::queue_created_event(const RawNotification &event,
                                               const std::string &src_path,
                                               const std::string &parent)
    {
        queue_event(events::created(src_path, file_type(event)));
        if (src_path != watch_root_)
            queue_event(events::modified(parent, FileType::Directory));
    }

    void EventInterpreter::queue_deleted_event(const RawNotification &event,
                                               const std::string &src_path,
                                               const std::string &parent)
    {
        queue_event(events::deleted(src_path, file_type(event)));
        if (src_path != watch_root_)
            queue_event(events::modified(parent, FileType::Directory));
    }

    void EventInterpreter::queue_modified_event(const RawNotification &event, const std::string &src_path)
    {
        queue_event(events::modified(src_path, file_type(event)));
    }

    void EventInterpreter::queue_renamed_event(const RawNotification &src_event,
                                               const std::string &src_path,
                                               const std::string &dst_path,
                                               const std::string &src_dirname,
                                               const std::string &dst_dirname)
    {
        queue_event(events::moved(src_path, dst_path, file_type(src_event)));
        queue_event(events::modified(src_dirname, FileType::Directory));
        queue_event(events::modified(dst_dirname, FileType::Directory));
    }

    void EventInterpreter::queue_events(std::vector<RawNotification> batch, Clock::time_point now)
    {
        if (root_changed_)
        {
            logger_->debug("Ignoring " + std::to_string(batch.size()) + " native events after root change of " + watch_root_);
            return;
        }

        for (const auto &event : batch)
            logger_->debug(event.describe());

        if (starting_state_ && now - start_time_ > kHistoryWindow)
        {
            // Event history is no longer needed.
            starting_state_.reset();
            logger_->debug("Discarded starting state of " + watch_root_);
        }

        for (std::size_t i = 0; i < batch.size() && !root_changed_; ++i)
        {
            const RawNotification event = batch[i];

            const std::string &src_path = event.path;
            const std::string src_dirname = dirname(src_path);

            auto stat = snapshot::stat_entry(src_path);
            const bool exists = stat && stat->inode == event.inode;

            // Flags are only ever coalesced for the same item at the same path,
            // so "removed" always means the item was gone at the end of the
            // chain, and "created" may be left over from an already reported
            // creation (filtered through fs_view_). Spurious "modified" and
            // metadata flags are passed through.

            if (event.is_created() && event.is_removed())
            {
                // No rename can be coalesced into a created+removed pair.
                if (!is_historic_created_event(event))
                    queue_created_event(event, src_path, src_dirname);

                fs_view_.insert(event.inode);

                if (event.is_modified() || event.is_meta_mod())
                    queue_modified_event(event, src_path);

                queue_deleted_event(event, src_path, src_dirname);
                fs_view_.erase(event.inode);
            }
            else
            {
                std::size_t dst_index = batch.size();
                if (event.is_renamed())
                {
                    for (std::size_t j = i + 1; j < batch.size(); ++j)
                    {
                        if (batch[j].is_renamed() && batch[j].inode == event.inode)
                        {
                            dst_index = j;
                            break;
                        }
                    }

                    if (dst_index == batch.size() && !exists)
                    {
                        // Moved out of the watched tree: only the disappearance is reported.
                        queue_deleted_event(event, src_path, src_dirname);
                        fs_view_.erase(event.inode);
                        continue;
                    }
                }

                const bool report_created = event.is_created() && !is_historic_created_event(event);
                if (report_created)
                    queue_created_event(event, src_path, src_dirname);

                fs_view_.insert(event.inode);

                if (event.is_modified() || event.is_meta_mod())
                    queue_modified_event(event, src_path);

                if (event.is_renamed())
                {
                    if (dst_index < batch.size())
                    {
                        // Moved within the watched tree.
                        const RawNotification dst_event = batch[dst_index];
                        batch.erase(batch.begin() + static_cast<std::ptrdiff_t>(dst_index));
                        logger_->debug("Destination event for rename is " + dst_event.describe());

                        const std::string &dst_path = dst_event.path;
                        const std::string dst_dirname = dirname(dst_path);

                        queue_renamed_event(event, src_path, dst_path, src_dirname, dst_dirname);
                        fs_view_.insert(event.inode);

                        if (recursive_ && event.is_directory())
                        {
                            for (const auto &sub_moved : events::generate_sub_moved_events(src_path, dst_path))
                                queue_event(sub_moved);
                        }

                        // Coalesced flags of the destination half.
                        if (dst_event.is_modified() || dst_event.is_meta_mod())
                            queue_modified_event(dst_event, dst_path);

                        if (dst_event.is_removed())
                        {
                            queue_deleted_event(dst_event, dst_path, dst_dirname);
                            fs_view_.erase(dst_event.inode);
                        }
                    }
                    else
                    {
                        // Moved into the watched tree.
                        if (!report_created)
                            queue_created_event(event, src_path, src_dirname);

                        if (event.is_directory())
                        {
                            for (const auto &sub_created : events::generate_sub_created_events(src_path))
                                queue_event(sub_created);
                        }
                    }
                }

                if (event.is_removed())
                {
                    queue_deleted_event(event, src_path, src_dirname);
                    fs_view_.erase(event.inode);
                }
            }

            if (event.is_root_changed())
            {
                // The root or one of its parents was renamed or deleted.
                root_changed_ = true;
                queue_event(events::deleted(watch_root_, FileType::Directory));
                logger_->info("Stopping watch of " + watch_root_ + " because root path was changed");
                fs_view_.clear();
            }
        }
    }

} // namespace interpreter
