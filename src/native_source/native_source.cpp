#include "native_source.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <limits.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <system_error>
#include <unistd.h>

#include "../interpreter/interpreter.hpp"
#include "../snapshot/snapshot.hpp"

namespace fs = std::filesystem;
namespace flags = interpreter::flags;

namespace native_source
{
    namespace
    {
        constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB |
                                        IN_MOVED_FROM | IN_MOVED_TO |
                                        IN_DELETE_SELF | IN_MOVE_SELF |
                                        IN_ONLYDIR | IN_DONT_FOLLOW | IN_EXCL_UNLINK;

        constexpr size_t kBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

        // True if 'path' is 'base' or lies below it.
        bool is_descendant(const std::string &base, const std::string &path)
        {
            if (base == path)
                return true;
            std::string baseWithSep = base;
            if (baseWithSep.back() != '/')
                baseWithSep.push_back('/');
            return path.compare(0, baseWithSep.size(), baseWithSep) == 0;
        }

        std::string errno_message(const std::string &what)
        {
            return what + ": " + std::strerror(errno);
        }
    }

    struct InotifySource::Batch
    {
        std::vector<std::string> paths;
        std::vector<uint64_t> inodes;
        std::vector<uint32_t> flags;
        std::vector<uint64_t> ids;

        void add(const std::string &path, uint64_t inode, uint32_t mask, uint64_t id)
        {
            paths.push_back(path);
            inodes.push_back(inode);
            flags.push_back(mask);
            ids.push_back(id);
        }

        bool empty() const { return paths.empty(); }
    };

    InotifySource::InotifySource(const std::string &root, bool recursive, std::shared_ptr<MyLogger> logger)
        : root_(interpreter::normalize_root(root)), recursive_(recursive), logger_(std::move(logger))
    {
    }

    InotifySource::~InotifySource()
    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (inotify_fd_ >= 0)
            ::close(inotify_fd_);
        if (wake_fd_ >= 0)
            ::close(wake_fd_);
    }

    void InotifySource::start()
    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (inotify_fd_ >= 0)
            throw NativeSourceError("inotify source for " + root_ + " already started");

        inotify_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd_ < 0)
            throw NativeSourceError(errno_message("inotify_init1"));

        wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0)
            throw NativeSourceError(errno_message("eventfd"));

        root_wd_ = add_watch(root_);
        if (root_wd_ < 0)
            throw NativeSourceError(errno_message("Cannot watch " + root_));

        if (auto info = snapshot::stat_entry(root_))
            record_inode(root_, info->inode);
        add_tree(root_, nullptr);

        logger_->info("Watching " + root_ + (recursive_ ? " recursively" : "") + " with " +
                      std::to_string(wd_to_path_.size()) + " inotify watches");
    }

    void InotifySource::run(const BatchCallback &callback)
    {
        if (inotify_fd_ < 0)
        {
            if (stopping_)
                return;
            throw NativeSourceError("inotify source for " + root_ + " was not started");
        }

        alignas(struct inotify_event) char buffer[kBufferSize];
        struct pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};

        while (!stopping_)
        {
            int ready = ::poll(fds, 2, -1);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                throw NativeSourceError(errno_message("poll"));
            }
            if (fds[1].revents & POLLIN)
                break;
            if (!(fds[0].revents & POLLIN))
                continue;

            ssize_t length = ::read(inotify_fd_, buffer, sizeof(buffer));
            if (length < 0)
            {
                if (errno == EAGAIN || errno == EINTR)
                    continue;
                throw NativeSourceError(errno_message("read"));
            }

            Batch batch;
            for (char *ptr = buffer; ptr < buffer + length;)
            {
                const auto *event = reinterpret_cast<const struct inotify_event *>(ptr);
                translate(event, batch);
                ptr += sizeof(struct inotify_event) + event->len;
            }
            drop_unmatched_moves();

            if (!batch.empty())
                callback(batch.paths, batch.inodes, batch.flags, batch.ids);
        }
        logger_->debug("inotify loop for " + root_ + " finished");
    }

    void InotifySource::stop()
    {
        stopping_ = true;
        std::lock_guard<std::mutex> lock(fd_mutex_);
        if (wake_fd_ >= 0)
        {
            uint64_t one = 1;
            if (::write(wake_fd_, &one, sizeof(one)) < 0)
                logger_->warning(errno_message("Failed to wake inotify loop for " + root_));
        }
    }

    int InotifySource::add_watch(const std::string &dir)
    {
        int wd = ::inotify_add_watch(inotify_fd_, dir.c_str(), kWatchMask);
        if (wd >= 0)
            wd_to_path_[wd] = dir;
        return wd;
    }

    // Record inodes below dir and, when recursive, watch its subdirectories.
    void InotifySource::add_tree(const std::string &dir, Batch *created_children)
    {
        std::error_code ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            const std::string path = it->path().string();
            auto info = snapshot::stat_entry(path);
            if (!info)
                continue;
            record_inode(path, info->inode);

            if (info->is_directory)
            {
                if (!recursive_)
                    it.disable_recursion_pending();
                else if (add_watch(path) < 0)
                    logger_->warning(errno_message("Cannot watch " + path));
            }

            if (created_children)
                created_children->add(path, info->inode,
                                      flags::ItemCreated | (info->is_directory ? flags::ItemIsDir : flags::ItemIsFile),
                                      next_event_id_++);
        }
    }

    void InotifySource::remove_tree(const std::string &dir)
    {
        for (auto it = wd_to_path_.begin(); it != wd_to_path_.end();)
        {
            if (is_descendant(dir, it->second))
            {
                ::inotify_rm_watch(inotify_fd_, it->first);
                it = wd_to_path_.erase(it);
            }
            else
                ++it;
        }
        for (auto it = inodes_.begin(); it != inodes_.end();)
        {
            if (is_descendant(dir, it->first))
                it = inodes_.erase(it);
            else
                ++it;
        }
    }

    void InotifySource::rename_tree(const std::string &from, const std::string &to)
    {
        for (auto &entry : wd_to_path_)
        {
            if (is_descendant(from, entry.second))
                entry.second = to + entry.second.substr(from.size());
        }

        std::vector<std::pair<std::string, uint64_t>> moved;
        for (auto it = inodes_.begin(); it != inodes_.end();)
        {
            if (is_descendant(from, it->first))
            {
                moved.emplace_back(to + it->first.substr(from.size()), it->second);
                it = inodes_.erase(it);
            }
            else
                ++it;
        }
        for (const auto &entry : moved)
            inodes_[entry.first] = entry.second;
    }

    void InotifySource::record_inode(const std::string &path, uint64_t inode)
    {
        inodes_[path] = inode;
    }

    uint64_t InotifySource::known_inode(const std::string &path) const
    {
        auto it = inodes_.find(path);
        return it == inodes_.end() ? 0 : it->second;
    }

    void InotifySource::translate(const struct inotify_event *event, Batch &batch)
    {
        if (event->mask & IN_Q_OVERFLOW)
        {
            logger_->warning("inotify queue overflow while watching " + root_ + ", events were lost");
            return;
        }
        if (event->mask & IN_IGNORED)
        {
            wd_to_path_.erase(event->wd);
            return;
        }

        auto dir = wd_to_path_.find(event->wd);
        if (dir == wd_to_path_.end())
            return;

        if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF))
        {
            if (event->wd == root_wd_)
                batch.add(root_, known_inode(root_), flags::RootChanged | flags::ItemIsDir, next_event_id_++);
            return;
        }

        if (event->len == 0)
        {
            // Attribute change of the watched directory itself; children
            // are reported by their parent's watch.
            if (event->wd == root_wd_ && (event->mask & IN_ATTRIB))
                batch.add(root_, known_inode(root_), flags::ItemInodeMetaMod | flags::ItemIsDir, next_event_id_++);
            return;
        }

        const std::string path = (fs::path(dir->second) / event->name).string();
        const bool is_dir = (event->mask & IN_ISDIR) != 0;
        const uint32_t type_flag = is_dir ? flags::ItemIsDir : flags::ItemIsFile;

        if (event->mask & IN_CREATE)
        {
            auto info = snapshot::stat_entry(path);
            uint64_t inode = info ? info->inode : 0;
            if (info)
                record_inode(path, inode);
            batch.add(path, inode, flags::ItemCreated | type_flag, next_event_id_++);

            if (is_dir && recursive_ && info)
            {
                if (add_watch(path) < 0)
                    logger_->warning(errno_message("Cannot watch " + path));
                // Entries created before the watch was in place.
                add_tree(path, &batch);
            }
        }
        else if (event->mask & IN_MOVED_FROM)
        {
            batch.add(path, known_inode(path), flags::ItemRenamed | type_flag, next_event_id_++);
            pending_moves_[event->cookie] = PendingMove{path, is_dir};
        }
        else if (event->mask & IN_MOVED_TO)
        {
            auto info = snapshot::stat_entry(path);
            uint64_t inode = info ? info->inode : 0;

            auto pending = pending_moves_.find(event->cookie);
            if (pending != pending_moves_.end())
            {
                // Renamed inside the tree: existing watches follow the item.
                if (pending->second.is_directory)
                    rename_tree(pending->second.path, path);
                else
                    inodes_.erase(pending->second.path);
                pending_moves_.erase(pending);
            }
            else if (is_dir && recursive_ && info)
            {
                if (add_watch(path) < 0)
                    logger_->warning(errno_message("Cannot watch " + path));
                add_tree(path, nullptr);
            }

            if (info)
                record_inode(path, inode);
            batch.add(path, inode, flags::ItemRenamed | type_flag, next_event_id_++);
        }
        else if (event->mask & IN_DELETE)
        {
            batch.add(path, known_inode(path), flags::ItemRemoved | type_flag, next_event_id_++);
            inodes_.erase(path);
        }
        else if (event->mask & IN_MODIFY)
        {
            batch.add(path, known_inode(path), flags::ItemModified | type_flag, next_event_id_++);
        }
        else if (event->mask & IN_ATTRIB)
        {
            batch.add(path, known_inode(path), flags::ItemInodeMetaMod | type_flag, next_event_id_++);
        }
    }

    // A moved-from without its moved-to left the tree.
    void InotifySource::drop_unmatched_moves()
    {
        for (const auto &pending : pending_moves_)
        {
            logger_->debug("Moved out of " + root_ + ": " + pending.second.path);
            remove_tree(pending.second.path);
        }
        pending_moves_.clear();
    }

} // namespace native_source
