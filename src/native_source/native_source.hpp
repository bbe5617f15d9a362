#ifndef NATIVE_SOURCE_HPP
#define NATIVE_SOURCE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/inotify.h>

#include "../logger/Mylogger.hpp"

namespace native_source
{

    class NativeSourceError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // One batch: paths, inodes, flags and ids, index-aligned.
    using BatchCallback = std::function<void(const std::vector<std::string> &,
                                             const std::vector<uint64_t> &,
                                             const std::vector<uint32_t> &,
                                             const std::vector<uint64_t> &)>;

    class NativeSource
    {
    public:
        virtual ~NativeSource() = default;

        virtual void start() = 0;
        // Blocks delivering batches until stop() is called.
        virtual void run(const BatchCallback &callback) = 0;
        // Safe to call from any thread, before or during run().
        virtual void stop() = 0;
    };

    // Linux inotify source.
    class InotifySource : public NativeSource
    {
    public:
        InotifySource(const std::string &root, bool recursive, std::shared_ptr<MyLogger> logger);
        ~InotifySource() override;

        InotifySource(const InotifySource &) = delete;
        InotifySource &operator=(const InotifySource &) = delete;

        void start() override;
        void run(const BatchCallback &callback) override;
        void stop() override;

    private:
        struct Batch;
        struct PendingMove
        {
            std::string path;
            bool is_directory;
        };

        int add_watch(const std::string &dir);
        void add_tree(const std::string &dir, Batch *created_children);
        void remove_tree(const std::string &dir);
        void rename_tree(const std::string &from, const std::string &to);
        void record_inode(const std::string &path, uint64_t inode);
        uint64_t known_inode(const std::string &path) const;

        void translate(const struct inotify_event *event, Batch &batch);
        void drop_unmatched_moves();

        std::string root_;
        bool recursive_;
        std::shared_ptr<MyLogger> logger_;

        std::mutex fd_mutex_;
        int inotify_fd_ = -1;
        int wake_fd_ = -1;
        std::atomic<bool> stopping_{false};

        int root_wd_ = -1;
        std::unordered_map<int, std::string> wd_to_path_;
        std::unordered_map<std::string, uint64_t> inodes_;
        std::unordered_map<uint32_t, PendingMove> pending_moves_;
        uint64_t next_event_id_ = 1;
    };

} // namespace native_source

#endif // NATIVE_SOURCE_HPP
