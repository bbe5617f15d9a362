#ifndef INTERPRETER_HPP
#define INTERPRETER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../events/events.hpp"
#include "../logger/Mylogger.hpp"
#include "../snapshot/snapshot.hpp"

namespace interpreter
{

    // Native flag bits carried by a raw notification.
    namespace flags
    {
        constexpr uint32_t MustScanSubDirs = 0x00000001;
        constexpr uint32_t HistoryDone = 0x00000010;
        constexpr uint32_t RootChanged = 0x00000020;
        constexpr uint32_t ItemCreated = 0x00000100;
        constexpr uint32_t ItemRemoved = 0x00000200;
        constexpr uint32_t ItemInodeMetaMod = 0x00000400;
        constexpr uint32_t ItemRenamed = 0x00000800;
        constexpr uint32_t ItemModified = 0x00001000;
        constexpr uint32_t ItemFinderInfoMod = 0x00002000;
        constexpr uint32_t ItemChangeOwner = 0x00004000;
        constexpr uint32_t ItemXattrMod = 0x00008000;
        constexpr uint32_t ItemIsFile = 0x00010000;
        constexpr uint32_t ItemIsDir = 0x00020000;
        constexpr uint32_t ItemIsSymlink = 0x00040000;
    } // namespace flags

    // One entry of a native batch.
    struct RawNotification
    {
        std::string path;
        uint64_t inode = 0;
        uint32_t flags = 0;
        uint64_t event_id = 0;

        bool has(uint32_t flag) const { return (flags & flag) != 0; }

        bool is_created() const { return has(flags::ItemCreated); }
        bool is_removed() const { return has(flags::ItemRemoved); }
        bool is_renamed() const { return has(flags::ItemRenamed); }
        bool is_modified() const { return has(flags::ItemModified); }
        bool is_inode_meta_mod() const { return has(flags::ItemInodeMetaMod); }
        bool is_xattr_mod() const { return has(flags::ItemXattrMod); }
        bool is_owner_change() const { return has(flags::ItemChangeOwner); }
        bool is_directory() const { return has(flags::ItemIsDir); }
        bool is_root_changed() const { return has(flags::RootChanged); }

        // Any change of metadata rather than content.
        bool is_meta_mod() const { return is_inode_meta_mod() || is_xattr_mod() || is_owner_change(); }

        std::string describe() const;
    };

    // Receives the interpreter's output.
    class EventSink
    {
    public:
        virtual void queue_event(const events::FileSystemEvent &event) = 0;
        virtual ~EventSink() {}
    };

    // Turns raw native batches into semantic events for one watch.
    //
    // Not thread safe: the owner serializes calls to queue_events().
    class EventInterpreter
    {
    public:
        using Clock = std::chrono::steady_clock;

        // The native source only replays history for a bounded window after start.
        static constexpr std::chrono::seconds kHistoryWindow{60};

        EventInterpreter(const std::string &watch_root,
                         bool recursive,
                         EventSink &sink,
                         std::shared_ptr<MyLogger> logger);

        void set_starting_state(snapshot::DirectorySnapshot state);
        void start(Clock::time_point now = Clock::now());

        // Reconcile one batch. Entries are consumed in order; the destination
        // half of a rename is taken out of the remaining entries.
        void queue_events(std::vector<RawNotification> batch, Clock::time_point now = Clock::now());

        // The root itself went away; nothing more will be emitted.
        bool root_changed() const { return root_changed_; }

        bool has_starting_state() const { return starting_state_.has_value(); }
        const std::unordered_set<uint64_t> &known_inodes() const { return fs_view_; }
        const std::string &watch_root() const { return watch_root_; }
        bool is_recursive() const { return recursive_; }

    private:
        bool is_historic_created_event(const RawNotification &event) const;
        bool is_in_scope(const events::FileSystemEvent &event) const;

        void queue_event(const events::FileSystemEvent &event);
        void queue_created_event(const RawNotification &event, const std::string &src_path, const std::string &parent);
        void queue_deleted_event(const RawNotification &event, const std::string &src_path, const std::string &parent);
        void queue_modified_event(const RawNotification &event, const std::string &src_path);
        void queue_renamed_event(const RawNotification &src_event,
                                 const std::string &src_path,
                                 const std::string &dst_path,
                                 const std::string &src_dirname,
                                 const std::string &dst_dirname);

        std::string watch_root_;
        bool recursive_;
        EventSink &sink_;
        std::shared_ptr<MyLogger> logger_;

        std::unordered_set<uint64_t> fs_view_;
        std::optional<snapshot::DirectorySnapshot> starting_state_;
        Clock::time_point start_time_;
        bool root_changed_ = false;
    };

    // Lexically normal form without trailing separators.
    std::string normalize_root(const std::string &root);

    std::string dirname(const std::string &path);

} // namespace interpreter

#endif // INTERPRETER_HPP
