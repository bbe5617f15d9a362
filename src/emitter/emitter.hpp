#ifndef EMITTER_HPP
#define EMITTER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../delayed_queue/delayed_queue.hpp"
#include "../events/events.hpp"
#include "../interpreter/interpreter.hpp"
#include "../logger/Mylogger.hpp"
#include "../native_source/native_source.hpp"
#include "../patterns/patterns.hpp"

namespace emitter
{

    struct WatchOptions
    {
        std::string path;
        bool recursive = true;
        // Unset means every kind passes.
        std::optional<std::set<events::EventKind>> event_filter;
        bool suppress_history = false;
        std::vector<std::string> patterns{"**"};
        std::vector<std::string> ignore_patterns;
        bool case_sensitive = true;
    };

    using EventQueue = delayed_queue::DelayedQueue<events::FileSystemEvent>;

    using SourceFactory = std::function<std::unique_ptr<native_source::NativeSource>(const WatchOptions &)>;

    std::unique_ptr<native_source::NativeSource> make_inotify_source(const WatchOptions &options);

    // Producer side of one watch: owns the native source and the interpreter
    // and feeds filtered events into the watch's queue.
    class Emitter : public interpreter::EventSink
    {
    public:
        Emitter(std::shared_ptr<EventQueue> queue,
                WatchOptions options,
                std::shared_ptr<MyLogger> logger,
                SourceFactory factory = make_inotify_source);
        ~Emitter() override;

        Emitter(const Emitter &) = delete;
        Emitter &operator=(const Emitter &) = delete;

        void start();
        void stop();
        bool is_alive() const { return running_; }

        // Native batch boundary. Never throws.
        void events_callback(const std::vector<std::string> &paths,
                             const std::vector<uint64_t> &inodes,
                             const std::vector<uint32_t> &flags,
                             const std::vector<uint64_t> &ids);

        void queue_event(const events::FileSystemEvent &event) override;

        const WatchOptions &watch() const { return options_; }

    private:
        void run();
        bool passes_filters(const events::FileSystemEvent &event) const;

        std::shared_ptr<EventQueue> queue_;
        WatchOptions options_;
        std::shared_ptr<MyLogger> logger_;
        patterns::PatternFilter pattern_filter_;

        std::mutex lock_;
        interpreter::EventInterpreter interpreter_;
        std::unique_ptr<native_source::NativeSource> source_;
        std::thread thread_;
        std::atomic<bool> stopped_{false};
        std::atomic<bool> running_{false};
    };

} // namespace emitter

#endif // EMITTER_HPP
