#ifndef OBSERVER_HPP
#define OBSERVER_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "../emitter/emitter.hpp"
#include "../events/events.hpp"
#include "../logger/Mylogger.hpp"

namespace observer
{

    // Base class for consumers. dispatch() calls onAnyEvent() and then the
    // hook for the event type.
    class FileSystemEventHandler
    {
    public:
        virtual ~FileSystemEventHandler() = default;

        virtual void dispatch(const events::FileSystemEvent &event);

        virtual void onAnyEvent(const events::FileSystemEvent &) {}
        virtual void onCreated(const events::FileSystemEvent &) {}
        virtual void onDeleted(const events::FileSystemEvent &) {}
        virtual void onModified(const events::FileSystemEvent &) {}
        virtual void onMoved(const events::FileSystemEvent &) {}
    };

    class LoggingEventHandler : public FileSystemEventHandler
    {
    public:
        explicit LoggingEventHandler(std::shared_ptr<MyLogger> logger);

        void onCreated(const events::FileSystemEvent &event) override;
        void onDeleted(const events::FileSystemEvent &event) override;
        void onModified(const events::FileSystemEvent &event) override;
        void onMoved(const events::FileSystemEvent &event) override;

    private:
        std::shared_ptr<MyLogger> logger_;
    };

    // Handle for a scheduled watch. Two schedules with equal options share
    // one watch.
    class ObservedWatch
    {
    public:
        explicit ObservedWatch(emitter::WatchOptions options) : options_(std::move(options)) {}

        const std::string &path() const { return options_.path; }
        bool is_recursive() const { return options_.recursive; }
        const emitter::WatchOptions &options() const { return options_; }

    private:
        auto key() const
        {
            return std::tie(options_.path, options_.recursive, options_.event_filter, options_.suppress_history,
                            options_.patterns, options_.ignore_patterns, options_.case_sensitive);
        }

    public:
        bool operator<(const ObservedWatch &other) const { return key() < other.key(); }
        bool operator==(const ObservedWatch &other) const { return key() == other.key(); }

    private:
        emitter::WatchOptions options_;
    };

    class Observer
    {
    public:
        explicit Observer(std::shared_ptr<MyLogger> logger,
                          double delay_seconds = 0.0,
                          emitter::SourceFactory factory = emitter::make_inotify_source);
        ~Observer();

        Observer(const Observer &) = delete;
        Observer &operator=(const Observer &) = delete;

        // Throws patterns::ConflictingPatternsError for contradictory patterns.
        ObservedWatch schedule(std::shared_ptr<FileSystemEventHandler> handler, const emitter::WatchOptions &options);
        void add_handler_for_watch(std::shared_ptr<FileSystemEventHandler> handler, const ObservedWatch &watch);
        void remove_handler_for_watch(const std::shared_ptr<FileSystemEventHandler> &handler, const ObservedWatch &watch);

        void unschedule(const ObservedWatch &watch);
        void unschedule_all();

        void start();
        // Stops every watch. The observer cannot be restarted.
        void stop();

        std::vector<ObservedWatch> watches() const;
        bool is_alive(const ObservedWatch &watch) const;

    private:
        struct WatchEntry
        {
            std::shared_ptr<emitter::EventQueue> queue;
            std::unique_ptr<emitter::Emitter> emitter;
            std::mutex handlers_mutex;
            std::vector<std::shared_ptr<FileSystemEventHandler>> handlers;
            std::thread dispatcher;
        };

        void start_watch(WatchEntry &entry);
        void stop_watch(WatchEntry &entry);
        void dispatch_events(WatchEntry &entry);

        std::shared_ptr<MyLogger> logger_;
        std::chrono::duration<double> delay_;
        emitter::SourceFactory factory_;

        mutable std::mutex lock_;
        std::map<ObservedWatch, std::unique_ptr<WatchEntry>> watches_;
        bool started_ = false;
    };

} // namespace observer

#endif // OBSERVER_HPP
