#include "observer.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

using events::EventType;
using events::FileSystemEvent;

namespace observer
{

    void FileSystemEventHandler::dispatch(const FileSystemEvent &event)
    {
        onAnyEvent(event);
        switch (event.eventType)
        {
        case EventType::Created:
            onCreated(event);
            break;
        case EventType::Deleted:
            onDeleted(event);
            break;
        case EventType::Modified:
            onModified(event);
            break;
        case EventType::Moved:
            onMoved(event);
            break;
        }
    }

    LoggingEventHandler::LoggingEventHandler(std::shared_ptr<MyLogger> logger)
        : logger_(std::move(logger))
    {
    }

    void LoggingEventHandler::onCreated(const FileSystemEvent &event)
    {
        logger_->info("Created " + events::fileTypeToString(event.fileType) + ": " + event.src_path);
    }

    void LoggingEventHandler::onDeleted(const FileSystemEvent &event)
    {
        logger_->info("Deleted " + events::fileTypeToString(event.fileType) + ": " + event.src_path);
    }

    void LoggingEventHandler::onModified(const FileSystemEvent &event)
    {
        logger_->info("Modified " + events::fileTypeToString(event.fileType) + ": " + event.src_path);
    }

    void LoggingEventHandler::onMoved(const FileSystemEvent &event)
    {
        logger_->info("Moved " + events::fileTypeToString(event.fileType) + ": from " + event.src_path +
                      " to " + event.dest_path);
    }

    Observer::Observer(std::shared_ptr<MyLogger> logger, double delay_seconds, emitter::SourceFactory factory)
        : logger_(std::move(logger)), delay_(delay_seconds), factory_(std::move(factory))
    {
        if (delay_seconds < 0)
            throw std::invalid_argument("delay_seconds must not be negative");
    }

    Observer::~Observer()
    {
        stop();
    }

    ObservedWatch Observer::schedule(std::shared_ptr<FileSystemEventHandler> handler,
                                     const emitter::WatchOptions &options)
    {
        ObservedWatch watch(options);

        std::lock_guard<std::mutex> lock(lock_);
        auto it = watches_.find(watch);
        if (it == watches_.end())
        {
            auto entry = std::make_unique<WatchEntry>();
            entry->queue = std::make_shared<emitter::EventQueue>(delay_);
            entry->emitter = std::make_unique<emitter::Emitter>(entry->queue, options, MyLogger::create("emitter"),
                                                                factory_);
            it = watches_.emplace(watch, std::move(entry)).first;
            logger_->info("Scheduled watch of " + options.path);
            if (started_)
                start_watch(*it->second);
        }

        if (handler)
        {
            std::lock_guard<std::mutex> handlers_lock(it->second->handlers_mutex);
            it->second->handlers.push_back(std::move(handler));
        }
        return watch;
    }

    void Observer::add_handler_for_watch(std::shared_ptr<FileSystemEventHandler> handler, const ObservedWatch &watch)
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = watches_.find(watch);
        if (it == watches_.end())
            throw std::out_of_range("Watch of " + watch.path() + " is not scheduled");

        std::lock_guard<std::mutex> handlers_lock(it->second->handlers_mutex);
        it->second->handlers.push_back(std::move(handler));
    }

    void Observer::remove_handler_for_watch(const std::shared_ptr<FileSystemEventHandler> &handler,
                                            const ObservedWatch &watch)
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = watches_.find(watch);
        if (it == watches_.end())
            return;

        std::lock_guard<std::mutex> handlers_lock(it->second->handlers_mutex);
        auto &handlers = it->second->handlers;
        handlers.erase(std::remove(handlers.begin(), handlers.end(), handler), handlers.end());
    }

    void Observer::unschedule(const ObservedWatch &watch)
    {
        std::unique_ptr<WatchEntry> entry;
        {
            std::lock_guard<std::mutex> lock(lock_);
            auto it = watches_.find(watch);
            if (it == watches_.end())
                return;
            entry = std::move(it->second);
            watches_.erase(it);
        }
        stop_watch(*entry);
        logger_->info("Unscheduled watch of " + watch.path());
    }

    void Observer::unschedule_all()
    {
        std::map<ObservedWatch, std::unique_ptr<WatchEntry>> removed;
        {
            std::lock_guard<std::mutex> lock(lock_);
            removed.swap(watches_);
        }
        for (auto &watch : removed)
            stop_watch(*watch.second);
    }

    void Observer::start()
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (started_)
            return;
        started_ = true;
        for (auto &watch : watches_)
            start_watch(*watch.second);
    }

    void Observer::stop()
    {
        std::lock_guard<std::mutex> lock(lock_);
        for (auto &watch : watches_)
            stop_watch(*watch.second);
        started_ = false;
    }

    std::vector<ObservedWatch> Observer::watches() const
    {
        std::lock_guard<std::mutex> lock(lock_);
        std::vector<ObservedWatch> result;
        for (const auto &watch : watches_)
            result.push_back(watch.first);
        return result;
    }

    bool Observer::is_alive(const ObservedWatch &watch) const
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = watches_.find(watch);
        return it != watches_.end() && it->second->emitter->is_alive();
    }

    void Observer::start_watch(WatchEntry &entry)
    {
        if (entry.dispatcher.joinable())
            return;
        entry.emitter->start();
        entry.dispatcher = std::thread(&Observer::dispatch_events, this, std::ref(entry));
    }

    void Observer::stop_watch(WatchEntry &entry)
    {
        entry.emitter->stop();
        entry.queue->close();
        if (entry.dispatcher.joinable())
            entry.dispatcher.join();
    }

    void Observer::dispatch_events(WatchEntry &entry)
    {
        while (auto event = entry.queue->get())
        {
            std::vector<std::shared_ptr<FileSystemEventHandler>> handlers;
            {
                std::lock_guard<std::mutex> lock(entry.handlers_mutex);
                handlers = entry.handlers;
            }
            for (const auto &handler : handlers)
            {
                try
                {
                    handler->dispatch(*event);
                }
                catch (const std::exception &e)
                {
                    logger_->error("Handler failed on " + events::to_string(*event) + ": " + e.what());
                }
            }
        }
    }

} // namespace observer
