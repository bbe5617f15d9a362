#include "emitter.hpp"

#include <stdexcept>
#include <utility>

#include "../snapshot/snapshot.hpp"

using events::EventType;
using events::FileSystemEvent;
using events::FileType;

namespace emitter
{
    namespace
    {
        WatchOptions with_normal_root(WatchOptions options)
        {
            options.path = interpreter::normalize_root(options.path);
            return options;
        }
    }

    std::unique_ptr<native_source::NativeSource> make_inotify_source(const WatchOptions &options)
    {
        return std::make_unique<native_source::InotifySource>(options.path, options.recursive,
                                                              MyLogger::create("inotify"));
    }

    Emitter::Emitter(std::shared_ptr<EventQueue> queue,
                     WatchOptions options,
                     std::shared_ptr<MyLogger> logger,
                     SourceFactory factory)
        : queue_(std::move(queue)),
          options_(with_normal_root(std::move(options))),
          logger_(std::move(logger)),
          pattern_filter_(options_.patterns, options_.ignore_patterns, options_.case_sensitive),
          interpreter_(options_.path, options_.recursive, *this, MyLogger::create("interpreter"))
    {
        if (!queue_)
            throw std::invalid_argument("Emitter for " + options_.path + " needs an event queue");
        if (!factory)
            throw std::invalid_argument("Emitter for " + options_.path + " needs a native source factory");
        source_ = factory(options_);
    }

    Emitter::~Emitter()
    {
        stop();
    }

    void Emitter::start()
    {
        if (thread_.joinable())
            return;

        if (options_.suppress_history)
        {
            auto state = snapshot::DirectorySnapshot::capture(options_.path, options_.recursive);
            logger_->debug("Captured " + std::to_string(state.size()) + " entries below " + options_.path);
            std::lock_guard<std::mutex> lock(lock_);
            interpreter_.set_starting_state(std::move(state));
        }

        running_ = true;
        thread_ = std::thread(&Emitter::run, this);
    }

    void Emitter::run()
    {
        try
        {
            {
                std::lock_guard<std::mutex> lock(lock_);
                interpreter_.start();
            }
            source_->start();
            source_->run([this](const std::vector<std::string> &paths,
                                const std::vector<uint64_t> &inodes,
                                const std::vector<uint32_t> &flags,
                                const std::vector<uint64_t> &ids)
                         { events_callback(paths, inodes, flags, ids); });
        }
        catch (const native_source::NativeSourceError &e)
        {
            logger_->error("Native source for " + options_.path + " failed: " + e.what());
        }
        catch (const std::exception &e)
        {
            logger_->error("Watch of " + options_.path + " terminated: " + e.what());
        }
        catch (...)
        {
            logger_->error("Watch of " + options_.path + " terminated by unknown exception");
        }
        running_ = false;
    }

    void Emitter::stop()
    {
        {
            // Once set under the lock, no further batch reaches the interpreter.
            std::lock_guard<std::mutex> lock(lock_);
            stopped_ = true;
        }
        if (source_)
            source_->stop();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            thread_.join();
    }

    void Emitter::events_callback(const std::vector<std::string> &paths,
                                  const std::vector<uint64_t> &inodes,
                                  const std::vector<uint32_t> &flags,
                                  const std::vector<uint64_t> &ids)
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (stopped_)
            return;

        try
        {
            if (inodes.size() != paths.size() || flags.size() != paths.size() || ids.size() != paths.size())
            {
                throw std::invalid_argument("malformed native batch: " + std::to_string(paths.size()) + " paths, " +
                                            std::to_string(inodes.size()) + " inodes, " +
                                            std::to_string(flags.size()) + " flags, " +
                                            std::to_string(ids.size()) + " ids");
            }

            std::vector<interpreter::RawNotification> batch;
            batch.reserve(paths.size());
            for (size_t i = 0; i < paths.size(); ++i)
                batch.push_back(interpreter::RawNotification{paths[i], inodes[i], flags[i], ids[i]});

            interpreter_.queue_events(std::move(batch));

            if (interpreter_.root_changed())
                source_->stop();
        }
        catch (const std::exception &e)
        {
            logger_->error("Unhandled exception while processing " + std::to_string(paths.size()) +
                           " native events for " + options_.path + ": " + e.what());
        }
        catch (...)
        {
            logger_->error("Unknown exception while processing " + std::to_string(paths.size()) +
                           " native events for " + options_.path);
        }
    }

    bool Emitter::passes_filters(const FileSystemEvent &event) const
    {
        if (options_.event_filter && options_.event_filter->count(events::kind_of(event)) == 0)
            return false;

        if (pattern_filter_.matches(event.src_path))
            return true;
        return event.eventType == EventType::Moved && pattern_filter_.matches(event.dest_path);
    }

    void Emitter::queue_event(const FileSystemEvent &event)
    {
        // The root's Deleted tells consumers the watch has ended.
        if (interpreter_.root_changed() && event.eventType == EventType::Deleted &&
            event.src_path == interpreter_.watch_root())
        {
            queue_->put(event);
            return;
        }

        if (!passes_filters(event))
            return;

        if (queue_->delay().count() > 0 && !event.is_directory())
        {
            if (event.eventType == EventType::Deleted)
            {
                // Held back so that an immediate re-create can replace it.
                queue_->put(event, true);
                return;
            }
            if (event.eventType == EventType::Created)
            {
                auto replaced = queue_->remove([&event](const FileSystemEvent &queued)
                                               { return queued.eventType == EventType::Deleted &&
                                                        !queued.is_directory() &&
                                                        queued.src_path == event.src_path; });
                if (replaced)
                {
                    logger_->debug("Coalesced delete and create of " + event.src_path + " into modify");
                    queue_->put(events::modified(event.src_path, FileType::File));
                    return;
                }
            }
        }

        queue_->put(event);
    }

} // namespace emitter
