#pragma once

#include "kmswitch/input_source.hpp"
#include "kmswitch/source_set.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace kmswitch {

/*
    Reopens sources that disconnected.

    Each failed slot gets a worker thread that retries the open at a fixed
    interval and, once it succeeds, attaches the new handle to the SourceSet.
    Nothing else is shared with the event loop.
*/
class ReconnectSupervisor {
public:
    ReconnectSupervisor(SourceSet& sources, SourceOpener opener,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    // Called from the event loop after a read failed.
    void source_failed(size_t slot);

    bool pending(size_t slot) const;
    // Threads not yet joined. Finished workers are joined on the next failure.
    size_t worker_count() const;
    void stop();

private:
    struct Worker {
        size_t slot;
        std::thread thread;
    };

    void reconnect(size_t slot, std::string path);
    void join_finished();

    SourceSet& sources_;
    SourceOpener opener_;
    std::chrono::milliseconds interval_;

    mutable std::mutex lock_;
    std::condition_variable wake_;
    std::set<size_t> pending_;
    std::vector<Worker> workers_;
    std::atomic<bool> running_{true};
};

}  // namespace kmswitch
