#include "kmswitch/reconnect.hpp"

#include "kmswitch/errors.hpp"

#include <iostream>

namespace kmswitch {

ReconnectSupervisor::ReconnectSupervisor(SourceSet& sources, SourceOpener opener,
                                         std::chrono::milliseconds interval)
    : sources_(sources), opener_(std::move(opener)), interval_(interval) {}

ReconnectSupervisor::~ReconnectSupervisor() { stop(); }

void ReconnectSupervisor::source_failed(size_t slot) {
    std::string path = sources_.path(slot);
    std::cerr << "[source] " << path << " disconnected" << std::endl;
    sources_.detach(slot);

    std::lock_guard<std::mutex> guard(lock_);
    if (!running_ || pending_.count(slot)) return;
    join_finished();
    pending_.insert(slot);
    workers_.push_back(Worker{slot, std::thread(&ReconnectSupervisor::reconnect, this, slot, path)});
}

// lock_ held. A worker out of pending_ is about to return.
void ReconnectSupervisor::join_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (pending_.count(it->slot)) {
            ++it;
            continue;
        }
        it->thread.join();
        it = workers_.erase(it);
    }
}

size_t ReconnectSupervisor::worker_count() const {
    std::lock_guard<std::mutex> guard(lock_);
    return workers_.size();
}

bool ReconnectSupervisor::pending(size_t slot) const {
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.count(slot) != 0;
}

void ReconnectSupervisor::reconnect(size_t slot, std::string path) {
    while (running_) {
        try {
            auto source = opener_(path);
            {
                // a slot is never seen connected and pending at once
                std::lock_guard<std::mutex> guard(lock_);
                sources_.attach(slot, std::move(source));
                pending_.erase(slot);
            }
            std::cout << "[source] " << path << " reconnected" << std::endl;
            return;
        } catch (const DeviceUnavailable&) {
            // not back yet
        }
        std::unique_lock<std::mutex> guard(lock_);
        wake_.wait_for(guard, interval_, [this] { return !running_; });
    }
}

void ReconnectSupervisor::stop() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> guard(lock_);
        running_ = false;
        workers.swap(workers_);
    }
    wake_.notify_all();
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

}  // namespace kmswitch
