#include "kmswitch/source_set.hpp"

namespace kmswitch {

size_t SourceSet::add(std::unique_ptr<InputSource> source, SourceKind kind) {
    std::lock_guard<std::mutex> guard(lock_);
    if (grabbed_) source->grab();
    std::string path = source->path();
    slots_.push_back(Slot{path, kind, std::move(source)});
    return slots_.size() - 1;
}

const std::string& SourceSet::path(size_t slot) const {
    std::lock_guard<std::mutex> guard(lock_);
    return slots_.at(slot).path;
}

bool SourceSet::connected(size_t slot) const {
    std::lock_guard<std::mutex> guard(lock_);
    return slots_.at(slot).source != nullptr;
}

std::vector<SourceSet::Ready> SourceSet::connected_sources() const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<Ready> out;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].source) out.push_back(Ready{i, slots_[i].source.get()});
    }
    return out;
}

void SourceSet::detach(size_t slot) {
    std::unique_ptr<InputSource> old;
    {
        std::lock_guard<std::mutex> guard(lock_);
        old = std::move(slots_.at(slot).source);
    }
}

void SourceSet::attach(size_t slot, std::unique_ptr<InputSource> source) {
    std::unique_ptr<InputSource> old;
    std::lock_guard<std::mutex> guard(lock_);
    if (grabbed_) source->grab();
    old = std::move(slots_.at(slot).source);
    slots_.at(slot).source = std::move(source);
}

void SourceSet::grab_all() {
    std::lock_guard<std::mutex> guard(lock_);
    if (grabbed_) return;
    for (auto& s : slots_) {
        if (s.source) s.source->grab();
    }
    grabbed_ = true;
}

void SourceSet::release_all() {
    std::lock_guard<std::mutex> guard(lock_);
    if (!grabbed_) return;
    for (auto& s : slots_) {
        if (s.source) s.source->release();
    }
    grabbed_ = false;
}

bool SourceSet::is_key_down(int code) const {
    std::lock_guard<std::mutex> guard(lock_);
    for (const auto& s : slots_) {
        if (s.kind == SourceKind::Keyboard && s.source && s.source->is_key_down(code)) return true;
    }
    return false;
}

void SourceSet::set_keyboard_led(int code, bool on) {
    std::lock_guard<std::mutex> guard(lock_);
    for (auto& s : slots_) {
        if (s.kind == SourceKind::Keyboard && s.source) s.source->set_led(code, on);
    }
}

}  // namespace kmswitch
