// Reconnection: a source that disappears is reopened in the background.

#include "fakes.hpp"

#include "kmswitch/errors.hpp"
#include "kmswitch/router.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <thread>

using namespace kmswitch;

namespace {

// Device node that can be "unplugged" and "plugged in" again.
struct Hotplug {
  std::mutex lock;
  bool present = true;
  std::shared_ptr<FakeSourceState> latest;
  int opens = 0;

  std::unique_ptr<InputSource> open(const std::string& path) {
    std::lock_guard<std::mutex> guard(lock);
    if (!present) throw DeviceUnavailable(path, ENOENT);
    ++opens;
    latest = std::make_shared<FakeSourceState>();
    return makeSource(path, latest);
  }

  std::shared_ptr<FakeSourceState> current() {
    std::lock_guard<std::mutex> guard(lock);
    return latest;
  }
};

bool waitFor(const std::function<bool()>& cond, int ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return cond();
}

}  // namespace

int main() {
  // --- Test 1: disconnect, drop input, reconnect, resume ---
  {
    Hotplug plug;
    FakeFactory factory;
    Router router(factory);
    router.set_source_opener([&](const std::string& path) { return plug.open(path); },
                             std::chrono::milliseconds(20));
    size_t slot = router.add_source(plug.open("/dev/input/kbd"), SourceKind::Keyboard);
    router.add_target(KEY_F1, "win");
    router.set_active("win");
    auto first = plug.current();
    requireTrue(first->grabbed, "initial source grabbed");

    first->push(key_event(KEY_A, VALUE_DOWN));
    {
      std::lock_guard<std::mutex> guard(plug.lock);
      plug.present = false;
    }
    first->disconnect();
    router.run_once(100);

    requireTrue(countKey(factory.kbd["win"], KEY_A, VALUE_DOWN) == 1, "events read before the failure are kept");
    requireTrue(!router.sources().connected(slot), "slot marked disconnected");
    requireTrue(router.supervisor().pending(slot), "reconnect scheduled");

    // the loop keeps running without the source
    first->push(key_event(KEY_B, VALUE_DOWN));
    router.run_once(10);
    requireTrue(countKey(factory.kbd["win"], KEY_B, VALUE_DOWN) == 0, "input from an unplugged source is lost");
    requireTrue(router.active() && router.active()->name == "win", "router state kept");

    {
      std::lock_guard<std::mutex> guard(plug.lock);
      plug.present = true;
    }
    requireTrue(waitFor([&] { return router.sources().connected(slot); }, 2000), "source reattached");
    requireTrue(!router.supervisor().pending(slot), "no longer pending");
    auto second = plug.current();
    requireTrue(second != first, "a new handle was opened");
    requireTrue(second->grabbed, "reattached source grabbed while routed");

    second->push(key_event(KEY_A, VALUE_UP));
    second->push(key_event(KEY_C, VALUE_DOWN));
    requireTrue(router.run_once(100), "new source is polled");
    requireTrue(countKey(factory.kbd["win"], KEY_A, VALUE_UP) == 1, "held key released after reconnect");
    requireTrue(countKey(factory.kbd["win"], KEY_C, VALUE_DOWN) == 1, "events flow again");

    std::printf("  Test 1 (reconnect while routed) PASS\n");
  }

  // --- Test 2: reattached source stays ungrabbed while idle ---
  {
    Hotplug plug;
    FakeFactory factory;
    Router router(factory);
    router.set_source_opener([&](const std::string& path) { return plug.open(path); },
                             std::chrono::milliseconds(20));
    size_t slot = router.add_source(plug.open("/dev/input/mouse"), SourceKind::Mouse);
    router.add_target(KEY_F1, "win");

    plug.current()->disconnect();
    router.run_once(100);
    requireTrue(waitFor([&] { return router.sources().connected(slot); }, 2000), "source reattached");
    requireTrue(!plug.current()->grabbed, "idle: not grabbed");
    requireTrue(plug.opens == 2, "opened exactly twice");

    router.set_active("win");
    requireTrue(plug.current()->grabbed, "grabbed on activation");
    std::printf("  Test 2 (reconnect while idle) PASS\n");
  }

  // --- Test 3: stopping the supervisor abandons pending retries ---
  {
    Hotplug plug;
    FakeFactory factory;
    Router router(factory);
    router.set_source_opener([&](const std::string& path) { return plug.open(path); },
                             std::chrono::milliseconds(20));
    size_t slot = router.add_source(plug.open("/dev/input/kbd"), SourceKind::Keyboard);
    {
      std::lock_guard<std::mutex> guard(plug.lock);
      plug.present = false;
    }
    plug.current()->disconnect();
    router.run_once(100);
    requireTrue(router.supervisor().pending(slot), "retrying");
    router.supervisor().stop();
    {
      std::lock_guard<std::mutex> guard(plug.lock);
      plug.present = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    requireTrue(!router.sources().connected(slot), "no reconnect after stop");
    std::printf("  Test 3 (supervisor stop) PASS\n");
  }

  // --- Test 4: repeated unplugging does not pile up finished workers ---
  {
    Hotplug plug;
    FakeFactory factory;
    Router router(factory);
    router.set_source_opener([&](const std::string& path) { return plug.open(path); },
                             std::chrono::milliseconds(20));
    size_t slot = router.add_source(plug.open("/dev/input/kbd"), SourceKind::Keyboard);

    for (int round = 0; round < 3; ++round) {
      plug.current()->disconnect();
      router.run_once(100);
      requireTrue(waitFor([&] { return router.sources().connected(slot); }, 2000), "source reattached");
      requireTrue(!router.supervisor().pending(slot), "connected slot is not pending");
      requireTrue(router.supervisor().worker_count() == 1, "only the latest worker is kept");
    }
    std::lock_guard<std::mutex> guard(plug.lock);
    requireTrue(plug.opens == 4, "one reopen per unplug");
    std::printf("  Test 4 (worker cleanup) PASS\n");
  }

  std::printf("reconnect_test: ALL PASS\n");
  return 0;
}
