// VirtualInputGroup: held-key bookkeeping, motion batching, scrolling.

#include "fakes.hpp"

#include "kmswitch/virtual_device.hpp"

#include <cstdio>

using namespace kmswitch;

struct Group {
  WriteLog kbd = std::make_shared<std::vector<Write>>();
  WriteLog mouse = std::make_shared<std::vector<Write>>();
  VirtualInputGroup group{std::make_unique<FakeDevice>("t-virt-kbd", kbd),
                          std::make_unique<FakeDevice>("t-virt-mouse", mouse)};
};

int main() {
  // --- Test 1: queued motion is flushed once with the sum per axis ---
  {
    Group g;
    g.group.queue_motion(REL_X, 3);
    g.group.queue_motion(REL_X, -1);
    g.group.queue_motion(REL_Y, 5);
    g.group.queue_motion(REL_X, 4);
    requireTrue(g.mouse->empty(), "queue_motion writes nothing");
    requireTrue(g.group.pending_x() == 6 && g.group.pending_y() == 5, "pending sums");

    requireTrue(g.group.commit_motion(), "commit reports a write");
    requireTrue(g.mouse->size() == 3, "one REL_X, one REL_Y, one SYN");
    requireTrue((*g.mouse)[0].type == EV_REL && (*g.mouse)[0].code == REL_X && (*g.mouse)[0].value == 6,
                "REL_X carries the sum");
    requireTrue((*g.mouse)[1].type == EV_REL && (*g.mouse)[1].code == REL_Y && (*g.mouse)[1].value == 5,
                "REL_Y carries the sum");
    requireTrue(countSyn(g.mouse) == 1, "single SYN_REPORT");
    requireTrue(g.group.pending_x() == 0 && g.group.pending_y() == 0, "accumulators reset");
    requireTrue(g.kbd->empty(), "keyboard untouched");

    std::printf("  Test 1 (motion coalescing) PASS\n");
  }

  // --- Test 2: a second commit with nothing queued writes nothing ---
  {
    Group g;
    g.group.queue_motion(REL_Y, -2);
    g.group.commit_motion();
    size_t before = g.mouse->size();
    requireTrue(!g.group.commit_motion(), "idle commit reports nothing");
    requireTrue(g.mouse->size() == before, "idle commit writes nothing");

    // movement that cancels out is not flushed either
    g.group.queue_motion(REL_X, 7);
    g.group.queue_motion(REL_X, -7);
    requireTrue(!g.group.commit_motion(), "net zero motion is not flushed");
    requireTrue(g.mouse->size() == before, "net zero motion writes nothing");

    // non-motion axes are not queued
    g.group.queue_motion(REL_WHEEL, 1);
    requireTrue(!g.group.commit_motion(), "wheel is never queued");

    std::printf("  Test 2 (idempotent commit) PASS\n");
  }

  // --- Test 3: held keys follow the writes exactly ---
  {
    Group g;
    g.group.write_key(KEY_A, VALUE_DOWN);
    g.group.write_key(KEY_B, VALUE_DOWN);
    requireTrue(g.group.holds(KEY_A) && g.group.holds(KEY_B), "both held");
    g.group.write_key(KEY_A, VALUE_REPEAT);
    requireTrue(g.group.holds(KEY_A), "repeat keeps key held");
    g.group.write_key(KEY_A, VALUE_UP);
    requireTrue(!g.group.holds(KEY_A) && g.group.holds(KEY_B), "A released, B still held");

    // redundant up is written and tolerated
    g.group.write_key(KEY_A, VALUE_UP);
    requireTrue(!g.group.holds(KEY_A), "redundant up keeps A released");
    requireTrue(g.group.held_keys().size() == 1, "only B held");

    requireTrue(countKey(g.kbd, KEY_A, VALUE_UP) == 2, "both ups written");
    requireTrue(countSyn(g.kbd) == 5, "every key write is followed by SYN");
    requireTrue(g.mouse->empty(), "mouse untouched by keys");

    std::printf("  Test 3 (held keys) PASS\n");
  }

  // --- Test 4: press_and_release leaves nothing held ---
  {
    Group g;
    g.group.press_and_release_key(KEY_KP1);
    requireTrue(g.kbd->size() == 4, "down, syn, up, syn");
    requireTrue((*g.kbd)[0].code == KEY_KP1 && (*g.kbd)[0].value == VALUE_DOWN, "down first");
    requireTrue((*g.kbd)[1].type == EV_SYN, "syn after down");
    requireTrue((*g.kbd)[2].code == KEY_KP1 && (*g.kbd)[2].value == VALUE_UP, "then up");
    requireTrue((*g.kbd)[3].type == EV_SYN, "syn after up");
    requireTrue(g.group.held_keys().empty(), "nothing held");

    std::printf("  Test 4 (press and release) PASS\n");
  }

  // --- Test 5: scroll steps are never summed ---
  {
    Group g;
    g.group.scroll(REL_WHEEL, 1);
    g.group.scroll(REL_WHEEL, 1);
    g.group.scroll(REL_HWHEEL, -1);
    requireTrue(countType(g.mouse, EV_REL) == 3, "three scroll events");
    requireTrue(countSyn(g.mouse) == 3, "each scroll synced on its own");
    requireTrue((*g.mouse)[0].value == 1 && (*g.mouse)[2].value == 1, "wheel values kept");
    requireTrue((*g.mouse)[4].code == REL_HWHEEL && (*g.mouse)[4].value == -1, "hwheel kept");

    std::printf("  Test 5 (uncoalesced scroll) PASS\n");
  }

  // --- Test 6: buttons go to the mouse and are released with the keys ---
  {
    Group g;
    g.group.write_mouse_button(BTN_LEFT, VALUE_DOWN);
    g.group.write_key(KEY_LEFTSHIFT, VALUE_DOWN);
    requireTrue(countKey(g.mouse, BTN_LEFT, VALUE_DOWN) == 1, "button on mouse");
    requireTrue(countKey(g.kbd, BTN_LEFT, VALUE_DOWN) == 0, "button not on keyboard");
    requireTrue(g.group.holds(BTN_LEFT), "button held");

    g.group.release_all();
    requireTrue(g.group.held_keys().empty(), "release_all clears held keys");
    requireTrue(countKey(g.mouse, BTN_LEFT, VALUE_UP) == 1, "button released on mouse");
    requireTrue(countKey(g.kbd, KEY_LEFTSHIFT, VALUE_UP) == 1, "shift released on keyboard");

    std::printf("  Test 6 (buttons) PASS\n");
  }

  // --- Test 7: a failing device surfaces SinkWriteFailed ---
  {
    WriteLog kbd = std::make_shared<std::vector<Write>>();
    WriteLog mouse = std::make_shared<std::vector<Write>>();
    auto kbd_dev = std::make_unique<FakeDevice>("t-virt-kbd", kbd);
    FakeDevice* dev = kbd_dev.get();
    VirtualInputGroup group(std::move(kbd_dev), std::make_unique<FakeDevice>("t-virt-mouse", mouse));
    dev->fail = true;
    bool thrown = false;
    try {
      group.write_key(KEY_A, VALUE_DOWN);
    } catch (const SinkWriteFailed& e) {
      thrown = e.code().value() == EIO;
    }
    requireTrue(thrown, "SinkWriteFailed with errno");
    requireTrue(!group.holds(KEY_A), "failed write is not tracked");

    std::printf("  Test 7 (write failure) PASS\n");
  }

  // --- Test 8: event values are evdev's 0/1/2, arrow keys keep their codes ---
  {
    Group g;
    g.group.write_key(KEY_UP, VALUE_DOWN);
    g.group.write_key(KEY_DOWN, VALUE_REPEAT);
    requireTrue(g.kbd->at(0).code == 103 && g.kbd->at(0).value == 1, "arrow up pressed with value 1");
    requireTrue(g.kbd->at(2).code == 108 && g.kbd->at(2).value == 2, "arrow down repeated with value 2");
    requireTrue(g.group.holds(KEY_UP) && g.group.holds(KEY_DOWN), "both arrows held");
    g.group.write_key(KEY_UP, VALUE_UP);
    requireTrue(g.kbd->at(4).value == 0 && !g.group.holds(KEY_UP), "release written as 0");
    std::printf("  Test 8 (event values) PASS\n");
  }

  std::printf("virtual_group_test: ALL PASS\n");
  return 0;
}
