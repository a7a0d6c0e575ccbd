// D4.3 - Two-hand arbitration, timeouts and selection transfer

#include "gt/interaction/InteractionEngine.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static gt::HandObservation hand(gt::HandLabel label, gt::Gesture g, float x, float y) {
  gt::HandObservation h;
  h.label = label;
  h.gesture = g;
  h.confidence = 0.9f;
  h.center = {x, y};
  return h;
}

static gt::TickResult step(gt::InteractionEngine& engine,
                           std::vector<gt::HandObservation> hands) {
  gt::TickInput in;
  in.timestampMs = static_cast<std::int64_t>(engine.tick() + 1) * 33;
  in.hands = std::move(hands);
  return engine.advance(in);
}

static int countEvents(const gt::TickResult& r, gt::EventType t, gt::HandLabel h) {
  int n = 0;
  for (const auto& e : r.events) {
    if (e.type == t && e.hand == h) ++n;
  }
  return n;
}

static void populate(gt::InteractionEngine& engine) {
  engine.addDemoObjects(gt::DemoSet::Shapes2d);
  engine.store().add(gt::ObjectKind::Torus, {600.0f, 440.0f});
}

int main() {
  using gt::Gesture;
  using gt::HandLabel;
  using gt::HandMode;
  using gt::EventType;
  const auto L = HandLabel::Left;
  const auto R = HandLabel::Right;

  // ---- Test 1: simultaneous grab, Left wins ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    requireTrue(engine.hand(L).hovered == 7 && engine.hand(R).hovered == 7, "both hover 7");

    // Right listed first; processing order is still Left then Right.
    auto r = step(engine, {hand(R, Gesture::ClosedFist, 605, 445), hand(L, Gesture::ClosedFist, 600, 440)});
    requireTrue(engine.hand(L).mode == HandMode::Dragging, "left drags");
    requireTrue(engine.hand(R).mode == HandMode::Hover, "right stays hovering");
    requireTrue(countEvents(r, EventType::LockDenied, R) == 1, "right denied once");
    requireTrue(engine.stats().lockDenials == 1, "denial counted");

    r = step(engine, {hand(L, Gesture::ClosedFist, 600, 440), hand(R, Gesture::ClosedFist, 605, 445)});
    requireTrue(countEvents(r, EventType::LockDenied, R) == 0, "held fist is not re-reported");
    requireTrue(engine.hand(R).mode == HandMode::Hover, "still hovering");
    std::printf("  Test 1 (simultaneous grab): PASS\n");
  }

  // ---- Test 2: dragging hand times out ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    step(engine, {hand(L, Gesture::ClosedFist, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    requireTrue(engine.hand(L).mode == HandMode::Dragging, "left drags");

    // Left vanishes. Three missed ticks are tolerated.
    HandLabel owner;
    for (int i = 0; i < 3; ++i) {
      auto r = step(engine, {hand(R, Gesture::OpenPalm, 605, 445)});
      requireTrue(engine.hand(L).mode == HandMode::Dragging, "within timeout");
      requireTrue(engine.store().lockOwner(7, owner) && owner == L, "lock held");
      requireTrue(r.events.empty(), "quiet");
    }

    auto r = step(engine, {hand(R, Gesture::OpenPalm, 605, 445)});
    requireTrue(countEvents(r, EventType::HandTimeout, L) == 1, "hand_timeout");
    requireTrue(engine.hand(L).mode == HandMode::Idle, "left reset");
    requireTrue(!engine.hand(L).present, "left absent");
    requireTrue(!engine.store().lockOwner(7, owner), "lock released");
    requireTrue(!engine.store().get(7)->selected, "selection released");
    requireTrue(engine.stats().timeouts == 1, "timeout counted");

    step(engine, {hand(R, Gesture::ClosedFist, 605, 445)});
    requireTrue(engine.hand(R).mode == HandMode::Dragging, "right acquires next tick");
    requireTrue(engine.store().lockOwner(7, owner) && owner == R, "right owns lock");
    std::printf("  Test 2 (timeout): PASS\n");
  }

  // ---- Test 3: returning within the window keeps the drag ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440)});
    step(engine, {hand(L, Gesture::ClosedFist, 600, 440)});
    step(engine, {});
    step(engine, {});
    step(engine, {hand(L, Gesture::ClosedFist, 600, 440)});
    requireTrue(engine.hand(L).mode == HandMode::Dragging, "drag survives dropout");
    requireTrue(engine.hand(L).missedTicks == 0, "missed reset");
    step(engine, {});
    step(engine, {});
    step(engine, {});
    requireTrue(engine.hand(L).mode == HandMode::Dragging, "counter restarted");
    std::printf("  Test 3 (dropout): PASS\n");
  }

  // ---- Test 4: selection moves to the hand that takes the lock ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    step(engine, {hand(L, Gesture::ClosedFist, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440), hand(R, Gesture::OpenPalm, 605, 445)});
    requireTrue(engine.hand(L).mode == HandMode::Selected, "left selected");

    auto r = step(engine, {hand(L, Gesture::OpenPalm, 600, 440), hand(R, Gesture::ClosedFist, 605, 445)});
    requireTrue(engine.hand(R).mode == HandMode::Dragging, "right drags");
    requireTrue(engine.hand(L).mode == HandMode::Idle, "left dropped selection");
    requireTrue(engine.hand(L).selected == gt::kNoObject, "left selects nothing");
    requireTrue(countEvents(r, EventType::Deselect, L) == 1, "left deselect event");
    requireTrue(engine.store().get(7)->selectedBy == R, "right selects");
    std::printf("  Test 4 (selection transfer): PASS\n");
  }

  // ---- Test 5: one hand moves from object A to object B ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440)});
    step(engine, {hand(L, Gesture::ClosedFist, 600, 440)});
    step(engine, {hand(L, Gesture::OpenPalm, 600, 440)});
    step(engine, {hand(L, Gesture::OpenPalm, 130, 130)});
    HandLabel owner;
    requireTrue(!engine.store().lockOwner(7, owner), "A released first");
    requireTrue(engine.hand(L).hovered == 1, "hovering B");
    step(engine, {hand(L, Gesture::ClosedFist, 130, 130)});
    requireTrue(engine.store().lockOwner(1, owner) && owner == L, "B locked");
    requireTrue(!engine.store().lockOwner(7, owner), "A still free");
    std::printf("  Test 5 (A then B): PASS\n");
  }

  // ---- Test 6: mutual exclusion sweep ----
  {
    gt::InteractionEngine engine;
    populate(engine);
    std::uint32_t seed = 12345;
    auto next = [&seed]() {
      seed = seed * 1664525u + 1013904223u;
      return seed >> 16;
    };
    const Gesture choices[] = {Gesture::OpenPalm, Gesture::ClosedFist, Gesture::Pointing};

    for (int t = 0; t < 2000; ++t) {
      std::vector<gt::HandObservation> hands;
      for (auto label : {L, R}) {
        if (next() % 10 == 0) continue;
        Gesture g = choices[next() % 3];
        bool onTarget = next() % 4 != 0;
        hands.push_back(onTarget ? hand(label, g, 600, 440) : hand(label, g, 20, 460));
      }
      step(engine, hands);

      int holders = 0;
      for (auto label : {L, R}) {
        const auto& st = engine.hand(label);
        if (!gt::holdsLock(st.mode)) continue;
        ++holders;
        HandLabel owner;
        requireTrue(engine.store().lockOwner(st.selected, owner) && owner == label,
                    "locked mode implies lock ownership");
      }
      requireTrue(holders <= 1, "at most one hand holds object 7");

      const auto& a = engine.hand(L);
      const auto& b = engine.hand(R);
      requireTrue(!(a.selected != gt::kNoObject && a.selected == b.selected),
                  "a single selecting hand per object");
    }
    std::printf("  Test 6 (mutual exclusion sweep): PASS\n");
  }

  std::printf("D4.3 arbitration: ALL PASS\n");
  return 0;
}
