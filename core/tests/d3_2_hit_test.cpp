// D3.2 - Spatial hit tester and detection tracking

#include "gt/scene/DetectionTracker.hpp"
#include "gt/scene/HitTester.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static gt::Cursor at(float x, float y) {
  gt::Cursor c;
  c.surface = {x, y};
  return c;
}

int main() {
  gt::HitConfig noMargin;
  noMargin.hoverMargin = 0.0f;

  // ---- Test 1: containment ----
  {
    gt::ObjectStore store;
    auto id = store.add(gt::ObjectKind::Square, {100.0f, 100.0f});
    requireTrue(gt::hitTest(at(100, 100), store.list(), noMargin) == id, "center hits");
    requireTrue(gt::hitTest(at(150, 150), store.list(), noMargin) == id, "edge hits");
    requireTrue(gt::hitTest(at(151, 100), store.list(), noMargin) == gt::kNoObject, "outside misses");
    requireTrue(gt::hitTest(at(0, 0), {}, noMargin) == gt::kNoObject, "no objects");
    std::printf("  Test 1 (containment): PASS\n");
  }

  // ---- Test 2: newest object wins overlaps ----
  {
    gt::ObjectStore store;
    auto a = store.add(gt::ObjectKind::Square, {100.0f, 100.0f});
    auto b = store.add(gt::ObjectKind::Circle, {120.0f, 100.0f});
    auto c = store.add(gt::ObjectKind::Star, {500.0f, 500.0f});
    requireTrue(gt::hitTest(at(110, 100), store.list(), noMargin) == b, "higher id on top");
    requireTrue(gt::hitTest(at(60, 100), store.list(), noMargin) == a, "only a");
    requireTrue(gt::hitTest(at(500, 500), store.list(), noMargin) == c, "only c");
    std::printf("  Test 2 (tie-break): PASS\n");
  }

  // ---- Test 3: hover margin ----
  {
    gt::ObjectStore store;
    auto id = store.add(gt::ObjectKind::Square, {100.0f, 100.0f});
    gt::HitConfig cfg;
    requireTrue(cfg.hoverMargin == 30.0f, "default margin 30");
    requireTrue(gt::hitTest(at(175, 100), store.list(), cfg) == id, "inside margin");
    requireTrue(gt::hitTest(at(181, 100), store.list(), cfg) == gt::kNoObject, "past margin");
    std::printf("  Test 3 (hover margin): PASS\n");
  }

  // ---- Test 4: transform-adjusted region ----
  {
    gt::ObjectStore store;
    auto id = store.add(gt::ObjectKind::Square, {100.0f, 100.0f});
    store.applyOffset(id, {200.0f, 0.0f});
    requireTrue(gt::hitTest(at(100, 100), store.list(), noMargin) == gt::kNoObject, "old spot empty");
    requireTrue(gt::hitTest(at(300, 100), store.list(), noMargin) == id, "moved spot hits");
    store.applyScale(id, 2.0f);
    requireTrue(gt::hitTest(at(390, 100), store.list(), noMargin) == id, "scaled region");

    gt::ObjectStore thin;
    auto t = thin.add(gt::ObjectKind::Square, {0.0f, 0.0f}, {100.0f, 10.0f});
    requireTrue(gt::hitTest(at(0, 40), thin.list(), noMargin) == gt::kNoObject, "unrotated misses");
    thin.applyRotation(t, 90.0f);
    requireTrue(gt::hitTest(at(0, 40), thin.list(), noMargin) == t, "rotated hits");
    std::printf("  Test 4 (transforms): PASS\n");
  }

  // ---- Test 5: 3-D sphere test ----
  {
    gt::ObjectStore store;
    auto id = store.add3d(gt::ObjectKind::Sphere, {0.1f, 0.0f, 0.1f}, {1000.0f, 1000.0f, 10.0f, 10.0f});
    gt::HitConfig cfg;
    cfg.use3d = true;
    cfg.hitRadius3d = 0.05f;

    gt::Cursor c;
    c.has3d = true;
    c.world = {0.12f, 0.0f, 0.1f};
    requireTrue(gt::hitTest(c, store.list(), cfg) == id, "within radius");
    c.world = {0.2f, 0.0f, 0.1f};
    requireTrue(gt::hitTest(c, store.list(), cfg) == gt::kNoObject, "outside radius");

    cfg.use3d = false;
    c.surface = {1005.0f, 1005.0f};
    requireTrue(gt::hitTest(c, store.list(), cfg) == id, "2-D fallback uses footprint");
    std::printf("  Test 5 (3-D): PASS\n");
  }

  // ---- Test 6: detections become objects and follow the detector ----
  {
    gt::ObjectStore store;
    store.add(gt::ObjectKind::Square, {50.0f, 50.0f});
    gt::DetectionTrackerConfig dcfg;
    dcfg.matchDistance = 50.0f;
    dcfg.staleTicks = 2;
    gt::DetectionTracker tracker(dcfg);

    gt::Detection cup;
    cup.classId = 41;
    cup.className = "cup";
    cup.confidence = 0.7f;
    cup.bbox = {200.0f, 200.0f, 40.0f, 40.0f};
    cup.center = cup.bbox.center();

    auto r = tracker.update({cup}, 1, store);
    requireTrue(r.created.size() == 1 && r.refreshed.empty(), "created");
    gt::ObjectId id = r.created[0];
    const auto* o = store.get(id);
    requireTrue(o->kind == gt::ObjectKind::Detected && o->label == "cup", "detected kind");
    requireTrue(o->classId == 41, "class kept");

    cup.bbox = {220.0f, 210.0f, 40.0f, 40.0f};
    cup.center = cup.bbox.center();
    r = tracker.update({cup}, 2, store);
    requireTrue(r.refreshed.size() == 1 && r.refreshed[0] == id, "matched");
    requireTrue(store.get(id)->anchorBox.x == 220.0f, "anchor follows");

    gt::Detection other = cup;
    other.classId = 7;
    r = tracker.update({other}, 3, store);
    requireTrue(r.created.size() == 1, "other class is a new object");

    gt::Detection far = cup;
    far.center = {600.0f, 600.0f};
    r = tracker.update({far}, 4, store);
    requireTrue(r.created.size() == 1, "too far to match");

    store.tryLock(id, gt::HandLabel::Left);
    r = tracker.update({}, 10, store);
    requireTrue(store.get(id) != nullptr, "locked object kept");
    requireTrue(r.removed.size() == 2, "unlocked stale objects removed");
    requireTrue(store.get(1) != nullptr, "manual object untouched");
    store.unlock(id, gt::HandLabel::Left);
    r = tracker.update({}, 11, store);
    requireTrue(r.removed.size() == 1 && store.get(id) == nullptr, "expires once free");
    std::printf("  Test 6 (detection tracking): PASS\n");
  }

  std::printf("D3.2 hit test: ALL PASS\n");
  return 0;
}
