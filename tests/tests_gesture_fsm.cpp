/*!
 * @file
 * @brief Gesture state machine tests: pinch hysteresis, precedence, drag sessions.
 */

#include "gestify/GestureFSM.hpp"

#include "catch2/catch.hpp"
#include "hand_fixtures.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace gestify;
using fixtures::makeShape;

namespace {

std::vector<GestureKind> kindsOf(const std::vector<GestureEvent>& events) {
    std::vector<GestureKind> kinds;
    for (const auto& e : events) {
        kinds.push_back(e.kind);
    }
    return kinds;
}

HandMotion still(float x = 0.5f, float y = 0.5f) {
    HandMotion motion;
    motion.pointer = {x, y};
    return motion;
}

} // namespace

TEST_CASE("GestureFSM: pinch scenario 120, 55, 50, 52, 95")
{
    PipelineConfig config;
    GestureFSM fsm(config);

    const float trajectory[] = {120.0f, 55.0f, 50.0f, 52.0f, 95.0f};
    std::vector<std::vector<GestureEvent>> perFrame;
    std::vector<GestureState> states;

    for (float pinch : trajectory) {
        std::vector<GestureEvent> out;
        states.push_back(fsm.update(makeShape(fixtures::L_SHAPE, pinch), still(), out));
        perFrame.push_back(out);
    }

    CHECK(perFrame[0].empty());
    REQUIRE(perFrame[1].size() == 1);
    CHECK(perFrame[1][0].kind == GestureKind::Click);
    CHECK(perFrame[2].empty());
    CHECK(perFrame[3].empty());
    CHECK(perFrame[4].empty());

    CHECK(states[0] == GestureState::IdleOpen);
    CHECK(states[1] == GestureState::PinchHeld);
    CHECK(states[2] == GestureState::PinchHeld);
    CHECK(states[3] == GestureState::PinchHeld);
    CHECK(states[4] == GestureState::IdleOpen);
}

TEST_CASE("GestureFSM: pinch hysteresis")
{
    PipelineConfig config;
    GestureFSM fsm(config);
    std::vector<GestureEvent> out;

    SECTION("jitter inside the gap never releases")
    {
        fsm.update(makeShape(fixtures::L_SHAPE, 40.0f), still(), out);
        REQUIRE(fsm.isPinched());
        out.clear();

        for (int i = 0; i < 50; ++i) {
            float pinch = (i % 2 == 0) ? 61.0f : 89.0f;
            fsm.update(makeShape(fixtures::L_SHAPE, pinch), still(), out);
            REQUIRE(fsm.isPinched());
        }
        CHECK(out.empty());
    }

    SECTION("never enters without crossing the grab threshold")
    {
        for (float pinch : {85.0f, 70.0f, 61.0f, 60.0f, 75.0f}) {
            fsm.update(makeShape(fixtures::L_SHAPE, pinch), still(), out);
            CHECK_FALSE(fsm.isPinched());
        }
        CHECK(out.empty());
    }

    SECTION("release exactly at the threshold still holds")
    {
        fsm.update(makeShape(fixtures::L_SHAPE, 40.0f), still(), out);
        fsm.update(makeShape(fixtures::L_SHAPE, 90.0f), still(), out);
        CHECK(fsm.isPinched());
        fsm.update(makeShape(fixtures::L_SHAPE, 90.5f), still(), out);
        CHECK_FALSE(fsm.isPinched());
    }
}

TEST_CASE("GestureFSM: double click")
{
    PipelineConfig config;
    config.pinch.doubleClickFrames = 10;
    GestureFSM fsm(config);

    auto pinchCycle = [&](int openFrames) {
        std::vector<GestureEvent> out;
        fsm.update(makeShape(fixtures::L_SHAPE, 40.0f), still(), out);
        fsm.update(makeShape(fixtures::L_SHAPE, 120.0f), still(), out);
        for (int i = 0; i < openFrames; ++i) {
            fsm.update(makeShape(fixtures::L_SHAPE, 120.0f), still(), out);
        }
        return kindsOf(out);
    };

    SECTION("second pinch inside the window")
    {
        CHECK(pinchCycle(2) == std::vector<GestureKind>{GestureKind::Click});
        CHECK(pinchCycle(2) == std::vector<GestureKind>{GestureKind::DoubleClick});
        // Window consumed by the double click
        CHECK(pinchCycle(2) == std::vector<GestureKind>{GestureKind::Click});
    }

    SECTION("window expires")
    {
        CHECK(pinchCycle(12) == std::vector<GestureKind>{GestureKind::Click});
        CHECK(pinchCycle(2) == std::vector<GestureKind>{GestureKind::Click});
    }

    SECTION("frames without the hand still age the window")
    {
        CHECK(pinchCycle(0) == std::vector<GestureKind>{GestureKind::Click});
        for (int i = 0; i < 10; ++i) {
            fsm.handleHandLost();
        }
        CHECK(pinchCycle(0) == std::vector<GestureKind>{GestureKind::Click});
    }
}

TEST_CASE("GestureFSM: precedence")
{
    PipelineConfig config;
    GestureFSM fsm(config);
    std::vector<GestureEvent> out;

    SECTION("a held pinch ignores the finger reading")
    {
        fsm.update(makeShape(fixtures::L_SHAPE, 40.0f), still(), out);
        fsm.update(makeShape(fixtures::FIST, 70.0f), still(), out);
        fsm.update(makeShape(fixtures::PALM, 80.0f), still(), out);
        CHECK(fsm.getState() == GestureState::PinchHeld);
        CHECK(kindsOf(out) == std::vector<GestureKind>{GestureKind::Click});
    }

    SECTION("a fist with the thumb on the index is not a pinch")
    {
        fsm.update(makeShape(fixtures::FIST, 30.0f), still(), out);
        CHECK(fsm.getState() == GestureState::FistDrag);
    }

    SECTION("pinch wins over the pointing pattern")
    {
        fsm.update(makeShape(fixtures::POINT, 30.0f), still(), out);
        CHECK(fsm.getState() == GestureState::PinchHeld);
    }

    SECTION("unknown pattern is a silent idle")
    {
        fsm.update(makeShape({false, false, true, true, false}, 150.0f), still(), out);
        CHECK(fsm.getState() == GestureState::IdleOpen);
        CHECK(out.empty());
    }
}

TEST_CASE("GestureFSM: continuous and one-shot states")
{
    PipelineConfig config;
    GestureFSM fsm(config);
    std::vector<GestureEvent> out;

    SECTION("pointing moves the cursor every frame, entry frame included")
    {
        fsm.update(makeShape(fixtures::POINT, 150.0f), still(0.2f, 0.3f), out);
        fsm.update(makeShape(fixtures::POINT, 150.0f), still(0.25f, 0.3f), out);
        REQUIRE(kindsOf(out) == std::vector<GestureKind>{GestureKind::CursorMove, GestureKind::CursorMove});
        CHECK(out[0].x == Approx(0.2f));
        CHECK(out[1].x == Approx(0.25f));
    }

    SECTION("open palm toggles pause once per entry")
    {
        for (int i = 0; i < 5; ++i) {
            fsm.update(makeShape(fixtures::PALM, 150.0f), still(), out);
        }
        CHECK(kindsOf(out) == std::vector<GestureKind>{GestureKind::PauseToggle});
    }

    SECTION("thumbs up and down")
    {
        fsm.update(makeShape(fixtures::THUMB, 150.0f, ThumbDirection::Up), still(), out);
        fsm.update(makeShape(fixtures::THUMB, 150.0f, ThumbDirection::Up), still(), out);
        fsm.update(makeShape(fixtures::THUMB, 150.0f, ThumbDirection::Down), still(), out);
        CHECK(kindsOf(out) == std::vector<GestureKind>{GestureKind::Confirm, GestureKind::Cancel});
    }

    SECTION("sideways thumb is no gesture")
    {
        fsm.update(makeShape(fixtures::THUMB, 150.0f, ThumbDirection::Sideways), still(), out);
        CHECK(fsm.getState() == GestureState::IdleOpen);
        CHECK(out.empty());
    }

    SECTION("fist scrolls with vertical velocity above the deadband")
    {
        HandMotion slow = still();
        slow.velocity = {0.0f, -100.0f};
        fsm.update(makeShape(fixtures::FIST, 150.0f), slow, out);
        CHECK(out.empty());

        HandMotion up = still();
        up.velocity = {0.0f, -400.0f};
        fsm.update(makeShape(fixtures::FIST, 150.0f), up, out);
        REQUIRE(out.size() == 1);
        CHECK(out[0].kind == GestureKind::Scroll);
        CHECK(out[0].value == Approx(400.0f * config.output.scrollGain));

        HandMotion down = still();
        down.velocity = {0.0f, 400.0f};
        fsm.update(makeShape(fixtures::FIST, 150.0f), down, out);
        REQUIRE(out.size() == 2);
        CHECK(out[1].value < 0.0f);
    }
}

TEST_CASE("GestureFSM: drag sessions")
{
    PipelineConfig config;
    config.shape.ambiguousHoldFrames = 3;
    GestureFSM fsm(config);
    std::vector<GestureEvent> out;

    fsm.update(makeShape(fixtures::PEACE, 150.0f), still(0.1f, 0.1f), out);
    fsm.update(makeShape(fixtures::PEACE, 150.0f), still(0.2f, 0.1f), out);
    REQUIRE(kindsOf(out) == std::vector<GestureKind>{GestureKind::DragStart, GestureKind::DragMove});
    CHECK(out[0].x == Approx(0.1f));
    CHECK(out[1].x == Approx(0.2f));
    CHECK(fsm.isDragActive());
    out.clear();

    SECTION("exit emits drag end before the next state's entry event")
    {
        fsm.update(makeShape(fixtures::PALM, 150.0f), still(), out);
        CHECK(kindsOf(out) == std::vector<GestureKind>{GestureKind::DragEnd, GestureKind::PauseToggle});
    }

    SECTION("short misreads keep the drag alive")
    {
        for (int i = 0; i < 3; ++i) {
            fsm.update(makeShape(fixtures::L_SHAPE, 150.0f), still(), out);
            CHECK(fsm.isDragActive());
        }
        fsm.update(makeShape(fixtures::PEACE, 150.0f), still(), out);
        CHECK(fsm.isDragActive());
        for (const auto& e : out) {
            CHECK(e.kind == GestureKind::DragMove);
        }
    }

    SECTION("longer misreads end the drag exactly once")
    {
        for (int i = 0; i < 6; ++i) {
            fsm.update(makeShape(fixtures::L_SHAPE, 150.0f), still(), out);
        }
        CHECK_FALSE(fsm.isDragActive());
        auto kinds = kindsOf(out);
        CHECK(std::count(kinds.begin(), kinds.end(), GestureKind::DragEnd) == 1);
    }

    SECTION("terminate closes the drag")
    {
        fsm.terminate(out);
        CHECK(kindsOf(out) == std::vector<GestureKind>{GestureKind::DragEnd});
        CHECK(fsm.getState() == GestureState::IdleOpen);

        out.clear();
        fsm.terminate(out);
        CHECK(out.empty());
    }

    SECTION("hand lost keeps the state")
    {
        fsm.handleHandLost();
        CHECK(fsm.isDragActive());
    }
}

TEST_CASE("GestureFSM: transition callback")
{
    PipelineConfig config;
    GestureFSM fsm(config);
    std::vector<std::pair<GestureState, GestureState>> seen;
    fsm.setTransitionCallback([&](GestureState from, GestureState to) { seen.emplace_back(from, to); });

    std::vector<GestureEvent> out;
    fsm.update(makeShape(fixtures::POINT, 150.0f), still(), out);
    fsm.update(makeShape(fixtures::POINT, 150.0f), still(), out);
    fsm.update(makeShape(fixtures::FIST, 150.0f), still(), out);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0].first == GestureState::IdleOpen);
    CHECK(seen[0].second == GestureState::Pointing);
    CHECK(seen[1].second == GestureState::FistDrag);
    CHECK(std::string(GestureFSM::getStateName(seen[1].second)) == "FIST_DRAG");
}
