/*!
 * @file
 * @brief Finger extension, thumb direction and pinch normalisation tests.
 */

#include "gestify/FingerState.hpp"
#include "gestify/GestureFSM.hpp"

#include "catch2/catch.hpp"
#include "hand_fixtures.hpp"

using namespace gestify;

namespace {

ShapeDescriptor shapeOf(const HandSnapshot& hand) {
    PipelineConfig config;
    return extractShape(hand, config.shape, config.pinch.referenceHandSize);
}

} // namespace

TEST_CASE("FingerState: finger patterns")
{
	SECTION("pointing")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::POINT, 640, 500));
		CHECK(shape.matches(false, true, false, false, false));
		CHECK(shape.extendedCount() == 1);
	}
	SECTION("peace")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::PEACE, 640, 500));
		CHECK(shape.matches(false, true, true, false, false));
	}
	SECTION("fist")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::FIST, 640, 500));
		CHECK(shape.extendedCount() == 0);
		CHECK(shape.longFingersFlexed());
	}
	SECTION("open palm")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::PALM, 640, 500));
		CHECK(shape.extendedCount() == 5);
		CHECK(shape.isExtended(Finger::Thumb));
		CHECK(shape.isExtended(Finger::Pinky));
	}
}

TEST_CASE("FingerState: extension does not depend on hand rotation or scale")
{
	for (float rotation : {-90.0f, -30.0f, 45.0f, 90.0f}) {
		for (float scale : {0.5f, 1.0f, 2.5f}) {
			auto shape = shapeOf(fixtures::makeHand(fixtures::PEACE, 600, 400, rotation, scale));
			INFO("rotation " << rotation << " scale " << scale);
			CHECK(shape.matches(false, true, true, false, false));
		}
	}
}

TEST_CASE("FingerState: thumb direction")
{
	SECTION("thumb up when the hand is turned sideways")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::THUMB, 640, 400, 90.0f));
		CHECK(shape.matches(true, false, false, false, false));
		CHECK(shape.thumbDirection == ThumbDirection::Up);
		CHECK(GestureFSM::classifyShape(shape) == GestureState::ThumbUp);
	}
	SECTION("thumb down")
	{
		auto shape = shapeOf(fixtures::makeHand(fixtures::THUMB, 640, 400, -90.0f));
		CHECK(shape.matches(true, false, false, false, false));
		CHECK(shape.thumbDirection == ThumbDirection::Down);
		CHECK(GestureFSM::classifyShape(shape) == GestureState::ThumbDown);
	}
}

TEST_CASE("FingerState: pinch distance is scale invariant")
{
	auto near = shapeOf(fixtures::makePinchHand(640, 500, 2.0f));
	auto far = shapeOf(fixtures::makePinchHand(640, 500, 0.5f));

	CHECK(near.pinchDistance == Approx(far.pinchDistance).epsilon(0.01));
	// 8.25 px at a 65.2 px hand, expressed at the 200 px reference
	CHECK(near.pinchDistance == Approx(25.3f).margin(0.5f));
	CHECK(near.pinchDistance < PipelineConfig{}.pinch.grabThreshold);

	auto open = shapeOf(fixtures::makeHand(fixtures::POINT, 640, 500));
	CHECK(open.pinchDistance > PipelineConfig{}.pinch.releaseThreshold);
}

TEST_CASE("FingerState: palm angle and reference length")
{
	auto upright = fixtures::makeHand(fixtures::PALM, 640, 500);
	CHECK(handReferenceLength(upright) == Approx(fixtures::HAND_SIZE).margin(0.01f));

	auto shape = shapeOf(upright);
	CHECK(shape.handSize == Approx(fixtures::HAND_SIZE).margin(0.01f));
	CHECK(shape.palmAngleDeg == Approx(-4.4f).margin(0.1f));
	CHECK(shape.orientation.y < -0.9f);

	auto turned = shapeOf(fixtures::makeHand(fixtures::PALM, 640, 500, 90.0f));
	CHECK(turned.palmAngleDeg == Approx(85.6f).margin(0.1f));
	CHECK(turned.orientation.x > 0.9f);
}
