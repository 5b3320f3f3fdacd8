#include <core/GestureClassifier.h>

#include <vector>

#include "catch2/catch.hpp"
#include "hand_fixtures.hpp"

namespace
{
    constexpr double kFrame = 1.0 / 30.0;

    struct Tick
    {
        double now;
        GestureResult result;
    };
}

TEST_CASE("Stationary open hand stays idle")
{
    GestureClassifier classifier;

    for (int i = 0; i < 120; ++i)
    {
        const GestureResult r = classifier.update(makeHand(0.8), i * kFrame);
        REQUIRE(r.gesture == Gesture::Idle);
        REQUIRE_FALSE(r.orbit.has_value());
    }
    CHECK(classifier.lastOpenness() == Approx(0.8));
    REQUIRE(classifier.lastSpeed().has_value());
    CHECK(*classifier.lastSpeed() == Approx(0.0).margin(1e-9));
}

TEST_CASE("Moving open hand orbits after the confidence frames")
{
    GestureClassifier classifier;
    double x = 0.3;

    // seeds the smoother, no previous position yet
    GestureResult r = classifier.update(makeHand(0.8, x, 0.5), 0.0);
    CHECK(r.gesture == Gesture::Idle);

    x += 0.05;
    r = classifier.update(makeHand(0.8, x, 0.5), kFrame);
    CHECK(r.gesture == Gesture::Idle);
    CHECK_FALSE(r.orbit.has_value());
    CHECK(classifier.hysteresis().candidate == Gesture::Orbit);

    x += 0.05;
    r = classifier.update(makeHand(0.8, x, 0.5), 2 * kFrame);
    CHECK(r.gesture == Gesture::Idle);
    CHECK_FALSE(r.orbit.has_value());

    x += 0.05;
    r = classifier.update(makeHand(0.8, x, 0.5), 3 * kFrame);
    CHECK(r.gesture == Gesture::Orbit);
    REQUIRE(r.orbit.has_value());
    CHECK(r.orbit->dx > ORBIT_DEAD_ZONE);
    CHECK(r.orbit->dy == Approx(0.0).margin(1e-12));

    SECTION("payload is this tick's smoothed displacement")
    {
        const double s1 = 0.3 + 0.45 * 0.05;
        const double s2 = 0.45 * 0.4 + 0.55 * s1;
        const double s3 = 0.45 * 0.45 + 0.55 * s2;
        CHECK(r.orbit->dx == Approx(s3 - s2));
    }

    SECTION("a closed hand does not orbit")
    {
        GestureClassifier fist;
        double fx = 0.3;
        for (int i = 0; i < 20; ++i)
        {
            fx += 0.05;
            REQUIRE(fist.update(makeHand(0.4, fx, 0.5), i * kFrame).gesture == Gesture::Idle);
        }
    }
}

TEST_CASE("Small motion inside the dead zone is ignored")
{
    GestureClassifier classifier;
    for (int i = 0; i < 60; ++i)
    {
        // 0.004 per frame, smoothed delta stays under 0.015
        const double x = 0.5 + ((i % 2) ? 0.004 : 0.0);
        REQUIRE(classifier.update(makeHand(0.9, x, 0.5), i * kFrame).gesture == Gesture::Idle);
    }
}

TEST_CASE("Opening the hand quickly zooms in")
{
    GestureClassifier classifier;

    // openness 0.2 -> 0.9 over four ticks within 0.1 s
    const double openness[] = {0.2, 0.2 + 0.7 / 3, 0.2 + 1.4 / 3, 0.9};
    for (int i = 0; i < 4; ++i)
    {
        const GestureResult r = classifier.update(makeHand(openness[i]), i * kFrame);
        CHECK(r.gesture == Gesture::Idle);
    }

    // first tick with four samples in the window: speed ~7/s
    GestureResult r = classifier.update(makeHand(0.9), 4 * kFrame);
    REQUIRE(classifier.lastSpeed().has_value());
    CHECK(*classifier.lastSpeed() == Approx(7.0));
    CHECK(classifier.hysteresis().candidate == Gesture::ZoomIn);
    CHECK(r.gesture == Gesture::Idle);

    r = classifier.update(makeHand(0.9), 5 * kFrame);
    CHECK(r.gesture == Gesture::Idle);

    r = classifier.update(makeHand(0.9), 6 * kFrame);
    CHECK(r.gesture == Gesture::ZoomIn);
    CHECK_FALSE(r.orbit.has_value());

    SECTION("holding the open pose sustains the zoom")
    {
        for (int i = 7; i < 100; ++i)
        {
            r = classifier.update(makeHand(0.9), i * kFrame);
            REQUIRE(r.gesture == Gesture::ZoomIn);
            REQUIRE_FALSE(r.orbit.has_value());
        }
    }
}

TEST_CASE("Closing the hand quickly zooms out and holding a fist sustains it")
{
    GestureClassifier classifier;
    int i = 0;
    for (; i < 4; ++i)
        classifier.update(makeHand(0.9), i * kFrame);

    GestureResult r;
    for (; i < 8; ++i)
        r = classifier.update(makeHand(0.1), i * kFrame);
    CHECK(r.gesture == Gesture::ZoomOut);

    for (; i < 80; ++i)
    {
        r = classifier.update(makeHand(0.1), i * kFrame);
        REQUIRE(r.gesture == Gesture::ZoomOut);
    }
}

TEST_CASE("Orbit is suppressed right after a zoom")
{
    GestureClassifier classifier;
    std::vector<Tick> ticks;

    const auto feed = [&](int step, double openness, double x)
    {
        const double now = step * 0.1;
        ticks.push_back({now, classifier.update(makeHand(openness, x, 0.5), now)});
        return ticks.back().result;
    };

    // closed hand, then opened: speed over the window exceeds 0.8/s
    for (int s = 0; s < 4; ++s)
        feed(s, 0.2, 0.5);
    for (int s = 4; s < 8; ++s)
        feed(s, 0.9, 0.5);
    REQUIRE(ticks.back().result.gesture == Gesture::ZoomIn);

    // speed decays below the threshold, open pose keeps the zoom
    for (int s = 8; s < 11; ++s)
        REQUIRE(feed(s, 0.9, 0.5).gesture == Gesture::ZoomIn);

    // relax to an orbit-capable openness and start moving
    double x = 0.5;
    int firstOrbit = -1;
    for (int s = 11; s < 25; ++s)
    {
        x += 0.05;
        const GestureResult r = feed(s, 0.65, x);
        if (r.gesture == Gesture::Orbit && firstOrbit < 0)
        {
            firstOrbit = s;
            REQUIRE(r.orbit.has_value());
            CHECK(r.orbit->dx > 0.0);
        }
    }

    // zoom confirmed until step 12, released at step 13; the cooldown is
    // anchored at the last zoom-confirmed tick and lasts 0.3 s
    for (const Tick &t : ticks)
    {
        if (t.now < 1.55)
            CHECK(t.result.gesture != Gesture::Orbit);
    }
    REQUIRE(firstOrbit > 0);
    CHECK(firstOrbit * 0.1 >= 1.6 - 1e-9);
    CHECK(firstOrbit * 0.1 <= 2.0 + 1e-9);
}

TEST_CASE("A dropped frame does not cut the post-zoom cooldown short")
{
    GestureClassifier classifier;

    for (int s = 0; s < 4; ++s)
        classifier.update(makeHand(0.2), s * 0.1);
    for (int s = 4; s < 11; ++s)
        classifier.update(makeHand(0.9), s * 0.1);
    REQUIRE(classifier.confirmed() == Gesture::ZoomIn);

    // speed below threshold and the hand relaxed: cooldown starts at 1.1 s
    GestureResult r = classifier.update(makeHand(0.65), 1.1);
    CHECK(r.gesture == Gesture::ZoomIn);

    r = classifier.update(std::nullopt, 1.15);
    CHECK_FALSE(r.orbit.has_value());

    double x = 0.5;
    double firstOrbit = -1.0;
    for (int k = 0; k < 14; ++k)
    {
        const double now = 1.18 + 0.03 * k;
        x += 0.05;
        r = classifier.update(makeHand(0.65, x, 0.5), now);
        if (now < 1.4)
            CHECK(r.gesture != Gesture::Orbit);
        if (r.gesture == Gesture::Orbit && firstOrbit < 0.0)
            firstOrbit = now;
    }

    REQUIRE(firstOrbit > 0.0);
    CHECK(firstOrbit >= 1.4);
    CHECK(firstOrbit < 1.55);
}

TEST_CASE("Loss of tracking")
{
    GestureClassifier classifier;
    double x = 0.2;
    GestureResult r;
    for (int i = 0; i < 6; ++i)
    {
        x += 0.05;
        r = classifier.update(makeHand(0.8, x, 0.5), i * kFrame);
    }
    REQUIRE(r.gesture == Gesture::Orbit);

    SECTION("sustained absence converges to idle")
    {
        CHECK(classifier.update(std::nullopt, 6 * kFrame).gesture == Gesture::Orbit);
        CHECK(classifier.update(std::nullopt, 7 * kFrame).gesture == Gesture::Orbit);
        r = classifier.update(std::nullopt, 8 * kFrame);
        CHECK(r.gesture == Gesture::Idle);
        CHECK_FALSE(r.orbit.has_value());

        for (int i = 9; i < 50; ++i)
            REQUIRE(classifier.update(std::nullopt, i * kFrame).gesture == Gesture::Idle);

        // tracking restarts from scratch: no previous position, no speed
        r = classifier.update(makeHand(0.8, 0.9, 0.5), 50 * kFrame);
        CHECK(r.gesture == Gesture::Idle);
        CHECK_FALSE(classifier.lastSpeed().has_value());
    }

    SECTION("a single dropped frame keeps the orbit")
    {
        r = classifier.update(std::nullopt, 6 * kFrame);
        CHECK(r.gesture == Gesture::Orbit);
        CHECK_FALSE(r.orbit.has_value());

        for (int i = 7; i < 12; ++i)
        {
            x += 0.05;
            r = classifier.update(makeHand(0.8, x, 0.5), i * kFrame);
            REQUIRE(r.gesture == Gesture::Orbit);
        }
        CHECK(r.orbit.has_value());
    }
}

TEST_CASE("Absence from a fresh classifier never fails")
{
    GestureClassifier classifier;
    for (int i = 0; i < 10; ++i)
    {
        const GestureResult r = classifier.update(std::nullopt, 0.0);
        REQUIRE(r.gesture == Gesture::Idle);
        REQUIRE_FALSE(r.orbit.has_value());
    }
}

TEST_CASE("Degenerate input degrades to idle")
{
    GestureClassifier classifier;

    SECTION("every landmark on one point")
    {
        HandSnapshot hand;
        for (auto &lm : hand.landmarks)
            lm = Landmark{0.5, 0.5, 0.0};
        for (int i = 0; i < 10; ++i)
            REQUIRE(classifier.update(hand, i * kFrame).gesture == Gesture::Idle);
        CHECK(classifier.lastOpenness() == 0.0);
    }

    SECTION("identical timestamps")
    {
        for (int i = 0; i < 10; ++i)
        {
            const double openness = (i % 2) ? 0.1 : 0.9;
            REQUIRE(classifier.update(makeHand(openness), 1.0).gesture == Gesture::Idle);
        }
        CHECK_FALSE(classifier.lastSpeed().has_value());
    }
}

TEST_CASE("Classifier honours its configuration")
{
    ClassifierConfig cfg;
    cfg.confidenceFrames = 1;
    cfg.orbitDeadZone = 0.1;
    GestureClassifier classifier(cfg);

    classifier.update(makeHand(0.8, 0.2, 0.5), 0.0);
    // smoothed step 0.45 * 0.1 = 0.045, under the wider dead zone
    CHECK(classifier.update(makeHand(0.8, 0.3, 0.5), kFrame).gesture == Gesture::Idle);
    // smoothed step 0.45 * (0.8 - 0.245) = 0.25
    const GestureResult r = classifier.update(makeHand(0.8, 0.8, 0.5), 2 * kFrame);
    CHECK(r.gesture == Gesture::Orbit);
    REQUIRE(r.orbit.has_value());
}
