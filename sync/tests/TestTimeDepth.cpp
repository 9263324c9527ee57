/**
 * @file TestTimeDepth.cpp
 * @brief Unit tests for lag compensation offsets.
 */

#include <catch2/catch.hpp>

#include "tks/sync/SyncedEntity.hpp"

#include <cmath>

using Catch::Matchers::WithinAbs;

namespace tks::sync {

namespace {

class FakeObject final : public IGameObject
{
public:
    math::Vec3f worldPosition() const override { return {3.0f, 4.0f, 0.0f}; }

    void setCompensationOffset(const math::Vec3f &position, const math::Quatf &rotation) override
    {
        lastPosition = position;
        lastRotation = rotation;
        ++calls;
    }

    math::Vec3f lastPosition;
    math::Quatf lastRotation;
    int         calls{0};
};

struct Target
{
    std::unique_ptr<SyncedEntity> entity;
    PropertyHandle<math::Vec3f>   position;
    PropertyHandle<math::Quatf>   rotation;
};

constexpr math::Vec3f kUp{0.0f, 0.0f, 1.0f};

Target makeTarget(IGameObject *object)
{
    SyncedEntity::Builder builder{"target"};
    Target t;
    t.position = builder.add<math::Vec3f>("position");
    t.rotation = builder.add<math::Quatf>("rotation");
    t.entity = builder.key(9).gameObject(object).lagCompensated(t.position, t.rotation).build(64);

    for (core::Tick tick = 1; tick <= 20; ++tick)
    {
        const auto f = static_cast<core::f32>(tick);
        t.entity->get(t.position).history().write(tick, math::Vec3f{f, 0.0f, 0.0f});
        t.entity->get(t.rotation).history().write(tick, math::Quatf::fromAxisAngle(kUp, 0.1f * f));
    }
    return t;
}

} // namespace

TEST_CASE("Compensation moves the hit volume back along the path", "[sync][timedepth]")
{
    FakeObject object;
    auto t = makeTarget(&object);
    TimeDepthCompensator *compensator = t.entity->compensator();
    REQUIRE(compensator != nullptr);

    compensator->apply(*t.entity, 20, 5.0);

    REQUIRE(object.calls == 1);
    CHECK_THAT(object.lastPosition.x, WithinAbs(-5.0, 1e-5));
    CHECK_THAT(object.lastPosition.y, WithinAbs(0.0, 1e-5));
    CHECK(compensator->depth() == 5.0);

    const auto expected = math::Quatf::fromAxisAngle(kUp, -0.5f);
    const auto &rotation = object.lastRotation;
    CHECK_THAT(std::abs(rotation.dot(expected)), WithinAbs(1.0, 1e-4));

    SECTION("fractional depth reads between ticks")
    {
        const auto offset = compensator->compute(*t.entity, 20, 2.5);
        CHECK_THAT(offset.position.x, WithinAbs(-2.5, 1e-5));
    }
    SECTION("zero depth resets the offset")
    {
        compensator->apply(*t.entity, 20, 0.0);
        REQUIRE(object.calls == 2);
        CHECK(compensator->offset() == CompensationOffset{});
    }
}

TEST_CASE("Authoritative history is left untouched", "[sync][timedepth]")
{
    auto t = makeTarget(nullptr);
    t.entity->compensator()->apply(*t.entity, 20, 8.0);

    CHECK_THAT(t.entity->compensator()->offset().position.x, WithinAbs(-8.0, 1e-5));
    CHECK(t.entity->get(t.position).history().at(20) == math::Vec3f{20.0f, 0.0f, 0.0f});
}

TEST_CASE("Entity position prefers the game object", "[sync][timedepth]")
{
    FakeObject object;
    auto withObject = makeTarget(&object);
    auto bare = makeTarget(nullptr);

    REQUIRE(withObject.entity->position(10) == math::Vec3f{3.0f, 4.0f, 0.0f});
    REQUIRE(bare.entity->position(10) == math::Vec3f{10.0f, 0.0f, 0.0f});

    SyncedEntity::Builder builder{"prop"};
    (void)builder.add<core::f32>("mass");
    REQUIRE_FALSE(builder.build(8)->position(10).has_value());
}

TEST_CASE("Only the closest observer receives the time depth", "[sync][timedepth]")
{
    auto t = makeTarget(nullptr);
    t.entity->setTimeDepth(TimeDepth{.ticks = 6.0, .closest = 3});

    CHECK(t.entity->timeDepthFor(3) == 6.0);
    CHECK(t.entity->timeDepthFor(2) == 0.0);
    CHECK(t.entity->timeDepthFor(4) == 0.0);
}

} // namespace tks::sync
