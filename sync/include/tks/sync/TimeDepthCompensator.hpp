/**
 * @file TimeDepthCompensator.hpp
 * @brief Lag-compensation offset of a hit-testable entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_TIME_DEPTH_COMPENSATOR_HPP
    #define TKS_SYNC_TIME_DEPTH_COMPENSATOR_HPP

#include <tks/sync/PropertyOptions.hpp>
#include <tks/math/Quat.hpp>
#include <tks/math/Vec3.hpp>
#include <tks/core/Types.hpp>

namespace tks::sync {

class SyncedEntity;

struct CompensationOffset
{
    math::Vec3f position;
    math::Quatf rotation;

    [[nodiscard]] bool operator==(const CompensationOffset &) const = default;
};

/**
 * @class TimeDepthCompensator
 * @brief Moves the hit-test children of an entity back in time.
 *
 * Once per step the entity's position and rotation histories are read
 * at the current tick and @c depth ticks earlier; the difference is
 * handed to IGameObject::setCompensationOffset().  The authoritative
 * history is never modified.
 */
class TimeDepthCompensator final
{
public:
    TimeDepthCompensator(PropertyHandle<math::Vec3f> position, PropertyHandle<math::Quatf> rotation);

    /** @brief Offset from the state at @p currentTick to the state @p depth ticks earlier. */
    [[nodiscard]] CompensationOffset compute(const SyncedEntity &entity, core::Tick currentTick, core::f64 depth) const;

    /** @brief compute() and forward the result to the entity's game object, if any. */
    void apply(SyncedEntity &entity, core::Tick currentTick, core::f64 depth);

    [[nodiscard]] const CompensationOffset &offset() const noexcept { return _offset; }
    [[nodiscard]] core::f64                 depth()  const noexcept { return _depth; }

    [[nodiscard]] PropertyHandle<math::Vec3f> positionHandle() const noexcept { return _position; }
    [[nodiscard]] PropertyHandle<math::Quatf> rotationHandle() const noexcept { return _rotation; }

private:
    PropertyHandle<math::Vec3f> _position;
    PropertyHandle<math::Quatf> _rotation;
    CompensationOffset          _offset;
    core::f64                   _depth{0.0};
};

} // namespace tks::sync

#endif // TKS_SYNC_TIME_DEPTH_COMPENSATOR_HPP
