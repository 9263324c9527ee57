/**
 * @file TimeDepthCompensator.cpp
 * @brief TimeDepthCompensator implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/TimeDepthCompensator.hpp>
#include <tks/sync/SyncedEntity.hpp>
#include <tks/core/Assert.hpp>

namespace tks::sync {

TimeDepthCompensator::TimeDepthCompensator(PropertyHandle<math::Vec3f> position, PropertyHandle<math::Quatf> rotation)
    : _position{position}
    , _rotation{rotation}
{
    TKS_VERIFY(position.isValid());
}

CompensationOffset TimeDepthCompensator::compute(const SyncedEntity &entity, core::Tick currentTick, core::f64 depth) const
{
    CompensationOffset result;
    if (depth <= 0.0)
    {
        return result;
    }

    const core::f64 now = static_cast<core::f64>(currentTick);
    const core::f64 then = now - depth;

    const auto &position = entity.get(_position).history();
    if (!position.empty())
    {
        result.position = position.read(then) - position.read(now);
    }

    if (_rotation.isValid())
    {
        const auto &rotation = entity.get(_rotation).history();
        if (!rotation.empty())
        {
            result.rotation = (rotation.read(then) * rotation.read(now).conjugate()).normalize();
        }
    }
    return result;
}

void TimeDepthCompensator::apply(SyncedEntity &entity, core::Tick currentTick, core::f64 depth)
{
    _depth = depth;
    _offset = compute(entity, currentTick, depth);
    if (IGameObject *object = entity.gameObject())
    {
        object->setCompensationOffset(_offset.position, _offset.rotation);
    }
}

} // namespace tks::sync
