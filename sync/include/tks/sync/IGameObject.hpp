/**
 * @file IGameObject.hpp
 * @brief Scene-side object a SyncedEntity is attached to.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_IGAMEOBJECT_HPP
    #define TKS_SYNC_IGAMEOBJECT_HPP

#include <tks/math/Quat.hpp>
#include <tks/math/Vec3.hpp>

namespace tks::sync {

/**
 * @class IGameObject
 * @brief The part of a scene node the synchronization layer needs.
 *
 * Bound fields are reached through the getter/setter pairs passed to
 * SyncedEntity::bindAutoSync(); this interface only exposes the world
 * position used by lag compensation and the compensation hook.
 */
class IGameObject
{
public:
    virtual ~IGameObject() = default;

    [[nodiscard]] virtual math::Vec3f worldPosition() const = 0;

    /**
     * @brief Displace the hit-test children of the object.
     *
     * The offset moves the children to where a remote observer saw the
     * object; the authoritative transform is left untouched.
     */
    virtual void setCompensationOffset(const math::Vec3f &position, const math::Quatf &rotation) = 0;
};

} // namespace tks::sync

#endif // TKS_SYNC_IGAMEOBJECT_HPP
