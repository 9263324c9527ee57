/**
 * @file PropertyOptions.cpp
 * @brief SyncStrategy helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/PropertyOptions.hpp>

namespace tks::sync {

const char *toString(SyncStrategy strategy) noexcept
{
    switch (strategy)
    {
        case SyncStrategy::Unreliable:  return "unreliable";
        case SyncStrategy::Auto:        return "auto";
        case SyncStrategy::Reliable:    return "reliable";
        case SyncStrategy::NoSync:      return "no-sync";
        case SyncStrategy::ClientOwned: return "client-owned";
    }
    return "unknown";
}

} // namespace tks::sync
