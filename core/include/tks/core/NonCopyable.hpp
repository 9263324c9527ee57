/**
 * @file NonCopyable.hpp
 * @brief CRTP bases that delete copy (NonCopyable) or copy and move (Pinned).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_NON_COPYABLE_HPP
    #define TKS_CORE_NON_COPYABLE_HPP

namespace tks::core {

/**
 * @brief Owners of history, ledgers or sockets: movable, never copied.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)      = default;
};

/**
 * @brief Objects whose address is held by someone else, such as a
 *        transport endpoint registered in its network or a world whose
 *        `this` is captured by transport handlers.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class Pinned {
protected:
    Pinned()  = default;
    ~Pinned() = default;

    Pinned(const Pinned &)            = delete;
    Pinned &operator=(const Pinned &) = delete;
    Pinned(Pinned &&)                 = delete;
    Pinned &operator=(Pinned &&)      = delete;
};

} // namespace tks::core

#endif // TKS_CORE_NON_COPYABLE_HPP
