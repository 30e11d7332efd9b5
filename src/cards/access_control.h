// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_ACCESS_CONTROL_H
#define CARDVAULT_CARDS_ACCESS_CONTROL_H

/**
 * @file access_control.h
 * @brief Capability and maintenance-mode collaborators
 *
 * The registry never decides authorization or pause policy itself. It asks
 * a CapabilityProvider whether an actor holds a role and a HaltState whether
 * ownership changes are currently frozen. RoleRegistry and PauseSwitch are
 * the in-process implementations.
 */

#include <cards/card_common.h>
#include <sync.h>

#include <map>
#include <set>

namespace cards {

/**
 * @brief Answers whether an actor holds a capability
 */
class CapabilityProvider {
public:
    virtual ~CapabilityProvider() = default;

    virtual bool HasCapability(const Address& actor, Capability capability) const = 0;
};

/**
 * @brief Answers whether the registry is in maintenance mode
 */
class HaltState {
public:
    virtual ~HaltState() = default;

    virtual bool IsHalted() const = 0;
};

/**
 * @brief In-memory role membership table
 *
 * Thread-safe. Granting a role twice or revoking a role that is not held
 * are no-ops that return false.
 */
class RoleRegistry : public CapabilityProvider {
public:
    RoleRegistry();

    bool HasCapability(const Address& actor, Capability capability) const override;

    /**
     * @brief Grant a role
     * @return true if the role was newly granted
     */
    bool GrantRole(Capability capability, const Address& actor);

    /**
     * @brief Revoke a role
     * @return true if the role was held and is now removed
     */
    bool RevokeRole(Capability capability, const Address& actor);

    /** Number of actors holding a role */
    size_t GetRoleMemberCount(Capability capability) const;

private:
    std::map<Capability, std::set<Address>> members_;

    mutable CCriticalSection cs_roles_;
};

/**
 * @brief In-memory maintenance flag
 */
class PauseSwitch : public HaltState {
public:
    PauseSwitch();

    bool IsHalted() const override;

    /** Enter maintenance mode. Returns false if already paused. */
    bool Pause();

    /** Leave maintenance mode. Returns false if not paused. */
    bool Unpause();

private:
    bool halted_;

    mutable CCriticalSection cs_pause_;
};

} // namespace cards

#endif // CARDVAULT_CARDS_ACCESS_CONTROL_H
