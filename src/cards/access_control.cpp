// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/access_control.h>
#include <util.h>

namespace cards {

// ============================================================================
// RoleRegistry
// ============================================================================

RoleRegistry::RoleRegistry() = default;

bool RoleRegistry::HasCapability(const Address& actor, Capability capability) const
{
    LOCK(cs_roles_);

    auto it = members_.find(capability);
    if (it == members_.end()) {
        return false;
    }
    return it->second.count(actor) > 0;
}

bool RoleRegistry::GrantRole(Capability capability, const Address& actor)
{
    LOCK(cs_roles_);

    if (!members_[capability].insert(actor).second) {
        return false;
    }

    LogPrint(BCLog::CARDS, "RoleRegistry: Granted %s to %s\n",
             CapabilityToString(capability), actor.ToString().substr(0, 16));
    return true;
}

bool RoleRegistry::RevokeRole(Capability capability, const Address& actor)
{
    LOCK(cs_roles_);

    auto it = members_.find(capability);
    if (it == members_.end() || it->second.erase(actor) == 0) {
        return false;
    }

    LogPrint(BCLog::CARDS, "RoleRegistry: Revoked %s from %s\n",
             CapabilityToString(capability), actor.ToString().substr(0, 16));
    return true;
}

size_t RoleRegistry::GetRoleMemberCount(Capability capability) const
{
    LOCK(cs_roles_);

    auto it = members_.find(capability);
    return it == members_.end() ? 0 : it->second.size();
}

// ============================================================================
// PauseSwitch
// ============================================================================

PauseSwitch::PauseSwitch()
    : halted_(false)
{
}

bool PauseSwitch::IsHalted() const
{
    LOCK(cs_pause_);
    return halted_;
}

bool PauseSwitch::Pause()
{
    LOCK(cs_pause_);

    if (halted_) {
        return false;
    }
    halted_ = true;
    LogPrintf("PauseSwitch: Registry halted - mint, burn and transfer are frozen\n");
    return true;
}

bool PauseSwitch::Unpause()
{
    LOCK(cs_pause_);

    if (!halted_) {
        return false;
    }
    halted_ = false;
    LogPrintf("PauseSwitch: Registry resumed\n");
    return true;
}

} // namespace cards
