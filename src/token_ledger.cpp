// =============================================================================
// token_ledger.cpp - Token custody balances
// =============================================================================

#include "incentive/token_ledger.hpp"
#include "incentive/math.hpp"

namespace incentive {

void TokenLedger::mint(const Currency& token, const Address& to, U128 amount) {
    U128 supply = math::checked_add(supply_[token], amount);
    U128& balance = balances_[token][to];
    balance = math::checked_add(balance, amount);
    supply_[token] = supply;
}

int32_t TokenLedger::transfer(const Currency& token, const Address& from,
                              const Address& to, U128 amount) {
    if (balance_of(token, from) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    if (from != to && amount != 0) {
        auto& holders = balances_[token];
        holders[from] -= amount;
        holders[to] = math::checked_add(holders[to], amount);
    }

    // External code runs only after the balances are final
    auto it = hooks_.find(token);
    if (it != hooks_.end() && it->second) {
        it->second->on_transfer(token, from, to, amount);
    }
    return errors::OK;
}

U128 TokenLedger::balance_of(const Currency& token, const Address& holder) const {
    auto token_it = balances_.find(token);
    if (token_it == balances_.end()) return 0;
    auto it = token_it->second.find(holder);
    return it != token_it->second.end() ? it->second : 0;
}

U128 TokenLedger::total_supply(const Currency& token) const {
    auto it = supply_.find(token);
    return it != supply_.end() ? it->second : 0;
}

void TokenLedger::set_hook(const Currency& token, ITransferHook* hook) {
    if (hook) {
        hooks_[token] = hook;
    } else {
        hooks_.erase(token);
    }
}

} // namespace incentive
