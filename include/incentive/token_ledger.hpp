#ifndef INCENTIVE_TOKEN_LEDGER_HPP
#define INCENTIVE_TOKEN_LEDGER_HPP

#include <map>

#include "types.hpp"

namespace incentive {

// =============================================================================
// Transfer Hook Interface
// =============================================================================

// External code a token runs on every transfer (fee-on-transfer, callbacks,
// or a hostile token trying to re-enter the caller).
class ITransferHook {
public:
    virtual ~ITransferHook() = default;
    virtual void on_transfer(const Currency& token, const Address& from,
                             const Address& to, U128 amount) = 0;
};

// =============================================================================
// TokenLedger - token balances per holder
// =============================================================================

class TokenLedger {
public:
    TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // Credit new supply to a holder
    void mint(const Currency& token, const Address& to, U128 amount);

    // Move balance, then run the token's hook (if any).
    // Returns errors::INSUFFICIENT_BALANCE without side effects when short.
    int32_t transfer(const Currency& token, const Address& from, const Address& to, U128 amount);

    U128 balance_of(const Currency& token, const Address& holder) const;
    U128 total_supply(const Currency& token) const;

    void set_hook(const Currency& token, ITransferHook* hook);

private:
    std::map<Currency, std::map<Address, U128>> balances_;
    std::map<Currency, U128> supply_;
    std::map<Currency, ITransferHook*> hooks_;
};

} // namespace incentive

#endif // INCENTIVE_TOKEN_LEDGER_HPP
