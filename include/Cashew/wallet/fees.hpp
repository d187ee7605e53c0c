#ifndef CASHEW_WALLET_FEES
#define CASHEW_WALLET_FEES

#include <Cashew/keyset.hpp>
#include <Cashew/proof.hpp>

namespace Cashew {

    // fees are charged per input in parts per thousand and rounded up
    // once for the whole transaction.
    amount inline fee_for_inputs (int64 inputs, amount fee_ppk) {
        if (inputs <= 0 || fee_ppk <= 0) return 0;
        return (inputs * fee_ppk + 999) / 1000;
    }

    struct fee_model {
        const keychain &Keys;

        // throw unknown_keyset if the proof's keyset is not in the keychain.
        amount fee_ppk (const proof &) const;
        amount fee_ppk (const list<proof> &) const;

        // the fee charged by the mint to spend these proofs together.
        amount fees (const list<proof> &) const;

        // the fee charged by the mint to spend n proofs of the given keyset.
        amount fees (int64 inputs, const keyset_id &) const;

        // the value of a proof after paying its own input fee, rounded up.
        amount net_value (const proof &, bool include_fees = true) const;
    };

    amount inline fee_model::fee_ppk (const proof &p) const {
        return Keys.get (p.KeysetID).FeePPK;
    }

    amount inline fee_model::fees (const list<proof> &p) const {
        amount total = fee_ppk (p);
        return total <= 0 ? 0 : (total + 999) / 1000;
    }

    amount inline fee_model::fees (int64 inputs, const keyset_id &id) const {
        return fee_for_inputs (inputs, Keys.get (id).FeePPK);
    }

    amount inline fee_model::net_value (const proof &p, bool include_fees) const {
        return include_fees ? p.Amount - fee_for_inputs (1, fee_ppk (p)) : p.Amount;
    }
}

#endif
