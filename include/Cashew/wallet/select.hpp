#ifndef CASHEW_WALLET_SELECT
#define CASHEW_WALLET_SELECT

#include <Cashew/options.hpp>
#include <Cashew/wallet/fees.hpp>

namespace Cashew {

    struct send_response {
        list<proof> Keep;
        list<proof> Send;
    };

    // Randomized greedy with local improvement. Selects proofs whose value,
    // minus fees if include_fees is true, is equal to the target or, if not
    // exact_match, as little over it as we can find. If the target cannot
    // be reached, everything is kept and nothing is sent.
    //
    // throw selection_timeout if exact_match and the time runs out before
    // an exact match is found.
    struct select_proofs {
        const fee_model &Fees;
        data::entropy &Random;
        select_options Options {};

        send_response operator () (const list<proof> &, amount target,
            bool include_fees = false, bool exact_match = false) const;
    };
}

#endif
