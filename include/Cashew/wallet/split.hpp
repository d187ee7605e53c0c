#ifndef CASHEW_WALLET_SPLIT
#define CASHEW_WALLET_SPLIT

#include <Cashew/keyset.hpp>
#include <Cashew/proof.hpp>

namespace Cashew {

    using denominations = std::vector<amount>;

    amount inline sum (const denominations &d) {
        amount x = 0;
        for (amount a : d) x += a;
        return x;
    }

    // Split a value into amounts supported by the keyset. If a split
    // is provided, it is used first and the remainder is split greedily
    // starting with the largest amount. Zero amounts in the split are
    // kept only when the value is zero (NUT-08 blanks). The result is
    // sorted ascending.
    //
    // throw invalid_configuration if the split is bigger than the value,
    // includes amounts that the keyset does not have, or if the value
    // cannot be represented by the keyset.
    denominations split_amount (amount value, const keyset &, const denominations &split = {});

    // Choose denominations for proofs that we are going to keep, trying
    // to hold at least target proofs of each denomination given the
    // proofs that we have already.
    denominations keep_amounts (const list<proof> &have, amount value, const keyset &, uint32 target);
}

#endif
