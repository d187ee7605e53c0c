#include <Cashew/wallet/split.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    denominations split_amount (amount value, const keyset &k, const denominations &split) {
        if (value < 0) throw invalid_configuration {"cannot split negative amount " + std::to_string (value)};

        denominations chunks {};

        if (split.size () > 0) {
            amount split_sum = sum (split);
            if (split_sum > value) throw invalid_configuration {
                "split is greater than total amount: " + std::to_string (split_sum) + " > " + std::to_string (value)};

            for (amount a : split) {
                if (a == 0) {
                    if (value == 0) chunks.push_back (0);
                    continue;
                }

                if (a < 0 || !k.has_amount (a)) throw invalid_configuration {
                    "amount " + std::to_string (a) + " is not supported by keyset " + k.ID};

                chunks.push_back (a);
            }

            value -= split_sum;
        }

        denominations amounts = k.amounts ();
        for (auto a = amounts.rbegin (); a != amounts.rend () && value > 0; a++) {
            if (*a <= 0) continue;
            for (amount q = value / *a; q > 0; q--) chunks.push_back (*a);
            value %= *a;
        }

        if (value != 0) throw invalid_configuration {
            "keyset " + k.ID + " cannot represent remaining amount " + std::to_string (value)};

        std::sort (chunks.begin (), chunks.end ());
        return chunks;
    }

    denominations keep_amounts (const list<proof> &have, amount value, const keyset &k, uint32 target) {
        std::map<amount, uint32> counts;
        for (const proof &p : have) counts[p.Amount]++;

        denominations chunks {};
        amount chunks_sum = 0;

        // amounts we have fewer than the target of, smallest first.
        for (amount a : k.amounts ()) {
            if (a <= 0) continue;
            uint32 have_count = counts[a];
            uint32 needed = have_count < target ? target - have_count : 0;
            for (uint32 i = 0; i < needed && chunks_sum + a <= value; i++) {
                chunks.push_back (a);
                chunks_sum += a;
            }
        }

        if (amount remaining = value - chunks_sum; remaining > 0)
            for (amount a : split_amount (remaining, k)) chunks.push_back (a);

        std::sort (chunks.begin (), chunks.end ());
        return chunks;
    }
}
