#include <Cashew/wallet/select.hpp>
#include <Cashew/errors.hpp>
#include <data/shuffle.hpp>
#include <chrono>
#include <cmath>
#include <set>

namespace Cashew {

    namespace {

        struct candidate {
            // position in the list we were given.
            uint32 Index;
            amount Amount;
            amount FeePPK;
            // value net of this proof's own fee.
            amount ExFee;
        };

        constexpr const int64 infinite = std::numeric_limits<int64>::max ();

        // if less_or_equal, the last index with ExFee <= value.
        // Otherwise the first index with ExFee >= value.
        maybe<size_t> search (const std::vector<candidate> &x, amount value, bool less_or_equal) {
            int64 left = 0;
            int64 right = int64 (x.size ()) - 1;
            maybe<size_t> result {};

            while (left <= right) {
                int64 mid = (left + right) / 2;
                amount mid_value = x[mid].ExFee;
                if (less_or_equal ? mid_value <= value : mid_value >= value) {
                    result = size_t (mid);
                    if (less_or_equal) left = mid + 1;
                    else right = mid - 1;
                } else if (less_or_equal) right = mid - 1;
                else left = mid + 1;
            }

            if (less_or_equal) return result;
            if (left < int64 (x.size ())) return size_t (left);
            return {};
        }

        void insert_sorted (std::vector<candidate> &x, const candidate &c) {
            x.insert (std::lower_bound (x.begin (), x.end (), c, [] (const candidate &a, const candidate &b) {
                return a.ExFee < b.ExFee;
            }), c);
        }

        struct selection {
            amount Target;
            bool IncludeFees;
            bool ExactMatch;
            amount MaxOver;

            amount net (amount value, amount fee_ppk) const {
                return IncludeFees ? value - fee_for_inputs (1, fee_ppk) : value;
            }

            // how much we overpay, in parts per thousand, if the target is met.
            int64 delta (amount value, amount fee_ppk) const {
                if (net (value, fee_ppk) < Target) return infinite;
                return value * 1000 + fee_ppk - Target * 1000;
            }

            bool acceptable (amount value, amount fee_ppk) const {
                amount n = net (value, fee_ppk);
                return n == Target || (!ExactMatch && n >= Target && n <= MaxOver);
            }
        };
    }

    send_response select_proofs::operator () (const list<proof> &proofs, amount target, bool include_fees, bool exact_match) const {
        auto start = std::chrono::steady_clock::now ();

        std::vector<proof> given {};
        std::vector<candidate> spendable {};
        amount total_amount = 0;
        amount total_fee_ppk = 0;

        for (const proof &p : proofs) {
            amount ppk = Fees.fee_ppk (p);
            amount ex_fee = include_fees ? p.Amount - fee_for_inputs (1, ppk) : p.Amount;
            uint32 index = given.size ();
            given.push_back (p);

            // proofs that cost more to spend than they are worth are useless.
            if (include_fees && ex_fee <= 0) continue;

            spendable.push_back (candidate {index, p.Amount, ppk, ex_fee});
            total_amount += p.Amount;
            total_fee_ppk += ppk;
        }

        std::stable_sort (spendable.begin (), spendable.end (), [] (const candidate &a, const candidate &b) {
            return a.ExFee < b.ExFee;
        });

        // remove proofs that are too big to be useful.
        if (spendable.size () > 0) {
            size_t end_index;
            if (exact_match) {
                maybe<size_t> right = search (spendable, target, true);
                end_index = bool (right) ? *right + 1 : 0;
            } else {
                maybe<size_t> bigger = search (spendable, target, false);
                // the smallest proof that covers the target on its own and everything
                // with the same value is kept. Anything bigger would be overpaying.
                end_index = bool (bigger) ? *search (spendable, spendable[*bigger].ExFee, true) + 1 : spendable.size ();
            }

            for (size_t i = end_index; i < spendable.size (); i++) {
                total_amount -= spendable[i].Amount;
                total_fee_ppk -= spendable[i].FeePPK;
            }

            spendable.resize (end_index);
        }

        amount total_net = include_fees ? total_amount - fee_for_inputs (1, total_fee_ppk) : total_amount;
        if (target <= 0 || target > total_net) return send_response {proofs, {}};

        selection sel {target, include_fees, exact_match, std::min ({
            amount (std::ceil (double (target) * (1 + Options.MaxOverPercent / 100))),
            target + Options.MaxOverAmount,
            total_net})};

        std::vector<candidate> best {};
        int64 best_delta = infinite;
        amount best_amount = 0;
        amount best_fee_ppk = 0;

        for (uint32 trial = 0; trial < Options.MaxTrials; trial++) {

            // phase 1: fill greedily from a random ordering.
            std::vector<candidate> shuffled {};
            for (size_t i : random_ordering (spendable.size (), Random)) shuffled.push_back (spendable[i]);

            std::vector<candidate> S {};
            amount value = 0;
            amount fee_ppk = 0;
            for (const candidate &c : shuffled) {
                amount next_value = value + c.Amount;
                amount next_fee_ppk = fee_ppk + c.FeePPK;
                amount next_net = sel.net (next_value, next_fee_ppk);
                if (exact_match && next_net > target) break;
                S.push_back (c);
                value = next_value;
                fee_ppk = next_fee_ppk;
                if (next_net >= target) break;
            }

            // phase 2: try to replace selected proofs with better ones.
            std::vector<candidate> others {};
            {
                std::set<uint32> selected {};
                for (const candidate &c : S) selected.insert (c.Index);
                for (const candidate &c : spendable) if (!selected.contains (c.Index)) others.push_back (c);
            }

            uint32 swaps = 0;
            for (size_t i : random_ordering (S.size (), Random)) {
                if (swaps++ == Options.MaxSwaps || sel.acceptable (value, fee_ppk)) break;

                candidate P = S[i];
                amount temp_value = value - P.Amount;
                amount temp_fee_ppk = fee_ppk - P.FeePPK;
                amount remaining = target - sel.net (temp_value, temp_fee_ppk);

                maybe<size_t> q = search (others, remaining, exact_match);
                if (!bool (q)) continue;

                candidate Q = others[*q];
                if ((!exact_match || Q.ExFee > P.ExFee) && (remaining >= 0 || Q.ExFee <= P.ExFee)) {
                    S[i] = Q;
                    value = temp_value + Q.Amount;
                    fee_ppk = temp_fee_ppk + Q.FeePPK;
                    others.erase (others.begin () + *q);
                    insert_sorted (others, P);
                }
            }

            // phase 3: keep the best and see if we can drop anything from it.
            if (int64 d = sel.delta (value, fee_ppk); d < best_delta) {
                DATA_LOG (debug) << "proof selection: best solution found in trial " << trial << ": amount " << value << ", delta " << d;

                best = S;
                std::stable_sort (best.begin (), best.end (), [] (const candidate &a, const candidate &b) {
                    return a.ExFee > b.ExFee;
                });

                best_delta = d;
                best_amount = value;
                best_fee_ppk = fee_ppk;

                // try removing proofs, largest first, as long as the target is still met.
                for (auto it = best.begin (); best.size () > 1 && best_delta > 0 && it != best.end ();) {
                    amount trimmed_value = best_amount - it->Amount;
                    amount trimmed_fee_ppk = best_fee_ppk - it->FeePPK;
                    int64 trimmed_delta = sel.delta (trimmed_value, trimmed_fee_ppk);

                    if (trimmed_delta == infinite) {
                        it++;
                        continue;
                    }

                    it = best.erase (it);
                    best_delta = trimmed_delta;
                    best_amount = trimmed_value;
                    best_fee_ppk = trimmed_fee_ppk;
                }
            }

            if (best_delta < infinite && sel.acceptable (best_amount, best_fee_ppk)) break;

            if (std::chrono::steady_clock::now () - start > Options.MaxTime) {
                if (exact_match) throw selection_timeout {};
                DATA_LOG (warning) << "proof selection took too long; returning best selection so far";
                break;
            }
        }

        if (best_delta == infinite) return send_response {proofs, {}};

        std::vector<bool> chosen (given.size (), false);
        list<proof> send;
        for (const candidate &c : best) {
            chosen[c.Index] = true;
            send <<= given[c.Index];
        }

        list<proof> keep;
        for (size_t i = 0; i < given.size (); i++) if (!chosen[i]) keep <<= given[i];

        DATA_LOG (debug) << "proof selection took " <<
            std::chrono::duration_cast<std::chrono::milliseconds> (std::chrono::steady_clock::now () - start).count () << "ms";

        return send_response {keep, send};
    }
}
