#include <Cashew/wallet/outputs.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    const denominations *denominations_of (const output_type &t) {
        if (t.is<random_outputs> ()) return &t.get<random_outputs> ().Denominations;
        if (t.is<deterministic_outputs> ()) return &t.get<deterministic_outputs> ().Denominations;
        if (t.is<locked_outputs> ()) return &t.get<locked_outputs> ().Denominations;
        if (t.is<factory_outputs> ()) return &t.get<factory_outputs> ().Denominations;
        return nullptr;
    }

    output_type with_denominations (const output_type &t, const denominations &d) {
        if (t.is<random_outputs> ()) return random_outputs {d};
        if (t.is<deterministic_outputs> ()) return deterministic_outputs {t.get<deterministic_outputs> ().Counter, d};
        if (t.is<locked_outputs> ()) return locked_outputs {t.get<locked_outputs> ().Lock, d};
        if (t.is<factory_outputs> ()) return factory_outputs {t.get<factory_outputs> ().Factory, d};
        throw invalid_configuration {"custom outputs do not have denominations"};
    }

    bool plain_random (const output_type &t) {
        return t.is<random_outputs> () && t.get<random_outputs> ().Denominations.size () == 0;
    }

    int64 output_spec::counters_needed () const {
        if (!Type.is<deterministic_outputs> ()) return 0;
        const auto &d = Type.get<deterministic_outputs> ();
        return d.Counter == 0 ? int64 (d.Denominations.size ()) : 0;
    }

    output_spec blank_outputs (amount fee_reserve, const output_type &t) {
        if (t.is<custom_outputs> ())
            throw invalid_configuration {"custom outputs cannot be used for melt change, which must be blank"};

        if (fee_reserve <= 0) return output_spec {with_denominations (t, {}), 0};

        // ceil (log2 (fee_reserve)), at least one.
        int64 count = 0;
        while ((int64 {1} << count) < fee_reserve) count++;
        if (count == 0) count = 1;

        return output_spec {with_denominations (t, denominations (count, 0)), 0};
    }

    output_spec output_planner::configure (amount value, const keyset &k, const output_type &t,
        bool include_fees, const list<proof> &have) const {

        if (t.is<custom_outputs> ()) {
            if (include_fees) throw invalid_configuration {"custom outputs do not support automatic fee inclusion"};

            amount custom_total = sum (t.get<custom_outputs> ().Data);
            if (custom_total != value) throw invalid_configuration {
                "custom output total " + std::to_string (custom_total) + " does not match amount " + std::to_string (value)};

            return output_spec {t, value};
        }

        denominations d = *denominations_of (t);

        if (d.size () > 0) {
            amount split_sum = sum (d);
            if (split_sum != value) throw invalid_configuration {
                "denominations add up to " + std::to_string (split_sum) + " but the amount is " + std::to_string (value)};
        } else if (data::size (have) > 0) d = keep_amounts (have, value, k, DenominationTarget);

        if (d.size () == 0) d = split_amount (value, k);

        // the receiver will pay a fee to spend these outputs, and the
        // outputs that pay for that fee add to the fee themselves.
        if (include_fees) {
            amount receive_fee = fee_for_inputs (d.size (), k.FeePPK);
            denominations fee_amounts = split_amount (receive_fee, k);
            uint32 iterations = 0;
            while (fee_for_inputs (d.size () + fee_amounts.size (), k.FeePPK) > receive_fee) {
                if (++iterations > MaxFeeIterations) throw invalid_configuration {
                    "could not determine fee for " + std::to_string (value) + " with keyset " + k.ID};
                receive_fee++;
                fee_amounts = split_amount (receive_fee, k);
            }

            value += receive_fee;
            d.insert (d.end (), fee_amounts.begin (), fee_amounts.end ());
        }

        return output_spec {with_denominations (t, d), value};
    }

    output_planner::reserved output_planner::reserve (const keyset_id &id, list<output_spec> specs) const {
        int64 total = 0;
        for (const output_spec &s : specs) total += s.counters_needed ();

        if (total == 0) return reserved {specs, {}};

        counter_range range = Counters.reserve (id, total);

        int64 cursor = range.Start;
        list<output_spec> patched;
        for (const output_spec &s : specs) {
            int64 need = s.counters_needed ();
            if (need == 0) {
                patched <<= s;
                continue;
            }

            patched <<= output_spec {deterministic_outputs {cursor, s.Type.get<deterministic_outputs> ().Denominations}, s.Amount};
            cursor += need;
        }

        operation_counters used {id, range.Start, range.Count, range.end ()};
        DATA_LOG (debug) << "reserved " << used;
        return reserved {patched, used};
    }

    list<output_data> output_planner::create (const output_spec &spec, const keyset &k) const {
        if (spec.Amount < 0) {
            DATA_LOG (warning) << "cannot create outputs for negative amount " << spec.Amount;
            return {};
        }

        const output_type &t = spec.Type;

        if (t.is<custom_outputs> ()) {
            const list<output_data> &custom = t.get<custom_outputs> ().Data;
            if (sum (custom) != spec.Amount) throw invalid_configuration {"custom output total does not match amount"};
            return custom;
        }

        const denominations &given = *denominations_of (t);
        if (given.size () > 0 && sum (given) != spec.Amount) throw invalid_configuration {
            "denominations add up to " + std::to_string (sum (given)) + " but the amount is " + std::to_string (spec.Amount)};

        denominations d = split_amount (spec.Amount, k, given);

        list<output_data> outputs;

        if (t.is<random_outputs> ()) {
            for (amount a : d) outputs <<= Blinding.blind (a, k.ID, random_secret (Random), Blinding.random_blinding_factor (Random));
        } else if (t.is<deterministic_outputs> ()) {
            if (!bool (Seed)) throw invalid_configuration {"deterministic outputs require a seed"};

            int64 counter = t.get<deterministic_outputs> ().Counter;
            for (amount a : d) {
                derived_secret x = Blinding.derive (*Seed, k.ID, counter++);
                outputs <<= Blinding.blind (a, k.ID, x.Secret, x.BlindingFactor);
            }
        } else if (t.is<locked_outputs> ()) {
            const lock_options &lock = t.get<locked_outputs> ().Lock;
            if (!lock.valid ()) throw invalid_configuration {"locked outputs require at least one pubkey"};

            for (amount a : d) outputs <<= Blinding.blind (a, k.ID, Blinding.lock (lock, Random), Blinding.random_blinding_factor (Random));
        } else {
            const output_factory &make = t.get<factory_outputs> ().Factory;
            if (!make) throw invalid_configuration {"factory outputs require a factory"};

            for (amount a : d) outputs <<= make (a, k);
        }

        return outputs;
    }

    list<output_data> output_planner::plan (amount value, const keyset &k, const output_type &t,
        bool include_fees, const list<proof> &have, const counters_reserved &on_reserved) const {

        if (value <= 0) {
            DATA_LOG (warning) << "cannot plan outputs for amount " << value;
            return {};
        }

        output_spec spec = configure (value, k, t, include_fees, have);
        reserved r = reserve (k.ID, {spec});
        if (bool (r.Used)) notify ("counters reserved", on_reserved, *r.Used);

        return create (r.Specs[0], k);
    }
}
