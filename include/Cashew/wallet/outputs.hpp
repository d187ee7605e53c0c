#ifndef CASHEW_WALLET_OUTPUTS
#define CASHEW_WALLET_OUTPUTS

#include <Cashew/blinding.hpp>
#include <Cashew/options.hpp>
#include <Cashew/wallet/split.hpp>
#include <Cashew/wallet/fees.hpp>
#include <Cashew/wallet/events.hpp>

namespace Cashew {

    using output_factory = data::function<output_data (amount, const keyset &)>;

    // secrets are random.
    struct random_outputs {
        denominations Denominations {};
    };

    // secrets are derived from the wallet seed. A counter of zero means
    // that counters will be reserved from the wallet's counter source.
    struct deterministic_outputs {
        int64 Counter {0};
        denominations Denominations {};
    };

    // secrets are NUT-10 locked.
    struct locked_outputs {
        lock_options Lock;
        denominations Denominations {};
    };

    // outputs are made by a user function, one for each denomination.
    struct factory_outputs {
        output_factory Factory;
        denominations Denominations {};
    };

    // pre-built outputs, used as is.
    struct custom_outputs {
        list<output_data> Data;
    };

    using output_type = either<random_outputs, deterministic_outputs, locked_outputs, factory_outputs, custom_outputs>;

    // nullptr for custom outputs.
    const denominations *denominations_of (const output_type &);

    // throw invalid_configuration for custom outputs.
    output_type with_denominations (const output_type &, const denominations &);

    // random outputs with no denominations provided.
    bool plain_random (const output_type &);

    // an output type with denominations chosen, together with the
    // amount the outputs will add up to, which may be more than the
    // amount requested if fees were included.
    struct output_spec {
        output_type Type;
        amount Amount;

        // number of counters needed to assign counters automatically.
        int64 counters_needed () const;
    };

    // NUT-08 blank outputs for returning change on a melt with the given fee reserve.
    output_spec blank_outputs (amount fee_reserve, const output_type &);

    // Turns amounts and output policies into outputs for the mint to sign.
    struct output_planner {
        const blinding &Blinding;
        counter_source &Counters;
        data::entropy &Random;

        // required for deterministic outputs.
        maybe<bytes> Seed {};

        uint32 DenominationTarget {wallet_options::DefaultDenominationTarget};
        uint32 MaxFeeIterations {wallet_options::DefaultMaxFeeIterations};

        // Choose denominations. If include_fees is true, extra denominations
        // are added to pay the fee that the receiver will be charged to spend
        // the outputs. Denominations for proofs that we keep are chosen
        // based on the proofs we have.
        output_spec configure (amount, const keyset &, const output_type &,
            bool include_fees = false, const list<proof> &have = {}) const;

        struct reserved {
            list<output_spec> Specs;
            maybe<operation_counters> Used;
        };

        // reserve counters for all deterministic outputs with counter zero
        // in a single reservation and assign them in order.
        reserved reserve (const keyset_id &, list<output_spec>) const;

        // make the outputs. Deterministic outputs use counters starting from
        // the one given, so counters must already be reserved.
        list<output_data> create (const output_spec &, const keyset &) const;

        // configure, reserve, and create together. Returns nothing for
        // non-positive amounts.
        list<output_data> plan (amount, const keyset &, const output_type &,
            bool include_fees = false, const list<proof> &have = {},
            const counters_reserved & = {}) const;
    };
}

#endif
