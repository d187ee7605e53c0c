#ifndef CASHEW_WALLET
#define CASHEW_WALLET

#include <Cashew/issuer.hpp>
#include <Cashew/options.hpp>
#include <Cashew/wallet/counters.hpp>
#include <Cashew/wallet/outputs.hpp>
#include <Cashew/wallet/select.hpp>
#include <Cashew/wallet/swap.hpp>

namespace Cashew {

    struct send_config {
        maybe<keyset_id> KeysetID {};
        // add outputs to pay the fee that the receiver will be charged to spend the proofs.
        bool IncludeFees {false};
        counters_reserved OnCountersReserved {};
    };

    // if not provided, the wallet's default output type is used.
    struct output_config {
        maybe<output_type> Send {};
        maybe<output_type> Keep {};
    };

    struct send_offline_config {
        // only send proofs with valid DLEQs, and include the DLEQs.
        bool RequireDLEQ {false};
        bool IncludeFees {false};
        bool ExactMatch {true};
    };

    struct receive_config {
        maybe<keyset_id> KeysetID {};
        bool RequireDLEQ {false};
        // used to choose denominations.
        list<proof> ProofsWeHave {};
        counters_reserved OnCountersReserved {};
    };

    struct mint_config {
        maybe<keyset_id> KeysetID {};
        list<proof> ProofsWeHave {};
        counters_reserved OnCountersReserved {};
    };

    // blank outputs for a melt, given to the user before they are sent
    // to the mint so that the change can be recovered if the melt is
    // interrupted.
    struct melt_blanks {
        melt_payload Payload;
        list<output_data> OutputData;
        keyset Keyset;
        melt_quote Quote;
    };

    using change_outputs_created = data::function<void (const melt_blanks &)>;

    struct melt_config {
        maybe<keyset_id> KeysetID {};
        counters_reserved OnCountersReserved {};
        change_outputs_created OnChangeOutputsCreated {};
    };

    struct melt_proofs_response {
        melt_quote Quote;
        list<proof> Change;
    };

    struct restored {
        list<proof> Proofs;
        maybe<int64> LastCounterWithSignature;
    };

    struct wallet {
        issuer &Mint;
        keychain Keys;
        const blinding &Blinding;
        counter_source &Counters;
        data::entropy &Random;

        // required for deterministic secrets.
        maybe<bytes> Seed;

        // if not set, the cheapest active keyset is used.
        maybe<keyset_id> KeysetID;

        wallet_options Options;

        wallet (issuer &m, const keychain &k, const blinding &b, counter_source &c, data::entropy &r,
            maybe<bytes> seed = {}, const wallet_options &o = {}) :
            Mint {m}, Keys {k}, Blinding {b}, Counters {c}, Random {r}, Seed {seed}, KeysetID {}, Options {o} {}

        // the same wallet bound to a given keyset.
        wallet with_keyset (const keyset_id &) const;

        wallet_counters counters () {
            return wallet_counters {Counters};
        }

        // the given keyset, else the keyset that the wallet is bound to, else the active keyset.
        const keyset &get_keyset (const maybe<keyset_id> & = {}) const;

        // based on the secrets policy.
        // throw invalid_configuration if the policy is deterministic and there is no seed.
        output_type default_output_type () const;

        amount fees_for_proofs (const list<proof> &) const;
        amount fees_for_keyset (int64 inputs, const keyset_id &) const;

        send_response select_proofs_to_send (const list<proof> &, amount,
            bool include_fees = false, bool exact_match = false) const;

        // send without contacting the mint.
        // throw insufficient_funds if the proofs do not add up to the amount.
        send_response send_offline (amount, const list<proof> &, const send_offline_config & = {}) const;

        // throw insufficient_funds if the proofs cannot cover the amount plus fees.
        awaitable<send_response> send (amount, list<proof>, send_config, output_config);

        // swap the proofs of a token for new proofs.
        awaitable<list<proof>> receive (token, receive_config, maybe<output_type>);

        awaitable<list<proof>> mint_proofs (amount, mint_quote, mint_config, maybe<output_type>);

        // the proofs must add up to at least the quote amount plus the fee reserve.
        // This function does not select proofs.
        awaitable<melt_proofs_response> melt_proofs (melt_quote, list<proof>, melt_config, maybe<output_type>);

        // send a melt again with the blanks given to OnChangeOutputsCreated,
        // for example after a melt that was pending.
        awaitable<melt_proofs_response> complete_melt (melt_blanks);

        // regenerate deterministic proofs with counters in [start, start + count).
        awaitable<restored> restore (int64 start, int64 count, maybe<keyset_id>);

        // restore in batches until gap_limit counters in a row have no signatures.
        awaitable<restored> batch_restore (int64 gap_limit, int64 batch_size, int64 counter, maybe<keyset_id>);

        constexpr static int64 DefaultGapLimit {300};
        constexpr static int64 DefaultBatchSize {100};

    private:
        output_planner planner () const;

        // sending without a swap is only possible when no special outputs are requested.
        maybe<send_response> send_exact_offline (amount, const list<proof> &, const send_config &,
            const output_type &send, const output_type &keep) const;
    };
}

#endif
