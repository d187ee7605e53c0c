#include <Cashew/wallet.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    namespace {
        template <typename X>
        std::vector<X> to_vector (const list<X> &x) {
            std::vector<X> v {};
            for (const X &z : x) v.push_back (z);
            return v;
        }
    }

    wallet wallet::with_keyset (const keyset_id &id) const {
        wallet w = *this;
        w.KeysetID = id;
        return w;
    }

    const keyset &wallet::get_keyset (const maybe<keyset_id> &id) const {
        if (bool (id)) return Keys.get (*id);
        if (bool (KeysetID)) return Keys.get (*KeysetID);
        return Keys.active ();
    }

    output_type wallet::default_output_type () const {
        switch (Options.SecretsPolicy) {
            case secrets_policy::random: return random_outputs {};
            case secrets_policy::deterministic: {
                if (!bool (Seed)) throw invalid_configuration {"deterministic secrets policy requires a seed"};
                return deterministic_outputs {0};
            }
            case secrets_policy::automatic: return bool (Seed) ? output_type {deterministic_outputs {0}} : output_type {random_outputs {}};
        }

        throw invalid_configuration {"invalid secrets policy"};
    }

    amount wallet::fees_for_proofs (const list<proof> &p) const {
        return fee_model {Keys}.fees (p);
    }

    amount wallet::fees_for_keyset (int64 inputs, const keyset_id &id) const {
        return fee_model {Keys}.fees (inputs, id);
    }

    output_planner wallet::planner () const {
        return output_planner {Blinding, Counters, Random, Seed, Options.DenominationTarget, Options.MaxFeeIterations};
    }

    send_response wallet::select_proofs_to_send (const list<proof> &proofs, amount value, bool include_fees, bool exact_match) const {
        fee_model fees {Keys};
        return select_proofs {fees, Random, Options.Select} (proofs, value, include_fees, exact_match);
    }

    send_response wallet::send_offline (amount value, const list<proof> &proofs, const send_offline_config &config) const {
        list<proof> usable {};
        list<proof> unusable {};

        for (const proof &p : proofs)
            if (!config.RequireDLEQ || (bool (p.DLEQ) && Blinding.verify_dleq (p, Keys.get (p.KeysetID)))) usable <<= p;
            else unusable <<= p;

        if (sum (usable) < value) throw insufficient_funds {};

        send_response r = select_proofs_to_send (usable, value, config.IncludeFees, config.ExactMatch);

        for (const proof &p : unusable) r.Keep <<= p;
        if (!config.RequireDLEQ) r.Send = strip_dleq (r.Send);

        return r;
    }

    maybe<send_response> wallet::send_exact_offline (amount value, const list<proof> &proofs,
        const send_config &config, const output_type &send, const output_type &keep) const {

        if (bool (config.KeysetID)) {
            DATA_LOG (debug) << "swap required: keyset specified";
            return {};
        }

        if (!plain_random (send) || !plain_random (keep)) {
            DATA_LOG (debug) << "swap required: outputs are not plain random";
            return {};
        }

        try {
            send_response r = send_offline (value, proofs, send_offline_config {false, config.IncludeFees, true});
            amount expected_fee = config.IncludeFees ? fees_for_proofs (r.Send) : 0;
            if (data::size (r.Send) > 0 && sum (r.Send) == value + expected_fee) return r;
        } catch (const insufficient_funds &e) {
            DATA_LOG (debug) << "exact match offline selection failed: " << e.what ();
        } catch (const selection_timeout &e) {
            DATA_LOG (debug) << "exact match offline selection failed: " << e.what ();
        }

        return {};
    }

    awaitable<send_response> wallet::send (amount value, list<proof> proofs, send_config config, output_config outputs) {
        output_type send_type = bool (outputs.Send) ? *outputs.Send : default_output_type ();
        output_type keep_type = bool (outputs.Keep) ? *outputs.Keep : default_output_type ();

        // we don't need a swap if we have exactly the right proofs.
        if (maybe<send_response> offline = send_exact_offline (value, proofs, config, send_type, keep_type); bool (offline)) {
            DATA_LOG (info) << "sending " << value << " with exact match offline selection";
            co_return *offline;
        }

        keyset k = get_keyset (config.KeysetID);
        output_planner plan = planner ();

        output_spec send_spec = plan.configure (value, k, send_type, config.IncludeFees);

        // we pay the swap fee.
        send_response selected = select_proofs_to_send (proofs, send_spec.Amount, true);
        if (data::size (selected.Send) == 0) throw insufficient_funds {};

        amount selected_sum = sum (selected.Send);
        amount swap_fee = fees_for_proofs (selected.Send);
        amount change = selected_sum - swap_fee - send_spec.Amount;
        if (change < 0) throw insufficient_funds {"not enough funds available for swap: selected " +
            std::to_string (selected_sum) + ", fee " + std::to_string (swap_fee) + ", sending " + std::to_string (send_spec.Amount)};

        // we don't include fees in the change because we are the receiver.
        output_spec keep_spec = plan.configure (change, k, keep_type, false, selected.Keep);

        output_planner::reserved r = plan.reserve (k.ID, {send_spec, keep_spec});
        if (bool (r.Used)) notify ("counters reserved", config.OnCountersReserved, *r.Used);

        list<output_data> send_outputs = plan.create (r.Specs[0], k);
        list<output_data> keep_outputs = plan.create (r.Specs[1], k);

        swap_transaction tx = assemble (selected.Send, keep_outputs, send_outputs);
        list<blind_signature> signatures = co_await Mint.swap (tx.Payload);
        send_response swapped = tx.construct (signatures, Blinding, k);

        list<proof> keep = swapped.Keep;
        for (const proof &p : selected.Keep) keep <<= p;

        DATA_LOG (debug) << "send complete: keeping " << sum (keep) << " in " << data::size (keep) <<
            " proofs and sending " << sum (swapped.Send) << " in " << data::size (swapped.Send) << " proofs";

        co_return send_response {keep, swapped.Send};
    }

    awaitable<list<proof>> wallet::receive (token t, receive_config config, maybe<output_type> type) {
        std::string token_mint = sanitize_url (t.Mint);
        std::string wallet_mint = sanitize_url (Mint.url ());
        if (token_mint != wallet_mint) throw protocol_error {"token belongs to mint " + token_mint + ", not " + wallet_mint};
        if (t.Unit != Options.Unit) throw protocol_error {"token is in unit " + t.Unit + ", not " + Options.Unit};

        amount total = sum (t.Proofs);
        if (total == 0) co_return list<proof> {};

        keyset k = get_keyset (config.KeysetID);

        if (config.RequireDLEQ) for (const proof &p : t.Proofs)
            if (!bool (p.DLEQ) || !Blinding.verify_dleq (p, Keys.get (p.KeysetID)))
                throw protocol_error {"token contains proofs with invalid or missing DLEQ"};

        output_planner plan = planner ();
        output_spec spec = plan.configure (total - fees_for_proofs (t.Proofs), k,
            bool (type) ? *type : default_output_type (), false, config.ProofsWeHave);

        output_planner::reserved r = plan.reserve (k.ID, {spec});
        if (bool (r.Used)) notify ("counters reserved", config.OnCountersReserved, *r.Used);

        swap_transaction tx = assemble (t.Proofs, plan.create (r.Specs[0], k));
        list<blind_signature> signatures = co_await Mint.swap (tx.Payload);
        list<proof> received = tx.construct (signatures, Blinding, k).Keep;

        DATA_LOG (debug) << "receive complete: " << sum (received) << " in " << data::size (received) << " proofs";
        co_return received;
    }

    awaitable<list<proof>> wallet::mint_proofs (amount value, mint_quote quote, mint_config config, maybe<output_type> type) {
        if (value <= 0) throw invalid_configuration {"invalid mint amount " + std::to_string (value) + ": must be positive"};

        keyset k = get_keyset (config.KeysetID);
        output_planner plan = planner ();

        output_spec spec = plan.configure (value, k, bool (type) ? *type : default_output_type (), false, config.ProofsWeHave);

        output_planner::reserved r = plan.reserve (k.ID, {spec});
        if (bool (r.Used)) notify ("counters reserved", config.OnCountersReserved, *r.Used);

        list<output_data> outputs = plan.create (r.Specs[0], k);
        list<blind_signature> signatures = co_await Mint.mint (mint_payload {quote.Quote, blinded_messages (outputs)});

        if (data::size (signatures) != data::size (outputs))
            throw protocol_error {"mint returned " + std::to_string (data::size (signatures)) +
                " signatures, expected " + std::to_string (data::size (outputs))};

        std::vector<blind_signature> sigs = to_vector (signatures);
        list<proof> minted;
        size_t i = 0;
        for (const output_data &d : outputs) minted <<= d.to_proof (Blinding, sigs[i++], k);

        DATA_LOG (debug) << "mint complete: " << sum (minted) << " in " << data::size (minted) << " proofs";
        co_return minted;
    }

    awaitable<melt_proofs_response> wallet::melt_proofs (melt_quote quote, list<proof> proofs, melt_config config, maybe<output_type> type) {
        keyset k = get_keyset (config.KeysetID);
        amount fee_reserve = sum (proofs) - quote.Amount;

        list<output_data> blanks {};

        // blank outputs for the mint to return lightning fees that were reserved but not needed.
        if (fee_reserve > 0) {
            output_planner plan = planner ();
            output_spec spec = blank_outputs (fee_reserve, bool (type) ? *type : default_output_type ());

            output_planner::reserved r = plan.reserve (k.ID, {spec});
            if (bool (r.Used)) notify ("counters reserved", config.OnCountersReserved, *r.Used);

            blanks = plan.create (r.Specs[0], k);
            DATA_LOG (debug) << "created " << data::size (blanks) << " blank outputs for fee reserve " << fee_reserve;
        }

        melt_blanks b {melt_payload {quote.Quote, strip_dleq (proofs), blinded_messages (blanks)}, blanks, k, quote};
        notify ("change outputs created", config.OnChangeOutputsCreated, b);

        co_return co_await complete_melt (b);
    }

    awaitable<melt_proofs_response> wallet::complete_melt (melt_blanks b) {
        melt_response response = co_await Mint.melt (b.Payload);

        if (data::size (response.Change) > data::size (b.OutputData))
            throw protocol_error {"mint returned " + std::to_string (data::size (response.Change)) +
                " change signatures but only " + std::to_string (data::size (b.OutputData)) + " blanks were provided"};

        // the mint may return fewer signatures than blanks.
        std::vector<output_data> blank_data = to_vector (b.OutputData);
        list<proof> change;
        size_t i = 0;
        for (const blind_signature &sig : response.Change) change <<= blank_data[i++].to_proof (Blinding, sig, b.Keyset);

        melt_quote quote = b.Quote;
        quote.State = response.State;
        if (bool (response.PaymentPreimage)) quote.PaymentPreimage = response.PaymentPreimage;

        DATA_LOG (debug) << "melt " << quote.Quote << " complete: change " << sum (change);
        co_return melt_proofs_response {quote, change};
    }

    awaitable<restored> wallet::restore (int64 start, int64 count, maybe<keyset_id> id) {
        if (!bool (Seed)) throw invalid_configuration {"wallet must have a seed to restore"};
        if (start < 0 || count < 0) throw invalid_configuration {"invalid restore range"};

        keyset k = get_keyset (id);

        // blank deterministic outputs since we don't know the amounts.
        list<output_data> blanks = planner ().create (
            output_spec {deterministic_outputs {start, denominations (count, 0)}, 0}, k);
        std::vector<output_data> outputs = to_vector (blanks);

        restore_response response = co_await Mint.restore (blinded_messages (blanks));

        std::vector<blinded_message> signed_outputs = to_vector (response.Outputs);
        std::vector<blind_signature> signatures = to_vector (response.Signatures);
        if (signed_outputs.size () != signatures.size ())
            throw protocol_error {"restore response has " + std::to_string (signed_outputs.size ()) +
                " outputs but " + std::to_string (signatures.size ()) + " signatures"};

        restored r {};
        for (size_t i = 0; i < outputs.size (); i++) {
            auto match = std::find_if (signed_outputs.begin (), signed_outputs.end (), [&] (const blinded_message &m) {
                return m.B_ == outputs[i].BlindedMessage.B_;
            });

            if (match == signed_outputs.end ()) continue;

            const blind_signature &sig = signatures[match - signed_outputs.begin ()];
            output_data d = outputs[i];
            d.BlindedMessage.Amount = sig.Amount;
            r.Proofs <<= d.to_proof (Blinding, sig, k);
            r.LastCounterWithSignature = start + int64 (i);
        }

        co_return r;
    }

    awaitable<restored> wallet::batch_restore (int64 gap_limit, int64 batch_size, int64 counter, maybe<keyset_id> id) {
        if (batch_size <= 0 || gap_limit <= 0) throw invalid_configuration {"gap limit and batch size must be positive"};

        int64 required_empty_batches = (gap_limit + batch_size - 1) / batch_size;
        int64 empty_batches = 0;

        restored r {};
        while (empty_batches < required_empty_batches) {
            restored batch = co_await restore (counter, batch_size, id);
            if (data::size (batch.Proofs) > 0) {
                empty_batches = 0;
                for (const proof &p : batch.Proofs) r.Proofs <<= p;
                r.LastCounterWithSignature = batch.LastCounterWithSignature;
            } else empty_batches++;

            counter += batch_size;
        }

        // make sure we never use these counters again.
        if (bool (r.LastCounterWithSignature)) {
            keyset_id restored_keyset = get_keyset (id).ID;
            try {
                Counters.advance_to_at_least (restored_keyset, *r.LastCounterWithSignature + 1);
            } catch (const counter_capability_unsupported &e) {
                DATA_LOG (warning) << "could not advance counter for keyset " << restored_keyset << " after restore: " << e.what ();
            }
        }

        co_return r;
    }
}
