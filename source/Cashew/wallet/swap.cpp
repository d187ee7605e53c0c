#include <Cashew/wallet/swap.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    swap_transaction assemble (const list<proof> &inputs, const list<output_data> &keep, const list<output_data> &send) {
        swap_transaction tx {};

        std::vector<bool> keep_vector {};
        for (const output_data &d : keep) {
            tx.OutputData.push_back (d);
            keep_vector.push_back (true);
        }

        for (const output_data &d : send) {
            tx.OutputData.push_back (d);
            keep_vector.push_back (false);
        }

        tx.SortedIndices.resize (tx.OutputData.size ());
        for (size_t i = 0; i < tx.SortedIndices.size (); i++) tx.SortedIndices[i] = i;

        // outputs with equal amounts stay in the order they were made.
        std::stable_sort (tx.SortedIndices.begin (), tx.SortedIndices.end (), [&tx] (size_t a, size_t b) {
            return tx.OutputData[a].value () < tx.OutputData[b].value ();
        });

        list<blinded_message> outputs;
        for (size_t i : tx.SortedIndices) {
            tx.KeepVector.push_back (keep_vector[i]);
            outputs <<= tx.OutputData[i].BlindedMessage;
        }

        tx.Payload = swap_payload {strip_dleq (inputs), outputs};

        DATA_LOG (debug) << "assembled swap with " << data::size (inputs) << " inputs and " << tx.OutputData.size () << " outputs";

        return tx;
    }

    send_response swap_transaction::construct (const list<blind_signature> &signatures, const blinding &b, const keyset &k) const {
        if (data::size (signatures) != OutputData.size ())
            throw protocol_error {"mint returned " + std::to_string (data::size (signatures)) +
                " signatures, expected " + std::to_string (OutputData.size ())};

        std::vector<proof> proofs (OutputData.size ());
        std::vector<bool> keep (OutputData.size (), false);

        size_t wire_position = 0;
        for (const blind_signature &sig : signatures) {
            size_t made = SortedIndices[wire_position];
            proofs[made] = OutputData[made].to_proof (b, sig, k);
            keep[made] = KeepVector[wire_position];
            wire_position++;
        }

        send_response r {};
        for (size_t i = 0; i < proofs.size (); i++)
            if (keep[i]) r.Keep <<= proofs[i];
            else r.Send <<= proofs[i];

        return r;
    }
}
