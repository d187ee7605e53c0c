#ifndef CASHEW_WALLET_SWAP
#define CASHEW_WALLET_SWAP

#include <Cashew/issuer.hpp>
#include <Cashew/wallet/select.hpp>

namespace Cashew {

    // The mint requires outputs in ascending order by amount, so we need
    // to remember where each output came from in order to tell which
    // proofs we keep and which we send.
    struct swap_transaction {
        // inputs and outputs as sent to the mint.
        swap_payload Payload;

        // outputs in the order we made them: outputs to keep followed by outputs to send.
        std::vector<output_data> OutputData;

        // by position in Payload.Outputs, whether the output is one we keep.
        std::vector<bool> KeepVector;

        // by position in Payload.Outputs, the position of the output in OutputData.
        std::vector<size_t> SortedIndices;

        // turn the mint's signatures into proofs, split into the
        // proofs we keep and the proofs we send, each in the
        // order the outputs were made.
        // throw protocol_error if the number of signatures is wrong.
        send_response construct (const list<blind_signature> &, const blinding &, const keyset &) const;
    };

    swap_transaction assemble (const list<proof> &inputs, const list<output_data> &keep, const list<output_data> &send = {});
}

#endif
