#ifndef CASHEW_BLINDING
#define CASHEW_BLINDING

#include <Cashew/keyset.hpp>
#include <Cashew/proof.hpp>

namespace Cashew {

    // an output sent to the mint to be signed.
    struct blinded_message {
        amount Amount;
        keyset_id KeysetID;
        secp256k1::pubkey B_;

        bool operator == (const blinded_message &) const = default;

        explicit blinded_message (const JSON &);
        explicit operator JSON () const;

        blinded_message () : Amount {0}, KeysetID {}, B_ {} {}
        blinded_message (amount a, const keyset_id &id, const secp256k1::pubkey &b) :
            Amount {a}, KeysetID {id}, B_ {b} {}
    };

    // the mint's signature on a blinded message.
    struct blind_signature {
        keyset_id KeysetID;
        amount Amount;
        secp256k1::pubkey C_;
        maybe<dleq> DLEQ;

        explicit blind_signature (const JSON &);
        explicit operator JSON () const;

        blind_signature () : KeysetID {}, Amount {0}, C_ {}, DLEQ {} {}
        blind_signature (const keyset_id &id, amount a, const secp256k1::pubkey &c, maybe<dleq> d = {}) :
            KeysetID {id}, Amount {a}, C_ {c}, DLEQ {d} {}
    };

    // NUT-11 spending conditions.
    struct lock_options {
        list<secp256k1::pubkey> Pubkeys;
        maybe<int64> Locktime;
        list<secp256k1::pubkey> RefundKeys;
        maybe<uint32> RequiredSignatures;
        maybe<uint32> RequiredRefundSignatures;
        // SIG_INPUTS or SIG_ALL
        std::string SigFlag {"SIG_INPUTS"};

        bool valid () const {
            return data::size (Pubkeys) > 0;
        }
    };

    struct blinding;

    // everything we need to remember about an output in order to
    // turn the mint's signature into a proof.
    struct output_data {
        blinded_message BlindedMessage;
        secp256k1::secret BlindingFactor;
        bytes Secret;

        amount value () const {
            return BlindedMessage.Amount;
        }

        proof to_proof (const blinding &, const blind_signature &, const keyset &) const;
    };

    amount sum (const list<output_data> &);

    list<blinded_message> blinded_messages (const list<output_data> &);

    // a secret and blinding factor derived from a seed (NUT-13).
    struct derived_secret {
        bytes Secret;
        secp256k1::secret BlindingFactor;
    };

    // the elliptic curve part of the protocol.
    struct blinding {

        virtual output_data blind (amount, const keyset_id &, const bytes &secret, const secp256k1::secret &r) const = 0;

        virtual secp256k1::secret random_blinding_factor (data::entropy &) const = 0;

        virtual derived_secret derive (const bytes &seed, const keyset_id &, int64 counter) const = 0;

        // create a NUT-10 well-known secret for the given lock.
        virtual bytes lock (const lock_options &, data::entropy &) const = 0;

        virtual proof unblind (const output_data &, const blind_signature &, const keyset &) const = 0;

        virtual bool verify_dleq (const proof &, const keyset &) const = 0;

        virtual ~blinding () {}
    };

    // 32 random bytes, hex encoded.
    bytes random_secret (data::entropy &);

    proof inline output_data::to_proof (const blinding &b, const blind_signature &sig, const keyset &k) const {
        return b.unblind (*this, sig, k);
    }
}

#endif
