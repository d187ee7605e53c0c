#ifndef CASHEW_PROOF
#define CASHEW_PROOF

#include <Cashew/types.hpp>

namespace Cashew {

    // NUT-12 proof that the mint signed with the key it claims.
    // Verification belongs to the blinding module, so here we only
    // carry the scalars around.
    struct dleq {
        bytes E;
        bytes S;
        // blinding factor, only present on proofs, not on blind signatures.
        maybe<bytes> R;

        bool operator == (const dleq &) const = default;

        explicit dleq (const JSON &);
        explicit operator JSON () const;

        dleq () : E {}, S {}, R {} {}
        dleq (const bytes &e, const bytes &s, maybe<bytes> r = {}) :
            E {e}, S {s}, R {r} {}
    };

    // an unspent ecash token.
    struct proof {
        keyset_id KeysetID;
        amount Amount;
        // the secret is a UTF8 string in the protocol; we keep it as bytes.
        bytes Secret;
        // unblinded signature.
        secp256k1::pubkey C;
        maybe<dleq> DLEQ;
        maybe<std::string> Witness;

        proof () : KeysetID {}, Amount {0}, Secret {}, C {}, DLEQ {}, Witness {} {}
        proof (const keyset_id &id, amount a, const bytes &secret, const secp256k1::pubkey &c,
            maybe<dleq> d = {}, maybe<std::string> w = {}) :
            KeysetID {id}, Amount {a}, Secret {secret}, C {c}, DLEQ {d}, Witness {w} {}

        // proofs are identified by keyset and secret.
        bool operator == (const proof &p) const {
            return KeysetID == p.KeysetID && Secret == p.Secret;
        }

        // the same proof without a DLEQ. We never send DLEQs to the mint.
        proof strip_dleq () const;

        explicit proof (const JSON &);
        explicit operator JSON () const;
    };

    std::ostream &operator << (std::ostream &, const proof &);

    amount sum (const list<proof> &);

    list<proof> strip_dleq (const list<proof> &);

    // the proofs in the first list that are not in the second.
    list<proof> remove (const list<proof> &, const list<proof> &);

    JSON write (const list<proof> &);
    list<proof> read_proofs (const JSON &);
}

#endif
