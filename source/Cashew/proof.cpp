#include <Cashew/proof.hpp>

namespace Cashew {

    dleq::dleq (const JSON &j) : dleq {} {
        if (!j.is_object () || !j.contains ("e") || !j.contains ("s"))
            throw data::exception {} << "invalid DLEQ format";

        E = read_hex (std::string (j["e"]));
        S = read_hex (std::string (j["s"]));
        if (j.contains ("r")) R = read_hex (std::string (j["r"]));
    }

    dleq::operator JSON () const {
        JSON::object_t x {};
        x["e"] = write_hex (E);
        x["s"] = write_hex (S);
        if (bool (R)) x["r"] = write_hex (*R);
        return x;
    }

    proof proof::strip_dleq () const {
        return proof {KeysetID, Amount, Secret, C, {}, Witness};
    }

    proof::proof (const JSON &j) : proof {} {
        if (!j.is_object () || !j.contains ("id") || !j.contains ("amount") || !j.contains ("secret") || !j.contains ("C"))
            throw data::exception {} << "invalid proof format";

        KeysetID = std::string (j["id"]);
        Amount = amount (j["amount"]);
        Secret = secret_from_string (std::string (j["secret"]));
        C = secp256k1::pubkey {read_hex (std::string (j["C"]))};
        if (j.contains ("dleq")) DLEQ = dleq {j["dleq"]};

        if (j.contains ("witness")) {
            const JSON &w = j["witness"];
            // witnesses are strings on the wire but some wallets send them as objects.
            Witness = w.is_string () ? std::string (w) : w.dump ();
        }
    }

    proof::operator JSON () const {
        JSON::object_t x {};
        x["id"] = KeysetID;
        x["amount"] = Amount;
        x["secret"] = secret_to_string (Secret);
        x["C"] = write_hex (C);
        if (bool (DLEQ)) x["dleq"] = JSON (*DLEQ);
        if (bool (Witness)) x["witness"] = *Witness;
        return x;
    }

    std::ostream &operator << (std::ostream &o, const proof &p) {
        return o << "proof {" << p.KeysetID << ", " << p.Amount << ", \"" << secret_to_string (p.Secret) << "\"}";
    }

    amount sum (const list<proof> &p) {
        amount x = 0;
        for (const proof &z : p) x += z.Amount;
        return x;
    }

    list<proof> strip_dleq (const list<proof> &p) {
        list<proof> x;
        for (const proof &z : p) x <<= z.strip_dleq ();
        return x;
    }

    list<proof> remove (const list<proof> &from, const list<proof> &these) {
        list<proof> x;
        for (const proof &z : from) {
            bool found = false;
            for (const proof &y : these) if (y == z) {
                found = true;
                break;
            }

            if (!found) x <<= z;
        }
        return x;
    }

    JSON write (const list<proof> &p) {
        JSON::array_t x;
        for (const proof &z : p) x.push_back (JSON (z));
        return x;
    }

    list<proof> read_proofs (const JSON &j) {
        if (!j.is_array ()) throw data::exception {} << "invalid proof list format";
        list<proof> x;
        for (const JSON &z : j) x <<= proof {z};
        return x;
    }
}
