#include <Cashew/blinding.hpp>

namespace Cashew {

    blinded_message::blinded_message (const JSON &j) : blinded_message {} {
        if (!j.is_object () || !j.contains ("amount") || !j.contains ("id") || !j.contains ("B_"))
            throw data::exception {} << "invalid blinded message format";

        Amount = amount (j["amount"]);
        KeysetID = std::string (j["id"]);
        B_ = secp256k1::pubkey {read_hex (std::string (j["B_"]))};
    }

    blinded_message::operator JSON () const {
        JSON::object_t x {};
        x["amount"] = Amount;
        x["id"] = KeysetID;
        x["B_"] = write_hex (B_);
        return x;
    }

    blind_signature::blind_signature (const JSON &j) : blind_signature {} {
        if (!j.is_object () || !j.contains ("amount") || !j.contains ("id") || !j.contains ("C_"))
            throw data::exception {} << "invalid blind signature format";

        Amount = amount (j["amount"]);
        KeysetID = std::string (j["id"]);
        C_ = secp256k1::pubkey {read_hex (std::string (j["C_"]))};
        if (j.contains ("dleq")) DLEQ = dleq {j["dleq"]};
    }

    blind_signature::operator JSON () const {
        JSON::object_t x {};
        x["amount"] = Amount;
        x["id"] = KeysetID;
        x["C_"] = write_hex (C_);
        if (bool (DLEQ)) x["dleq"] = JSON (*DLEQ);
        return x;
    }

    amount sum (const list<output_data> &o) {
        amount x = 0;
        for (const output_data &d : o) x += d.value ();
        return x;
    }

    list<blinded_message> blinded_messages (const list<output_data> &o) {
        list<blinded_message> x;
        for (const output_data &d : o) x <<= d.BlindedMessage;
        return x;
    }

    bytes random_secret (data::entropy &r) {
        bytes raw {};
        raw.resize (32);
        r >> raw;
        return secret_from_string (write_hex (raw));
    }
}
