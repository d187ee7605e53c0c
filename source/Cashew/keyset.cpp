#include <Cashew/keyset.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    bool keyset::hex_id () const {
        if (ID.size () == 0) return false;
        for (char c : ID) if (!std::isxdigit (static_cast<unsigned char> (c))) return false;
        return true;
    }

    std::vector<amount> keyset::amounts () const {
        std::vector<amount> x;
        x.reserve (Keys.size ());
        for (const auto &[a, _] : Keys) x.push_back (a);
        return x;
    }

    keyset::keyset (const JSON &j) : keyset {} {
        if (j == nullptr) return;
        if (!j.is_object () || !j.contains ("id")) throw data::exception {} << "invalid keyset format";

        ID = std::string (j["id"]);
        if (j.contains ("unit")) Unit = std::string (j["unit"]);
        Active = j.contains ("active") ? bool (j["active"]) : true;
        if (j.contains ("input_fee_ppk")) FeePPK = amount (j["input_fee_ppk"]);
        if (j.contains ("final_expiry") && !j["final_expiry"].is_null ()) FinalExpiry = int64 (j["final_expiry"]);

        if (FeePPK < 0) throw data::exception {} << "keyset " << ID << " has negative fee";

        if (j.contains ("keys")) {
            const JSON &k = j["keys"];
            if (!k.is_object ()) throw data::exception {} << "invalid keyset format: keys must be an object";

            for (const auto &[key, value] : k.items ())
                Keys[std::stoll (key)] = secp256k1::pubkey {read_hex (std::string (value))};
        }
    }

    keyset::operator JSON () const {
        JSON::object_t x {};
        x["id"] = ID;
        x["unit"] = Unit;
        x["active"] = Active;
        x["input_fee_ppk"] = FeePPK;
        if (bool (FinalExpiry)) x["final_expiry"] = *FinalExpiry;

        JSON::object_t k {};
        for (const auto &[a, pk] : Keys) k[std::to_string (a)] = write_hex (pk);
        x["keys"] = k;

        return x;
    }

    std::ostream &operator << (std::ostream &o, const keyset &k) {
        return o << "keyset {" << k.ID << ", " << k.Unit << ", " << (k.Active ? "active" : "inactive") <<
            ", fee " << k.FeePPK << " ppk, " << k.Keys.size () << " keys}";
    }

    keychain::keychain (const std::string &unit, list<keyset> k) : keychain {unit} {
        for (const keyset &x : k) add (x);
    }

    keychain &keychain::add (const keyset &k) {
        if (k.Unit == Unit) Keysets[k.ID] = k;
        return *this;
    }

    const keyset &keychain::get (const keyset_id &id) const {
        auto k = Keysets.find (id);
        if (k == Keysets.end ()) throw unknown_keyset {id};
        return k->second;
    }

    const keyset &keychain::active () const {
        const keyset *cheapest = nullptr;

        // map iteration is ordered by id, so ties go to the lowest id.
        for (const auto &[_, k] : Keysets)
            if (k.Active && k.hex_id () && k.has_keys () && (cheapest == nullptr || k.FeePPK < cheapest->FeePPK))
                cheapest = &k;

        if (cheapest == nullptr) throw unknown_keyset {"(no active keyset for unit " + Unit + ")"};
        return *cheapest;
    }

    list<keyset> keychain::keysets () const {
        list<keyset> x;
        for (const auto &[_, k] : Keysets) x <<= k;
        return x;
    }

    keychain::keychain (const JSON &j) : keychain {} {
        if (j == nullptr) return;
        if (!j.is_object () || !j.contains ("keysets") || !j["keysets"].is_array ())
            throw data::exception {} << "invalid keychain format";

        if (j.contains ("unit")) Unit = std::string (j["unit"]);
        for (const JSON &k : j["keysets"]) add (keyset {k});
    }

    keychain::operator JSON () const {
        JSON::array_t k;
        for (const auto &[_, x] : Keysets) k.push_back (JSON (x));

        JSON::object_t x {};
        x["unit"] = Unit;
        x["keysets"] = k;
        return x;
    }
}
