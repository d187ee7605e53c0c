#ifndef CASHEW_KEYSET
#define CASHEW_KEYSET

#include <Cashew/types.hpp>

namespace Cashew {

    // a set of mint signing keys, one for each denomination.
    struct keyset {
        keyset_id ID;
        std::string Unit;
        bool Active;

        // fee per input in parts per thousand.
        amount FeePPK;

        // unix time after which the keyset can no longer be used.
        maybe<int64> FinalExpiry;

        std::map<amount, secp256k1::pubkey> Keys;

        keyset () : ID {}, Unit {}, Active {false}, FeePPK {0}, FinalExpiry {}, Keys {} {}
        keyset (const keyset_id &id, const std::string &unit, bool active, amount fee_ppk,
            std::map<amount, secp256k1::pubkey> keys = {}, maybe<int64> expiry = {}) :
            ID {id}, Unit {unit}, Active {active}, FeePPK {fee_ppk}, FinalExpiry {expiry}, Keys {keys} {}

        // keysets from version 0 onward have hex ids.
        bool hex_id () const;

        bool has_keys () const {
            return Keys.size () > 0;
        }

        bool has_amount (amount a) const {
            return Keys.contains (a);
        }

        // denominations supported by this keyset, ascending.
        std::vector<amount> amounts () const;

        explicit keyset (const JSON &);
        explicit operator JSON () const;

        bool operator == (const keyset &) const;
    };

    std::ostream &operator << (std::ostream &, const keyset &);

    // keysets of a single mint for a single unit.
    struct keychain {
        std::string Unit;
        std::map<keyset_id, keyset> Keysets;

        keychain (const std::string &unit = "sat") : Unit {unit}, Keysets {} {}
        keychain (const std::string &unit, list<keyset>);

        // keysets for other units are ignored.
        keychain &add (const keyset &);

        // throw unknown_keyset if not found.
        const keyset &get (const keyset_id &) const;

        // the cheapest active keyset with a hex id and keys.
        const keyset &active () const;

        list<keyset> keysets () const;

        explicit keychain (const JSON &);
        explicit operator JSON () const;
    };

    bool inline keyset::operator == (const keyset &k) const {
        return ID == k.ID && Unit == k.Unit && Active == k.Active && FeePPK == k.FeePPK &&
            FinalExpiry == k.FinalExpiry && Keys == k.Keys;
    }
}

#endif
