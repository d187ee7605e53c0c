#ifndef CASHEW_TYPES
#define CASHEW_TYPES

#include <data/tools.hpp>
#include <data/math.hpp>
#include <data/numbers.hpp>
#include <data/maybe.hpp>
#include <data/bytes.hpp>
#include <data/net/JSON.hpp>
#include <data/io/exception.hpp>
#include <data/crypto/random.hpp>
#include <data/async.hpp>
#include <gigamonkey/secp256k1.hpp>

namespace Cashew {
    using namespace data;
    namespace secp256k1 = Gigamonkey::secp256k1;

    // a keyset id as given by the mint. Modern ids are hex strings
    // but old mints use base64, so we keep it a string.
    using keyset_id = std::string;

    // all amounts are integers in the smallest unit of the keyset.
    using amount = int64;

    std::string inline write_hex (const bytes &b) {
        return std::string (encoding::hex::write (b));
    }

    bytes read_hex (const std::string &);

    // secrets are strings on the wire.
    bytes inline secret_from_string (const std::string &x) {
        bytes b {};
        b.resize (x.size ());
        std::copy (x.begin (), x.end (), b.begin ());
        return b;
    }

    std::string inline secret_to_string (const bytes &b) {
        return std::string (b.begin (), b.end ());
    }
}

#endif
