#include <Cashew/types.hpp>

namespace Cashew {

    bytes read_hex (const std::string &x) {
        maybe<bytes> b = encoding::hex::read (x);
        if (!bool (b)) throw data::exception {} << "could not read hex string \"" << x << "\"";
        return *b;
    }
}
