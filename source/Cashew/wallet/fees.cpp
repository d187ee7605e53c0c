#include <Cashew/wallet/fees.hpp>

namespace Cashew {

    amount fee_model::fee_ppk (const list<proof> &p) const {
        // look up each keyset only once.
        std::map<keyset_id, amount> rates;
        amount total = 0;
        for (const proof &z : p) {
            auto r = rates.find (z.KeysetID);
            if (r == rates.end ()) r = rates.emplace (z.KeysetID, fee_ppk (z)).first;
            total += r->second;
        }
        return total;
    }
}
