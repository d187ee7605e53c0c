#ifndef CASHEW_WALLET_EVENTS
#define CASHEW_WALLET_EVENTS

#include <Cashew/wallet/counters.hpp>

namespace Cashew {

    using counters_reserved = data::function<void (const operation_counters &)>;

    // Call a user callback. Callbacks cannot affect the operation
    // that calls them, so failures are only logged.
    template <typename callback, typename ...X>
    void notify (const char *name, const callback &f, const X &...x) {
        if (!f) return;
        try {
            f (x...);
        } catch (const std::exception &e) {
            DATA_LOG (warning) << "callback " << name << " failed: " << e.what ();
        } catch (...) {
            DATA_LOG (warning) << "callback " << name << " failed";
        }
    }
}

#endif
