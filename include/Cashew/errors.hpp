#ifndef CASHEW_ERRORS
#define CASHEW_ERRORS

#include <stdexcept>
#include <string>

namespace Cashew {

    // the proofs available cannot cover the amount requested.
    struct insufficient_funds : std::runtime_error {
        insufficient_funds () : std::runtime_error {"not enough funds available"} {}
        insufficient_funds (const std::string &what) : std::runtime_error {what} {}
    };

    // bad denominations, bad counters, custom outputs with fees, etc.
    // Never worth retrying.
    struct invalid_configuration : std::logic_error {
        invalid_configuration (const std::string &what) : std::logic_error {what} {}
    };

    // exact-match selection ran out of time. Retry with fewer
    // proofs or without an exact match.
    struct selection_timeout : std::runtime_error {
        selection_timeout () : std::runtime_error {"proof selection took too long"} {}
    };

    struct counter_capability_unsupported : std::logic_error {
        counter_capability_unsupported (const std::string &method) :
            std::logic_error {"counter source does not support " + method} {}
    };

    struct unknown_keyset : std::out_of_range {
        unknown_keyset (const std::string &id) : std::out_of_range {"unknown keyset " + id} {}
    };

    // the mint or a token did not follow the protocol.
    struct protocol_error : std::runtime_error {
        protocol_error (const std::string &what) : std::runtime_error {what} {}
    };
}

#endif
