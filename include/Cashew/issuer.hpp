#ifndef CASHEW_ISSUER
#define CASHEW_ISSUER

#include <Cashew/blinding.hpp>

namespace Cashew {

    struct swap_payload {
        list<proof> Inputs;
        list<blinded_message> Outputs;
    };

    struct mint_payload {
        std::string Quote;
        list<blinded_message> Outputs;
    };

    struct melt_payload {
        std::string Quote;
        list<proof> Inputs;
        // NUT-08 blank outputs for fee change.
        list<blinded_message> Outputs;
    };

    enum class quote_state {
        unpaid,
        pending,
        paid,
        issued
    };

    std::ostream &operator << (std::ostream &, quote_state);

    quote_state read_quote_state (const std::string &);

    struct mint_quote {
        std::string Quote;
        // payment request, such as a lightning invoice.
        std::string Request;
        amount Amount;
        std::string Unit;
        quote_state State;
        maybe<int64> Expiry;

        explicit mint_quote (const JSON &);
        explicit operator JSON () const;

        mint_quote (const std::string &q, const std::string &r, amount a, const std::string &u,
            quote_state s = quote_state::unpaid, maybe<int64> ex = {}) :
            Quote {q}, Request {r}, Amount {a}, Unit {u}, State {s}, Expiry {ex} {}
    };

    struct melt_quote {
        std::string Quote;
        std::string Request;
        amount Amount;
        // the most the mint may charge in lightning fees.
        amount FeeReserve;
        std::string Unit;
        quote_state State;
        maybe<int64> Expiry;
        maybe<std::string> PaymentPreimage;

        explicit melt_quote (const JSON &);
        explicit operator JSON () const;

        melt_quote (const std::string &q, const std::string &r, amount a, amount fee_reserve, const std::string &u,
            quote_state s = quote_state::unpaid, maybe<int64> ex = {}) :
            Quote {q}, Request {r}, Amount {a}, FeeReserve {fee_reserve}, Unit {u}, State {s}, Expiry {ex}, PaymentPreimage {} {}
    };

    struct melt_response {
        quote_state State;
        maybe<std::string> PaymentPreimage;
        // signatures on some of the blank outputs, in order.
        list<blind_signature> Change;
    };

    struct restore_response {
        list<blinded_message> Outputs;
        list<blind_signature> Signatures;
    };

    // connection to a mint. Implementations throw whatever errors
    // their transport produces.
    struct issuer {

        virtual std::string url () const = 0;

        // one signature for each output, in order.
        virtual awaitable<list<blind_signature>> swap (const swap_payload &) = 0;
        virtual awaitable<list<blind_signature>> mint (const mint_payload &) = 0;

        virtual awaitable<melt_response> melt (const melt_payload &) = 0;

        // the outputs that the mint has signatures for, and those signatures.
        virtual awaitable<restore_response> restore (const list<blinded_message> &) = 0;

        virtual ~issuer () {}
    };

    // proofs from a single mint with a single unit.
    struct token {
        std::string Mint;
        std::string Unit;
        list<proof> Proofs;
        maybe<std::string> Memo;

        explicit token (const JSON &);
        explicit operator JSON () const;

        token (const std::string &mint, const std::string &unit, list<proof> p, maybe<std::string> memo = {}) :
            Mint {mint}, Unit {unit}, Proofs {p}, Memo {memo} {}
    };

    // remove trailing slash.
    std::string sanitize_url (const std::string &);
}

#endif
