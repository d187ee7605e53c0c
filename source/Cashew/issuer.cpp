#include <Cashew/issuer.hpp>

namespace Cashew {

    std::ostream &operator << (std::ostream &o, quote_state s) {
        switch (s) {
            case quote_state::unpaid: return o << "UNPAID";
            case quote_state::pending: return o << "PENDING";
            case quote_state::paid: return o << "PAID";
            case quote_state::issued: return o << "ISSUED";
        }

        throw data::exception {} << "invalid quote state";
    }

    quote_state read_quote_state (const std::string &x) {
        if (x == "UNPAID") return quote_state::unpaid;
        if (x == "PENDING") return quote_state::pending;
        if (x == "PAID") return quote_state::paid;
        if (x == "ISSUED") return quote_state::issued;
        throw data::exception {} << "unknown quote state " << x;
    }

    namespace {
        std::string write_quote_state (quote_state s) {
            std::stringstream ss;
            ss << s;
            return ss.str ();
        }

        maybe<int64> read_expiry (const JSON &j) {
            if (!j.contains ("expiry") || j["expiry"].is_null ()) return {};
            return int64 (j["expiry"]);
        }
    }

    mint_quote::mint_quote (const JSON &j) :
        Quote {}, Request {}, Amount {0}, Unit {}, State {quote_state::unpaid}, Expiry {} {
        if (!j.is_object () || !j.contains ("quote") || !j.contains ("request"))
            throw data::exception {} << "invalid mint quote format";

        Quote = std::string (j["quote"]);
        Request = std::string (j["request"]);
        if (j.contains ("amount")) Amount = amount (j["amount"]);
        if (j.contains ("unit")) Unit = std::string (j["unit"]);
        if (j.contains ("state")) State = read_quote_state (std::string (j["state"]));
        Expiry = read_expiry (j);
    }

    mint_quote::operator JSON () const {
        JSON::object_t x {};
        x["quote"] = Quote;
        x["request"] = Request;
        x["amount"] = Amount;
        x["unit"] = Unit;
        x["state"] = write_quote_state (State);
        if (bool (Expiry)) x["expiry"] = *Expiry;
        return x;
    }

    melt_quote::melt_quote (const JSON &j) :
        Quote {}, Request {}, Amount {0}, FeeReserve {0}, Unit {}, State {quote_state::unpaid}, Expiry {}, PaymentPreimage {} {
        if (!j.is_object () || !j.contains ("quote") || !j.contains ("amount"))
            throw data::exception {} << "invalid melt quote format";

        Quote = std::string (j["quote"]);
        Amount = amount (j["amount"]);
        if (j.contains ("request")) Request = std::string (j["request"]);
        if (j.contains ("fee_reserve")) FeeReserve = amount (j["fee_reserve"]);
        if (j.contains ("unit")) Unit = std::string (j["unit"]);
        if (j.contains ("state")) State = read_quote_state (std::string (j["state"]));
        Expiry = read_expiry (j);
        if (j.contains ("payment_preimage") && !j["payment_preimage"].is_null ())
            PaymentPreimage = std::string (j["payment_preimage"]);
    }

    melt_quote::operator JSON () const {
        JSON::object_t x {};
        x["quote"] = Quote;
        x["request"] = Request;
        x["amount"] = Amount;
        x["fee_reserve"] = FeeReserve;
        x["unit"] = Unit;
        x["state"] = write_quote_state (State);
        if (bool (Expiry)) x["expiry"] = *Expiry;
        if (bool (PaymentPreimage)) x["payment_preimage"] = *PaymentPreimage;
        return x;
    }

    token::token (const JSON &j) : Mint {}, Unit {}, Proofs {}, Memo {} {
        if (!j.is_object () || !j.contains ("mint") || !j.contains ("proofs"))
            throw data::exception {} << "invalid token format";

        Mint = std::string (j["mint"]);
        Unit = j.contains ("unit") ? std::string (j["unit"]) : std::string {"sat"};
        Proofs = read_proofs (j["proofs"]);
        if (j.contains ("memo")) Memo = std::string (j["memo"]);
    }

    token::operator JSON () const {
        JSON::object_t x {};
        x["mint"] = Mint;
        x["unit"] = Unit;
        x["proofs"] = write (Proofs);
        if (bool (Memo)) x["memo"] = *Memo;
        return x;
    }

    std::string sanitize_url (const std::string &url) {
        std::string x = url;
        while (x.size () > 0 && x.back () == '/') x.pop_back ();
        return x;
    }
}
