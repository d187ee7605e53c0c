#include <Cashew/options.hpp>
#include <Cashew/errors.hpp>

namespace Cashew {

    std::ostream &operator << (std::ostream &o, secrets_policy p) {
        switch (p) {
            case secrets_policy::random: return o << "random";
            case secrets_policy::deterministic: return o << "deterministic";
            case secrets_policy::automatic: return o << "auto";
        }

        throw data::exception {} << "invalid secrets policy";
    }

    namespace {
        secrets_policy read_secrets_policy (const std::string &x) {
            if (x == "random") return secrets_policy::random;
            if (x == "deterministic") return secrets_policy::deterministic;
            if (x == "auto") return secrets_policy::automatic;
            throw invalid_configuration {"unknown secrets policy " + x};
        }
    }

    select_options::select_options (const JSON &j) {
        if (j == nullptr) return;
        if (!j.is_object ()) throw data::exception {} << "invalid select options format";

        if (j.contains ("max_trials")) MaxTrials = uint32 (j["max_trials"]);
        if (j.contains ("max_over_percent")) MaxOverPercent = double (j["max_over_percent"]);
        if (j.contains ("max_over_amount")) MaxOverAmount = amount (j["max_over_amount"]);
        if (j.contains ("max_time_ms")) MaxTime = std::chrono::milliseconds {int64 (j["max_time_ms"])};
        if (j.contains ("max_swaps")) MaxSwaps = uint32 (j["max_swaps"]);
    }

    select_options::operator JSON () const {
        JSON::object_t x {};
        x["max_trials"] = MaxTrials;
        x["max_over_percent"] = MaxOverPercent;
        x["max_over_amount"] = MaxOverAmount;
        x["max_time_ms"] = int64 (MaxTime.count ());
        x["max_swaps"] = MaxSwaps;
        return x;
    }

    wallet_options::wallet_options (const JSON &j) {
        if (j == nullptr) return;
        if (!j.is_object ()) throw data::exception {} << "invalid wallet options format";

        if (j.contains ("unit")) Unit = std::string (j["unit"]);
        if (j.contains ("denomination_target")) DenominationTarget = uint32 (j["denomination_target"]);
        if (j.contains ("secrets_policy")) SecretsPolicy = read_secrets_policy (std::string (j["secrets_policy"]));
        if (j.contains ("max_fee_iterations")) MaxFeeIterations = uint32 (j["max_fee_iterations"]);
        if (j.contains ("select")) Select = select_options {j["select"]};
    }

    wallet_options::operator JSON () const {
        std::stringstream policy;
        policy << SecretsPolicy;

        JSON::object_t x {};
        x["unit"] = Unit;
        x["denomination_target"] = DenominationTarget;
        x["secrets_policy"] = policy.str ();
        x["max_fee_iterations"] = MaxFeeIterations;
        x["select"] = JSON (Select);
        return x;
    }
}
