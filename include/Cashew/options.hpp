#ifndef CASHEW_OPTIONS
#define CASHEW_OPTIONS

#include <Cashew/types.hpp>
#include <chrono>

namespace Cashew {

    // parameters of the proof selection algorithm.
    struct select_options {
        constexpr static uint32 DefaultMaxTrials {60};

        // acceptable overage in close-match mode, as a percentage of the target
        // and as an absolute amount. With both zero, a close match is only
        // accepted early when it is exact.
        constexpr static double DefaultMaxOverPercent {0};
        constexpr static amount DefaultMaxOverAmount {0};

        // shared by all trials.
        constexpr static std::chrono::milliseconds DefaultMaxTime {1000};

        // swap attempts per trial during local improvement.
        constexpr static uint32 DefaultMaxSwaps {5000};

        uint32 MaxTrials {DefaultMaxTrials};
        double MaxOverPercent {DefaultMaxOverPercent};
        amount MaxOverAmount {DefaultMaxOverAmount};
        std::chrono::milliseconds MaxTime {DefaultMaxTime};
        uint32 MaxSwaps {DefaultMaxSwaps};

        explicit select_options (const JSON &);
        explicit operator JSON () const;

        select_options () {}
    };

    // how secrets are generated when the caller does not say.
    enum class secrets_policy {
        // deterministic if the wallet has a seed, random otherwise.
        automatic,
        random,
        deterministic
    };

    std::ostream &operator << (std::ostream &, secrets_policy);

    struct wallet_options {
        constexpr static uint32 DefaultDenominationTarget {3};
        constexpr static uint32 DefaultMaxFeeIterations {10000};

        std::string Unit {"sat"};

        // how many proofs of each denomination we try to keep around.
        uint32 DenominationTarget {DefaultDenominationTarget};

        secrets_policy SecretsPolicy {secrets_policy::automatic};

        // bound on the fee-inclusive fixed point in output planning.
        uint32 MaxFeeIterations {DefaultMaxFeeIterations};

        select_options Select {};

        explicit wallet_options (const JSON &);
        explicit operator JSON () const;

        wallet_options () {}
    };
}

#endif
