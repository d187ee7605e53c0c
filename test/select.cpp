#include "fake.hpp"

namespace Cashew {

    struct SelectTest : ::testing::Test {
        keychain Keys {"sat", {test_keyset ("00ab"), test_keyset ("00cd", 1000), test_keyset ("00ef", 100)}};
        fee_model Fees {Keys};
        data::std_random<std::default_random_engine> Random {12345};

        select_proofs select (select_options o = {}) {
            return select_proofs {Fees, Random, o};
        }

        // keep and send contain every proof exactly once.
        void expect_partition (const list<proof> &proofs, const send_response &r) {
            EXPECT_EQ (data::size (r.Keep) + data::size (r.Send), data::size (proofs));
            for (const proof &p : proofs) {
                uint32 count = 0;
                for (const proof &x : r.Keep) if (x == p) count++;
                for (const proof &x : r.Send) if (x == p) count++;
                EXPECT_EQ (count, 1);
            }
        }
    };

    TEST_F (SelectTest, ExactMatch) {
        list<proof> proofs = test_proofs ("00ab", {1, 2, 4, 8});
        send_response r = select () (proofs, 6, false, true);
        EXPECT_EQ (amounts_of (r.Send), (std::vector<amount> {2, 4}));
        EXPECT_EQ (amounts_of (r.Keep), (std::vector<amount> {1, 8}));
        expect_partition (proofs, r);
    }

    TEST_F (SelectTest, NotEnough) {
        list<proof> proofs = test_proofs ("00ab", {1, 2});
        send_response r = select () (proofs, 10);
        EXPECT_EQ (data::size (r.Send), 0);
        EXPECT_EQ (r.Keep, proofs);

        r = select () (proofs, 0);
        EXPECT_EQ (data::size (r.Send), 0);
        EXPECT_EQ (r.Keep, proofs);
    }

    TEST_F (SelectTest, IncludeFees) {
        // worth 15 after its fee.
        list<proof> proofs = test_proofs ("00cd", {16});
        send_response r = select () (proofs, 10, true);
        EXPECT_EQ (r.Send, proofs);
        EXPECT_EQ (data::size (r.Keep), 0);

        // two of these are worth exactly 4 together.
        proofs = test_proofs ("00cd", {3, 3, 3});
        r = select () (proofs, 4, true, true);
        EXPECT_EQ (amounts_of (r.Send), (std::vector<amount> {3, 3}));
        expect_partition (proofs, r);

        // proofs that are worth nothing after fees are never sent.
        proofs = test_proofs ("00cd", {1, 1, 1, 1});
        r = select () (proofs, 1, true);
        EXPECT_EQ (data::size (r.Send), 0);
    }

    TEST_F (SelectTest, CloseMatch) {
        // no exact match is possible.
        list<proof> proofs = test_proofs ("00ab", {4, 4, 4});
        send_response r = select () (proofs, 6);
        EXPECT_EQ (amounts_of (r.Send), (std::vector<amount> {4, 4}));
        expect_partition (proofs, r);

        // a single proof that covers the target beats lots of small ones.
        proofs = test_proofs ("00ab", {1, 1, 1, 1, 1, 32});
        r = select () (proofs, 6);
        EXPECT_EQ (amounts_of (r.Send), (std::vector<amount> {32}));
    }

    TEST_F (SelectTest, Soundness) {
        std::uniform_int_distribution<uint32> power {0, 6};
        std::uniform_int_distribution<uint32> count {1, 20};
        std::uniform_int_distribution<uint32> keyset_choice {0, 2};
        std::vector<keyset_id> ids {"00ab", "00cd", "00ef"};

        for (int trial = 0; trial < 50; trial++) {
            list<proof> proofs {};
            amount total = 0;
            uint32 n = count (Random);
            for (uint32 i = 0; i < n; i++) {
                amount a = amount {1} << power (Random);
                proofs <<= proof {ids[keyset_choice (Random)], a,
                    secret_from_string (std::to_string (trial) + "-" + std::to_string (i)), secp256k1::pubkey {}};
                total += a;
            }

            amount target = std::uniform_int_distribution<amount> {1, total} (Random);
            bool include_fees = trial % 2 == 0;

            send_response r = select () (proofs, target, include_fees);
            expect_partition (proofs, r);

            // anything that is sent covers the target.
            if (data::size (r.Send) > 0) {
                amount net = sum (r.Send) - (include_fees ? Fees.fees (r.Send) : 0);
                EXPECT_GE (net, target);
            }

            // without fees there is always enough.
            if (!include_fees) EXPECT_GT (data::size (r.Send), 0);
        }
    }

    TEST_F (SelectTest, ExactCorrectness) {
        std::uniform_int_distribution<uint32> power {0, 5};
        std::uniform_int_distribution<uint32> count {1, 8};
        std::uniform_int_distribution<uint32> keyset_choice {0, 2};
        std::vector<keyset_id> ids {"00ab", "00cd", "00ef"};

        for (int trial = 0; trial < 50; trial++) {
            bool include_fees = trial % 2 == 0;
            std::string tag = std::to_string (trial) + "-";

            // proofs that add up to the target exactly.
            list<proof> subset {};
            uint32 n = count (Random);
            for (uint32 i = 0; i < n; i++) {
                uint32 k = keyset_choice (Random);
                amount a = amount {1} << power (Random);
                // keep them worth something after fees.
                if (include_fees && k != 0 && a == 1) a = 2;
                subset <<= proof {ids[k], a, secret_from_string ("subset-" + tag + std::to_string (i)), secp256k1::pubkey {}};
            }

            amount target = sum (subset) - (include_fees ? Fees.fees (subset) : 0);

            // proofs that are worth too much to be part of an exact match.
            list<proof> proofs = subset;
            uint32 extra = count (Random);
            for (uint32 i = 0; i < extra; i++)
                proofs <<= proof {ids[keyset_choice (Random)], target + 2 + amount (power (Random)),
                    secret_from_string ("extra-" + tag + std::to_string (i)), secp256k1::pubkey {}};

            // and one that is worth nothing after fees.
            if (include_fees) proofs <<= proof {"00cd", 1, secret_from_string ("dust-" + tag), secp256k1::pubkey {}};

            send_response r = select () (proofs, target, include_fees, true);
            expect_partition (proofs, r);
            EXPECT_EQ (sum (r.Send) - (include_fees ? Fees.fees (r.Send) : 0), target);
        }
    }

    TEST_F (SelectTest, Timeout) {
        // no exact match exists.
        list<proof> proofs = test_proofs ("00ab", {3, 3, 3});

        select_options no_time {};
        no_time.MaxTime = std::chrono::milliseconds {0};
        EXPECT_THROW (select (no_time) (proofs, 4, false, true), selection_timeout);

        // with enough time, we just give up.
        send_response r = select () (proofs, 4, false, true);
        EXPECT_EQ (data::size (r.Send), 0);
        EXPECT_EQ (r.Keep, proofs);

        // a close match returns the best so far instead of throwing.
        r = select (no_time) (proofs, 4);
        EXPECT_EQ (amounts_of (r.Send), (std::vector<amount> {3, 3}));
    }

    TEST_F (SelectTest, UnknownKeyset) {
        EXPECT_THROW (select () (test_proofs ("ffff", {1}), 1), unknown_keyset);
    }

    TEST (SelectOptions, JSON) {
        select_options o {};
        o.MaxTrials = 10;
        o.MaxOverPercent = 5;
        o.MaxTime = std::chrono::milliseconds {250};

        select_options read {JSON (o)};
        EXPECT_EQ (read.MaxTrials, 10);
        EXPECT_EQ (read.MaxOverPercent, 5);
        EXPECT_EQ (read.MaxOverAmount, 0);
        EXPECT_EQ (read.MaxTime, std::chrono::milliseconds {250});
        EXPECT_EQ (read.MaxSwaps, select_options::DefaultMaxSwaps);
    }
}
