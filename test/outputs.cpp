#include "fake.hpp"
#include <thread>

namespace Cashew {

    struct OutputsTest : ::testing::Test {
        keyset Free = test_keyset ("00ab");
        keyset Expensive = test_keyset ("00cd", 1000);

        fake_blinding Blinding {};
        ephemeral_counter_source Counters {};
        data::std_random<std::default_random_engine> Random {777};

        output_planner planner (maybe<bytes> seed = {}) {
            return output_planner {Blinding, Counters, Random, seed};
        }

        static bytes seed () {
            return secret_from_string ("test seed");
        }
    };

    std::vector<amount> amounts_of (const list<output_data> &o) {
        std::vector<amount> a {};
        for (const output_data &d : o) a.push_back (d.value ());
        std::sort (a.begin (), a.end ());
        return a;
    }

    TEST_F (OutputsTest, Configure) {
        output_spec spec = planner ().configure (13, Free, random_outputs {});
        EXPECT_EQ (spec.Amount, 13);
        EXPECT_EQ (*denominations_of (spec.Type), (denominations {1, 4, 8}));

        // given denominations must add up to the amount.
        EXPECT_EQ (*denominations_of (planner ().configure (13, Free, random_outputs {{1, 4, 4, 4}}).Type),
            (denominations {1, 4, 4, 4}));
        EXPECT_THROW (planner ().configure (13, Free, random_outputs {{4, 4}}), invalid_configuration);

        // choose denominations based on what we have.
        EXPECT_EQ (*denominations_of (planner ().configure (10, Free, random_outputs {}, false, test_proofs ("00ab", {1, 1, 1})).Type),
            (denominations {2, 2, 2, 4}));
    }

    TEST_F (OutputsTest, Custom) {
        list<output_data> custom {};
        custom <<= Blinding.blind (1, "00ab", secret_from_string ("a"), secp256k1::secret {7});
        custom <<= Blinding.blind (4, "00ab", secret_from_string ("b"), secp256k1::secret {7});

        output_spec spec = planner ().configure (5, Free, custom_outputs {custom});
        EXPECT_EQ (spec.Amount, 5);
        EXPECT_EQ (denominations_of (spec.Type), nullptr);
        EXPECT_EQ (data::size (planner ().create (spec, Free)), 2);

        EXPECT_THROW (planner ().configure (6, Free, custom_outputs {custom}), invalid_configuration);
        EXPECT_THROW (planner ().configure (5, Expensive, custom_outputs {custom}, true), invalid_configuration);
        EXPECT_THROW (blank_outputs (8, custom_outputs {custom}), invalid_configuration);
    }

    TEST_F (OutputsTest, IncludeFees) {
        // without fees there is nothing to add.
        output_spec no_fee = planner ().configure (10, Free, random_outputs {}, true);
        EXPECT_EQ (no_fee.Amount, 10);

        // the receiver pays 1 per input, including the inputs that pay the fee.
        for (amount value : {1, 10, 100, 1000, 12345}) {
            output_spec spec = planner ().configure (value, Expensive, random_outputs {}, true);
            const denominations &d = *denominations_of (spec.Type);
            EXPECT_EQ (sum (d), spec.Amount);
            EXPECT_GE (spec.Amount - value, fee_for_inputs (d.size (), Expensive.FeePPK));
        }

        EXPECT_EQ (planner ().configure (10, Expensive, random_outputs {}, true).Amount, 14);

        output_planner impatient = planner ();
        impatient.MaxFeeIterations = 0;
        EXPECT_THROW (impatient.configure (10, Expensive, random_outputs {}, true), invalid_configuration);
    }

    TEST_F (OutputsTest, PlanRandom) {
        EXPECT_EQ (data::size (planner ().plan (0, Free, random_outputs {})), 0);
        EXPECT_EQ (data::size (planner ().plan (-3, Free, random_outputs {})), 0);

        for (amount value : {1, 2, 7, 64, 99}) {
            list<output_data> o = planner ().plan (value, Free, random_outputs {});
            EXPECT_EQ (sum (o), value);
            for (const output_data &d : o) EXPECT_EQ (d.BlindedMessage.KeysetID, "00ab");
        }

        // random outputs do not use counters.
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 0);
    }

    TEST_F (OutputsTest, PlanDeterministic) {
        maybe<operation_counters> reported {};
        list<output_data> o = planner (seed ()).plan (13, Free, deterministic_outputs {}, false, {},
            [&reported] (const operation_counters &c) {
                reported = c;
            });

        EXPECT_EQ (amounts_of (o), (std::vector<amount> {1, 4, 8}));
        EXPECT_EQ (Blinding.derived (), (std::vector<int64> {0, 1, 2}));
        ASSERT_TRUE (bool (reported));
        EXPECT_EQ (*reported, (operation_counters {"00ab", 0, 3, 3}));
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 3);

        // an explicit counter is used as is.
        planner (seed ()).plan (13, Free, deterministic_outputs {7});
        EXPECT_EQ (Blinding.derived (), (std::vector<int64> {0, 1, 2, 7, 8, 9}));
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 3);

        // the same counters make the same outputs.
        list<output_data> again = planner (seed ()).create (
            output_spec {deterministic_outputs {0, {1, 4, 8}}, 13}, Free);
        EXPECT_TRUE (blinded_messages (again) == blinded_messages (o));

        EXPECT_THROW (planner ().plan (13, Free, deterministic_outputs {}), invalid_configuration);
    }

    TEST_F (OutputsTest, CallbackFailure) {
        list<output_data> o = planner (seed ()).plan (5, Free, deterministic_outputs {}, false, {},
            [] (const operation_counters &) {
                throw std::runtime_error {"could not save counters"};
            });

        EXPECT_EQ (sum (o), 5);
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 2);
    }

    TEST_F (OutputsTest, CallbackThrowsNonException) {
        list<output_data> o = planner (seed ()).plan (3, Free, deterministic_outputs {}, false, {},
            [] (const operation_counters &) {
                throw 7;
            });

        EXPECT_EQ (sum (o), 3);
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 2);
    }

    TEST_F (OutputsTest, RandomSecret) {
        std::string a = secret_to_string (random_secret (Random));
        std::string b = secret_to_string (random_secret (Random));

        // 32 random bytes written as hex.
        EXPECT_EQ (a.size (), 64);
        EXPECT_EQ (read_hex (a).size (), 32);
        EXPECT_NE (a, b);
    }

    TEST_F (OutputsTest, ReserveJointly) {
        output_planner p = planner (seed ());
        output_spec send = p.configure (7, Free, deterministic_outputs {});
        output_spec keep = p.configure (3, Free, deterministic_outputs {});
        output_spec other = p.configure (5, Free, random_outputs {});

        output_planner::reserved r = p.reserve ("00ab", {send, other, keep});
        ASSERT_TRUE (bool (r.Used));
        EXPECT_EQ (*r.Used, (operation_counters {"00ab", 0, 5, 5}));
        EXPECT_EQ (r.Specs[0].Type.get<deterministic_outputs> ().Counter, 0);
        EXPECT_TRUE (r.Specs[1].Type.is<random_outputs> ());
        EXPECT_EQ (r.Specs[2].Type.get<deterministic_outputs> ().Counter, 3);

        // nothing to reserve.
        EXPECT_FALSE (bool (p.reserve ("00ab", {other}).Used));
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, 5);
    }

    TEST_F (OutputsTest, ConcurrentPlansUseDifferentCounters) {
        constexpr int threads = 8;
        constexpr int plans = 25;

        std::vector<std::thread> workers {};
        for (int t = 0; t < threads; t++) workers.emplace_back ([this] () {
            output_planner p = planner (seed ());
            // three outputs each.
            for (int i = 0; i < plans; i++) p.plan (7, Free, deterministic_outputs {});
        });

        for (std::thread &w : workers) w.join ();

        std::vector<int64> derived = Blinding.derived ();
        std::sort (derived.begin (), derived.end ());

        std::vector<int64> expected (threads * plans * 3);
        for (size_t i = 0; i < expected.size (); i++) expected[i] = i;

        EXPECT_EQ (derived, expected);
        EXPECT_EQ (Counters.reserve ("00ab", 0).Start, threads * plans * 3);
    }

    TEST_F (OutputsTest, Locked) {
        EXPECT_THROW (planner ().plan (4, Free, locked_outputs {}), invalid_configuration);

        lock_options lock {};
        lock.Pubkeys <<= secp256k1::secret {123}.to_public ();

        list<output_data> o = planner ().plan (6, Free, locked_outputs {lock});
        EXPECT_EQ (sum (o), 6);
        for (const output_data &d : o) EXPECT_EQ (secret_to_string (d.Secret).rfind (R"(["P2PK",)", 0), 0);
    }

    TEST_F (OutputsTest, Factory) {
        std::vector<amount> requested {};
        output_factory make = [this, &requested] (amount a, const keyset &k) -> output_data {
            requested.push_back (a);
            return Blinding.blind (a, k.ID, secret_from_string ("made " + std::to_string (requested.size ())), secp256k1::secret {7});
        };

        list<output_data> o = planner ().plan (11, Free, factory_outputs {make});
        EXPECT_EQ (sum (o), 11);
        EXPECT_EQ (requested, (std::vector<amount> {1, 2, 8}));

        EXPECT_THROW (planner ().plan (4, Free, factory_outputs {}), invalid_configuration);
    }

    TEST_F (OutputsTest, Blanks) {
        auto count = [] (amount fee_reserve) -> size_t {
            return denominations_of (blank_outputs (fee_reserve, random_outputs {}).Type)->size ();
        };

        EXPECT_EQ (count (0), 0);
        EXPECT_EQ (count (1), 1);
        EXPECT_EQ (count (2), 1);
        EXPECT_EQ (count (3), 2);
        EXPECT_EQ (count (6), 3);
        EXPECT_EQ (count (1000), 10);
        EXPECT_EQ (count (1024), 10);
        EXPECT_EQ (count (1025), 11);

        output_spec blanks = blank_outputs (6, random_outputs {});
        EXPECT_EQ (blanks.Amount, 0);

        list<output_data> o = planner ().create (blanks, Free);
        EXPECT_EQ (data::size (o), 3);
        for (const output_data &d : o) EXPECT_EQ (d.value (), 0);
    }
}
