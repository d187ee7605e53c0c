#include "fake.hpp"

namespace Cashew {

    TEST (Split, SplitAmount) {
        keyset k = test_keyset ("00ab");

        EXPECT_EQ (split_amount (13, k), (denominations {1, 4, 8}));
        EXPECT_EQ (split_amount (0, k), denominations {});
        EXPECT_EQ (split_amount (13, k, {4}), (denominations {1, 4, 8}));
        EXPECT_EQ (split_amount (13, k, {4, 4}), (denominations {1, 4, 4, 4}));

        // zeros are only kept for blank outputs.
        EXPECT_EQ (split_amount (0, k, {0, 0, 0}), (denominations {0, 0, 0}));
        EXPECT_EQ (split_amount (5, k, {0, 1, 4, 0}), (denominations {1, 4}));

        // bigger than anything in the keyset.
        EXPECT_EQ (split_amount (10000, k), (denominations {16, 256, 512, 1024, 4096, 4096}));

        EXPECT_THROW (split_amount (-1, k), invalid_configuration);
        EXPECT_THROW (split_amount (3, k, {4}), invalid_configuration);
        EXPECT_THROW (split_amount (6, k, {3, 3}), invalid_configuration);

        keyset no_ones {"00cd", "sat", true, 0, {{2, secp256k1::pubkey {}}, {4, secp256k1::pubkey {}}}};
        EXPECT_THROW (split_amount (7, no_ones), invalid_configuration);
        EXPECT_EQ (split_amount (6, no_ones), (denominations {2, 4}));
    }

    TEST (Split, KeepAmounts) {
        keyset k = test_keyset ("00ab");

        // fill up small denominations first.
        EXPECT_EQ (keep_amounts ({}, 10, k, 3), (denominations {1, 1, 1, 1, 2, 2, 2}));

        // we already have enough ones.
        EXPECT_EQ (keep_amounts (test_proofs ("00ab", {1, 1, 1}), 10, k, 3), (denominations {2, 2, 2, 4}));

        // the result always adds up to the value.
        for (amount value : {1, 7, 63, 100, 1000}) {
            denominations d = keep_amounts (test_proofs ("00ab", {1, 2, 2, 8}), value, k, 3);
            EXPECT_EQ (sum (d), value);
            EXPECT_TRUE (std::is_sorted (d.begin (), d.end ()));
        }

        EXPECT_EQ (keep_amounts ({}, 0, k, 3), denominations {});
    }

    TEST (Fees, FeeForInputs) {
        EXPECT_EQ (fee_for_inputs (0, 1000), 0);
        EXPECT_EQ (fee_for_inputs (3, 0), 0);
        EXPECT_EQ (fee_for_inputs (3, 100), 1);
        EXPECT_EQ (fee_for_inputs (10, 100), 1);
        EXPECT_EQ (fee_for_inputs (11, 100), 2);
        EXPECT_EQ (fee_for_inputs (2, 1000), 2);
    }

    TEST (Fees, FeeModel) {
        keychain keys {"sat", {test_keyset ("00ab", 100), test_keyset ("00cd", 1000)}};
        fee_model fees {keys};

        // rounded up once for the whole transaction.
        list<proof> cheap = test_proofs ("00ab", {1, 2, 4});
        EXPECT_EQ (fees.fee_ppk (cheap), 300);
        EXPECT_EQ (fees.fees (cheap), 1);

        list<proof> mixed = cheap;
        for (const proof &p : test_proofs ("00cd", {8, 16}, "other")) mixed <<= p;
        EXPECT_EQ (fees.fee_ppk (mixed), 2300);
        EXPECT_EQ (fees.fees (mixed), 3);

        EXPECT_EQ (fees.fees (11, "00ab"), 2);
        EXPECT_EQ (fees.net_value (test_proofs ("00cd", {8})[0]), 7);
        EXPECT_EQ (fees.net_value (test_proofs ("00cd", {8})[0], false), 8);

        EXPECT_THROW (fees.fees (test_proofs ("ffff", {1})), unknown_keyset);
        EXPECT_THROW (fees.fees (1, "ffff"), unknown_keyset);
    }
}
