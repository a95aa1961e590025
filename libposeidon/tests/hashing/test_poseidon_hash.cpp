#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/algebra/utils.hpp"
#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"
#include "libposeidon/hashing/poseidon_hash.hpp"

namespace libposeidon {

TEST(PoseidonHashTest, HashTwoOfZeros) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const FieldT expected = field_from_hex_string<FieldT>(
        "0x2098f5fb9e239eab3ceac3f27b81e481dc3124d55ffed523a839ee8446b64864");

    EXPECT_EQ(expected, bn254_poseidon_hash_two(FieldT::zero(), FieldT::zero()));
    EXPECT_EQ(expected, bn254_poseidon_hash(std::vector<FieldT>(2, FieldT::zero())));
}

TEST(PoseidonHashTest, HashThreeOfZeros) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const FieldT expected = field_from_hex_string<FieldT>(
        "0x0bc188d27dcceadc1dcfb6af0a7af08fe2864eecec96c5ae7cee6db31ba599aa");

    EXPECT_EQ(expected, bn254_poseidon_hash_three(FieldT::zero(), FieldT::zero(), FieldT::zero()));
    EXPECT_EQ(expected, bn254_poseidon_hash(std::vector<FieldT>(3, FieldT::zero())));
}

TEST(PoseidonHashTest, DigestIsFirstStateElement) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    /* hash_three(1, 2, 3) permutes [0, 1, 2, 3] */
    EXPECT_EQ(field_from_hex_string<FieldT>("0x0e7732d89e6939c0ff03d5e58dab6302f3230e269dc5b968f725df34ab36d732"),
              bn254_poseidon_hash_three(FieldT(1l), FieldT(2l), FieldT(3l)));
    /* hash_two(1, 2) permutes [0, 1, 2] */
    EXPECT_EQ(field_from_hex_string<FieldT>("0x115cc0f5e7d690413df64c6b9662e9cf2a3617f2743245519e19607a4417189a"),
              bn254_poseidon_hash_two(FieldT(1l), FieldT(2l)));
}

TEST(PoseidonHashTest, Deterministic) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const std::vector<FieldT> inputs = random_vector<FieldT>(3);

    EXPECT_EQ(bn254_poseidon_hash_two(inputs[0], inputs[1]),
              bn254_poseidon_hash_two(inputs[0], inputs[1]));
    EXPECT_EQ(bn254_poseidon_hash_three(inputs[0], inputs[1], inputs[2]),
              bn254_poseidon_hash_three(inputs[0], inputs[1], inputs[2]));
    EXPECT_EQ(bn254_poseidon_hash_three(inputs[0], inputs[1], inputs[2]),
              bn254_poseidon_hash(inputs));
}

TEST(PoseidonHashTest, OrderSensitive) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    EXPECT_NE(bn254_poseidon_hash_two(FieldT(1l), FieldT(2l)),
              bn254_poseidon_hash_two(FieldT(2l), FieldT(1l)));
    EXPECT_NE(bn254_poseidon_hash_three(FieldT(1l), FieldT(2l), FieldT(3l)),
              bn254_poseidon_hash_three(FieldT(1l), FieldT(3l), FieldT(2l)));
}

TEST(PoseidonHashTest, UnsupportedArity) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    EXPECT_TRUE(bn254_poseidon().supports_arity(2));
    EXPECT_TRUE(bn254_poseidon().supports_arity(3));
    EXPECT_FALSE(bn254_poseidon().supports_arity(1));
    EXPECT_EQ(std::vector<std::size_t>({2, 3}), bn254_poseidon().supported_arities());

    EXPECT_THROW(bn254_poseidon_hash(std::vector<FieldT>()), std::invalid_argument);
    EXPECT_THROW(bn254_poseidon_hash(random_vector<FieldT>(1)), std::invalid_argument);
    EXPECT_THROW(bn254_poseidon_hash(random_vector<FieldT>(4)), std::invalid_argument);
}

TEST(PoseidonHashTest, Chain) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const std::vector<FieldT> inputs = random_vector<FieldT>(4);

    FieldT expected = FieldT::zero();
    for (auto &input : inputs)
    {
        expected = bn254_poseidon_hash_two(expected, input);
    }
    EXPECT_EQ(expected, bn254_poseidon_hash_chain(inputs));

    EXPECT_EQ(FieldT::zero(), bn254_poseidon_hash_chain(std::vector<FieldT>()));
    EXPECT_EQ(bn254_poseidon_hash_two(FieldT::zero(), inputs[0]),
              bn254_poseidon_hash_chain(std::vector<FieldT>(1, inputs[0])));
}

TEST(PoseidonHashTest, TwoToOneHash) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const two_to_one_hash_function<FieldT> compress = bn254_poseidon_two_to_one_hash();
    const std::vector<FieldT> inputs = random_vector<FieldT>(2);

    EXPECT_EQ(bn254_poseidon_hash_two(inputs[0], inputs[1]), compress(inputs[0], inputs[1]));
}

TEST(PoseidonHashTest, RejectsBadParameterSets) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    std::vector<std::shared_ptr<const poseidon_params<FieldT>>> duplicated({
        bn254_poseidon_params(3), bn254_poseidon_params(3)});
    EXPECT_THROW(poseidon_hash<FieldT> hasher(duplicated), std::invalid_argument);

    std::vector<std::shared_ptr<const poseidon_params<FieldT>>> missing({nullptr});
    EXPECT_THROW(poseidon_hash<FieldT> hasher(missing), std::invalid_argument);

    /* capacity of two elements */
    std::vector<std::vector<FieldT>> ark;
    std::vector<std::vector<FieldT>> mds;
    for (std::size_t i = 0; i < 4 + 3; ++i)
    {
        ark.emplace_back(random_vector<FieldT>(4));
    }
    for (std::size_t i = 0; i < 4; ++i)
    {
        mds.emplace_back(random_vector<FieldT>(4));
    }
    std::vector<std::shared_ptr<const poseidon_params<FieldT>>> wide_capacity({
        std::make_shared<const poseidon_params<FieldT>>(4, 3, 5, 2, ark, mds)});
    EXPECT_THROW(poseidon_hash<FieldT> hasher(wide_capacity), std::invalid_argument);
}

TEST(PoseidonHashTest, ConcurrentHashing) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const std::size_t num_threads = 4;
    const std::size_t per_thread = 8;
    const std::vector<FieldT> inputs = random_vector<FieldT>(num_threads * per_thread + 1);

    std::vector<FieldT> expected;
    for (std::size_t i = 0; i < num_threads * per_thread; ++i)
    {
        expected.emplace_back(bn254_poseidon_hash_two(inputs[i], inputs[i + 1]));
    }

    std::vector<FieldT> results(expected.size());
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < num_threads; ++t)
    {
        threads.emplace_back([&, t]() {
            for (std::size_t i = t * per_thread; i < (t + 1) * per_thread; ++i)
            {
                results[i] = bn254_poseidon_hash_two(inputs[i], inputs[i + 1]);
            }
        });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(expected, results);
}

}
