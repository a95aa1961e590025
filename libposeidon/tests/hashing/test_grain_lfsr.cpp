#include <gmp.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/algebra/matrix.hpp"
#include "libposeidon/algebra/utils.hpp"
#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/hashing/grain_lfsr.hpp"
#include "libposeidon/hashing/parameter_generation.hpp"

namespace libposeidon {

TEST(GrainLFSRTest, Deterministic) {
    grain_lfsr first(prime_field_type, power_sbox_type, 254, 3, 8, 57);
    grain_lfsr second(prime_field_type, power_sbox_type, 254, 3, 8, 57);

    EXPECT_EQ(first.next_bits(1000), second.next_bits(1000));
}

TEST(GrainLFSRTest, SeedSelectsStream) {
    grain_lfsr t3(prime_field_type, power_sbox_type, 254, 3, 8, 57);
    grain_lfsr t4(prime_field_type, power_sbox_type, 254, 4, 8, 56);

    EXPECT_NE(t3.next_bits(256), t4.next_bits(256));
}

TEST(GrainLFSRTest, SeedOverflow) {
    EXPECT_THROW(grain_lfsr(prime_field_type, power_sbox_type, 1 << 12, 3, 8, 57),
                 std::invalid_argument);
    EXPECT_THROW(grain_lfsr(prime_field_type, power_sbox_type, 254, 3, 1 << 10, 57),
                 std::invalid_argument);
    EXPECT_THROW(grain_lfsr(prime_field_type, power_sbox_type, 254, 3, 8, 1 << 10),
                 std::invalid_argument);
}

TEST(GrainLFSRTest, RandomBigintWidth) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    grain_lfsr lfsr(prime_field_type, power_sbox_type, 254, 3, 8, 57);
    for (std::size_t i = 0; i < 20; ++i)
    {
        EXPECT_LE(grain_random_bigint<FieldT>(lfsr, 16).num_bits(), 16u);
    }
    EXPECT_THROW(grain_random_bigint<FieldT>(lfsr, 8 * sizeof(mp_limb_t) * FieldT::num_limbs + 1),
                 std::invalid_argument);
}

TEST(ParameterGenerationTest, MatchesCircomlib) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const generated_poseidon_constants<FieldT> constants = generate_poseidon_constants<FieldT>(3, 8, 57);

    ASSERT_EQ(65u, constants.ark_matrix_.size());
    ASSERT_EQ(3u, constants.ark_matrix_[0].size());
    EXPECT_EQ(field_from_hex_string<FieldT>("0x0ee9a592ba9a9518d05986d656f40c2114c4993c11bb29938d21d47304cd8e6e"),
              constants.ark_matrix_[0][0]);
    EXPECT_EQ(field_from_hex_string<FieldT>("0x00f1445235f2148c5986587169fc1bcd887b08d4d00868df5696fff40956e864"),
              constants.ark_matrix_[0][1]);
    EXPECT_EQ(field_from_hex_string<FieldT>("0x08dff3487e8ac99e1f29a058d0fa80b930c728730b7ab36ce879f3890ecf73f5"),
              constants.ark_matrix_[0][2]);

    ASSERT_EQ(3u, constants.mds_matrix_.size());
    EXPECT_EQ(field_from_hex_string<FieldT>("0x109b7f411ba0e4c9b2b70caf5c36a7b194be7c11ad24378bfedb68592ba8118b"),
              constants.mds_matrix_[0][0]);
}

TEST(ParameterGenerationTest, ShapesAndRange) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const generated_poseidon_constants<FieldT> constants = generate_poseidon_constants<FieldT>(4, 8, 56);

    EXPECT_EQ(4u, constants.state_size_);
    EXPECT_EQ(8u, constants.full_rounds_);
    EXPECT_EQ(56u, constants.partial_rounds_);
    ASSERT_EQ(64u, constants.ark_matrix_.size());
    for (auto &row : constants.ark_matrix_)
    {
        ASSERT_EQ(4u, row.size());
        EXPECT_TRUE(all_canonical(row));
    }
    EXPECT_EQ(4u, matrix_rank(constants.mds_matrix_));
}

TEST(ParameterGenerationTest, CauchyMatrixIsInvertible) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    grain_lfsr lfsr(prime_field_type, power_sbox_type, 254, 5, 8, 60);
    const std::vector<std::vector<FieldT>> m = generate_cauchy_matrix<FieldT>(lfsr, 5);

    EXPECT_EQ(identity_matrix<FieldT>(5), matrix_product(m, matrix_inverse(m)));
}

TEST(ParameterGenerationTest, CompiledTablesMatchGenerator) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    for (const std::size_t t : bn254_supported_state_sizes())
    {
        const std::shared_ptr<const poseidon_params<FieldT>> params = bn254_poseidon_params(t);
        const generated_poseidon_constants<FieldT> constants = generate_poseidon_constants<FieldT>(
            t, params->full_rounds_, params->partial_rounds_);

        EXPECT_EQ(constants.ark_matrix_, params->ark_matrix_);
        EXPECT_EQ(constants.mds_matrix_, params->mds_matrix_);
    }
}

}
