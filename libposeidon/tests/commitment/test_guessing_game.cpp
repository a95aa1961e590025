#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/commitment/guessing_game.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"

namespace libposeidon {

TEST(GuessingGameTest, KnownCommitments) {
    init_bn254_params();

    EXPECT_EQ("0x2346b3b208c9e65959af9824ccab4da69ae27d222204fcf0ace7f725e02e512d",
              field_to_hex_string(guessing_game_commit(
                  5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xa")));
    EXPECT_EQ("0x1cb75e97aa2b617f4d0c6bf6c99606af77cc899ee8c3e765e48af3b4a4f9cf67",
              field_to_hex_string(guessing_game_commit(
                  6, "0x3C44CdDdB6a900fa2b585dd299e03d12FA4293BC", "0xa")));
}

TEST(GuessingGameTest, PrefixIsOptional) {
    init_bn254_params();

    EXPECT_EQ(guessing_game_commit(5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xa"),
              guessing_game_commit(5, "70997970c51812dc3a010c7d01b50e0d17dc79c8", "a"));
}

TEST(GuessingGameTest, InputOrder) {
    init_bn254_params();
    typedef bn254_Fr FieldT;

    const FieldT address = field_from_hex_string<FieldT>("0x70997970c51812dc3a010c7d01b50e0d17dc79c8");
    const FieldT randomness = FieldT(10l);

    EXPECT_EQ(bn254_poseidon_hash_three(FieldT(5l), address, randomness),
              guessing_game_commit(5, address, randomness));
    EXPECT_NE(bn254_poseidon_hash_three(FieldT(5l), randomness, address),
              guessing_game_commit(5, address, randomness));
}

TEST(GuessingGameTest, BindsEveryInput) {
    init_bn254_params();

    const bn254_Fr reference = guessing_game_commit(5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xa");

    EXPECT_NE(reference, guessing_game_commit(6, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xa"));
    EXPECT_NE(reference, guessing_game_commit(5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c9", "0xa"));
    EXPECT_NE(reference, guessing_game_commit(5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xb"));
    EXPECT_NE(guessing_game_commit(0, "0x0", "0x0"), guessing_game_commit(65535, "0x0", "0x0"));
}

TEST(GuessingGameTest, MalformedInputs) {
    init_bn254_params();

    EXPECT_THROW(guessing_game_commit(5, "0x70997970c51812dc3a010c7d01b50e0d17dc79c8", "0xnothex"),
                 field_parse_error);
    EXPECT_THROW(guessing_game_commit(5, "0xgg", "0xa"), field_parse_error);
    EXPECT_THROW(guessing_game_commit(5, "", "0xa"), field_parse_error);
    EXPECT_THROW(guessing_game_commit(5, "0x1", ""), field_parse_error);
}

}
