/**@file
 *****************************************************************************
 Commitments of the guessing game: a player commits to a 16-bit guess, bound
 to their account address and blinded by a random field element, as

     commitment = Poseidon(guess, address, randomness)

 with the three-input BN254 instance.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_COMMITMENT_GUESSING_GAME_HPP_
#define LIBPOSEIDON_COMMITMENT_GUESSING_GAME_HPP_

#include <cstdint>
#include <string>

#include "libposeidon/algebra/bn254_field.hpp"

namespace libposeidon {

bn254_Fr guessing_game_commit(const uint16_t guess,
                              const bn254_Fr &address,
                              const bn254_Fr &randomness);

/** address and randomness are hexadecimal, with or without "0x". Both are
 *  parsed before anything is hashed; throws field_parse_error if either is
 *  malformed. */
bn254_Fr guessing_game_commit(const uint16_t guess,
                              const std::string &address,
                              const std::string &randomness);

} // namespace libposeidon

#endif // LIBPOSEIDON_COMMITMENT_GUESSING_GAME_HPP_
