/**@file
 *****************************************************************************
 Poseidon over BN254 with the Circom-compatible parameters: two inputs use
 the state size 3 permutation, three inputs the state size 4 one.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_BN254_POSEIDON_HPP_
#define LIBPOSEIDON_HASHING_BN254_POSEIDON_HPP_

#include <vector>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/hashing/hashing.hpp"
#include "libposeidon/hashing/poseidon_hash.hpp"

namespace libposeidon {

/** Built on first use, shared by every caller. */
const poseidon_hash<bn254_Fr> &bn254_poseidon();

bn254_Fr bn254_poseidon_hash_two(const bn254_Fr &a, const bn254_Fr &b);
bn254_Fr bn254_poseidon_hash_three(const bn254_Fr &a, const bn254_Fr &b, const bn254_Fr &c);
/** Throws std::invalid_argument unless inputs has 2 or 3 elements. */
bn254_Fr bn254_poseidon_hash(const std::vector<bn254_Fr> &inputs);
bn254_Fr bn254_poseidon_hash_chain(const std::vector<bn254_Fr> &inputs);

two_to_one_hash_function<bn254_Fr> bn254_poseidon_two_to_one_hash();

} // namespace libposeidon

#endif // LIBPOSEIDON_HASHING_BN254_POSEIDON_HPP_
