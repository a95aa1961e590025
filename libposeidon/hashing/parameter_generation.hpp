/**@file
 *****************************************************************************
 Derivation of Poseidon round constants and Cauchy mixing matrices from the
 Grain LFSR, following the reference parameter script of the Poseidon paper
 (https://eprint.iacr.org/2019/458.pdf, appendix F).

 This runs at build time to produce the compiled-in constant tables; the
 hashing code itself only ever reads those tables.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_PARAMETER_GENERATION_HPP_
#define LIBPOSEIDON_HASHING_PARAMETER_GENERATION_HPP_

#include <cstddef>
#include <vector>

#include <libff/algebra/field_utils/bigint.hpp>

#include "libposeidon/hashing/grain_lfsr.hpp"

namespace libposeidon {

template<typename FieldT>
class generated_poseidon_constants
{
    public:
    std::size_t state_size_;
    std::size_t full_rounds_;
    std::size_t partial_rounds_;
    /* one row of state_size_ constants per round */
    std::vector<std::vector<FieldT>> ark_matrix_;
    std::vector<std::vector<FieldT>> mds_matrix_;
};

/** Reads num_bits bits from the LFSR, most significant first. */
template<typename FieldT>
libff::bigint<FieldT::num_limbs> grain_random_bigint(grain_lfsr &lfsr, const std::size_t num_bits);

/** Round constants are rejection sampled below the modulus, in round-major order. */
template<typename FieldT>
std::vector<std::vector<FieldT>> generate_round_constants(
    grain_lfsr &lfsr,
    const std::size_t state_size,
    const std::size_t num_rounds);

/** M[i][j] = 1 / (x_i + y_j) for 2t distinct sampled elements x, y. */
template<typename FieldT>
std::vector<std::vector<FieldT>> generate_cauchy_matrix(
    grain_lfsr &lfsr,
    const std::size_t state_size);

/** Constants for the x^alpha S-box over the prime field FieldT, drawn from a
 *  single LFSR stream: the round constants first, then the matrix.
 *
 *  The reference script also redraws the matrix until it passes the
 *  invariant subspace checks of the Poseidon paper (algorithms 1 to 3). Those
 *  checks are not performed here; only full rank is checked. The output
 *  therefore matches the reference only for instances whose first matrix
 *  passes them, such as the BN254 instances (3, 8, 57) and (4, 8, 56). Any
 *  other instance has to be checked against the reference before use. */
template<typename FieldT>
generated_poseidon_constants<FieldT> generate_poseidon_constants(
    const std::size_t state_size,
    const std::size_t full_rounds,
    const std::size_t partial_rounds);

} // namespace libposeidon

#include "libposeidon/hashing/parameter_generation.tcc"

#endif // LIBPOSEIDON_HASHING_PARAMETER_GENERATION_HPP_
