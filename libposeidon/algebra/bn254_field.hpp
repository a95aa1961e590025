/**@file
 *****************************************************************************
 The BN254 scalar field, as provided by libff's alt_bn128 curve.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_ALGEBRA_BN254_FIELD_HPP_
#define LIBPOSEIDON_ALGEBRA_BN254_FIELD_HPP_

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>

namespace libposeidon {

/** Integers modulo
 *  p = 21888242871839275222246405745257275088548364400416034343698204186575808495617 */
typedef libff::alt_bn128_Fr bn254_Fr;

/** libff keeps the modulus and Montgomery constants in globals that must be set
 *  before any bn254_Fr is constructed. Safe to call any number of times,
 *  from any thread. */
void init_bn254_params();

} // namespace libposeidon

#endif // LIBPOSEIDON_ALGEBRA_BN254_FIELD_HPP_
