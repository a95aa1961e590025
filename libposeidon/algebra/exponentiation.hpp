/**@file
 *****************************************************************************
 Exponentiation of field elements, including the Poseidon S-box x^alpha.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_ALGEBRA_EXPONENTIATION_HPP_
#define LIBPOSEIDON_ALGEBRA_EXPONENTIATION_HPP_

#include <cstddef>

namespace libposeidon {

/** Left-to-right square and multiply. */
template<typename FieldT>
FieldT power(const FieldT &base, const std::size_t exponent);

/** Computes x^alpha with a fixed addition chain for the exponents used as
 *  S-boxes (3, 5, 7 and 17), and with power() otherwise. */
template<typename FieldT>
FieldT sbox_power(const FieldT &x, const std::size_t alpha);

} // namespace libposeidon

#include "libposeidon/algebra/exponentiation.tcc"

#endif // LIBPOSEIDON_ALGEBRA_EXPONENTIATION_HPP_
