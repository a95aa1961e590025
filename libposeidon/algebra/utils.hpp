/**@file
 *****************************************************************************
 Helpers for vectors of field elements.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_ALGEBRA_UTILS_HPP_
#define LIBPOSEIDON_ALGEBRA_UTILS_HPP_

#include <cstddef>
#include <vector>

namespace libposeidon {

template<typename FieldT>
std::vector<FieldT> random_vector(const std::size_t count);

/** True iff the stored (Montgomery) integer of every element is below the
 *  modulus. */
template<typename FieldT>
bool all_canonical(const std::vector<FieldT> &elements);

} // namespace libposeidon

#include "libposeidon/algebra/utils.tcc"

#endif // LIBPOSEIDON_ALGEBRA_UTILS_HPP_
