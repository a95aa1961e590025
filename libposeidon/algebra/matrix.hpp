/**@file
 *****************************************************************************
 Dense matrices over a field, stored as vectors of rows.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_ALGEBRA_MATRIX_HPP_
#define LIBPOSEIDON_ALGEBRA_MATRIX_HPP_

#include <cstddef>
#include <vector>

namespace libposeidon {

template<typename FieldT>
std::vector<std::vector<FieldT>> identity_matrix(const std::size_t dimension);

/** result[r] = sum_c matrix[r][c] * vector[c] */
template<typename FieldT>
std::vector<FieldT> matrix_vector_product(const std::vector<std::vector<FieldT>> &matrix,
                                          const std::vector<FieldT> &vector);

template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_product(const std::vector<std::vector<FieldT>> &left,
                                                const std::vector<std::vector<FieldT>> &right);

template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_transpose(const std::vector<std::vector<FieldT>> &matrix);

/** Gauss-Jordan elimination. Throws std::invalid_argument if the matrix is not
 *  square or is singular. */
template<typename FieldT>
std::vector<std::vector<FieldT>> matrix_inverse(const std::vector<std::vector<FieldT>> &matrix);

template<typename FieldT>
std::size_t matrix_rank(const std::vector<std::vector<FieldT>> &matrix);

} // namespace libposeidon

#include "libposeidon/algebra/matrix.tcc"

#endif // LIBPOSEIDON_ALGEBRA_MATRIX_HPP_
