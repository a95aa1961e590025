/**@file
 *****************************************************************************
 The Circom-compatible Poseidon parameter sets over BN254.

 State size 3 (hashing two elements) uses 8 full and 57 partial rounds, state
 size 4 (hashing three elements) 8 full and 56 partial rounds, both with
 x^5 as S-box. The sets are built from the generated tables on first use and
 shared, read-only, for the rest of the process.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_BN254_PARAMS_HPP_
#define LIBPOSEIDON_HASHING_BN254_PARAMS_HPP_

#include <cstddef>
#include <memory>
#include <vector>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/hashing/bn254_constants.hpp"
#include "libposeidon/hashing/poseidon_params.hpp"

namespace libposeidon {

/** Throws std::invalid_argument if the table is malformed. */
std::shared_ptr<const poseidon_params<bn254_Fr>> bn254_params_from_table(
    const poseidon_constants_table &table);

/** Throws std::invalid_argument for a state size without a table. */
std::shared_ptr<const poseidon_params<bn254_Fr>> bn254_poseidon_params(const std::size_t state_size);

std::vector<std::size_t> bn254_supported_state_sizes();

} // namespace libposeidon

#endif // LIBPOSEIDON_HASHING_BN254_PARAMS_HPP_
