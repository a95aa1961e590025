/**@file
 *****************************************************************************
 Layout of the generated Poseidon constant tables for BN254.

 The tables are written at build time by generate_bn254_constants and hold
 each constant as a hexadecimal string, in the order the reference generator
 prints them.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_BN254_CONSTANTS_HPP_
#define LIBPOSEIDON_HASHING_BN254_CONSTANTS_HPP_

#include <cstddef>

namespace libposeidon {

struct poseidon_constants_table
{
    std::size_t state_size;
    std::size_t full_rounds;
    std::size_t partial_rounds;
    std::size_t alpha;
    /* (full_rounds + partial_rounds) rows of state_size entries, row-major */
    const char *const *round_constants;
    std::size_t num_round_constants;
    /* state_size rows of state_size entries, row-major */
    const char *const *mds_matrix;
    std::size_t num_mds_entries;
};

extern const poseidon_constants_table bn254_poseidon_constant_tables[];
extern const std::size_t bn254_poseidon_num_constant_tables;

} // namespace libposeidon

#endif // LIBPOSEIDON_HASHING_BN254_CONSTANTS_HPP_
