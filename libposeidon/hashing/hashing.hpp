/**@file
 *****************************************************************************
 Hash function signatures shared by the Poseidon instances.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_HASHING_HPP_
#define LIBPOSEIDON_HASHING_HASHING_HPP_

#include <functional>

namespace libposeidon {

/* Compression of two digests into one, e.g. for Merkle tree nodes */
template<typename hash_type>
using two_to_one_hash_function = std::function<hash_type(const hash_type&, const hash_type&)>;

} // namespace libposeidon

#endif // LIBPOSEIDON_HASHING_HASHING_HPP_
