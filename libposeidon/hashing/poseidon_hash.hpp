/**@file
 *****************************************************************************
 Single-block Poseidon sponge over a set of permutations, one per arity.

 Hashing k elements places them after a zero capacity element in a state of
 size k + 1, applies the permutation of that size, and squeezes element 0.
 This is the convention of circomlib's Poseidon.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_POSEIDON_HASH_HPP_
#define LIBPOSEIDON_HASHING_POSEIDON_HASH_HPP_

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

#include "libposeidon/hashing/hashing.hpp"
#include "libposeidon/hashing/poseidon.hpp"

namespace libposeidon {

template<typename FieldT>
class poseidon_hash
{
    protected:
    /* keyed by state size */
    std::map<std::size_t, poseidon_permutation<FieldT>> permutations_;

    const poseidon_permutation<FieldT> &permutation_for_arity(const std::size_t arity) const;

    public:
    /** Every parameter set must have a capacity of one element, and no two may
     *  share a state size. */
    explicit poseidon_hash(const std::vector<std::shared_ptr<const poseidon_params<FieldT>>> &params);

    bool supports_arity(const std::size_t arity) const;
    std::vector<std::size_t> supported_arities() const;

    /** Throws std::invalid_argument if no permutation has state size
     *  inputs.size() + 1. */
    FieldT hash(const std::vector<FieldT> &inputs) const;
    FieldT hash_two(const FieldT &a, const FieldT &b) const;
    FieldT hash_three(const FieldT &a, const FieldT &b, const FieldT &c) const;

    /** Folds hash_two over the inputs, starting from zero:
     *  acc = hash_two(acc, input). Returns zero for no input. */
    FieldT hash_chain(const std::vector<FieldT> &inputs) const;

    two_to_one_hash_function<FieldT> two_to_one_hash() const;
};

} // namespace libposeidon

#include "libposeidon/hashing/poseidon_hash.tcc"

#endif // LIBPOSEIDON_HASHING_POSEIDON_HASH_HPP_
