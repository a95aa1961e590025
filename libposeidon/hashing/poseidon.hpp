/**@file
 *****************************************************************************
    An implementation of the Poseidon permutation with the exponentiation S-Box
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_POSEIDON_HPP_
#define LIBPOSEIDON_HASHING_POSEIDON_HPP_

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "libposeidon/hashing/poseidon_params.hpp"

namespace libposeidon {

/** Rounds are laid out as full_rounds_ / 2 full rounds, partial_rounds_
 *  partial rounds and full_rounds_ / 2 full rounds. Each round adds the round
 *  constants, applies x^alpha (to every element in full rounds, to element 0
 *  only in partial rounds) and multiplies the state by the MDS matrix.
 *
 *  The permutation keeps no state of its own, so one instance can be shared
 *  between threads. */
template<typename FieldT>
class poseidon_permutation
{
    public:
    /* Called after each round with the round index and the state at its end */
    typedef std::function<void(const std::size_t, const std::vector<FieldT>&)> round_observer;

    explicit poseidon_permutation(std::shared_ptr<const poseidon_params<FieldT>> params);

    /** Uses the sparse partial rounds; agrees with permute_unoptimized. */
    std::vector<FieldT> permute(const std::vector<FieldT> &input) const;
    std::vector<FieldT> permute_unoptimized(
        const std::vector<FieldT> &input,
        const round_observer &observer = round_observer()) const;

    std::size_t state_size() const;
    const poseidon_params<FieldT> &params() const;

    protected:
    std::shared_ptr<const poseidon_params<FieldT>> params_;

    void check_state_size(const std::vector<FieldT> &state) const;
    void add_round_constants(std::vector<FieldT> &state, const std::vector<FieldT> &constants) const;
    void apply_mix_layer(std::vector<FieldT> &state) const;
    void apply_sparse_mix_layer(std::vector<FieldT> &state, const std::size_t index) const;
    void apply_full_round(std::vector<FieldT> &state, const std::size_t round_id) const;
    void apply_partial_round(std::vector<FieldT> &state, const std::size_t round_id) const;
};

} // namespace libposeidon

#include "libposeidon/hashing/poseidon.tcc"

#endif // LIBPOSEIDON_HASHING_POSEIDON_HPP_
