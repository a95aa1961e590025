/**@file
 *****************************************************************************
 Parameters of a Poseidon permutation over a prime field.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_POSEIDON_PARAMS_HPP_
#define LIBPOSEIDON_HASHING_POSEIDON_PARAMS_HPP_

#include <cstddef>
#include <vector>

namespace libposeidon {

template<typename FieldT>
class poseidon_params
{
    public:
    const std::size_t full_rounds_;
    const std::size_t partial_rounds_;
    const std::size_t alpha_;
    const std::size_t state_size_;
    const std::size_t rate_;
    const std::size_t capacity_;
    // The ARK matrix is the "Add-Round-Key" matrix, one row per round.
    const std::vector<std::vector<FieldT>> ark_matrix_;
    // The MDS matrix is the linear layer, applied as state = mds * state.
    const std::vector<std::vector<FieldT>> mds_matrix_;

    /** The partial rounds can be computed with one dense matrix followed by
     *  one sparse matrix per round, and with a single round constant per
     *  partial round (Poseidon paper, appendix B). The sparse matrices are
     *  stored by their first row (mds_matrix_[0][0], w_hat) and first column
     *  (v), in reverse round order. */
    std::vector<std::vector<FieldT>> optimized_round_constants_;
    std::vector<std::vector<FieldT>> pre_sparse_matrix_;
    std::vector<std::vector<FieldT>> sparse_v_;
    std::vector<std::vector<FieldT>> sparse_w_hat_;

    /** The tables are trusted input; only their shapes are checked.
     *  Throws std::invalid_argument on a shape mismatch. */
    poseidon_params(const std::size_t full_rounds,
                    const std::size_t partial_rounds,
                    const std::size_t alpha,
                    const std::size_t rate,
                    const std::vector<std::vector<FieldT>> &ark_matrix,
                    const std::vector<std::vector<FieldT>> &mds_matrix);

    std::size_t num_rounds() const;
    std::size_t full_rounds_per_side() const;
    /** Throws std::out_of_range past the last round. */
    const std::vector<FieldT> &round_constants(const std::size_t round_id) const;

    void print() const;

    protected:
    void check_dimensions() const;
    void compute_sparse_matrices();
    void compute_optimized_round_constants();
};

} // namespace libposeidon

#include "libposeidon/hashing/poseidon_params.tcc"

#endif // LIBPOSEIDON_HASHING_POSEIDON_PARAMS_HPP_
