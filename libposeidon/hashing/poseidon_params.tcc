#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <libff/common/profiling.hpp>

#include "libposeidon/algebra/matrix.hpp"

namespace libposeidon {

template<typename FieldT>
poseidon_params<FieldT>::poseidon_params(
    const std::size_t full_rounds,
    const std::size_t partial_rounds,
    const std::size_t alpha,
    const std::size_t rate,
    const std::vector<std::vector<FieldT>> &ark_matrix,
    const std::vector<std::vector<FieldT>> &mds_matrix) :
    full_rounds_(full_rounds),
    partial_rounds_(partial_rounds),
    alpha_(alpha),
    state_size_(mds_matrix.size()),
    rate_(rate),
    capacity_(state_size_ - std::min(rate, state_size_)),
    ark_matrix_(ark_matrix),
    mds_matrix_(mds_matrix)
{
    this->check_dimensions();
    this->compute_sparse_matrices();
    this->compute_optimized_round_constants();
}

template<typename FieldT>
void poseidon_params<FieldT>::check_dimensions() const
{
    if (this->state_size_ < 2)
    {
        throw std::invalid_argument("mds_matrix is of wrong dimension");
    }
    for (auto &row : this->mds_matrix_)
    {
        if (row.size() != this->state_size_)
        {
            throw std::invalid_argument("mds_matrix is of wrong dimension");
        }
    }

    if (this->ark_matrix_.size() != this->full_rounds_ + this->partial_rounds_)
    {
        throw std::invalid_argument("ark_matrix is of wrong dimension");
    }
    for (auto &row : this->ark_matrix_)
    {
        if (row.size() != this->state_size_)
        {
            throw std::invalid_argument("ark_matrix is of wrong dimension");
        }
    }

    if (this->full_rounds_ % 2 != 0)
    {
        throw std::invalid_argument("full rounds must split evenly around the partial rounds");
    }
    if (this->partial_rounds_ == 0)
    {
        throw std::invalid_argument("at least one partial round is required");
    }
    if (this->rate_ == 0 || this->rate_ >= this->state_size_)
    {
        throw std::invalid_argument("rate must be positive and leave a non-empty capacity");
    }
}

template<typename FieldT>
void poseidon_params<FieldT>::compute_sparse_matrices()
{
    const std::size_t t = this->state_size_;
    const std::vector<std::vector<FieldT>> mds_transpose = matrix_transpose(this->mds_matrix_);

    /* accumulated = M^T * M'_{i}, where M'_{i} is the dense remainder after
       splitting off i sparse factors */
    std::vector<std::vector<FieldT>> accumulated = mds_transpose;
    std::vector<std::vector<FieldT>> dense(t, std::vector<FieldT>(t, FieldT::zero()));

    for (std::size_t i = 0; i < this->partial_rounds_; ++i)
    {
        std::vector<std::vector<FieldT>> m_hat(t - 1, std::vector<FieldT>(t - 1, FieldT::zero()));
        std::vector<FieldT> w(t - 1, FieldT::zero());
        const std::vector<FieldT> v(accumulated[0].begin() + 1, accumulated[0].end());
        for (std::size_t row = 1; row < t; ++row)
        {
            for (std::size_t col = 1; col < t; ++col)
            {
                m_hat[row - 1][col - 1] = accumulated[row][col];
            }
            w[row - 1] = accumulated[row][0];
        }

        this->sparse_w_hat_.emplace_back(matrix_vector_product(matrix_inverse(m_hat), w));
        this->sparse_v_.emplace_back(v);

        dense = accumulated;
        dense[0][0] = FieldT::one();
        for (std::size_t j = 1; j < t; ++j)
        {
            dense[0][j] = FieldT::zero();
            dense[j][0] = FieldT::zero();
        }
        accumulated = matrix_product(mds_transpose, dense);
    }

    this->pre_sparse_matrix_ = matrix_transpose(dense);
}

template<typename FieldT>
void poseidon_params<FieldT>::compute_optimized_round_constants()
{
    const std::size_t t = this->state_size_;
    const std::size_t first_partial_round = this->full_rounds_per_side();
    const std::vector<std::vector<FieldT>> mds_inverse = matrix_inverse(this->mds_matrix_);

    /* Move the constants of each partial round backwards through the linear
       layer; only the first coordinate has to stay in place, because it is
       the only one going through the S-box. */
    this->optimized_round_constants_.assign(this->partial_rounds_, std::vector<FieldT>());
    std::vector<FieldT> carried = this->ark_matrix_[first_partial_round + this->partial_rounds_ - 1];
    for (std::size_t i = this->partial_rounds_ - 1; i-- > 0; )
    {
        const std::vector<FieldT> moved = matrix_vector_product(mds_inverse, carried);
        this->optimized_round_constants_[i + 1] = std::vector<FieldT>(1, moved[0]);

        carried = this->ark_matrix_[first_partial_round + i];
        for (std::size_t j = 1; j < t; ++j)
        {
            carried[j] += moved[j];
        }
    }
    this->optimized_round_constants_[0] = carried;
}

template<typename FieldT>
std::size_t poseidon_params<FieldT>::num_rounds() const
{
    return this->full_rounds_ + this->partial_rounds_;
}

template<typename FieldT>
std::size_t poseidon_params<FieldT>::full_rounds_per_side() const
{
    return this->full_rounds_ / 2;
}

template<typename FieldT>
const std::vector<FieldT> &poseidon_params<FieldT>::round_constants(const std::size_t round_id) const
{
    if (round_id >= this->ark_matrix_.size())
    {
        throw std::out_of_range("round " + std::to_string(round_id) +
                                " is past the last round of the ark_matrix (" +
                                std::to_string(this->ark_matrix_.size()) + " rounds)");
    }
    return this->ark_matrix_[round_id];
}

template<typename FieldT>
void poseidon_params<FieldT>::print() const
{
    libff::print_indent(); printf("\nPoseidon parameters\n");
    libff::print_indent(); printf("* State size = %zu\n", this->state_size_);
    libff::print_indent(); printf("* Full rounds = %zu\n", this->full_rounds_);
    libff::print_indent(); printf("* Partial rounds = %zu\n", this->partial_rounds_);
    libff::print_indent(); printf("* Alpha = %zu\n", this->alpha_);
}

} // libposeidon
