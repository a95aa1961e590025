#include <stdexcept>
#include <string>
#include <utility>

#include "libposeidon/algebra/exponentiation.hpp"
#include "libposeidon/algebra/matrix.hpp"

namespace libposeidon {

template<typename FieldT>
poseidon_permutation<FieldT>::poseidon_permutation(
    std::shared_ptr<const poseidon_params<FieldT>> params) :
    params_(params)
{
    if (!this->params_)
    {
        throw std::invalid_argument("poseidon_permutation needs parameters");
    }
}

template<typename FieldT>
std::size_t poseidon_permutation<FieldT>::state_size() const
{
    return this->params_->state_size_;
}

template<typename FieldT>
const poseidon_params<FieldT> &poseidon_permutation<FieldT>::params() const
{
    return *this->params_;
}

template<typename FieldT>
void poseidon_permutation<FieldT>::check_state_size(const std::vector<FieldT> &state) const
{
    if (state.size() != this->params_->state_size_)
    {
        throw std::invalid_argument("expected a state of " +
                                    std::to_string(this->params_->state_size_) +
                                    " elements, got " + std::to_string(state.size()));
    }
}

template<typename FieldT>
void poseidon_permutation<FieldT>::add_round_constants(
    std::vector<FieldT> &state,
    const std::vector<FieldT> &constants) const
{
    for (std::size_t i = 0; i < constants.size(); i++)
    {
        state[i] += constants[i];
    }
}

template<typename FieldT>
void poseidon_permutation<FieldT>::apply_mix_layer(std::vector<FieldT> &state) const
{
    const std::vector<std::vector<FieldT>> &mds = this->params_->mds_matrix_;
    const std::size_t state_size = this->params_->state_size_;

    std::vector<FieldT> mixed(state_size, FieldT::zero());
    for (std::size_t row = 0; row < state_size; row++)
    {
        for (std::size_t col = 0; col < state_size; col++)
        {
            mixed[row] += mds[row][col] * state[col];
        }
    }
    std::swap(state, mixed);
}

template<typename FieldT>
void poseidon_permutation<FieldT>::apply_sparse_mix_layer(
    std::vector<FieldT> &state,
    const std::size_t index) const
{
    /** The sparse matrix is
     *   [[mds[0][0], w_hat],
     *    [v,         I    ]] */
    const std::vector<FieldT> &v = this->params_->sparse_v_[index];
    const std::vector<FieldT> &w_hat = this->params_->sparse_w_hat_[index];
    const std::size_t state_size = this->params_->state_size_;

    FieldT first = this->params_->mds_matrix_[0][0] * state[0];
    for (std::size_t i = 1; i < state_size; i++)
    {
        first += w_hat[i - 1] * state[i];
    }
    for (std::size_t i = 1; i < state_size; i++)
    {
        state[i] += state[0] * v[i - 1];
    }
    state[0] = first;
}

template<typename FieldT>
void poseidon_permutation<FieldT>::apply_full_round(
    std::vector<FieldT> &state,
    const std::size_t round_id) const
{
    const std::vector<FieldT> &constants = this->params_->round_constants(round_id);
    // Add-Round Key & S-Box
    for (std::size_t i = 0; i < state.size(); i++)
    {
        state[i] += constants[i];
        state[i] = sbox_power(state[i], this->params_->alpha_);
    }

    // MixLayer
    // state = params.mds * state
    this->apply_mix_layer(state);
}

template<typename FieldT>
void poseidon_permutation<FieldT>::apply_partial_round(
    std::vector<FieldT> &state,
    const std::size_t round_id) const
{
    // Add-Round Key & S-Box on the first element only
    this->add_round_constants(state, this->params_->round_constants(round_id));
    state[0] = sbox_power(state[0], this->params_->alpha_);

    // MixLayer
    this->apply_mix_layer(state);
}

template<typename FieldT>
std::vector<FieldT> poseidon_permutation<FieldT>::permute(const std::vector<FieldT> &input) const
{
    this->check_state_size(input);
    const poseidon_params<FieldT> &params = *this->params_;
    const std::size_t half_full_rounds = params.full_rounds_per_side();
    const std::size_t partial_end = half_full_rounds + params.partial_rounds_;

    std::vector<FieldT> state(input);
    for (std::size_t round = 0; round < half_full_rounds; round++)
    {
        this->apply_full_round(state, round);
    }

    this->add_round_constants(state, params.optimized_round_constants_[0]);
    state = matrix_vector_product(params.pre_sparse_matrix_, state);
    for (std::size_t round = half_full_rounds; round < partial_end; round++)
    {
        state[0] = sbox_power(state[0], params.alpha_);
        if (round + 1 < partial_end)
        {
            state[0] += params.optimized_round_constants_[round + 1 - half_full_rounds][0];
        }
        this->apply_sparse_mix_layer(state, partial_end - round - 1);
    }

    for (std::size_t round = partial_end; round < params.num_rounds(); round++)
    {
        this->apply_full_round(state, round);
    }

    return state;
}

template<typename FieldT>
std::vector<FieldT> poseidon_permutation<FieldT>::permute_unoptimized(
    const std::vector<FieldT> &input,
    const round_observer &observer) const
{
    this->check_state_size(input);
    const std::size_t half_full_rounds = this->params_->full_rounds_per_side();

    std::vector<FieldT> state(input);
    std::size_t round = 0;
    for (std::size_t i = 0; i < half_full_rounds; i++)
    {
        this->apply_full_round(state, round);
        if (observer) observer(round, state);
        round++;
    }

    for (std::size_t i = 0; i < this->params_->partial_rounds_; i++)
    {
        this->apply_partial_round(state, round);
        if (observer) observer(round, state);
        round++;
    }

    for (std::size_t i = 0; i < half_full_rounds; i++)
    {
        this->apply_full_round(state, round);
        if (observer) observer(round, state);
        round++;
    }

    return state;
}

} // libposeidon
