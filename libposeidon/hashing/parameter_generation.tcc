#include <gmp.h>
#include <stdexcept>

#include "libposeidon/algebra/matrix.hpp"

namespace libposeidon {

template<typename FieldT>
libff::bigint<FieldT::num_limbs> grain_random_bigint(grain_lfsr &lfsr, const std::size_t num_bits)
{
    const std::size_t bits_per_limb = 8 * sizeof(mp_limb_t);
    if (num_bits > FieldT::num_limbs * bits_per_limb)
    {
        throw std::invalid_argument("requested more bits than a bigint holds");
    }

    libff::bigint<FieldT::num_limbs> result;
    result.clear();

    const std::vector<bool> bits = lfsr.next_bits(num_bits);
    for (std::size_t i = 0; i < num_bits; ++i)
    {
        if (!bits[i])
        {
            continue;
        }
        const std::size_t bitno = num_bits - 1 - i;
        result.data[bitno / bits_per_limb] |= ((mp_limb_t)1) << (bitno % bits_per_limb);
    }
    return result;
}

template<typename FieldT>
std::vector<std::vector<FieldT>> generate_round_constants(
    grain_lfsr &lfsr,
    const std::size_t state_size,
    const std::size_t num_rounds)
{
    const std::size_t field_size = FieldT::mod.num_bits();

    std::vector<std::vector<FieldT>> result(num_rounds);
    for (std::size_t round = 0; round < num_rounds; ++round)
    {
        result[round].reserve(state_size);
        for (std::size_t i = 0; i < state_size; ++i)
        {
            libff::bigint<FieldT::num_limbs> candidate = grain_random_bigint<FieldT>(lfsr, field_size);
            while (mpn_cmp(candidate.data, FieldT::mod.data, FieldT::num_limbs) >= 0)
            {
                candidate = grain_random_bigint<FieldT>(lfsr, field_size);
            }
            result[round].emplace_back(FieldT(candidate));
        }
    }
    return result;
}

template<typename FieldT>
std::vector<std::vector<FieldT>> generate_cauchy_matrix(
    grain_lfsr &lfsr,
    const std::size_t state_size)
{
    const std::size_t field_size = FieldT::mod.num_bits();

    while (true)
    {
        /* matrix entries are reduced, not rejection sampled */
        std::vector<FieldT> samples;
        bool distinct = false;
        while (!distinct)
        {
            samples.clear();
            for (std::size_t i = 0; i < 2 * state_size; ++i)
            {
                libff::bigint<FieldT::num_limbs> value = grain_random_bigint<FieldT>(lfsr, field_size);
                while (mpn_cmp(value.data, FieldT::mod.data, FieldT::num_limbs) >= 0)
                {
                    mpn_sub_n(value.data, value.data, FieldT::mod.data, FieldT::num_limbs);
                }
                samples.emplace_back(FieldT(value));
            }

            distinct = true;
            for (std::size_t i = 0; i < samples.size() && distinct; ++i)
            {
                for (std::size_t j = i + 1; j < samples.size(); ++j)
                {
                    if (samples[i] == samples[j])
                    {
                        distinct = false;
                        break;
                    }
                }
            }
        }

        std::vector<std::vector<FieldT>> matrix(state_size, std::vector<FieldT>(state_size));
        bool invertible_entries = true;
        for (std::size_t i = 0; i < state_size && invertible_entries; ++i)
        {
            for (std::size_t j = 0; j < state_size; ++j)
            {
                const FieldT sum = samples[i] + samples[state_size + j];
                if (sum.is_zero())
                {
                    invertible_entries = false;
                    break;
                }
                matrix[i][j] = sum.inverse();
            }
        }

        if (invertible_entries)
        {
            return matrix;
        }
    }
}

template<typename FieldT>
generated_poseidon_constants<FieldT> generate_poseidon_constants(
    const std::size_t state_size,
    const std::size_t full_rounds,
    const std::size_t partial_rounds)
{
    grain_lfsr lfsr(prime_field_type, power_sbox_type,
                    FieldT::mod.num_bits(), state_size, full_rounds, partial_rounds);

    generated_poseidon_constants<FieldT> result;
    result.state_size_ = state_size;
    result.full_rounds_ = full_rounds;
    result.partial_rounds_ = partial_rounds;
    result.ark_matrix_ = generate_round_constants<FieldT>(lfsr, state_size, full_rounds + partial_rounds);
    result.mds_matrix_ = generate_cauchy_matrix<FieldT>(lfsr, state_size);

    if (matrix_rank(result.mds_matrix_) != state_size)
    {
        throw std::logic_error("generated mixing matrix does not have full rank");
    }
    return result;
}

} // libposeidon
