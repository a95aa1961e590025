/**@file
 *****************************************************************************
 The Grain LFSR used by the Poseidon reference generator to derive round
 constants and mixing matrices.

 The 80-bit register is seeded from the instance description (field type,
 S-box type, field size, state size and round numbers), clocked 160 times,
 and then produces output through self-shrinking: bits are drawn in pairs and
 the second bit of a pair is kept only when the first one is 1.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_HASHING_GRAIN_LFSR_HPP_
#define LIBPOSEIDON_HASHING_GRAIN_LFSR_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace libposeidon {

enum grain_field_type {
    binary_field_type = 0,
    prime_field_type = 1
};

enum grain_sbox_type {
    power_sbox_type = 0,
    inverse_sbox_type = 1
};

class grain_lfsr
{
    public:
    static const std::size_t state_bits = 80;
    static const std::size_t warmup_clocks = 160;

    grain_lfsr(const grain_field_type field,
               const grain_sbox_type sbox,
               const std::size_t field_size,
               const std::size_t state_size,
               const std::size_t full_rounds,
               const std::size_t partial_rounds);

    bool next_bit();
    /** Most significant bit first. */
    std::vector<bool> next_bits(const std::size_t num_bits);

    protected:
    std::array<uint8_t, state_bits> register_;
    /* register_[(head_ + i) % state_bits] is bit b_i of the reference description */
    std::size_t head_ = 0;

    void append_seed_bits(std::size_t &position, const std::size_t value, const std::size_t width);
    bool clock();
};

} // namespace libposeidon

#endif // LIBPOSEIDON_HASHING_GRAIN_LFSR_HPP_
