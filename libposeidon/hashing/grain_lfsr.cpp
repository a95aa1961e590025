#include <stdexcept>

#include "libposeidon/hashing/grain_lfsr.hpp"

namespace libposeidon {

grain_lfsr::grain_lfsr(const grain_field_type field,
                       const grain_sbox_type sbox,
                       const std::size_t field_size,
                       const std::size_t state_size,
                       const std::size_t full_rounds,
                       const std::size_t partial_rounds)
{
    if (field_size >= (1ull << 12) || state_size >= (1ull << 12) ||
        full_rounds >= (1ull << 10) || partial_rounds >= (1ull << 10))
    {
        throw std::invalid_argument("instance description does not fit in the Grain seed");
    }

    std::size_t position = 0;
    this->append_seed_bits(position, (std::size_t)field, 2);
    this->append_seed_bits(position, (std::size_t)sbox, 4);
    this->append_seed_bits(position, field_size, 12);
    this->append_seed_bits(position, state_size, 12);
    this->append_seed_bits(position, full_rounds, 10);
    this->append_seed_bits(position, partial_rounds, 10);
    while (position < state_bits)
    {
        this->register_[position++] = 1;
    }

    for (std::size_t i = 0; i < warmup_clocks; ++i)
    {
        this->clock();
    }
}

void grain_lfsr::append_seed_bits(std::size_t &position,
                                  const std::size_t value,
                                  const std::size_t width)
{
    for (std::size_t i = 0; i < width; ++i)
    {
        this->register_[position++] = (value >> (width - 1 - i)) & 1;
    }
}

bool grain_lfsr::clock()
{
    const auto bit = [this](const std::size_t i) {
        return this->register_[(this->head_ + i) % state_bits];
    };
    const uint8_t new_bit = bit(62) ^ bit(51) ^ bit(38) ^ bit(23) ^ bit(13) ^ bit(0);

    /* drop b_0 and append the new bit as b_79 */
    this->register_[this->head_] = new_bit;
    this->head_ = (this->head_ + 1) % state_bits;

    return new_bit == 1;
}

bool grain_lfsr::next_bit()
{
    bool selector = this->clock();
    while (!selector)
    {
        /* discard the pair and draw another */
        this->clock();
        selector = this->clock();
    }
    return this->clock();
}

std::vector<bool> grain_lfsr::next_bits(const std::size_t num_bits)
{
    std::vector<bool> result;
    result.reserve(num_bits);
    for (std::size_t i = 0; i < num_bits; ++i)
    {
        result.push_back(this->next_bit());
    }
    return result;
}

} // namespace libposeidon
