#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/commitment/guessing_game.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"

namespace libposeidon {

bn254_Fr guessing_game_commit(const uint16_t guess,
                              const bn254_Fr &address,
                              const bn254_Fr &randomness)
{
    init_bn254_params();
    return bn254_poseidon_hash_three(bn254_Fr(guess), address, randomness);
}

bn254_Fr guessing_game_commit(const uint16_t guess,
                              const std::string &address,
                              const std::string &randomness)
{
    init_bn254_params();
    const bn254_Fr address_element = field_from_hex_string<bn254_Fr>(address);
    const bn254_Fr randomness_element = field_from_hex_string<bn254_Fr>(randomness);

    return guessing_game_commit(guess, address_element, randomness_element);
}

} // namespace libposeidon
