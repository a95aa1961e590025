#include <memory>

#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"

namespace libposeidon {

namespace {

std::vector<std::shared_ptr<const poseidon_params<bn254_Fr>>> all_bn254_params()
{
    std::vector<std::shared_ptr<const poseidon_params<bn254_Fr>>> result;
    for (const std::size_t state_size : bn254_supported_state_sizes())
    {
        result.emplace_back(bn254_poseidon_params(state_size));
    }
    return result;
}

} // namespace

const poseidon_hash<bn254_Fr> &bn254_poseidon()
{
    static const poseidon_hash<bn254_Fr> instance(all_bn254_params());
    return instance;
}

bn254_Fr bn254_poseidon_hash_two(const bn254_Fr &a, const bn254_Fr &b)
{
    return bn254_poseidon().hash_two(a, b);
}

bn254_Fr bn254_poseidon_hash_three(const bn254_Fr &a, const bn254_Fr &b, const bn254_Fr &c)
{
    return bn254_poseidon().hash_three(a, b, c);
}

bn254_Fr bn254_poseidon_hash(const std::vector<bn254_Fr> &inputs)
{
    return bn254_poseidon().hash(inputs);
}

bn254_Fr bn254_poseidon_hash_chain(const std::vector<bn254_Fr> &inputs)
{
    return bn254_poseidon().hash_chain(inputs);
}

two_to_one_hash_function<bn254_Fr> bn254_poseidon_two_to_one_hash()
{
    return bn254_poseidon().two_to_one_hash();
}

} // namespace libposeidon
