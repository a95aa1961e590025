#include <stdexcept>
#include <string>

namespace libposeidon {

template<typename FieldT>
poseidon_hash<FieldT>::poseidon_hash(
    const std::vector<std::shared_ptr<const poseidon_params<FieldT>>> &params)
{
    for (auto &p : params)
    {
        if (!p)
        {
            throw std::invalid_argument("poseidon_hash needs parameters");
        }
        if (p->capacity_ != 1)
        {
            throw std::invalid_argument("poseidon_hash only supports a capacity of one element");
        }
        const bool inserted = this->permutations_.emplace(
            p->state_size_, poseidon_permutation<FieldT>(p)).second;
        if (!inserted)
        {
            throw std::invalid_argument("two parameter sets for state size " +
                                        std::to_string(p->state_size_));
        }
    }
}

template<typename FieldT>
bool poseidon_hash<FieldT>::supports_arity(const std::size_t arity) const
{
    return this->permutations_.find(arity + 1) != this->permutations_.end();
}

template<typename FieldT>
std::vector<std::size_t> poseidon_hash<FieldT>::supported_arities() const
{
    std::vector<std::size_t> result;
    for (auto &entry : this->permutations_)
    {
        result.emplace_back(entry.first - 1);
    }
    return result;
}

template<typename FieldT>
const poseidon_permutation<FieldT> &poseidon_hash<FieldT>::permutation_for_arity(
    const std::size_t arity) const
{
    const auto it = this->permutations_.find(arity + 1);
    if (it == this->permutations_.end())
    {
        throw std::invalid_argument("no Poseidon parameters for hashing " +
                                    std::to_string(arity) + " elements");
    }
    return it->second;
}

template<typename FieldT>
FieldT poseidon_hash<FieldT>::hash(const std::vector<FieldT> &inputs) const
{
    const poseidon_permutation<FieldT> &permutation = this->permutation_for_arity(inputs.size());

    std::vector<FieldT> state;
    state.reserve(inputs.size() + 1);
    /* capacity */
    state.emplace_back(FieldT::zero());
    state.insert(state.end(), inputs.begin(), inputs.end());

    return permutation.permute(state)[0];
}

template<typename FieldT>
FieldT poseidon_hash<FieldT>::hash_two(const FieldT &a, const FieldT &b) const
{
    return this->hash(std::vector<FieldT>({a, b}));
}

template<typename FieldT>
FieldT poseidon_hash<FieldT>::hash_three(const FieldT &a, const FieldT &b, const FieldT &c) const
{
    return this->hash(std::vector<FieldT>({a, b, c}));
}

template<typename FieldT>
FieldT poseidon_hash<FieldT>::hash_chain(const std::vector<FieldT> &inputs) const
{
    /* checked up front so an empty chain still needs the two-input instance */
    this->permutation_for_arity(2);

    FieldT digest = FieldT::zero();
    for (auto &input : inputs)
    {
        digest = this->hash_two(digest, input);
    }
    return digest;
}

template<typename FieldT>
two_to_one_hash_function<FieldT> poseidon_hash<FieldT>::two_to_one_hash() const
{
    /* the hasher must outlive the returned function */
    return [this](const FieldT &left, const FieldT &right) {
        return this->hash_two(left, right);
    };
}

} // libposeidon
