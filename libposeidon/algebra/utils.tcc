#include <gmp.h>
#include <libff/algebra/field_utils/bigint.hpp>

namespace libposeidon {

template<typename FieldT>
std::vector<FieldT> random_vector(const std::size_t count)
{
    std::vector<FieldT> result;
    result.reserve(count);

    for (std::size_t i = 0; i < count; ++i)
    {
        result.emplace_back(FieldT::random_element());
    }

    return result;
}

template<typename FieldT>
bool all_canonical(const std::vector<FieldT> &elements)
{
    for (auto &el : elements)
    {
        /* as_bigint() reduces on the way out, so look at the stored
           Montgomery representative, which is kept below the modulus */
        if (mpn_cmp(el.mont_repr.data, FieldT::mod.data, FieldT::num_limbs) >= 0)
        {
            return false;
        }
    }
    return true;
}

} // libposeidon
