#include <mutex>

#include "libposeidon/algebra/bn254_field.hpp"

namespace libposeidon {

void init_bn254_params()
{
    static std::once_flag initialized;
    std::call_once(initialized, libff::alt_bn128_pp::init_public_params);
}

} // namespace libposeidon
