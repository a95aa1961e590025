#include <cctype>
#include <cstring>
#include <memory>

#include <gmp.h>
#include <sodium/utils.h>
#include <libff/algebra/field_utils/bigint.hpp>

namespace libposeidon {

template<typename FieldT>
FieldT field_from_bytes(const std::vector<uint8_t> &bytes)
{
    /* Horner's rule in the field reduces as it goes, so the input length is unbounded */
    const FieldT radix = FieldT(256l);
    FieldT result = FieldT::zero();
    for (const uint8_t byte : bytes)
    {
        result = result * radix + FieldT((long)byte);
    }
    return result;
}

template<typename FieldT>
std::vector<uint8_t> field_to_bytes(const FieldT &element)
{
    const libff::bigint<FieldT::num_limbs> value = element.as_bigint();
    const std::size_t bytes_per_limb = sizeof(mp_limb_t);
    std::vector<uint8_t> result(FieldT::num_limbs * bytes_per_limb, 0);

    /* limbs are stored least significant first */
    for (std::size_t i = 0; i < result.size(); ++i)
    {
        const mp_limb_t limb = value.data[i / bytes_per_limb];
        result[result.size() - 1 - i] = (uint8_t)((limb >> (8 * (i % bytes_per_limb))) & 0xFF);
    }
    return result;
}

template<typename FieldT>
FieldT field_from_hex_string(const std::string &str)
{
    std::string digits = str;
    if (digits.compare(0, 2, "0x") == 0)
    {
        digits = digits.substr(2);
    }

    if (digits.empty())
    {
        throw field_parse_error("empty hexadecimal string: \"" + str + "\"");
    }
    for (const char c : digits)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            throw field_parse_error("not a hexadecimal string: \"" + str + "\"");
        }
    }

    /* sodium_hex2bin only decodes whole bytes */
    if (digits.size() % 2 == 1)
    {
        digits.insert(0, 1, '0');
    }

    std::vector<uint8_t> bytes(digits.size() / 2);
    std::size_t bytes_written = 0;
    const int status = sodium_hex2bin(bytes.data(), bytes.size(),
                                      digits.c_str(), digits.size(),
                                      NULL, &bytes_written, NULL);
    if (status != 0 || bytes_written != bytes.size())
    {
        throw field_parse_error("not a hexadecimal string: \"" + str + "\"");
    }

    return field_from_bytes<FieldT>(bytes);
}

template<typename FieldT>
std::string field_to_hex_string(const FieldT &element)
{
    const std::vector<uint8_t> bytes = field_to_bytes<FieldT>(element);

    /* sodium_bin2hex writes a terminating nul */
    std::vector<char> hex(2 * bytes.size() + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

    const std::string digits(hex.data());
    const std::size_t first_nonzero = digits.find_first_not_of('0');
    if (first_nonzero == std::string::npos)
    {
        return "0x0";
    }
    return "0x" + digits.substr(first_nonzero);
}

template<typename FieldT>
FieldT field_from_decimal_string(const std::string &str)
{
    if (str.empty())
    {
        throw field_parse_error("empty decimal string");
    }

    const FieldT ten = FieldT(10l);
    FieldT result = FieldT::zero();
    for (const char c : str)
    {
        if (c < '0' || c > '9')
        {
            throw field_parse_error("not a decimal string: \"" + str + "\"");
        }
        result = result * ten + FieldT((long)(c - '0'));
    }
    return result;
}

template<typename FieldT>
std::string field_to_decimal_string(const FieldT &element)
{
    const libff::bigint<FieldT::num_limbs> value = element.as_bigint();

    mpz_t z;
    mpz_init(z);
    value.to_mpz(z);

    /* mpz_sizeinbase may overestimate by one; +2 covers the nul */
    std::unique_ptr<char[]> buffer(new char[mpz_sizeinbase(z, 10) + 2]);
    mpz_get_str(buffer.get(), 10, z);
    mpz_clear(z);

    return std::string(buffer.get());
}

} // libposeidon
