/**@file
 *****************************************************************************
 Conversions between prime field elements and their byte, hexadecimal and
 decimal encodings.

 Every decoder accepts integers of any size and reduces them modulo the field
 characteristic; only malformed text is an error.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_ALGEBRA_FIELD_ENCODING_HPP_
#define LIBPOSEIDON_ALGEBRA_FIELD_ENCODING_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace libposeidon {

/** Raised when a textual field element is empty or contains characters
 *  outside its alphabet. */
class field_parse_error : public std::invalid_argument
{
    public:
    explicit field_parse_error(const std::string &what_arg) :
        std::invalid_argument(what_arg) {}
};

/** Big endian, any length. */
template<typename FieldT>
FieldT field_from_bytes(const std::vector<uint8_t> &bytes);

/** Big endian canonical representative, one byte per 8 bits of limb storage
 *  (32 bytes for BN254). */
template<typename FieldT>
std::vector<uint8_t> field_to_bytes(const FieldT &element);

/** Hexadecimal digits of either case, with an optional "0x" prefix. */
template<typename FieldT>
FieldT field_from_hex_string(const std::string &str);

/** "0x" followed by lowercase digits without leading zeros, "0x0" for zero. */
template<typename FieldT>
std::string field_to_hex_string(const FieldT &element);

template<typename FieldT>
FieldT field_from_decimal_string(const std::string &str);

template<typename FieldT>
std::string field_to_decimal_string(const FieldT &element);

} // namespace libposeidon

#include "libposeidon/algebra/field_encoding.tcc"

#endif // LIBPOSEIDON_ALGEBRA_FIELD_ENCODING_HPP_
