#include <map>
#include <stdexcept>
#include <string>

#include <libff/common/profiling.hpp>

#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/hashing/bn254_params.hpp"

namespace libposeidon {

namespace {

typedef std::map<std::size_t, std::shared_ptr<const poseidon_params<bn254_Fr>>> bn254_params_registry;

std::vector<std::vector<bn254_Fr>> parse_rows(const char *const *entries,
                                              const std::size_t num_rows,
                                              const std::size_t row_length)
{
    std::vector<std::vector<bn254_Fr>> result(num_rows);
    for (std::size_t row = 0; row < num_rows; ++row)
    {
        result[row].reserve(row_length);
        for (std::size_t col = 0; col < row_length; ++col)
        {
            result[row].emplace_back(
                field_from_hex_string<bn254_Fr>(entries[row * row_length + col]));
        }
    }
    return result;
}

bn254_params_registry build_registry()
{
    init_bn254_params();

    libff::enter_block("Load BN254 Poseidon parameters");
    bn254_params_registry registry;
    for (std::size_t i = 0; i < bn254_poseidon_num_constant_tables; ++i)
    {
        const poseidon_constants_table &table = bn254_poseidon_constant_tables[i];
        registry[table.state_size] = bn254_params_from_table(table);
    }
    libff::leave_block("Load BN254 Poseidon parameters");

    return registry;
}

const bn254_params_registry &registry()
{
    static const bn254_params_registry instance = build_registry();
    return instance;
}

} // namespace

std::shared_ptr<const poseidon_params<bn254_Fr>> bn254_params_from_table(
    const poseidon_constants_table &table)
{
    init_bn254_params();

    const std::size_t t = table.state_size;
    const std::size_t num_rounds = table.full_rounds + table.partial_rounds;
    if (table.num_round_constants != num_rounds * t)
    {
        throw std::invalid_argument("constant table for state size " + std::to_string(t) +
                                    " has " + std::to_string(table.num_round_constants) +
                                    " round constants, expected " + std::to_string(num_rounds * t));
    }
    if (table.num_mds_entries != t * t)
    {
        throw std::invalid_argument("constant table for state size " + std::to_string(t) +
                                    " has a mixing matrix of " + std::to_string(table.num_mds_entries) +
                                    " entries, expected " + std::to_string(t * t));
    }

    const std::vector<std::vector<bn254_Fr>> ark_matrix = parse_rows(table.round_constants, num_rounds, t);
    const std::vector<std::vector<bn254_Fr>> mds_matrix = parse_rows(table.mds_matrix, t, t);

    /* one capacity element, the rest is rate */
    return std::make_shared<const poseidon_params<bn254_Fr>>(
        table.full_rounds, table.partial_rounds, table.alpha, t - 1, ark_matrix, mds_matrix);
}

std::shared_ptr<const poseidon_params<bn254_Fr>> bn254_poseidon_params(const std::size_t state_size)
{
    const auto it = registry().find(state_size);
    if (it == registry().end())
    {
        throw std::invalid_argument("no BN254 Poseidon parameters for state size " +
                                    std::to_string(state_size));
    }
    return it->second;
}

std::vector<std::size_t> bn254_supported_state_sizes()
{
    std::vector<std::size_t> result;
    for (auto &entry : registry())
    {
        result.emplace_back(entry.first);
    }
    return result;
}

} // namespace libposeidon
