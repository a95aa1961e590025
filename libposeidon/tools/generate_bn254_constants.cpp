#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <libff/common/profiling.hpp>

#include "libposeidon/algebra/bn254_field.hpp"
#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/hashing/parameter_generation.hpp"
#include "libposeidon/tools/command_line.hpp"

namespace po = boost::program_options;
using namespace libposeidon;

struct options {
    std::string output;
    bool verbose = false;
};

struct instance {
    std::size_t state_size;
    std::size_t full_rounds;
    std::size_t partial_rounds;
};

/* Round numbers of circomlib's Poseidon for 2 and 3 inputs */
const std::vector<instance> bn254_instances = {
    { 3, 8, 57 },
    { 4, 8, 56 },
};

const std::size_t bn254_alpha = 5;

po::options_description gen_options(options &options)
{
    po::options_description base = gen_base_options(options.verbose);

    base.add_options()
        ("output", po::value<std::string>(&options.output)->required(), "C++ source file to write");

    return base;
}

void write_table(std::ostream &out,
                 const std::string &name,
                 const std::vector<std::vector<bn254_Fr>> &rows)
{
    out << "const char *const " << name << "[] = {\n";
    for (auto &row : rows)
    {
        for (auto &element : row)
        {
            out << "    \"" << field_to_hex_string(element) << "\",\n";
        }
    }
    out << "};\n\n";
}

void write_constants(std::ostream &out,
                     const std::vector<generated_poseidon_constants<bn254_Fr>> &constants)
{
    out << "/* Generated by generate_bn254_constants. Do not edit. */\n\n";
    out << "#include \"libposeidon/hashing/bn254_constants.hpp\"\n\n";
    out << "namespace libposeidon {\n\n";
    out << "namespace {\n\n";

    for (auto &c : constants)
    {
        const std::string prefix = "bn254_t" + std::to_string(c.state_size_);
        write_table(out, prefix + "_round_constants", c.ark_matrix_);
        write_table(out, prefix + "_mds_matrix", c.mds_matrix_);
    }

    out << "} // namespace\n\n";
    out << "const poseidon_constants_table bn254_poseidon_constant_tables[] = {\n";
    for (auto &c : constants)
    {
        const std::string prefix = "bn254_t" + std::to_string(c.state_size_);
        const std::size_t num_round_constants = c.ark_matrix_.size() * c.state_size_;
        out << "    { " << c.state_size_ << ", " << c.full_rounds_ << ", " << c.partial_rounds_
            << ", " << bn254_alpha << ",\n"
            << "      " << prefix << "_round_constants, " << num_round_constants << ",\n"
            << "      " << prefix << "_mds_matrix, " << c.state_size_ * c.state_size_ << " },\n";
    }
    out << "};\n\n";
    out << "const std::size_t bn254_poseidon_num_constant_tables = " << constants.size() << ";\n\n";
    out << "} // namespace libposeidon\n";
}

int main(int argc, const char * argv[])
{
    options options;
    const command_line_status status = process_command_line(argc, argv, gen_options(options));
    if (status != command_line_parsed)
    {
        return command_line_exit_status(status);
    }

    libff::inhibit_profiling_info = !options.verbose;
    libff::start_profiling();
    init_bn254_params();

    std::vector<generated_poseidon_constants<bn254_Fr>> constants;
    for (auto &inst : bn254_instances)
    {
        libff::enter_block("Generate constants for state size " + std::to_string(inst.state_size));
        constants.emplace_back(generate_poseidon_constants<bn254_Fr>(
            inst.state_size, inst.full_rounds, inst.partial_rounds));
        libff::leave_block("Generate constants for state size " + std::to_string(inst.state_size));
    }

    std::ofstream out(options.output);
    if (!out)
    {
        std::cerr << "Error: cannot open " << options.output << " for writing\n";
        return 1;
    }
    write_constants(out, constants);
    out.close();
    if (!out)
    {
        std::cerr << "Error: failed to write " << options.output << "\n";
        return 1;
    }

    return 0;
}
