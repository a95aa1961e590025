#include <cstdio>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <libff/common/profiling.hpp>

#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/hashing/bn254_poseidon.hpp"
#include "libposeidon/tools/command_line.hpp"

namespace po = boost::program_options;
using namespace libposeidon;

struct options {
    std::string a;
    std::string b;
    bool verbose = false;
};

po::options_description gen_options(options &options)
{
    po::options_description base = gen_base_options(options.verbose);

    base.add_options()
        ("a", po::value<std::string>(&options.a)->required(), "first input, in decimal")
        ("b", po::value<std::string>(&options.b)->required(), "second input, in decimal");

    return base;
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

    bn254_Fr input_a, input_b;
    try
    {
        input_a = field_from_decimal_string<bn254_Fr>(options.a);
        input_b = field_from_decimal_string<bn254_Fr>(options.b);
    }
    catch (const field_parse_error &e)
    {
        printf("Failed to parse the inputs: %s\n", e.what());
        return 1;
    }

    if (options.verbose)
    {
        bn254_poseidon_params(3)->print();
    }

    const bn254_Fr hash = bn254_poseidon_hash_two(input_a, input_b);

    printf("input_a: %s\n", field_to_decimal_string(input_a).c_str());
    printf("input_b: %s\n", field_to_decimal_string(input_b).c_str());
    printf("hash: %s\n", field_to_decimal_string(hash).c_str());

    return 0;
}
