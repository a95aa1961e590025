#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>
#include <libff/common/profiling.hpp>

#include "libposeidon/algebra/field_encoding.hpp"
#include "libposeidon/commitment/guessing_game.hpp"
#include "libposeidon/hashing/bn254_params.hpp"
#include "libposeidon/tools/command_line.hpp"

namespace po = boost::program_options;
using namespace libposeidon;

struct options {
    uint32_t guess = 0;
    std::string address;
    std::string randomness;
    bool verbose = false;
};

po::options_description gen_options(options &options)
{
    po::options_description base = gen_base_options(options.verbose);

    base.add_options()
        ("guess", po::value<uint32_t>(&options.guess)->required(), "the guessed number, between 0 and 65535")
        ("rand", po::value<std::string>(&options.randomness)->required(), "blinding randomness, in hexadecimal")
        ("address", po::value<std::string>(&options.address)->required(), "address of the player, in hexadecimal");

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
    if (options.guess > 0xFFFF)
    {
        std::cerr << "Error: guess must be between 0 and 65535\n";
        return 1;
    }

    libff::inhibit_profiling_info = !options.verbose;
    libff::start_profiling();

    bn254_Fr commitment;
    try
    {
        commitment = guessing_game_commit(static_cast<uint16_t>(options.guess),
                                          options.address,
                                          options.randomness);
    }
    catch (const field_parse_error &e)
    {
        printf("Failed to parse the inputs: %s\n", e.what());
        return 1;
    }

    if (options.verbose)
    {
        bn254_poseidon_params(4)->print();
    }

    printf("guess: %u\n", options.guess);
    printf("address: %s\n", options.address.c_str());
    printf("rand: %s\n", options.randomness.c_str());
    printf("commitment: %s\n", field_to_hex_string(commitment).c_str());

    return 0;
}
