#include <iostream>

#include "libposeidon/tools/command_line.hpp"

namespace po = boost::program_options;

namespace libposeidon {

po::options_description gen_base_options(bool &verbose)
{
    po::options_description base("Usage");

    base.add_options()
        ("help", "print this help message")
        ("verbose", po::bool_switch(&verbose), "report parameters and timings");

    return base;
}

command_line_status process_command_line(const int argc,
                                         const char** argv,
                                         const po::options_description &desc)
{
    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return command_line_help;
        }

        po::notify(vm);
    }
    catch(po::error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << desc << "\n";
        return command_line_error;
    }

    return command_line_parsed;
}

int command_line_exit_status(const command_line_status status)
{
    return status == command_line_error ? 1 : 0;
}

} // namespace libposeidon
