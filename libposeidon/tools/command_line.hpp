/**@file
 *****************************************************************************
 Command-line handling shared by the libposeidon programs.
 *****************************************************************************
 * @author     This file is part of libposeidon (see AUTHORS)
 * @copyright  MIT license (see LICENSE file)
 *****************************************************************************/
#ifndef LIBPOSEIDON_TOOLS_COMMAND_LINE_HPP_
#define LIBPOSEIDON_TOOLS_COMMAND_LINE_HPP_

#include <boost/program_options.hpp>

namespace libposeidon {

enum command_line_status {
    command_line_parsed = 0,
    command_line_help = 1,
    command_line_error = 2
};

/** The "Usage" group with --help and --verbose; programs add their own
 *  options to it. */
boost::program_options::options_description gen_base_options(bool &verbose);

/** Parses argv into the variables bound by desc. Prints desc on --help, and
 *  the error followed by desc on stderr for unknown, missing or malformed
 *  options. */
command_line_status process_command_line(const int argc,
                                         const char** argv,
                                         const boost::program_options::options_description &desc);

/** Exit status of a program that stops after processing its command line. */
int command_line_exit_status(const command_line_status status);

} // namespace libposeidon

#endif // LIBPOSEIDON_TOOLS_COMMAND_LINE_HPP_
