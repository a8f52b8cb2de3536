// <CommandLine> -*- C++ -*-

#pragma once

#include "mdb2sqlite/app/ExportConfig.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace mdb2sqlite {
namespace app {

/*!
 * \brief Command line interpreter for the mdb2sqlite tool:
 *
 *   mdb2sqlite [options] <source.mdb> <destination.sqlite>
 *
 * Options from a --config file are applied first, then any
 * option given on the command line overrides them.
 */
class CommandLine
{
public:

    CommandLine();

    /*!
     * \brief Parse the command line.
     * \return true if the export should run, false if the program
     * should exit with the code in getErrorCode() (after --help,
     * or after a usage error has been reported).
     */
    bool parse(int argc, const char * const argv[]);

    //! Exit code to return when parse() returned false
    int getErrorCode() const {
        return err_code_;
    }

    const std::string & getSourcePath() const {
        return source_path_;
    }

    const std::string & getDestinationPath() const {
        return dest_path_;
    }

    //! Configuration after applying the --config file and
    //! command line overrides
    const ExportConfig & getConfig() const {
        return config_;
    }

    //! Was --quiet given (no summary on stdout)?
    bool isQuiet() const {
        return quiet_;
    }

    //! Print usage text
    void printUsage(std::ostream & o) const;

private:

    po::options_description general_opts_;
    po::options_description export_opts_;
    po::options_description log_opts_;
    po::options_description hidden_opts_;
    po::options_description all_opts_;
    po::options_description visible_opts_;
    po::positional_options_description positional_;

    ExportConfig config_;
    std::string source_path_;
    std::string dest_path_;
    bool quiet_ = false;
    int err_code_ = 0;
};

} // namespace app
} // namespace mdb2sqlite
