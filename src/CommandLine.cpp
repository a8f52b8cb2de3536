// <CommandLine> -*- C++ -*-


/*!
 * \file CommandLine.cpp
 * \brief Command line option handling for the mdb2sqlite tool
 */

#include "mdb2sqlite/app/CommandLine.hpp"
#include "mdb2sqlite/app/NamedValue.hpp"
#include "mdb2sqlite/log/Destination.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <boost/lexical_cast.hpp>

namespace mdb2sqlite {
namespace app {

CommandLine::CommandLine() :
    general_opts_("General Options"),
    export_opts_("Export Options"),
    log_opts_("Logging Options"),
    hidden_opts_("Positional Options"),
    all_opts_("All Options"),
    visible_opts_("Options")
{
    general_opts_.add_options()
        ("help,h",
         "Show this help message and exit")
        ("config,c",
         named_value<std::string>("FILE"),
         "Read export options from a YAML file. Options given on the command line "
         "override the file.\n"
         "Example: \"--config export.yaml\"")
        ("quiet,q",
         "Do not print the export summary on stdout")
        ;

    export_opts_.add_options()
        ("include-system-tables",
         "Also export the Access system tables (MSys*)")
        ("progress-interval",
         named_value<std::string>("N"),
         "Log an 'info' progress message every N rows of a table. 0 disables progress "
         "messages.\n"
         "Example: \"--progress-interval 50000\"")
        ("date-format",
         named_value<std::string>("FORMAT"),
         "strftime() format used for date/time values.\n"
         "Example: \"--date-format '%Y-%m-%dT%H:%M:%S'\"")
        ;

    log_opts_.add_options()
        ("log,l",
         named_value<std::vector<std::string>>("PATTERN CATEGORY DEST", 3, 3)->multitoken(),
         "Place a log-message tap that watches for messages having the category CATEGORY "
         "from components at or below the dotted location PATTERN (for example \"export\" or "
         "\"export.populate\"). An empty PATTERN or CATEGORY matches everything. Matching "
         "messages are written to the file DEST. DEST may also be '1' to refer to stdout and "
         "'2' to refer to stderr.\n"
         "Example: \"--log export info export.log.basic\"")
        ;

    hidden_opts_.add_options()
        ("source", po::value<std::string>(), "Source .mdb file")
        ("destination", po::value<std::string>(), "Destination SQLite file")
        ;

    positional_.add("source", 1);
    positional_.add("destination", 1);

    all_opts_.add(general_opts_).add(export_opts_).add(log_opts_).add(hidden_opts_);
    visible_opts_.add(general_opts_).add(export_opts_).add(log_opts_);
}

void CommandLine::printUsage(std::ostream & o) const
{
    o << "Usage: mdb2sqlite [options] <source.mdb> <destination.sqlite>\n\n"
      << "Copies every table, index and row of an Access database into a new, "
      << "empty SQLite database.\n\n"
      << visible_opts_ << "\n"
      << "Log destination file extensions:\n";
    log::DestinationManager::dumpFileExtensions(o);
}

bool CommandLine::parse(int argc, const char * const argv[])
{
    po::variables_map vm;
    std::vector<log::TapDescriptor> cmdline_taps;

    try{
        po::parsed_options opts = po::command_line_parser(argc, argv)
            .options(all_opts_)
            .positional(positional_)
            .run();

        // Taps are handled in the order given. Each --log occurrence
        // must be looked at separately, so pull them out before storing.
        for(size_t i = 0; i < opts.options.size(); /*increment conditionally*/){
            auto o = opts.options[i];
            if(o.string_key == "log"){
                if(o.value.size() != 3){
                    std::cerr << "command-line option \"" << o.string_key << "\" had " << o.value.size()
                              << " tokens but requires 3.\nExample:\n   --log export info export.log"
                              << std::endl;
                    printUsage(std::cerr);
                    err_code_ = 1;
                    return false;
                }
                cmdline_taps.emplace_back(o.value[0], o.value[1], o.value[2]);
                opts.options.erase(opts.options.begin() + i);
            }else{
                ++i;
            }
        }

        po::store(opts, vm);
        po::notify(vm);
    }catch(const po::error & ex){
        std::cerr << "Error: " << ex.what() << "\n" << std::endl;
        printUsage(std::cerr);
        err_code_ = 1;
        return false;
    }

    if(vm.count("help")){
        printUsage(std::cout);
        err_code_ = 0;
        return false;
    }

    if(vm.count("source") == 0 || vm.count("destination") == 0){
        std::cerr << "Error: a source and a destination path are both required\n" << std::endl;
        printUsage(std::cerr);
        err_code_ = 1;
        return false;
    }

    source_path_ = vm["source"].as<std::string>();
    dest_path_ = vm["destination"].as<std::string>();
    quiet_ = vm.count("quiet") > 0;

    try{
        // File first, then command line overrides
        if(vm.count("config")){
            config_.loadFile(vm["config"].as<std::string>());
        }

        if(vm.count("include-system-tables")){
            config_.source.include_system_tables = true;
        }
        if(vm.count("date-format")){
            config_.source.date_format = vm["date-format"].as<std::string>();
        }
        if(vm.count("progress-interval")){
            const std::string & n = vm["progress-interval"].as<std::string>();
            try{
                if(!n.empty() && n[0] == '-'){
                    throw boost::bad_lexical_cast();
                }
                config_.progress_interval = boost::lexical_cast<uint64_t>(n);
            }catch(const boost::bad_lexical_cast &){
                throw ConfigError("--progress-interval expects a non-negative integer, got '")
                    << n << "'";
            }
        }
    }catch(const ConfigError & ex){
        std::cerr << "Error: " << ex.what() << std::endl;
        err_code_ = 1;
        return false;
    }

    config_.taps.insert(config_.taps.end(), cmdline_taps.begin(), cmdline_taps.end());

    return true;
}

} // namespace app
} // namespace mdb2sqlite
