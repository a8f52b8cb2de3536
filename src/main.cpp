// <main.cpp> -*- C++ -*-


#include <iostream>
#include <memory>
#include <vector>

#include "mdb2sqlite/app/CommandLine.hpp"
#include "mdb2sqlite/migrate/Exporter.hpp"
#include "mdb2sqlite/log/Tap.hpp"
#include "mdb2sqlite/Errors.hpp"

int main(int argc, char **argv)
{
    mdb2sqlite::app::CommandLine cmdline;

    // Parse command line options and the --config file
    if(!cmdline.parse(argc, argv)){
        return cmdline.getErrorCode(); // Any errors already printed to cerr
    }

    const mdb2sqlite::ExportConfig & config = cmdline.getConfig();

    // Warnings go to stderr unless the user set up their own taps
    std::vector<std::unique_ptr<mdb2sqlite::log::Tap>> taps;
    try{
        if(config.taps.empty()){
            taps.emplace_back(new mdb2sqlite::log::Tap("", mdb2sqlite::log::categories::WARN_STR, std::cerr));
        }
        for(const auto & td : config.taps){
            taps.emplace_back(td.createTap());
        }
    }catch(const mdb2sqlite::ExportException & ex){
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    mdb2sqlite::Exporter exporter(config);
    try{
        exporter.run(cmdline.getSourcePath(), cmdline.getDestinationPath());
    }catch(const mdb2sqlite::ExportException & ex){
        std::cerr << "Error: " << ex.what() << std::endl;
        std::cerr << exporter.getSummary();
        return 2;
    }

    if(!cmdline.isQuiet()){
        std::cout << exporter.getSummary();
    }
    return 0;
}
