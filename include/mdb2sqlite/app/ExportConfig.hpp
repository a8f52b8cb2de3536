// <ExportConfig> -*- C++ -*-

#pragma once

#include "mdb2sqlite/source/SourceReader.hpp"
#include "mdb2sqlite/log/Tap.hpp"

#include <cstdint>
#include <iostream>
#include <string>

namespace mdb2sqlite {

//! Default number of rows between two progress messages
static constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 10000;

/*!
 * \brief Everything that can be configured about an export.
 * None of it changes how tables are translated or copied.
 *
 * Can be read from a YAML file:
 *
 * \code
 *   source:
 *     include_system_tables: false
 *     date_format: "%Y-%m-%d %H:%M:%S"
 *   export:
 *     progress_interval: 10000
 *   logging:
 *     - { pattern: "", category: "warning", destination: "2" }
 *     - { pattern: "export", category: "info", destination: "export.log.basic" }
 * \endcode
 */
struct ExportConfig {
    SourceOptions source;

    //! Log progress every N rows of a table (0 disables)
    uint64_t progress_interval = DEFAULT_PROGRESS_INTERVAL;

    //! Logging taps to install for the export
    log::TapDescVec taps;

    //! Update this configuration from a YAML file.
    //! \throw ConfigError if the file cannot be read, has an unknown
    //! key, or a value of the wrong type.
    void loadFile(const std::string & yaml_file);

    //! Same as loadFile() for YAML content already in memory
    void loadString(const std::string & yaml_content,
                    const std::string & origin = "<string>");

    //! Print the configuration
    void dump(std::ostream & o) const;
};

} // namespace mdb2sqlite
