// <ExportConfig> -*- C++ -*-

#include "mdb2sqlite/app/ExportConfig.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <type_traits>

namespace mdb2sqlite {

namespace {

//! "In file config.yaml:3 col:5" style location of a node
std::string markToString(const std::string & origin, const YAML::Mark & mark)
{
    std::stringstream ss;
    ss << "In file " << origin << ":" << mark.line + 1
       << " col:" << mark.column + 1;
    return ss.str();
}

//! Read a scalar of type T, throwing ConfigError with the
//! location of the node if it is not convertible
template <typename T>
T readScalar(const std::string & origin, const std::string & key, const YAML::Node & node)
{
    if (!node.IsScalar()) {
        throw ConfigError("Configuration key '") << key << "' must be a scalar. "
            << markToString(origin, node.Mark());
    }
    if (std::is_unsigned<T>::value && !node.Scalar().empty() && node.Scalar()[0] == '-') {
        throw ConfigError("Configuration key '") << key << "' must not be negative. "
            << markToString(origin, node.Mark());
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception &) {
        throw ConfigError("Configuration key '") << key << "' has an invalid value '"
            << node.Scalar() << "'. " << markToString(origin, node.Mark());
    }
}

//! Throws unless 'node' is a map whose keys are all in 'known_keys'
void requireMapWithKeys(const std::string & origin,
                        const std::string & section,
                        const YAML::Node & node,
                        const std::vector<std::string> & known_keys)
{
    if (!node.IsMap()) {
        throw ConfigError("Configuration section '") << section << "' must be a map. "
            << markToString(origin, node.Mark());
    }
    for (const auto & kv : node) {
        const std::string key = kv.first.as<std::string>();
        bool known = false;
        for (const auto & k : known_keys) {
            known |= (k == key);
        }
        if (!known) {
            throw ConfigError("Unknown configuration key '") << section
                << (section.empty() ? "" : ".") << key << "'. "
                << markToString(origin, kv.first.Mark());
        }
    }
}

void applyYaml(ExportConfig & config, const std::string & origin, const YAML::Node & root)
{
    if (root.IsNull()) {
        //Empty file
        return;
    }

    requireMapWithKeys(origin, "", root, {"source", "export", "logging"});

    if (const YAML::Node source = root["source"]) {
        requireMapWithKeys(origin, "source", source, {"include_system_tables", "date_format"});

        if (const YAML::Node n = source["include_system_tables"]) {
            config.source.include_system_tables =
                readScalar<bool>(origin, "source.include_system_tables", n);
        }
        if (const YAML::Node n = source["date_format"]) {
            config.source.date_format = readScalar<std::string>(origin, "source.date_format", n);
        }
    }

    if (const YAML::Node exp = root["export"]) {
        requireMapWithKeys(origin, "export", exp, {"progress_interval"});

        if (const YAML::Node n = exp["progress_interval"]) {
            config.progress_interval = readScalar<uint64_t>(origin, "export.progress_interval", n);
        }
    }

    if (const YAML::Node logging = root["logging"]) {
        if (!logging.IsSequence()) {
            throw ConfigError("Configuration section 'logging' must be a list. ")
                << markToString(origin, logging.Mark());
        }
        for (const auto & tap : logging) {
            requireMapWithKeys(origin, "logging", tap, {"pattern", "category", "destination"});

            if (!tap["destination"]) {
                throw ConfigError("Every logging entry needs a 'destination'. ")
                    << markToString(origin, tap.Mark());
            }

            std::string pattern, category;
            if (const YAML::Node n = tap["pattern"]) {
                pattern = readScalar<std::string>(origin, "logging.pattern", n);
            }
            if (const YAML::Node n = tap["category"]) {
                category = readScalar<std::string>(origin, "logging.category", n);
            }
            const std::string dest = readScalar<std::string>(origin, "logging.destination",
                                                             tap["destination"]);
            config.taps.emplace_back(pattern, category, dest);
        }
    }
}

} // namespace

void ExportConfig::loadFile(const std::string & yaml_file)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_file);
    } catch (const YAML::BadFile &) {
        throw ConfigError("Unable to read configuration file '") << yaml_file << "'";
    } catch (const YAML::ParserException & ex) {
        throw ConfigError("Unable to parse configuration file '") << yaml_file
            << "': " << ex.what();
    }
    applyYaml(*this, yaml_file, root);
}

void ExportConfig::loadString(const std::string & yaml_content, const std::string & origin)
{
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::ParserException & ex) {
        throw ConfigError("Unable to parse configuration ") << origin << ": " << ex.what();
    }
    applyYaml(*this, origin, root);
}

void ExportConfig::dump(std::ostream & o) const
{
    o << "source.include_system_tables: " << std::boolalpha
      << source.include_system_tables << "\n";
    o << "source.date_format: \"" << source.date_format << "\"\n";
    o << "export.progress_interval: " << progress_interval << "\n";
    for (const auto & tap : taps) {
        o << "logging: " << tap.stringize() << "\n";
    }
}

} // namespace mdb2sqlite
