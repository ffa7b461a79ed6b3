#include <locale>
#include <string>
#include <vector>

#include <boost/property_tree/exceptions.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "config_file.hpp"
#include "errors.hpp"
#include "option_utils.hpp"

namespace pt = boost::property_tree;

namespace wknn {

void saveConfig(const std::filesystem::path &xmlPath, const KnnOptions &cfg){
    pt::ptree tree;
    tree.put("wknn.options", joinOptions(cfg.toOptions()));
    tree.put("wknn.strict", cfg.weighting.strict);
    try {
        pt::write_xml(xmlPath.string(), tree, std::locale(),
                      pt::xml_writer_make_settings<std::string>(' ', 2));
    } catch (const pt::ptree_error &exc){
        throw ConfigurationError("Cannot write " + xmlPath.string() + ": " + exc.what());
    }
}

KnnOptions loadConfig(const std::filesystem::path &xmlPath){
    pt::ptree tree;
    std::string options;
    bool strict{false};
    try {
        read_xml(xmlPath.string(), tree);
        options = tree.get<std::string>("wknn.options");
        strict = tree.get<bool>("wknn.strict", false);
    } catch (const pt::ptree_error &exc){
        throw ConfigurationError("Cannot read " + xmlPath.string() + ": " + exc.what());
    }

    KnnOptions cfg = KnnOptions::parse(splitOptions(options));
    cfg.weighting.strict = strict;
    return cfg;
}

}
