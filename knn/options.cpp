#include <cmath>

#include <boost/lexical_cast.hpp>

#include "errors.hpp"
#include "nn_search.hpp"
#include "option_utils.hpp"
#include "options.hpp"

namespace wknn {

KnnOptions KnnOptions::parse(std::vector<std::string> options){
    KnnOptions cfg;

    std::string knnString = getOption('K', options);
    if (knnString.length() != 0)
        cfg.k = parseInt(knnString, 'K');

    std::string windowString = getOption('W', options);
    if (windowString.length() != 0)
        cfg.windowSize = parseInt(windowString, 'W');

    if (getFlag('L', options))
        cfg.weighting.mode = WeightingMode::LogDistance;
    else if (getFlag('G', options))
        cfg.weighting.mode = WeightingMode::Gaussian;

    std::string sdString = getOption('S', options);
    if (sdString.length() != 0)
        cfg.weighting.sd = parseDouble(sdString, 'S');

    cfg.crossValidate = getFlag('X', options);
    cfg.meanSquared = getFlag('E', options);

    std::string nnSearchClass = getOption('A', options);
    if (nnSearchClass.length() != 0)
        cfg.search = makeNeighborSearch(nnSearchClass)->specification();

    checkForRemainingOptions(options);
    cfg.validate();
    return cfg;
}

std::vector<std::string> KnnOptions::toOptions() const{
    std::vector<std::string> options;
    options.push_back("-K"); options.push_back(std::to_string(this->k));
    options.push_back("-W"); options.push_back(std::to_string(this->windowSize));
    options.push_back("-S"); options.push_back(boost::lexical_cast<std::string>(this->weighting.sd));
    if (this->crossValidate)
        options.push_back("-X");
    if (this->meanSquared)
        options.push_back("-E");
    if (this->weighting.mode == WeightingMode::Gaussian)
        options.push_back("-G");
    else
        options.push_back("-L");
    options.push_back("-A"); options.push_back(this->search);
    return options;
}

void KnnOptions::validate() const{
    if (this->k < 1)
        throw ConfigurationError("Number of neighbours must be at least 1, got " + std::to_string(this->k));
    if (this->windowSize < 0)
        throw ConfigurationError("Window size must not be negative, got " + std::to_string(this->windowSize));
    if (!std::isfinite(this->weighting.sd) || this->weighting.sd <= 0)
        throw ConfigurationError("Gaussian standard deviation must be positive");
    if (this->weighting.strict && this->weighting.mode != WeightingMode::LogDistance &&
        this->weighting.mode != WeightingMode::Gaussian)
        throw ConfigurationError("Unknown distance weighting mode " +
                                 std::to_string(static_cast<int>(this->weighting.mode)));
    makeNeighborSearch(this->search);
}

bool KnnOptions::operator==(const KnnOptions &other) const{
    return this->k == other.k
        && this->windowSize == other.windowSize
        && this->weighting.mode == other.weighting.mode
        && this->weighting.sd == other.weighting.sd
        && this->weighting.strict == other.weighting.strict
        && this->crossValidate == other.crossValidate
        && this->meanSquared == other.meanSquared
        && this->search == other.search;
}

std::vector<OptionInfo> listOptions(){
    return {
        {"-L", "Weight neighbours by the log of their distance\n(use when k > 1)"},
        {"-G", "Weight neighbours by a gaussian around them\n(use when k > 1)"},
        {"-S <sd>", "Standard deviation for the gaussian.\n(Default = 1.0)"},
        {"-K <number of neighbors>", "Number of nearest neighbours (k) used in classification.\n(Default = 1)"},
        {"-E", "Minimise mean squared error rather than mean absolute\n"
               "error when using -X option with numeric prediction."},
        {"-W <window size>", "Maximum number of training instances maintained.\n"
                             "Training instances are dropped FIFO. (Default = no window)"},
        {"-X", "Select the number of nearest neighbours between 1\n"
               "and the k value specified using hold-one-out evaluation\n"
               "on the training data (use when k > 1)"},
        {"-A <spec>", "The nearest neighbour search algorithm to use\n"
                      "(LinearNNSearch [-S] [-D] or KDTree [-L <leaf size>] [-D]; default: LinearNNSearch)."},
    };
}

}
