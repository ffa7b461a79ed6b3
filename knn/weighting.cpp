#include <algorithm>
#include <cmath>
#include <string>

#include <boost/math/constants/constants.hpp>

#include "errors.hpp"
#include "weighting.hpp"

namespace wknn {

double gaussian(double mean, double sd, double x){
    return std::exp(-((x-mean)*(x-mean))/(2*sd*sd)) /
           std::sqrt(boost::math::double_constants::two_pi*sd*sd);
}

double adjustDistance(double distance, int numAttributesUsed){
    double squared = distance*distance;
    return std::sqrt(squared/numAttributesUsed);
}

double neighborWeight(double adjusted, const WeightConfig &cfg){
    switch (cfg.mode){
        case WeightingMode::LogDistance:
            return -std::log(adjusted + LOG_EPSILON);
        case WeightingMode::Gaussian:
            return gaussian(0.0, cfg.sd, adjusted);
    }
    if (cfg.strict)
        throw ConfigurationError("Unknown distance weighting mode " +
                                 std::to_string(static_cast<int>(cfg.mode)));
    return -std::log(LOG_EPSILON);
}

std::vector<double> buildDistribution(const NeighborSet &neighbors, const WeightConfig &cfg,
                                      int numClasses, AttributeType classType,
                                      int numAttributesUsed, std::size_t trainingSetSize){
    if (numAttributesUsed <= 0)
        throw DataIntegrityError("No attributes available to normalize distances");

    double total = 0;
    std::vector<double> distribution(std::max(numClasses, 1), 0.0);

    // Laplace correction to the estimator
    if (classType == AttributeType::Nominal){
        double denom = static_cast<double>(std::max<std::size_t>(1, trainingSetSize));
        std::fill(distribution.begin(), distribution.end(), 1.0 / denom);
        total = numClasses / denom;
    }

    for (const auto &neighbor : neighbors){
        const Instance &current = *neighbor.instance;
        double weight = neighborWeight(adjustDistance(neighbor.distance, numAttributesUsed), cfg);
        weight *= current.weight();

        if (current.classIsMissing())
            throw DataIntegrityError("Data has no class attribute!");

        if (classType == AttributeType::Nominal){
            int cls = static_cast<int>(current.classValue());
            if (cls < 0 || cls >= numClasses)
                throw DataIntegrityError("Class value " + std::to_string(cls) + " outside of " +
                                         std::to_string(numClasses) + " classes");
            distribution[cls] += weight;
        } else {
            distribution[0] += current.classValue() * weight;
        }
        total += weight;
    }

    if (total > 0){
        for (auto &d : distribution)
            d /= total;
    }
    return distribution;
}

}
