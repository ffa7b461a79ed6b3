#pragma once

#include <vector>

#include "instances.hpp"
#include "nn_search.hpp"

namespace wknn {

enum class WeightingMode : int {
    LogDistance = 8,
    Gaussian = 16
};

struct WeightConfig {
    WeightingMode mode{WeightingMode::LogDistance};
    double sd{1.0};      // Gaussian spread, only used with WeightingMode::Gaussian
    bool strict{false};  // reject unknown modes instead of the constant-weight fallback
};

// Floor added to the adjusted distance so that a zero distance keeps a finite log weight.
constexpr double LOG_EPSILON = 1e-10;

double gaussian(double mean, double sd, double x);

// sqrt(d*d / numAttributesUsed): the raw distance scaled to a per-attribute mean.
double adjustDistance(double distance, int numAttributesUsed);

// Vote weight for an adjusted distance, before the instance weight is applied.
// Unknown modes weigh every neighbor as if it were at distance 0, unless cfg.strict.
double neighborWeight(double adjusted, const WeightConfig &cfg);

/**
 * Turns a list of nearest neighbors into a class distribution.
 *
 * Nominal classes get a 1/max(1, trainingSetSize) correction in every slot and
 * the result sums to 1. Numeric classes accumulate value * weight in slot 0,
 * which after normalization holds the weighted mean. A non-positive total
 * leaves the distribution unnormalized.
 *
 * Throws DataIntegrityError if a neighbor has no class value.
 */
std::vector<double> buildDistribution(const NeighborSet &neighbors, const WeightConfig &cfg,
                                      int numClasses, AttributeType classType,
                                      int numAttributesUsed, std::size_t trainingSetSize);

}
