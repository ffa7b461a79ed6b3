#pragma once

#include <cstddef>
#include <vector>

#include "instances.hpp"

namespace wknn {

// Euclidean distance over range-normalized attributes.
class EuclideanDistance {
    public:
        explicit EuclideanDistance(bool dontNormalize = false) : dontNorm(dontNormalize) {}

        void setDontNormalize(bool dontNormalize) { this->dontNorm = dontNormalize; }
        bool getDontNormalize() const { return this->dontNorm; }

        // Recomputes the per-attribute ranges from scratch.
        void setInstances(const Instances &data);
        // Widens the ranges to cover inst.
        void updateRanges(const Instance &inst);

        double distance(const Instance &a, const Instance &b) const;
        // Attribute values scaled into [0,1] by the training ranges (unscaled with -D).
        std::vector<double> normalized(const Instance &inst) const;
        double norm(std::size_t attr, double v) const;

    private:
        double difference(std::size_t attr, double v1, double v2) const;

        bool dontNorm;
        std::vector<double> mins;
        std::vector<double> maxs;
};

}
