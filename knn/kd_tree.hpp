#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "nn_search.hpp"

namespace wknn {

struct KDNode {
    // Internal nodes split on the point at pointIndex; leaves hold up to leafSize points.
    std::size_t pointIndex{0};
    int splitDimension{-1};
    double splitValue{0.0};

    bool isLeaf{false};
    std::vector<std::size_t> leafPoints;

    std::unique_ptr<KDNode> left;
    std::unique_ptr<KDNode> right;
};

// Median-split KD tree over normalized attribute values.
// Training data with missing values is rejected; queries with missing values
// fall back to a linear scan.
class KDTree : public NeighborSearch {
    public:
        static constexpr const char *NAME = "KDTree";
        static constexpr int DEFAULT_LEAF_SIZE = 10;

        KDTree() = default;
        KDTree(const KDTree &other);

        std::string name() const override { return NAME; }
        // -L <leaf size>, -D do not normalize attributes.
        void setOptions(std::vector<std::string> &options);
        std::vector<std::string> getOptions() const override;
        std::unique_ptr<NeighborSearch> clone() const override;

        void setLeafSize(int size);
        int getLeafSize() const { return this->leafSize; }

        void setInstances(const Instances &data) override;
        bool accepts(const Instance &inst) const override { return !inst.hasMissing(); }
        void update(const Instance &inst) override;
        NeighborSet kNearestNeighbours(const Instance &target, int k,
                                       std::size_t exclude = NO_EXCLUSION) const override;

    private:
        std::unique_ptr<KDNode> buildRecursive(std::vector<std::size_t> &pointIndices, int depth) const;
        void searchRecursive(const KDNode *node, const Instance &target, const std::vector<double> &query,
                             int k, std::size_t exclude, NeighborSet &best) const;
        void visitPoint(std::size_t idx, const Instance &target, int k, std::size_t exclude,
                        NeighborSet &best) const;

        int leafSize{DEFAULT_LEAF_SIZE};
        std::vector<const Instance *> points;
        std::vector<std::vector<double>> coords;
        std::unique_ptr<KDNode> root;
};

}
