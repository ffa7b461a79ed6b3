#include <algorithm>
#include <cmath>
#include <numeric>

#include "errors.hpp"
#include "kd_tree.hpp"
#include "option_utils.hpp"

namespace wknn {

KDTree::KDTree(const KDTree &other)
    : NeighborSearch(other), leafSize(other.leafSize) {
    // The copy is rebuilt on its own setInstances() call.
    this->data = nullptr;
}

void KDTree::setOptions(std::vector<std::string> &options){
    std::string leafString = getOption('L', options);
    if (leafString.length() != 0)
        this->setLeafSize(parseInt(leafString, 'L'));
    else
        this->setLeafSize(DEFAULT_LEAF_SIZE);
    this->dist.setDontNormalize(getFlag('D', options));
}

std::vector<std::string> KDTree::getOptions() const{
    std::vector<std::string> options{"-L", std::to_string(this->leafSize)};
    if (this->dist.getDontNormalize())
        options.push_back("-D");
    return options;
}

std::unique_ptr<NeighborSearch> KDTree::clone() const{
    return std::make_unique<KDTree>(*this);
}

void KDTree::setLeafSize(int size){
    if (size < 1)
        throw ConfigurationError("KDTree leaf size must be positive");
    this->leafSize = size;
}

void KDTree::setInstances(const Instances &data){
    for (const auto &inst : data){
        if (!this->accepts(inst))
            throw DataIntegrityError("KDTree does not support missing attribute values, use LinearNNSearch");
    }

    EuclideanDistance newDist = this->dist;
    newDist.setInstances(data);
    std::vector<const Instance *> newPoints;
    std::vector<std::vector<double>> newCoords;
    for (const auto &inst : data){
        newPoints.push_back(&inst);
        newCoords.push_back(newDist.normalized(inst));
    }

    this->data = &data;
    this->dist = newDist;
    this->points.swap(newPoints);
    this->coords.swap(newCoords);
    this->root.reset();
    if (this->points.empty() || data.numAttributes() == 0)
        return;

    std::vector<std::size_t> pointIndices(this->points.size());
    std::iota(pointIndices.begin(), pointIndices.end(), 0);
    this->root = this->buildRecursive(pointIndices, 0);
}

void KDTree::update(const Instance &){
    // Ranges and splits both depend on the full set, so rebuild.
    this->setInstances(*this->data);
}

std::unique_ptr<KDNode> KDTree::buildRecursive(std::vector<std::size_t> &pointIndices, int depth) const{
    if (pointIndices.empty())
        return nullptr;

    auto node = std::make_unique<KDNode>();
    if (static_cast<int>(pointIndices.size()) <= this->leafSize){
        node->isLeaf = true;
        node->leafPoints = pointIndices;
        return node;
    }

    int numDimensions = static_cast<int>(this->coords[0].size());
    int axis = depth % numDimensions;

    std::size_t median = pointIndices.size() / 2;
    std::nth_element(pointIndices.begin(), pointIndices.begin() + median, pointIndices.end(),
        [&](std::size_t a, std::size_t b){ return this->coords[a][axis] < this->coords[b][axis]; });

    node->pointIndex = pointIndices[median];
    node->splitDimension = axis;
    node->splitValue = this->coords[node->pointIndex][axis];

    std::vector<std::size_t> leftIndices(pointIndices.begin(), pointIndices.begin() + median);
    std::vector<std::size_t> rightIndices(pointIndices.begin() + median + 1, pointIndices.end());
    node->left = this->buildRecursive(leftIndices, depth + 1);
    node->right = this->buildRecursive(rightIndices, depth + 1);
    return node;
}

void KDTree::visitPoint(std::size_t idx, const Instance &target, int k, std::size_t exclude,
                        NeighborSet &best) const{
    if (idx == exclude) return;
    offer(best, Neighbor{this->points[idx], this->dist.distance(target, *this->points[idx]), idx}, k);
}

void KDTree::searchRecursive(const KDNode *node, const Instance &target, const std::vector<double> &query,
                             int k, std::size_t exclude, NeighborSet &best) const{
    if (node == nullptr) return;

    if (node->isLeaf){
        for (std::size_t idx : node->leafPoints)
            this->visitPoint(idx, target, k, exclude, best);
        return;
    }

    double diff = query[node->splitDimension] - node->splitValue;
    const KDNode *nearSide = diff < 0 ? node->left.get() : node->right.get();
    const KDNode *farSide = diff < 0 ? node->right.get() : node->left.get();

    this->searchRecursive(nearSide, target, query, k, exclude, best);
    this->visitPoint(node->pointIndex, target, k, exclude, best);
    // Points tied with the k-th neighbor are kept, so the boundary itself is still searched.
    if (std::fabs(diff) <= kthDistance(best, k))
        this->searchRecursive(farSide, target, query, k, exclude, best);
}

NeighborSet KDTree::kNearestNeighbours(const Instance &target, int k, std::size_t exclude) const{
    if (this->data == nullptr)
        throw DataIntegrityError("No training instances set for the neighbour search");

    NeighborSet best;
    if (k < 1) return best;

    if (target.hasMissing() || !this->root){
        for (std::size_t idx{0}; idx < this->points.size(); ++idx)
            this->visitPoint(idx, target, k, exclude, best);
        return best;
    }

    this->searchRecursive(this->root.get(), target, this->dist.normalized(target), k, exclude, best);
    return best;
}

}
