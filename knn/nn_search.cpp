#include <algorithm>

#include "errors.hpp"
#include "kd_tree.hpp"
#include "linear_search.hpp"
#include "nn_search.hpp"
#include "option_utils.hpp"

namespace wknn {

void NeighborSearch::setInstances(const Instances &data){
    this->data = &data;
    this->dist.setInstances(data);
}

std::string NeighborSearch::specification() const{
    std::string opts = joinOptions(this->getOptions());
    if (opts.empty())
        return this->name();
    return this->name() + " " + opts;
}

void NeighborSearch::offer(NeighborSet &best, const Neighbor &cand, int k){
    if (static_cast<int>(best.size()) >= k && cand.distance > best[k-1].distance)
        return;

    auto farther = [](double d, const Neighbor &n){ return d < n.distance; };
    best.insert(std::upper_bound(best.begin(), best.end(), cand.distance, farther), cand);

    if (static_cast<int>(best.size()) > k){
        double kth = best[k-1].distance;
        best.erase(std::upper_bound(best.begin() + k, best.end(), kth, farther), best.end());
    }
}

double NeighborSearch::kthDistance(const NeighborSet &best, int k){
    if (static_cast<int>(best.size()) < k)
        return std::numeric_limits<double>::infinity();
    return best[k-1].distance;
}

NeighborSet pruneToK(const NeighborSet &neighbors, int k){
    if (k < 1) k = 1;
    if (static_cast<int>(neighbors.size()) <= k)
        return neighbors;

    std::size_t keep = k;
    while (keep < neighbors.size() && neighbors[keep].distance == neighbors[keep-1].distance)
        keep++;
    return NeighborSet(neighbors.begin(), neighbors.begin() + keep);
}

std::unique_ptr<NeighborSearch> makeNeighborSearch(const std::string &spec){
    std::vector<std::string> tokens = splitOptions(spec);
    if (tokens.empty())
        throw ConfigurationError("Invalid NearestNeighbourSearch algorithm specification string.");

    std::string className = tokens[0];
    tokens[0].clear();

    std::unique_ptr<NeighborSearch> search;
    if (className == LinearNNSearch::NAME){
        auto linear = std::make_unique<LinearNNSearch>();
        linear->setOptions(tokens);
        search = std::move(linear);
    } else if (className == KDTree::NAME){
        auto tree = std::make_unique<KDTree>();
        tree->setOptions(tokens);
        search = std::move(tree);
    } else {
        throw ConfigurationError("Unknown nearest neighbour search algorithm: " + className);
    }
    checkForRemainingOptions(tokens);
    return search;
}

}
