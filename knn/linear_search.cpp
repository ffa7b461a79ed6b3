#include "errors.hpp"
#include "linear_search.hpp"
#include "option_utils.hpp"

namespace wknn {

void LinearNNSearch::setOptions(std::vector<std::string> &options){
    this->skipIdentical = getFlag('S', options);
    this->dist.setDontNormalize(getFlag('D', options));
}

std::vector<std::string> LinearNNSearch::getOptions() const{
    std::vector<std::string> options;
    if (this->skipIdentical)
        options.push_back("-S");
    if (this->dist.getDontNormalize())
        options.push_back("-D");
    return options;
}

std::unique_ptr<NeighborSearch> LinearNNSearch::clone() const{
    return std::make_unique<LinearNNSearch>(*this);
}

void LinearNNSearch::update(const Instance &inst){
    this->dist.updateRanges(inst);
}

NeighborSet LinearNNSearch::kNearestNeighbours(const Instance &target, int k, std::size_t exclude) const{
    if (this->data == nullptr)
        throw DataIntegrityError("No training instances set for the neighbour search");

    NeighborSet best;
    if (k < 1) return best;

    std::size_t i{0};
    for (const auto &candidate : *this->data){
        std::size_t idx = i++;
        if (idx == exclude) continue;

        double curDist = this->dist.distance(target, candidate);
        if (this->skipIdentical && curDist == 0.0) continue;
        offer(best, Neighbor{&candidate, curDist, idx}, k);
    }
    return best;
}

}
