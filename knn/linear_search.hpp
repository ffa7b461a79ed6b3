#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nn_search.hpp"

namespace wknn {

// Brute force search over every training instance.
class LinearNNSearch : public NeighborSearch {
    public:
        static constexpr const char *NAME = "LinearNNSearch";

        std::string name() const override { return NAME; }
        // -S skip identical instances, -D do not normalize attributes.
        void setOptions(std::vector<std::string> &options);
        std::vector<std::string> getOptions() const override;
        std::unique_ptr<NeighborSearch> clone() const override;

        void setSkipIdentical(bool skip) { this->skipIdentical = skip; }
        bool getSkipIdentical() const { return this->skipIdentical; }

        void update(const Instance &inst) override;
        NeighborSet kNearestNeighbours(const Instance &target, int k,
                                       std::size_t exclude = NO_EXCLUSION) const override;

    private:
        bool skipIdentical{false};
};

}
