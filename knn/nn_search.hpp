#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "distance.hpp"
#include "instances.hpp"

namespace wknn {

struct Neighbor {
    const Instance *instance;
    double distance;
    std::size_t index; // position in the searched training set
};

// Ascending by distance. May hold more than k entries when neighbors tie at the k-th distance.
typedef std::vector<Neighbor> NeighborSet;

constexpr std::size_t NO_EXCLUSION = std::numeric_limits<std::size_t>::max();

class NeighborSearch {
    public:
        virtual ~NeighborSearch() = default;

        virtual std::string name() const = 0;
        virtual std::vector<std::string> getOptions() const = 0;
        virtual std::unique_ptr<NeighborSearch> clone() const = 0;

        // data must outlive the search or be replaced by another setInstances() call.
        virtual void setInstances(const Instances &data);
        // Called after inst was appended to the instances given to setInstances().
        virtual void update(const Instance &inst) = 0;
        // Whether inst can be added to the searched set.
        virtual bool accepts(const Instance &) const { return true; }
        // The training instance at position exclude (hold-one-out) is never returned.
        virtual NeighborSet kNearestNeighbours(const Instance &target, int k,
                                               std::size_t exclude = NO_EXCLUSION) const = 0;

        // "<name> <options>", the form accepted by makeNeighborSearch().
        std::string specification() const;

        const EuclideanDistance &distanceFunction() const { return this->dist; }

    protected:
        // Keeps best sorted and trimmed to k entries plus ties at the k-th distance.
        static void offer(NeighborSet &best, const Neighbor &cand, int k);
        static double kthDistance(const NeighborSet &best, int k);

        const Instances *data{nullptr};
        EuclideanDistance dist;
};

// Keeps the first k neighbors plus any tied with the k-th.
NeighborSet pruneToK(const NeighborSet &neighbors, int k);

// Parses "LinearNNSearch [-S] [-D]" or "KDTree [-L <leaf size>] [-D]".
std::unique_ptr<NeighborSearch> makeNeighborSearch(const std::string &spec);

}
