#pragma once

#include <string>
#include <vector>

#include "weighting.hpp"

namespace wknn {

struct OptionInfo {
    std::string synopsis;
    std::string description;
};

struct KnnOptions {
    int k{1};
    int windowSize{0}; // 0 = unbounded
    WeightConfig weighting;
    bool crossValidate{false};
    bool meanSquared{false};
    std::string search{"LinearNNSearch"}; // canonical "<name> <options>"

    /**
     * Parses a flat option list: -K <n> -W <n> -L|-G -S <sd> -X -E -A <spec>.
     * Nothing is applied on failure; leftover tokens are a ConfigurationError.
     */
    static KnnOptions parse(std::vector<std::string> options);
    // Always -K -W -S -A, one of -L/-G, and -X/-E when enabled.
    std::vector<std::string> toOptions() const;

    // Throws ConfigurationError for out-of-range values or an unknown search strategy.
    void validate() const;

    bool operator==(const KnnOptions &other) const;
    bool operator!=(const KnnOptions &other) const { return !(*this == other); }
};

std::vector<OptionInfo> listOptions();

}
