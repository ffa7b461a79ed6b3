#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "instances.hpp"
#include "nn_search.hpp"
#include "options.hpp"
#include "window.hpp"

namespace wknn {

/**
 * k-nearest-neighbours classifier with log-distance or gaussian vote weighting.
 *
 * Optionally selects k between 1 and the configured value by hold-one-out
 * evaluation on the training data, and keeps at most a window of the most
 * recent training instances. Predictions are const; all model state changes
 * happen in train(), update() and setConfig().
 */
class knn {
    public:
        knn();
        explicit knn(int k);

        void setConfig(const KnnOptions &cfg);
        const KnnOptions &getConfig() const { return this->cfg; }
        void setOptions(const std::vector<std::string> &options);
        std::vector<std::string> getOptions() const { return this->cfg.toOptions(); }

        // Sets the upper k; the used k equals it unless hold-one-out selects a smaller one.
        void setKNN(int k);
        // Number of neighbours actually used for prediction.
        int getKNN() const { return this->kNN; }

        void train(const Instances &data);
        void update(const Instance &inst);

        std::vector<double> distribution(const Instance &inst) const;
        // Index of the most probable class, or the numeric estimate.
        double fit(const Instance &inst) const;

        // Hold-one-out error per k (index k-1) from the last selection; empty when not run.
        const std::vector<double> &crossValidationErrors() const { return this->cvErrors; }

        bool isBuilt() const { return this->built; }
        const Instances &trainingSet() const { return this->window.instances(); }
        int numAttributesUsed() const { return this->attributesUsed; }

        std::string describe() const;

    private:
        void rebuildSearch();
        void crossValidate();
        std::vector<double> zeroR() const;
        std::vector<double> makeDistribution(const NeighborSet &neighbors) const;

        KnnOptions cfg;
        int kNN{1};
        TrainingWindow window;
        std::unique_ptr<NeighborSearch> search;
        std::vector<double> cvErrors;

        bool built{false};
        int numClasses{0};
        AttributeType classType{AttributeType::Nominal};
        int attributesUsed{0};
};

}
