#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "knn.hpp"
#include "weighting.hpp"

namespace wknn {

knn::knn() : search(makeNeighborSearch(cfg.search)) {}

knn::knn(int k) : knn() {
    this->setKNN(k);
}

void knn::setConfig(const KnnOptions &newCfg){
    newCfg.validate();
    std::unique_ptr<NeighborSearch> newSearch = makeNeighborSearch(newCfg.search);

    if (this->built){
        // Build against a trial window first so a failure leaves the model untouched.
        TrainingWindow trial{this->window};
        trial.setCapacity(newCfg.windowSize);
        newSearch->setInstances(trial.instances());
        this->window = std::move(trial);
        newSearch->setInstances(this->window.instances());
    } else {
        this->window.setCapacity(newCfg.windowSize);
    }

    this->cfg = newCfg;
    this->cfg.search = newSearch->specification();
    this->search = std::move(newSearch);
    this->kNN = this->cfg.k;
    this->cvErrors.clear();

    if (this->built && this->cfg.crossValidate)
        this->crossValidate();
}

void knn::setOptions(const std::vector<std::string> &options){
    KnnOptions parsed = KnnOptions::parse(options);
    parsed.weighting.strict = this->cfg.weighting.strict;
    this->setConfig(parsed);
}

void knn::setKNN(int k){
    KnnOptions newCfg = this->cfg;
    newCfg.k = k;
    this->setConfig(newCfg);
}

void knn::train(const Instances &data){
    if (data.numAttributes() == 0)
        throw DataIntegrityError("Training data has no attributes besides the class");

    // Build against a trial window first so a rejected training set leaves the model untouched.
    TrainingWindow trial{this->window.capacity()};
    trial.assign(data);
    std::unique_ptr<NeighborSearch> newSearch = this->search->clone();
    newSearch->setInstances(trial.instances());

    this->classType = data.classAttribute().type;
    this->numClasses = data.numClasses();
    this->attributesUsed = static_cast<int>(data.numAttributes());

    this->window = std::move(trial);
    this->search = std::move(newSearch);
    this->rebuildSearch();
    this->built = true;

    this->kNN = this->cfg.k;
    this->cvErrors.clear();
    if (this->cfg.crossValidate)
        this->crossValidate();
}

void knn::update(const Instance &inst){
    if (!this->built)
        throw std::logic_error("IBk: No model built yet.");
    if (inst.classIsMissing())
        return;
    if (this->classType == AttributeType::Nominal &&
        (inst.classValue() < 0 || inst.classValue() >= this->numClasses))
        throw DataIntegrityError("Class value " + std::to_string(inst.classValue()) +
                                 " outside of " + std::to_string(this->numClasses) + " classes");

    if (!this->search->accepts(inst))
        throw DataIntegrityError(this->search->name() + " cannot hold an instance with missing attribute values");

    std::size_t evicted = this->window.add(inst);
    if (evicted > 0)
        this->rebuildSearch();
    else
        this->search->update(inst);

    this->kNN = this->cfg.k;
    if (this->cfg.crossValidate)
        this->crossValidate();
}

void knn::rebuildSearch(){
    this->search->setInstances(this->window.instances());
}

std::vector<double> knn::zeroR() const{
    if (this->classType == AttributeType::Numeric)
        return std::vector<double>{0.0};
    int n = std::max(1, this->numClasses);
    return std::vector<double>(n, 1.0 / n);
}

std::vector<double> knn::makeDistribution(const NeighborSet &neighbors) const{
    return buildDistribution(neighbors, this->cfg.weighting, this->numClasses, this->classType,
                             this->attributesUsed, this->window.currentSize());
}

std::vector<double> knn::distribution(const Instance &inst) const{
    if (!this->built)
        throw std::logic_error("IBk: No model built yet.");
    if (inst.numValues() != static_cast<std::size_t>(this->attributesUsed))
        throw DataIntegrityError("Instance has " + std::to_string(inst.numValues()) +
                                 " values, model was trained on " + std::to_string(this->attributesUsed));
    if (this->window.currentSize() == 0)
        return this->zeroR();

    NeighborSet neighbours = this->search->kNearestNeighbours(inst, this->kNN);
    return this->makeDistribution(neighbours);
}

double knn::fit(const Instance &inst) const{
    std::vector<double> dist = this->distribution(inst);
    if (this->classType == AttributeType::Numeric)
        return dist[0];
    return static_cast<double>(std::max_element(dist.begin(), dist.end()) - dist.begin());
}

void knn::crossValidate(){
    const Instances &train = this->window.instances();
    const int kUpper = this->cfg.k;
    std::vector<double> performanceStats(kUpper, 0.0);
    std::vector<double> performanceStatsSq(kUpper, 0.0);

    for (std::size_t i{0}; i < train.numInstances(); ++i){
        const Instance &instance = train.instance(i);
        NeighborSet neighbours = this->search->kNearestNeighbours(instance, kUpper, i);

        for (int j = kUpper - 1; j >= 0; j--){
            std::vector<double> dist = this->makeDistribution(neighbours);
            if (this->classType == AttributeType::Numeric){
                double err = dist[0] - instance.classValue();
                performanceStatsSq[j] += err * err;
                performanceStats[j] += std::fabs(err);
            } else {
                double thisPrediction = std::max_element(dist.begin(), dist.end()) - dist.begin();
                if (thisPrediction != instance.classValue())
                    performanceStats[j]++;
            }
            if (j >= 1)
                neighbours = pruneToK(neighbours, j);
        }
    }

    const std::vector<double> &searchStats =
        (this->classType == AttributeType::Numeric && this->cfg.meanSquared) ? performanceStatsSq
                                                                             : performanceStats;
    int bestK = 1;
    double bestPerformance = searchStats[0];
    for (int i = 1; i < kUpper; i++){
        if (searchStats[i] < bestPerformance){
            bestPerformance = searchStats[i];
            bestK = i + 1;
        }
    }
    this->kNN = bestK;
    this->cvErrors = searchStats;
}

namespace {

// Spreads print with a decimal point, "1.0" rather than "1".
std::string formatSpread(double sd){
    std::ostringstream out;
    out << sd;
    std::string text = out.str();
    if (text.find_first_of(".en") == std::string::npos)
        text += ".0";
    return text;
}

}

std::string knn::describe() const{
    if (!this->built)
        return "IBk: No model built yet.";
    if (this->window.currentSize() == 0)
        return "Warning: no training instances - ZeroR model used.";

    std::ostringstream result;
    result << "IB1 instance-based classifier\n"
           << "using " << this->kNN;

    switch (this->cfg.weighting.mode){
        case WeightingMode::LogDistance:
            result << " log-distance-weighted";
            break;
        case WeightingMode::Gaussian:
            result << " gaussian-distance-weighted (Mean:0, SD:" << formatSpread(this->cfg.weighting.sd) << ")";
            break;
    }
    result << " nearest neighbor(s) for classification\n";

    if (this->cfg.windowSize != 0)
        result << "using a maximum of " << this->cfg.windowSize << " (windowed) training instances\n";
    return result.str();
}

}
