#include <algorithm>
#include <cmath>

#include <opencv2/core.hpp>

#include "distance.hpp"

namespace wknn {

void EuclideanDistance::setInstances(const Instances &data){
    const std::size_t cols = data.numAttributes();
    this->mins.assign(cols, Instance::missingValue());
    this->maxs.assign(cols, Instance::missingValue());
    if (data.empty() || cols == 0) return;

    cv::Mat samples(static_cast<int>(data.numInstances()), static_cast<int>(cols), CV_64FC1);
    int row{0};
    for (const auto &inst : data){
        for (std::size_t j{0}; j < cols; ++j)
            samples.at<double>(row, static_cast<int>(j)) = inst.value(j);
        row++;
    }

    for (std::size_t j{0}; j < cols; ++j){
        cv::Mat col = samples.col(static_cast<int>(j)).clone();
        cv::Mat present;
        cv::compare(col, col, present, cv::CMP_EQ); // NaN compares unequal to itself
        if (cv::countNonZero(present) == 0) continue;

        double mn, mx;
        cv::minMaxIdx(col, &mn, &mx, nullptr, nullptr, present);
        this->mins[j] = mn;
        this->maxs[j] = mx;
    }
}

void EuclideanDistance::updateRanges(const Instance &inst){
    if (this->mins.size() != inst.numValues()){
        this->mins.assign(inst.numValues(), Instance::missingValue());
        this->maxs.assign(inst.numValues(), Instance::missingValue());
    }
    for (std::size_t j{0}; j < inst.numValues(); ++j){
        if (inst.isMissing(j)) continue;
        double v = inst.value(j);
        if (Instance::isMissingValue(this->mins[j])){
            this->mins[j] = v;
            this->maxs[j] = v;
        } else {
            this->mins[j] = std::min(this->mins[j], v);
            this->maxs[j] = std::max(this->maxs[j], v);
        }
    }
}

double EuclideanDistance::norm(std::size_t attr, double v) const{
    if (this->dontNorm)
        return v;
    if (attr >= this->mins.size() || Instance::isMissingValue(this->mins[attr]))
        return 0.0;
    double width = this->maxs[attr] - this->mins[attr];
    if (width == 0.0)
        return 0.0;
    return (v - this->mins[attr]) / width;
}

double EuclideanDistance::difference(std::size_t attr, double v1, double v2) const{
    bool miss1 = Instance::isMissingValue(v1);
    bool miss2 = Instance::isMissingValue(v2);
    if (miss1 && miss2)
        return 1.0;
    if (miss1 || miss2){
        double diff = this->norm(attr, miss1 ? v2 : v1);
        if (diff < 0.5)
            diff = 1.0 - diff;
        return diff;
    }
    return this->norm(attr, v1) - this->norm(attr, v2);
}

double EuclideanDistance::distance(const Instance &a, const Instance &b) const{
    double dst = 0.0;
    std::size_t sz = std::min(a.numValues(), b.numValues());
    for (std::size_t i{0}; i < sz; ++i){
        double sub = this->difference(i, a.value(i), b.value(i));
        dst += sub*sub;
    }
    return std::sqrt(dst);
}

std::vector<double> EuclideanDistance::normalized(const Instance &inst) const{
    std::vector<double> out(inst.numValues());
    for (std::size_t i{0}; i < inst.numValues(); ++i)
        out[i] = this->norm(i, inst.value(i));
    return out;
}

}
