#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "errors.hpp"
#include "instances.hpp"

namespace fs = std::filesystem;

namespace wknn {

int Attribute::indexOfLabel(const std::string &label) const{
    auto it = std::find(this->labels.begin(), this->labels.end(), label);
    if (it == this->labels.end())
        return -1;
    return static_cast<int>(it - this->labels.begin());
}

int Attribute::addLabel(const std::string &label){
    int idx = this->indexOfLabel(label);
    if (idx >= 0)
        return idx;
    this->labels.push_back(label);
    return static_cast<int>(this->labels.size()) - 1;
}

Instance::Instance(std::vector<double> features, double classValue, double weight)
    : vals(std::move(features)), cls(classValue), w(weight) {}

double Instance::missingValue(){
    return std::numeric_limits<double>::quiet_NaN();
}

bool Instance::isMissingValue(double v){
    return std::isnan(v);
}

bool Instance::isMissing(std::size_t i) const{
    return isMissingValue(this->vals[i]);
}

bool Instance::hasMissing() const{
    return std::any_of(this->vals.begin(), this->vals.end(), isMissingValue);
}

bool Instance::classIsMissing() const{
    return isMissingValue(this->cls);
}

Instances::Instances(std::vector<Attribute> features, Attribute classAttribute)
    : attrs(std::move(features)), classAttr(std::move(classAttribute)) {}

int Instances::numClasses() const{
    if (this->classIsNominal())
        return static_cast<int>(this->classAttr.labels.size());
    return 1;
}

void Instances::add(const Instance &inst){
    if (inst.numValues() != this->attrs.size())
        throw DataIntegrityError("Instance has " + std::to_string(inst.numValues()) +
                                 " values, header has " + std::to_string(this->attrs.size()) + " attributes");
    this->rows.push_back(inst);
}

void Instances::deleteOldest(std::size_t count){
    count = std::min(count, this->rows.size());
    this->rows.erase(this->rows.begin(), this->rows.begin() + count);
}

std::size_t Instances::deleteWithMissingClass(){
    auto firstMissing = std::remove_if(this->rows.begin(), this->rows.end(),
        [](const Instance &inst){ return inst.classIsMissing(); });
    std::size_t removed = this->rows.end() - firstMissing;
    this->rows.erase(firstMissing, this->rows.end());
    return removed;
}

Instances Instances::headerCopy() const{
    return Instances{this->attrs, this->classAttr};
}

bool Instances::sameHeader(const Instances &other) const{
    if (this->attrs.size() != other.attrs.size()) return false;
    if (this->classAttr.type != other.classAttr.type) return false;
    if (this->classIsNominal() && this->classAttr.labels != other.classAttr.labels) return false;
    return true;
}

namespace {

std::vector<std::string> splitFields(const std::string &ln){
    std::vector<std::string> spl;
    boost::split(spl, ln, boost::is_any_of(";,"));
    for (auto &field : spl)
        boost::trim(field);
    return spl;
}

bool isMissingField(const std::string &field){
    return field.empty() || field == "?";
}

std::string where(const fs::path &csvPath, int lineNo){
    return csvPath.string() + ":" + std::to_string(lineNo);
}

double parseNumber(const std::string &field, const fs::path &csvPath, int lineNo){
    try {
        return boost::lexical_cast<double>(field);
    } catch (const boost::bad_lexical_cast &){
        throw DataIntegrityError(where(csvPath, lineNo) + ": '" + field + "' is not a number");
    }
}

std::size_t resolveClassColumn(int classIndex, std::size_t numColumns){
    if (classIndex < 0)
        return numColumns - 1;
    if (static_cast<std::size_t>(classIndex) >= numColumns)
        throw ConfigurationError("Class index " + std::to_string(classIndex) +
                                 " out of range for " + std::to_string(numColumns) + " columns");
    return static_cast<std::size_t>(classIndex);
}

void readRows(Instances &data, std::ifstream &csvStream, const fs::path &csvPath,
              std::size_t classCol, bool allowNewLabels){
    const std::size_t numColumns = data.numAttributes() + 1;
    std::string ln;
    int lineNo{1};
    while (std::getline(csvStream, ln)){
        lineNo++;
        boost::trim(ln);
        if (ln.empty()) continue;

        std::vector<std::string> spl = splitFields(ln);
        if (spl.size() != numColumns)
            throw DataIntegrityError(where(csvPath, lineNo) + ": expected " + std::to_string(numColumns) +
                                     " fields, found " + std::to_string(spl.size()));

        std::vector<double> features;
        features.reserve(numColumns - 1);
        for (std::size_t it{0}; it < spl.size(); ++it){
            if (it == classCol) continue;
            features.push_back(isMissingField(spl[it]) ? Instance::missingValue()
                                                       : parseNumber(spl[it], csvPath, lineNo));
        }

        double cls = Instance::missingValue();
        const std::string &clsField = spl[classCol];
        if (!isMissingField(clsField)){
            if (!data.classIsNominal()){
                cls = parseNumber(clsField, csvPath, lineNo);
            } else if (allowNewLabels){
                cls = data.classAttribute().addLabel(clsField);
            } else {
                int idx = data.classAttribute().indexOfLabel(clsField);
                if (idx < 0)
                    throw DataIntegrityError(where(csvPath, lineNo) + ": unknown class label '" + clsField + "'");
                cls = idx;
            }
        }
        data.add(Instance{std::move(features), cls});
    }
}

std::vector<std::string> readHeader(std::ifstream &csvStream, const fs::path &csvPath){
    std::string ln;
    if (!std::getline(csvStream, ln))
        throw DataIntegrityError(csvPath.string() + ": missing header row");
    boost::trim(ln);
    std::vector<std::string> names = splitFields(ln);
    if (names.size() < 2)
        throw DataIntegrityError(csvPath.string() + ": need at least one feature and a class column");
    return names;
}

std::ifstream openCsv(const fs::path &csvPath){
    std::ifstream csvStream{csvPath};
    if (!csvStream)
        throw DataIntegrityError("Cannot open " + csvPath.string());
    return csvStream;
}

}

Instances loadCsv(const fs::path &csvPath, const CsvOptions &opts){
    std::ifstream csvStream = openCsv(csvPath);
    std::vector<std::string> names = readHeader(csvStream, csvPath);
    std::size_t classCol = resolveClassColumn(opts.classIndex, names.size());

    std::vector<Attribute> features;
    Attribute classAttr;
    for (std::size_t it{0}; it < names.size(); ++it){
        if (it == classCol){
            classAttr.name = names[it];
            classAttr.type = opts.numericClass ? AttributeType::Numeric : AttributeType::Nominal;
        } else {
            features.push_back(Attribute{names[it], AttributeType::Numeric, {}});
        }
    }

    Instances data{std::move(features), std::move(classAttr)};
    readRows(data, csvStream, csvPath, classCol, true);
    return data;
}

void appendCsv(Instances &data, const fs::path &csvPath, const CsvOptions &opts){
    std::ifstream csvStream = openCsv(csvPath);
    std::vector<std::string> names = readHeader(csvStream, csvPath);
    if (names.size() != data.numAttributes() + 1)
        throw DataIntegrityError(csvPath.string() + ": header has " + std::to_string(names.size()) +
                                 " columns, expected " + std::to_string(data.numAttributes() + 1));
    std::size_t classCol = resolveClassColumn(opts.classIndex, names.size());
    readRows(data, csvStream, csvPath, classCol, false);
}

}
