#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <string>
#include <vector>

namespace wknn {

enum class AttributeType { Numeric, Nominal };

struct Attribute {
    std::string name;
    AttributeType type{AttributeType::Numeric};
    std::vector<std::string> labels; // nominal only

    int indexOfLabel(const std::string &label) const;
    int addLabel(const std::string &label);
};

// A training or query row. Feature values exclude the class; NaN marks a missing value.
class Instance {
    public:
        Instance() = default;
        Instance(std::vector<double> features, double classValue, double weight = 1.0);

        static double missingValue();
        static bool isMissingValue(double v);

        std::size_t numValues() const { return this->vals.size(); }
        double value(std::size_t i) const { return this->vals[i]; }
        const std::vector<double> &values() const { return this->vals; }
        bool isMissing(std::size_t i) const;
        bool hasMissing() const;

        double classValue() const { return this->cls; }
        void setClassValue(double v) { this->cls = v; }
        bool classIsMissing() const;

        double weight() const { return this->w; }
        void setWeight(double weight) { this->w = weight; }

    private:
        std::vector<double> vals;
        double cls{missingValue()};
        double w{1.0};
};

class Instances {
    public:
        Instances() = default;
        Instances(std::vector<Attribute> features, Attribute classAttribute);

        std::size_t numAttributes() const { return this->attrs.size(); }
        const Attribute &attribute(std::size_t i) const { return this->attrs[i]; }
        const Attribute &classAttribute() const { return this->classAttr; }
        Attribute &classAttribute() { return this->classAttr; }
        bool classIsNominal() const { return this->classAttr.type == AttributeType::Nominal; }
        int numClasses() const;

        std::size_t numInstances() const { return this->rows.size(); }
        bool empty() const { return this->rows.empty(); }
        const Instance &instance(std::size_t i) const { return this->rows[i]; }

        void add(const Instance &inst);
        void deleteOldest(std::size_t count = 1);
        std::size_t deleteWithMissingClass();

        // Same header, no rows.
        Instances headerCopy() const;
        bool sameHeader(const Instances &other) const;

        std::deque<Instance>::const_iterator begin() const { return this->rows.begin(); }
        std::deque<Instance>::const_iterator end() const { return this->rows.end(); }

    private:
        std::vector<Attribute> attrs;
        Attribute classAttr;
        std::deque<Instance> rows;
};

struct CsvOptions {
    int classIndex{-1}; // -1 selects the last column
    bool numericClass{false};
};

// Reads a header row of attribute names followed by ';' or ',' separated rows.
// "?" or an empty field is a missing value.
Instances loadCsv(const std::filesystem::path &csvPath, const CsvOptions &opts = CsvOptions{});

// Reads rows against an existing header, e.g. a test set for a trained model.
// Column names and count must match; unseen nominal class labels are rejected.
void appendCsv(Instances &data, const std::filesystem::path &csvPath, const CsvOptions &opts = CsvOptions{});

}
