#include <cmath>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h>

#include <boost/algorithm/string.hpp>

#include "knn/config_file.hpp"
#include "knn/errors.hpp"
#include "knn/instances.hpp"
#include "knn/knn.hpp"
#include "knn/option_utils.hpp"
#include "knn/options.hpp"

namespace fs = std::filesystem;

struct RunSettings {
    fs::path trainCsv;
    fs::path testCsv;
    fs::path loadXml;
    fs::path saveXml;
    wknn::CsvOptions csv;
    int threads{1};
    bool help{false};
};

void printUsage(){
    std::cout << "Usage: wknn -t <train.csv> [general options] [classifier options]\n\n"
              << "General options:\n"
              << "  -t <file>       training set (CSV with a header row)\n"
              << "  -T <file>       test set, evaluated on the training set if omitted\n"
              << "  -c <index>      zero-based class column (default: last)\n"
              << "  -r              numeric class (regression)\n"
              << "  -j <threads>    evaluation threads (default: 1)\n"
              << "  -x <file>       read classifier options from an XML file\n"
              << "  -o <file>       write classifier options to an XML file\n"
              << "  -h              this help\n\n"
              << "Classifier options:\n";
    for (const auto &opt : wknn::listOptions()){
        std::vector<std::string> lines;
        boost::split(lines, opt.description, boost::is_any_of("\n"));
        std::cout << "  " << opt.synopsis << "\n";
        for (const auto &ln : lines)
            std::cout << "\t" << ln << "\n";
    }
}

// Lower-case flags are consumed here; what remains goes to the classifier.
RunSettings parseGeneralOptions(std::vector<std::string> &args){
    RunSettings settings;
    settings.help = wknn::getFlag('h', args);
    settings.trainCsv = wknn::getOption('t', args);
    settings.testCsv = wknn::getOption('T', args);
    settings.loadXml = wknn::getOption('x', args);
    settings.saveXml = wknn::getOption('o', args);
    settings.csv.numericClass = wknn::getFlag('r', args);

    std::string classString = wknn::getOption('c', args);
    if (classString.length() != 0)
        settings.csv.classIndex = wknn::parseInt(classString, 'c');

    std::string threadString = wknn::getOption('j', args);
    if (threadString.length() != 0)
        settings.threads = wknn::parseInt(threadString, 'j');
    if (settings.threads < 1)
        throw wknn::ConfigurationError("Thread count must be positive");
    return settings;
}

void printCrossValidation(const wknn::knn &classifier){
    const std::vector<double> &errors = classifier.crossValidationErrors();
    if (errors.empty()) return;

    std::cout << "Hold-one-out errors:\n";
    for (std::size_t i{0}; i < errors.size(); ++i)
        std::cout << "  k=" << std::setw(3) << i + 1 << "  " << errors[i] << "\n";
    std::cout << "Selected k=" << classifier.getKNN() << "\n" << std::endl;
}

void evaluateNominal(const wknn::knn &classifier, const wknn::Instances &test){
    const int numClasses = test.numClasses();
    if (numClasses == 0){
        std::cout << "No class labels to evaluate" << std::endl;
        return;
    }
    const int sz = static_cast<int>(test.numInstances());
    std::vector<int> confMatrix(numClasses * numClasses, 0);
    int *confMatrixPtr = confMatrix.data();
    const int cells = static_cast<int>(confMatrix.size());

    int progress = 0;
    int step = 20;
    std::string failure;

    std::cout << "\r" << "0/" << sz << std::flush;
    #pragma omp parallel for reduction(+:confMatrixPtr[:cells])
    for (int i = 0; i < sz; ++i){
        const wknn::Instance &inst = test.instance(i);
        if (inst.classIsMissing()) continue;
        try {
            int pred = static_cast<int>(classifier.fit(inst));
            confMatrixPtr[static_cast<int>(inst.classValue())*numClasses + pred]++;
        } catch (const std::exception &ex){
            #pragma omp critical
            {
                if (failure.empty()) failure = ex.what();
            }
        }

        if (i%step == step-1){
            #pragma omp critical
            {
                std::cout << "\r" << (++progress)*step << "/" << sz << std::flush;
            }
        }
    }
    std::cout << "\r" << sz << "/" << sz << std::endl;
    if (!failure.empty())
        throw std::runtime_error(failure);

    int correct{0}, total{0};
    for (int a{0}; a < numClasses; ++a){
        for (int p{0}; p < numClasses; ++p){
            total += confMatrix[a*numClasses + p];
            if (a == p) correct += confMatrix[a*numClasses + p];
        }
    }

    std::cout << "\nCorrectly classified: " << correct << "/" << total;
    if (total > 0)
        std::cout << " (" << std::fixed << std::setprecision(2) << 100.0 * correct / total << "%)"
                  << std::defaultfloat;
    std::cout << "\n\nConfusion matrix (rows: actual, columns: predicted)\n";
    const auto &labels = test.classAttribute().labels;
    for (int a{0}; a < numClasses; ++a){
        for (int p{0}; p < numClasses; ++p)
            std::cout << std::setw(6) << confMatrix[a*numClasses + p] << " ";
        std::cout << " | " << labels[a] << "\n";
    }
}

void evaluateNumeric(const wknn::knn &classifier, const wknn::Instances &test){
    const int sz = static_cast<int>(test.numInstances());
    double absErr = 0.0, sqErr = 0.0;
    int counted = 0;
    std::string failure;

    #pragma omp parallel for reduction(+:absErr,sqErr,counted)
    for (int i = 0; i < sz; ++i){
        const wknn::Instance &inst = test.instance(i);
        if (inst.classIsMissing()) continue;
        try {
            double err = classifier.fit(inst) - inst.classValue();
            absErr += std::fabs(err);
            sqErr += err*err;
            counted++;
        } catch (const std::exception &ex){
            #pragma omp critical
            {
                if (failure.empty()) failure = ex.what();
            }
        }
    }
    if (!failure.empty())
        throw std::runtime_error(failure);

    std::cout << "Instances evaluated: " << counted << "\n";
    if (counted > 0){
        std::cout << "Mean absolute error: " << absErr / counted << "\n"
                  << "Root mean squared error: " << std::sqrt(sqErr / counted) << "\n";
    }
}

int run(std::vector<std::string> args){
    RunSettings settings = parseGeneralOptions(args);
    if (settings.help){
        printUsage();
        return 0;
    }
    if (settings.trainCsv.empty())
        throw wknn::ConfigurationError("No training file given (-t)");

    omp_set_num_threads(settings.threads);

    wknn::knn classifier;
    if (!settings.loadXml.empty()){
        wknn::checkForRemainingOptions(args);
        classifier.setConfig(wknn::loadConfig(settings.loadXml));
    } else {
        classifier.setOptions(args);
    }
    if (!settings.saveXml.empty())
        wknn::saveConfig(settings.saveXml, classifier.getConfig());

    std::cout << "Options: " << wknn::joinOptions(classifier.getOptions()) << "\n" << std::endl;

    std::cout << "Loading training data from " << settings.trainCsv << "..." << std::flush;
    wknn::Instances trnData = wknn::loadCsv(settings.trainCsv, settings.csv);
    std::cout << " " << trnData.numInstances() << " instances" << std::endl;

    std::cout << "Training classifier..." << std::flush;
    classifier.train(trnData);
    std::cout << " done\n" << std::endl;

    std::cout << classifier.describe() << std::endl;
    printCrossValidation(classifier);

    wknn::Instances tstData = trnData.headerCopy();
    if (!settings.testCsv.empty()){
        std::cout << "Loading test data from " << settings.testCsv << "..." << std::flush;
        wknn::appendCsv(tstData, settings.testCsv, settings.csv);
        std::cout << " " << tstData.numInstances() << " instances\n" << std::endl;
    } else {
        std::cout << "No test set given, evaluating on the training data\n" << std::endl;
        tstData = trnData;
    }

    if (tstData.classIsNominal())
        evaluateNominal(classifier, tstData);
    else
        evaluateNumeric(classifier, tstData);
    return 0;
}

int main(int argc, char **argv){
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return run(args);
    } catch (const std::exception &ex){
        std::cerr << "\nError: " << ex.what() << std::endl;
        return 1;
    }
}
