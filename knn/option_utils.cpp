#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include "errors.hpp"
#include "option_utils.hpp"

namespace wknn {

namespace {

std::string flagToken(char flag){
    return std::string{"-"} + flag;
}

}

std::string getOption(char flag, std::vector<std::string> &options){
    const std::string token = flagToken(flag);
    auto it = std::find(options.begin(), options.end(), token);
    if (it == options.end())
        return "";
    if (it + 1 == options.end())
        throw ConfigurationError("No value given for " + token + " option.");
    std::string value = *(it + 1);
    it->clear();
    (it + 1)->clear();
    return value;
}

bool getFlag(char flag, std::vector<std::string> &options){
    const std::string token = flagToken(flag);
    auto it = std::find(options.begin(), options.end(), token);
    if (it == options.end())
        return false;
    it->clear();
    return true;
}

void checkForRemainingOptions(const std::vector<std::string> &options){
    std::vector<std::string> left;
    std::copy_if(options.begin(), options.end(), std::back_inserter(left),
        [](const std::string &opt){ return !opt.empty(); });
    if (!left.empty())
        throw ConfigurationError("Illegal options: " + boost::algorithm::join(left, " "));
}

std::vector<std::string> splitOptions(const std::string &line){
    typedef boost::tokenizer< boost::escaped_list_separator<char> > Tokenizer;
    boost::escaped_list_separator<char> sep{'\\', ' ', '"'};

    bool inQuote{false};
    for (std::size_t i{0}; i < line.size(); ++i){
        if (line[i] == '\\') i++;
        else if (line[i] == '"') inQuote = !inQuote;
    }
    if (inQuote)
        throw ConfigurationError("Unterminated quoted string in '" + line + "'");

    std::vector<std::string> result;
    try {
        Tokenizer tok{line, sep};
        for (const auto &t : tok)
            if (!t.empty())
                result.push_back(t);
    } catch (const boost::escaped_list_error &ex){
        throw ConfigurationError("Malformed option string '" + line + "': " + ex.what());
    }
    return result;
}

std::string joinOptions(const std::vector<std::string> &options){
    std::vector<std::string> quoted;
    for (const auto &opt : options){
        if (opt.empty()) continue;
        if (opt.find_first_of(" \"\\") == std::string::npos){
            quoted.push_back(opt);
            continue;
        }
        std::string q{"\""};
        for (char c : opt){
            if (c == '"' || c == '\\')
                q += '\\';
            q += c;
        }
        q += '"';
        quoted.push_back(q);
    }
    return boost::algorithm::join(quoted, " ");
}

int parseInt(const std::string &value, char flag){
    try {
        return boost::lexical_cast<int>(value);
    } catch (const boost::bad_lexical_cast &){
        throw ConfigurationError("Invalid integer '" + value + "' for -" + flag + " option.");
    }
}

double parseDouble(const std::string &value, char flag){
    try {
        return boost::lexical_cast<double>(value);
    } catch (const boost::bad_lexical_cast &){
        throw ConfigurationError("Invalid number '" + value + "' for -" + flag + " option.");
    }
}

}
