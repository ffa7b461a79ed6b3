#pragma once

#include <string>
#include <vector>

namespace wknn {

// Flag/value option lists. Consumed tokens are blanked in place so that
// whatever is left over can be reported by checkForRemainingOptions().

// Returns the value following -<flag> and blanks both tokens; "" when the flag is absent.
std::string getOption(char flag, std::vector<std::string> &options);
// Blanks -<flag> and returns whether it was present.
bool getFlag(char flag, std::vector<std::string> &options);
void checkForRemainingOptions(const std::vector<std::string> &options);

// Splits a command line on blanks, honouring "double quotes" and backslash escapes.
std::vector<std::string> splitOptions(const std::string &line);
// Inverse of splitOptions().
std::string joinOptions(const std::vector<std::string> &options);

int parseInt(const std::string &value, char flag);
double parseDouble(const std::string &value, char flag);

}
