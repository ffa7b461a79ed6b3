#pragma once

#include <filesystem>

#include "options.hpp"

namespace wknn {

// <wknn><options>-K 3 -W 0 ...</options><strict>false</strict></wknn>
void saveConfig(const std::filesystem::path &xmlPath, const KnnOptions &cfg);
// Throws ConfigurationError for unreadable files, missing elements or invalid options.
KnnOptions loadConfig(const std::filesystem::path &xmlPath);

}
