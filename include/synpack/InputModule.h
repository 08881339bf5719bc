#pragma once
#include <string>
#include <vector>
#include "synpack/Config.h"

namespace synpack {

// CSV item loader. First line is a header; columns: id,name,weight,value[,category]
bool LoadItemsFromCsv(const std::string& filename, std::vector<Item>* out, std::string* err);
bool ParseItemsCsv(const std::string& text, std::vector<Item>* out, std::string* err);

} // namespace synpack
