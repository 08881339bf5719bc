#include "synpack/InputModule.h"
#include <string>
#include <vector>
#include <stdexcept>
#include <fstream>
#include <sstream>

namespace synpack {

bool ParseItemsCsv(const std::string& text, std::vector<Item>* out, std::string* err) {
    if (!out) { if (err) *err = "out is null"; return false; }
    std::vector<Item> items;
    std::istringstream in(text);
    std::string line;
    std::getline(in, line); // header
    int lineNo = 1;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::istringstream ss(line);
        std::string token;
        Item it;

        try {
            std::getline(ss, token, ','); it.id = std::stoi(token);
            std::getline(ss, it.name, ',');
            std::getline(ss, token, ','); it.weight = std::stod(token);
            std::getline(ss, token, ','); it.value = std::stod(token);
            if (std::getline(ss, token, ',') && !token.empty()) it.category = token;
        } catch (const std::exception& e) {
            if (err) *err = "malformed item at line " + std::to_string(lineNo) + ": " + line + " (" + e.what() + ")";
            return false;
        }
        if (it.name.empty()) {
            if (err) *err = "item at line " + std::to_string(lineNo) + " has no name";
            return false;
        }

        items.push_back(std::move(it));
    }

    *out = std::move(items);
    return true;
}

bool LoadItemsFromCsv(const std::string& filename, std::vector<Item>* out, std::string* err) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (err) *err = "Could not open file: " + filename;
        return false;
    }
    std::ostringstream ss; ss << file.rdbuf();
    return ParseItemsCsv(ss.str(), out, err);
}

} // namespace synpack
