#include "package_list.hpp"
#include "utils.hpp"

#include <fstream>
#include <stdexcept>

namespace Postinstall {

    std::vector<std::string> PackageList::parse(std::istream& in) {
        std::vector<std::string> packages;

        std::string line;
        while (std::getline(in, line)) {
            std::string name = trim(line);

            // Skips comments or empty lines
            if (name.empty() || name[0] == '#') {
                continue;
            }
            packages.push_back(name);
        }

        return packages;
    }

    std::vector<std::string> PackageList::loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open package list: " + path);
        }
        return parse(file);
    }
}
