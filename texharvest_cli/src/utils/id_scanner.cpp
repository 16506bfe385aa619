#include "id_scanner.hpp"
#include "../../../libtexharvest/include/logger.hpp"

#include <fstream>
#include <iostream>
#include <unordered_set>

using namespace texharvest;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void read_list(std::istream& in, std::vector<std::string>& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        if (auto id = trim(line); !id.empty()) {
            out.push_back(std::move(id));
        }
    }
}

} // namespace

std::optional<std::vector<std::string>>
collect_identifiers(const std::vector<std::string>& positional,
                    const std::filesystem::path& ids_file) {
    std::vector<std::string> raw = positional;

    if (!ids_file.empty()) {
        if (ids_file == "-") {
            read_list(std::cin, raw);
        } else {
            std::ifstream in(ids_file);
            if (!in) {
                Logger::log(LogLevel::Error, "Can't read identifier list: " + ids_file.string(), "id_scanner");
                return std::nullopt;
            }
            read_list(in, raw);
        }
    }

    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (auto& id : raw) {
        if (seen.insert(id).second) {
            ids.push_back(std::move(id));
        } else {
            Logger::log(LogLevel::Debug, "Skipping duplicate identifier " + id, "id_scanner");
        }
    }
    return ids;
}
