/**
 * @file find_duplicate_glosses.cpp
 * @brief Reports glosses shared by several symbols with the same metadata
 *
 * Usage: bliss_find_duplicates <bliss_dict.json> <duplicate_glosses.json>
 */

#include <ingestion/duplicate_glosses.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace Bliss;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <bliss_dict.json> <duplicate_glosses.json>\n";
        return 1;
    }

    try {
        Timer timer;

        Logger::step(std::string("Reading ") + argv[1]);
        std::ifstream in(argv[1]);
        if (!in) throw std::runtime_error(std::string("Cannot open ") + argv[1]);
        auto dictionary = nlohmann::json::parse(in);

        Logger::step("Analyzing glosses and metadata");
        DuplicateReport report = DuplicateGlossFinder::find(dictionary);

        std::cout << "\n" << std::string(40, '=') << "\n"
                  << "SUMMARY REPORT\n"
                  << "Total duplicate groups found: " << report.total_groups << "\n"
                  << std::string(40, '-') << "\n"
                  << std::left << std::setw(10) << "Language" << " | " << "Groups Found\n"
                  << std::string(40, '-') << "\n";
        for (const auto& [lang, count] : report.groups_per_language) {
            std::cout << std::left << std::setw(10) << lang << " | " << count << "\n";
        }
        std::cout << std::string(40, '=') << "\n\n";

        Logger::step(std::string("Writing ") + argv[2]);
        std::ofstream out(argv[2]);
        if (!out) throw std::runtime_error(std::string("Cannot write ") + argv[2]);
        out << report.groups.dump(2, ' ', false) << "\n";

        Logger::success("Done in " + timer.elapsed_str());
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        return 1;
    }
}
