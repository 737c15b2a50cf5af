/**
 * @file clean_glosses.cpp
 * @brief Cleans raw multilingual symbol descriptions into a Bliss dictionary
 *
 * Usage: bliss_clean_glosses <raw_explanations.json> <bliss_dict.json>
 */

#include <ingestion/gloss_cleaner.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using namespace Bliss;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <raw_explanations.json> <bliss_dict.json>\n";
        return 1;
    }

    try {
        ScopedTimer timer("Gloss cleaning");

        Logger::step(std::string("Reading ") + argv[1]);
        std::ifstream in(argv[1]);
        if (!in) throw std::runtime_error(std::string("Cannot open ") + argv[1]);
        auto raw = nlohmann::json::parse(in);

        Logger::step("Processing " + std::to_string(raw.size()) + " items");
        auto cleaned = GlossCleaner::clean_dictionary(raw);

        size_t old_count = 0;
        for (const auto& [id, item] : cleaned.items()) {
            if (item.is_object() && item.value("is_old", false)) ++old_count;
        }

        Logger::step(std::string("Writing ") + argv[2]);
        std::ofstream out(argv[2]);
        if (!out) throw std::runtime_error(std::string("Cannot write ") + argv[2]);
        out << cleaned.dump(2, ' ', false) << "\n";

        Logger::success("Cleaned " + std::to_string(cleaned.size()) + " symbols (" +
                        std::to_string(old_count) + " marked old)");
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Error: ") + e.what());
        return 1;
    }
}
