// applications/screener_app/main.cpp
#include "augur/analysis/analyzer_setup.hpp"
#include "augur/analysis/report_format.hpp"
#include "augur/utils/config.hpp"
#include "augur/utils/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

// Usage: augur_screener [config file] [SYMBOL ...]
int main(int argc, char** argv) {
    try {
        auto config = augur::utils::Config::instance();
        std::string config_file = argc > 1 ? argv[1] : "augur.conf";
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        augur::utils::Logger::configure(*config);

        std::vector<std::string> symbols;
        for (int i = 2; i < argc; ++i) {
            symbols.emplace_back(argv[i]);
        }
        if (symbols.empty()) {
            symbols = config->get_list("symbols");
        }
        if (symbols.empty()) {
            std::cerr << "No symbols given on the command line or in 'symbols'" << std::endl;
            return 1;
        }

        auto analyzer = augur::analysis::make_analyzer(*config);

        std::cout << "Screening " << symbols.size() << " symbols ("
                  << analyzer->config().period << ", " << analyzer->config().interval << ")..." << std::endl;
        auto reports = analyzer->screen(symbols);

        augur::analysis::print_report_table(std::cout, reports);

        if (config->get_bool("print_json", false)) {
            for (const auto& report : reports) {
                std::cout << augur::analysis::to_json(report) << std::endl;
            }
        }
        
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
