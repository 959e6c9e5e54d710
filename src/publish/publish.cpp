#include <augur/analysis/analyzer_setup.hpp>
#include <augur/analysis/report_format.hpp>
#include <augur/utils/config.hpp>
#include <augur/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <zmq.hpp>

// Publishes one message per symbol and refresh cycle on a ZeroMQ PUB socket:
// "<SYMBOL> <report json>". Subscribers filter on the symbol prefix.

namespace {

std::atomic<bool> running{true};

void handle_signal(int) {
    running = false;
}

bool publish_report(zmq::socket_t& socket, const augur::analysis::AnalysisReport& report) {
    const std::string payload = report.symbol + " " + augur::analysis::to_json(report);
    try {
        auto sent = socket.send(zmq::buffer(payload), zmq::send_flags::dontwait);
        return sent.has_value();
    } catch (const zmq::error_t& e) {
        augur::utils::Logger::error() << "Failed to publish " << report.symbol << ": " << e.what()
                                      << augur::utils::Logger::endl;
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = augur::utils::Config::instance();
        std::string config_file = argc > 1 ? argv[1] : "augur.conf";
        if (!config->load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }

        augur::utils::Logger::configure(*config);

        const std::vector<std::string> symbols = config->get_list("symbols");
        if (symbols.empty()) {
            std::cerr << "No symbols configured ('symbols' key)" << std::endl;
            return 1;
        }

        const std::string endpoint = config->get("publish.endpoint", std::string("tcp://*:5556"));
        const auto refresh = std::chrono::seconds(config->get<long>("publish.refresh_seconds", 60));
        // 0 keeps publishing until interrupted
        const long cycles = config->get<long>("publish.cycles", 0);

        auto analyzer = augur::analysis::make_analyzer(*config);

        zmq::context_t context(1);
        zmq::socket_t socket(context, zmq::socket_type::pub);
        try {
            socket.bind(endpoint);
        } catch (const zmq::error_t& e) {
            std::cerr << "Failed to bind publisher socket at " << endpoint << ": " << e.what() << std::endl;
            return 1;
        }
        augur::utils::Logger::info() << "Publishing " << symbols.size() << " symbols on " << endpoint
                                     << augur::utils::Logger::endl;

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        for (long cycle = 0; running && (cycles == 0 || cycle < cycles); ++cycle) {
            auto reports = analyzer->screen(symbols);

            size_t published = 0;
            for (const auto& report : reports) {
                if (publish_report(socket, report)) {
                    ++published;
                }
            }
            augur::utils::Logger::info() << "Cycle " << (cycle + 1) << ": published " << published
                                         << "/" << reports.size() << " reports" << augur::utils::Logger::endl;

            // Sleep in short steps so an interrupt is honoured promptly
            const auto wake = std::chrono::steady_clock::now() + refresh;
            while (running && (cycles == 0 || cycle + 1 < cycles) && std::chrono::steady_clock::now() < wake) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        augur::utils::Logger::info() << "Publisher stopped" << augur::utils::Logger::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
