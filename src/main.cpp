#include "config/simulation_config.hpp"
#include "sim/route_simulator.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path = "data/config.json";
    std::string report_path = "REPORT.md";
    std::string csv_path = "data/routing_results.csv";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            report_path = argv[++i];
        } else if (arg == "--csv" && i + 1 < argc) {
            csv_path = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: perpx_router [options]\n"
                      << "  --config <path>  Simulation config (default: data/config.json)\n"
                      << "  --report <path>  Markdown report (default: REPORT.md)\n"
                      << "  --csv <path>     Execution CSV (default: data/routing_results.csv)\n"
                      << "  --help           Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)\n";
            return 2;
        }
    }

    try {
        std::cout << "Loading config from: " << config_path << "\n";
        auto config = perpx::load_simulation_config(config_path);

        perpx::RouteSimulator sim(config);

        std::cout << "Routing " << config.requests.size() << " requests across "
                  << config.venues.size() << " venues and "
                  << config.markets.size() << " markets...\n";
        sim.run();

        for (const auto& record : sim.events().records()) {
            std::cout << "  #" << record.sequence << " " << perpx::describe(record.event) << "\n";
        }

        bool written = sim.write_report(report_path);
        written = sim.write_csv(csv_path) && written;

        std::cout << "\n" << sim.metrics().generate_report();
        if (!written) {
            return 1;
        }
        std::cout << "\nResults written to " << report_path << " and " << csv_path << "\n";
    } catch (const perpx::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const perpx::RouterError& e) {
        std::cerr << "Setup failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
