#include "agentspace/simulation.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    try {
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        po::options_description desc("Agent space simulations - Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("scenario,S", po::value<std::string>()->default_value("segregation"),
                "Scenario to run: flocking, segregation or outbreak")
            ("agents,n", po::value<int>()->default_value(0), "Number of agents (0 = scenario default)")
            ("seed,s", po::value<uint64_t>()->default_value(1234), "Random seed")
            ("max-ticks", po::value<int>()->default_value(100), "Maximum simulation ticks")
            ("width", po::value<int>()->default_value(30), "Segregation grid width")
            ("height", po::value<int>()->default_value(30), "Segregation grid height")
            ("threshold", po::value<int>()->default_value(3), "Same-group neighbors needed to be happy")
            ("visual-distance", po::value<double>()->default_value(5.0), "Flocking visual distance")
            ("countdown", po::value<int>()->default_value(1500), "Outbreak countdown in ticks")
            ("out-trace", po::value<std::string>()->default_value(""), "Output trace CSV file")
            ("out-metrics", po::value<std::string>()->default_value(""), "Output metrics JSON file")
            ("verbose,v", "Enable verbose logging")
            ("quiet,q", "Suppress info messages");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Agent-based model runner\n";
            std::cout << "Flocking, Schelling segregation and zombie outbreak on a shared spatial engine\n\n";
            std::cout << desc << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./agentspace_app --scenario segregation --width 10 --height 10 \\\n";
            std::cout << "                   --agents 80 --threshold 3 --seed 1234 --max-ticks 50\n";
            return 0;
        }

        po::notify(vm);

        if (vm.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else if (vm.count("quiet")) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            spdlog::set_level(spdlog::level::info);
        }

        auto scenario = agentspace::parse_scenario(vm["scenario"].as<std::string>());
        if (!scenario) {
            spdlog::error("Unknown scenario: {}", vm["scenario"].as<std::string>());
            return 1;
        }

        agentspace::SimulationConfig config;
        config.scenario = *scenario;
        config.num_agents = vm["agents"].as<int>();
        config.seed = vm["seed"].as<uint64_t>();
        config.max_ticks = vm["max-ticks"].as<int>();
        config.segregation.width = vm["width"].as<int>();
        config.segregation.height = vm["height"].as<int>();
        config.segregation.min_to_be_happy = vm["threshold"].as<int>();
        config.flocking.visual_distance = vm["visual-distance"].as<double>();
        config.outbreak.countdown = vm["countdown"].as<int>();
        config.trace_output = vm["out-trace"].as<std::string>();
        config.metrics_output = vm["out-metrics"].as<std::string>();
        config.verbose = vm.count("verbose") > 0;

        if (config.num_agents < 0) {
            spdlog::error("Number of agents must not be negative");
            return 1;
        }

        if (config.max_ticks < 0) {
            spdlog::error("Maximum ticks must not be negative");
            return 1;
        }

        agentspace::Simulation sim(config);

        if (!sim.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        if (!sim.run()) {
            spdlog::error("Simulation failed");
            return 1;
        }

        auto metrics = sim.get_metrics();
        spdlog::info("=== Simulation Results ===");
        spdlog::info("Ticks: {}", metrics.ticks);
        spdlog::info("Live agents: {}", metrics.live_agents);
        spdlog::info("Observed: {}", metrics.observed);
        spdlog::info("Relocations: {} ({:.2f} per tick)",
                    metrics.relocated,
                    metrics.ticks > 0 ? static_cast<double>(metrics.relocated) / metrics.ticks : 0.0);
        spdlog::info("Wall time: {}ms", metrics.wall_time.count());

        return 0;

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
