#include <staffsim/core/engine.hpp>
#include <staffsim/core/error.hpp>
#include <staffsim/core/types.hpp>

#include <staffsim/algo/error.hpp>
#include <staffsim/algo/simulation.hpp>

#include <staffsim/io/error.hpp>
#include <staffsim/io/metrics.hpp>
#include <staffsim/io/scenario_injection.hpp>
#include <staffsim/io/scenario_loader.hpp>
#include <staffsim/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = staffsim::core;
namespace algo = staffsim::algo;
namespace io = staffsim::io;

constexpr double DEFAULT_DURATION = 600.0;

struct Config {
    std::string scenario_file;
    std::optional<double> duration;
    std::optional<double> tick;
    std::string output_file{"-"};
    std::string format{"json"};
    bool metrics{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("staffsim", "Zoo staff and task scheduling simulator");

    options.add_options()
        ("i,input", "Scenario file (JSON)", cxxopts::value<std::string>())
        ("d,duration", "Simulated seconds (default: scenario, else 600)", cxxopts::value<double>())
        ("t,tick", "Tick length in seconds (default: scenario, else 0.1)", cxxopts::value<double>())
        ("o,output", "Trace output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("format", "Format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("metrics", "Print metrics to stderr")
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.scenario_file = result["input"].as<std::string>();
    if (result.count("duration") != 0U) {
        config.duration = result["duration"].as<double>();
    }
    if (result.count("tick") != 0U) {
        config.tick = result["tick"].as<double>();
    }
    config.output_file = result["output"].as<std::string>();
    config.format = result["format"].as<std::string>();
    config.metrics = result.count("metrics") != 0U;
    config.verbose = result.count("verbose") != 0U;

    if (config.format != "json" && config.format != "text" && config.format != "null") {
        std::cerr << "Error: unknown format '" << config.format << "'" << std::endl;
        std::exit(64);
    }
    if ((config.duration && *config.duration <= 0.0) || (config.tick && *config.tick <= 0.0)) {
        std::cerr << "Error: --duration and --tick must be positive" << std::endl;
        std::exit(64);
    }
    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading scenario from: " << config.scenario_file << std::endl;
        }

        // 1. Load scenario and build the world
        auto scenario = io::load_scenario(config.scenario_file);
        auto world = io::build_world(scenario);

        // 2. Create engine with the tick length
        core::Engine engine;
        engine.set_tick_period(config.tick ? core::duration_from_seconds(*config.tick)
                                           : scenario.config.tick);

        // 3. Setup trace writer (before injection so zone and seed job records land)
        std::unique_ptr<core::TraceWriter> writer;
        std::ofstream outfile;
        std::ostream* out = &std::cout;

        if (config.output_file != "-" && config.format != "null") {
            outfile.open(config.output_file);
            if (!outfile) {
                std::cerr << "Error: cannot open output file: " << config.output_file << std::endl;
                return 1;
            }
            out = &outfile;
        }

        if (config.format == "null") {
            writer = std::make_unique<io::NullTraceWriter>();
        } else if (config.format == "text") {
            writer = std::make_unique<io::TextualTraceWriter>(*out, out == &std::cout);
        } else {
            writer = std::make_unique<io::JsonTraceWriter>(*out);
        }

        io::MemoryTraceWriter memory;
        io::TeeTraceWriter tee(*writer, memory);
        engine.set_trace_writer(config.metrics ? static_cast<core::TraceWriter*>(&tee)
                                               : writer.get());

        // 4. Create the simulation and populate it
        algo::Simulation sim(engine, world, scenario.config.simulation);
        auto workers = io::inject_scenario(sim, scenario);

        if (config.verbose) {
            std::cerr << "World " << world.width() << "x" << world.height() << ", "
                      << world.zone_ids().size() << " zones, " << workers.size()
                      << " staff, " << sim.tasks().stats().queued << " seed jobs" << std::endl;
            std::cerr << "Starting simulation..." << std::endl;
        }

        // 5. Run simulation
        double duration = config.duration.value_or(
            scenario.config.duration ? core::duration_to_seconds(*scenario.config.duration)
                                     : DEFAULT_DURATION);
        sim.start();
        engine.run(core::time_from_seconds(duration));

        auto stats = sim.tasks().stats();
        engine.trace([&](core::TraceWriter& w) {
            w.type("sim_finished");
            w.field("ticks", engine.tick_count());
            w.field("queued", static_cast<uint64_t>(stats.queued));
            w.field("active", static_cast<uint64_t>(stats.active));
        });

        // 6. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (config.verbose) {
            std::cerr << "Simulation complete at time: "
                      << core::time_to_seconds(engine.time()) << "s ("
                      << engine.tick_count() << " ticks)" << std::endl;
        }

        if (config.metrics) {
            io::print_metrics(io::compute_metrics(memory.records()), std::cerr);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::InvalidJobError& e) {
        std::cerr << "Invalid job: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SimulationError& e) {
        std::cerr << "Simulation error: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
