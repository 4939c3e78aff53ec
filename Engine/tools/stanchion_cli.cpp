#include <config/engine_config.hpp>
#include <database/postgres_connection.hpp>
#include <storage/memory_analysis_store.hpp>
#include <storage/postgres_analysis_store.hpp>
#include <storage/snapshot_export.hpp>
#include <calibration/calibration_tracker.hpp>
#include <ensemble/decision_engine.hpp>
#include <utils/json_output.hpp>
#include <utils/logger.hpp>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace Stanchion;

namespace {

std::atomic<bool> g_stop{false};

void handle_interrupt(int) {
    g_stop.store(true);
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--memory] <command> [args]\n";
    std::cerr << "\nCommands:\n";
    std::cerr << "  decide <id>... [--force]          classify subjects\n";
    std::cerr << "  correct <id> <material> <type>    record a human correction\n";
    std::cerr << "  export [json|csv]                 dump every subject record\n";
    std::cerr << "  calibration                       calibration report (JSON)\n";
    std::cerr << "  stats                             store statistics\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " decide 120 135 --force\n";
    std::cerr << "  " << prog << " correct 120 betón \"stĺp značky samostatný\"\n";
}

int run_decide(DecisionEngine& engine, const std::vector<std::string>& args) {
    std::vector<std::string> ids;
    bool force = false;
    for (const auto& a : args) {
        if (a == "--force") force = true;
        else ids.push_back(a);
    }
    if (ids.empty()) {
        std::cerr << "decide: at least one subject id is required\n";
        return 1;
    }

    std::signal(SIGINT, handle_interrupt);
    for (const auto& d : engine.decide_batch(ids, force, &g_stop)) {
        std::cout << d.subject_id << "\t" << d.result.material << "\t" << d.result.type << "\t"
                  << std::fixed << std::setprecision(3) << d.result.confidence << "\n";
    }
    return 0;
}

int run_correct(DecisionEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 3) {
        std::cerr << "correct: expected <id> <material> <type>\n";
        return 1;
    }
    CorrectionEvent event = engine.correct(args[0], args[1], args[2]);
    std::cout << event.id << "\t#" << event.sequence << "\n";
    return 0;
}

int run_export(AnalysisStore& store, const std::vector<std::string>& args) {
    std::string format = args.empty() ? "json" : args[0];
    if (format == "json") {
        SnapshotExporter::write_json(store, std::cout);
    } else if (format == "csv") {
        SnapshotExporter::write_csv(store, std::cout);
    } else {
        std::cerr << "export: unknown format " << format << "\n";
        return 1;
    }
    return 0;
}

int run_stats(AnalysisStore& store) {
    StoreStats stats = store.stats();
    std::cout << "\n=== Store Statistics ===\n"
              << "Subject records:   " << stats.total_records << "\n"
              << "  Verified:        " << stats.verified_records << "\n"
              << "Correction events: " << stats.correction_events << "\n"
              << "Hypotheses:        " << stats.hypotheses << "\n"
              << "\nBy provenance:\n";
    for (const auto& [source, p] : stats.by_source) {
        std::cout << "  " << std::left << std::setw(18) << source << std::right
                  << std::setw(8) << p.count << "  mean confidence "
                  << std::fixed << std::setprecision(3) << p.mean_confidence << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    bool use_memory = false;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--memory") {
            use_memory = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            rest.push_back(arg);
        }
    }

    if (rest.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = rest.front();
    const std::vector<std::string> args(rest.begin() + 1, rest.end());

    try {
        EngineConfig config = config_path.empty() ? EngineConfig::from_env()
                                                  : EngineConfig::from_json_file(config_path);

        std::unique_ptr<PostgresConnection> db;
        std::unique_ptr<AnalysisStore> store;
        if (use_memory) {
            Logger::warn("Using in-memory store; nothing will be persisted");
            store = std::make_unique<MemoryAnalysisStore>();
        } else {
            db = std::make_unique<PostgresConnection>(config.resolved_conninfo());
            auto pg = std::make_unique<PostgresAnalysisStore>(*db);
            pg->ensure_schema();
            store = std::move(pg);
        }

        CalibrationTracker calibration(*store);
        calibration.load();

        DecisionEngine engine(*store, config);
        engine.set_calibration(&calibration);

        if (command == "decide") return run_decide(engine, args);
        if (command == "correct") return run_correct(engine, args);
        if (command == "export") return run_export(*store, args);
        if (command == "stats") return run_stats(*store);
        if (command == "calibration") {
            std::cout << dump_report(to_json(calibration.report())) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
