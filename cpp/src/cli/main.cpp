// =============================================================================
// dreamgroup CLI
// =============================================================================
//
// Usage:
//   dreamgroup [global options] <command> [options]
//
// Commands:
//   run          Normalize, cluster and classify the corpus (resumable)
//   status       Show pipeline progress
//   search       Find clusters similar to a given cluster
//   merge        Merge clusters after review
//   build-index  Embed normalized phrases and build the similarity index
//   summary      Print cluster and category statistics
//   export       Write dream_mappings.tsv and dream_groups.tsv
//   version      Show version information
//
// Examples:
//   dreamgroup -c dreamgroup.yaml run --background
//   dreamgroup search group_00042 -k 20 -t 60
//   dreamgroup merge group_00042 group_00107 group_00311
//
// =============================================================================

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "dreamgroup/config.hpp"
#include "dreamgroup/error.hpp"
#include "dreamgroup/logging.hpp"
#include "dreamgroup/oracle/chat_oracle.hpp"
#include "dreamgroup/oracle/embedder.hpp"
#include "dreamgroup/oracle/http_client.hpp"
#include "dreamgroup/pipeline/background_runner.hpp"
#include "dreamgroup/pipeline/checkpoint.hpp"
#include "dreamgroup/pipeline/export.hpp"
#include "dreamgroup/pipeline/pipeline.hpp"
#include "dreamgroup/pipeline/progress.hpp"
#include "dreamgroup/search/index_builder.hpp"
#include "dreamgroup/search/similarity_index.hpp"
#include "dreamgroup/store/cluster_store.hpp"

namespace dreamgroup::cli {
    int cmd_run(int argc, char* argv[]);
    int cmd_status(int argc, char* argv[]);
    int cmd_search(int argc, char* argv[]);
    int cmd_merge(int argc, char* argv[]);
    int cmd_build_index(int argc, char* argv[]);
    int cmd_summary(int argc, char* argv[]);
    int cmd_export(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define DREAMGROUP_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"run",         "Normalize, cluster and classify the corpus", dreamgroup::cli::cmd_run},
    {"status",      "Show pipeline progress", dreamgroup::cli::cmd_status},
    {"search",      "Find clusters similar to a cluster", dreamgroup::cli::cmd_search},
    {"merge",       "Merge source clusters into a target cluster", dreamgroup::cli::cmd_merge},
    {"build-index", "Embed phrases and build the similarity index", dreamgroup::cli::cmd_build_index},
    {"summary",     "Print cluster and category statistics", dreamgroup::cli::cmd_summary},
    {"export",      "Write the mapping and group tables", dreamgroup::cli::cmd_export},
    {"version",     "Show version information", dreamgroup::cli::cmd_version},
    {"help",        "Show this help message", dreamgroup::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "dreamgroup.yaml";
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

static dreamgroup::Config load_settings() {
    dreamgroup::Config config = dreamgroup::load_config(g_options.config_file);
    if (g_options.verbose) config.logging.level = "debug";
    if (g_options.quiet) config.logging.level = "warn";
    dreamgroup::apply_logging(config.logging);
    return config;
}

static void print_snapshot(const dreamgroup::pipeline::ProgressSnapshot& s) {
    std::cout << "Stage: " << dreamgroup::stage_name(s.stage)
              << "  processed: " << s.processed;
    if (s.total > 0) {
        std::cout << "/" << s.total << " (" << std::fixed << std::setprecision(1) << s.percent() << "%)";
    }
    std::cout << "  running: " << (s.running ? "yes" : "no") << "\n";
    if (!s.last_error.empty()) {
        std::cout << "Last error: " << s.last_error << "\n";
    }
}

namespace dreamgroup::cli {

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "dreamgroup - dream phrase normalization, clustering and taxonomy\n";
    std::cout << "Version " << DREAMGROUP_VERSION_STRING << "\n\n";
    std::cout << "Usage: dreamgroup [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 13; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: dreamgroup.yaml)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  DREAMGROUP_ORACLE_API_KEY     Chat completions API key (or GROQ_API_KEY)\n";
    std::cout << "  DREAMGROUP_EMBEDDING_API_KEY  Embeddings API key\n";
    std::cout << "  DREAMGROUP_LOG_LEVEL          trace|debug|info|warn|error\n";
    std::cout << "\nExamples:\n";
    std::cout << "  dreamgroup run --limit 500\n";
    std::cout << "  dreamgroup search group_00042 -k 20 -t 60\n";
    std::cout << "  dreamgroup merge group_00042 group_00107\n";
    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "dreamgroup " << DREAMGROUP_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Pipeline Commands
// =============================================================================

int cmd_run(int argc, char* argv[]) {
    bool background = false;
    long limit = -1;
    std::string corpus;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--background" || arg == "-b") {
            background = true;
        } else if ((arg == "--limit" || arg == "-n") && i + 1 < argc) {
            limit = std::stol(argv[++i]);
        } else if (arg == "--corpus" && i + 1 < argc) {
            corpus = argv[++i];
        } else {
            std::cerr << "Usage: dreamgroup run [--background] [--limit N] [--corpus file.tsv]\n";
            return 1;
        }
    }

    Config config = load_settings();
    if (limit >= 0) config.pipeline.max_records_per_run = static_cast<uint32_t>(limit);
    if (!corpus.empty()) config.pipeline.corpus_file = corpus;

    auto http = std::make_shared<oracle::HttpClient>();
    oracle::ChatCompletionOracle text_oracle(config.oracle, http);
    pipeline::ProgressTracker tracker(config.pipeline.status_file);

    auto job = [&]() {
        pipeline::Pipeline runner(config, text_oracle, &tracker);
        pipeline::RunOutcome outcome = runner.run();
        if (outcome.completed) {
            pipeline::export_tables(runner.state(), config.pipeline.output_dir);
        }
        return outcome;
    };

    pipeline::RunOutcome outcome;
    if (background) {
        pipeline::BackgroundRunner worker(tracker);
        worker.start(job);
        while (worker.running()) {
            std::this_thread::sleep_for(std::chrono::seconds(2));
            if (!g_options.quiet) print_snapshot(*tracker.snapshot());
        }
        worker.wait();
        if (!worker.error().empty()) {
            std::cerr << "Pipeline failed: " << worker.error() << "\n";
            return 1;
        }
        outcome = worker.outcome().value_or(pipeline::RunOutcome{});
    } else {
        outcome = pipeline::run_tracked(tracker, job);
    }

    std::cout << "Stage reached: " << stage_name(outcome.stage) << "\n"
              << "Normalized:    " << outcome.normalized << "\n"
              << "Merges:        " << outcome.merges << "\n"
              << "Classified:    " << outcome.classified << "\n"
              << "Oracle calls:  " << outcome.oracle_calls << "\n";
    if (!outcome.completed) {
        std::cout << "Batch limit reached; run again to continue.\n";
    }
    return 0;
}

int cmd_status([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config config = load_settings();

    if (!config.pipeline.status_file.empty()) {
        if (auto snapshot = pipeline::ProgressTracker::read_status_file(config.pipeline.status_file)) {
            print_snapshot(*snapshot);
            return 0;
        }
    }

    pipeline::CheckpointManager checkpoint(config.pipeline.checkpoint_file);
    if (!checkpoint.exists()) {
        std::cout << "No pipeline run recorded (" << checkpoint.path() << " not found)\n";
        return 0;
    }
    pipeline::PipelineState state = checkpoint.load();
    std::cout << "Stage:      " << stage_name(state.stage) << "\n"
              << "Records:    " << state.records.size() << "\n"
              << "Normalized: " << state.normalized_ids().size() << "\n"
              << "Clusters:   " << state.clusters.size() << "\n"
              << "Cached:     " << state.cache.size() << " oracle results\n";
    return 0;
}

// =============================================================================
// Review Commands
// =============================================================================

int cmd_search(int argc, char* argv[]) {
    std::string cluster_id;
    long k = -1;
    double threshold = -1.0;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-k" || arg == "--top") && i + 1 < argc) {
            k = std::stol(argv[++i]);
        } else if ((arg == "-t" || arg == "--threshold") && i + 1 < argc) {
            threshold = std::stod(argv[++i]);
        } else if (arg[0] != '-' && cluster_id.empty()) {
            cluster_id = arg;
        }
    }
    if (cluster_id.empty()) {
        std::cerr << "Usage: dreamgroup search <cluster_id> [-k N] [-t threshold]\n";
        return 1;
    }

    Config config = load_settings();
    const size_t top = k > 0 ? static_cast<size_t>(k) : config.search.default_k;
    const double gate = threshold >= 0 ? threshold : config.search.default_threshold;

    store::ClusterStore live = store::ClusterStore::load(pipeline::CheckpointManager(config.pipeline.checkpoint_file));
    search::SimilarityIndex index(config.search);
    if (!index.load()) {
        std::cerr << "Similarity index unavailable in " << config.search.index_dir
                  << "; run 'dreamgroup build-index' first\n";
        return 2;
    }

    const Cluster* query = live.find(cluster_id);
    if (!query) {
        std::cerr << "Cluster " << cluster_id << " not found (it may have been merged)\n";
        return 1;
    }
    std::cout << cluster_id << ": " << query->representative << " (" << query->size() << " dreams)\n\n";

    auto hits = index.search(live, cluster_id, top, gate);
    if (hits.empty()) {
        std::cout << "No similar clusters at threshold " << gate << "\n";
        return 0;
    }
    for (const auto& hit : hits) {
        std::cout << "  " << std::fixed << std::setprecision(1) << std::setw(5) << hit.similarity << "  "
                  << hit.cluster_id << "  " << hit.representative << " (" << hit.members << ")"
                  << (hit.lexical ? "  [lexical]" : "") << "\n";
    }
    return 0;
}

int cmd_merge(int argc, char* argv[]) {
    std::vector<std::string> ids;
    for (int i = 0; i < argc; ++i) ids.emplace_back(argv[i]);
    if (ids.size() < 2) {
        std::cerr << "Usage: dreamgroup merge <target_cluster> <source_cluster>...\n";
        return 1;
    }

    Config config = load_settings();
    pipeline::CheckpointManager checkpoint(config.pipeline.checkpoint_file);
    store::ClusterStore live = store::ClusterStore::load(checkpoint);

    for (const auto& id : ids) {
        if (!live.live(id)) {
            std::cerr << "Cluster " << id << " not found (it may have been merged already)\n";
            return 1;
        }
    }

    const std::string target = ids.front();
    std::vector<std::string> sources(ids.begin() + 1, ids.end());
    const Cluster& merged = live.merge_into(target, sources);

    checkpoint.save(live.state());
    pipeline::export_tables(live.state(), config.pipeline.output_dir);

    std::cout << "Merged " << sources.size() << " cluster(s) into " << merged.id << " ('"
              << merged.representative << "'), now " << merged.size() << " dreams\n";
    return 0;
}

int cmd_build_index([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    Config config = load_settings();
    pipeline::PipelineState state = pipeline::CheckpointManager(config.pipeline.checkpoint_file).load();

    auto http = std::make_shared<oracle::HttpClient>();
    oracle::HttpEmbedder embedder(config.embedding, http);
    search::IndexBuildStats stats = search::build_index(state, embedder, config.search);

    std::cout << "Indexed " << stats.phrases << " phrases (" << stats.dimensions << " dims)\n"
              << "  " << stats.index_path << "\n"
              << "  " << stats.meta_path << "\n";
    return 0;
}

// =============================================================================
// Reporting Commands
// =============================================================================

int cmd_summary(int argc, char* argv[]) {
    size_t top = 10;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--top" || arg == "-n") && i + 1 < argc) {
            top = static_cast<size_t>(std::stoul(argv[++i]));
        }
    }

    Config config = load_settings();
    pipeline::PipelineState state = pipeline::CheckpointManager(config.pipeline.checkpoint_file).load();
    pipeline::print_summary(std::cout, pipeline::build_summary(state, top));
    return 0;
}

int cmd_export(int argc, char* argv[]) {
    Config config = load_settings();
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            config.pipeline.output_dir = argv[++i];
        }
    }

    pipeline::PipelineState state = pipeline::CheckpointManager(config.pipeline.checkpoint_file).load();
    auto paths = pipeline::export_tables(state, config.pipeline.output_dir);
    std::cout << paths.mappings << "\n" << paths.groups << "\n";
    return 0;
}

} // namespace dreamgroup::cli

// =============================================================================
// Main Entry Point
// =============================================================================

static int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        dreamgroup::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const dreamgroup::DreamGroupException& e) {
                LOG_ERROR(e.what());
                std::cerr << e.what() << "\n";
                return 1;
            } catch (const std::exception& e) {
                LOG_ERROR("Unexpected error: ", e.what());
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'dreamgroup help' for usage.\n";
    return 1;
}
