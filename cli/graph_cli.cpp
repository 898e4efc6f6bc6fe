// FILE: cli/graph_cli.cpp
#include <getopt.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/ocl.hpp>

#include "engine_config.hpp"
#include "kernel/engine_session.hpp"

using namespace nw;

namespace {

void print_cli_help() {
    std::cout
        << "Usage: nodeweave_cli [options]\n\n"
        << "Options:\n"
        << "  -h, --help                 Show this help message\n"
        << "  -r, --read <file>          Read YAML graph into the session\n"
        << "  -c, --compute              Process every node in dependency order\n"
        << "  -n, --node <id>            Process a single node\n"
        << "  -o, --output <file>        Save current graph (with results) to YAML\n"
        << "  -p, --print                Print dependency tree\n"
        << "  -t, --traversal            Show evaluation order\n"
        << "      --config <file>        Use a specific configuration file\n"
        << "      --cleanup              Remove cache entries older than cache_max_age_ms\n"
        << "      --clear-cache          Remove every cache entry\n"
        << std::endl;
}

// Waits for a submission and prints a one-line report. Returns false on failure.
bool report(const NodeId& id, std::shared_future<Outcome> fut) {
    try {
        const Outcome& outcome = fut.get();
        if (outcome.success) {
            std::cout << "  [ok]        " << id << "\n";
            return true;
        }
        std::cout << "  [failed]    " << id << ": " << outcome.error << "\n";
    } catch (const ProcessingCancelled&) {
        std::cout << "  [cancelled] " << id << "\n";
    } catch (const std::exception& e) {
        std::cout << "  [error]     " << id << ": " << e.what() << "\n";
    }
    return false;
}

void print_events(EngineSession& session) {
    for (const auto& ev : session.drain_events()) {
        if (ev.source == "start") continue;
        std::cout << "  " << std::left << std::setw(10) << ev.source << std::setw(16) << ev.id
                  << std::right << std::fixed << std::setprecision(2) << ev.elapsed_ms << " ms";
        if (!ev.message.empty()) std::cout << "  " << ev.message;
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    // Hard-disable OpenCL runtime at process start to avoid spurious driver errors
    setenv("OPENCV_OPENCL_DEVICE", "disabled", 1);
    setenv("OPENCV_OPENCL_RUNTIME", "disabled", 1);
    cv::ocl::setUseOpenCL(false);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    std::string custom_config_path;
    const char* const short_opts = "hr:cn:o:pt";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},        {"read", required_argument, nullptr, 'r'},
        {"compute", no_argument, nullptr, 'c'},     {"node", required_argument, nullptr, 'n'},
        {"output", required_argument, nullptr, 'o'}, {"print", no_argument, nullptr, 'p'},
        {"traversal", no_argument, nullptr, 't'},   {"cleanup", no_argument, nullptr, 1001},
        {"clear-cache", no_argument, nullptr, 1002}, {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) { custom_config_path = optarg; }
    }
    optind = 1;

    EngineConfig config =
        load_or_create_engine_config(custom_config_path.empty() ? "config.yaml" : custom_config_path);

    std::unique_ptr<EngineSession> session;
    try {
        session = std::make_unique<EngineSession>(config);
    } catch (const GraphError& e) {
        std::cerr << "Failed to start engine session: " << e.what() << "\n";
        return 1;
    }

    bool graph_loaded = false;
    bool did_any_action = false;
    int exit_code = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        try {
            switch (opt) {
            case 'r': {
                session->load_graph(optarg);
                graph_loaded = true;
                did_any_action = true;
                std::cout << "Loaded graph from " << optarg << "\n";
                break; }
            case 'c': {
                if (!graph_loaded) { std::cerr << "No graph loaded; use -r first.\n"; exit_code = 1; break; }
                // Diff against an empty model so every node counts as new.
                GraphSnapshot graph = session->model().snapshot();
                session->model().clear();
                std::cout << "Processing graph:\n";
                for (auto& sub : session->update_graph(std::move(graph))) {
                    if (!report(sub.node_id, sub.outcome)) exit_code = 1;
                }
                print_events(*session);
                did_any_action = true;
                break; }
            case 'n': {
                if (!graph_loaded) { std::cerr << "No graph loaded; use -r first.\n"; exit_code = 1; break; }
                if (!session->model().has_node(optarg)) {
                    std::cerr << "Node not found: " << optarg << "\n"; exit_code = 1; break;
                }
                std::cout << "Processing node " << optarg << ":\n";
                if (!report(optarg, session->process_node(optarg).share())) exit_code = 1;
                print_events(*session);
                did_any_action = true;
                break; }
            case 'o': {
                if (!graph_loaded) { std::cerr << "No graph loaded; use -r first.\n"; exit_code = 1; break; }
                session->save_graph(optarg);
                std::cout << "Saved graph to " << optarg << "\n";
                did_any_action = true;
                break; }
            case 'p': {
                if (!graph_loaded) { std::cerr << "No graph loaded; use -r first.\n"; exit_code = 1; break; }
                session->traversal().print_dependency_tree(session->model().snapshot(), std::cout);
                did_any_action = true;
                break; }
            case 't': {
                if (!graph_loaded) { std::cerr << "No graph loaded; use -r first.\n"; exit_code = 1; break; }
                GraphSnapshot graph = session->model().snapshot();
                auto order = session->traversal().topo_order(session->model().node_ids(), graph.edges);
                std::cout << "Evaluation order:\n";
                for (size_t i = 0; i < order.size(); ++i) {
                    std::cout << "  " << (i + 1) << ". " << order[i] << "\n";
                }
                did_any_action = true;
                break; }
            case 1001: {
                int removed = session->cleanup_expired();
                std::cout << "Removed " << removed << " expired cache entries.\n";
                did_any_action = true;
                break; }
            case 1002: {
                int removed = session->cache().cleanup(0);
                std::cout << "Removed " << removed << " cache entries.\n";
                did_any_action = true;
                break; }
            case 2001: break;
            default: print_cli_help(); return 1;
            }
        } catch (const GraphError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            exit_code = 1;
        }
    }

    if (!did_any_action) {
        print_cli_help();
    }
    session->shutdown();
    return exit_code;
}
