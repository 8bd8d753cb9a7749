#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "engram/common/logger.h"
#include "engram/graph/memory_graph.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace engram {
namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] <command> [ARGS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --data-dir DIR       Data directory (default: /tmp/engram)" << std::endl;
    std::cout << "  --log-level LEVEL    Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  create --owner O [--consent C] [--tag T]... [--ttl-ms N] [--importance F] TEXT" << std::endl;
    std::cout << "  read --as O ID" << std::endl;
    std::cout << "  search --as O [--k N] [--min-score F] [--tag T]... TEXT" << std::endl;
    std::cout << "  consent --as O ID LEVEL" << std::endl;
    std::cout << "  grant --as O ID RECEIVER TTL_MS [--modify]" << std::endl;
    std::cout << "  revoke --as O GRANT_ID" << std::endl;
    std::cout << "  link --as O SOURCE TARGET RELATION [--weight F]" << std::endl;
    std::cout << "  delete --as O ID" << std::endl;
    std::cout << "  maintain" << std::endl;
    std::cout << "  stats" << std::endl;
    std::cout << "  serve [--interval SECONDS]" << std::endl;
}

/**
 * @brief Arguments following the command word
 */
struct CommandArgs {
    std::multimap<std::string, std::string> options;
    std::vector<std::string> flags;
    std::vector<std::string> positional;

    bool has_flag(const std::string& name) const {
        for (const auto& flag : flags) {
            if (flag == name) return true;
        }
        return false;
    }

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }

    std::vector<std::string> get_all(const std::string& name) const {
        std::vector<std::string> values;
        auto range = options.equal_range(name);
        for (auto it = range.first; it != range.second; ++it) {
            values.push_back(it->second);
        }
        return values;
    }

    std::string joined_positional(size_t from) const {
        std::string text;
        for (size_t i = from; i < positional.size(); ++i) {
            if (!text.empty()) text += " ";
            text += positional[i];
        }
        return text;
    }
};

CommandArgs ParseCommandArgs(int argc, char* argv[], int start) {
    static const std::vector<std::string> kFlags = {"--modify"};
    CommandArgs args;
    for (int i = start; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            bool is_flag = false;
            for (const auto& flag : kFlags) {
                if (arg == flag) is_flag = true;
            }
            if (is_flag || i + 1 >= argc) {
                args.flags.push_back(arg);
            } else {
                args.options.emplace(arg, argv[++i]);
            }
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

int Fail(const std::string& what, const std::string& error) {
    std::cerr << what << ": " << error << std::endl;
    return 1;
}

template<typename T>
int Fail(const std::string& what, const core::Result<T>& result) {
    return Fail(what, std::string(core::error_code_name(result.code())) + ": " + result.error());
}

void PrintNode(const core::MemoryNode& node) {
    std::cout << "id:          " << node.id << std::endl;
    std::cout << "owner:       " << node.owner << std::endl;
    std::cout << "level:       " << core::level_name(node.level) << std::endl;
    std::cout << "consent:     " << core::consent_name(node.consent) << std::endl;
    std::cout << "importance:  " << node.importance << std::endl;
    std::cout << "created_at:  " << node.created_at << std::endl;
    std::cout << "expires_at:  " << node.expires_at() << std::endl;
    std::cout << "accesses:    " << node.access_count << std::endl;
    if (!node.tags.empty()) {
        std::cout << "tags:        ";
        for (size_t i = 0; i < node.tags.size(); ++i) {
            std::cout << (i ? ", " : "") << node.tags[i];
        }
        std::cout << std::endl;
    }
    if (node.parent) {
        std::cout << "parent:      " << *node.parent << std::endl;
    }
    if (!node.children.empty()) {
        std::cout << "children:    " << node.children.size() << std::endl;
    }
    std::cout << node.content << std::endl;
}

bool ParseId(const std::string& text, uint64_t& id) {
    try {
        size_t pos = 0;
        id = std::stoull(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

int RunCreate(graph::MemoryGraph& graph, const CommandArgs& args) {
    const std::string owner = args.get("--owner");
    auto consent = core::parse_consent(args.get("--consent", "private"));
    if (!consent) {
        return Fail("create", "unknown consent level " + args.get("--consent"));
    }
    graph::CreateOptions options;
    options.tags = args.get_all("--tag");
    try {
        if (!args.get("--ttl-ms").empty()) options.ttl = std::stoll(args.get("--ttl-ms"));
        if (!args.get("--importance").empty()) options.importance = std::stof(args.get("--importance"));
    } catch (const std::exception& e) {
        return Fail("create", std::string("bad number: ") + e.what());
    }
    auto id = graph.create_memory(owner, args.joined_positional(0), *consent, options);
    if (!id.ok()) {
        return Fail("create", id);
    }
    std::cout << id.value() << std::endl;
    return 0;
}

int RunRead(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t id = 0;
    if (args.positional.size() != 1 || !ParseId(args.positional[0], id)) {
        return Fail("read", "expected one node id");
    }
    auto node = graph.read_memory(id, args.get("--as"));
    if (!node.ok()) {
        return Fail("read", node);
    }
    PrintNode(node.value());
    return 0;
}

int RunSearch(graph::MemoryGraph& graph, const CommandArgs& args) {
    size_t k = 10;
    double min_score = graph.config().index.default_min_score;
    try {
        if (!args.get("--k").empty()) k = std::stoul(args.get("--k"));
        if (!args.get("--min-score").empty()) min_score = std::stod(args.get("--min-score"));
    } catch (const std::exception& e) {
        return Fail("search", std::string("bad number: ") + e.what());
    }
    graph::SearchOptions options;
    options.tags = args.get_all("--tag");
    auto hits = graph.search_memories(args.joined_positional(0), args.get("--as"), k, min_score, options);
    if (!hits.ok()) {
        return Fail("search", hits);
    }
    for (const auto& hit : hits.value()) {
        std::cout << hit.node.id << "\t" << hit.score << "\t" << hit.node.owner << "\t"
                  << hit.node.content << std::endl;
    }
    return 0;
}

int RunConsent(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t id = 0;
    if (args.positional.size() != 2 || !ParseId(args.positional[0], id)) {
        return Fail("consent", "expected node id and consent level");
    }
    auto level = core::parse_consent(args.positional[1]);
    if (!level) {
        return Fail("consent", "unknown consent level " + args.positional[1]);
    }
    auto result = graph.update_consent(id, args.get("--as"), *level);
    return result.ok() ? 0 : Fail("consent", result);
}

int RunGrant(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t id = 0;
    uint64_t ttl = 0;
    if (args.positional.size() != 3 || !ParseId(args.positional[0], id) || !ParseId(args.positional[2], ttl)) {
        return Fail("grant", "expected node id, receiver and ttl in ms");
    }
    auto grant = graph.grant_access(id, args.get("--as"), args.positional[1],
                                    static_cast<core::Duration>(ttl), args.has_flag("--modify"));
    if (!grant.ok()) {
        return Fail("grant", grant);
    }
    std::cout << grant.value() << std::endl;
    return 0;
}

int RunRevoke(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t id = 0;
    if (args.positional.size() != 1 || !ParseId(args.positional[0], id)) {
        return Fail("revoke", "expected one grant id");
    }
    auto result = graph.revoke_access(id, args.get("--as"));
    return result.ok() ? 0 : Fail("revoke", result);
}

int RunLink(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t source = 0;
    uint64_t target = 0;
    if (args.positional.size() != 3 || !ParseId(args.positional[0], source) ||
        !ParseId(args.positional[1], target)) {
        return Fail("link", "expected source id, target id and relation");
    }
    float weight = 1.0f;
    try {
        if (!args.get("--weight").empty()) weight = std::stof(args.get("--weight"));
    } catch (const std::exception& e) {
        return Fail("link", std::string("bad number: ") + e.what());
    }
    auto edge = graph.link_memories(source, target, args.positional[2], weight, args.get("--as"));
    if (!edge.ok()) {
        return Fail("link", edge);
    }
    std::cout << edge.value() << std::endl;
    return 0;
}

int RunDelete(graph::MemoryGraph& graph, const CommandArgs& args) {
    uint64_t id = 0;
    if (args.positional.size() != 1 || !ParseId(args.positional[0], id)) {
        return Fail("delete", "expected one node id");
    }
    auto result = graph.delete_memory(id, args.get("--as"));
    return result.ok() ? 0 : Fail("delete", result);
}

int RunMaintain(graph::MemoryGraph& graph) {
    auto report = graph.trigger_maintenance();
    if (!report.ok()) {
        return Fail("maintain", report);
    }
    std::cout << "expired:    " << report.value().expired_nodes << std::endl;
    std::cout << "summaries:  " << report.value().rollups.summaries_created << std::endl;
    std::cout << "timeouts:   " << report.value().rollups.timeouts << std::endl;
    std::cout << "checkpoint: " << (report.value().checkpointed ? "yes" : "no") << std::endl;
    return 0;
}

int RunStats(graph::MemoryGraph& graph) {
    auto stats = graph.stats();
    std::cout << "nodes:      " << stats.store.total_nodes << std::endl;
    for (size_t i = 0; i < core::kNumLevels; ++i) {
        std::cout << "  " << core::level_name(static_cast<core::Level>(i)) << ": "
                  << stats.store.nodes_per_level[i] << std::endl;
    }
    std::cout << "owners:     " << stats.store.nodes_per_owner.size() << std::endl;
    for (const auto& [owner, count] : stats.store.nodes_per_owner) {
        std::cout << "  " << owner << ": " << count << std::endl;
    }
    std::cout << "grants:     " << stats.store.total_grants << std::endl;
    std::cout << "edges:      " << stats.store.total_edges << std::endl;
    std::cout << "indexed:    " << stats.indexed_nodes << std::endl;
    std::cout << "avg access: " << stats.average_access_count << std::endl;
    return 0;
}

int RunServe(graph::MemoryGraph& graph, const CommandArgs& args) {
    long interval_seconds = 60;
    try {
        if (!args.get("--interval").empty()) interval_seconds = std::stol(args.get("--interval"));
    } catch (const std::exception& e) {
        return Fail("serve", std::string("bad number: ") + e.what());
    }
    if (interval_seconds <= 0) {
        return Fail("serve", "interval must be positive");
    }

    ENGRAM_INFO("Running maintenance every {}s. Press Ctrl+C to stop.", interval_seconds);
    auto next_run = std::chrono::steady_clock::now();
    while (g_running.load()) {
        if (std::chrono::steady_clock::now() >= next_run) {
            auto report = graph.trigger_maintenance();
            if (!report.ok()) {
                ENGRAM_ERROR("Maintenance failed: {}", report.error());
            }
            next_run = std::chrono::steady_clock::now() + std::chrono::seconds(interval_seconds);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ENGRAM_INFO("Shutting down");
    return 0;
}

} // namespace
} // namespace engram

int main(int argc, char* argv[]) {
    // Set up signal handling
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    engram::common::Logger::Init();

    std::string data_dir = "/tmp/engram";
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--data-dir" && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level_str = argv[++i];
            if (level_str == "trace") engram::common::Logger::SetLevel(spdlog::level::trace);
            else if (level_str == "debug") engram::common::Logger::SetLevel(spdlog::level::debug);
            else if (level_str == "info") engram::common::Logger::SetLevel(spdlog::level::info);
            else if (level_str == "warn") engram::common::Logger::SetLevel(spdlog::level::warn);
            else if (level_str == "error") engram::common::Logger::SetLevel(spdlog::level::err);
            else if (level_str == "off") engram::common::Logger::SetLevel(spdlog::level::off);
            else std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
        } else if (arg == "--help" || arg == "-h") {
            engram::PrintUsage(argv[0]);
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        } else {
            break;
        }
    }
    if (i >= argc) {
        engram::PrintUsage(argv[0]);
        return 1;
    }
    const std::string command = argv[i];
    const auto args = engram::ParseCommandArgs(argc, argv, i + 1);

    try {
        auto config = engram::core::GraphConfig::Default();
        config.data_dir = data_dir;
        auto opened = engram::graph::MemoryGraph::open(config);
        if (!opened.ok()) {
            std::cerr << "Failed to open memory graph: " << opened.error() << std::endl;
            return 1;
        }
        auto graph = opened.take_value();

        if (command == "create") return engram::RunCreate(*graph, args);
        if (command == "read") return engram::RunRead(*graph, args);
        if (command == "search") return engram::RunSearch(*graph, args);
        if (command == "consent") return engram::RunConsent(*graph, args);
        if (command == "grant") return engram::RunGrant(*graph, args);
        if (command == "revoke") return engram::RunRevoke(*graph, args);
        if (command == "link") return engram::RunLink(*graph, args);
        if (command == "delete") return engram::RunDelete(*graph, args);
        if (command == "maintain") return engram::RunMaintain(*graph);
        if (command == "stats") return engram::RunStats(*graph);
        if (command == "serve") return engram::RunServe(*graph, args);

        std::cerr << "Unknown command: " << command << std::endl;
        std::cerr << "Use --help for usage information" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
