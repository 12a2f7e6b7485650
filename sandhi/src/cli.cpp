// sandhi: Command-line interface for intent stacks and transfers
//
// Usage: sandhi [options] <command> [args]
//
// Commands:
//   push       Push an intent onto a session's stack
//   pop        Complete the top intent
//   show       List a session's frames
//   turn       Run one user turn: transfer, then inherit slots
//   sweep      Remove expired frames
//   help       Show this help

#include <sandhi/sandhi.hpp>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sandhi;

namespace {

const std::vector<std::string> SYSTEM_INTENTS = {"timeout", "error-recovery", "session-end"};

const char* prog_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "sandhi " << SANDHI_VERSION << " - Intent stack administration\n\n"
              << "Usage: " << name << " [options] <command> [args]\n\n"
              << "Stack Commands:\n"
              << "  push <session> <user> <intent> [context-json]\n"
              << "                     Push an intent (current one is interrupted)\n"
              << "  pop <session>      Complete the top intent, resume the one below\n"
              << "  show <session>     List frames, top first\n"
              << "  stats <session>    Stack statistics\n"
              << "  sweep [session]    Remove expired frames (all sessions if omitted)\n\n"
              << "Transfer Commands:\n"
              << "  turn <session> <user> <text>\n"
              << "                     Evaluate and apply a transfer, then fill slots\n"
              << "  rules [intent]     List transfer rules (for one intent if given)\n"
              << "  history <session>  Recent transfers and their statistics\n\n"
              << "Cache Commands:\n"
              << "  cache-stats        Inheritance cache entries\n"
              << "  invalidate-user <user>\n"
              << "                     Drop cached inheritance results for a user\n\n"
              << "  version            Show version\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --db PATH          SQLite database (default: ./sandhi.db)\n"
              << "  --config PATH      JSON config file\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose logging\n"
              << "  -v, --version      Show version\n";
}

// Session context for inheritance: slots collected by the session's other
// frames, newest first, dated by the frame's last update
class StackSessionContext : public SessionContextSource {
public:
    explicit StackSessionContext(IntentStackStore& stacks) : stacks_(stacks) {}

    ValueMap current_context(const std::string& session) override {
        ValueMap context;
        auto frames = stacks_.frames(session);
        for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
            if (it->status == FrameStatus::Active) continue;
            for (const auto& [slot, value] : it->collected_slots) {
                if (context.count(slot) || !is_filled(value)) continue;
                context[slot] = value;
                context[slot + "_timestamp"] = it->updated_at;
            }
        }
        return context;
    }

private:
    IntentStackStore& stacks_;
};

void print_frame(const IntentFrame& f) {
    std::cout << "  [" << f.depth << "] " << f.intent_name
              << "  " << status_name(f.status)
              << "  progress " << std::fixed << std::setprecision(2) << f.completion_progress;
    if (f.interruption_kind != InterruptionKind::None) {
        std::cout << "  (" << interruption_name(f.interruption_kind);
        if (!f.interruption_reason.empty()) std::cout << ": " << f.interruption_reason;
        std::cout << ")";
    }
    std::cout << "\n";
    if (!f.collected_slots.empty()) {
        std::cout << "      slots: " << json(f.collected_slots).dump() << "\n";
    }
    if (!f.missing_slots.empty()) {
        std::cout << "      missing: " << json(f.missing_slots).dump() << "\n";
    }
}

int report_failure(const char* op, const StackResult& r) {
    std::cerr << "Error: " << op << " failed (" << error_name(r.error) << "): " << r.message << "\n";
    return 1;
}

// Everything a command may need, wired over one store
struct Runtime {
    SandhiConfig config;
    SqliteStore store;
    StaticIntentCatalog catalog;
    std::unique_ptr<IntentStackStore> stacks;
    std::unique_ptr<KeywordClassifier> classifier;
    std::unique_ptr<TransferEngine> transfers;
    std::unique_ptr<SlotInheritanceEngine> inheritance;
    std::unique_ptr<InheritanceCache> cache;
    std::unique_ptr<StackSessionContext> session_context;
    std::unique_ptr<ConversationInheritance> conversation;

    bool open(const SandhiConfig& cfg) {
        config = cfg;
        if (!store.open(config.db_path)) {
            std::cerr << "Error: Failed to open database at " << config.db_path
                      << ": " << store.last_error() << "\n";
            return false;
        }
        size_t purged = store.purge_expired();
        if (purged > 0 && config.stack.verbose) {
            std::cerr << "[sandhi] Purged " << purged << " expired record(s)\n";
        }

        try {
            catalog.load(config.intents);
        } catch (const json::exception& e) {
            std::cerr << "Error: bad intent catalog: " << e.what() << "\n";
            return false;
        }
        catalog.add_system_intents(SYSTEM_INTENTS);

        stacks = std::make_unique<IntentStackStore>(store, catalog, config.stack);
        classifier = std::make_unique<KeywordClassifier>(catalog);
        transfers = std::make_unique<TransferEngine>(*stacks, store, *classifier, config.transfer);
        transfers->install_default_rules();
        if (!config.transfer_rules.empty()) {
            std::string error;
            transfers->load_rules(config.transfer_rules, &error);
            if (!error.empty()) std::cerr << "[sandhi] Transfer rules: " << error << "\n";
        }

        inheritance = std::make_unique<SlotInheritanceEngine>(TransformRegistry::with_builtins(),
                                                              config.inheritance.verbose);
        cache = std::make_unique<InheritanceCache>(store, config.cache);
        session_context = std::make_unique<StackSessionContext>(*stacks);
        conversation = std::make_unique<ConversationInheritance>(
            *inheritance, cache.get(), nullptr, session_context.get(), nullptr,
            config.inheritance);
        return true;
    }
};

int cmd_push(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.size() < 3) {
        std::cerr << "Usage: sandhi push <session> <user> <intent> [context-json]\n";
        return 1;
    }
    ValueMap context;
    if (args.size() > 3) {
        try {
            context = json::parse(args[3]).get<ValueMap>();
        } catch (const json::exception& e) {
            std::cerr << "Error: context must be a JSON object: " << e.what() << "\n";
            return 1;
        }
    }

    auto result = rt.stacks->push(args[0], args[1], args[2], context);
    if (!result.ok()) return report_failure("push", result);

    if (json_output) {
        std::cout << json{{"frame", *result.frame}, {"depth", result.depth}}.dump(2) << "\n";
    } else {
        std::cout << "Pushed " << result.frame->intent_name << " (" << result.frame->frame_id
                  << "), depth " << result.depth << "\n";
    }
    return 0;
}

int cmd_pop(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.empty()) {
        std::cerr << "Usage: sandhi pop <session>\n";
        return 1;
    }
    auto result = rt.stacks->pop(args[0], "completed from cli");
    if (!result.ok()) return report_failure("pop", result);

    if (json_output) {
        json out = {{"frame", nullptr}, {"resumed", nullptr}, {"depth", result.depth}};
        if (result.frame) out["frame"] = *result.frame;
        if (result.resumed) out["resumed"] = *result.resumed;
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    if (!result.frame) {
        std::cout << "Stack is empty\n";
        return 0;
    }
    std::cout << "Completed " << result.frame->intent_name << ", depth " << result.depth << "\n";
    if (result.resumed) std::cout << "Resumed " << result.resumed->intent_name << "\n";
    return 0;
}

int cmd_show(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.empty()) {
        std::cerr << "Usage: sandhi show <session>\n";
        return 1;
    }
    auto frames = rt.stacks->frames(args[0]);
    if (json_output) {
        std::cout << json(frames).dump(2) << "\n";
        return 0;
    }
    std::cout << "Session " << args[0] << " (" << frames.size() << "/"
              << rt.config.stack.max_depth << ")\n";
    std::cout << "═══════════════════════════════\n";
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) print_frame(*it);
    return 0;
}

int cmd_stats(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.empty()) {
        std::cerr << "Usage: sandhi stats <session>\n";
        return 1;
    }
    auto stats = rt.stacks->statistics(args[0]);
    if (json_output) {
        std::cout << json(stats).dump(2) << "\n";
        return 0;
    }
    std::cout << "Stack Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Frames:       " << stats.total_frames << "\n";
    std::cout << "  Active:       " << (stats.active_intent.empty() ? "-" : stats.active_intent) << "\n";
    std::cout << "  Utilization:  " << std::fixed << std::setprecision(2) << stats.utilization << "\n";
    std::cout << "  Avg progress: " << stats.average_progress << "\n";
    for (const auto& [status, count] : stats.status_counts) {
        std::cout << "  " << std::left << std::setw(13) << (status + ":") << count << "\n";
    }
    return 0;
}

int cmd_turn(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.size() < 3) {
        std::cerr << "Usage: sandhi turn <session> <user> <text>\n";
        return 1;
    }
    const std::string& session = args[0];
    const std::string& user = args[1];
    const std::string& text = args[2];

    json out = json::object();
    auto current = rt.stacks->active(session);

    if (!current) {
        // Nothing to transfer from; start the conversation with the best guess
        auto guess = rt.classifier->classify(text, {});
        if (!rt.catalog.find(guess.intent)) {
            std::cerr << "No active intent and \"" << text << "\" was not recognized\n";
            return 1;
        }
        auto pushed = rt.stacks->push(session, user, guess.intent);
        if (!pushed.ok()) return report_failure("push", pushed);
        out["started"] = guess.intent;
    } else {
        ValueMap context = current->collected_slots;
        auto decision = rt.transfers->evaluate(session, user, current->intent_name, text, context);
        out["decision"] = decision;
        if (decision.should_transfer) {
            auto applied = rt.transfers->execute(session, user, decision, context);
            if (!applied.ok()) return report_failure("transfer", applied);
        }
    }
    rt.transfers->record_activity(session);

    auto filled = rt.conversation->fill_active_frame(*rt.stacks, session);
    if (!filled.ok() && filled.error != ErrorCode::FrameNotFound) {
        return report_failure("inheritance", filled);
    }
    out["inherited"] = filled.inheritance.inherited();
    out["inheritance_sources"] = filled.inheritance.sources;
    out["from_cache"] = filled.inheritance.from_cache;

    if (json_output) {
        out["stack"] = rt.stacks->frames(session);
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (out.contains("started")) {
        std::cout << "Started " << out["started"].get<std::string>() << "\n";
    } else {
        const json& d = out["decision"];
        if (d["should_transfer"].get<bool>()) {
            std::cout << "Transfer -> " << d["target_intent"].get<std::string>()
                      << " (" << d["transfer_type"].get<std::string>() << ", "
                      << d["reason"].get<std::string>() << ")\n";
        } else {
            std::cout << "Staying: " << d["reason"].get<std::string>() << "\n";
        }
    }
    for (const auto& [slot, source] : filled.inheritance.sources) {
        std::cout << "  inherited " << slot << " from " << source << "\n";
    }
    auto frames = rt.stacks->frames(session);
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) print_frame(*it);
    return 0;
}

int cmd_sweep(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (!args.empty()) {
        auto result = rt.stacks->sweep_expired(args[0]);
        if (!result.ok()) return report_failure("sweep", result);
        if (json_output) {
            std::cout << json{{"removed", result.removed}, {"depth", result.depth}}.dump(2) << "\n";
        } else {
            std::cout << "Removed " << result.removed.size() << " expired frame(s), depth "
                      << result.depth << "\n";
        }
        return 0;
    }

    ExpirySweeper sweeper(*rt.stacks, rt.config.sweeper);
    size_t expired = sweeper.run_once();
    auto stats = sweeper.stats();
    if (json_output) {
        std::cout << json{{"sessions", stats.sessions_swept}, {"expired", expired},
                          {"failures", stats.failures}}.dump(2) << "\n";
    } else {
        std::cout << "Swept " << stats.sessions_swept << " session(s), removed "
                  << expired << " expired frame(s)\n";
    }
    return stats.failures == 0 ? 0 : 1;
}

int cmd_rules(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    auto rules = args.empty() ? rt.transfers->rules() : rt.transfers->rules_for(args[0]);
    if (json_output) {
        std::cout << json(rules).dump(2) << "\n";
        return 0;
    }
    for (const auto& r : rules) {
        std::cout << std::left << std::setw(22) << r.id << " " << r.from.str() << " -> "
                  << r.to.str() << "  " << trigger_name(r.trigger)
                  << "  priority " << r.priority << (r.enabled ? "" : "  (disabled)") << "\n";
    }
    return 0;
}

int cmd_history(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.empty()) {
        std::cerr << "Usage: sandhi history <session>\n";
        return 1;
    }
    auto records = rt.transfers->history(args[0], rt.config.transfer.history_limit);
    auto stats = rt.transfers->statistics(args[0]);
    if (json_output) {
        std::cout << json{{"history", records}, {"statistics", stats}}.dump(2) << "\n";
        return 0;
    }
    for (const auto& r : records) {
        std::cout << "  " << (r.from_intent.empty() ? "-" : r.from_intent) << " -> "
                  << r.to_intent << "  " << r.trigger << "  " << r.reason << "\n";
    }
    std::cout << "Total: " << stats.total << ", avg confidence "
              << std::fixed << std::setprecision(2) << stats.average_confidence << "\n";
    return 0;
}

int cmd_cache_stats(Runtime& rt, bool json_output) {
    size_t entries = rt.cache->entry_count();
    if (json_output) {
        json out = rt.cache->statistics();
        out["entries"] = entries;
        std::cout << out.dump(2) << "\n";
    } else {
        std::cout << "Inheritance cache entries: " << entries << "\n";
    }
    return 0;
}

int cmd_invalidate_user(Runtime& rt, const std::vector<std::string>& args, bool json_output) {
    if (args.empty()) {
        std::cerr << "Usage: sandhi invalidate-user <user>\n";
        return 1;
    }
    size_t removed = rt.cache->invalidate_user(args[0]);
    if (json_output) {
        std::cout << json{{"removed", removed}}.dump() << "\n";
    } else {
        std::cout << "Removed " << removed << " cached result(s)\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string config_path;
    std::string command;
    std::vector<std::string> args;
    bool json_output = false;
    bool verbose = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "sandhi " << SANDHI_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' || command.size() > 0) {
            if (command.empty()) {
                command = argv[i];
            } else {
                args.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "sandhi " << SANDHI_VERSION << " (cache format "
                  << SANDHI_CACHE_FORMAT_VERSION << ")\n";
        return 0;
    }

    SandhiConfig config;
    if (!config_path.empty()) {
        std::string error;
        auto loaded = load_config(config_path, &error);
        if (!loaded) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        config = std::move(*loaded);
    } else {
        apply_env_overrides(config);
    }
    if (!db_path.empty()) config.db_path = db_path;
    if (verbose) {
        config.stack.verbose = true;
        config.transfer.verbose = true;
        config.inheritance.verbose = true;
        config.cache.verbose = true;
    }

    Runtime rt;
    try {
        if (!rt.open(config)) return 1;

        if (command == "push") return cmd_push(rt, args, json_output);
        if (command == "pop") return cmd_pop(rt, args, json_output);
        if (command == "show") return cmd_show(rt, args, json_output);
        if (command == "stats") return cmd_stats(rt, args, json_output);
        if (command == "turn") return cmd_turn(rt, args, json_output);
        if (command == "sweep") return cmd_sweep(rt, args, json_output);
        if (command == "rules") return cmd_rules(rt, args, json_output);
        if (command == "history") return cmd_history(rt, args, json_output);
        if (command == "cache-stats") return cmd_cache_stats(rt, json_output);
        if (command == "invalidate-user") return cmd_invalidate_user(rt, args, json_output);
    } catch (const StoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
