#include <sandhi/sandhi.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <chrono>
#include <atomic>
#include <unistd.h>

using namespace sandhi;

// Deterministic time for TTL and expiry checks
struct ManualClock {
    Timestamp t = 1700000000000;

    Clock fn() {
        return [this]() { return t; };
    }

    void advance(int64_t seconds) {
        t += seconds_to_ms(seconds);
    }
};

void fill_catalog(StaticIntentCatalog& catalog) {
    IntentInfo book;
    book.name = "book_flight";
    book.id = "intent_book_flight";
    book.required_slots = {"departure_city", "arrival_city", "departure_date"};
    book.keywords = {"flight", "机票", "ticket"};
    catalog.add(book);

    IntentInfo balance;
    balance.name = "check_balance";
    balance.required_slots = {"card_number"};
    balance.keywords = {"balance", "余额"};
    catalog.add(balance);

    IntentInfo cancel;
    cancel.name = "cancel_flight";
    cancel.required_slots = {"order_id"};
    cancel.keywords = {"cancel"};
    catalog.add(cancel);

    catalog.add_system_intents({"timeout", "error-recovery", "session-end"});
}

class FixedClassifier : public Classifier {
public:
    Classification result{"unknown", 0.3};
    bool fail = false;

    Classification classify(const std::string&, const ValueMap&) override {
        if (fail) throw std::runtime_error("classifier down");
        return result;
    }
};

class SlowClassifier : public Classifier {
public:
    Classification classify(const std::string&, const ValueMap&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return {"book_flight", 0.99};
    }
};

class StubSession : public SessionContextSource {
public:
    ValueMap context;
    bool fail = false;

    ValueMap current_context(const std::string&) override {
        if (fail) throw std::runtime_error("session store down");
        return context;
    }
};

class StubProfile : public ProfileSource {
public:
    UserProfile data;
    bool fail = false;
    std::atomic<int> calls{0};

    UserProfile profile(const std::string&) override {
        calls++;
        if (fail) throw std::runtime_error("profile service down");
        return data;
    }
};

class SlowProfile : public ProfileSource {
public:
    UserProfile profile(const std::string&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return {};
    }
};

class StubHistory : public HistorySource {
public:
    SourceMap values;

    SourceMap recent_slot_values(const std::string&, size_t) override {
        return values;
    }
};

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

std::string skip_reason(const InheritanceResult& r, const std::string& target) {
    for (const auto& [rule, reason] : r.skipped) {
        if (rule.target_slot == target) return reason;
    }
    return "";
}

size_t count_active(const std::vector<IntentFrame>& frames) {
    size_t n = 0;
    for (const auto& f : frames) {
        if (f.status == FrameStatus::Active) ++n;
    }
    return n;
}

// ═══════════════════════════════════════════════════════════════════════════
// Intent stack
// ═══════════════════════════════════════════════════════════════════════════

void test_push_interrupt_pop_resume() {
    std::cout << "Testing push/interrupt/pop/resume..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    auto first = stacks.push("s1", "u1", "book_flight");
    assert(first.ok());
    assert(first.depth == 1);
    assert(first.frame->intent_id == "intent_book_flight");
    assert(first.frame->missing_slots.size() == 3);
    assert(first.frame->parent_frame_id.empty());

    auto second = stacks.push("s1", "u1", "check_balance", {},
                              InterruptionKind::UserInitiated);
    assert(second.ok());
    assert(second.depth == 2);

    auto frames = stacks.frames("s1");
    assert(frames.size() == 2);
    assert(frames[0].status == FrameStatus::Interrupted);
    assert(frames[0].interruption_kind == InterruptionKind::UserInitiated);
    assert(frames[1].status == FrameStatus::Active);
    assert(frames[1].depth == 1);
    assert(frames[1].parent_frame_id == frames[0].frame_id);

    auto popped = stacks.pop("s1");
    assert(popped.ok());
    assert(popped.frame->intent_name == "check_balance");
    assert(popped.frame->status == FrameStatus::Completed);
    assert(popped.resumed && popped.resumed->intent_name == "book_flight");
    assert(popped.depth == 1);

    frames = stacks.frames("s1");
    assert(frames.size() == 1);
    assert(frames[0].status == FrameStatus::Active);
    assert(stacks.active("s1")->intent_name == "book_flight");

    std::cout << "  PASS" << std::endl;
}

void test_depth_bound() {
    std::cout << "Testing stack depth bound..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    StackConfig config;
    config.max_depth = 3;
    IntentStackStore stacks(store, catalog, config, clock.fn());

    assert(stacks.push("s", "u", "book_flight").ok());
    assert(stacks.push("s", "u", "check_balance").ok());
    assert(stacks.push("s", "u", "cancel_flight").ok());
    std::string before = *store.get(std::string(STACK_KEY_PREFIX) + "s");

    auto overflow = stacks.push("s", "u", "book_flight");
    assert(overflow.error == ErrorCode::StackOverflow);
    assert(overflow.depth == 3);
    assert(!overflow.frame);

    // Rejected push leaves the stored stack byte-identical
    assert(*store.get(std::string(STACK_KEY_PREFIX) + "s") == before);
    auto frames = stacks.frames("s");
    assert(frames.size() == 3);
    assert(count_active(frames) == 1);
    assert(frames.back().status == FrameStatus::Active);

    // Replacing the top of a full stack is allowed
    auto replaced = stacks.replace_top("s", "u", "book_flight");
    assert(replaced.ok());
    assert(replaced.depth == 3);
    assert(replaced.replaced && replaced.replaced->intent_name == "cancel_flight");
    assert(replaced.replaced->status == FrameStatus::Completed);
    frames = stacks.frames("s");
    assert(frames.back().intent_name == "book_flight");
    assert(count_active(frames) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_single_active_invariant() {
    std::cout << "Testing single active frame..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    const char* sequence[] = {"book_flight", "check_balance", "cancel_flight", "book_flight"};
    for (const char* intent : sequence) {
        assert(stacks.push("s", "u", intent).ok());
        auto frames = stacks.frames("s");
        assert(count_active(frames) == 1);
        assert(frames.back().status == FrameStatus::Active);
    }
    while (!stacks.frames("s").empty()) {
        assert(stacks.pop("s").ok());
        auto frames = stacks.frames("s");
        assert(count_active(frames) <= 1);
        if (!frames.empty()) assert(frames.back().status == FrameStatus::Active);
    }
    // Empty stack leaves no record behind
    assert(!store.get(std::string(STACK_KEY_PREFIX) + "s"));

    std::cout << "  PASS" << std::endl;
}

void test_push_pop_inverse() {
    std::cout << "Testing push then pop restores the stack..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    assert(stacks.push("s", "u", "book_flight").ok());
    auto top = stacks.peek("s");
    assert(stacks.update_slots("s", top->frame_id, {{"departure_city", "北京"}}).ok());
    auto before = stacks.frames("s");

    assert(stacks.push("s", "u", "check_balance").ok());
    auto popped = stacks.pop("s");
    assert(popped.ok());

    auto after = stacks.frames("s");
    assert(after.size() == before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        assert(after[i].frame_id == before[i].frame_id);
        assert(after[i].intent_name == before[i].intent_name);
        assert(after[i].status == before[i].status);
        assert(after[i].collected_slots == before[i].collected_slots);
        assert(after[i].depth == before[i].depth);
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_pushes() {
    std::cout << "Testing concurrent pushes on one session..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    const std::vector<std::string> intents = {
        "book_flight", "check_balance", "cancel_flight", "book_flight", "check_balance"
    };
    std::atomic<int> pushed{0};
    std::vector<std::thread> workers;
    for (const auto& intent : intents) {
        workers.emplace_back([&stacks, &pushed, intent]() {
            if (stacks.push("shared", "u", intent, {}, InterruptionKind::UserInitiated).ok()) {
                ++pushed;
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(pushed == static_cast<int>(intents.size()));
    auto frames = stacks.frames("shared");
    assert(frames.size() == intents.size());
    assert(count_active(frames) == 1);
    assert(frames.back().status == FrameStatus::Active);
    for (size_t i = 0; i < frames.size(); ++i) {
        assert(frames[i].depth == i);
        if (i == 0) {
            assert(frames[i].parent_frame_id.empty());
        } else {
            assert(frames[i].parent_frame_id == frames[i - 1].frame_id);
            assert(frames[i - 1].status == FrameStatus::Interrupted);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_session_locks_released() {
    std::cout << "Testing session locks are released..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    for (int i = 0; i < 50; ++i) {
        std::string session = "lock_" + std::to_string(i);
        assert(stacks.push(session, "u", "book_flight").ok());
        assert(stacks.peek(session));
        assert(stacks.pop(session, "done").ok());
        assert(stacks.clear(session).ok());
    }
    assert(stacks.tracked_sessions() == 0);

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&stacks, i]() {
            std::string session = "busy_" + std::to_string(i % 2);
            for (int j = 0; j < 20; ++j) {
                stacks.frames(session);
                stacks.statistics(session);
            }
        });
    }
    for (auto& w : workers) w.join();
    assert(stacks.tracked_sessions() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_unknown_intent_and_empty_pop() {
    std::cout << "Testing unknown intent and empty pop..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    auto result = stacks.push("s", "u", "fly_to_moon");
    assert(result.error == ErrorCode::UnknownIntent);
    assert(!store.get(std::string(STACK_KEY_PREFIX) + "s"));

    auto popped = stacks.pop("s");
    assert(popped.ok());
    assert(!popped.frame);
    assert(popped.depth == 0);

    auto replaced = stacks.replace_top("s", "u", "fly_to_moon");
    assert(replaced.error == ErrorCode::UnknownIntent);

    std::cout << "  PASS" << std::endl;
}

void test_update_slots_progress() {
    std::cout << "Testing slot updates and progress..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    auto pushed = stacks.push("s", "u", "book_flight");
    const std::string id = pushed.frame->frame_id;
    assert(near(pushed.frame->completion_progress, 0.0));

    clock.advance(5);
    auto updated = stacks.update_slots("s", id, {{"departure_city", "北京"}});
    assert(updated.ok());
    assert(near(updated.frame->completion_progress, 1.0 / 3.0));
    assert(updated.frame->missing_slots.size() == 2);
    assert(updated.frame->updated_at == clock.t);

    // Empty strings do not count as filled
    updated = stacks.update_slots("s", id, {{"arrival_city", ""}});
    assert(near(updated.frame->completion_progress, 1.0 / 3.0));
    assert(updated.frame->missing_slots.size() == 2);

    updated = stacks.update_slots("s", id, {{"arrival_city", "上海"}, {"departure_date", "2024-03-01"}});
    assert(near(updated.frame->completion_progress, 1.0));
    assert(updated.frame->missing_slots.empty());

    // An explicit missing list is replaced, then pruned
    updated = stacks.update_slots("s", id, {}, std::vector<std::string>{"seat", "arrival_city"});
    assert(updated.frame->missing_slots.size() == 1);
    assert(updated.frame->missing_slots[0] == "seat");

    auto ctx = stacks.update_context("s", id, {{"channel", "app"}});
    assert(ctx.ok());
    assert(ctx.frame->saved_context.at("channel") == "app");

    auto missing = stacks.update_slots("s", "frame_nope", {{"x", 1}});
    assert(missing.error == ErrorCode::FrameNotFound);
    missing = stacks.update_context("s", "frame_nope", {{"x", 1}});
    assert(missing.error == ErrorCode::FrameNotFound);

    // Intents without required slots are complete from the start
    auto system = stacks.push("s", "u", "timeout");
    assert(near(system.frame->completion_progress, 1.0));

    std::cout << "  PASS" << std::endl;
}

void test_sweep_expired() {
    std::cout << "Testing expiry sweep..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    StackConfig config;
    config.frame_ttl_seconds = 60;
    IntentStackStore stacks(store, catalog, config, clock.fn());

    // Interior frame expires on its own; the active top is untouched
    assert(stacks.push("a", "u", "book_flight").ok());
    clock.advance(30);
    assert(stacks.push("a", "u", "check_balance").ok());
    clock.advance(40);

    auto swept = stacks.sweep_expired("a");
    assert(swept.ok());
    assert(swept.removed.size() == 1);
    assert(swept.removed[0].intent_name == "book_flight");
    assert(swept.removed[0].status == FrameStatus::Expired);
    assert(!swept.resumed);
    assert(swept.depth == 1);
    auto frames = stacks.frames("a");
    assert(frames.size() == 1);
    assert(frames[0].intent_name == "check_balance");
    assert(frames[0].status == FrameStatus::Active);
    assert(frames[0].depth == 0);
    assert(frames[0].parent_frame_id.empty());

    // Expired top: the surviving frame beneath resumes
    StackConfig long_lived;
    long_lived.frame_ttl_seconds = 1000;
    IntentStackStore durable(store, catalog, long_lived, clock.fn());
    assert(durable.push("b", "u", "book_flight").ok());
    assert(stacks.push("b", "u", "check_balance").ok());
    clock.advance(100);

    swept = stacks.sweep_expired("b");
    assert(swept.removed.size() == 1);
    assert(swept.resumed && swept.resumed->intent_name == "book_flight");
    assert(stacks.active("b")->intent_name == "book_flight");

    // Everything expired: the record is removed
    clock.advance(2000);
    swept = stacks.sweep_expired("b");
    assert(swept.removed.size() == 1);
    assert(swept.depth == 0);
    assert(!store.get(std::string(STACK_KEY_PREFIX) + "b"));

    // Nothing to do
    swept = stacks.sweep_expired("nobody");
    assert(swept.ok() && swept.removed.empty());

    std::cout << "  PASS" << std::endl;
}

void test_corrupt_stack() {
    std::cout << "Testing corrupt stack handling..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    const std::string key = std::string(STACK_KEY_PREFIX) + "bad";
    store.set(key, "not json at all");

    auto pushed = stacks.push("bad", "u", "book_flight");
    assert(pushed.error == ErrorCode::CorruptState);
    assert(*store.get(key) == "not json at all");

    bool threw = false;
    try {
        stacks.frames("bad");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    store.set(key, R"([{"frame_id":"f1","intent_name":"book_flight","status":"weird"}])");
    auto popped = stacks.pop("bad");
    assert(popped.error == ErrorCode::CorruptState);

    // clear() is the way out
    auto cleared = stacks.clear("bad");
    assert(cleared.ok() && cleared.existed);
    assert(stacks.push("bad", "u", "book_flight").ok());

    std::cout << "  PASS" << std::endl;
}

void test_stack_statistics() {
    std::cout << "Testing stack statistics..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());

    auto empty = stacks.statistics("s");
    assert(empty.total_frames == 0);
    assert(empty.status_counts.at("active") == 0);
    assert(empty.active_intent.empty());

    Timestamp first_at = clock.t;
    assert(stacks.push("s", "u", "book_flight").ok());
    clock.advance(10);
    assert(stacks.push("s", "u", "check_balance").ok());

    auto stats = stacks.statistics("s");
    assert(stats.total_frames == 2);
    assert(stats.current_depth == 2);
    assert(stats.active_intent == "check_balance");
    assert(stats.status_counts.at("active") == 1);
    assert(stats.status_counts.at("interrupted") == 1);
    assert(stats.status_counts.at("completed") == 0);
    assert(stats.interruption_types.at("user_initiated") == 1);
    assert(near(stats.utilization, 0.4));
    assert(stats.oldest_frame_at == first_at);
    assert(stats.newest_frame_at == clock.t);

    json j = stats;
    assert(near(j["stack_utilization"].get<double>(), 0.4));
    assert(j["active_intent"] == "check_balance");

    auto sessions = stacks.sessions();
    assert(sessions.size() == 1 && sessions[0] == "s");
    assert(stacks.clear("s").existed);
    assert(!stacks.clear("s").existed);
    assert(stacks.sessions().empty());

    std::cout << "  PASS" << std::endl;
}

void test_frame_serialization() {
    std::cout << "Testing frame serialization..." << std::endl;

    IntentFrame f;
    f.frame_id = "frame_000000000001";
    f.intent_name = "book_flight";
    f.intent_id = "intent_book_flight";
    f.status = FrameStatus::Interrupted;
    f.interruption_kind = InterruptionKind::SystemSuggestion;
    f.collected_slots = {{"departure_city", "北京"}};

    json j = f;
    assert(j["interruption_type"] == "system_suggestion");
    assert(j["parent_frame_id"].is_null());
    assert(j["status"] == "interrupted");

    IntentFrame back = j.get<IntentFrame>();
    assert(back.frame_id == f.frame_id);
    assert(back.status == FrameStatus::Interrupted);
    assert(back.interruption_kind == InterruptionKind::SystemSuggestion);
    assert(back.collected_slots == f.collected_slots);

    bool threw = false;
    try {
        json{{"intent_name", "x"}}.get<IntentFrame>();
    } catch (const CorruptStateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Storage
// ═══════════════════════════════════════════════════════════════════════════

void test_memory_store() {
    std::cout << "Testing MemoryStore..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());

    store.set("a:1", "one");
    store.set("a:2", "two", 10);
    store.set("b:1", "three");
    assert(*store.get("a:1") == "one");

    auto keys = store.keys_with_prefix("a:");
    assert(keys.size() == 2 && keys[0] == "a:1" && keys[1] == "a:2");

    clock.advance(11);
    assert(!store.get("a:2"));
    assert(store.keys_with_prefix("a:").size() == 1);

    assert(store.delete_by_prefix("a:") == 1);
    assert(!store.get("a:1"));
    assert(store.del("b:1"));
    assert(!store.del("b:1"));

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_store() {
    std::cout << "Testing SqliteStore..." << std::endl;

    const std::string path = "/tmp/sandhi_test_" + std::to_string(getpid()) + ".db";
    std::remove(path.c_str());

    ManualClock clock;
    {
        SqliteStore store(clock.fn());
        assert(store.open(path));

        store.set("inheritance:u%3A1:x:a:fp", "v1");
        store.set("inheritance:u:x:a:fp", "v2", 5);
        store.set("other", "v3");
        assert(*store.get("inheritance:u:x:a:fp") == "v2");

        // '%' in keys is literal for prefix matching
        auto keys = store.keys_with_prefix("inheritance:u%3A1:");
        assert(keys.size() == 1);

        clock.advance(6);
        assert(!store.get("inheritance:u:x:a:fp"));
        assert(store.keys_with_prefix("inheritance:").size() == 1);

        store.set("short", "x", 1);
        clock.advance(2);
        assert(store.purge_expired() == 1);

        assert(store.delete_by_prefix("inheritance:") == 1);
        assert(store.del("other"));
        assert(!store.del("other"));

        // Stacks survive a reopen
        StaticIntentCatalog catalog;
        fill_catalog(catalog);
        IntentStackStore stacks(store, catalog, {}, clock.fn());
        assert(stacks.push("persist", "u", "book_flight").ok());
        store.close();

        bool threw = false;
        try {
            store.get("anything");
        } catch (const StoreError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        SqliteStore store(clock.fn());
        assert(store.open(path));
        StaticIntentCatalog catalog;
        fill_catalog(catalog);
        IntentStackStore stacks(store, catalog, {}, clock.fn());
        auto frames = stacks.frames("persist");
        assert(frames.size() == 1);
        assert(frames[0].intent_name == "book_flight");
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Transfer rules
// ═══════════════════════════════════════════════════════════════════════════

void test_cancel_returns_to_previous() {
    std::cout << "Testing cancel returns to previous intent..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());

    TransferRule cancel;
    cancel.id = "cancel";
    cancel.to = IntentPattern::previous();
    cancel.trigger = TriggerKind::UserClarification;
    cancel.conditions = {ConditionKind::PatternMatch};
    cancel.patterns = {"cancel"};
    cancel.priority = 0;
    engine.add_rule(cancel);

    // Single frame: nothing beneath, no history
    assert(stacks.push("s1", "u", "book_flight").ok());
    auto d = engine.evaluate("s1", "u", "book_flight", "cancel");
    assert(d.should_transfer);
    assert(d.transfer_type == TransferType::PopOnly);
    assert(d.to_previous);
    assert(d.target_intent == "unknown");
    assert(d.rule_id == "cancel");

    // Two frames: the one beneath
    assert(stacks.push("s2", "u", "check_balance").ok());
    assert(stacks.push("s2", "u", "book_flight").ok());
    d = engine.evaluate("s2", "u", "book_flight", "Cancel");
    assert(d.should_transfer);
    assert(d.target_intent == "check_balance");

    auto applied = engine.execute("s2", "u", d);
    assert(applied.ok());
    assert(applied.removed && applied.removed->intent_name == "book_flight");
    assert(applied.active && applied.active->intent_name == "check_balance");
    assert(applied.depth == 1);

    auto history = engine.history("s2");
    assert(history.size() == 1);
    assert(history[0].from_intent == "book_flight");
    assert(history[0].to_intent == "check_balance");
    assert(history[0].trigger == "user_clarification");
    assert(history[0].transfer_type == "pop_only");

    // One level after a swap: the swapped-out intent is not beneath it
    assert(stacks.push("s3", "u", "check_balance").ok());
    TransferDecision change;
    change.should_transfer = true;
    change.target_intent = "book_flight";
    change.trigger = TriggerKind::ExplicitChange;
    change.transfer_type = TransferType::PopThenPush;
    change.confidence = 0.9;
    change.reason = "explicit";
    auto swapped = engine.execute("s3", "u", change);
    assert(swapped.ok());
    assert(swapped.removed->intent_name == "check_balance");
    assert(swapped.depth == 1);

    d = engine.evaluate("s3", "u", "book_flight", "cancel that");
    assert(d.should_transfer);
    assert(d.transfer_type == TransferType::PopOnly);
    assert(d.target_intent == "unknown");

    auto popped = engine.execute("s3", "u", d);
    assert(popped.ok());
    assert(popped.removed && popped.removed->intent_name == "book_flight");
    assert(!popped.active);
    assert(popped.depth == 0);
    assert(engine.history("s3").front().to_intent == "unknown");

    std::cout << "  PASS" << std::endl;
}

void test_rule_priority_determinism() {
    std::cout << "Testing rule priority determinism..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());
    engine.install_default_rules();
    assert(engine.rule_count() == 4);

    const std::string input = "what is my balance";

    // High confidence: explicit change (priority 1) beats the interruption (2)
    classifier.result = {"check_balance", 0.9};
    auto d = engine.evaluate("s", "u", "book_flight", input);
    assert(d.should_transfer);
    assert(d.rule_id == "explicit_change_all");
    assert(d.transfer_type == TransferType::PopThenPush);
    assert(!d.save_context);
    for (int i = 0; i < 5; ++i) {
        assert(engine.evaluate("s", "u", "book_flight", input).rule_id == "explicit_change_all");
    }

    // Lower confidence falls through to the balance interruption
    classifier.result = {"check_balance", 0.7};
    d = engine.evaluate("s", "u", "book_flight", input);
    assert(d.rule_id == "query_interruption");
    assert(d.trigger == TriggerKind::Interruption);
    assert(d.transfer_type == TransferType::PushOnly);
    assert(d.save_context);
    assert(d.target_intent == "check_balance");

    // On equal priority an intent-specific rule precedes a wildcard one
    TransferRule specific;
    specific.id = "book_specific";
    specific.from = IntentPattern::specific("book_flight");
    specific.trigger = TriggerKind::ContextDriven;
    specific.conditions = {ConditionKind::ConfidenceThreshold};
    specific.confidence_threshold = 0.5;
    specific.priority = 1;
    engine.add_rule(specific);
    classifier.result = {"check_balance", 0.9};
    d = engine.evaluate("s", "u", "book_flight", input);
    assert(d.rule_id == "book_specific");
    assert(d.transfer_type == TransferType::PushOnly);

    // Re-adding by id replaces; a disabled rule is ignored
    specific.enabled = false;
    engine.add_rule(specific);
    assert(engine.rule_count() == 5);
    d = engine.evaluate("s", "u", "book_flight", input);
    assert(d.rule_id == "explicit_change_all");

    assert(engine.remove_rule("book_specific"));
    assert(!engine.remove_rule("book_specific"));
    assert(engine.rule_count() == 4);

    auto ordered = engine.rules_for("check_balance");
    for (size_t i = 1; i < ordered.size(); ++i) {
        assert(ordered[i - 1].priority <= ordered[i].priority);
    }

    std::cout << "  PASS" << std::endl;
}

void test_transfer_negatives() {
    std::cout << "Testing transfer negatives..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());
    engine.install_default_rules();

    classifier.result = {"book_flight", 0.95};
    auto d = engine.evaluate("s", "u", "book_flight", "flight please");
    assert(!d.should_transfer);
    assert(d.error == ErrorCode::None);

    classifier.result = {"cancel_flight", 0.5};
    d = engine.evaluate("s", "u", "book_flight", "hmm");
    assert(!d.should_transfer);
    assert(d.reason == "no transfer rule matched");
    assert(d.error == ErrorCode::None);

    // Classifier failure is reported, not a transfer
    classifier.fail = true;
    d = engine.evaluate("s", "u", "book_flight", "hmm");
    assert(!d.should_transfer);
    assert(d.error == ErrorCode::SourceUnavailable);

    // Executing a negative decision is rejected
    auto applied = engine.execute("s", "u", d);
    assert(applied.error == ErrorCode::InvalidArgument);

    // Popping an empty stack
    TransferDecision back;
    back.should_transfer = true;
    back.target_intent = "unknown";
    back.trigger = TriggerKind::UserClarification;
    back.transfer_type = TransferType::PopOnly;
    applied = engine.execute("empty", "u", back);
    assert(applied.error == ErrorCode::FrameNotFound);

    std::cout << "  PASS" << std::endl;
}

void test_condition_error_skips_rule() {
    std::cout << "Testing condition error skips one rule..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    classifier.result = {"cancel_flight", 0.9};
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());
    engine.install_default_rules();

    TransferRule needs_slots;
    needs_slots.id = "needs_slots";
    needs_slots.trigger = TriggerKind::ContextDriven;
    needs_slots.conditions = {ConditionKind::SlotCompletion};
    needs_slots.priority = 0;
    engine.add_rule(needs_slots);

    // Reading the active frame fails on this session's damaged stack
    store.set(std::string(STACK_KEY_PREFIX) + "broken", "garbage");
    auto d = engine.evaluate("broken", "u", "book_flight", "something else");
    assert(d.should_transfer);
    assert(d.rule_id == "explicit_change_all");

    // An explicit completion flag satisfies the condition without the stack
    d = engine.evaluate("broken", "u", "book_flight", "something else",
                        {{"slots_complete", true}});
    assert(d.rule_id == "needs_slots");

    std::cout << "  PASS" << std::endl;
}

void test_special_cases() {
    std::cout << "Testing special-case transfers..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    classifier.fail = true;   // Special cases never classify
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());

    // Inactivity
    assert(engine.record_activity("s"));
    assert(*engine.last_activity("s") == clock.t);
    clock.advance(1801);
    auto d = engine.evaluate("s", "u", "book_flight", "hello");
    assert(d.should_transfer);
    assert(d.trigger == TriggerKind::Timeout);
    assert(d.target_intent == "timeout");
    assert(d.transfer_type == TransferType::PushOnly);
    assert(near(d.confidence, 1.0));

    // Idle for hours still reads as a timeout
    assert(engine.record_activity("s"));
    clock.advance(2 * 3600);
    d = engine.evaluate("s", "u", "book_flight", "hello");
    assert(d.should_transfer);
    assert(d.trigger == TriggerKind::Timeout);

    engine.record_activity("s");

    // Repeated errors
    d = engine.evaluate("s", "u", "book_flight", "hello", {{"error_count", 3}});
    assert(d.trigger == TriggerKind::ErrorRecovery);
    assert(d.target_intent == "error-recovery");
    d = engine.evaluate("s", "u", "book_flight", "hello", {{"error_count", "3"}});
    assert(!d.should_transfer);
    assert(d.error == ErrorCode::SourceUnavailable);

    // Go back
    assert(stacks.push("b", "u", "check_balance").ok());
    assert(stacks.push("b", "u", "book_flight").ok());
    d = engine.evaluate("b", "u", "book_flight", "please Go Back");
    assert(d.should_transfer);
    assert(d.to_previous);
    assert(d.transfer_type == TransferType::PopOnly);
    assert(d.target_intent == "check_balance");
    assert(near(d.confidence, 0.9));

    // Exit
    d = engine.evaluate("b", "u", "book_flight", "I want to quit now");
    assert(d.should_transfer);
    assert(d.target_intent == "session-end");
    assert(d.transfer_type == TransferType::PushOnly);
    d = engine.evaluate("b", "u", "book_flight", "算了吧");
    assert(d.target_intent == "session-end");

    auto applied = engine.execute("b", "u", d);
    assert(applied.ok());
    assert(applied.active->intent_name == "session-end");
    auto frames = stacks.frames("b");
    assert(frames.size() == 3);
    assert(frames[1].interruption_kind == InterruptionKind::Clarification);

    // Timeout window longer than an hour
    TransferConfig long_window;
    long_window.session_timeout_seconds = 5400;
    TransferEngine patient(stacks, store, classifier, long_window, clock.fn());
    assert(patient.record_activity("p"));
    clock.advance(100 * 60);
    d = patient.evaluate("p", "u", "book_flight", "hello");
    assert(d.should_transfer);
    assert(d.trigger == TriggerKind::Timeout);
    patient.record_activity("p");
    clock.advance(60 * 60);
    d = patient.evaluate("p", "u", "book_flight", "hello");
    assert(d.trigger != TriggerKind::Timeout || !d.should_transfer);

    std::cout << "  PASS" << std::endl;
}

void test_classifier_timeout() {
    std::cout << "Testing classifier timeout..." << std::endl;

    // Outlives the detached call
    static SlowClassifier slow;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    TransferConfig config;
    config.classifier_timeout_ms = 50;
    TransferEngine engine(stacks, store, slow, config, clock.fn());
    engine.install_default_rules();

    auto started = std::chrono::steady_clock::now();
    auto d = engine.evaluate("s", "u", "check_balance", "book me a flight");
    auto elapsed = std::chrono::steady_clock::now() - started;
    assert(!d.should_transfer);
    assert(d.error == ErrorCode::SourceUnavailable);
    assert(elapsed < std::chrono::milliseconds(250));

    std::this_thread::sleep_for(std::chrono::milliseconds(350));

    std::cout << "  PASS" << std::endl;
}

void test_context_and_similarity_rules() {
    std::cout << "Testing context and similarity conditions..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());
    engine.install_default_rules();

    classifier.result = {"book_flight", 0.6};
    auto d = engine.evaluate("s", "u", "check_balance", "ok", {{"balance_sufficient", true}});
    assert(d.should_transfer);
    assert(d.rule_id == "booking_suggestion");
    assert(d.trigger == TriggerKind::SystemSuggestion);
    assert(d.save_context);

    d = engine.evaluate("s", "u", "check_balance", "ok", {{"balance_sufficient", false}});
    assert(!d.should_transfer);

    assert(near(token_similarity("book a flight", "book a flight"), 1.0));
    assert(near(token_similarity("Book a flight", "book flight"), 2.0 / 3.0));
    assert(near(token_similarity("订机票", "机票"), 2.0 / 3.0));
    assert(near(token_similarity("", "flight"), 0.0));

    TransferEngine similar(stacks, store, classifier, {}, clock.fn());
    TransferRule rule;
    rule.id = "similar";
    rule.trigger = TriggerKind::ContextDriven;
    rule.conditions = {ConditionKind::SemanticSimilarity};
    rule.patterns = {"book a flight ticket"};
    rule.similarity_threshold = 0.5;
    similar.add_rule(rule);

    classifier.result = {"book_flight", 0.5};
    d = similar.evaluate("s", "u", "check_balance", "book flight ticket");
    assert(d.should_transfer && d.rule_id == "similar");
    d = similar.evaluate("s", "u", "check_balance", "weather today");
    assert(!d.should_transfer);

    std::cout << "  PASS" << std::endl;
}

void test_execute_and_history() {
    std::cout << "Testing transfer execution and history..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferConfig config;
    config.history_limit = 3;
    TransferEngine engine(stacks, store, classifier, config, clock.fn());
    engine.install_default_rules();

    assert(stacks.push("s", "u", "book_flight").ok());
    classifier.result = {"check_balance", 0.7};
    ValueMap context = {{"departure_city", "北京"}};
    auto d = engine.evaluate("s", "u", "book_flight", "check my balance", context);
    assert(d.rule_id == "query_interruption");

    auto applied = engine.execute("s", "u", d, context);
    assert(applied.ok());
    assert(applied.applied == TransferType::PushOnly);
    assert(applied.active->intent_name == "check_balance");
    assert(applied.depth == 2);

    auto frames = stacks.frames("s");
    assert(frames[0].status == FrameStatus::Interrupted);
    assert(frames[0].interruption_kind == InterruptionKind::UserInitiated);
    assert(frames[0].saved_context.at("departure_city") == "北京");
    assert(*engine.last_activity("s") == clock.t);

    // History is newest first and bounded
    for (int i = 0; i < 4; ++i) {
        clock.advance(1);
        TransferDecision change;
        change.should_transfer = true;
        change.target_intent = i % 2 == 0 ? "cancel_flight" : "check_balance";
        change.trigger = TriggerKind::ExplicitChange;
        change.transfer_type = TransferType::PopThenPush;
        change.confidence = 0.8;
        assert(engine.execute("s", "u", change).ok());
    }
    auto history = engine.history("s", 10);
    assert(history.size() == 3);
    assert(history[0].to_intent == "check_balance");
    assert(history[0].at == clock.t);

    auto stats = engine.statistics("s");
    assert(stats.total == 3);
    assert(stats.by_trigger.at("explicit_change") == 3);
    assert(near(stats.average_confidence, 0.8));
    json j = stats;
    assert(j["total_transfers"] == 3);

    std::cout << "  PASS" << std::endl;
}

void test_load_rules() {
    std::cout << "Testing rule loading..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());

    json rules = json::parse(R"([
        {"id": "r1", "from": "book_flight", "to": "cancel_flight",
         "trigger": "explicit_change", "conditions": ["confidence_threshold"],
         "confidence_threshold": 0.6, "priority": 5},
        {"from": "*", "trigger": "interruption"},
        {"id": "r3", "trigger": "teleport"},
        {"id": "r4", "from": "previous", "trigger": "timeout"}
    ])");

    std::string error;
    assert(engine.load_rules(rules, &error) == 1);
    assert(!error.empty());
    assert(engine.rule_count() == 1);

    auto loaded = engine.rules_for("book_flight");
    assert(loaded.size() == 1);
    assert(loaded[0].id == "r1");
    assert(loaded[0].to.name == "cancel_flight");
    assert(near(loaded[0].confidence_threshold, 0.6));
    assert(engine.rules_for("check_balance").empty());

    classifier.result = {"cancel_flight", 0.65};
    auto d = engine.evaluate("s", "u", "book_flight", "drop it");
    assert(d.rule_id == "r1");

    json round = loaded[0];
    assert(round["from"] == "book_flight");
    assert(round["conditions"][0] == "confidence_threshold");

    error.clear();
    assert(engine.load_rules(json::object(), &error) == 0);
    assert(!error.empty());

    std::cout << "  PASS" << std::endl;
}

void test_rule_replacement_is_atomic() {
    std::cout << "Testing rule replacement is atomic..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    FixedClassifier classifier;
    TransferEngine engine(stacks, store, classifier, {}, clock.fn());

    TransferRule rule;
    rule.id = "swap";
    rule.from = IntentPattern::specific("book_flight");
    rule.to = IntentPattern::specific("check_balance");
    rule.trigger = TriggerKind::Interruption;
    rule.conditions = {ConditionKind::PatternMatch};
    rule.patterns = {"balance"};
    engine.add_rule(rule);

    std::atomic<bool> done{false};
    std::atomic<int> missing{0};
    std::thread reader([&]() {
        while (!done) {
            int seen = 0;
            for (const auto& r : engine.rules_for("book_flight")) {
                if (r.id == "swap") ++seen;
            }
            if (seen != 1) ++missing;
        }
    });
    for (int i = 0; i < 2000; ++i) {
        rule.priority = i % 7;
        engine.add_rule(rule);
    }
    done = true;
    reader.join();

    assert(missing == 0);
    assert(engine.rule_count() == 1);
    assert(engine.rules_for("book_flight").front().priority == 1999 % 7);

    std::cout << "  PASS" << std::endl;
}

void test_keyword_classifier() {
    std::cout << "Testing keyword classifier..." << std::endl;

    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    KeywordClassifier classifier(catalog);

    auto c = classifier.classify("I need a FLIGHT ticket", {});
    assert(c.intent == "book_flight");
    assert(near(c.confidence, 0.9));

    c = classifier.classify("查询余额", {});
    assert(c.intent == "check_balance");
    assert(near(c.confidence, 0.8));

    c = classifier.classify("good morning", {});
    assert(c.intent == KeywordClassifier::UNKNOWN_INTENT);
    assert(near(c.confidence, KeywordClassifier::UNKNOWN_CONFIDENCE));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Slot inheritance
// ═══════════════════════════════════════════════════════════════════════════

InheritanceRule make_rule(SourceKind source, const std::string& slot, int priority) {
    InheritanceRule r;
    r.source = source;
    r.source_slot = slot;
    r.target_slot = slot;
    r.priority = priority;
    return r;
}

void test_inheritance_priority() {
    std::cout << "Testing inheritance priority..." << std::endl;

    SourceBundle bundle;
    bundle.now = 1700000000000;
    bundle.set(SourceKind::Session, "departure_city", "北京");
    bundle.set(SourceKind::UserProfile, "departure_city", "上海");

    // Registration order does not matter
    for (int order = 0; order < 2; ++order) {
        SlotInheritanceEngine engine;
        auto session_rule = make_rule(SourceKind::Session, "departure_city", 10);
        auto profile_rule = make_rule(SourceKind::UserProfile, "departure_city", 5);
        if (order == 0) {
            engine.add_rule(session_rule);
            engine.add_rule(profile_rule);
        } else {
            engine.add_rule(profile_rule);
            engine.add_rule(session_rule);
        }

        auto result = engine.inherit({"departure_city"}, {}, bundle);
        assert(result.values.at("departure_city") == "北京");
        assert(result.sources.at("departure_city") == "session context (departure_city)");
        assert(result.applied.size() == 1);
        assert(skip_reason(result, "departure_city") == "already has value");
    }

    std::cout << "  PASS" << std::endl;
}

void test_inheritance_preserves_and_idempotent() {
    std::cout << "Testing inheritance keeps input and is idempotent..." << std::endl;

    SlotInheritanceEngine engine;
    engine.add_rule(make_rule(SourceKind::Session, "departure_city", 10));
    engine.add_rule(make_rule(SourceKind::Session, "arrival_city", 10));

    SourceBundle bundle;
    bundle.now = 1700000000000;
    bundle.set(SourceKind::Session, "departure_city", "北京");
    bundle.set(SourceKind::Session, "arrival_city", "广州");

    ValueMap current = {{"passengers", 2}, {"departure_city", ""}, {"arrival_city", "上海"}};
    auto first = engine.inherit({"departure_city", "arrival_city"}, current, bundle);
    for (const auto& [key, _] : current) assert(first.values.count(key));
    assert(first.values.at("passengers") == 2);
    assert(first.values.at("arrival_city") == "上海");
    assert(first.values.at("departure_city") == "北京");
    assert(first.inherited().size() == 1);

    // Slots not required are left alone
    auto partial = engine.inherit({"arrival_city"}, current, bundle);
    assert(partial.values.at("departure_city") == "");

    auto second = engine.inherit({"departure_city", "arrival_city"}, first.values, bundle);
    assert(second.values == first.values);
    assert(second.applied.empty());

    std::cout << "  PASS" << std::endl;
}

void test_inheritance_skip_reasons() {
    std::cout << "Testing inheritance skip reasons..." << std::endl;

    const Timestamp now = 1700000000000;
    SourceBundle bundle;
    bundle.now = now;
    bundle.set(SourceKind::Session, "stale", "old", now - seconds_to_ms(120));
    bundle.set(SourceKind::Session, "undated", "fresh");
    bundle.set(SourceKind::Session, "city", "北京");
    bundle.mark_unavailable(SourceKind::UserProfile);

    SlotInheritanceEngine engine;
    engine.transforms().add("explode", [](const Value&) -> Value {
        throw std::runtime_error("boom");
    });

    auto unavailable = make_rule(SourceKind::UserProfile, "phone_number", 1);
    engine.add_rule(unavailable);

    auto gated = make_rule(SourceKind::Session, "city", 1);
    gated.target_slot = "gated";
    gated.condition = InheritanceCondition::slot_equals("trip_type", "round");
    engine.add_rule(gated);

    auto stale = make_rule(SourceKind::Session, "stale", 1);
    stale.ttl_seconds = 60;
    engine.add_rule(stale);

    // Unknown age is not TTL-checked
    auto undated = make_rule(SourceKind::Session, "undated", 1);
    undated.ttl_seconds = 60;
    engine.add_rule(undated);

    engine.add_rule(make_rule(SourceKind::Session, "absent", 1));

    auto unknown = make_rule(SourceKind::Session, "city", 1);
    unknown.target_slot = "renamed";
    unknown.transform = "no_such_transform";
    engine.add_rule(unknown);

    auto failing = make_rule(SourceKind::Session, "city", 1);
    failing.target_slot = "broken";
    failing.transform = "explode";
    engine.add_rule(failing);

    std::vector<std::string> required = {"phone_number", "gated", "stale", "undated",
                                         "absent", "renamed", "broken"};
    auto result = engine.inherit(required, {{"trip_type", "one_way"}}, bundle);

    assert(skip_reason(result, "phone_number") == "source unavailable");
    assert(skip_reason(result, "gated") == "condition false");
    assert(skip_reason(result, "stale") == "TTL expired");
    assert(skip_reason(result, "absent") == "source empty");
    assert(skip_reason(result, "renamed") == "unknown transform");
    assert(skip_reason(result, "broken").rfind("error: ", 0) == 0);
    assert(result.values.at("undated") == "fresh");
    assert(result.values.size() == 2);   // trip_type + undated

    auto round_trip = engine.inherit({"gated"}, {{"trip_type", "round"}}, bundle);
    assert(round_trip.values.at("gated") == "北京");

    std::cout << "  PASS" << std::endl;
}

void test_inheritance_conditions_and_strategies() {
    std::cout << "Testing inheritance conditions and strategies..." << std::endl;

    const Timestamp now = 1700000000000;
    SourceBundle bundle;
    bundle.now = now;
    bundle.set(SourceKind::UserProfile, "vip", true);
    bundle.set(SourceKind::UserProfile, "lounge", "T3");
    bundle.set(SourceKind::Session, "card_number", "6222", now - seconds_to_ms(100));
    bundle.set(SourceKind::Session, "old_card", "6333", now - seconds_to_ms(4000));
    bundle.set(SourceKind::Session, "nodate_card", "6444");
    bundle.set(SourceKind::Context, "tags", json::array({"b", "c"}));
    bundle.set(SourceKind::Context, "prefs", json{{"seat", "window"}});
    bundle.set(SourceKind::Default, "class", "economy");

    SlotInheritanceEngine engine;

    auto lounge = make_rule(SourceKind::UserProfile, "lounge", 1);
    lounge.condition = InheritanceCondition::user_attribute("vip", true);
    engine.add_rule(lounge);

    for (const char* slot : {"card_number", "old_card", "nodate_card"}) {
        auto card = make_rule(SourceKind::Session, slot, 1);
        card.condition = InheritanceCondition::time_window(1800);
        engine.add_rule(card);
    }

    auto tags = make_rule(SourceKind::Context, "tags", 1);
    tags.strategy = MergeStrategy::Merge;
    engine.add_rule(tags);

    auto prefs = make_rule(SourceKind::Context, "prefs", 1);
    prefs.strategy = MergeStrategy::Merge;
    engine.add_rule(prefs);

    auto cls = make_rule(SourceKind::Default, "class", 1);
    cls.strategy = MergeStrategy::Override;
    engine.add_rule(cls);

    ValueMap current = {
        {"tags", json::array({"a", "b"})},
        {"prefs", json{{"meal", "veg"}}},
        {"class", "business"}
    };
    auto result = engine.inherit({"lounge", "card_number", "old_card", "nodate_card",
                                  "tags", "prefs", "class"}, current, bundle);

    assert(result.values.at("lounge") == "T3");
    assert(result.values.at("card_number") == "6222");
    assert(!result.values.count("old_card"));
    assert(!result.values.count("nodate_card"));
    assert(result.values.at("tags") == json::array({"a", "b", "c"}));
    assert(result.values.at("prefs") == (json{{"meal", "veg"}, {"seat", "window"}}));
    assert(result.values.at("class") == "economy");
    assert(result.sources.at("class") == "default value (class)");
    assert(result.sources.at("tags") == "conversation history (tags)");

    std::cout << "  PASS" << std::endl;
}

void test_transforms() {
    std::cout << "Testing transforms..." << std::endl;

    auto registry = TransformRegistry::with_builtins();
    auto str = [&](const char* name, const Value& v) {
        return registry.apply(name, v)->get<std::string>();
    };

    assert(str("format_phone", "138 0013 8000") == "138-0013-8000");
    assert(str("format_phone", "+1 234-5") == "12345");
    assert(str("extract_city", "北京") == "北京市");
    assert(str("extract_city", " 朝阳区 ") == "朝阳区");
    assert(str("extract_city", "Paris") == "Paris");
    assert(str("normalize_name", "  zhang SAN ") == "Zhang San");
    assert(str("normalize_date", "2024-03-01T08:30:00") == "2024-03-01");
    assert(str("normalize_date", "next monday") == "next monday");
    assert(str("to_uppercase", "abc") == "ABC");
    assert(str("to_lowercase", "AbC") == "abc");

    assert(!registry.apply("nope", "x"));
    assert(registry.contains("format_phone"));
    assert(registry.names().size() == 6);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inheritance cache
// ═══════════════════════════════════════════════════════════════════════════

CacheKey sample_key(const std::string& user = "u1", const std::string& intent = "i1") {
    return CacheKey{user, intent, {"departure_city", "arrival_city"}, "fp"};
}

void test_cache_ttl() {
    std::cout << "Testing inheritance cache TTL..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    InheritanceCache cache(store, {}, clock.fn());

    auto key = sample_key();
    assert(cache.set(key, {{"departure_city", "北京"}},
                     {{"departure_city", "session context (departure_city)"}}, 1));

    auto hit = cache.get(key);
    assert(hit);
    assert(hit->values.at("departure_city") == "北京");
    assert(hit->ttl_seconds == 1);
    assert(cache.statistics().hits == 1);
    assert(cache.statistics().misses == 0);

    clock.advance(2);
    assert(!cache.get(key));
    auto stats = cache.statistics();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(near(stats.hit_rate, 0.5));

    // Entry-level expiry when the store keeps the record longer
    cache.reset_statistics();
    json payload = {
        {"format", 1},
        {"inherited_values", {{"a", "b"}}},
        {"inheritance_sources", json::object()},
        {"cached_at", clock.t - seconds_to_ms(10)},
        {"ttl_seconds", 5}
    };
    store.set(key.str(), payload.dump());
    assert(!cache.get(key));
    assert(cache.statistics().expired_evictions == 1);
    assert(!store.get(key.str()));

    std::cout << "  PASS" << std::endl;
}

void test_cache_corrupt_payload() {
    std::cout << "Testing corrupt cache payloads..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    InheritanceCache cache(store, {}, clock.fn());
    auto key = sample_key();

    store.set(key.str(), "{not json");
    ErrorCode error = ErrorCode::None;
    assert(!cache.get(key, &error));
    assert(error == ErrorCode::CacheCorrupt);
    assert(!store.get(key.str()));

    store.set(key.str(), R"({"format": 99, "inherited_values": {}, "inheritance_sources": {},
                              "cached_at": 0, "ttl_seconds": 10})");
    assert(!cache.get(key, &error));
    assert(error == ErrorCode::CacheCorrupt);

    auto stats = cache.statistics();
    assert(stats.corrupt_evictions == 2);
    assert(stats.misses == 2);

    assert(!cache.get(key, &error));
    assert(error == ErrorCode::None);

    std::cout << "  PASS" << std::endl;
}

void test_cache_keys_and_invalidation() {
    std::cout << "Testing cache keys and invalidation..." << std::endl;

    CacheKey odd{"a:b", "i,1", {"z", "a"}, "fp"};
    assert(odd.str() == "inheritance:a%3Ab:i%2C1:a,z:fp");
    assert(escape_key_component("50%") == "50%25");

    // Slot order does not change the key
    CacheKey reordered{"u", "i", {"b", "a"}, "fp"};
    CacheKey sorted{"u", "i", {"a", "b"}, "fp"};
    assert(reordered.str() == sorted.str());

    FingerprintInput fp1;
    fp1.current_values = {{"x", 1}};
    fp1.session_keys = {"b", "a"};
    FingerprintInput fp2 = fp1;
    fp2.session_keys = {"a", "b"};
    assert(context_fingerprint(fp1) == context_fingerprint(fp2));
    fp2.current_values["x"] = 2;
    assert(context_fingerprint(fp1) != context_fingerprint(fp2));
    fp2 = fp1;
    fp2.profile_last_updated = 5;
    assert(context_fingerprint(fp1) != context_fingerprint(fp2));

    ManualClock clock;
    MemoryStore store(clock.fn());
    InheritanceCache cache(store, {}, clock.fn());
    cache.set(sample_key("u", "i1"), {{"a", 1}}, {});
    cache.set(sample_key("u", "i2"), {{"a", 1}}, {});
    cache.set(sample_key("u:1", "i1"), {{"a", 1}}, {});
    cache.set(sample_key("v", "i1"), {{"a", 1}}, {});
    assert(cache.entry_count() == 4);

    // "u:1" escapes to "u%3A1", so it is not under "u:"
    assert(cache.invalidate_user("u") == 2);
    assert(cache.get(sample_key("u:1", "i1")));
    assert(cache.entry_count() == 2);

    assert(cache.invalidate_intent("i1") == 2);
    assert(cache.entry_count() == 0);
    assert(cache.invalidate_intent("i1") == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Conversation inheritance
// ═══════════════════════════════════════════════════════════════════════════

void test_conversation_inheritance() {
    std::cout << "Testing conversation inheritance..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    InheritanceCache cache(store, {}, clock.fn());
    SlotInheritanceEngine engine;

    StubSession session;
    session.context = {
        {"departure_city", "北京"},
        {"departure_city_timestamp", clock.t - seconds_to_ms(100)},
        {"card_number", "6222021234"}
    };
    StubProfile profile;
    profile.data.preferences = {{"contact_info", {{"phone", "13800138000"}, {"name", "zhang san"}}}};
    profile.data.last_updated = 42;

    ConversationInheritance conv(engine, &cache, nullptr, &session, &profile, {}, clock.fn());
    assert(engine.rules().size() == 5);

    std::vector<std::string> required = {"departure_city", "passenger_name",
                                         "phone_number", "card_number"};
    auto first = conv.inherit_for("s", "u", "intent_book_flight", required, {});
    assert(!first.from_cache);
    assert(first.values.at("departure_city") == "北京");
    assert(first.values.at("passenger_name") == "Zhang San");
    assert(first.values.at("phone_number") == "138-0013-8000");
    assert(first.values.at("card_number") == "6222021234");
    assert(first.sources.at("departure_city") == "session context (departure_city)");
    assert(first.sources.at("passenger_name") == "user profile (passenger_name)");
    assert(cache.statistics().writes == 1);

    auto second = conv.inherit_for("s", "u", "intent_book_flight", required, {});
    assert(second.from_cache);
    assert(second.values == first.values);
    assert(second.sources == first.sources);
    assert(cache.statistics().hits == 1);

    // Different current values, different fingerprint; supplement keeps input
    auto third = conv.inherit_for("s", "u", "intent_book_flight", required,
                                  {{"departure_city", "上海"}});
    assert(!third.from_cache);
    assert(third.values.at("departure_city") == "上海");

    // Card outside the 30 minute window is not offered
    session.context["card_number_timestamp"] = clock.t - seconds_to_ms(3600);
    auto stale = conv.inherit_for("s2", "u2", "intent_book_flight", {"card_number"}, {});
    assert(!stale.values.count("card_number"));
    assert(skip_reason(stale, "card_number") == "condition false");

    std::cout << "  PASS" << std::endl;
}

void test_conversation_source_failures() {
    std::cout << "Testing unavailable inheritance sources..." << std::endl;

    // Outlives the detached call
    static SlowProfile slow;

    ManualClock clock;
    MemoryStore store(clock.fn());
    InheritanceCache cache(store, {}, clock.fn());
    SlotInheritanceEngine engine;

    StubSession session;
    session.context = {{"departure_city", "北京"}};
    StubProfile profile;
    profile.fail = true;

    ConversationInheritance conv(engine, &cache, nullptr, &session, &profile, {}, clock.fn());
    auto result = conv.inherit_for("s", "u", "i", {"departure_city", "passenger_name"}, {});
    assert(result.values.at("departure_city") == "北京");
    assert(!result.values.count("passenger_name"));
    assert(skip_reason(result, "passenger_name") == "source unavailable");
    // Partial results are not cached
    assert(cache.statistics().writes == 0);
    assert(profile.calls == 1);

    InheritanceConfig config;
    config.source_timeout_ms = 50;
    SlotInheritanceEngine slow_engine;
    ConversationInheritance slow_conv(slow_engine, nullptr, nullptr, &session, &slow,
                                      config, clock.fn());
    auto started = std::chrono::steady_clock::now();
    result = slow_conv.inherit_for("s", "u", "i", {"departure_city", "phone_number"}, {});
    assert(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(250));
    assert(result.values.at("departure_city") == "北京");
    assert(skip_reason(result, "phone_number") == "source unavailable");

    session.fail = true;
    auto bundle = conv.gather("s", "u", {});
    assert(!bundle.available(SourceKind::Session));
    assert(bundle.available(SourceKind::Context));

    std::this_thread::sleep_for(std::chrono::milliseconds(350));

    std::cout << "  PASS" << std::endl;
}

void test_source_flattening() {
    std::cout << "Testing source flattening..." << std::endl;

    UserProfile profile;
    profile.preferences = {
        {"preferred_departure_cities", {"上海", "北京"}},
        {"contact_info", {{"phone", "13800138000"}, {"name", "li si"}}}
    };
    profile.frequent_values = {{"phone_number", {{"most_frequent", "13900000000"}, {"count", 4}}}};
    profile.last_updated = 7;

    auto flat = ConversationInheritance::flatten_profile(profile);
    assert(flat.at("preferred_departure_city").value == "上海");
    assert(flat.at("passenger_name").value == "li si");
    assert(flat.at("phone_number").value == "13900000000");
    assert(flat.at("phone_number").timestamp == 7);

    ValueMap context = {
        {"arrival_city", "广州"},
        {"arrival_city_timestamp", 1000},
        {"seat", "12A"}
    };
    auto dated = ConversationInheritance::date_session_context(context, 5000);
    assert(dated.size() == 2);
    assert(dated.at("arrival_city").timestamp == 1000);
    assert(dated.at("seat").timestamp == 5000);

    StubHistory history;
    history.values["arrival_city"] = SourceValue{"深圳", 900};
    SlotInheritanceEngine engine;
    InheritanceConfig config;
    config.install_default_rules = false;
    config.default_values = {{"class", "economy"}};
    ConversationInheritance conv(engine, nullptr, &history, nullptr, nullptr, config);
    assert(engine.rules().empty());

    FingerprintInput fp;
    auto bundle = conv.gather("s", "u", {{"passengers", 1}}, &fp);
    assert(bundle.find(SourceKind::Context, "arrival_city")->value == "深圳");
    assert(bundle.find(SourceKind::Default, "class")->value == "economy");
    assert(bundle.find(SourceKind::Dependency, "passengers")->value == 1);
    assert(fp.conversation_keys.size() == 1);
    assert(fp.session_keys.empty());

    std::cout << "  PASS" << std::endl;
}

void test_fill_active_frame() {
    std::cout << "Testing inheritance into the active frame..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    IntentStackStore stacks(store, catalog, {}, clock.fn());
    SlotInheritanceEngine engine;

    StubSession session;
    session.context = {{"arrival_city", "上海"}};
    ConversationInheritance conv(engine, nullptr, nullptr, &session, nullptr, {}, clock.fn());

    auto none = conv.fill_active_frame(stacks, "s");
    assert(none.error == ErrorCode::FrameNotFound);

    assert(stacks.push("s", "u", "book_flight").ok());
    auto filled = conv.fill_active_frame(stacks, "s");
    assert(filled.ok());
    assert(filled.inheritance.values.at("departure_city") == "上海市");
    assert(filled.inheritance.sources.at("departure_city") == "session context (arrival_city)");
    assert(filled.frame->collected_slots.at("departure_city") == "上海市");
    assert(near(filled.frame->completion_progress, 1.0 / 3.0));
    for (const auto& slot : filled.frame->missing_slots) assert(slot != "departure_city");

    // Second pass has nothing new to add
    auto again = conv.fill_active_frame(stacks, "s");
    assert(again.ok());
    assert(again.inheritance.inherited().empty());
    assert(again.frame->collected_slots == filled.frame->collected_slots);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Sweeper, catalog, config
// ═══════════════════════════════════════════════════════════════════════════

void test_sweeper() {
    std::cout << "Testing expiry sweeper..." << std::endl;

    ManualClock clock;
    MemoryStore store(clock.fn());
    StaticIntentCatalog catalog;
    fill_catalog(catalog);
    StackConfig config;
    config.frame_ttl_seconds = 60;
    IntentStackStore stacks(store, catalog, config, clock.fn());

    assert(stacks.push("a", "u", "book_flight").ok());
    assert(stacks.push("b", "u", "check_balance").ok());
    clock.advance(61);

    ExpirySweeper sweeper(stacks);
    std::atomic<int> expired_events{0};
    sweeper.on_event([&](SweepEvent event, const std::string&) {
        if (event == SweepEvent::Expired) expired_events++;
    });

    assert(sweeper.run_once() == 2);
    auto stats = sweeper.stats();
    assert(stats.passes == 1);
    assert(stats.sessions_swept == 2);
    assert(stats.frames_expired == 2);
    assert(stats.failures == 0);
    assert(expired_events == 2);
    assert(stacks.sessions().empty());

    // Background thread runs passes until stopped
    SweeperConfig fast;
    fast.interval_ms = 10;
    ExpirySweeper background(stacks, fast);
    std::atomic<int> started{0};
    std::atomic<int> stopped{0};
    background.on_event([&](SweepEvent event, const std::string&) {
        if (event == SweepEvent::Started) started++;
        if (event == SweepEvent::Stopped) stopped++;
    });
    background.start();
    assert(background.is_running());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    background.stop();
    assert(!background.is_running());
    assert(background.stats().passes >= 1);
    assert(started == 1 && stopped == 1);

    std::cout << "  PASS" << std::endl;
}

void test_catalog() {
    std::cout << "Testing intent catalog..." << std::endl;

    StaticIntentCatalog catalog;
    json entries = json::parse(R"([
        {"name": "book_flight", "required_slots": ["departure_city"], "keywords": ["flight"]},
        {"name": "check_balance", "id": 42}
    ])");
    assert(catalog.load(entries) == 2);
    assert(catalog.find("book_flight")->id == "book_flight");
    assert(catalog.find("check_balance")->id == "42");
    assert(catalog.required_slots("book_flight").size() == 1);
    assert(catalog.required_slots("nothing").empty());

    catalog.add_system_intents({"timeout", "book_flight"});
    assert(catalog.size() == 3);
    assert(catalog.required_slots("book_flight").size() == 1);

    assert(catalog.remove("timeout"));
    assert(!catalog.find("timeout"));
    assert(catalog.load(json::object()) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing configuration..." << std::endl;

    std::string error;
    auto config = parse_config(R"({
        "db_path": "/tmp/x.db",
        "stack": {"max_depth": 3},
        "transfer": {"exit_patterns": ["bye"], "error_threshold": 5},
        "inheritance": {"default_values": {"class": "economy"}},
        "cache": {"default_ttl_seconds": 60},
        "intents": [{"name": "book_flight", "required_slots": ["departure_city"]}]
    })", &error);
    assert(config);
    assert(config->db_path == "/tmp/x.db");
    assert(config->stack.max_depth == 3);
    assert(config->stack.frame_ttl_seconds == 86400);
    assert(config->transfer.exit_patterns.size() == 1);
    assert(config->transfer.error_threshold == 5);
    assert(config->transfer.session_timeout_seconds == 1800);
    assert(config->inheritance.default_values.at("class") == "economy");
    assert(config->cache.default_ttl_seconds == 60);
    assert(config->intents.size() == 1);

    assert(!parse_config("{bad", &error));
    assert(!error.empty());
    assert(!parse_config(R"({"stack": {"max_depth": 0}})", &error));

    setenv("SANDHI_MAX_DEPTH", "7", 1);
    setenv("SANDHI_CACHE_TTL", "120", 1);
    setenv("SANDHI_SESSION_TIMEOUT", "-5", 1);
    SandhiConfig env;
    apply_env_overrides(env);
    assert(env.stack.max_depth == 7);
    assert(env.cache.default_ttl_seconds == 120);
    assert(env.transfer.session_timeout_seconds == 1800);
    unsetenv("SANDHI_MAX_DEPTH");
    unsetenv("SANDHI_CACHE_TTL");
    unsetenv("SANDHI_SESSION_TIMEOUT");

    assert(!load_config("/nonexistent/sandhi.json", &error));
    assert(error.find("cannot read") == 0);

    const std::string path = "/tmp/sandhi_config_" + std::to_string(getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"sweeper": {"enabled": true, "interval_ms": 500}})";
    }
    auto loaded = load_config(path, &error);
    assert(loaded);
    assert(loaded->sweeper.enabled);
    assert(loaded->sweeper.interval_ms == 500);
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sandhi C++ Tests ===" << std::endl;
    std::cout << "Version " << SANDHI_VERSION << std::endl;
    std::cout << std::endl;

    std::cout << "=== Intent Stack ===" << std::endl;
    test_push_interrupt_pop_resume();
    test_depth_bound();
    test_single_active_invariant();
    test_push_pop_inverse();
    test_concurrent_pushes();
    test_session_locks_released();
    test_unknown_intent_and_empty_pop();
    test_update_slots_progress();
    test_sweep_expired();
    test_corrupt_stack();
    test_stack_statistics();
    test_frame_serialization();

    std::cout << std::endl;
    std::cout << "=== Storage ===" << std::endl;
    test_memory_store();
    test_sqlite_store();

    std::cout << std::endl;
    std::cout << "=== Transfer ===" << std::endl;
    test_cancel_returns_to_previous();
    test_rule_priority_determinism();
    test_transfer_negatives();
    test_condition_error_skips_rule();
    test_special_cases();
    test_classifier_timeout();
    test_context_and_similarity_rules();
    test_execute_and_history();
    test_load_rules();
    test_rule_replacement_is_atomic();
    test_keyword_classifier();

    std::cout << std::endl;
    std::cout << "=== Slot Inheritance ===" << std::endl;
    test_inheritance_priority();
    test_inheritance_preserves_and_idempotent();
    test_inheritance_skip_reasons();
    test_inheritance_conditions_and_strategies();
    test_transforms();
    test_cache_ttl();
    test_cache_corrupt_payload();
    test_cache_keys_and_invalidation();
    test_conversation_inheritance();
    test_conversation_source_failures();
    test_source_flattening();
    test_fill_active_frame();

    std::cout << std::endl;
    std::cout << "=== Runtime ===" << std::endl;
    test_sweeper();
    test_catalog();
    test_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
