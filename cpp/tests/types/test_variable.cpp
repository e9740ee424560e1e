#include <cellgraph/types/variable.h>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cellgraph;

namespace {

/**
 * @brief Records value and blocked notifications of one Variable as "value:<v>" / "blocked:<b>".
 */
struct EventLog {
    std::vector<std::string> events;

    template<typename T, typename E>
    void watch(Variable<T, E>& variable) {
        variable.observe([this](const std::optional<T>& v) { events.push_back("value:" + cellgraph::to_string(v)); });
        variable.blocked().observe(
            [this](const std::optional<bool>& b) { events.push_back("blocked:" + cellgraph::to_string(b)); });
    }

    [[nodiscard]] std::size_t count(const std::string& prefix) const {
        return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [&](const std::string& e) {
            return e.starts_with(prefix);
        }));
    }
};

} // namespace

// ============================================================================
// Blocking
// ============================================================================

TEST_CASE("Variable starts unblocked and behaves like an Observable", "[variable]") {
    auto v = make_variable<int64_t>(1);
    EventLog log;
    log.watch(*v);

    REQUIRE_FALSE(v->is_blocked());
    REQUIRE(v->blocked().get() == false);

    v->set(2);
    v->set(2);

    REQUIRE(log.events == std::vector<std::string>{"value:2"});
}

TEST_CASE("Writes while blocked are buffered and flushed once on unblock", "[variable][blocking]") {
    auto v = make_variable<int64_t>(1);
    EventLog log;
    log.watch(*v);

    v->block();
    REQUIRE(v->is_blocked());
    REQUIRE(v->get() == 1);

    v->set(5);
    v->set(6);
    v->set(7);
    // Reads see the buffered value, observers see nothing
    REQUIRE(v->get() == 7);
    REQUIRE(v->pending() == 7);
    REQUIRE(log.count("value:") == 0);

    v->unblock();

    std::vector<std::string> expected{"blocked:true", "value:7", "blocked:false"};
    REQUIRE(log.events == expected);
    REQUIRE(v->get() == 7);
}

TEST_CASE("Unblocking with an unchanged value only reports the blocked transitions", "[variable][blocking]") {
    auto v = make_variable<int64_t>(3);
    EventLog log;
    log.watch(*v);

    v->block();
    v->set(10);
    v->set(3);
    v->unblock();

    std::vector<std::string> expected{"blocked:true", "blocked:false"};
    REQUIRE(log.events == expected);
}

TEST_CASE("Block and unblock are idempotent", "[variable][blocking]") {
    auto v = make_variable<int64_t>(0);
    EventLog log;
    log.watch(*v);

    v->unblock();
    REQUIRE(log.events.empty());

    v->block();
    v->set(1);
    v->block();
    // A second block must not overwrite the pending value with the stored one
    REQUIRE(v->get() == 1);

    v->unblock();
    v->unblock();

    REQUIRE(log.count("blocked:true") == 1);
    REQUIRE(log.count("blocked:false") == 1);
    REQUIRE(log.count("value:") == 1);
}

TEST_CASE("set_blocked dispatches to block and unblock", "[variable][blocking]") {
    auto v = make_variable<int64_t>(0);

    v->set_blocked(true);
    REQUIRE(v->is_blocked());
    v->set(4);
    v->set_blocked(false);

    REQUIRE_FALSE(v->is_blocked());
    REQUIRE(v->get() == 4);
}

TEST_CASE("Blocked writes skip the equality test", "[variable][blocking]") {
    auto v = make_variable<int64_t, AlwaysDifferent>(1);
    int calls = 0;
    v->observe([&calls](const std::optional<int64_t>&) { ++calls; });

    v->block();
    v->set(2);
    v->set(3);
    REQUIRE(calls == 0);
    v->unblock();

    REQUIRE(calls == 1);
}

// ============================================================================
// Coalescing
// ============================================================================

TEST_CASE("CoalescingScope blocks for its lifetime", "[variable][coalescing]") {
    auto v = make_variable<int64_t>(0);
    EventLog log;
    log.watch(*v);

    {
        CoalescingScope scope{*v};
        REQUIRE(v->is_blocked());
        v->set(1);
        v->set(2);
        v->set(3);
    }

    std::vector<std::string> expected{"blocked:true", "value:3", "blocked:false"};
    REQUIRE(log.events == expected);
}

TEST_CASE("updates_coalesced and coalesce_updates behave like an explicit scope", "[variable][coalescing]") {
    auto v = make_variable<std::string>("a");
    EventLog log;
    log.watch(*v);

    {
        auto scope = v->updates_coalesced();
        v->set("b");
        v->set("c");
    }
    coalesce_updates(*v, [&v] {
        v->set("d");
        v->set("e");
    });

    REQUIRE(log.count("value:") == 2);
    REQUIRE(log.events[1] == "value:'c'");
    REQUIRE(log.events[4] == "value:'e'");
    REQUIRE(v->get() == "e");
}

TEST_CASE("Leaving a coalescing scope by an exception still unblocks", "[variable][coalescing][errors]") {
    auto v = make_variable<int64_t>(0);
    EventLog log;
    log.watch(*v);

    REQUIRE_THROWS_WITH(coalesce_updates(*v, [&v] {
        v->set(9);
        throw std::runtime_error("body failed");
    }), "body failed");

    REQUIRE_FALSE(v->is_blocked());
    REQUIRE(v->get() == 9);
    std::vector<std::string> expected{"blocked:true", "value:9", "blocked:false"};
    REQUIRE(log.events == expected);
}

TEST_CASE("Errors raised while flushing a coalescing scope propagate", "[variable][coalescing][errors]") {
    auto v = make_variable<int64_t>(0);
    v->observe([](const std::optional<int64_t>& value) {
        if (value == 13) { throw std::domain_error("unlucky"); }
    });

    REQUIRE_THROWS_AS(coalesce_updates(*v, [&v] { v->set(13); }), std::domain_error);
}

TEST_CASE("A coalescing scope tolerates its flush destroying the Variable", "[variable][coalescing][lifetime]") {
    auto v = make_variable<int64_t>(0);
    auto& variable = *v;
    std::vector<std::optional<int64_t>> later;
    v->observe([&v](const std::optional<int64_t>&) { v.reset(); });
    v->observe([&later](const std::optional<int64_t>& value) { later.push_back(value); });

    {
        auto scope = variable.updates_coalesced();
        variable.set(3);
        variable.set(4);
    }

    REQUIRE(v == nullptr);
    REQUIRE(later.empty());
}

// ============================================================================
// Tracking
// ============================================================================

TEST_CASE("track pulls the current value and follows later changes", "[variable][tracking]") {
    auto source = make_variable<int64_t>(5);
    auto target = make_variable<int64_t>(0);

    target->track(source);
    REQUIRE(target->get() == 5);
    REQUIRE(target->is_tracking(*source));
    REQUIRE(target->tracked_source_count() == 1);
    REQUIRE(source->tracker_count() == 1);

    source->set(8);
    REQUIRE(target->get() == 8);
}

TEST_CASE("track does not copy the current blocked state", "[variable][tracking]") {
    auto source = make_variable<int64_t>(1);
    auto target = make_variable<int64_t>(0);

    source->block();
    target->track(source);

    // The pulled value is the source's visible (pending) value, the flag is not mirrored
    REQUIRE_FALSE(target->is_blocked());
    REQUIRE(target->get() == 1);

    // Later transitions are mirrored
    source->unblock();
    source->block();
    REQUIRE(target->is_blocked());
    source->set(2);
    REQUIRE(target->get() == 1);
    source->unblock();
    REQUIRE_FALSE(target->is_blocked());
    REQUIRE(target->get() == 2);
}

TEST_CASE("A tracking Variable flushes the source's coalesced value once", "[variable][tracking][coalescing]") {
    auto source = make_variable<int64_t>(0);
    auto target = make_variable<int64_t>(0);
    target->track(source);
    EventLog log;
    log.watch(*target);

    coalesce_updates(*source, [&source] {
        source->set(1);
        source->set(2);
        source->set(3);
    });

    std::vector<std::string> expected{"blocked:true", "value:3", "blocked:false"};
    REQUIRE(log.events == expected);
}

TEST_CASE("untrack removes the subscriptions and forces the blocked flag off", "[variable][tracking]") {
    auto source = make_variable<int64_t>(1);
    auto target = make_variable<int64_t>(0);
    target->track(source);
    std::size_t source_value_observers = source->observer_count();
    std::size_t source_blocked_observers = source->blocked().observer_count();

    source->block();
    source->set(4);
    REQUIRE(target->is_blocked());

    target->untrack(source);

    REQUIRE_FALSE(target->is_blocked());
    REQUIRE_FALSE(target->is_tracking(*source));
    REQUIRE(source->tracker_count() == 0);
    REQUIRE(source->observer_count() == source_value_observers - 1);
    REQUIRE(source->blocked().observer_count() == source_blocked_observers - 1);
    // The pending value of the target is discarded, the stored value stands
    REQUIRE(target->get() == 1);

    source->unblock();
    REQUIRE(target->get() == 1);
    source->set(6);
    REQUIRE(target->get() == 1);
}

TEST_CASE("untrack of a Variable that is not tracked throws", "[variable][tracking][errors]") {
    auto a = make_variable<int64_t>(0);
    auto b = make_variable<int64_t>(0);

    REQUIRE_THROWS_AS(a->untrack(b), subscriber_not_found);

    a->track(b);
    a->untrack(b);
    REQUIRE_THROWS_AS(a->untrack(b), subscriber_not_found);
}

TEST_CASE("Destroying a tracking Variable detaches it from its source", "[variable][tracking][lifetime]") {
    auto source = make_variable<int64_t>(0);
    std::size_t observers_before = source->observer_count();
    {
        auto target = make_variable<int64_t>(0);
        target->track(source);
        REQUIRE(source->observer_count() == observers_before + 1);
    }

    REQUIRE(source->observer_count() == observers_before);
    REQUIRE(source->tracker_count() == 0);
    source->set(3);
}

TEST_CASE("Destroying a source leaves its tracker usable", "[variable][tracking][lifetime]") {
    auto target = make_variable<int64_t>(0);
    {
        auto source = make_variable<int64_t>(2);
        target->track(source);
        REQUIRE(target->tracked_source_count() == 1);
    }

    REQUIRE(target->tracked_source_count() == 0);
    target->set(7);
    REQUIRE(target->get() == 7);
}

TEST_CASE("Variables with different equality policies can track each other", "[variable][tracking][equality]") {
    auto source = make_variable<int64_t, AlwaysDifferent>(0);
    auto target = make_variable<int64_t>(0);
    int calls = 0;
    target->observe([&calls](const std::optional<int64_t>&) { ++calls; });

    target->track(source);
    source->set(1);
    source->set(1);

    // The source notifies twice, the target only stores a change once
    REQUIRE(calls == 1);
}

TEST_CASE("Variable describes its visible value", "[variable]") {
    auto v = make_variable<int64_t>();
    REQUIRE_FALSE(v->has_value());
    REQUIRE(v->describe() == "null");
    REQUIRE(v->element_type() == typeid(int64_t));

    v->set(12);
    REQUIRE(v->has_value());
    REQUIRE(v->describe() == "12");
}
