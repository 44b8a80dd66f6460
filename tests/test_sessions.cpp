#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "almanac/agent/session_registry.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <thread>

void register_sessions_tests(std::vector<almanac::tests::TestCase> &tests) {
  using almanac::tests::require;
  namespace a = almanac::agent;

  tests.push_back({"sessions_get_or_create_is_idempotent", [] {
                     auto provider = std::make_shared<almanac::testing::ScriptedProvider>();
                     a::SessionRegistry registry(provider, nullptr);
                     auto first = registry.get_or_create("alpha");
                     auto second = registry.get_or_create("alpha");
                     require(first == second, "same id should give the same session");
                     require(first->id() == "alpha", "id mismatch");
                     require(registry.size() == 1, "one session expected");
                     require(registry.find("beta") == nullptr, "find must not create");
                     require(!registry.contains("beta"), "beta should be absent");
                   }});

  tests.push_back({"sessions_concurrent_creation_yields_one_session", [] {
                     std::atomic<int> created{0};
                     a::SessionRegistry registry([&created](const std::string &id) {
                       created.fetch_add(1);
                       return std::make_shared<a::AgentSession>(id, nullptr, nullptr);
                     });
                     std::vector<std::shared_ptr<a::AgentSession>> seen(8);
                     std::vector<std::thread> threads;
                     for (std::size_t i = 0; i < seen.size(); ++i) {
                       threads.emplace_back(
                           [&registry, &seen, i] { seen[i] = registry.get_or_create("race"); });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(created.load() == 1, "factory should run once");
                     for (const auto &session : seen) {
                       require(session == seen.front(), "threads saw different sessions");
                     }
                   }});

  tests.push_back({"sessions_clear_keeps_identity_and_other_sessions", [] {
                     auto provider = std::make_shared<almanac::testing::ScriptedProvider>();
                     provider->set_repeat(almanac::testing::text_completion("ok"));
                     a::SessionRegistry registry(provider, nullptr);
                     auto one = registry.get_or_create("one");
                     auto two = registry.get_or_create("two");
                     require(one->process("hi").ok(), "process one");
                     require(two->process("hi").ok(), "process two");

                     require(registry.clear("one"), "clear should find the session");
                     require(registry.get_or_create("one") == one, "identity must survive clear");
                     require(one->history_size() == 0, "history should be empty");
                     require(two->history_size() == 2, "other session must be untouched");
                     require(!registry.clear("ghost"), "clearing unknown id reports false");
                   }});

  tests.push_back({"sessions_remove_then_recreate_is_fresh", [] {
                     auto provider = std::make_shared<almanac::testing::ScriptedProvider>();
                     provider->set_repeat(almanac::testing::text_completion("ok"));
                     a::SessionRegistry registry(provider, nullptr);
                     auto original = registry.get_or_create("gone");
                     require(original->process("hi").ok(), "process");
                     require(registry.remove("gone"), "remove should succeed");
                     require(!registry.contains("gone"), "session should be absent");
                     require(!registry.remove("gone"), "second remove reports false");

                     auto fresh = registry.get_or_create("gone");
                     require(fresh != original, "expected a new session");
                     require(fresh->history_size() == 0, "new session starts empty");
                   }});

  tests.push_back({"sessions_ids_are_sorted", [] {
                     a::SessionRegistry registry(nullptr, nullptr);
                     (void)registry.get_or_create("c");
                     (void)registry.get_or_create("a");
                     (void)registry.get_or_create("b");
                     require(registry.ids() == std::vector<std::string>{"a", "b", "c"},
                             "ids should be sorted");
                   }});
}
