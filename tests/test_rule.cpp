#include "authority/alias.hpp"
#include "authority/authority.hpp"
#include "authority/relevance_cache.hpp"
#include "authority/rule.hpp"
#include "authority/rule_store.hpp"
#include "authority/type_registry.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using namespace authority;

// ── Helpers ──────────────────────────────────────────────────────────────────

struct Document {
    int owner_id;
};

static Predicate always(bool result) {
    return [result](const Authority&, const Value&) { return result; };
}

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Rule ──────────────────────────────────────────────────────────────────────

void test_rule_behavior() {
    std::cout << "\n[RuleBehavior]\n";
    Rule privilege(Behavior::Privilege, "read", "User");
    Rule restriction(Behavior::Restriction, "read", "User");

    ASSERT_TRUE("privilege is_privilege",      privilege.is_privilege());
    ASSERT_TRUE("privilege not restriction",  !privilege.is_restriction());
    ASSERT_TRUE("restriction is_restriction",  restriction.is_restriction());
    ASSERT_EQ("behavior accessor", Behavior::Restriction, restriction.behavior());
    ASSERT_EQ("action accessor",   std::string("read"), privilege.action());
    ASSERT_EQ("resource accessor", std::string("User"), privilege.resource());
}

void test_rule_applies() {
    std::cout << "\n[RuleApplies]\n";
    Authority auth(Value{});

    Rule bare(Behavior::Privilege, "read", "User");
    ASSERT_EQ("no predicates", static_cast<std::size_t>(0), bare.predicate_count());
    ASSERT_TRUE("no predicates always applies", bare.applies(auth, Value{}));

    Rule gated(Behavior::Privilege, "read", "User", always(true));
    gated.when(always(true)).when(nullptr);
    ASSERT_EQ("empty predicate ignored", static_cast<std::size_t>(2), gated.predicate_count());
    ASSERT_TRUE("all predicates pass -> applies", gated.applies(auth, Value{}));

    gated.when(always(false));
    ASSERT_TRUE("one failing predicate -> does not apply", !gated.applies(auth, Value{}));

    Rule owner(Behavior::Privilege, "edit", "Document",
               [](const Authority&, const Value& value) {
                   const auto* doc = value_as<Document>(value);
                   return doc && doc->owner_id == 7;
               });
    ASSERT_TRUE("predicate sees value",        owner.applies(auth, Document{ 7 }));
    ASSERT_TRUE("predicate rejects value",    !owner.applies(auth, Document{ 8 }));
    ASSERT_TRUE("predicate sees absent value", !owner.applies(auth, Value{}));
}

void test_rule_allowed_disallowed() {
    std::cout << "\n[RuleAllowedDisallowed]\n";
    Authority auth(Value{});

    Rule privilege(Behavior::Privilege, "read", "User");
    Rule restriction(Behavior::Restriction, "read", "User");
    Rule failing(Behavior::Restriction, "read", "User", always(false));

    ASSERT_TRUE("privilege is_allowed",          privilege.is_allowed(auth, Value{}));
    ASSERT_TRUE("privilege not is_disallowed",  !privilege.is_disallowed(auth, Value{}));
    ASSERT_TRUE("restriction is_disallowed",     restriction.is_disallowed(auth, Value{}));
    ASSERT_TRUE("restriction not is_allowed",   !restriction.is_allowed(auth, Value{}));
    ASSERT_TRUE("failing predicate not disallowed", !failing.is_disallowed(auth, Value{}));
}

void test_rule_matching() {
    std::cout << "\n[RuleMatching]\n";
    Rule rule(Behavior::Privilege, "manage", "User");
    Rule wildcard(Behavior::Privilege, "read", kAllResources);

    ASSERT_TRUE("exact action",              rule.matches_action("manage"));
    ASSERT_TRUE("other action",             !rule.matches_action("read"));
    ASSERT_TRUE("action in set",             rule.matches_action(std::vector<std::string>{ "read", "manage" }));
    ASSERT_TRUE("action not in set",        !rule.matches_action(std::vector<std::string>{ "read", "comment" }));
    ASSERT_TRUE("exact resource",            rule.matches_resource("User"));
    ASSERT_TRUE("other resource",           !rule.matches_resource("Post"));
    ASSERT_TRUE("'all' matches any resource", wildcard.matches_resource("Post"));
    ASSERT_TRUE("relevant",                  rule.is_relevant({ "read", "manage" }, "User"));
    ASSERT_TRUE("irrelevant resource",      !rule.is_relevant({ "manage" }, "Post"));
    ASSERT_TRUE("irrelevant action",        !rule.is_relevant({ "read" }, "User"));
}

// ── AliasRegistry ─────────────────────────────────────────────────────────────

void test_alias_registry() {
    std::cout << "\n[AliasRegistry]\n";
    AliasRegistry registry;
    registry.add("manage", { "create", "read", "update", "delete" });
    registry.add("comment", { "read", "comment" });

    auto read = registry.expand("read");
    ASSERT_EQ("read expands to 3 names", static_cast<std::size_t>(3), read.size());
    ASSERT_EQ("queried action first", std::string("read"), read.front());

    auto update = registry.expand("update");
    ASSERT_EQ("update expands to 2 names", static_cast<std::size_t>(2), update.size());

    auto unknown = registry.expand("launch");
    ASSERT_EQ("uncovered action expands to itself", static_cast<std::size_t>(1), unknown.size());

    ASSERT_TRUE("find known alias",        registry.find("manage").has_value());
    ASSERT_TRUE("find unknown alias",     !registry.find("publish").has_value());
}

void test_alias_overwrite() {
    std::cout << "\n[AliasOverwrite]\n";
    AliasRegistry registry;
    registry.add("manage", { "read" });
    const Alias& alias = registry.add("manage", { "delete" });

    ASSERT_EQ("one alias after overwrite", static_cast<std::size_t>(1), registry.size());
    ASSERT_TRUE("new definition includes delete", alias.includes("delete"));
    ASSERT_TRUE("old definition dropped",        !registry.find("manage")->includes("read"));
}

void test_alias_expansion_is_one_level() {
    std::cout << "\n[AliasOneLevel]\n";
    AliasRegistry registry;
    registry.add("manage", { "read", "update" });
    registry.add("admin", { "manage" });

    auto read = registry.expand("read");
    ASSERT_EQ("read -> read, manage only", static_cast<std::size_t>(2), read.size());

    auto manage = registry.expand("manage");
    ASSERT_EQ("manage -> manage, admin", static_cast<std::size_t>(2), manage.size());
}

// ── RuleStore & RelevanceCache ───────────────────────────────────────────────

void test_rule_store_order() {
    std::cout << "\n[RuleStoreOrder]\n";
    RuleStore store;
    Rule& first  = store.add(Rule(Behavior::Privilege, "read", "User"));
    store.add(Rule(Behavior::Privilege, "read", "Post"));
    Rule& third  = store.add(Rule(Behavior::Restriction, "manage", "User"));
    store.add(Rule(Behavior::Privilege, "read", kAllResources));

    ASSERT_EQ("store size", static_cast<std::size_t>(4), store.size());

    auto relevant = store.relevant({ "read", "manage" }, "User");
    ASSERT_EQ("3 relevant rules", static_cast<std::size_t>(3), relevant.size());
    ASSERT_TRUE("oldest first",            relevant[0] == &first);
    ASSERT_TRUE("insertion order kept",    relevant[1] == &third);
    ASSERT_EQ("wildcard rule last", kAllResources, relevant[2]->resource());

    auto all = store.all();
    ASSERT_TRUE("all() starts with first", all.front() == &first);

    // Appending must not move earlier rules.
    for (int i = 0; i < 100; ++i) store.add(Rule(Behavior::Privilege, "noop", "Noop"));
    ASSERT_EQ("reference survives growth", std::string("read"), first.action());
}

void test_relevance_cache() {
    std::cout << "\n[RelevanceCache]\n";
    RuleStore store;
    store.add(Rule(Behavior::Privilege, "read", "User"));

    RelevanceCache cache;
    int fills = 0;
    auto fill = [&] { ++fills; return store.relevant({ "read" }, "User"); };

    auto first  = cache.get_or_fill("read", "User", fill);
    auto second = cache.get_or_fill("read", "User", fill);
    ASSERT_EQ("filled once", 1, fills);
    ASSERT_TRUE("identical contents", first == second);
    ASSERT_TRUE("key cached", cache.contains("read", "User"));
    ASSERT_TRUE("other key not cached", !cache.contains("read", "Post"));

    store.add(Rule(Behavior::Restriction, "read", "User"));
    ASSERT_EQ("stale entry until cleared", static_cast<std::size_t>(1),
              cache.get_or_fill("read", "User", fill).size());

    cache.clear();
    ASSERT_EQ("cleared", static_cast<std::size_t>(0), cache.size());
    ASSERT_EQ("refilled after clear", static_cast<std::size_t>(2),
              cache.get_or_fill("read", "User", fill).size());
    ASSERT_EQ("filled twice", 2, fills);
}

// ── TypeRegistry ──────────────────────────────────────────────────────────────

void test_type_registry() {
    std::cout << "\n[TypeRegistry]\n";
    TypeRegistry types;
    types.register_type<Document>("Document");

    ASSERT_EQ("registered type resolves", std::string("Document"),
              types.resolve(Document{ 1 }).value_or(""));
    ASSERT_TRUE("unregistered type unresolved", !types.resolve(42).has_value());
    ASSERT_TRUE("empty value unresolved",       !types.resolve(Value{}).has_value());

    types.register_type<Document>("Doc");
    ASSERT_EQ("re-registration replaces name", std::string("Doc"),
              types.resolve(Document{ 1 }).value_or(""));
    ASSERT_EQ("one registration", static_cast<std::size_t>(1), types.size());
}

void test_resource_ref() {
    std::cout << "\n[ResourceRef]\n";
    ResourceRef by_name = "User";
    ResourceRef by_value = ResourceRef::of(Document{ 3 });

    ASSERT_TRUE("string is a type name", by_name.is_type_name());
    ASSERT_EQ("type name kept", std::string("User"), by_name.type_name());
    ASSERT_TRUE("of() holds a value", !by_value.is_type_name());
    ASSERT_EQ("value kept", 3, value_as<Document>(by_value.value())->owner_id);
    ASSERT_TRUE("value_as wrong type", value_as<int>(by_value.value()) == nullptr);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    spdlog::set_level(spdlog::level::warn);
    std::cout << "=== Rule Tests ===\n";

    test_rule_behavior();
    test_rule_applies();
    test_rule_allowed_disallowed();
    test_rule_matching();
    test_alias_registry();
    test_alias_overwrite();
    test_alias_expansion_is_one_level();
    test_rule_store_order();
    test_relevance_cache();
    test_type_registry();
    test_resource_ref();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}
