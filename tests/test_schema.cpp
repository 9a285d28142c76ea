// test_schema.cpp – Schema declaration, field ordering and the registry.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_schema

#include "Encodium/Error.hpp"
#include "Encodium/Schema.hpp"
#include "Encodium/Types.hpp"

#include <spdlog/cfg/env.h>

#include <iostream>
#include <string>
#include <vector>

using namespace encodium;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

template <typename Fn>
static void checkThrows(ErrorKind kind, Fn&& fn, const std::string& msg) {
    try {
        fn();
        std::cerr << "FAIL " << msg << " (nothing thrown)\n";
        ++failures;
    } catch (const Error& e) {
        CHECK(e.kind() == kind, msg + " → " + errorKindName(e.kind()) + ": " + e.what());
    }
}

static Schema single(FieldSpec spec) {
    SchemaBuilder b("Single");
    b.add(std::move(spec));
    return b.build();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: fields keep the order of the add() calls
// ─────────────────────────────────────────────────────────────────────────────
static void testFieldOrder() {
    std::cout << "\n=== Test: declaration order ===\n";
    SchemaBuilder b("Person");
    b.add(field::integer("age"))
     .add(field::string("name"))
     .add(field::boolean("diabetic"));
    CHECK(b.nextSequence() == 3, "three sequence numbers consumed");

    const Schema s = b.build();
    CHECK(s.name() == "Person", "schema name");
    CHECK(s.fields().size() == 3, "3 fields");
    CHECK(s.fields()[0].name == "age" && s.fields()[1].name == "name" &&
              s.fields()[2].name == "diabetic",
          "order age, name, diabetic");
    CHECK(s.fields()[0].sequence == 0 && s.fields()[2].sequence == 2, "sequence numbers");

    CHECK(s.indexOf("name") == 1,              "indexOf(name)");
    CHECK(s.indexOf("nope") == s.fields().size(), "indexOf unknown");
    CHECK(s.field("diabetic") && s.field("diabetic")->kind == FieldKind::Boolean, "field(diabetic)");
    CHECK(s.field("nope") == nullptr,          "field(unknown)");
    CHECK(s.registry() == nullptr,             "not registered yet");

    // A second builder restarts its own counter
    SchemaBuilder other("Other");
    other.add(field::bytes("raw"));
    CHECK(other.build().fields()[0].sequence == 0, "independent sequence per builder");

    const Schema empty = SchemaBuilder("Empty").build();
    CHECK(empty.fields().empty(), "a schema may have no fields");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: malformed declarations
// ─────────────────────────────────────────────────────────────────────────────
static void testInvalidDeclarations() {
    std::cout << "\n=== Test: invalid declarations ===\n";

    checkThrows(ErrorKind::InvalidSchema, [] { (void)SchemaBuilder("").build(); },
                "empty schema name");
    checkThrows(ErrorKind::InvalidSchema, [] {
        SchemaBuilder b("Dup");
        b.add(field::integer("x")).add(field::string("x"));
        (void)b.build();
    }, "duplicate field name");
    checkThrows(ErrorKind::InvalidSchema, [] { (void)single(field::integer("")); },
                "empty field name");
    checkThrows(ErrorKind::InvalidSchema,
                [] { (void)single(field::integer("n", {.maxLength = 4})); },
                "maxLength on an integer");
    checkThrows(ErrorKind::InvalidSchema,
                [] { (void)single(field::string("s", {.minValue = 1})); },
                "min on a string");
    checkThrows(ErrorKind::InvalidSchema,
                [] { (void)single(field::boolean("b", {.isSigned = false})); },
                "signed=false on a boolean");
    checkThrows(ErrorKind::InvalidSchema,
                [] { (void)single(field::integer("n", {.minValue = 10, .maxValue = 1})); },
                "min greater than max");
    checkThrows(ErrorKind::InvalidSchema, [] {
        FieldSpec f;
        f.name = "items";
        f.kind = FieldKind::List;
        (void)single(f);
    }, "list without element spec");
    checkThrows(ErrorKind::InvalidSchema, [] { (void)single(field::record("r", "")); },
                "record without schema name");
    checkThrows(ErrorKind::InvalidSchema, [] {
        FieldSpec f = field::string("s");
        f.schemaName = "Person";
        (void)single(f);
    }, "schema name on a string field");
    checkThrows(ErrorKind::InvalidSchema,
                [] { (void)single(field::list("l", field::boolean("", {.maxLength = 1}))); },
                "bad option on a list element");

    (void)single(field::list("tags", field::string("", {.maxLength = 8}), {.maxLength = 3}));
    CHECK(true, "list with element constraints accepted");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: registry lifecycle
// ─────────────────────────────────────────────────────────────────────────────
static void testRegistry() {
    std::cout << "\n=== Test: registry ===\n";
    SchemaRegistry registry;
    CHECK(registry.size() == 0 && !registry.frozen(), "starts empty and open");

    SchemaBuilder tree("Tree");
    tree.add(field::record("left", "Tree", {.optional = true}))
        .add(field::string("value"));
    const SchemaPtr t = registry.add(tree.build());
    CHECK(t && t->registry() == &registry, "add() binds the schema to the registry");

    SchemaBuilder alpha("Alpha");
    alpha.add(field::boolean("on"));
    registry.add(alpha.build());

    CHECK(registry.contains("Tree") && registry.contains("Alpha"), "contains");
    CHECK(!registry.contains("Gamma"), "!contains(Gamma)");
    CHECK(registry.resolve("Tree") == t, "resolve returns the registered schema");
    CHECK(t->resolve("Tree") == t, "self reference resolves to itself");
    CHECK((registry.names() == std::vector<std::string>{"Alpha", "Tree"}), "names sorted");

    checkThrows(ErrorKind::UnknownSchema, [&] { (void)registry.resolve("Gamma"); },
                "resolve unknown schema");
    checkThrows(ErrorKind::DuplicateSchema, [&] { registry.add(SchemaBuilder("Tree").build()); },
                "second Tree");
    CHECK(registry.size() == 2, "failed add leaves registry unchanged");

    registry.freeze();
    registry.freeze();
    CHECK(registry.frozen(), "frozen");
    checkThrows(ErrorKind::RegistryFrozen, [&] { registry.add(SchemaBuilder("Late").build()); },
                "add after freeze");
    CHECK(registry.resolve("Alpha")->name() == "Alpha", "lookups still work after freeze");

    const Schema loose = SchemaBuilder("Loose").build();
    checkThrows(ErrorKind::UnknownSchema, [&] { (void)loose.resolve("Tree"); },
                "unregistered schema cannot resolve references");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: registries are independent
// ─────────────────────────────────────────────────────────────────────────────
static void testIndependentRegistries() {
    std::cout << "\n=== Test: independent registries ===\n";
    SchemaRegistry a;
    SchemaRegistry b;
    const SchemaPtr pa = a.add(SchemaBuilder("Node").build());
    const SchemaPtr pb = b.add(SchemaBuilder("Node").build());
    CHECK(pa != pb, "same name, distinct schemas");
    CHECK(pa->resolve("Node") == pa && pb->resolve("Node") == pb, "each resolves in its own registry");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    spdlog::cfg::load_env_levels();

    testFieldOrder();
    testInvalidDeclarations();
    testRegistry();
    testIndependentRegistries();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
