// test_schema_loader.cpp – Loading schemas from XML documents.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_schema_loader [path/to/specs]

#include "Encodium/Codec.hpp"
#include "Encodium/Error.hpp"
#include "Encodium/Format.hpp"
#include "Encodium/SchemaLoader.hpp"

#include <spdlog/cfg/env.h>

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
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

// The document must be rejected with a SchemaLoadError.
static void checkRejected(const std::string& xml, const std::string& msg) {
    SchemaRegistry registry;
    try {
        (void)loadSchemasFromString(xml, registry);
        std::cerr << "FAIL " << msg << " (accepted)\n";
        ++failures;
    } catch (const SchemaLoadError& e) {
        CHECK(e.kind() == ErrorKind::InvalidSchema, msg + " → " + e.what());
    }
}

static void hexdump(const Bytes& data, const std::string& label) {
    std::cout << label << " (" << data.size() << " bytes): ";
    for (auto b : data)
        std::cout << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
                  << static_cast<int>(b) << ' ';
    std::cout << std::dec << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: person.xml
// ─────────────────────────────────────────────────────────────────────────────
static void testPersonFile(const fs::path& specs) {
    std::cout << "\n=== Test: load person.xml ===\n";
    SchemaRegistry registry;
    const auto names = loadSchemas(specs / "person.xml", registry);
    registry.freeze();

    CHECK((names == std::vector<std::string>{"Person", "Contact"}), "names in document order");
    CHECK(registry.size() == 2, "2 schemas registered");

    const SchemaPtr person = registry.resolve("Person");
    CHECK(person->fields().size() == 3, "Person has 3 fields");
    CHECK(person->fields()[0].name == "age" && person->fields()[2].name == "diabetic",
          "field order follows the document");
    CHECK(person->field("name")->options.maxLength == 50u, "name maxLength 50");

    const SchemaPtr contact = registry.resolve("Contact");
    const FieldSpec* emails = contact->field("emails");
    CHECK(emails && emails->kind == FieldKind::List && emails->options.optional, "emails: optional list");
    CHECK(emails && emails->element && emails->element->kind == FieldKind::String &&
              emails->element->options.maxLength == 64u,
          "emails element: string, maxLength 64");
    const FieldSpec* priority = contact->field("priority");
    CHECK(priority && !priority->options.isSigned && priority->options.maxValue == 255,
          "priority: unsigned, max 255");

    const Record john = construct(person, {{"age", 25}, {"name", "John"}});
    CHECK(serialize(john) == (Bytes{0x01, 0x01, 0x19, 0x05, 0x01, 0x4A, 0x6F, 0x68, 0x6E, 0x01, 0x01}),
          "loaded Person encodes like the declared one");

    const Record card = construct(contact, {{"person", john}});
    std::cout << describe(card) << '\n';
    CHECK(card["token"].asBytes() == (Bytes{0xDE, 0xAD, 0xBE, 0xEF}), "token default DE AD BE EF");
    CHECK(card["priority"].asInt() == 3, "priority default 3");
    CHECK(!card.has("emails") && !card.has("avatar"), "optional fields absent");

    const Bytes wire = serialize(card);
    hexdump(wire, "Contact");
    const Bytes expected = {0x01,
                            0x0B, 0x01, 0x01, 0x19, 0x05, 0x01, 0x4A, 0x6F, 0x68, 0x6E, 0x01, 0x01,
                            0x00,
                            0x00,
                            0x05, 0x01, 0xDE, 0xAD, 0xBE, 0xEF,
                            0x01, 0x03};
    CHECK(wire == expected, "Contact bytes");
    CHECK(deserialize(contact, wire) == card, "Contact round trip");

    const Record full = card.with("emails", Value::list({Value{"john@example.org"}}))
                            .with("avatar", Bytes{0x89, 0x50, 0x4E, 0x47});
    CHECK(deserialize(contact, serialize(full)) == full, "Contact with every field round trip");

    checkThrows(ErrorKind::ConstraintViolation, [&] { (void)card.with("priority", 256); },
                "priority above max");
    checkThrows(ErrorKind::ConstraintViolation, [&] { (void)card.with("priority", -1); },
                "negative priority");
    checkThrows(ErrorKind::TooLong,
                [&] {
                    (void)card.with("emails", Value::list({Value{"a"}, Value{"b"}, Value{"c"},
                                                           Value{"d"}, Value{"e"}}));
                },
                "five emails");

    checkThrows(ErrorKind::DuplicateSchema,
                [&] {
                    SchemaRegistry again;
                    (void)loadSchemas(specs / "person.xml", again);
                    (void)loadSchemas(specs / "person.xml", again);
                },
                "loading the same file twice");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: tree.xml (forward and self references)
// ─────────────────────────────────────────────────────────────────────────────
static void testTreeFile(const fs::path& specs) {
    std::cout << "\n=== Test: load tree.xml ===\n";
    SchemaRegistry registry;
    const auto names = loadSchemas(specs / "tree.xml", registry);
    registry.freeze();
    CHECK((names == std::vector<std::string>{"Forest", "Tree"}), "Forest declared before Tree");

    const SchemaPtr tree   = registry.resolve("Tree");
    const SchemaPtr forest = registry.resolve("Forest");

    const Record leaf  = construct(tree, {{"value", "a"}});
    const Record root  = construct(tree, {{"left", leaf}, {"value", "root"}});
    const Record woods = construct(forest, {{"trees", Value::list({Value{root}, Value{leaf}})}});

    CHECK(serialize(leaf) == (Bytes{0x01, 0x00, 0x00, 0x02, 0x01, 0x61}), "leaf bytes");
    CHECK(deserialize(forest, serialize(woods)) == woods, "Forest round trip");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: cross-field checks are attached by schema name
// ─────────────────────────────────────────────────────────────────────────────
static void testChecksByName() {
    std::cout << "\n=== Test: cross-field checks ===\n";
    const std::string xml = R"(
        <Schemas>
          <Schema name="Range">
            <Field name="lo" type="integer"/>
            <Field name="hi" type="integer"/>
          </Schema>
        </Schemas>)";

    std::vector<std::set<std::string>> seen;
    CrossFieldChecks checks;
    checks["Range"] = [&seen](const Record& r, const std::set<std::string>& changed) {
        seen.push_back(changed);
        if (r["lo"].asInt() > r["hi"].asInt())
            throw ValidationError("lo must not exceed hi");
    };
    // Unknown names only produce a warning
    checks["Elsewhere"] = [](const Record&, const std::set<std::string>&) {};

    SchemaRegistry registry;
    (void)loadSchemasFromString(xml, registry, checks);
    const SchemaPtr range = registry.resolve("Range");
    CHECK(static_cast<bool>(range->check()), "check attached");

    Record r = construct(range, {{"lo", 1}, {"hi", 2}});
    CHECK(seen.size() == 1, "check ran on construct");
    checkThrows(ErrorKind::CheckFailed, [&] { r.set("hi", 0); }, "hi below lo rejected");
    CHECK(r["hi"].asInt() == 2, "record unchanged");
    CHECK(seen.size() == 2 && seen.back() == std::set<std::string>{"hi"}, "mutate passes {hi}");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: documents that must be rejected
// ─────────────────────────────────────────────────────────────────────────────
static void testRejectedDocuments() {
    std::cout << "\n=== Test: invalid documents ===\n";
    checkRejected("<Schemas><Schema name=\"A\">", "unterminated XML");
    checkRejected("<Types/>", "wrong root element");
    checkRejected("<Schemas><Schema><Field name=\"x\" type=\"integer\"/></Schema></Schemas>",
                  "schema without name");
    checkRejected("<Schemas><Schema name=\"A\"><Field type=\"integer\"/></Schema></Schemas>",
                  "field without name");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\"/></Schema></Schemas>",
                  "field without type");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"float\"/></Schema></Schemas>",
                  "unknown type");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"list\"/></Schema></Schemas>",
                  "list without <Element>");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"record\"/></Schema></Schemas>",
                  "record without schema");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"integer\" min=\"abc\"/>"
                  "</Schema></Schemas>",
                  "non-numeric min");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"boolean\" default=\"yes\"/>"
                  "</Schema></Schemas>",
                  "bad boolean default");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"bytes\" default=\"abc\"/>"
                  "</Schema></Schemas>",
                  "odd number of hex digits");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"boolean\" maxLength=\"3\"/>"
                  "</Schema></Schemas>",
                  "maxLength on a boolean");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"integer\"/>"
                  "<Field name=\"x\" type=\"string\"/></Schema></Schemas>",
                  "duplicate field");
    checkRejected("<Schemas><Schema name=\"A\"><Field name=\"x\" type=\"record\" schema=\"A\" "
                  "default=\"1\"/></Schema></Schemas>",
                  "default on a record field");

    SchemaRegistry registry;
    try {
        (void)loadSchemas("/nonexistent/encodium.xml", registry);
        std::cerr << "FAIL missing file accepted\n";
        ++failures;
    } catch (const SchemaLoadError& e) {
        CHECK(true, std::string("missing file → ") + e.what());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();

    fs::path specs = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "specs";

    std::cout << "Using specs: " << specs << '\n';

    testPersonFile(specs);
    testTreeFile(specs);
    testChecksByName();
    testRejectedDocuments();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
