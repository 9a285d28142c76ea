#pragma once
// Schema.hpp – Record schemas, the builder that fixes their field order, and
// the name-keyed registry that resolves nested and self references.
//
// Usage example:
//   SchemaRegistry registry;
//   SchemaBuilder tree("Tree");
//   tree.add(field::record("left", "Tree", {.optional = true}));
//   tree.add(field::record("right", "Tree", {.optional = true}));
//   tree.add(field::string("value"));
//   registry.add(tree.build());
//   registry.freeze();
//
//   auto schema = registry.resolve("Tree");

#include "Types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace encodium {

class Record;
class Schema;
class SchemaRegistry;

using SchemaPtr = std::shared_ptr<const Schema>;

// Cross-field check: receives the candidate record and the names of the fields
// assigned by the current operation. Rejects by throwing ValidationError.
using CrossFieldCheck =
    std::function<void(const Record& record, const std::set<std::string>& changed)>;

// ─────────────────────────────────────────────────────────────────────────────
//  Schema
// ─────────────────────────────────────────────────────────────────────────────
// Immutable once built. Fields are held in declaration order.
class Schema {
public:
    [[nodiscard]] const std::string&            name()   const noexcept { return name_; }
    [[nodiscard]] const std::vector<FieldSpec>& fields() const noexcept { return fields_; }
    [[nodiscard]] const CrossFieldCheck&        check()  const noexcept { return check_; }

    // Index of the named field, or fields().size() when absent.
    [[nodiscard]] std::size_t indexOf(std::string_view field) const noexcept;

    // Named field spec, or nullptr.
    [[nodiscard]] const FieldSpec* field(std::string_view name) const noexcept;

    // The registry this schema was added to; nullptr until registered.
    [[nodiscard]] const SchemaRegistry* registry() const noexcept { return registry_; }

    // Resolve a schema reference through the owning registry.
    // Throws SchemaError(UnknownSchema) when unregistered or unknown.
    [[nodiscard]] SchemaPtr resolve(std::string_view name) const;

private:
    friend class SchemaBuilder;
    friend class SchemaRegistry;

    Schema() = default;

    std::string            name_;
    std::vector<FieldSpec> fields_;
    CrossFieldCheck        check_;
    const SchemaRegistry*  registry_{nullptr};
};

// ─────────────────────────────────────────────────────────────────────────────
//  SchemaBuilder
// ─────────────────────────────────────────────────────────────────────────────
// Each add() consumes the next sequence number, so field order is exactly the
// order of the add() calls.
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string name);

    SchemaBuilder& add(FieldSpec spec);
    SchemaBuilder& check(CrossFieldCheck fn);

    [[nodiscard]] std::uint32_t nextSequence() const noexcept { return next_seq_; }

    // Validate the declaration and produce the schema.
    // Throws SchemaError(InvalidSchema) on a malformed declaration.
    [[nodiscard]] Schema build() const;

private:
    std::string            name_;
    std::vector<FieldSpec> fields_;
    CrossFieldCheck        check_;
    std::uint32_t          next_seq_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
//  SchemaRegistry
// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle: populate with add() during start-up, then freeze(). After
// freeze() the registry is read-only and may be shared between threads
// without locking. The registry must outlive every record built from its
// schemas.
class SchemaRegistry {
public:
    SchemaRegistry() = default;
    SchemaRegistry(const SchemaRegistry&)            = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    // Throws SchemaError(DuplicateSchema) or SchemaError(RegistryFrozen).
    SchemaPtr add(Schema schema);

    // Throws SchemaError(UnknownSchema).
    [[nodiscard]] SchemaPtr resolve(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const noexcept { return schemas_.size(); }

    void freeze();
    [[nodiscard]] bool frozen() const noexcept { return frozen_; }

private:
    std::map<std::string, SchemaPtr, std::less<>> schemas_;
    bool frozen_{false};
};

} // namespace encodium
