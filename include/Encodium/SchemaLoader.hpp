#pragma once
// SchemaLoader.hpp – Declares schemas from an XML document.
//
//   <Schemas>
//     <Schema name="Person">
//       <Field name="age"      type="integer" min="0"/>
//       <Field name="name"     type="string"  maxLength="50"/>
//       <Field name="diabetic" type="boolean" default="true"/>
//       <Field name="tags"     type="list" optional="true">
//         <Element type="string" maxLength="16"/>
//       </Field>
//     </Schema>
//   </Schemas>
//
// Fields keep document order. Cross-field checks cannot be written in XML;
// pass them by schema name instead.

#include "Schema.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace encodium {

// Thrown when the XML is structurally invalid or violates the schema rules.
class SchemaLoadError : public SchemaError {
public:
    explicit SchemaLoadError(std::string message)
        : SchemaError(ErrorKind::InvalidSchema, std::move(message)) {}
};

using CrossFieldChecks = std::map<std::string, CrossFieldCheck, std::less<>>;

// Parse every <Schema> in the file and add it to the registry.
// Returns the schema names in document order.
// Throws SchemaLoadError on any parse or validation failure, SchemaError when
// the registry rejects a schema.
std::vector<std::string> loadSchemas(const std::filesystem::path& xml_path,
                                     SchemaRegistry& registry,
                                     const CrossFieldChecks& checks = {});

std::vector<std::string> loadSchemasFromString(std::string_view xml,
                                               SchemaRegistry& registry,
                                               const CrossFieldChecks& checks = {});

} // namespace encodium
