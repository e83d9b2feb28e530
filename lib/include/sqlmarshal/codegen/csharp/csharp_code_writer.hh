//
// C# Code Writer
//
// Extends the generic CodeWriter with C# conventions:
// - Allman brace placement (opening brace on its own line)
// - Namespace, class and method blocks
// - using directives, preprocessor lines and comment banners
//

#pragma once

#include <sqlmarshal/codegen/code_writer.hh>
#include <string>
#include <vector>

namespace sqlmarshal::codegen {

class CSharpCodeWriter : public CodeWriter {
public:
    explicit CSharpCodeWriter(std::ostream& output);

    void write_block_open(const std::string& header) override;

    // ========================================================================
    // C# Blocks
    // ========================================================================

    ScopeBlock write_namespace(const std::string& name);

    /// Class block; `modifiers` precede the class keyword ("partial", "internal sealed")
    ScopeBlock write_class(const std::string& modifiers, const std::string& name,
                           const std::string& base = {});

    /// Method block under a complete signature line
    ScopeBlock write_method(const std::string& signature);

    // ========================================================================
    // C# Output Helpers
    // ========================================================================

    void write_using(const std::string& ns);
    void write_usings(const std::vector<std::string>& namespaces);

    /// `#nullable enable`, `#pragma warning disable 1591`, ...
    void write_directive(const std::string& directive);

    void write_comment(const std::string& comment);
    void write_comment_block(const std::vector<std::string>& lines);
};

}  // namespace sqlmarshal::codegen
