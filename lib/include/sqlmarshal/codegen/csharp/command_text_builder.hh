#pragma once

#include <sqlmarshal/binding.hh>
#include <sqlmarshal/codegen/code_writer.hh>
#include <string>

namespace sqlmarshal::codegen {

/**
 * Builds the command text of a procedure.
 *
 * Raw text: the parameter carrying the text is referenced directly.
 * Named procedure: "<name> @p1, @p2 OUTPUT" held in a verbatim string local
 * named `sqlQuery`; out and ref parameters carry the OUTPUT marker.
 */
class CommandTextBuilder {
public:
    explicit CommandTextBuilder(const binding::procedure_binding& procedure);

    /// Invocation text of a named procedure ("sp_get @client_id, @total OUTPUT")
    [[nodiscard]] static std::string procedure_invocation(const std::string& procedure_name,
                                                          const binding::procedure_binding& procedure);

    /// C# verbatim string literal (`@"..."`, quotes doubled)
    [[nodiscard]] static std::string verbatim_literal(const std::string& text);

    /// Expression holding the command text at run time ("sql" or "sqlQuery")
    [[nodiscard]] std::string text_expression() const;

    /// `var sqlQuery = @"...";` for named procedures; nothing for raw text
    void emit_text_declaration(CodeWriter& writer) const;

    /// Declaration (if any) followed by `command.CommandText = <expr>;`
    void emit_command_text(CodeWriter& writer) const;

private:
    const binding::procedure_binding& procedure_;
};

}  // namespace sqlmarshal::codegen
