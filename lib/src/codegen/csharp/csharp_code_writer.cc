#include <sqlmarshal/codegen/csharp/csharp_code_writer.hh>

namespace sqlmarshal::codegen {

CSharpCodeWriter::CSharpCodeWriter(std::ostream& output)
    : CodeWriter(output)
{
}

void CSharpCodeWriter::write_block_open(const std::string& header) {
    if (!header.empty()) {
        write_line(header);
    }
    write_line("{");
    indent();
}

ScopeBlock CSharpCodeWriter::write_namespace(const std::string& name) {
    return write_scope("namespace " + name);
}

ScopeBlock CSharpCodeWriter::write_class(const std::string& modifiers,
                                         const std::string& name,
                                         const std::string& base) {
    std::string header = modifiers.empty() ? "class " + name : modifiers + " class " + name;
    if (!base.empty()) {
        header += " : " + base;
    }
    return write_scope(header);
}

ScopeBlock CSharpCodeWriter::write_method(const std::string& signature) {
    return write_scope(signature);
}

void CSharpCodeWriter::write_using(const std::string& ns) {
    write_line("using " + ns + ";");
}

void CSharpCodeWriter::write_usings(const std::vector<std::string>& namespaces) {
    for (const auto& ns : namespaces) {
        write_using(ns);
    }
}

void CSharpCodeWriter::write_directive(const std::string& directive) {
    write_line("#" + directive);
}

void CSharpCodeWriter::write_comment(const std::string& comment) {
    write_line(comment.empty() ? "//" : "// " + comment);
}

void CSharpCodeWriter::write_comment_block(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        write_comment(line);
    }
}

}  // namespace sqlmarshal::codegen
