//
// Unit tests for CodeWriter, the block guards and the C# writer
//

#include <doctest/doctest.h>
#include <sqlmarshal/codegen/code_writer.hh>
#include <sqlmarshal/codegen/csharp/csharp_code_writer.hh>
#include <sstream>
#include <string>

using namespace sqlmarshal::codegen;

TEST_SUITE("Codegen - CodeWriter") {

    TEST_CASE("Basic output") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        SUBCASE("Single line") {
            writer.write_line("hello");
            CHECK(oss.str() == "hello\n");
        }

        SUBCASE("Raw text") {
            writer.write_raw("raw");
            CHECK(oss.str() == "raw");
        }

        SUBCASE("Blank lines carry no indentation") {
            writer.indent();
            writer.write_blank_line();
            writer.write_line("");
            CHECK(oss.str() == "\n\n");
        }
    }

    TEST_CASE("Indentation") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        writer.indent();
        writer.indent();
        writer.write_line("deep");
        writer.unindent();
        writer.write_line("shallow");
        writer.unindent();
        writer.unindent();
        writer.write_line("top");

        CHECK(oss.str() == "        deep\n    shallow\ntop\n");
        CHECK(writer.current_indent_level() == 0);

        SUBCASE("Custom indent string") {
            std::ostringstream tabs;
            CodeWriter tab_writer(tabs);
            tab_writer.set_indent_string("\t");
            tab_writer.indent();
            tab_writer.write_line("x");
            CHECK(tabs.str() == "\tx\n");
        }
    }

    TEST_CASE("Streaming accumulates until endl") {
        std::ostringstream oss;
        CodeWriter writer(oss);
        writer.indent();

        writer << "var value_" << 3 << " = reader.GetValue(" << size_t{3} << ");";
        CHECK(oss.str().empty());

        writer << endl << blank;
        CHECK(oss.str() == "    var value_3 = reader.GetValue(3);\n\n");
    }

    TEST_CASE("K&R block guards") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        {
            auto loop = writer.write_while("more()");
            writer << "step();" << endl;
            {
                auto cond = writer.write_if("done()");
                writer << "break;" << endl;
            }
        }

        CHECK(oss.str() ==
              "while (more()) {\n"
              "    step();\n"
              "    if (done()) {\n"
              "        break;\n"
              "    }\n"
              "}\n");
    }

    TEST_CASE("Initializer block closes with a semicolon") {
        std::ostringstream oss;
        CodeWriter writer(oss);
        {
            auto init = writer.write_initializer("int values[] =");
            init << "1," << endl;
        }
        CHECK(oss.str() == "int values[] = {\n    1,\n};\n");
    }

    TEST_CASE("Guards close exactly once") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        SUBCASE("Explicit close") {
            auto scope = writer.write_scope("s");
            scope.close();
            scope.close();
            CHECK(oss.str() == "s {\n}\n");
        }

        SUBCASE("Moved-from guard closes nothing") {
            {
                auto first = writer.write_scope();
                auto second = std::move(first);
            }
            CHECK(oss.str() == "{\n}\n");
            CHECK(writer.current_indent_level() == 0);
        }
    }
}

TEST_SUITE("Codegen - CSharpCodeWriter") {

    TEST_CASE("Allman braces") {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);

        {
            auto ns = writer.write_namespace("Foo");
            auto cls = writer.write_class("partial", "C");
            auto method = writer.write_method("public partial int M()");
            writer << "return 0;" << endl;
        }

        CHECK(oss.str() ==
              "namespace Foo\n"
              "{\n"
              "    partial class C\n"
              "    {\n"
              "        public partial int M()\n"
              "        {\n"
              "            return 0;\n"
              "        }\n"
              "    }\n"
              "}\n");
    }

    TEST_CASE("try/finally") {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);

        {
            auto body = writer.write_try();
            writer << "Run();" << endl;
            auto cleanup = body.write_finally();
            writer << "Close();" << endl;
        }

        CHECK(oss.str() ==
              "try\n"
              "{\n"
              "    Run();\n"
              "}\n"
              "finally\n"
              "{\n"
              "    Close();\n"
              "}\n");
    }

    TEST_CASE("Class with base type") {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);
        { auto cls = writer.write_class("internal sealed", "A", "System.Attribute"); }
        CHECK(oss.str() == "internal sealed class A : System.Attribute\n{\n}\n");
    }

    TEST_CASE("Usings, directives and comments") {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);

        writer.write_comment_block({"<auto-generated>", ""});
        writer.write_directive("nullable enable");
        writer.write_usings({"System", "System.Linq"});

        CHECK(oss.str() ==
              "// <auto-generated>\n"
              "//\n"
              "#nullable enable\n"
              "using System;\n"
              "using System.Linq;\n");
    }
}
