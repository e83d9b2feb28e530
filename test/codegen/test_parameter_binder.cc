//
// Unit tests for the parameter binder
//

#include <doctest/doctest.h>
#include <sqlmarshal/codegen/csharp/csharp_code_writer.hh>
#include <sqlmarshal/codegen/csharp/parameter_binder.hh>
#include <test_support.hh>
#include <sstream>

using namespace sqlmarshal;
using namespace sqlmarshal::codegen;
using test_support::load_model;

namespace {

binding::parameter_spec param(const std::string& name, const std::string& type,
                              binding::direction dir = binding::direction::in) {
    binding::parameter_spec spec;
    spec.internal_name = name;
    spec.declared_type = model::parse_type_name(type);
    spec.dir = dir;
    return spec;
}

struct binder_fixture {
    model::compilation compilation = load_model("types: []\n");
    TypeUniverse universe{compilation};
    TypeClassifier classifier{universe};
    TypeNameFormatter names{universe, "Foo"};

    std::string bindings(const binding::procedure_binding& procedure, bool annotations) const {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);
        ParameterBinder(classifier, names, annotations, "Foo").emit_bindings(writer, procedure);
        return oss.str();
    }

    std::string read_backs(const binding::procedure_binding& procedure, bool annotations) const {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);
        ParameterBinder(classifier, names, annotations, "Foo").emit_read_backs(writer, procedure);
        return oss.str();
    }
};

}  // namespace

TEST_SUITE("Codegen - Parameter binder") {

    TEST_CASE_FIXTURE(binder_fixture, "Every direction in declaration order") {
        binding::procedure_binding procedure;
        procedure.parameters = {
            param("clientId", "int"),
            param("personId", "string?"),
            param("total", "int", binding::direction::out),
            param("counter", "long?", binding::direction::in_out),
        };

        CHECK(bindings(procedure, false) ==
              "var clientIdParameter = command.CreateParameter();\n"
              "clientIdParameter.ParameterName = \"@client_id\";\n"
              "clientIdParameter.Value = clientId;\n"
              "\n"
              "var personIdParameter = command.CreateParameter();\n"
              "personIdParameter.ParameterName = \"@person_id\";\n"
              "personIdParameter.Value = personId == null ? (object)DBNull.Value : personId;\n"
              "\n"
              "var totalParameter = command.CreateParameter();\n"
              "totalParameter.ParameterName = \"@total\";\n"
              "totalParameter.DbType = System.Data.DbType.Int32;\n"
              "totalParameter.Direction = System.Data.ParameterDirection.Output;\n"
              "\n"
              "var counterParameter = command.CreateParameter();\n"
              "counterParameter.ParameterName = \"@counter\";\n"
              "counterParameter.DbType = System.Data.DbType.Int64;\n"
              "counterParameter.Direction = System.Data.ParameterDirection.InputOutput;\n"
              "counterParameter.Value = counter == null ? (object)DBNull.Value : counter;\n"
              "\n"
              "var parameters = new DbParameter[]\n"
              "{\n"
              "    clientIdParameter,\n"
              "    personIdParameter,\n"
              "    totalParameter,\n"
              "    counterParameter,\n"
              "};\n"
              "\n");

        CHECK(read_backs(procedure, false) ==
              "total = (int)totalParameter.Value;\n"
              "counter = counterParameter.Value == DBNull.Value ? (long?)null : (long)counterParameter.Value;\n");
    }

    TEST_CASE_FIXTURE(binder_fixture, "No bound parameters emit nothing") {
        binding::procedure_binding procedure;
        CHECK(bindings(procedure, false).empty());

        auto sql = param("sql", "string");
        sql.is_raw_command_text = true;
        procedure.parameters = {sql};
        CHECK(bindings(procedure, false).empty());
        CHECK(read_backs(procedure, false).empty());
    }

    TEST_CASE_FIXTURE(binder_fixture, "Raw command parameter is skipped") {
        binding::procedure_binding procedure;
        auto sql = param("sql", "string");
        sql.is_raw_command_text = true;
        procedure.parameters = {sql, param("id", "int")};

        const auto text = bindings(procedure, false);
        CHECK(text.find("sqlParameter") == std::string::npos);
        CHECK(text.find("idParameter,") != std::string::npos);
    }

    TEST_CASE_FIXTURE(binder_fixture, "Reference types follow the annotation mode") {
        binding::procedure_binding procedure;
        procedure.parameters = {param("name", "string"),
                                param("label", "string", binding::direction::out)};

        SUBCASE("Annotations disabled: every reference may be null") {
            const auto text = bindings(procedure, false);
            CHECK(text.find("nameParameter.Value = name == null ? (object)DBNull.Value : name;") !=
                  std::string::npos);
            CHECK(read_backs(procedure, false) ==
                  "label = labelParameter.Value == DBNull.Value ? (string)null : (string)labelParameter.Value;\n");
        }

        SUBCASE("Annotations enabled: unannotated references are not null") {
            const auto text = bindings(procedure, true);
            CHECK(text.find("nameParameter.Value = name;") != std::string::npos);
            CHECK(read_backs(procedure, true) == "label = (string)labelParameter.Value;\n");
        }
    }

    TEST_CASE_FIXTURE(binder_fixture, "Output parameters need a scalar mapping") {
        binding::procedure_binding procedure;
        procedure.parameters = {param("when", "TimeSpan", binding::direction::out)};
        CHECK_THROWS_AS(bindings(procedure, false), unsupported_type_error);
    }

    TEST_CASE("Parameter variable names") {
        CHECK(parameter_variable(param("clientId", "int")) == "clientIdParameter");
    }
}
