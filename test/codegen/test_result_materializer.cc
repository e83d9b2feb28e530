//
// Unit tests for result materialization
//

#include <doctest/doctest.h>
#include <sqlmarshal/codegen/csharp/csharp_code_writer.hh>
#include <sqlmarshal/codegen/csharp/result_materializer.hh>
#include <test_support.hh>
#include <sstream>

using namespace sqlmarshal;
using namespace sqlmarshal::codegen;
using test_support::load_model;

namespace {

const char* ENTITIES = R"(
types:
  - name: Item
    namespace: Foo
    properties:
      - { name: Id, type: int }
      - { name: Name, type: string }
  - name: Point
    namespace: Foo
    kind: struct
    properties:
      - { name: X, type: int }
  - name: ItemsContext
    namespace: Foo
    base: DbContext
    properties:
      - { name: Catalog, type: DbSet<Item> }
)";

binding::parameter_spec param(const std::string& name, const std::string& type,
                              binding::direction dir = binding::direction::in) {
    binding::parameter_spec spec;
    spec.internal_name = name;
    spec.declared_type = model::parse_type_name(type);
    spec.dir = dir;
    return spec;
}

binding::procedure_binding raw_procedure(const std::string& returns) {
    binding::procedure_binding procedure;
    procedure.name = "M";
    procedure.return_type = model::parse_type_name(returns);
    auto sql = param("sql", "string");
    sql.is_raw_command_text = true;
    procedure.parameters.push_back(sql);
    procedure.source = binding::raw_text{"sql"};
    return procedure;
}

struct materializer_fixture {
    model::compilation compilation = load_model(ENTITIES);
    TypeUniverse universe{compilation};
    TypeClassifier classifier{universe};
    TypeNameFormatter names{universe, "Foo"};
    ParameterBinder binder{classifier, names, false, "Foo"};

    std::string render(const binding::procedure_binding& procedure,
                       const connection_strategy& connection) const {
        std::ostringstream oss;
        CSharpCodeWriter writer(oss);
        ResultMaterializer materializer(universe, names, binder, connection, "Foo");
        materializer.emit(writer, procedure, classifier.classify(procedure.return_type, "Foo"));
        return oss.str();
    }
};

}  // namespace

TEST_SUITE("Codegen - Result materializer") {

    TEST_CASE("Strategy selection") {
        type_classification scalar;
        scalar.kind = classification_kind::scalar;
        type_classification none;
        type_classification entity;
        entity.kind = classification_kind::entity_type;
        type_classification list;
        list.kind = classification_kind::entity_collection;

        const connection_strategy conn = connection_field{"connection"};
        const connection_strategy ctx = context_field{"ctx", model::parse_type_name("DbContext")};
        const connection_strategy fallback = assumed_default{"dbContext"};

        CHECK(select_result_strategy(scalar, ctx) == result_strategy::scalar);
        CHECK(select_result_strategy(none, ctx) == result_strategy::non_query);
        CHECK(select_result_strategy(list, ctx) == result_strategy::orm);
        CHECK(select_result_strategy(entity, ctx) == result_strategy::orm);
        CHECK(select_result_strategy(list, conn) == result_strategy::manual);
        CHECK(select_result_strategy(list, fallback) == result_strategy::manual);
        CHECK(std::string(to_string(result_strategy::non_query)) == "non-query");
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Entity set accessor") {
        const connection_strategy ctx = context_field{"ctx", model::parse_type_name("ItemsContext")};
        ResultMaterializer materializer(universe, names, binder, ctx, "Foo");
        auto procedure = raw_procedure("IList<Item>");

        SUBCASE("DbSet property of the context") {
            CHECK(materializer.entity_set_name(model::parse_type_name("Item"), procedure) == "Catalog");
        }

        SUBCASE("Explicit override wins") {
            procedure.overrides[ENTITY_SET_OVERRIDE] = "Archive";
            CHECK(materializer.entity_set_name(model::parse_type_name("Item"), procedure) == "Archive");
        }

        SUBCASE("Pluralized item name otherwise") {
            CHECK(materializer.entity_set_name(model::parse_type_name("Point"), procedure) == "Points");
        }
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Scalar result") {
        auto procedure = raw_procedure("int");
        procedure.parameters.push_back(param("clientId", "int"));

        CHECK(render(procedure, connection_field{"connection"}) ==
              "command.CommandText = sql;\n"
              "command.Parameters.AddRange(parameters);\n"
              "this.connection.Open();\n"
              "try\n"
              "{\n"
              "    var result = command.ExecuteScalar();\n"
              "    return (int)result;\n"
              "}\n"
              "finally\n"
              "{\n"
              "    this.connection.Close();\n"
              "}\n");
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Nullable scalar result maps the null sentinel") {
        auto procedure = raw_procedure("int?");
        const auto text = render(procedure, connection_field{"connection"});
        CHECK(text.find("return result == DBNull.Value ? (int?)null : (int)result;") != std::string::npos);
        CHECK(text.find("AddRange") == std::string::npos);
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Void result with read-back") {
        binding::procedure_binding procedure;
        procedure.return_type = model::parse_type_name("void");
        procedure.source = binding::named_procedure{"sp_count"};
        procedure.parameters = {param("total", "int", binding::direction::out)};

        CHECK(render(procedure, context_field{"ctx", model::parse_type_name("ItemsContext")}) ==
              "var sqlQuery = @\"sp_count @total OUTPUT\";\n"
              "command.CommandText = sqlQuery;\n"
              "command.Parameters.AddRange(parameters);\n"
              "this.ctx.Database.OpenConnection();\n"
              "try\n"
              "{\n"
              "    command.ExecuteNonQuery();\n"
              "    total = (int)totalParameter.Value;\n"
              "}\n"
              "finally\n"
              "{\n"
              "    this.ctx.Database.CloseConnection();\n"
              "}\n");
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Manual list") {
        auto procedure = raw_procedure("IList<Item>");

        CHECK(render(procedure, connection_field{"connection"}) ==
              "command.CommandText = sql;\n"
              "using var reader = command.ExecuteReader();\n"
              "var result = new List<Item>();\n"
              "while (reader.Read())\n"
              "{\n"
              "    var item = new Item();\n"
              "    var value_0 = reader.GetValue(0);\n"
              "    item.Id = (int)value_0;\n"
              "    var value_1 = reader.GetValue(1);\n"
              "    item.Name = value_1 == DBNull.Value ? (string)null : (string)value_1;\n"
              "    result.Add(item);\n"
              "}\n"
              "\n"
              "reader.Close();\n"
              "return result;\n");
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Manual single row") {
        SUBCASE("Class starts out null") {
            auto procedure = raw_procedure("Item");
            const auto text = render(procedure, connection_field{"connection"});
            CHECK(text.find("Item? result = null;\n"
                            "if (reader.Read())\n"
                            "{\n"
                            "    var item = new Item();\n") != std::string::npos);
            CHECK(text.find("    result = item;\n}\n\nreader.Close();\nreturn result;\n") !=
                  std::string::npos);
        }

        SUBCASE("Struct starts out as its default") {
            auto procedure = raw_procedure("Point");
            const auto text = render(procedure, connection_field{"connection"});
            CHECK(text.find("var result = default(Point);\n") != std::string::npos);
        }

        SUBCASE("Nullable struct starts out null") {
            for (const char* returns : {"Point?", "Nullable<Point>"}) {
                CAPTURE(returns);
                auto procedure = raw_procedure(returns);
                const auto text = render(procedure, connection_field{"connection"});
                CHECK(text.find("Point? result = null;\nif (reader.Read())\n") != std::string::npos);
                CHECK(text.find("default(Point)") == std::string::npos);
            }
        }
    }

    TEST_CASE_FIXTURE(materializer_fixture, "Rows need a declared entity type") {
        auto procedure = raw_procedure("IList<Gadget>");
        CHECK_THROWS_AS(render(procedure, connection_field{"connection"}), unsupported_type_error);
    }

    TEST_CASE_FIXTURE(materializer_fixture, "ORM list and single row") {
        const connection_strategy ctx = context_field{"ctx", model::parse_type_name("ItemsContext")};

        SUBCASE("Named procedure with parameters") {
            binding::procedure_binding procedure;
            procedure.return_type = model::parse_type_name("List<Item>");
            procedure.source = binding::named_procedure{"items_by_owner"};
            procedure.parameters = {param("ownerId", "int"),
                                    param("total", "int", binding::direction::out)};

            CHECK(render(procedure, ctx) ==
                  "var sqlQuery = @\"items_by_owner @owner_id, @total OUTPUT\";\n"
                  "var result = this.ctx.Catalog.FromSqlRaw(sqlQuery, parameters).ToList();\n"
                  "total = (int)totalParameter.Value;\n"
                  "return result;\n");
        }

        SUBCASE("Raw text single row") {
            auto procedure = raw_procedure("Item");
            CHECK(render(procedure, ctx) ==
                  "var result = this.ctx.Catalog.FromSqlRaw(sql).AsEnumerable().FirstOrDefault();\n"
                  "return result;\n");
        }
    }
}
