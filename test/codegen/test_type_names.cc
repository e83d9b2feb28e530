#include <doctest/doctest.h>
#include <sqlmarshal/codegen/csharp/csharp_type_names.hh>
#include <test_support.hh>

using namespace sqlmarshal;
using namespace sqlmarshal::codegen;
using test_support::load_model;

namespace {

model::type_ref ref(const std::string& text) {
    return model::parse_type_name(text);
}

}  // namespace

TEST_SUITE("Codegen - C# type names") {

    TEST_CASE("Framework names become keywords") {
        CHECK(keyword_name("Int32") == "int");
        CHECK(keyword_name("System.String") == "string");
        CHECK(keyword_name("Boolean") == "bool");
        CHECK(keyword_name("DateTime") == "DateTime");
        CHECK(keyword_name("int") == "int");
    }

    TEST_CASE("DbType members") {
        CHECK(db_type_name(scalar_kind::int32) == "System.Data.DbType.Int32");
        CHECK(db_type_name(scalar_kind::text) == "System.Data.DbType.String");
        CHECK(db_type_name(scalar_kind::timestamp) == "System.Data.DbType.DateTime2");
        CHECK(db_type_name(scalar_kind::uint8) == "System.Data.DbType.Byte");
        CHECK(db_type_name(scalar_kind::int8) == "System.Data.DbType.SByte");
        CHECK_THROWS_AS(db_type_name(scalar_kind::unsupported), unsupported_type_error);
    }

    TEST_CASE("Display form") {
        auto c = load_model(R"(
types:
  - name: Item
    namespace: Foo
)");
        TypeUniverse universe(c);
        TypeNameFormatter names(universe, "Foo");

        CHECK(names.display(ref("int")) == "int");
        CHECK(names.display(ref("Int32")) == "int");
        CHECK(names.display(ref("string?")) == "string?");
        CHECK(names.display(ref("Nullable<int>")) == "int?");
        CHECK(names.display(ref("Item")) == "Foo.Item");
        CHECK(names.display(ref("IList<Item>")) == "IList<Foo.Item>");
        CHECK(names.display(ref("Item?")) == "Foo.Item?");
        CHECK(names.display(ref("DbConnection")) == "DbConnection");
        CHECK(names.display(ref("Other.Thing")) == "Other.Thing");
    }

    TEST_CASE("Short form") {
        auto c = load_model("types: []\n");
        TypeUniverse universe(c);
        TypeNameFormatter names(universe, "Foo");

        CHECK(names.short_name(ref("Foo.Item")) == "Item");
        CHECK(names.short_name(ref("Int64")) == "long");
    }
}
