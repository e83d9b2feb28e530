#include <doctest/doctest.h>
#include <sqlmarshal/analysis.hh>
#include <test_support.hh>
#include <sstream>

using namespace sqlmarshal;
using namespace sqlmarshal::analysis;
using test_support::declare_markers;
using test_support::load_model;

TEST_SUITE("Analysis - analyze") {

    TEST_CASE("Missing marker symbols are fatal") {
        auto c = load_model(R"(
types:
  - name: C
    methods:
      - { name: M, returns: int, attributes: [ SqlMarshal ] }
)");

        auto result = analyze(c);
        CHECK_FALSE(result.analyzed.has_value());
        CHECK(result.error_count() == 2);
        CHECK(result.diagnostics[0].code == diag_codes::E_NO_MARKER_SYMBOL);
        CHECK(result.diagnostics[1].code == diag_codes::E_NO_RAW_SQL_SYMBOL);
    }

    TEST_CASE("Declarations are grouped by enclosing type in first-appearance order") {
        auto c = load_model(R"(
types:
  - name: Second
    namespace: Foo
    methods:
      - name: A
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp_a ] } ]
  - name: First
    namespace: Foo
    methods:
      - name: B
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp_b ] } ]
      - name: NotGenerated
        returns: int
  - name: Second
    namespace: Foo
    methods:
      - name: C
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp_c ] } ]
)");
        declare_markers(c);

        auto result = analyze(c);
        REQUIRE(result.analyzed.has_value());
        CHECK_FALSE(result.has_errors());

        const auto& units = result.analyzed->units;
        REQUIRE(units.size() == 2);

        CHECK(units[0].type->name == "Second");
        CHECK(units[0].parts.size() == 2);
        REQUIRE(units[0].procedures.size() == 2);
        CHECK(units[0].procedures[0].name == "A");
        CHECK(units[0].procedures[1].name == "C");

        CHECK(units[1].type->name == "First");
        REQUIRE(units[1].procedures.size() == 1);
        CHECK(units[1].procedures[0].name == "B");
    }

    TEST_CASE("Fields of all partial parts are visible") {
        auto c = load_model(R"(
types:
  - name: C
    fields:
      - { name: connection, type: DbConnection }
  - name: C
    methods:
      - name: M
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp ] } ]
)");
        declare_markers(c);

        auto result = analyze(c);
        REQUIRE(result.analyzed.has_value());
        REQUIRE(result.analyzed->units.size() == 1);

        auto fields = result.analyzed->units[0].fields();
        REQUIRE(fields.size() == 1);
        CHECK(fields[0]->name == "connection");
    }

    TEST_CASE("Nested enclosing types are skipped without a diagnostic") {
        auto c = load_model(R"(
types:
  - name: Inner
    namespace: Foo
    containing_type: Outer
    methods:
      - name: M
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp ] } ]
)");
        declare_markers(c);

        auto result = analyze(c);
        REQUIRE(result.analyzed.has_value());
        CHECK(result.diagnostics.empty());
        CHECK(result.analyzed->units.empty());
        CHECK(result.analyzed->skipped_nested == std::vector<std::string>{"Foo.Inner.M"});
    }

    TEST_CASE("Invalid declarations are dropped, valid ones kept") {
        auto c = load_model(R"(
types:
  - name: C
    methods:
      - name: Bad
        returns: int
        attributes: [ SqlMarshal ]
      - name: Good
        returns: int
        attributes: [ { name: SqlMarshal, arguments: [ sp ] } ]
)");
        declare_markers(c);

        auto result = analyze(c);
        REQUIRE(result.analyzed.has_value());
        CHECK(result.has_errors());
        REQUIRE(result.analyzed->units.size() == 1);
        REQUIRE(result.analyzed->units[0].procedures.size() == 1);
        CHECK(result.analyzed->units[0].procedures[0].name == "Good");
    }

    TEST_CASE("Warning policy") {
        const char* yaml = R"(
types:
  - name: C
    methods:
      - name: M
        returns: int
        attributes:
          - { name: SqlMarshal, arguments: [ sp ], named: { Unknown: x } }
)";

        SUBCASE("Warnings are reported by default") {
            auto c = load_model(yaml);
            declare_markers(c);
            auto result = analyze(c);
            CHECK(result.warning_count() == 1);
            CHECK_FALSE(result.has_errors());
        }

        SUBCASE("-w suppresses warnings") {
            auto c = load_model(yaml);
            declare_markers(c);
            analysis_options opts;
            opts.suppress_warnings = true;
            auto result = analyze(c, opts);
            CHECK(result.diagnostics.empty());
        }

        SUBCASE("-Werror promotes warnings") {
            auto c = load_model(yaml);
            declare_markers(c);
            analysis_options opts;
            opts.warnings_as_errors = true;
            auto result = analyze(c, opts);
            CHECK(result.error_count() == 1);
            CHECK(result.warning_count() == 0);
        }
    }

    TEST_CASE("Diagnostic summary") {
        auto c = load_model(R"(
types:
  - name: C
    methods:
      - { name: M, returns: int, attributes: [ SqlMarshal ] }
)");
        declare_markers(c);

        auto result = analyze(c);
        std::ostringstream oss;
        result.print_diagnostics(oss);
        CHECK(oss.str().find("C.M: error:") != std::string::npos);
        CHECK(oss.str().find("1 error generated.") != std::string::npos);
    }
}
