//
// Unit tests for the signature extractor
//

#include <doctest/doctest.h>
#include <sqlmarshal/analysis.hh>
#include <test_support.hh>

using namespace sqlmarshal;
using namespace sqlmarshal::analysis;
using test_support::load_model;

namespace {

struct extraction {
    model::compilation compilation;
    std::vector<diagnostic> diagnostics;
    std::optional<binding::procedure_binding> binding;
};

// Extract the first method of the first type
extraction extract_first(const std::string& yaml) {
    extraction result{load_model(yaml), {}, std::nullopt};
    marker_names markers;
    SignatureExtractor extractor(markers, result.diagnostics);
    const auto& type = result.compilation.types.front();
    result.binding = extractor.extract(type, type.methods.front());
    return result;
}

bool has_code(const std::vector<diagnostic>& diagnostics, const std::string& code) {
    for (const auto& d : diagnostics) {
        if (d.code == code) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_SUITE("Analysis - Attribute matching") {

    TEST_CASE("Suffix and qualification are optional") {
        CHECK(attribute_matches("SqlMarshal", "SqlMarshalAttribute"));
        CHECK(attribute_matches("SqlMarshalAttribute", "SqlMarshalAttribute"));
        CHECK(attribute_matches("Foo.SqlMarshal", "SqlMarshalAttribute"));
        CHECK(attribute_matches("Foo.Bar.SqlMarshalAttribute", "SqlMarshalAttribute"));
        CHECK_FALSE(attribute_matches("RawSql", "SqlMarshalAttribute"));
    }
}

TEST_SUITE("Analysis - Signature extractor") {

    TEST_CASE("Named procedure with parameters in declaration order") {
        auto r = extract_first(R"(
types:
  - name: C
    namespace: Foo
    methods:
      - name: GetTotal
        accessibility: internal
        returns: int
        attributes:
          - { name: SqlMarshal, arguments: [ sp_total ] }
        parameters:
          - { name: clientId, type: int }
          - { name: total, type: int, direction: out }
          - { name: counter, type: long, direction: ref }
)");
        REQUIRE(r.binding.has_value());
        CHECK(r.diagnostics.empty());

        const auto& b = *r.binding;
        CHECK(b.name == "GetTotal");
        CHECK(b.visibility == model::accessibility::internal);
        CHECK(b.return_type.name == "int");
        CHECK_FALSE(b.uses_raw_text());
        CHECK(std::get<binding::named_procedure>(b.source).name == "sp_total");

        REQUIRE(b.parameters.size() == 3);
        CHECK(b.parameters[0].internal_name == "clientId");
        CHECK(b.parameters[0].dir == binding::direction::in);
        CHECK(b.parameters[1].dir == binding::direction::out);
        CHECK(b.parameters[2].dir == binding::direction::in_out);

        CHECK(b.parameters[0].reads_value());
        CHECK_FALSE(b.parameters[0].writes_back());
        CHECK_FALSE(b.parameters[1].reads_value());
        CHECK(b.parameters[2].reads_value());
        CHECK(b.parameters[2].writes_back());
    }

    TEST_CASE("Raw command parameter is excluded from binding") {
        auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        returns: int
        attributes: [ SqlMarshal ]
        parameters:
          - { name: sql, type: string, attributes: [ RawSql ] }
          - { name: clientId, type: int }
)");
        REQUIRE(r.binding.has_value());
        CHECK(r.binding->uses_raw_text());
        CHECK(std::get<binding::raw_text>(r.binding->source).parameter_name == "sql");

        auto bound = r.binding->bound_parameters();
        REQUIRE(bound.size() == 1);
        CHECK(bound[0]->internal_name == "clientId");
    }

    TEST_CASE("Raw command parameter wins over a procedure name") {
        auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        returns: int
        attributes:
          - { name: SqlMarshal, arguments: [ sp_ignored ] }
        parameters:
          - { name: sql, type: String, attributes: [ RawSqlAttribute ] }
)");
        REQUIRE(r.binding.has_value());
        CHECK(r.binding->uses_raw_text());
    }

    TEST_CASE("Recognized named arguments become overrides") {
        auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        returns: "IList<Person>"
        attributes:
          - name: SqlMarshal
            arguments: [ sp_persons ]
            named: { PropertyName: People, Timeout: 30 }
)");
        REQUIRE(r.binding.has_value());
        CHECK(r.binding->overrides.at("PropertyName") == "People");
        CHECK(r.binding->overrides.count("Timeout") == 0);

        REQUIRE(r.diagnostics.size() == 1);
        CHECK(r.diagnostics[0].code == diag_codes::W_UNKNOWN_NAMED_ARGUMENT);
        CHECK(r.diagnostics[0].level == diagnostic_level::warning);
        CHECK(r.diagnostics[0].symbol == "C.M");
    }

    TEST_CASE("Declaration errors skip the declaration") {
        SUBCASE("More than one raw command parameter") {
            auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        attributes: [ SqlMarshal ]
        parameters:
          - { name: a, type: string, attributes: [ RawSql ] }
          - { name: b, type: string, attributes: [ RawSql ] }
)");
            CHECK_FALSE(r.binding.has_value());
            CHECK(has_code(r.diagnostics, diag_codes::E_MULTIPLE_RAW_SQL));
        }

        SUBCASE("Raw command parameter is not a string") {
            auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        attributes: [ SqlMarshal ]
        parameters:
          - { name: sql, type: int, attributes: [ RawSql ] }
)");
            CHECK_FALSE(r.binding.has_value());
            CHECK(has_code(r.diagnostics, diag_codes::E_RAW_SQL_NOT_STRING));
        }

        SUBCASE("No command text at all") {
            auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        attributes: [ SqlMarshal ]
        parameters:
          - { name: id, type: int }
)");
            CHECK_FALSE(r.binding.has_value());
            CHECK(has_code(r.diagnostics, diag_codes::E_NO_COMMAND_TEXT));
        }

        SUBCASE("Raw command parameter declared out") {
            auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        attributes: [ SqlMarshal ]
        parameters:
          - { name: sql, type: string, direction: out, attributes: [ RawSql ] }
)");
            CHECK_FALSE(r.binding.has_value());
            CHECK(has_code(r.diagnostics, diag_codes::E_RAW_SQL_DIRECTION));
        }
    }

    TEST_CASE("Unmarked methods are ignored") {
        auto r = extract_first(R"(
types:
  - name: C
    methods:
      - name: M
        attributes: [ Obsolete ]
)");
        CHECK_FALSE(r.binding.has_value());
        CHECK(r.diagnostics.empty());
    }
}

TEST_SUITE("Analysis - Diagnostics") {

    TEST_CASE("Format") {
        diagnostic d{diagnostic_level::error, "SM0012", "No command text", "Foo.C.M"};
        CHECK(d.format() == "Foo.C.M: error: No command text [SM0012]");

        diagnostic w{diagnostic_level::warning, "SM0100", "Ignored", ""};
        CHECK(w.format() == "warning: Ignored [SM0100]");
    }
}
