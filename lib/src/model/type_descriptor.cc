#include <sqlmarshal/type_descriptor.hh>
#include <algorithm>
#include <set>

namespace sqlmarshal {

// ============================================================================
// DeclaredType - TypeDescriptor backed by a model::type_def
// ============================================================================

// Partial declarations of one type merge into a single descriptor. Members
// follow part order, so a property's ordinal counts across all parts.
class TypeUniverse::DeclaredType : public TypeDescriptor {
public:
    explicit DeclaredType(const model::type_def& def)
        : primary_(def)
    {
        add_part(def);
    }

    const std::string& name() const override { return primary_.name; }
    std::string qualified_name() const override { return primary_.qualified_name(); }
    model::type_kind kind() const override { return primary_.kind; }
    bool is_value_type() const override { return primary_.is_value_type(); }
    const std::vector<model::member_def>& fields() const override { return fields_; }
    const std::vector<model::member_def>& properties() const override { return properties_; }

    const model::type_ref* base_type() const override { return base_; }

    bool is_part_of_same_type(const model::type_def& def) const {
        return def.name == primary_.name &&
               def.namespace_name == primary_.namespace_name &&
               def.containing_type == primary_.containing_type;
    }

    bool has_part(const model::type_def& def) const {
        for (const auto* part : parts_) {
            if (part == &def) {
                return true;
            }
        }
        return false;
    }

    void add_part(const model::type_def& def) {
        parts_.push_back(&def);
        fields_.insert(fields_.end(), def.fields.begin(), def.fields.end());
        properties_.insert(properties_.end(), def.properties.begin(), def.properties.end());
        if (!base_ && def.base) {
            base_ = &*def.base;
        }
    }

    const std::string& namespace_name() const { return primary_.namespace_name; }

private:
    const model::type_def& primary_;
    std::vector<const model::type_def*> parts_;
    std::vector<model::member_def> fields_;
    std::vector<model::member_def> properties_;
    const model::type_ref* base_ = nullptr;
};

// ============================================================================
// Well-Known Types
// ============================================================================

namespace {

model::type_def make_well_known(const std::string& ns,
                                const std::string& name,
                                const std::string& base = {}) {
    model::type_def def;
    def.name = name;
    def.namespace_name = ns;
    def.kind = model::type_kind::class_;
    if (!base.empty()) {
        model::type_ref base_ref;
        base_ref.name = base;
        def.base = base_ref;
    }
    return def;
}

std::vector<model::type_def> well_known_types() {
    return {
        make_well_known("System.Data.Common", "DbConnection"),
        make_well_known("Microsoft.Data.SqlClient", "SqlConnection", "DbConnection"),
        make_well_known("Microsoft.Data.Sqlite", "SqliteConnection", "DbConnection"),
        make_well_known("Npgsql", "NpgsqlConnection", "DbConnection"),
        make_well_known("MySqlConnector", "MySqlConnection", "DbConnection"),
        make_well_known("Microsoft.EntityFrameworkCore", "DbContext"),
    };
}

}  // namespace

// ============================================================================
// TypeUniverse
// ============================================================================

TypeUniverse::TypeUniverse(const model::compilation& compilation)
    : compilation_(compilation)
    , well_known_defs_(well_known_types())
{
    declared_.reserve(compilation_.types.size());
    for (const auto& def : compilation_.types) {
        auto existing = std::find_if(declared_.begin(), declared_.end(),
            [&](const auto& type) { return type->is_part_of_same_type(def); });
        if (existing != declared_.end()) {
            (*existing)->add_part(def);
        } else {
            declared_.push_back(std::make_unique<DeclaredType>(def));
        }
    }

    well_known_.reserve(well_known_defs_.size());
    for (const auto& def : well_known_defs_) {
        well_known_.push_back(std::make_unique<DeclaredType>(def));
    }
}

TypeUniverse::~TypeUniverse() = default;

const TypeUniverse::DeclaredType* TypeUniverse::find(const std::string& name,
                                                     const std::string& context_namespace,
                                                     bool declared_only) const {
    const bool qualified = name.find('.') != std::string::npos;

    auto match = [&](const std::vector<std::unique_ptr<DeclaredType>>& types)
        -> const DeclaredType* {
        if (qualified) {
            for (const auto& type : types) {
                if (type->qualified_name() == name) {
                    return type.get();
                }
            }
            return nullptr;
        }

        // Prefer the requesting namespace, then the first declaration
        const DeclaredType* first = nullptr;
        for (const auto& type : types) {
            if (type->name() != name) {
                continue;
            }
            if (type->namespace_name() == context_namespace) {
                return type.get();
            }
            if (!first) {
                first = type.get();
            }
        }
        return first;
    };

    if (const auto* found = match(declared_)) {
        return found;
    }
    if (declared_only) {
        return nullptr;
    }
    return match(well_known_);
}

const TypeDescriptor* TypeUniverse::resolve(const model::type_ref& ref,
                                            const std::string& context_namespace) const {
    return find(ref.name, context_namespace, false);
}

const TypeDescriptor* TypeUniverse::describe(const model::type_def& def) const {
    for (const auto& type : declared_) {
        if (type->has_part(def)) {
            return type.get();
        }
    }
    return nullptr;
}

bool TypeUniverse::is_declared(const model::type_ref& ref,
                               const std::string& context_namespace) const {
    return find(ref.name, context_namespace, true) != nullptr;
}

std::vector<std::string> TypeUniverse::base_chain(const TypeDescriptor& type) const {
    std::vector<std::string> chain;
    std::set<const TypeDescriptor*> visited{&type};

    const TypeDescriptor* current = &type;
    while (const model::type_ref* base = current->base_type()) {
        chain.push_back(base->simple_name());

        const std::string ns = current->qualified_name() == current->name()
            ? std::string()
            : current->qualified_name().substr(
                  0, current->qualified_name().size() - current->name().size() - 1);

        const TypeDescriptor* next = resolve(*base, ns);
        if (!next || !visited.insert(next).second) {
            break;
        }
        current = next;
    }
    return chain;
}

bool TypeUniverse::is_or_derives_from(const TypeDescriptor& type,
                                      const std::string& base_name) const {
    if (type.name() == base_name) {
        return true;
    }
    for (const auto& base : base_chain(type)) {
        if (base == base_name) {
            return true;
        }
    }
    return false;
}

}  // namespace sqlmarshal
