#include "warden/lattice/ContextLattice.hpp"
#include "warden/canon/DataFile.hpp"

#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace warden {

namespace {

std::string listNames(const std::set<std::string>& names) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& n : names) {
        if (!first) oss << ", ";
        oss << "'" << n << "'";
        first = false;
    }
    oss << "]";
    return oss.str();
}

const json::object* objectMember(
    const json::object& doc,
    const char* key,
    const std::string& what
) {
    const json::value* v = doc.if_contains(key);
    if (v == nullptr || v->is_null()) return nullptr;
    if (!v->is_object()) {
        throw LatticeError(what + " must be an object");
    }
    return &v->get_object();
}

std::map<std::string, Dimension> loadDimensions(const json::object* raw) {
    std::map<std::string, Dimension> dims;
    if (raw != nullptr) {
        for (const auto& kv : *raw) {
            std::string name(kv.key());
            dims.emplace(name, Dimension::fromJson(name, kv.value()));
        }
    }
    if (dims.empty()) {
        throw LatticeError("Lattice must define at least one dimension");
    }
    return dims;
}

std::map<std::string, ContextDescriptor> loadContexts(
    const json::object* raw,
    const std::map<std::string, Dimension>& dims
) {
    std::map<std::string, ContextDescriptor> contexts;
    if (raw != nullptr) {
        for (const auto& kv : *raw) {
            const std::string id(kv.key());
            if (!kv.value().is_object()) {
                throw LatticeError("Context '" + id + "' must be an object");
            }
            const json::object& desc = kv.value().get_object();

            std::set<std::string> missing;
            for (const auto& d : dims) {
                if (!desc.contains(d.first)) missing.insert(d.first);
            }
            if (!missing.empty()) {
                throw LatticeError("Context '" + id + "' missing dimensions: " +
                                   listNames(missing));
            }
            std::set<std::string> extra;
            for (const auto& field : desc) {
                std::string key(field.key());
                if (!dims.count(key)) extra.insert(key);
            }
            if (!extra.empty()) {
                throw LatticeError("Context '" + id + "' has unknown dimensions: " +
                                   listNames(extra));
            }

            ContextDescriptor normalized;
            for (const auto& d : dims) {
                normalized.values.emplace(d.first, d.second.normalize(desc.at(d.first)));
            }
            contexts.emplace(id, std::move(normalized));
        }
    }
    if (contexts.empty()) {
        throw LatticeError("Lattice must define at least one context");
    }
    return contexts;
}

LatticeMetadata loadMetadata(const json::object* raw) {
    LatticeMetadata meta;
    if (raw == nullptr) return meta;
    if (const json::value* ref = raw->if_contains("rfc_reference")) {
        meta.rfc_reference = scalarText(*ref);
    }
    if (const json::value* approvals = raw->if_contains("approvals")) {
        if (approvals->is_array()) {
            meta.approvals = approvals->get_array();
        }
    }
    return meta;
}

} // namespace

ContextLattice::ContextLattice(
    std::string version,
    std::map<std::string, Dimension> dimensions,
    std::map<std::string, ContextDescriptor> contexts,
    LatticeMetadata metadata
) : version_(std::move(version)),
    dimensions_(std::move(dimensions)),
    contexts_(std::move(contexts)),
    metadata_(std::move(metadata)) {}

ContextLattice ContextLattice::load(
    const fs::path& lattice_path,
    const fs::path& schema_path,
    const DocumentValidator* validator
) {
    if (!fs::exists(lattice_path)) {
        throw LatticeError("Lattice file not found: " + lattice_path.string());
    }

    json::value doc;
    try {
        doc = loadDataFile(lattice_path);
    } catch (const DataFileError& e) {
        throw LatticeError(std::string("Failed to parse lattice: ") + e.what());
    }

    if (!schema_path.empty()) {
        if (validator == nullptr) {
            throw LatticeError("Lattice schema given without a validator: " +
                               schema_path.string());
        }
        json::value schema;
        try {
            schema = loadDataFile(schema_path);
        } catch (const DataFileError& e) {
            throw LatticeError("Schema file not found: " + schema_path.string() +
                               " (" + e.what() + ")");
        }
        try {
            validator->validate(doc, schema);
        } catch (const std::exception& e) {
            throw LatticeError(std::string("Lattice schema validation failed: ") + e.what());
        }
    }

    ContextLattice lattice = fromJson(doc);
    std::cout << "[ContextLattice] Loaded version " << lattice.version()
              << " from " << lattice_path.filename().string()
              << " (" << lattice.dimensions().size() << " dimensions, "
              << lattice.contexts().size() << " contexts)\n";
    return lattice;
}

ContextLattice ContextLattice::load(
    const fs::path& lattice_path,
    const AuditConfig& config,
    const DocumentValidator* validator
) {
    return load(lattice_path, fs::path(config.lattice_schema_path), validator);
}

ContextLattice ContextLattice::fromJson(const json::value& doc) {
    if (!doc.is_object()) {
        throw LatticeError("Lattice document must be an object");
    }
    const json::object& obj = doc.get_object();

    const json::value* version = obj.if_contains("version");
    if (version == nullptr) {
        throw LatticeError("Lattice is missing version");
    }

    auto dims = loadDimensions(objectMember(obj, "dimensions", "Lattice dimensions"));
    auto contexts = loadContexts(objectMember(obj, "contexts", "Lattice contexts"), dims);
    auto meta = loadMetadata(objectMember(obj, "metadata", "Lattice metadata"));

    return ContextLattice(scalarText(*version), std::move(dims),
                          std::move(contexts), std::move(meta));
}

bool ContextLattice::hasContext(const std::string& context_id) const {
    return contexts_.count(context_id) > 0;
}

const ContextDescriptor& ContextLattice::resolve(const std::string& context_id) const {
    auto it = contexts_.find(context_id);
    if (it == contexts_.end()) {
        throw UnknownContextError(context_id);
    }
    return it->second;
}

bool ContextLattice::leq(
    const std::string& left_id,
    const std::string& right_id
) const {
    return leq(resolve(left_id), resolve(right_id));
}

bool ContextLattice::leq(
    const ContextDescriptor& left,
    const ContextDescriptor& right
) const {
    for (const auto& d : dimensions_) {
        auto l = left.values.find(d.first);
        auto r = right.values.find(d.first);
        if (l == left.values.end() || r == right.values.end()) {
            throw LatticeError("Descriptor is missing dimension '" + d.first + "'");
        }
        if (!d.second.leq(l->second, r->second)) {
            return false;
        }
    }
    return true;
}

bool ContextLattice::covers(
    const std::string& sup_id,
    const std::string& sub_id
) const {
    return leq(sub_id, sup_id);
}

std::vector<const ContextDescriptor*> ContextLattice::resolveAll(
    const std::vector<std::string>& context_ids,
    const char* op
) const {
    if (context_ids.empty()) {
        throw LatticeError(std::string(op) + " requires at least one context id");
    }
    std::vector<const ContextDescriptor*> resolved;
    resolved.reserve(context_ids.size());
    for (const auto& id : context_ids) {
        resolved.push_back(&resolve(id));
    }
    return resolved;
}

ContextDescriptor ContextLattice::join(const std::vector<std::string>& context_ids) const {
    const auto resolved = resolveAll(context_ids, "join");
    ContextDescriptor out;
    for (const auto& d : dimensions_) {
        std::vector<DimensionValue> column;
        for (const auto* c : resolved) {
            column.push_back(c->values.at(d.first));
        }
        out.values.emplace(d.first, d.second.join(column));
    }
    return out;
}

ContextDescriptor ContextLattice::meet(const std::vector<std::string>& context_ids) const {
    const auto resolved = resolveAll(context_ids, "meet");
    ContextDescriptor out;
    for (const auto& d : dimensions_) {
        std::vector<DimensionValue> column;
        for (const auto* c : resolved) {
            column.push_back(c->values.at(d.first));
        }
        out.values.emplace(d.first, d.second.meet(column));
    }
    return out;
}

json::object ContextLattice::toJson(const ContextDescriptor& descriptor) const {
    json::object out;
    for (const auto& d : dimensions_) {
        auto it = descriptor.values.find(d.first);
        if (it == descriptor.values.end()) {
            throw LatticeError("Descriptor is missing dimension '" + d.first + "'");
        }
        out[d.first] = d.second.render(it->second);
    }
    return out;
}

json::object ContextLattice::describe(const std::string& context_id) const {
    return toJson(resolve(context_id));
}

}
