#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <boost/json.hpp>

#include "warden/config/AuditConfig.hpp"
#include "warden/lattice/Dimension.hpp"
#include "warden/lattice/LatticeError.hpp"

namespace warden {

// Normalized value per dimension name.
struct ContextDescriptor {
    std::map<std::string, DimensionValue> values;

    bool operator==(const ContextDescriptor& o) const { return values == o.values; }
    bool operator!=(const ContextDescriptor& o) const { return values != o.values; }
};

struct LatticeMetadata {
    std::string rfc_reference;
    boost::json::array approvals;
};

// External JSON-Schema collaborator. Throws to reject a document.
class DocumentValidator {
public:
    virtual ~DocumentValidator() = default;

    virtual void validate(
        const boost::json::value& document,
        const boost::json::value& schema
    ) const = 0;
};

// ---------------------------------------------------------------------------
// ContextLattice
//
// Immutable after construction. covers(sup, sub) is leq(sub, sup): the
// covering context is at least as permissive as the covered one on every
// dimension.
// ---------------------------------------------------------------------------
class ContextLattice {
public:
    // Fails closed: a schema path without a validator, an unreadable
    // schema, or a validator rejection are all LatticeError.
    static ContextLattice load(
        const std::filesystem::path& lattice_path,
        const std::filesystem::path& schema_path = {},
        const DocumentValidator* validator = nullptr
    );

    // Validates against config.lattice_schema_path when it is set.
    static ContextLattice load(
        const std::filesystem::path& lattice_path,
        const AuditConfig& config,
        const DocumentValidator* validator = nullptr
    );

    static ContextLattice fromJson(const boost::json::value& doc);

    const std::string& version() const { return version_; }
    const std::map<std::string, Dimension>& dimensions() const { return dimensions_; }
    const std::map<std::string, ContextDescriptor>& contexts() const { return contexts_; }
    const LatticeMetadata& metadata() const { return metadata_; }

    bool hasContext(const std::string& context_id) const;
    const ContextDescriptor& resolve(const std::string& context_id) const;

    bool leq(
        const std::string& left_id,
        const std::string& right_id
    ) const;

    bool leq(
        const ContextDescriptor& left,
        const ContextDescriptor& right
    ) const;

    bool covers(
        const std::string& sup_id,
        const std::string& sub_id
    ) const;

    ContextDescriptor join(const std::vector<std::string>& context_ids) const;
    ContextDescriptor meet(const std::vector<std::string>& context_ids) const;

    boost::json::object toJson(const ContextDescriptor& descriptor) const;
    boost::json::object describe(const std::string& context_id) const;

private:
    ContextLattice(
        std::string version,
        std::map<std::string, Dimension> dimensions,
        std::map<std::string, ContextDescriptor> contexts,
        LatticeMetadata metadata
    );

    std::vector<const ContextDescriptor*> resolveAll(
        const std::vector<std::string>& context_ids,
        const char* op
    ) const;

    std::string version_;
    std::map<std::string, Dimension> dimensions_;
    std::map<std::string, ContextDescriptor> contexts_;
    LatticeMetadata metadata_;
};

}
