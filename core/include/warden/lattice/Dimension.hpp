#pragma once

#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <boost/json.hpp>

#include "warden/lattice/LatticeError.hpp"

namespace warden {

// Each dimension kind owns its value type. TOP is a flag inside that
// value, never a shared sentinel, so values cannot cross dimension kinds.

struct SetValue {
    bool top = false;
    std::set<std::string> atoms;

    bool operator==(const SetValue& o) const {
        return top == o.top && (top || atoms == o.atoms);
    }
    bool operator!=(const SetValue& o) const { return !(*this == o); }
};

struct EnumValue {
    bool top = false;
    std::string token;

    bool operator==(const EnumValue& o) const {
        return top == o.top && (top || token == o.token);
    }
    bool operator!=(const EnumValue& o) const { return !(*this == o); }
};

struct BoolValue {
    bool value = false;

    bool operator==(const BoolValue& o) const { return value == o.value; }
    bool operator!=(const BoolValue& o) const { return value != o.value; }
};

using DimensionValue = std::variant<SetValue, EnumValue, BoolValue>;

// ---------------------------------------------------------------------------
// Set dimension: value is a subset of atoms, or TOP ("*") meaning any/all.
// ---------------------------------------------------------------------------
class SetDimension {
public:
    using Value = SetValue;

    SetDimension(
        std::string name,
        const std::vector<std::string>& atoms,
        std::string top = "*",
        const std::vector<std::string>& bottom = {}
    );

    const std::string& name() const { return name_; }
    const std::set<std::string>& atoms() const { return atoms_; }
    const std::string& topSymbol() const { return top_symbol_; }

    Value normalize(const boost::json::value& raw) const;
    bool leq(const Value& a, const Value& b) const;
    Value join(const std::vector<Value>& values) const;
    Value meet(const std::vector<Value>& values) const;

    Value top() const;
    Value bottom() const;

    boost::json::value render(const Value& v) const;

private:
    std::string name_;
    std::set<std::string> atoms_;
    std::string top_symbol_;
    std::set<std::string> bottom_;
};

// ---------------------------------------------------------------------------
// Ordered enum: one token from a totally ordered sequence, or TOP.
// A top symbol that is itself a member of the order normalizes to TOP.
// ---------------------------------------------------------------------------
class OrderedEnumDimension {
public:
    using Value = EnumValue;

    OrderedEnumDimension(
        std::string name,
        const std::vector<std::string>& order,
        std::string top,
        std::string bottom
    );

    const std::string& name() const { return name_; }
    const std::vector<std::string>& order() const { return order_; }
    const std::string& topSymbol() const { return top_symbol_; }

    Value normalize(const boost::json::value& raw) const;
    bool leq(const Value& a, const Value& b) const;
    Value join(const std::vector<Value>& values) const;
    Value meet(const std::vector<Value>& values) const;

    Value top() const;
    Value bottom() const;

    size_t rank(const std::string& token) const;

    boost::json::value render(const Value& v) const;

private:
    std::string name_;
    std::vector<std::string> order_;
    std::map<std::string, size_t> rank_;
    std::string top_symbol_;
    std::string bottom_;
};

// ---------------------------------------------------------------------------
// Boolean: ordering is relative to whichever constant is configured top.
// ---------------------------------------------------------------------------
class BooleanDimension {
public:
    using Value = BoolValue;

    explicit BooleanDimension(
        std::string name,
        bool top = true,
        bool bottom = false
    );

    const std::string& name() const { return name_; }

    Value normalize(const boost::json::value& raw) const;
    bool leq(const Value& a, const Value& b) const;
    Value join(const std::vector<Value>& values) const;
    Value meet(const std::vector<Value>& values) const;

    Value top() const { return BoolValue{top_}; }
    Value bottom() const { return BoolValue{bottom_}; }

    boost::json::value render(const Value& v) const;

private:
    std::string name_;
    bool top_;
    bool bottom_;
};

// ---------------------------------------------------------------------------
// Closed union over the three kinds; every operation dispatches by visit.
// ---------------------------------------------------------------------------
class Dimension {
public:
    using Kind = std::variant<SetDimension, OrderedEnumDimension, BooleanDimension>;

    explicit Dimension(SetDimension d) : kind_(std::move(d)) {}
    explicit Dimension(OrderedEnumDimension d) : kind_(std::move(d)) {}
    explicit Dimension(BooleanDimension d) : kind_(std::move(d)) {}

    // Builds from a lattice document entry: {type, atoms|order, top, bottom}
    static Dimension fromJson(
        const std::string& name,
        const boost::json::value& entry
    );

    const std::string& name() const;
    const char* typeName() const;
    const Kind& kind() const { return kind_; }

    DimensionValue normalize(const boost::json::value& raw) const;
    bool leq(const DimensionValue& a, const DimensionValue& b) const;
    DimensionValue join(const std::vector<DimensionValue>& values) const;
    DimensionValue meet(const std::vector<DimensionValue>& values) const;
    DimensionValue top() const;
    boost::json::value render(const DimensionValue& v) const;

private:
    Kind kind_;
};

}
