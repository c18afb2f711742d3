#include "warden/lattice/Dimension.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace json = boost::json;

namespace warden {

namespace {

std::string toStd(const json::string& s) {
    return std::string(s.data(), s.size());
}

std::string joinSorted(const std::set<std::string>& items) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (const auto& s : items) {
        if (!first) oss << ", ";
        oss << "'" << s << "'";
        first = false;
    }
    oss << "]";
    return oss.str();
}

std::vector<std::string> stringList(
    const json::value* raw,
    const std::string& what
) {
    std::vector<std::string> out;
    if (raw == nullptr || raw->is_null()) return out;
    if (!raw->is_array()) {
        throw LatticeError(what + " must be a list of strings");
    }
    for (const auto& item : raw->get_array()) {
        if (!item.is_string()) {
            throw LatticeError(what + " must be a list of strings");
        }
        out.push_back(toStd(item.get_string()));
    }
    return out;
}

template <typename Dim>
const typename Dim::Value& valueFor(
    const Dim& dim,
    const DimensionValue& v
) {
    const auto* p = std::get_if<typename Dim::Value>(&v);
    if (p == nullptr) {
        throw LatticeError("Dimension '" + dim.name() +
                           "' received a value of another dimension type");
    }
    return *p;
}

template <typename Dim>
std::vector<typename Dim::Value> valuesFor(
    const Dim& dim,
    const std::vector<DimensionValue>& values
) {
    std::vector<typename Dim::Value> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        out.push_back(valueFor(dim, v));
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// SetDimension
// ---------------------------------------------------------------------------

SetDimension::SetDimension(
    std::string name,
    const std::vector<std::string>& atoms,
    std::string top,
    const std::vector<std::string>& bottom
) : name_(std::move(name)),
    atoms_(atoms.begin(), atoms.end()),
    top_symbol_(std::move(top)),
    bottom_(bottom.begin(), bottom.end()) {
    if (atoms_.empty()) {
        throw LatticeError("Set dimension '" + name_ + "' must define atoms");
    }
    if (top_symbol_ != "*") {
        throw LatticeError("Set dimension '" + name_ + "' must use '*' for top");
    }
    for (const auto& b : bottom_) {
        if (!atoms_.count(b)) {
            throw LatticeError("Set dimension '" + name_ + "' bottom has unknown atoms");
        }
    }
}

SetValue SetDimension::normalize(const json::value& raw) const {
    if (raw.is_string() && toStd(raw.get_string()) == top_symbol_) {
        return top();
    }
    if (!raw.is_array()) {
        throw NormalizeError("Set dimension '" + name_ + "' expects list or '*'");
    }

    SetValue v;
    std::set<std::string> unknown;
    for (const auto& item : raw.get_array()) {
        if (!item.is_string()) {
            unknown.insert(json::serialize(item));
            continue;
        }
        std::string atom = toStd(item.get_string());
        if (!atoms_.count(atom)) {
            unknown.insert(atom);
            continue;
        }
        v.atoms.insert(std::move(atom));
    }
    if (!unknown.empty()) {
        throw NormalizeError("Set dimension '" + name_ + "' has unknown atoms: " +
                             joinSorted(unknown));
    }
    return v;
}

bool SetDimension::leq(const SetValue& a, const SetValue& b) const {
    if (a.top) return b.top;
    if (b.top) return true;
    return std::includes(b.atoms.begin(), b.atoms.end(),
                         a.atoms.begin(), a.atoms.end());
}

SetValue SetDimension::join(const std::vector<SetValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Set dimension '" + name_ + "' join requires values");
    }
    SetValue out;
    for (const auto& v : values) {
        if (v.top) return top();
        out.atoms.insert(v.atoms.begin(), v.atoms.end());
    }
    return out;
}

SetValue SetDimension::meet(const std::vector<SetValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Set dimension '" + name_ + "' meet requires values");
    }

    // TOP places no constraint on the intersection.
    bool seeded = false;
    SetValue out;
    for (const auto& v : values) {
        if (v.top) continue;
        if (!seeded) {
            out.atoms = v.atoms;
            seeded = true;
            continue;
        }
        std::set<std::string> kept;
        std::set_intersection(out.atoms.begin(), out.atoms.end(),
                              v.atoms.begin(), v.atoms.end(),
                              std::inserter(kept, kept.begin()));
        out.atoms.swap(kept);
    }
    if (!seeded) return top();
    return out;
}

SetValue SetDimension::top() const {
    SetValue v;
    v.top = true;
    return v;
}

SetValue SetDimension::bottom() const {
    SetValue v;
    v.atoms = bottom_;
    return v;
}

json::value SetDimension::render(const SetValue& v) const {
    if (v.top) return json::value(json::string(top_symbol_));
    json::array arr;
    for (const auto& a : v.atoms) {
        arr.emplace_back(json::string(a));
    }
    return arr;
}

// ---------------------------------------------------------------------------
// OrderedEnumDimension
// ---------------------------------------------------------------------------

OrderedEnumDimension::OrderedEnumDimension(
    std::string name,
    const std::vector<std::string>& order,
    std::string top,
    std::string bottom
) : name_(std::move(name)),
    order_(order),
    top_symbol_(std::move(top)),
    bottom_(std::move(bottom)) {
    if (order_.empty()) {
        throw LatticeError("Ordered enum '" + name_ + "' must define order");
    }
    for (size_t i = 0; i < order_.size(); ++i) {
        if (!rank_.emplace(order_[i], i).second) {
            throw LatticeError("Ordered enum '" + name_ + "' repeats '" + order_[i] + "'");
        }
    }
    if (top_symbol_ != "*" && !rank_.count(top_symbol_)) {
        throw LatticeError("Ordered enum '" + name_ + "' top must be '*' or in order");
    }
    if (!rank_.count(bottom_)) {
        throw LatticeError("Ordered enum '" + name_ + "' bottom must be in order");
    }
}

size_t OrderedEnumDimension::rank(const std::string& token) const {
    auto it = rank_.find(token);
    if (it == rank_.end()) {
        throw NormalizeError("Ordered enum '" + name_ + "' has unknown value '" + token + "'");
    }
    return it->second;
}

EnumValue OrderedEnumDimension::normalize(const json::value& raw) const {
    if (!raw.is_string()) {
        throw NormalizeError("Ordered enum '" + name_ + "' has unknown value '" +
                             json::serialize(raw) + "'");
    }
    const std::string token = toStd(raw.get_string());
    if (token == top_symbol_) return top();

    EnumValue v;
    v.token = token;
    rank(v.token);
    return v;
}

bool OrderedEnumDimension::leq(const EnumValue& a, const EnumValue& b) const {
    if (a.top) return b.top;
    if (b.top) return true;
    return rank(a.token) <= rank(b.token);
}

EnumValue OrderedEnumDimension::join(const std::vector<EnumValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Ordered enum '" + name_ + "' join requires values");
    }
    const EnumValue* best = nullptr;
    for (const auto& v : values) {
        if (v.top) return top();
        if (best == nullptr || rank(v.token) > rank(best->token)) {
            best = &v;
        }
    }
    return *best;
}

EnumValue OrderedEnumDimension::meet(const std::vector<EnumValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Ordered enum '" + name_ + "' meet requires values");
    }
    const EnumValue* best = nullptr;
    for (const auto& v : values) {
        if (v.top) continue;
        if (best == nullptr || rank(v.token) < rank(best->token)) {
            best = &v;
        }
    }
    if (best == nullptr) return top();
    return *best;
}

EnumValue OrderedEnumDimension::top() const {
    EnumValue v;
    v.top = true;
    return v;
}

EnumValue OrderedEnumDimension::bottom() const {
    EnumValue v;
    v.token = bottom_;
    return v;
}

json::value OrderedEnumDimension::render(const EnumValue& v) const {
    return json::value(json::string(v.top ? top_symbol_ : v.token));
}

// ---------------------------------------------------------------------------
// BooleanDimension
// ---------------------------------------------------------------------------

BooleanDimension::BooleanDimension(
    std::string name,
    bool top,
    bool bottom
) : name_(std::move(name)), top_(top), bottom_(bottom) {
    if (top_ == bottom_) {
        throw LatticeError("Boolean dimension '" + name_ + "' top and bottom must differ");
    }
}

BoolValue BooleanDimension::normalize(const json::value& raw) const {
    if (!raw.is_bool()) {
        throw NormalizeError("Boolean dimension '" + name_ + "' expects boolean value");
    }
    return BoolValue{raw.get_bool()};
}

bool BooleanDimension::leq(const BoolValue& a, const BoolValue& b) const {
    return a.value == bottom_ || b.value == top_;
}

BoolValue BooleanDimension::join(const std::vector<BoolValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Boolean dimension '" + name_ + "' join requires values");
    }
    for (const auto& v : values) {
        if (v.value == top_) return top();
    }
    return bottom();
}

BoolValue BooleanDimension::meet(const std::vector<BoolValue>& values) const {
    if (values.empty()) {
        throw LatticeError("Boolean dimension '" + name_ + "' meet requires values");
    }
    for (const auto& v : values) {
        if (v.value == bottom_) return bottom();
    }
    return top();
}

json::value BooleanDimension::render(const BoolValue& v) const {
    return json::value(v.value);
}

// ---------------------------------------------------------------------------
// Dimension
// ---------------------------------------------------------------------------

Dimension Dimension::fromJson(
    const std::string& name,
    const json::value& entry
) {
    if (!entry.is_object()) {
        throw LatticeError("Dimension '" + name + "' must be an object");
    }
    const json::object& obj = entry.get_object();

    std::string type;
    if (const json::value* t = obj.if_contains("type"); t && t->is_string()) {
        type = toStd(t->get_string());
    }

    if (type == "set") {
        std::string top = "*";
        if (const json::value* t = obj.if_contains("top")) {
            if (!t->is_string()) {
                throw LatticeError("Set dimension '" + name + "' must use '*' for top");
            }
            top = toStd(t->get_string());
        }
        return Dimension(SetDimension(
            name,
            stringList(obj.if_contains("atoms"), "Set dimension '" + name + "' atoms"),
            top,
            stringList(obj.if_contains("bottom"), "Set dimension '" + name + "' bottom")
        ));
    }

    if (type == "ordered_enum") {
        std::string top = "*";
        if (const json::value* t = obj.if_contains("top")) {
            if (!t->is_string()) {
                throw LatticeError("Ordered enum '" + name + "' top must be '*' or in order");
            }
            top = toStd(t->get_string());
        }
        const json::value* b = obj.if_contains("bottom");
        if (b == nullptr || !b->is_string()) {
            throw LatticeError("Ordered enum '" + name + "' bottom must be in order");
        }
        return Dimension(OrderedEnumDimension(
            name,
            stringList(obj.if_contains("order"), "Ordered enum '" + name + "' order"),
            top,
            toStd(b->get_string())
        ));
    }

    if (type == "boolean") {
        bool top = true;
        bool bottom = false;
        const json::value* t = obj.if_contains("top");
        const json::value* b = obj.if_contains("bottom");
        if ((t && !t->is_bool()) || (b && !b->is_bool())) {
            throw LatticeError("Boolean dimension '" + name + "' top/bottom must be boolean");
        }
        if (t) top = t->get_bool();
        if (b) bottom = b->get_bool();
        return Dimension(BooleanDimension(name, top, bottom));
    }

    throw LatticeError("Unknown dimension type '" + type + "' for '" + name + "'");
}

const std::string& Dimension::name() const {
    return std::visit([](const auto& d) -> const std::string& { return d.name(); }, kind_);
}

const char* Dimension::typeName() const {
    switch (kind_.index()) {
        case 0: return "set";
        case 1: return "ordered_enum";
        case 2: return "boolean";
        default: return "unknown";
    }
}

DimensionValue Dimension::normalize(const json::value& raw) const {
    return std::visit([&](const auto& d) -> DimensionValue {
        return d.normalize(raw);
    }, kind_);
}

bool Dimension::leq(
    const DimensionValue& a,
    const DimensionValue& b
) const {
    return std::visit([&](const auto& d) {
        return d.leq(valueFor(d, a), valueFor(d, b));
    }, kind_);
}

DimensionValue Dimension::join(const std::vector<DimensionValue>& values) const {
    return std::visit([&](const auto& d) -> DimensionValue {
        return d.join(valuesFor(d, values));
    }, kind_);
}

DimensionValue Dimension::meet(const std::vector<DimensionValue>& values) const {
    return std::visit([&](const auto& d) -> DimensionValue {
        return d.meet(valuesFor(d, values));
    }, kind_);
}

DimensionValue Dimension::top() const {
    return std::visit([](const auto& d) -> DimensionValue { return d.top(); }, kind_);
}

json::value Dimension::render(const DimensionValue& v) const {
    return std::visit([&](const auto& d) {
        return d.render(valueFor(d, v));
    }, kind_);
}

}
