#include "sc/schema.h"
#include "schema_node.h"
#include <cmath>
#include <cstdint>
#include <memory>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace sc {

namespace {

template <typename T>
std::shared_ptr<const SchemaNode> make_node(T&& alternative) {
    return std::make_shared<const SchemaNode>(SchemaNode{std::forward<T>(alternative)});
}

std::string format_number(double x) {
    std::ostringstream ss;
    ss << x;
    return ss.str();
}

// Number of code points in UTF-8 text (continuation bytes are not counted).
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

// Orders an integer against a finite or infinite double without rounding the
// integer: negative, zero or positive as i is below, equal to or above d.
int compare_integer(int64_t i, double d) {
    if (d >= 9223372036854775808.0) return -1;
    if (d < -9223372036854775808.0) return 1;
    double whole = std::floor(d);
    auto w = static_cast<int64_t>(whole);
    if (i < w) return -1;
    if (i > w) return 1;
    return whole == d ? 0 : -1;
}

void require_bound(double bound) {
    if (std::isnan(bound)) throw std::invalid_argument("number bound must not be NaN");
}

std::string character_count(size_t n) { return std::to_string(n) + " character(s)"; }

StringSchema with_string_check(const Schema& base, Check<std::string> check) {
    StringNode node = std::get<StringNode>(base.node().data);
    node.checks.push_back(std::move(check));
    return StringSchema(make_node(std::move(node)));
}

NumberSchema with_number_check(const Schema& base, NumberCheck check) {
    NumberNode node = std::get<NumberNode>(base.node().data);
    node.checks.push_back(std::move(check));
    return NumberSchema(make_node(std::move(node)));
}

// Wrap a child type in parentheses when it would otherwise bind wrongly
// inside an intersection.
std::string grouped(const Schema& s) {
    SchemaKind k = s.kind();
    std::string t = s.outputType();
    if (k == SchemaKind::Union || k == SchemaKind::Optional) return "(" + t + ")";
    return t;
}

}  // namespace

std::string to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::Unknown:
            return "unknown";
        case SchemaKind::String:
            return "string";
        case SchemaKind::Number:
            return "number";
        case SchemaKind::Array:
            return "array";
        case SchemaKind::Object:
            return "object";
        case SchemaKind::Optional:
            return "optional";
        case SchemaKind::Union:
            return "union";
        case SchemaKind::Intersection:
            return "intersection";
    }
    throw std::logic_error("Not a valid schema kind");
}

const SchemaNode& Schema::node() const {
    if (!m_node) throw std::logic_error("use of an empty schema");
    return *m_node;
}

SchemaKind Schema::kind() const { return static_cast<SchemaKind>(node().data.index()); }

Schema Schema::optional() const { return sc::optional(*this); }

Schema Schema::unionWith(const Schema& other) const { return union_of({*this, other}); }

Schema Schema::intersectWith(const Schema& other) const { return intersection(*this, other); }

std::string Schema::outputType() const {
    return std::visit(
                [](auto const& n) -> std::string {
                    using N = std::decay_t<decltype(n)>;
                    if constexpr (std::is_same_v<N, UnknownNode>) {
                        return "unknown";
                    } else if constexpr (std::is_same_v<N, StringNode>) {
                        return "string";
                    } else if constexpr (std::is_same_v<N, NumberNode>) {
                        return "number";
                    } else if constexpr (std::is_same_v<N, ArrayNode>) {
                        return "Array<" + n.element.outputType() + ">";
                    } else if constexpr (std::is_same_v<N, ObjectNode>) {
                        if (n.fields.empty()) return "{}";
                        std::string out = "{ ";
                        bool first = true;
                        for (auto const& [name, field] : n.fields) {
                            if (!first) out += "; ";
                            first = false;
                            if (field.kind() == SchemaKind::Optional) {
                                const auto& inner = std::get<OptionalNode>(field.node().data).inner;
                                out += name + "?: " + inner.outputType();
                            } else {
                                out += name + ": " + field.outputType();
                            }
                        }
                        return out + " }";
                    } else if constexpr (std::is_same_v<N, OptionalNode>) {
                        return n.inner.outputType() + " | undefined";
                    } else if constexpr (std::is_same_v<N, UnionNode>) {
                        std::string out;
                        for (size_t i = 0; i < n.options.size(); ++i) {
                            if (i) out += " | ";
                            out += n.options[i].outputType();
                        }
                        return out;
                    } else {
                        static_assert(std::is_same_v<N, IntersectionNode>, "unhandled schema node");
                        return grouped(n.left) + " & " + grouped(n.right);
                    }
                },
                node().data);
}

StringSchema StringSchema::minLength(size_t n) const {
    return with_string_check(*this,
                             {"String must contain at least " + character_count(n),
                              [n](const std::string& s) { return utf8_length(s) >= n; }});
}

StringSchema StringSchema::maxLength(size_t n) const {
    return with_string_check(*this,
                             {"String must contain at most " + character_count(n),
                              [n](const std::string& s) { return utf8_length(s) <= n; }});
}

StringSchema StringSchema::length(size_t n) const {
    return with_string_check(*this,
                             {"String must contain exactly " + character_count(n),
                              [n](const std::string& s) { return utf8_length(s) == n; }});
}

StringSchema StringSchema::nonEmpty() const {
    return with_string_check(*this, {"String must not be empty", [](const std::string& s) { return utf8_length(s) >= 1; }});
}

StringSchema StringSchema::pattern(const std::string& regex) const {
    std::shared_ptr<const std::regex> rx;
    try {
        rx = std::make_shared<const std::regex>(regex, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid pattern '" + regex + "': " + e.what());
    }
    return with_string_check(*this,
                             {"String must match pattern " + regex,
                              [rx](const std::string& s) { return std::regex_match(s, *rx); }});
}

StringSchema StringSchema::refine(Predicate predicate, std::string message) const {
    if (!predicate) throw std::invalid_argument("refine() requires a predicate");
    return with_string_check(*this, {std::move(message), std::move(predicate)});
}

NumberSchema NumberSchema::minimum(double bound) const {
    require_bound(bound);
    return with_number_check(*this,
                             {"Number must be greater than or equal to " + format_number(bound),
                              [bound](double x) { return x >= bound; },
                              [bound](int64_t i) { return compare_integer(i, bound) >= 0; }});
}

NumberSchema NumberSchema::maximum(double bound) const {
    require_bound(bound);
    return with_number_check(*this,
                             {"Number must be less than or equal to " + format_number(bound),
                              [bound](double x) { return x <= bound; },
                              [bound](int64_t i) { return compare_integer(i, bound) <= 0; }});
}

NumberSchema NumberSchema::exclusiveMinimum(double bound) const {
    require_bound(bound);
    return with_number_check(*this,
                             {"Number must be greater than " + format_number(bound),
                              [bound](double x) { return x > bound; },
                              [bound](int64_t i) { return compare_integer(i, bound) > 0; }});
}

NumberSchema NumberSchema::exclusiveMaximum(double bound) const {
    require_bound(bound);
    return with_number_check(*this,
                             {"Number must be less than " + format_number(bound),
                              [bound](double x) { return x < bound; },
                              [bound](int64_t i) { return compare_integer(i, bound) < 0; }});
}

NumberSchema NumberSchema::integer() const {
    return with_number_check(*this,
                             {"Number must be an integer",
                              [](double x) { return std::isfinite(x) && x == std::trunc(x); },
                              [](int64_t) { return true; }});
}

NumberSchema NumberSchema::refine(Predicate predicate, std::string message) const {
    if (!predicate) throw std::invalid_argument("refine() requires a predicate");
    return with_number_check(*this, {std::move(message), std::move(predicate), nullptr});
}

const Schema& ArraySchema::element() const { return std::get<ArrayNode>(node().data).element; }

const FieldList& ObjectSchema::fields() const { return std::get<ObjectNode>(node().data).fields; }

bool ObjectSchema::isStrict() const { return std::get<ObjectNode>(node().data).strict; }

ObjectSchema ObjectSchema::strict() const {
    ObjectNode n = std::get<ObjectNode>(node().data);
    n.strict = true;
    return ObjectSchema(make_node(std::move(n)));
}

ObjectSchema ObjectSchema::extend(const FieldList& more) const {
    ObjectNode n = std::get<ObjectNode>(node().data);
    for (auto const& [name, field] : more) {
        if (field.empty()) throw std::invalid_argument("field '" + name + "' has an empty schema");
        bool replaced = false;
        for (auto& existing : n.fields) {
            if (existing.first == name) {
                existing.second = field;
                replaced = true;
                break;
            }
        }
        if (!replaced) n.fields.emplace_back(name, field);
    }
    return ObjectSchema(make_node(std::move(n)));
}

Schema unknown() { return Schema(make_node(UnknownNode{})); }

StringSchema string() { return StringSchema(make_node(StringNode{})); }

NumberSchema number() { return NumberSchema(make_node(NumberNode{})); }

ArraySchema array(Schema element) {
    if (element.empty()) throw std::invalid_argument("array() requires an element schema");
    return ArraySchema(make_node(ArrayNode{std::move(element)}));
}

ObjectSchema object(FieldList fields) {
    std::set<std::string> seen;
    for (auto const& [name, field] : fields) {
        if (!seen.insert(name).second) throw std::invalid_argument("duplicate field '" + name + "'");
        if (field.empty()) throw std::invalid_argument("field '" + name + "' has an empty schema");
    }
    return ObjectSchema(make_node(ObjectNode{std::move(fields), false}));
}

Schema optional(Schema inner) {
    if (inner.empty()) throw std::invalid_argument("optional() requires a schema");
    return Schema(make_node(OptionalNode{std::move(inner)}));
}

Schema union_of(std::vector<Schema> options) {
    if (options.empty()) throw std::invalid_argument("union_of() requires at least one option");
    for (auto const& o : options)
        if (o.empty()) throw std::invalid_argument("union_of() given an empty schema");
    return Schema(make_node(UnionNode{std::move(options)}));
}

Schema intersection(Schema left, Schema right) {
    if (left.empty() || right.empty()) throw std::invalid_argument("intersection() requires two schemas");
    return Schema(make_node(IntersectionNode{std::move(left), std::move(right)}));
}

}  // namespace sc
