#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "sc/failure.h"
#include "sc/value.h"

namespace sc {

struct SchemaNode;  // defined privately by the engine

enum class SchemaKind { Unknown, String, Number, Array, Object, Optional, Union, Intersection };

std::string to_string(SchemaKind kind);

// An immutable description of an accepted value shape. Copies share the same
// node tree; every refinement or combinator call returns a new schema and
// leaves the receiver untouched, so a base schema can be specialised into
// several stricter variants.
class Schema {
  public:
    // A default-constructed schema is empty; using it throws std::logic_error.
    Schema() = default;
    explicit Schema(std::shared_ptr<const SchemaNode> node) : m_node(std::move(node)) {}

    bool empty() const noexcept { return !m_node; }

    SchemaKind kind() const;

    // Validate `value`. Never throws for invalid input; exceptions raised by
    // user-supplied refinement predicates propagate.
    ParseResult safeParse(const Value& value) const;

    // Validate `value` and return the validated value, or throw SchemaError.
    Value parse(const Value& value) const;

    // Accept Absent in addition to whatever this schema accepts.
    Schema optional() const;
    // Accept values this schema or `other` accepts; this schema is tried first.
    Schema unionWith(const Schema& other) const;
    // Accept only values both this schema and `other` accept.
    Schema intersectWith(const Schema& other) const;

    // Text rendering of the type a successful parse yields, e.g.
    // "{ name: string; tags?: Array<string> }". Descriptive only.
    std::string outputType() const;

    const SchemaNode& node() const;

  protected:
    std::shared_ptr<const SchemaNode> m_node;
};

class StringSchema : public Schema {
  public:
    using Predicate = std::function<bool(const std::string&)>;

    explicit StringSchema(std::shared_ptr<const SchemaNode> node) : Schema(std::move(node)) {}

    // Lengths count Unicode code points of the UTF-8 text.
    StringSchema minLength(size_t n) const;
    StringSchema maxLength(size_t n) const;
    StringSchema length(size_t n) const;
    StringSchema nonEmpty() const;
    // Full match against an ECMAScript regular expression. Throws
    // std::invalid_argument if the expression does not compile.
    StringSchema pattern(const std::string& regex) const;
    StringSchema refine(Predicate predicate, std::string message) const;
};

class NumberSchema : public Schema {
  public:
    using Predicate = std::function<bool(double)>;

    explicit NumberSchema(std::shared_ptr<const SchemaNode> node) : Schema(std::move(node)) {}

    // Bounds compare Integer values exactly; a NaN bound is rejected with
    // std::invalid_argument.
    NumberSchema minimum(double bound) const;
    NumberSchema maximum(double bound) const;
    NumberSchema exclusiveMinimum(double bound) const;
    NumberSchema exclusiveMaximum(double bound) const;
    NumberSchema integer() const;
    NumberSchema refine(Predicate predicate, std::string message) const;
};

class ArraySchema : public Schema {
  public:
    explicit ArraySchema(std::shared_ptr<const SchemaNode> node) : Schema(std::move(node)) {}

    const Schema& element() const;
};

using FieldList = std::vector<std::pair<std::string, Schema> >;

class ObjectSchema : public Schema {
  public:
    explicit ObjectSchema(std::shared_ptr<const SchemaNode> node) : Schema(std::move(node)) {}

    const FieldList& fields() const;
    bool isStrict() const;

    // Same fields, but keys not declared here are rejected.
    ObjectSchema strict() const;
    // Appends `more`; a name that is already declared keeps its position and
    // takes the new schema.
    ObjectSchema extend(const FieldList& more) const;
};

Schema unknown();
StringSchema string();
NumberSchema number();
ArraySchema array(Schema element);
// Field names must be unique (std::invalid_argument otherwise).
ObjectSchema object(FieldList fields);
Schema optional(Schema inner);
// At least one option is required (std::invalid_argument otherwise).
Schema union_of(std::vector<Schema> options);
Schema intersection(Schema left, Schema right);

}  // namespace sc
