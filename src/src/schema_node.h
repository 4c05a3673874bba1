#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include "sc/schema.h"

namespace sc {

// A named predicate attached to a leaf schema.
template <typename T>
struct Check {
    std::string message;
    std::function<bool(const T&)> predicate;
};

struct UnknownNode {};

struct StringNode {
    std::vector<Check<std::string> > checks;
};

// Number checks see the value as a double. Bound checks also carry an exact
// form that Integer values are tested with instead, so integers beyond 2^53
// are not rounded before comparison.
struct NumberCheck {
    std::string message;
    std::function<bool(double)> predicate;
    std::function<bool(int64_t)> integer_predicate;
};

struct NumberNode {
    std::vector<NumberCheck> checks;
};

struct ArrayNode {
    Schema element;
};

struct ObjectNode {
    FieldList fields;
    bool strict = false;
};

struct OptionalNode {
    Schema inner;
};

struct UnionNode {
    std::vector<Schema> options;
};

struct IntersectionNode {
    Schema left;
    Schema right;
};

// Alternative order matches SchemaKind.
struct SchemaNode {
    std::variant<UnknownNode,
                 StringNode,
                 NumberNode,
                 ArrayNode,
                 ObjectNode,
                 OptionalNode,
                 UnionNode,
                 IntersectionNode>
                data;
};

}  // namespace sc
