#include "sc/validate.h"
#include "schema_node.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <variant>

namespace sc {

namespace {

struct ParseContext {
    bool debug = false;
};

std::string value_preview(const Value& v, size_t maxlen = 80) {
    std::string s = v.dump();
    if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
    return s;
}

std::string field_path(const std::string& path, const std::string& key) {
    if (key.find_first_of(".[]\"\\") != std::string::npos) {
        std::string quoted = "[\"";
        for (char c : key) {
            if (c == '"' || c == '\\') quoted.push_back('\\');
            quoted.push_back(c);
        }
        return path + quoted + "\"]";
    }
    return path.empty() ? key : path + "." + key;
}

std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

// Aggregated messages span lines; a trace record must not.
std::string single_line(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n')
            out += "\\n";
        else
            out.push_back(c);
    }
    return out;
}

std::string join_messages(const std::vector<Failure>& failures) {
    std::string out;
    for (size_t i = 0; i < failures.size(); ++i) {
        if (i) out += "\n";
        out += failures[i].message;
    }
    return out;
}

ParseResult parse_node(const Value& value,
                       const Schema& schema,
                       const std::string& path,
                       const ParseContext& ctx);

// Runs refinement checks in insertion order; the first rejecting check wins.
template <typename T>
std::optional<std::string> first_failed_check(const std::vector<Check<T> >& checks, const T& v) {
    for (auto const& check : checks)
        if (!check.predicate(v)) return check.message;
    return std::nullopt;
}

struct NodeParser {
    const Value& value;
    const std::string& path;
    const ParseContext& ctx;

    ParseResult fail(FailureKind kind, std::string message, std::vector<Failure> causes = {}) const {
        Failure f{kind, std::move(message), path, std::move(causes)};
        if (ctx.debug) {
            std::cerr << "parse fail: path='" << path << "' kind=" << to_string(f.kind)
                      << " message=" << single_line(f.message) << "\n";
        }
        return ParseResult::failure(std::move(f));
    }

    ParseResult operator()(const UnknownNode&) const { return ParseResult::success(value); }

    ParseResult operator()(const StringNode& node) const {
        if (!value.isString()) return fail(FailureKind::TypeMismatch, "Not a string");
        if (auto msg = first_failed_check(node.checks, value.asString()))
            return fail(FailureKind::ConstraintViolation, *msg);
        return ParseResult::success(value);
    }

    ParseResult operator()(const NumberNode& node) const {
        if (!value.isNumber()) return fail(FailureKind::TypeMismatch, "Not a number");
        for (auto const& check : node.checks) {
            bool passed = value.isInt() && check.integer_predicate ? check.integer_predicate(value.asInt())
                                                                   : check.predicate(value.asDouble());
            if (!passed) return fail(FailureKind::ConstraintViolation, check.message);
        }
        return ParseResult::success(value);
    }

    // Fail-fast: the first element failure is returned as-is.
    ParseResult operator()(const ArrayNode& node) const {
        if (!value.isArrayObject()) return fail(FailureKind::TypeMismatch, "Not an array");
        const auto& elements = value.asArray();
        std::vector<Value> out;
        out.reserve(elements.size());
        for (size_t i = 0; i < elements.size(); ++i) {
            ParseResult r = parse_node(elements[i], node.element, index_path(path, i), ctx);
            if (!r) return r;
            out.push_back(r.value());
        }
        return ParseResult::success(Value::array(std::move(out)));
    }

    // Fail-fast over declared fields, in declaration order. Undeclared keys
    // are left out of the result (or rejected when the schema is strict).
    ParseResult operator()(const ObjectNode& node) const {
        if (!value.isMappedObject()) return fail(FailureKind::TypeMismatch, "Not an object");
        Value out = Value::object();
        for (auto const& [name, field] : node.fields) {
            ParseResult r = parse_node(value.get(name), field, field_path(path, name), ctx);
            if (!r) return r;
            if (!r.value().isAbsent()) out[name] = r.value();
        }
        if (node.strict) {
            for (auto const& key : value.keys()) {
                bool declared = false;
                for (auto const& f : node.fields) {
                    if (f.first == key) {
                        declared = true;
                        break;
                    }
                }
                if (!declared) return fail(FailureKind::ConstraintViolation, "Unrecognized key '" + key + "'");
            }
        }
        return ParseResult::success(std::move(out));
    }

    ParseResult operator()(const OptionalNode& node) const {
        if (value.isAbsent()) return ParseResult::success(Value::absent());
        return parse_node(value, node.inner, path, ctx);
    }

    // First success wins; every branch failure is kept for the report.
    ParseResult operator()(const UnionNode& node) const {
        std::vector<Failure> failures;
        failures.reserve(node.options.size());
        for (auto const& option : node.options) {
            ParseResult r = parse_node(value, option, path, ctx);
            if (r) return r;
            failures.push_back(r.error());
        }
        std::string message = join_messages(failures);
        return fail(FailureKind::NoMatchingVariant, std::move(message), std::move(failures));
    }

    // Both sides are always evaluated so that both failures can be reported.
    ParseResult operator()(const IntersectionNode& node) const {
        ParseResult left = parse_node(value, node.left, path, ctx);
        ParseResult right = parse_node(value, node.right, path, ctx);
        if (left && right) return ParseResult::success(value);
        std::vector<Failure> failures;
        if (!left) failures.push_back(left.error());
        if (!right) failures.push_back(right.error());
        std::string message = join_messages(failures);
        return fail(FailureKind::CombinedFailure, std::move(message), std::move(failures));
    }
};

ParseResult parse_node(const Value& value,
                       const Schema& schema,
                       const std::string& path,
                       const ParseContext& ctx) {
    if (ctx.debug) {
        std::cerr << "parse enter: path='" << path << "' kind=" << to_string(schema.kind())
                  << " value=" << value_preview(value) << "\n";
    }
    return std::visit(NodeParser{value, path, ctx}, schema.node().data);
}

}  // namespace

ParseResult Schema::safeParse(const Value& value) const {
    ParseContext ctx;
    ctx.debug = std::getenv("SC_PARSE_DEBUG") != nullptr;
    if (ctx.debug) {
        std::cerr << "parse debug: schema=" << outputType() << " value=" << value_preview(value) << "\n";
    }
    return parse_node(value, *this, "", ctx);
}

Value Schema::parse(const Value& value) const {
    ParseResult r = safeParse(value);
    if (!r) throw SchemaError(r.error());
    return r.value();
}

std::optional<std::string> validate(const Value& data, const Schema& schema) {
    ParseResult r = schema.safeParse(data);
    if (r) return std::nullopt;
    return r.error().describe();
}

}  // namespace sc
