#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "sc/value.h"

namespace sc {

enum class FailureKind {
    TypeMismatch,         // wrong primitive or structural kind
    ConstraintViolation,  // kind matched, a refinement rejected the value
    NoMatchingVariant,    // every branch of a union failed
    CombinedFailure       // one or both sides of an intersection failed
};

std::string to_string(FailureKind kind);

struct Failure {
    FailureKind kind = FailureKind::TypeMismatch;
    std::string message;
    // Location of the failing node, e.g. "servers[2].port"; empty at the root.
    // Keys containing . [ ] " or \ are quoted: servers["a.b"].
    std::string path;
    // Branch failures aggregated by a union or intersection.
    std::vector<Failure> causes;

    // The message plus the folder-style location, e.g.
    // "Not a number at 'servers/2/port'".
    std::string describe() const;
};

bool operator==(const Failure& a, const Failure& b);
inline bool operator!=(const Failure& a, const Failure& b) { return !(a == b); }

// Outcome of a single validation: either the validated value or the failure.
class ParseResult {
  public:
    static ParseResult success(Value v) { return ParseResult(std::move(v)); }
    static ParseResult failure(Failure f) { return ParseResult(std::move(f)); }

    bool ok() const noexcept { return std::holds_alternative<Value>(m_outcome); }
    explicit operator bool() const noexcept { return ok(); }

    const Value& value() const {
        if (!ok()) throw std::logic_error("value() called on a failed parse: " + error().message);
        return std::get<Value>(m_outcome);
    }

    const Failure& error() const {
        if (ok()) throw std::logic_error("error() called on a successful parse");
        return std::get<Failure>(m_outcome);
    }

  private:
    explicit ParseResult(Value v) : m_outcome(std::move(v)) {}
    explicit ParseResult(Failure f) : m_outcome(std::move(f)) {}

    std::variant<Value, Failure> m_outcome;
};

// Thrown by Schema::parse when validation fails.
class SchemaError : public std::runtime_error {
  public:
    explicit SchemaError(Failure failure)
        : std::runtime_error(failure.describe()), m_failure(std::move(failure)) {}

    const Failure& failure() const noexcept { return m_failure; }
    FailureKind kind() const noexcept { return m_failure.kind; }

  private:
    Failure m_failure;
};

}  // namespace sc
