#include "sc/failure.h"
#include <stdexcept>

namespace sc {

// Convert internal path (dot/bracket style) to folder-style display path.
// Quoted keys keep their quotes: x["a.b"] displays as x/"a.b".
static std::string display_path(const std::string& path) {
    if (path.empty()) return std::string("root");
    std::string out;
    out.reserve(path.size());
    for (size_t i = 0; i < path.size();) {
        if (path[i] == '.') {
            out.push_back('/');
            ++i;
            continue;
        }
        if (path[i] == '[' && i + 1 < path.size() && path[i + 1] == '"') {
            out += "/\"";
            size_t j = i + 2;
            while (j < path.size() && path[j] != '"') {
                if (path[j] == '\\' && j + 1 < path.size()) out.push_back(path[j++]);
                out.push_back(path[j++]);
            }
            out.push_back('"');
            i = j + 2;  // past the closing "]
            continue;
        }
        // convert [N] into /N
        if (path[i] == '[') {
            size_t j = path.find(']', i);
            if (j != std::string::npos) {
                out.push_back('/');
                out.append(path.substr(i + 1, j - (i + 1)));
                i = j + 1;
                continue;
            }
        }
        out.push_back(path[i]);
        ++i;
    }
    return out;
}

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::TypeMismatch:
            return "TypeMismatch";
        case FailureKind::ConstraintViolation:
            return "ConstraintViolation";
        case FailureKind::NoMatchingVariant:
            return "NoMatchingVariant";
        case FailureKind::CombinedFailure:
            return "CombinedFailure";
    }
    throw std::logic_error("Not a valid failure kind");
}

std::string Failure::describe() const {
    if (path.empty()) return message;
    return message + " at '" + display_path(path) + "'";
}

bool operator==(const Failure& a, const Failure& b) {
    return a.kind == b.kind && a.message == b.message && a.path == b.path && a.causes == b.causes;
}

}  // namespace sc
