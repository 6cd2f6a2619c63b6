#pragma once
#include <stdexcept>
#include <string>

namespace pactforge {

// Base for caller programming errors that abort fixture generation.
class PactError : public std::runtime_error {
public:
    explicit PactError(const std::string& what) : std::runtime_error(what) {}
};

// A schema field kind the synthesizer has no matcher for.
class UnsupportedTypeKind : public PactError {
public:
    explicit UnsupportedTypeKind(const std::string& type_expr)
        : PactError("match: unhandled type: " + type_expr), type_expr_(type_expr) {}
    const std::string& type_expr() const { return type_expr_; }

private:
    std::string type_expr_;
};

// A field annotation that does not parse for the field's kind.
class InvalidAnnotation : public PactError {
public:
    InvalidAnnotation(const std::string& annotation, const std::string& reason)
        : PactError("match: encountered invalid pact tag \"" + annotation +
                    "\" . . . parsing failed with error: " + reason),
          annotation_(annotation), reason_(reason) {}
    const std::string& annotation() const { return annotation_; }
    const std::string& reason() const { return reason_; }

private:
    std::string annotation_;
    std::string reason_;
};

// Structurally invalid document text. Recoverable: most APIs report it
// through a bool result plus error string; the schema loader throws it.
class MalformedDocument : public PactError {
public:
    explicit MalformedDocument(const std::string& what) : PactError("malformed document: " + what) {}
};

} // namespace pactforge
