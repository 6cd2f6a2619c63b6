#include "pactforge/types.h"
#include "pactforge/matcher.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace pactforge {

const char* node_kind_name(NodeKind k) {
    switch (k) {
        case NodeKind::NUL:     return "null";
        case NodeKind::BOOL:    return "bool";
        case NodeKind::INT:     return "integer";
        case NodeKind::NUMBER:  return "number";
        case NodeKind::STRING:  return "string";
        case NodeKind::OBJECT:  return "object";
        case NodeKind::ARRAY:   return "array";
        case NodeKind::MATCHER: return "matcher";
    }
    return "null";
}

Node::Node(bool v) : kind(NodeKind::BOOL), b(v) {}
Node::Node(int v) : kind(NodeKind::INT), i(v) {}
Node::Node(int64_t v) : kind(NodeKind::INT), i(v) {}
Node::Node(double v) : kind(NodeKind::NUMBER), d(v) {
    if (!std::isfinite(v)) throw std::invalid_argument("Node: number must be finite");
}
Node::Node(const char* v) : kind(NodeKind::STRING), s(v ? v : "") {}
Node::Node(std::string v) : kind(NodeKind::STRING), s(std::move(v)) {}
Node::Node(Matcher m) : kind(NodeKind::MATCHER), matcher(std::make_shared<const Matcher>(std::move(m))) {}

Node Node::null() {
    return Node{};
}

Node Node::object_of(std::map<std::string, Node> fields) {
    Node n;
    n.kind = NodeKind::OBJECT;
    n.object = std::move(fields);
    return n;
}

Node Node::array_of(std::vector<Node> items) {
    Node n;
    n.kind = NodeKind::ARRAY;
    n.array = std::move(items);
    return n;
}

bool Node::contains_matcher() const {
    switch (kind) {
        case NodeKind::MATCHER:
            return true;
        case NodeKind::OBJECT:
            for (const auto& kv : object) {
                if (kv.second.contains_matcher()) return true;
            }
            return false;
        case NodeKind::ARRAY:
            for (const auto& el : array) {
                if (el.contains_matcher()) return true;
            }
            return false;
        default:
            return false;
    }
}

bool operator==(const Node& a, const Node& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case NodeKind::NUL:     return true;
        case NodeKind::BOOL:    return a.b == b.b;
        case NodeKind::INT:     return a.i == b.i;
        case NodeKind::NUMBER:  return a.d == b.d;
        case NodeKind::STRING:  return a.s == b.s;
        case NodeKind::OBJECT:  return a.object == b.object;
        case NodeKind::ARRAY:   return a.array == b.array;
        case NodeKind::MATCHER:
            if (a.matcher == b.matcher) return true;
            if (!a.matcher || !b.matcher) return false;
            return *a.matcher == *b.matcher;
    }
    return false;
}

} // namespace pactforge
