#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pactforge {

class Matcher;

enum class NodeKind {
    NUL,
    BOOL,
    INT,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY,
    MATCHER
};

const char* node_kind_name(NodeKind k);

// Node: one position of a body tree.
// Literal kinds describe plain JSON. MATCHER holds an immutable matcher that
// stands in for a literal and carries its matching rule.
// Objects are key-sorted so every walk over a tree is deterministic.
struct Node {
    NodeKind kind{NodeKind::NUL};
    bool b{false};
    int64_t i{0};
    double d{0.0};
    std::string s;
    std::map<std::string, Node> object;
    std::vector<Node> array;
    std::shared_ptr<const Matcher> matcher;

    Node() = default;
    Node(bool v);
    Node(int v);
    Node(int64_t v);
    Node(double v);             // throws std::invalid_argument for NaN/inf
    Node(const char* v);
    Node(std::string v);
    Node(Matcher m);

    static Node null();
    static Node object_of(std::map<std::string, Node> fields);
    static Node array_of(std::vector<Node> items);

    bool is_matcher() const { return kind == NodeKind::MATCHER; }
    bool is_object() const { return kind == NodeKind::OBJECT; }
    bool is_array() const { return kind == NodeKind::ARRAY; }

    // True when any matcher is reachable from this node.
    bool contains_matcher() const;
};

bool operator==(const Node& a, const Node& b);
inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }

} // namespace pactforge
