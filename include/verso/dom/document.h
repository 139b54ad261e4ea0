#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verso::dom {

// Stable index of a node inside its Document arena.
using NodeId = std::uint32_t;
inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

enum class NodeType {
    Document, Element, Text
};

struct Attribute {
    std::string name;
    std::string value;
};

struct NodeData {
    NodeType type = NodeType::Element;
    std::string tag_name;      // lower-case, elements only
    std::vector<Attribute> attributes;
    std::string id;
    std::vector<std::string> classes;
    std::string text;          // text nodes only

    NodeId parent = kInvalidNode;
    NodeId first_child = kInvalidNode;
    NodeId last_child = kInvalidNode;
    NodeId next_sibling = kInvalidNode;
    NodeId prev_sibling = kInvalidNode;
};

// Arena-backed document tree. Relationships are index fields, so the tree
// has no ownership cycles and NodeIds stay valid for the document lifetime.
// The style/layout/paint stages only use the const interface.
class Document {
public:
    Document();

    NodeId root() const { return 0; }
    std::size_t size() const { return nodes_.size(); }
    bool contains(NodeId id) const { return id < nodes_.size(); }

    // Builder interface. Returns kInvalidNode / false on misuse
    // (unknown parent, appending below a text node, re-parenting).
    NodeId create_element(std::string_view tag_name,
                          const std::vector<Attribute>& attributes = {});
    NodeId create_text(std::string_view text);
    bool append_child(NodeId parent, NodeId child);
    bool set_attribute(NodeId element, std::string_view name, std::string_view value);

    // Convenience: create + append in one call.
    NodeId append_element(NodeId parent, std::string_view tag_name,
                          const std::vector<Attribute>& attributes = {});
    NodeId append_text(NodeId parent, std::string_view text);

    // Read-only traversal
    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeType type(NodeId id) const { return nodes_[id].type; }
    bool is_element(NodeId id) const { return nodes_[id].type == NodeType::Element; }
    bool is_text(NodeId id) const { return nodes_[id].type == NodeType::Text; }
    const std::string& tag_name(NodeId id) const { return nodes_[id].tag_name; }
    const std::string& text(NodeId id) const { return nodes_[id].text; }
    const std::string& element_id(NodeId id) const { return nodes_[id].id; }
    const std::vector<std::string>& classes(NodeId id) const { return nodes_[id].classes; }
    std::optional<std::string> attribute(NodeId id, std::string_view name) const;
    bool has_class(NodeId id, std::string_view cls) const;

    NodeId parent(NodeId id) const { return nodes_[id].parent; }
    NodeId first_child(NodeId id) const { return nodes_[id].first_child; }
    NodeId next_sibling(NodeId id) const { return nodes_[id].next_sibling; }
    NodeId prev_sibling(NodeId id) const { return nodes_[id].prev_sibling; }
    std::vector<NodeId> children(NodeId id) const;

    // Nearest element at or above `id` (text nodes resolve to their parent).
    NodeId owning_element(NodeId id) const;

    // Depth-first, parents before children.
    std::vector<NodeId> preorder() const;

    // First element whose id attribute equals `id`, or kInvalidNode.
    NodeId find_by_id(std::string_view id) const;
    // First element with the given tag in document order, or kInvalidNode.
    NodeId find_first_by_tag(std::string_view tag) const;

private:
    std::vector<NodeData> nodes_;

    void update_derived_attribute(NodeData& data, const std::string& name,
                                  const std::string& value);
};

// Canonical string for deterministic comparison in tests.
std::string serialize_dom(const Document& document, NodeId id);

} // namespace verso::dom
