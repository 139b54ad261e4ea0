#include <verso/dom/document.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace verso::dom {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_class_list(const std::string& value) {
    std::vector<std::string> result;
    std::istringstream iss(value);
    std::string token;
    while (iss >> token) {
        if (std::find(result.begin(), result.end(), token) == result.end()) {
            result.push_back(token);
        }
    }
    return result;
}

} // namespace

Document::Document() {
    NodeData root;
    root.type = NodeType::Document;
    root.tag_name = "#document";
    nodes_.push_back(std::move(root));
}

NodeId Document::create_element(std::string_view tag_name,
                                const std::vector<Attribute>& attributes) {
    NodeData data;
    data.type = NodeType::Element;
    data.tag_name = to_lower(tag_name);
    for (const auto& attr : attributes) {
        std::string name = to_lower(attr.name);
        data.attributes.push_back({name, attr.value});
        update_derived_attribute(data, name, attr.value);
    }
    nodes_.push_back(std::move(data));
    return static_cast<NodeId>(nodes_.size() - 1);
}

NodeId Document::create_text(std::string_view text) {
    NodeData data;
    data.type = NodeType::Text;
    data.tag_name = "#text";
    data.text = std::string(text);
    nodes_.push_back(std::move(data));
    return static_cast<NodeId>(nodes_.size() - 1);
}

bool Document::append_child(NodeId parent, NodeId child) {
    if (!contains(parent) || !contains(child) || parent == child) return false;
    if (nodes_[parent].type == NodeType::Text) return false;
    if (child == root() || nodes_[child].parent != kInvalidNode) return false;

    // Reject cycles: child must not be an ancestor of parent.
    for (NodeId p = parent; p != kInvalidNode; p = nodes_[p].parent) {
        if (p == child) return false;
    }

    NodeData& p = nodes_[parent];
    NodeData& c = nodes_[child];
    c.parent = parent;
    c.prev_sibling = p.last_child;
    c.next_sibling = kInvalidNode;
    if (p.last_child != kInvalidNode) {
        nodes_[p.last_child].next_sibling = child;
    } else {
        p.first_child = child;
    }
    p.last_child = child;
    return true;
}

bool Document::set_attribute(NodeId element, std::string_view name, std::string_view value) {
    if (!contains(element) || nodes_[element].type != NodeType::Element) return false;
    NodeData& data = nodes_[element];
    std::string key = to_lower(name);
    auto it = std::find_if(data.attributes.begin(), data.attributes.end(),
                           [&](const Attribute& a) { return a.name == key; });
    if (it != data.attributes.end()) {
        it->value = std::string(value);
    } else {
        data.attributes.push_back({key, std::string(value)});
    }
    update_derived_attribute(data, key, std::string(value));
    return true;
}

NodeId Document::append_element(NodeId parent, std::string_view tag_name,
                                const std::vector<Attribute>& attributes) {
    if (!contains(parent) || nodes_[parent].type == NodeType::Text) return kInvalidNode;
    NodeId id = create_element(tag_name, attributes);
    append_child(parent, id);
    return id;
}

NodeId Document::append_text(NodeId parent, std::string_view text) {
    if (!contains(parent) || nodes_[parent].type == NodeType::Text) return kInvalidNode;
    NodeId id = create_text(text);
    append_child(parent, id);
    return id;
}

std::optional<std::string> Document::attribute(NodeId id, std::string_view name) const {
    const std::string key = to_lower(name);
    for (const auto& attr : nodes_[id].attributes) {
        if (attr.name == key) return attr.value;
    }
    return std::nullopt;
}

bool Document::has_class(NodeId id, std::string_view cls) const {
    const auto& list = nodes_[id].classes;
    return std::find(list.begin(), list.end(), cls) != list.end();
}

std::vector<NodeId> Document::children(NodeId id) const {
    std::vector<NodeId> result;
    for (NodeId c = nodes_[id].first_child; c != kInvalidNode; c = nodes_[c].next_sibling) {
        result.push_back(c);
    }
    return result;
}

NodeId Document::owning_element(NodeId id) const {
    while (id != kInvalidNode && nodes_[id].type != NodeType::Element) {
        id = nodes_[id].parent;
    }
    return id;
}

std::vector<NodeId> Document::preorder() const {
    std::vector<NodeId> order;
    order.reserve(nodes_.size());
    std::vector<NodeId> stack{root()};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        order.push_back(id);
        // Push children in reverse so the first child is visited first.
        for (NodeId c = nodes_[id].last_child; c != kInvalidNode; c = nodes_[c].prev_sibling) {
            stack.push_back(c);
        }
    }
    return order;
}

NodeId Document::find_by_id(std::string_view id) const {
    for (NodeId n : preorder()) {
        if (nodes_[n].type == NodeType::Element && nodes_[n].id == id) return n;
    }
    return kInvalidNode;
}

NodeId Document::find_first_by_tag(std::string_view tag) const {
    const std::string key = to_lower(tag);
    for (NodeId n : preorder()) {
        if (nodes_[n].type == NodeType::Element && nodes_[n].tag_name == key) return n;
    }
    return kInvalidNode;
}

void Document::update_derived_attribute(NodeData& data, const std::string& name,
                                        const std::string& value) {
    if (name == "id") {
        data.id = value;
    } else if (name == "class") {
        data.classes = split_class_list(value);
    }
}

std::string serialize_dom(const Document& document, NodeId id) {
    std::string out;
    const NodeData& n = document.node(id);
    if (n.type == NodeType::Text) {
        out += "\"" + n.text + "\"";
        return out;
    }
    out += "<" + n.tag_name;
    for (const auto& attr : n.attributes) {
        out += " " + attr.name + "=\"" + attr.value + "\"";
    }
    out += ">";
    for (NodeId c = n.first_child; c != kInvalidNode; c = document.next_sibling(c)) {
        out += serialize_dom(document, c);
    }
    out += "</" + n.tag_name + ">";
    return out;
}

} // namespace verso::dom
