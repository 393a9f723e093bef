/**
 * @file assumption_tree.hpp
 * @brief 仮定の探索木（ノードは削除されないアリーナ）
 */
#ifndef RUNE_LOCK_ASSUMPTION_TREE_HPP
#define RUNE_LOCK_ASSUMPTION_TREE_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace rune_lock {

/**
 * @brief 探索木のノードへのインデックス
 */
struct NodeHandle {
    size_t id;

    bool operator==(const NodeHandle& other) const { return id == other.id; }
    bool operator!=(const NodeHandle& other) const { return id != other.id; }
};

inline std::ostream& operator<<(std::ostream& os, const NodeHandle& handle) {
    return os << handle.id;
}

/**
 * @brief 仮定の探索木
 *
 * ノードは std::vector に追加されるだけで、削除も付け替えもしない。
 * そのためハンドルは木の寿命の間ずっと有効。
 * ルート（id 0）はコンストラクタで作られる。
 *
 * @tparam T ノードが保持するデータ
 */
template <typename T>
class AssumptionTree {
public:
    explicit AssumptionTree(T root) {
        nodes_.push_back(Node{std::nullopt, std::move(root), {}});
    }

    NodeHandle root() const { return NodeHandle{0}; }

    /**
     * @brief 子ノードを追加
     * @return 追加したノードのハンドル
     */
    NodeHandle insert_child(NodeHandle parent, T data) {
        NodeHandle child{nodes_.size()};
        nodes_.push_back(Node{parent, std::move(data), {}});
        nodes_[parent.id].children.push_back(child);
        return child;
    }

    /**
     * @brief 外部入力の id からハンドルを取得
     * @return 存在しない id なら std::nullopt
     */
    std::optional<NodeHandle> get_handle(size_t id) const {
        if (id >= nodes_.size()) {
            return std::nullopt;
        }
        return NodeHandle{id};
    }

    std::optional<NodeHandle> parent_of(NodeHandle node) const {
        return nodes_[node.id].parent;
    }

    const std::vector<NodeHandle>& children_of(NodeHandle node) const {
        return nodes_[node.id].children;
    }

    T& operator[](NodeHandle node) { return nodes_[node.id].data; }
    const T& operator[](NodeHandle node) const { return nodes_[node.id].data; }

    size_t size() const { return nodes_.size(); }

    /**
     * @brief 木をインデント付きで出力
     *
     * 各行は " - (id) data"。current のノードには末尾に "  <" を付ける。
     */
    void print(std::ostream& os, std::optional<NodeHandle> current = std::nullopt) const {
        print_node(os, root(), 0, current);
    }

private:
    struct Node {
        std::optional<NodeHandle> parent;
        T data;
        std::vector<NodeHandle> children;
    };

    void print_node(std::ostream& os, NodeHandle node, size_t indent,
                    std::optional<NodeHandle> current) const {
        os << std::string(indent, ' ') << " - (" << node << ") " << nodes_[node.id].data;
        if (current && *current == node) {
            os << "  <";
        }
        os << "\n";
        for (const auto& child : nodes_[node.id].children) {
            print_node(os, child, indent + 2, current);
        }
    }

    std::vector<Node> nodes_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_ASSUMPTION_TREE_HPP
