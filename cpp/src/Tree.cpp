#include "Tree.h"

using namespace treesim;

bool treesim::isTerminal(const LineageStatus status) noexcept {
    return status != LineageStatus::ALIVE && status != LineageStatus::NOTIFIED_ALIVE;
}

std::string treesim::toString(const LineageStatus status) {
    switch (status) {
    case LineageStatus::ALIVE: return "ALIVE";
    case LineageStatus::NOTIFIED_ALIVE: return "NOTIFIED_ALIVE";
    case LineageStatus::BRANCHED: return "BRANCHED";
    case LineageStatus::SAMPLED: return "SAMPLED";
    case LineageStatus::REMOVED_UNSAMPLED: return "REMOVED_UNSAMPLED";
    case LineageStatus::PRUNED_AT_TIME_LIMIT: return "PRUNED_AT_TIME_LIMIT";
    }
    return "UNKNOWN";
}

TreeNode::TreeNode(const int id, const int lineage, const double startTime, const size_t interval, TreeNode* parent)
    : id(id), lineage(lineage), startTime(startTime), interval(interval), parent(parent) {}


Tree::Tree(std::unique_ptr<TreeNode> root, const double startTime) : root_(std::move(root)), startTime_(startTime) {
    if (root_) root_->parent = nullptr;
}

std::vector<const TreeNode*> Tree::tips() const {
    std::vector<const TreeNode*> out;
    forEachNode([&out](const TreeNode& node) {
        if (node.isTip()) out.push_back(&node);
    });
    return out;
}

size_t Tree::nodeCount() const {
    size_t n = 0;
    forEachNode([&n](const TreeNode&) { ++n; });
    return n;
}

int Tree::sampledTips() const {
    int n = 0;
    forEachNode([&n](const TreeNode& node) {
        if (node.isTip() && node.status == LineageStatus::SAMPLED) ++n;
    });
    return n;
}

int Tree::prunedTips() const {
    int n = 0;
    forEachNode([&n](const TreeNode& node) {
        if (node.isTip() && node.status == LineageStatus::PRUNED_AT_TIME_LIMIT) ++n;
    });
    return n;
}


std::unique_ptr<TreeNode> treesim::pruneUnsampled(std::unique_ptr<TreeNode> node) {
    if (!node || node->status == LineageStatus::REMOVED_UNSAMPLED) return nullptr;
    if (node->children.empty()) return node;

    std::vector<std::unique_ptr<TreeNode>> kept;
    kept.reserve(node->children.size());
    for (auto& child : node->children) {
        if (auto k = pruneUnsampled(std::move(child)))
            kept.push_back(std::move(k));
    }

    if (kept.empty()) return nullptr;

    if (kept.size() == 1) {
        auto only = std::move(kept.front());
        only->startTime = node->startTime;
        only->interval = node->interval;
        only->parent = node->parent;
        return only;
    }

    node->children = std::move(kept);
    for (auto& child : node->children)
        child->parent = node.get();
    return node;
}
