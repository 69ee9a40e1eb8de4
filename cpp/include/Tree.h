#pragma once
/**
 * @file Tree.h
 * @brief Simulated transmission trees: one TreeNode per edge, children owned by their parent.
 */
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace treesim {
    /**
     * @brief Status of a tree edge. ALIVE and NOTIFIED_ALIVE are the only non-terminal values.
     */
    enum class LineageStatus : int {
        ALIVE,
        NOTIFIED_ALIVE,
        BRANCHED, /**< closed by a transmission: an internal node */
        SAMPLED,
        REMOVED_UNSAMPLED,
        PRUNED_AT_TIME_LIMIT
    };

    /** @brief true for every status but ALIVE and NOTIFIED_ALIVE */
    bool isTerminal(LineageStatus status) noexcept;

    /** @brief Upper-case name of a status, e.g. "SAMPLED". */
    std::string toString(LineageStatus status);

    /**
     * @brief One edge of a tree, from its start (a transmission or the root) to its end event.
     */
    struct TreeNode {
        static constexpr double NEVER = std::numeric_limits<double>::infinity();

        int id; /**< creation order within its tree */
        int lineage; /**< individual this edge belongs to */
        double startTime;
        double endTime = NEVER;
        LineageStatus status = LineageStatus::ALIVE;
        size_t interval; /**< skyline interval in force at startTime */
        bool notified = false;
        double notifiedAt = NEVER;
        int notifierId = -1; /**< id of the sampled tip whose notification reached this lineage */

        TreeNode* parent = nullptr; /**< non-owning */
        std::vector<std::unique_ptr<TreeNode>> children;

        TreeNode(int id, int lineage, double startTime, size_t interval, TreeNode* parent);

        double branchLength() const noexcept { return endTime - startTime; }
        bool isTip() const noexcept { return children.empty(); }
    };

    /**
     * @brief A rooted tree of TreeNodes; may be empty if every lineage went unobserved.
     */
    class Tree {
    public:
        Tree() = default;
        Tree(std::unique_ptr<TreeNode> root, double startTime);

        Tree(Tree&&) noexcept = default;
        Tree& operator=(Tree&&) noexcept = default;

        bool empty() const noexcept { return root_ == nullptr; }
        const TreeNode* root() const noexcept { return root_.get(); }
        double startTime() const noexcept { return startTime_; }

        /** @brief Visit every node in pre-order. */
        template <typename FUNC>
        void forEachNode(const FUNC& func) const {
            if (!root_) return;
            std::vector<const TreeNode*> stack{root_.get()};
            while (!stack.empty()) {
                const TreeNode* node = stack.back();
                stack.pop_back();
                func(*node);
                for (auto it = node->children.rbegin(); it != node->children.rend(); ++it)
                    stack.push_back(it->get());
            }
        }

        /** @brief Tips in pre-order. */
        std::vector<const TreeNode*> tips() const;

        size_t nodeCount() const;
        int sampledTips() const;
        int prunedTips() const;

    private:
        std::unique_ptr<TreeNode> root_;
        double startTime_ = 0.0;
    };

    /**
     * @brief Remove REMOVED_UNSAMPLED tips and collapse the unary nodes this leaves behind.
     *
     * A collapsed node's single child inherits its start time and interval, so root-to-tip lengths are
     * preserved. Returns nullptr when nothing observable remains.
     */
    std::unique_ptr<TreeNode> pruneUnsampled(std::unique_ptr<TreeNode> node);
}
