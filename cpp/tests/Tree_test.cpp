#include "gtest/gtest.h"
#include "Forest.h"
#include "Tree.h"

#include <memory>

using namespace treesim;

namespace {
    TreeNode* addChild(TreeNode& parent, const int id, const double start, const double end,
                       const LineageStatus status) {
        parent.children.push_back(std::make_unique<TreeNode>(id, id, start, 0, &parent));
        TreeNode* child = parent.children.back().get();
        child->endTime = end;
        child->status = status;
        return child;
    }

    /*
     * root [0,1] -> {a [1,4] SAMPLED, b [1,2] -> {c [2,3] REMOVED_UNSAMPLED, d [2,5] PRUNED}}
     */
    std::unique_ptr<TreeNode> handTree() {
        auto root = std::make_unique<TreeNode>(0, 0, 0.0, 0, nullptr);
        root->endTime = 1.0;
        root->status = LineageStatus::BRANCHED;
        addChild(*root, 1, 1.0, 4.0, LineageStatus::SAMPLED);
        TreeNode* b = addChild(*root, 2, 1.0, 2.0, LineageStatus::BRANCHED);
        addChild(*b, 3, 2.0, 3.0, LineageStatus::REMOVED_UNSAMPLED);
        addChild(*b, 4, 2.0, 5.0, LineageStatus::PRUNED_AT_TIME_LIMIT);
        return root;
    }
}

TEST(LineageStatus, TerminalValues) {
    EXPECT_FALSE(isTerminal(LineageStatus::ALIVE));
    EXPECT_FALSE(isTerminal(LineageStatus::NOTIFIED_ALIVE));
    EXPECT_TRUE(isTerminal(LineageStatus::BRANCHED));
    EXPECT_TRUE(isTerminal(LineageStatus::SAMPLED));
    EXPECT_TRUE(isTerminal(LineageStatus::REMOVED_UNSAMPLED));
    EXPECT_TRUE(isTerminal(LineageStatus::PRUNED_AT_TIME_LIMIT));
    EXPECT_EQ(toString(LineageStatus::NOTIFIED_ALIVE), "NOTIFIED_ALIVE");
}

TEST(Tree, PruneUnsampledCollapsesUnaryNodes) {
    const Tree tree(pruneUnsampled(handTree()), 0.0);
    ASSERT_FALSE(tree.empty());
    EXPECT_EQ(tree.nodeCount(), 3u);
    EXPECT_EQ(tree.sampledTips(), 1);
    EXPECT_EQ(tree.prunedTips(), 1);

    // b collapsed into d: d now starts where b started
    const TreeNode* root = tree.root();
    ASSERT_EQ(root->children.size(), 2u);
    const TreeNode* d = root->children[1].get();
    EXPECT_EQ(d->id, 4);
    EXPECT_DOUBLE_EQ(d->startTime, 1.0);
    EXPECT_DOUBLE_EQ(d->branchLength(), 4.0);
    EXPECT_EQ(d->parent, root);
}

TEST(Tree, RootToTipLengthsSurvivePruning) {
    const Tree tree(pruneUnsampled(handTree()), 0.0);
    for (const TreeNode* tip : tree.tips()) {
        double length = 0.0;
        for (const TreeNode* n = tip; n != nullptr; n = n->parent) length += n->branchLength();
        EXPECT_DOUBLE_EQ(length, tip->endTime - tree.startTime());
        EXPECT_NE(tip->status, LineageStatus::REMOVED_UNSAMPLED);
    }
}

TEST(Tree, PruneUnsampledRemovesEverythingUnobserved) {
    auto root = std::make_unique<TreeNode>(0, 0, 0.0, 0, nullptr);
    root->endTime = 1.0;
    root->status = LineageStatus::BRANCHED;
    addChild(*root, 1, 1.0, 2.0, LineageStatus::REMOVED_UNSAMPLED);
    addChild(*root, 2, 1.0, 3.0, LineageStatus::REMOVED_UNSAMPLED);
    EXPECT_EQ(pruneUnsampled(std::move(root)), nullptr);

    const Tree empty;
    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(empty.nodeCount(), 0u);
}

TEST(Forest, HiddenTreesAreCountedNotStored) {
    Forest forest;
    EventCounts observed;
    observed.sampled = 1;
    observed.unsampled = 1;
    observed.lineages = 4;
    forest.append(Tree(pruneUnsampled(handTree()), 0.0), observed);

    EventCounts hidden;
    hidden.unsampled = 2;
    hidden.lineages = 3;
    forest.append(Tree(), hidden);
    forest.setTime(5.0);

    EXPECT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest.totalTips(), 1);
    EXPECT_EQ(forest.unsampled(), 3);
    EXPECT_EQ(forest.hiddenTrees(), 1);

    const ForestSummary s = forest.summary();
    EXPECT_EQ(s.tips, 1);
    EXPECT_EQ(s.trees, 1);
    EXPECT_EQ(s.hiddenTrees, 1);
    EXPECT_DOUBLE_EQ(s.time, 5.0);
}

TEST(Ltt, StepCurveFromEvents) {
    const LttCurve curve = lttFromEvents({{2.0, -1}, {0.0, +1}, {1.0, +1}, {1.0, +1}, {3.0, -1}});
    ASSERT_EQ(curve.size(), 4u);
    EXPECT_EQ(curve[0], std::make_pair(0.0, 1));
    EXPECT_EQ(curve[1], std::make_pair(1.0, 3));
    EXPECT_EQ(curve[2], std::make_pair(2.0, 2));
    EXPECT_EQ(curve[3], std::make_pair(3.0, 1));

    EXPECT_EQ(lttAt(curve, -1.0), 0);
    EXPECT_EQ(lttAt(curve, 0.5), 1);
    EXPECT_EQ(lttAt(curve, 1.0), 3);
    EXPECT_EQ(lttAt(curve, 10.0), 1);
}

TEST(Ltt, ObservedCurveFollowsSampledAncestry) {
    Forest forest;
    EventCounts counts;
    counts.sampled = 1;
    forest.append(Tree(pruneUnsampled(handTree()), 0.0), counts);

    // only root [0,1] and a [1,4] lead to a sampled tip
    const LttCurve observed = observedLtt(forest);
    EXPECT_EQ(lttAt(observed, 0.5), 1);
    EXPECT_EQ(lttAt(observed, 2.0), 1);
    EXPECT_EQ(lttAt(observed, 4.0), 0);
}
