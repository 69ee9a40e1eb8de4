#include "Output.h"

#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

using namespace treesim;

namespace {
    using Observed = std::unordered_map<const TreeNode*, bool>;

    // whether each subtree holds a sampled tip, filled children first in one pass
    Observed observedSubtrees(const Tree& tree) {
        std::vector<const TreeNode*> preorder;
        tree.forEachNode([&preorder](const TreeNode& node) { preorder.push_back(&node); });

        Observed observed;
        observed.reserve(preorder.size());
        for (auto it = preorder.rbegin(); it != preorder.rend(); ++it) {
            const TreeNode* node = *it;
            bool any = node->isTip() && node->status == LineageStatus::SAMPLED;
            for (const auto& child : node->children)
                any = any || observed.at(child.get());
            observed[node] = any;
        }
        return observed;
    }

    // extra: length of collapsed ancestors carried down onto this edge
    void writeNode(std::ostream& out, const TreeNode& node, const Observed* observed, const double extra) {
        const double length = extra + node.branchLength();

        if (node.isTip()) {
            out << (node.status == LineageStatus::SAMPLED ? 's' : 'a') << node.id << ':' << length;
            return;
        }

        std::vector<const TreeNode*> kept;
        for (const auto& child : node.children)
            if (!observed || observed->at(child.get())) kept.push_back(child.get());

        if (kept.size() == 1) {
            writeNode(out, *kept.front(), observed, length);
            return;
        }

        out << '(';
        for (size_t i = 0; i < kept.size(); ++i) {
            if (i > 0) out << ',';
            writeNode(out, *kept[i], observed, 0.0);
        }
        out << "):" << length;
    }

    std::ofstream openForWriting(const std::string& path) {
        std::ofstream file(path);
        if (!file) throw std::runtime_error("cannot open " + path + " for writing");
        file << std::setprecision(12);
        return file;
    }

    void finish(std::ofstream& file, const std::string& path) {
        file.flush();
        if (!file) throw std::runtime_error("failed writing " + path);
    }
}


std::string treesim::toNewick(const Tree& tree, const bool sampledOnly) {
    if (tree.empty()) return "";

    Observed observed;
    if (sampledOnly) {
        observed = observedSubtrees(tree);
        if (!observed.at(tree.root())) return "";
    }

    std::ostringstream out;
    out << std::setprecision(12);
    writeNode(out, *tree.root(), sampledOnly ? &observed : nullptr, 0.0);
    out << ';';
    return out.str();
}

void treesim::saveForest(const Forest& forest, const std::string& path, const bool sampledOnly) {
    auto file = openForWriting(path);
    for (const Tree& tree : forest.trees()) {
        const std::string newick = toNewick(tree, sampledOnly);
        if (!newick.empty()) file << newick << '\n';
    }
    finish(file, path);
}

void treesim::saveLog(const Skyline& skyline, const ForestSummary& summary, const std::string& path) {
    auto file = openForWriting(path);
    file << "interval,end_time,la,psi,p,r,upsilon,phi,max_notified_contacts,tips,time,unsampled,hidden_trees\n";
    for (size_t i = 0; i < skyline.size(); ++i) {
        const Model& model = skyline.model(i);
        file << i << ',' << skyline.endTime(i) << ','
                << model.birthRate() << ',' << model.removalRate(false) << ',' << model.samplingProbability() << ','
                << model.recipients().mean() << ','
                << model.notificationProbability() << ',' << model.notifiedRemovalRate() << ','
                << model.maxNotifiedContacts() << ','
                << summary.tips << ',' << summary.time << ',' << summary.unsampled << ',' << summary.hiddenTrees
                << '\n';
    }
    finish(file, path);
}

void treesim::saveLtt(const LttCurve& ltt, const LttCurve& observed, const std::string& path) {
    std::set<double> times;
    for (const auto& point : ltt) times.insert(point.first);
    for (const auto& point : observed) times.insert(point.first);

    auto file = openForWriting(path);
    file << "time,infected,observed\n";
    for (const double t : times)
        file << t << ',' << lttAt(ltt, t) << ',' << lttAt(observed, t) << '\n';
    finish(file, path);
}
