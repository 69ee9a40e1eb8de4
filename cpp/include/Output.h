#pragma once
/**
 * @file Output.h
 * @brief Newick serialization and the forest, log and LTT writers.
 */
#include <string>

#include "Forest.h"
#include "Skyline.h"
#include "Tree.h"

namespace treesim {
    /**
     * @brief Newick string of a tree, terminated by ';'.
     *
     * Tips are labelled s<id> when sampled and a<id> otherwise; every edge carries its length, the root edge
     * included. With sampledOnly, tips that were not sampled are dropped and the unary nodes left behind are
     * collapsed. An empty tree (or one with nothing left to write) gives an empty string.
     */
    std::string toNewick(const Tree& tree, bool sampledOnly = false);

    /**
     * @brief Write one Newick line per tree.
     * @throws std::runtime_error if the file cannot be written
     */
    void saveForest(const Forest& forest, const std::string& path, bool sampledOnly = false);

    /**
     * @brief Write a CSV row per skyline interval: its parameters followed by the forest summary.
     * @throws std::runtime_error if the file cannot be written
     */
    void saveLog(const Skyline& skyline, const ForestSummary& summary, const std::string& path);

    /**
     * @brief Write `time,infected,observed` on the union of the change times of both curves.
     * @throws std::runtime_error if the file cannot be written
     */
    void saveLtt(const LttCurve& ltt, const LttCurve& observed, const std::string& path);
}
