#pragma once
/**
 * @file TrajectoryResult.h
 * @brief Possible outcomes of one tree or forest simulation attempt.
 */
#include <string>

/**
 * @brief Codes returned by EventEngine::simulate and ForestSimulator attempts.
 */
namespace treesim {
    enum class TrajectoryResult : int {
        ACCEPTED,
        EXTINCT, /**< every lineage terminated (or stalled) before the tip target */
        EARLY_REJECTED, /**< a criterion rejected while sampling was still going on */
        REJECTED_BY_CRITERION /**< the finished forest failed a final check */
    };

    inline std::string toString(const TrajectoryResult result) {
        switch (result) {
        case TrajectoryResult::ACCEPTED: return "accepted";
        case TrajectoryResult::EXTINCT: return "extinct";
        case TrajectoryResult::EARLY_REJECTED: return "early rejected";
        case TrajectoryResult::REJECTED_BY_CRITERION: return "rejected by criterion";
        }
        return "unknown";
    }
}
