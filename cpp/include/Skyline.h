#pragma once
/**
 * @file Skyline.h
 * @brief Piecewise-constant sequence of models switching at fixed times.
 */
#include <limits>
#include <vector>

#include "Model.h"


namespace treesim {
    /**
     * @brief Ordered (model, interval end time) pairs.
     *
     * Model i governs [endTime(i-1), endTime(i)); the last model also governs every time after its end.
     */
    class Skyline {
    public:
        /**
         * @param models    one model per interval
         * @param endTimes  interval end times, strictly increasing and positive, same length as models
         * @throws ConfigurationMismatch on empty or mismatched lists, or unordered times
         */
        Skyline(std::vector<Model> models, std::vector<double> endTimes);

        /** @brief A single interval covering all times. */
        explicit Skyline(const Model& model);

        Skyline(const Skyline& skyline) = default;

        /** @brief Number of intervals. */
        size_t size() const noexcept { return models_.size(); }

        /** @brief Index of the interval containing absolute time t. */
        size_t intervalAt(double t) const noexcept;

        /** @brief Model governing absolute time t. */
        const Model& modelAt(double t) const noexcept;

        /** @brief Model of interval i. */
        const Model& model(size_t i) const;

        /** @brief Declared end time of interval i. */
        double endTime(size_t i) const;

        /**
         * @brief Next interval boundary strictly after t.
         * @return the boundary, or inf when t lies in the last interval
         */
        double nextSwitch(double t) const noexcept;

        /** @brief True if some interval starting before `until` can produce a sampled removal. */
        bool canSample(double until = DOUBLE_INF) const noexcept;

        const std::vector<Model>& models() const noexcept { return models_; }

        /** @brief A copy with every notification cap replaced by maxContacts. */
        Skyline withMaxNotifiedContacts(int maxContacts) const;

    private:
        static constexpr double DOUBLE_INF = std::numeric_limits<double>::infinity();
        std::vector<Model> models_;
        std::vector<double> endTimes_;
    };
}
