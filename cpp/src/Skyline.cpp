#include "Skyline.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "Errors.h"

using namespace treesim;


Skyline::Skyline(std::vector<Model> models, std::vector<double> endTimes)
    : models_(std::move(models)), endTimes_(std::move(endTimes)) {
    if (models_.empty())
        throw ConfigurationMismatch("Skyline: at least one model is required");
    if (models_.size() != endTimes_.size())
        throw ConfigurationMismatch("Skyline: got " + std::to_string(models_.size()) + " models but " +
                                    std::to_string(endTimes_.size()) + " switch times");

    for (size_t i = 0; i < endTimes_.size(); ++i) {
        if (std::isnan(endTimes_[i]) || endTimes_[i] <= 0.0)
            throw ConfigurationMismatch("Skyline: switch time " + std::to_string(i) + " must be positive");
        if (i > 0 && endTimes_[i] <= endTimes_[i - 1])
            throw ConfigurationMismatch("Skyline: switch times must be strictly increasing (time " +
                                        std::to_string(i) + ")");
    }
}

Skyline::Skyline(const Model& model) : models_{model}, endTimes_{DOUBLE_INF} {}

size_t Skyline::intervalAt(const double t) const noexcept {
    // the last end time is not a switch: the last model stays in force
    const auto last = endTimes_.end() - 1;
    return static_cast<size_t>(std::upper_bound(endTimes_.begin(), last, t) - endTimes_.begin());
}

const Model& Skyline::modelAt(const double t) const noexcept {
    return models_[intervalAt(t)];
}

const Model& Skyline::model(const size_t i) const {
    if (i >= models_.size()) throw std::out_of_range("Skyline::model: no interval " + std::to_string(i));
    return models_[i];
}

double Skyline::endTime(const size_t i) const {
    if (i >= endTimes_.size()) throw std::out_of_range("Skyline::endTime: no interval " + std::to_string(i));
    return endTimes_[i];
}

double Skyline::nextSwitch(const double t) const noexcept {
    const auto last = endTimes_.end() - 1;
    const auto it = std::upper_bound(endTimes_.begin(), last, t);
    return it != last ? *it : DOUBLE_INF;
}

bool Skyline::canSample(const double until) const noexcept {
    for (size_t i = 0; i < models_.size(); ++i) {
        const double start = i == 0 ? 0.0 : endTimes_[i - 1];
        if (start >= until) break;
        if (models_[i].removalRate(false) > 0.0 && models_[i].samplingProbability() > 0.0) return true;
    }
    return false;
}

Skyline Skyline::withMaxNotifiedContacts(const int maxContacts) const {
    std::vector<Model> models;
    models.reserve(models_.size());
    for (const auto& m : models_)
        models.push_back(m.withMaxNotifiedContacts(maxContacts));
    return Skyline(std::move(models), endTimes_);
}
