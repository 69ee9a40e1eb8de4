#include "Model.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "Errors.h"

using namespace treesim;

namespace {
    void requireRate(const double value, const char* name) {
        if (!std::isfinite(value) || value < 0.0)
            throw InvalidParameter(std::string(name) + " must be a finite non-negative rate, got " +
                                   std::to_string(value));
    }

    void requireProbability(const double value, const char* name) {
        if (!(value >= 0.0 && value <= 1.0))
            throw InvalidParameter(std::string(name) + " must lie in [0, 1], got " + std::to_string(value));
    }
}

// RecipientDistribution
RecipientDistribution::RecipientDistribution(const Kind kind, const double mean, std::vector<double> cumulative)
    : kind_(kind), mean_(mean), cumulative_(std::move(cumulative)) {}

RecipientDistribution RecipientDistribution::single() {
    return RecipientDistribution(Kind::SINGLE, 1.0, {});
}

RecipientDistribution RecipientDistribution::withMean(const double mean) {
    if (!std::isfinite(mean) || mean < 1.0)
        throw InvalidParameter("RecipientDistribution: average number of recipients must be >= 1, got " +
                               std::to_string(mean));
    if (mean == 1.0) return single();
    return RecipientDistribution(Kind::SHIFTED_POISSON, mean, {});
}

RecipientDistribution RecipientDistribution::categorical(const std::vector<double>& weights) {
    if (weights.empty())
        throw InvalidParameter("RecipientDistribution: empty weight list");

    double total = 0.0, mean = 0.0;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (!std::isfinite(weights[i]) || weights[i] < 0.0)
            throw InvalidParameter("RecipientDistribution: weight " + std::to_string(i) + " is negative or not finite");
        total += weights[i];
        mean += weights[i] * static_cast<double>(i + 1);
    }
    if (total <= 0.0)
        throw InvalidParameter("RecipientDistribution: all weights are zero");

    std::vector<double> cumulative;
    cumulative.reserve(weights.size());
    double acc = 0.0;
    for (const double w : weights) {
        acc += w / total;
        cumulative.push_back(acc);
    }
    cumulative.back() = 1.0;
    return RecipientDistribution(Kind::CATEGORICAL, mean / total, std::move(cumulative));
}

int RecipientDistribution::draw(RngEngine& rng) const {
    switch (kind_) {
    case Kind::SINGLE:
        return 1;
    case Kind::SHIFTED_POISSON:
        return 1 + rng.poisson(mean_ - 1.0);
    case Kind::CATEGORICAL: {
        const double u = rng.uniform();
        const auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), u);
        const auto idx = std::min(static_cast<size_t>(it - cumulative_.begin()), cumulative_.size() - 1);
        return static_cast<int>(idx) + 1;
    }
    }
    return 1;
}

double RecipientDistribution::mean() const noexcept {
    return mean_;
}

// RateModel
RateModel::RateModel(const double birthRate, const double removalRate, const double samplingProbability,
                     RecipientDistribution recipients)
    : birthRate(birthRate),
      removalRate(removalRate),
      samplingProbability(samplingProbability),
      recipients(std::move(recipients)) {
    requireRate(birthRate, "RateModel: birth rate");
    requireRate(removalRate, "RateModel: removal rate");
    requireProbability(samplingProbability, "RateModel: sampling probability");
}

// Notification
Notification::Notification(const double probability, const double removalRate, const int maxContacts)
    : probability(probability), removalRate(removalRate), maxContacts(maxContacts) {
    requireProbability(probability, "Notification: notification probability");
    requireRate(removalRate, "Notification: notified removal rate");
    if (maxContacts < 0)
        throw InvalidParameter("Notification: max notified contacts must be >= 0, got " +
                               std::to_string(maxContacts));
}

// Model
Model::Model(const RateModel& base) : base_(base) {}

Model::Model(const RateModel& base, const Notification& notification) : base_(base), notification_(notification) {}

double Model::removalRate(const bool notified) const noexcept {
    return notified && notification_ ? notification_->removalRate : base_.removalRate;
}

bool Model::notifies() const noexcept {
    return notification_ && notification_->probability > 0.0 && notification_->maxContacts > 0;
}

double Model::notificationProbability() const noexcept {
    return notification_ ? notification_->probability : 0.0;
}

double Model::notifiedRemovalRate() const noexcept {
    return notification_ ? notification_->removalRate : base_.removalRate;
}

int Model::maxNotifiedContacts() const noexcept {
    return notification_ ? notification_->maxContacts : 0;
}

Model Model::withMaxNotifiedContacts(const int maxContacts) const {
    if (!notification_) return *this;
    return Model(base_, Notification(notification_->probability, notification_->removalRate, maxContacts));
}

std::string Model::describe() const {
    std::ostringstream out;
    out << "lambda=" << base_.birthRate << ", psi=" << base_.removalRate << ", p=" << base_.samplingProbability;
    if (base_.recipients.kind() != RecipientDistribution::Kind::SINGLE)
        out << ", r=" << base_.recipients.mean();
    if (notification_)
        out << ", upsilon=" << notification_->probability << ", phi=" << notification_->removalRate
            << ", max_notified_contacts=" << notification_->maxContacts;
    return out.str();
}
