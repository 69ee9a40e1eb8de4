#pragma once
/**
 * @file Model.h
 * @brief Per-interval rate models: the birth-death-sampling base and the notification decorator.
 */
#include <optional>
#include <string>
#include <vector>

#include "RngEngine.h"

namespace treesim {
    /**
     * @brief Distribution of the number of recipients of one transmission event.
     */
    class RecipientDistribution {
    public:
        enum class Kind : int { SINGLE, SHIFTED_POISSON, CATEGORICAL };

        /** @brief One recipient per transmission (one-to-one). */
        static RecipientDistribution single();

        /**
         * @brief 1 + Poisson(mean - 1) recipients.
         * @param mean  average number of recipients, must be >= 1
         * @throws InvalidParameter if mean < 1 or not finite
         */
        static RecipientDistribution withMean(double mean);

        /**
         * @brief weights[i] is the relative weight of i + 1 recipients.
         * @throws InvalidParameter on negative weights or an all-zero list
         */
        static RecipientDistribution categorical(const std::vector<double>& weights);

        /** @brief Draw a number of recipients, always >= 1. */
        int draw(RngEngine& rng) const;

        /** @brief Expected number of recipients. */
        double mean() const noexcept;

        Kind kind() const noexcept { return kind_; }

    private:
        RecipientDistribution(Kind kind, double mean, std::vector<double> cumulative);

        Kind kind_;
        double mean_;
        std::vector<double> cumulative_; /**< normalized CDF, categorical only */
    };

    /**
     * @brief Birth-death-sampling rates governing one skyline interval.
     */
    struct RateModel {
        const double birthRate; /**< transmission rate λ */
        const double removalRate; /**< removal rate ψ */
        const double samplingProbability; /**< probability p that a removal is sampled */
        const RecipientDistribution recipients;

        /**
         * @throws InvalidParameter if a rate is negative or not finite, or p is outside [0,1]
         */
        RateModel(double birthRate, double removalRate, double samplingProbability,
                  RecipientDistribution recipients = RecipientDistribution::single());
    };

    /**
     * @brief Contact-notification parameters layered on a RateModel.
     */
    struct Notification {
        const double probability; /**< υ: chance that a sampled individual notifies its contacts */
        const double removalRate; /**< φ: removal rate of notified contacts */
        const int maxContacts; /**< cap on contacts notified per sampling event */

        /**
         * @throws InvalidParameter if υ is outside [0,1], φ is negative or not finite, or maxContacts < 0
         */
        Notification(double probability, double removalRate, int maxContacts = 1);
    };

    /**
     * @brief What the event engine sees for one interval: a base model, optionally notification-decorated.
     */
    class Model {
    public:
        explicit Model(const RateModel& base);
        Model(const RateModel& base, const Notification& notification);

        double birthRate() const noexcept { return base_.birthRate; }

        /** @brief ψ for ordinary lineages, φ for notified ones. */
        double removalRate(bool notified) const noexcept;

        double samplingProbability() const noexcept { return base_.samplingProbability; }
        const RecipientDistribution& recipients() const noexcept { return base_.recipients; }

        /** @brief True if a sampling event under this model can notify anyone. */
        bool notifies() const noexcept;

        double notificationProbability() const noexcept;
        double notifiedRemovalRate() const noexcept;
        int maxNotifiedContacts() const noexcept;

        const RateModel& base() const noexcept { return base_; }
        const std::optional<Notification>& notification() const noexcept { return notification_; }

        /** @brief A copy whose notification cap is replaced (no-op without a decorator). */
        Model withMaxNotifiedContacts(int maxContacts) const;

        /** @brief Short human-readable description, e.g. for logs. */
        std::string describe() const;

    private:
        RateModel base_;
        std::optional<Notification> notification_;
    };
}
