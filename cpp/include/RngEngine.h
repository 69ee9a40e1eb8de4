#pragma once
#include <cstdint>

namespace treesim {
    /**
     * @brief PCG-based RNG engine offering
     *   • Uniform [0,1) and uniform integers
     *   • Exponential waiting times
     *   • Bernoulli trials
     *   • Poisson via Knuth / Atkinson rejection
     */
    class RngEngine {
    public:
        /**
         * @param seed  Optional seed (default = time ^ thread_id).
         */
        explicit RngEngine(uint64_t seed = defaultSeed());

        /** @return a double ∈ [0,1) */
        double uniform();

        /** @brief Draw one Exp(rate) waiting time.
         *  @param rate  Must be >= 0; a zero rate never fires.
         *  @return an Exp(rate) variate, +inf when rate == 0 */
        double exponential(double rate);

        /** @brief Draw one Bernoulli(p) trial.
         *  @param p  success probability in [0,1]
         *  @return true with probability p */
        bool bernoulli(double p);

        /** @brief Draw one Poisson(lambda) variate.
         *  @param lambda  Must be >= 0.
         *  @return a Poisson(lambda) variate */
        int poisson(double lambda);

        /** @brief Draw an integer uniformly from the closed range [lo, hi]. */
        int uniformInt(int lo, int hi);

        /** Default seed generator (clock ^ thread_id) */
        static uint64_t defaultSeed();

        /** @return next 32-bit uniform integer via PCG */
        uint32_t nextUInt32();

    private:
        // --- PCG state ---
        uint64_t state_;
        uint64_t increment_;

        /** @return a double ∈ (0,1), never exactly zero */
        double uniformOpen();
    };
}
