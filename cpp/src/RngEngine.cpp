#include "RngEngine.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <limits>
#include <thread>


using namespace treesim;


//------------------------------------------------------------------------------
// defaultSeed(): mix high-res clock and thread ID for initial seeding
//------------------------------------------------------------------------------
uint64_t RngEngine::defaultSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
    return static_cast<uint64_t>(now) ^ (static_cast<uint64_t>(tid) << 1);
}

//------------------------------------------------------------------------------
// Constructor: initialize PCG state
//------------------------------------------------------------------------------
RngEngine::RngEngine(const uint64_t seed) : state_(0), increment_(seed << 1 | 1) {
    // Advance state at least once
    state_ = seed + increment_;
    state_ = state_ * 6364136223846793005ULL + increment_;
}

//------------------------------------------------------------------------------
// nextUInt32(): PCG-XSH-RR 32-bit generator
//------------------------------------------------------------------------------
uint32_t RngEngine::nextUInt32() {
    const uint64_t old = state_;
    state_ = old * 6364136223846793005ULL + increment_;
    const auto xorshifted = static_cast<uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot = static_cast<uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-rot) & 31u));
}

//------------------------------------------------------------------------------
// uniform(): convert top-32 bits of nextUInt32() into [0,1)
//------------------------------------------------------------------------------
double RngEngine::uniform() {
    return nextUInt32() * (1.0 / 4294967296.0);
}

double RngEngine::uniformOpen() {
    return (nextUInt32() + 0.5) * (1.0 / 4294967296.0);
}

//------------------------------------------------------------------------------
// exponential(rate): inversion, rate 0 => +inf
//------------------------------------------------------------------------------
double RngEngine::exponential(const double rate) {
    assert(rate >= 0.0 && "Exponential rate must be non-negative");
    if (rate <= 0.0) return std::numeric_limits<double>::infinity();
    return -std::log(uniformOpen()) / rate;
}

bool RngEngine::bernoulli(const double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return uniform() < p;
}

int RngEngine::uniformInt(const int lo, const int hi) {
    assert(lo <= hi && "uniformInt needs lo <= hi");
    const auto span = static_cast<uint64_t>(static_cast<int64_t>(hi) - lo) + 1;
    // multiply-shift of 32 random bits onto [0, span)
    return lo + static_cast<int>((static_cast<uint64_t>(nextUInt32()) * span) >> 32u);
}


//------------------------------------------------------------------------------
// poisson(lambda): Knuth for small lambda, Atkinson's rejection otherwise
//------------------------------------------------------------------------------

inline int poissonKnuth(RngEngine& rng, const double lambda) {
    const double L = std::exp(-lambda);
    int k = 0;
    double t = 1.0;
    do {
        ++k;
        t *= rng.uniform();
    }
    while (t > L);
    return k - 1;
}


// Atkinson’s rejection for λ ≥ 30
inline int poissonAtkinson(RngEngine& rng, const double lambda) {
    const double c = 0.767 - 3.36 / lambda;
    const double beta = M_PI / std::sqrt(3.0 * lambda);
    const double alpha = beta * lambda;
    const double k = std::log(c) - lambda - std::log(beta);

    while (true) {
        const double u = rng.uniform();
        if (u <= 0.0) continue;
        const double x = (alpha - std::log((1.0 - u) / u)) / beta;
        const int n = static_cast<int>(std::floor(x + 0.5));
        if (n < 0) continue;
        const double v = rng.uniform();
        if (v <= 0.0) continue;
        const double y = alpha - beta * x;
        const double onePlusExp = 1.0 + std::exp(y);
        const double lhs = y + std::log(v / (onePlusExp * onePlusExp));
        const double rhs = k + n * std::log(lambda) - std::lgamma(n + 1.0);
        if (lhs <= rhs) return n;
    }
}

int RngEngine::poisson(const double lambda) {
    assert(lambda >= 0.0 && "Poisson lambda must be non-negative");
    if (lambda <= 0.0) return 0;
    if (lambda < 30.0)
        return poissonKnuth(*this, lambda);
    return poissonAtkinson(*this, lambda);
}
