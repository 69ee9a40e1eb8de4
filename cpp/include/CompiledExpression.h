#pragma once
/**
 * @file CompiledExpression.h
 * @brief An arithmetic expression evaluator over forest summaries.
 */
#include <memory>
#include <string>

namespace treesim {
    struct ForestSummary;

    /**
     * @brief Holds a compiled expression for fast repeated evaluation.
     */
    class CompiledExpression {
    public:
        /**
         * @brief Compile a new expression from source.
         * @param expr  arithmetic (and/or boolean) expression over tips, unsampled, hidden, notified, trees, time
         * @throws std::runtime_error if the expression does not compile
         */
        explicit CompiledExpression(const std::string& expr);


        ~CompiledExpression() = default;

        /**
         * @brief Evaluate on one forest summary.
         * @param s  the summary
         * @return   the result as double (0=false, nonzero=true)
         */
        double eval(const ForestSummary& s) const;

        /** @brief Get the original source string. */
        std::string expr() const { return expr_; }

    private:
        const std::string expr_;
        struct Impl;
        std::shared_ptr<Impl> impl_;
    };
}
