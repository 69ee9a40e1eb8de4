#include "CompiledExpression.h"
#include <exprtk.hpp>
#include <stdexcept>
#include <memory>

#include "Forest.h"

using namespace treesim;


struct CompiledExpression::Impl {
    exprtk::symbol_table<double> symbols;
    exprtk::expression<double> expression;
    exprtk::parser<double> parser;

    double tips = 0, unsampled = 0, hidden = 0, notified = 0, trees = 0, time = 0;

    explicit Impl(const std::string& expr) {
        symbols.add_variable("tips", tips);
        symbols.add_variable("unsampled", unsampled);
        symbols.add_variable("hidden", hidden);
        symbols.add_variable("notified", notified);
        symbols.add_variable("trees", trees);
        symbols.add_variable("time", time);
        symbols.add_constants(); // math constants (pi, e, etc.)
        expression.register_symbol_table(symbols);


        if (!parser.compile(expr, expression))
            throw std::runtime_error("ExprTk compile error: " + parser.error());
    }
};

CompiledExpression::CompiledExpression(const std::string& expr):
    expr_(expr), impl_(std::make_shared<Impl>(expr)) {}


double CompiledExpression::eval(const ForestSummary& s) const {
    auto& impl = *impl_;
    impl.tips = s.tips;
    impl.unsampled = s.unsampled;
    impl.hidden = s.hiddenTrees;
    impl.notified = s.notified;
    impl.trees = s.trees;
    impl.time = s.time;

    return impl.expression.value();
}
