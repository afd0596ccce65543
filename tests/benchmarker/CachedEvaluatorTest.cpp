#include "benchmarker/CachedEvaluator.hpp"
#include "benchmarker/FunctionSimulator.hpp"
#include "benchmarker/caching/CostCache.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace ionbench;

namespace {

Eigen::VectorXd vec(double a, double b) {
    Eigen::VectorXd v(2);
    v << a, b;
    return v;
}

// y(t) = p0 * t + p1
Eigen::VectorXd linearModel(const Eigen::VectorXd& p, const Eigen::VectorXd& t) {
    return (p[0] * t.array() + p[1]).matrix();
}

} // anonymous namespace

class CachedEvaluatorTest : public ::testing::Test {
protected:
    const double inf = std::numeric_limits<double>::infinity();
    Eigen::VectorXd defaults = vec(1.0, 2.0);
    Eigen::VectorXd times = Eigen::VectorXd::LinSpaced(10, 0.0, 9.0);
    Eigen::VectorXd data;

    ParameterTransform transform{vec(1.0, 2.0)};
    BoundsChecker bounds{2};
    Tracker tracker;
    CostCache cache;
    std::shared_ptr<FunctionSimulator> simulator;
    std::unique_ptr<CachedEvaluator> evaluator;

    void SetUp() override {
        data = linearModel(defaults, times);
        simulator = std::make_shared<FunctionSimulator>(linearModel);
        evaluator = std::make_unique<CachedEvaluator>(simulator, transform, bounds, tracker, cache,
                                                      defaults, data, times);
    }

    void useSimulator(FunctionSimulator::ModelFunction model) {
        simulator = std::make_shared<FunctionSimulator>(std::move(model));
        evaluator = std::make_unique<CachedEvaluator>(simulator, transform, bounds, tracker, cache,
                                                      defaults, data, times);
    }
};

TEST_F(CachedEvaluatorTest, PerfectMatchHasZeroCost) {
    EXPECT_DOUBLE_EQ(evaluator->calculate(defaults), 0.0);
    EXPECT_EQ(tracker.solveCount(), 1);
    EXPECT_EQ(tracker.paramIdentifiedCount().back(), 2);
    EXPECT_DOUBLE_EQ(tracker.paramRMSRE().back(), 0.0);
}

TEST_F(CachedEvaluatorTest, CostIsRootMeanSquareError) {
    // Offsetting the intercept by 0.5 shifts every point by 0.5.
    EXPECT_NEAR(evaluator->calculate(vec(1.0, 2.5)), 0.5, 1e-12);
}

TEST_F(CachedEvaluatorTest, CacheHitRecordsWithoutSolving) {
    const Eigen::VectorXd x = vec(1.1, 2.0);
    const double first = evaluator->calculate(x);
    const double second = evaluator->calculate(x);

    EXPECT_EQ(first, second);
    EXPECT_EQ(simulator->callCount(), 1);
    EXPECT_EQ(tracker.solveCount(), 1);
    EXPECT_EQ(tracker.size(), 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(CachedEvaluatorTest, OutOfBoundsCandidateIsNotSolved) {
    bounds.setParameterBounds(vec(0.5, 0.5), vec(1.5, 1.5));
    const Eigen::VectorXd candidate = vec(0.4, 1.0);

    EXPECT_FALSE(evaluator->isFeasible(candidate));
    EXPECT_EQ(evaluator->calculate(candidate), inf);
    EXPECT_EQ(tracker.solveCount(), 0);
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_EQ(simulator->callCount(), 0);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(CachedEvaluatorTest, InfeasibleCandidatesAreRecheckedAfterBoundsChange) {
    bounds.setParameterBounds(vec(0.5, 0.5), vec(1.5, 1.5));
    const Eigen::VectorXd candidate = vec(0.4, 1.0);
    EXPECT_EQ(evaluator->calculate(candidate), inf);

    bounds.setBounded(false);
    EXPECT_TRUE(std::isfinite(evaluator->calculate(candidate)));
    EXPECT_EQ(tracker.solveCount(), 1);
}

TEST_F(CachedEvaluatorTest, IgnoringBoundsRunsTheSimulator) {
    bounds.setParameterBounds(vec(0.5, 0.5), vec(1.5, 1.5));
    EvaluationOptions options;
    options.checkBounds = false;

    EXPECT_TRUE(std::isfinite(evaluator->cost(vec(0.4, 1.0), options)));
    EXPECT_EQ(tracker.solveCount(), 1);
}

TEST_F(CachedEvaluatorTest, UncountedCallsDoNotWriteTheCache) {
    EvaluationOptions options;
    options.incrementSolveCounter = false;
    const Eigen::VectorXd x = vec(1.2, 2.0);

    evaluator->cost(x, options);
    EXPECT_EQ(tracker.solveCount(), 0);
    EXPECT_EQ(cache.size(), 0u);

    evaluator->calculate(x);
    EXPECT_EQ(tracker.solveCount(), 1);
    EXPECT_EQ(simulator->callCount(), 2);
}

TEST_F(CachedEvaluatorTest, DisabledCacheAlwaysSolves) {
    EvaluationOptions options;
    options.useCache = false;
    evaluator->cost(defaults, options);
    evaluator->cost(defaults, options);

    EXPECT_EQ(simulator->callCount(), 2);
    EXPECT_EQ(tracker.solveCount(), 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(CachedEvaluatorTest, SimulationFailureIsCountedAndCached) {
    useSimulator([](const Eigen::VectorXd&, const Eigen::VectorXd&) -> Eigen::VectorXd {
        throw SimulationException("failingModel", "solver diverged");
    });

    EXPECT_EQ(evaluator->calculate(defaults), inf);
    EXPECT_EQ(evaluator->calculate(defaults), inf);
    EXPECT_EQ(tracker.solveCount(), 1);
    EXPECT_EQ(simulator->callCount(), 1);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(CachedEvaluatorTest, UnexpectedSimulatorErrorsBecomeInfiniteCost) {
    useSimulator([](const Eigen::VectorXd&, const Eigen::VectorXd&) -> Eigen::VectorXd {
        throw std::runtime_error("unexpected");
    });
    EXPECT_EQ(evaluator->calculate(defaults), inf);
    EXPECT_EQ(tracker.solveCount(), 1);
}

TEST_F(CachedEvaluatorTest, BadTraceBecomesInfiniteCost) {
    useSimulator([](const Eigen::VectorXd&, const Eigen::VectorXd&) {
        return Eigen::VectorXd::Zero(3).eval();
    });
    EXPECT_EQ(evaluator->calculate(defaults), inf);

    useSimulator([](const Eigen::VectorXd&, const Eigen::VectorXd& t) {
        return Eigen::VectorXd::Constant(t.size(), std::nan("")).eval();
    });
    cache.clear();
    EXPECT_EQ(evaluator->calculate(defaults), inf);
}

TEST_F(CachedEvaluatorTest, NonFiniteOriginalParametersAreInfeasible) {
    ParameterTransform logTransform(defaults, false, {true, true});
    CachedEvaluator logEvaluator(simulator, logTransform, bounds, tracker, cache, defaults, data, times);

    EXPECT_EQ(logEvaluator.calculate(vec(1000.0, 0.0)), inf);
    EXPECT_EQ(tracker.solveCount(), 0);
    EXPECT_EQ(simulator->callCount(), 0);
}

TEST_F(CachedEvaluatorTest, SolveCountMatchesSimulatorCalls) {
    bounds.setParameterBounds(vec(0.0, 0.0), vec(3.0, 3.0));
    const Eigen::VectorXd candidates[] = {
        vec(1.0, 2.0), vec(1.0, 2.0), vec(4.0, 1.0), vec(2.0, 2.0), vec(-1.0, 0.0), vec(2.0, 2.0)
    };
    for (const auto& x : candidates) {
        evaluator->calculate(x);
    }
    EXPECT_EQ(tracker.size(), 6u);
    EXPECT_EQ(tracker.solveCount(), simulator->callCount());
    EXPECT_EQ(tracker.solveCount(), 2);
}

TEST_F(CachedEvaluatorTest, SignedErrorReturnsResiduals) {
    Eigen::VectorXd residuals = evaluator->signedError(vec(1.0, 3.0));
    ASSERT_EQ(residuals.size(), data.size());
    EXPECT_TRUE(residuals.isApprox(Eigen::VectorXd::Ones(data.size())));
    EXPECT_EQ(tracker.solveCount(), 1);
    EXPECT_NEAR(tracker.lastCost(), 1.0, 1e-12);

    bounds.setParameterBounds(vec(0.5, 0.5), vec(1.5, 1.5));
    Eigen::VectorXd infeasible = evaluator->signedError(vec(0.4, 1.0));
    EXPECT_TRUE(infeasible.array().isInf().all());
    EXPECT_EQ(tracker.solveCount(), 1);
}

TEST_F(CachedEvaluatorTest, ConstructorValidatesInputs) {
    EXPECT_THROW({
        CachedEvaluator e(nullptr, transform, bounds, tracker, cache, defaults, data, times);
    }, InvalidParameterException);
    EXPECT_THROW({
        CachedEvaluator e(simulator, transform, bounds, tracker, cache, Eigen::VectorXd::Ones(3), data, times);
    }, ConfigurationException);
    EXPECT_THROW({
        CachedEvaluator e(simulator, transform, bounds, tracker, cache, defaults, data, times.head(5));
    }, ConfigurationException);
}
