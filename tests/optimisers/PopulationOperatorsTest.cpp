#include "optimisers/PopulationOperators.hpp"
#include "optimisers/operators/PolynomialMutation.hpp"
#include "optimisers/operators/SinglePointCrossover.hpp"
#include "benchmarker/Benchmarker.hpp"
#include "benchmarker/FunctionSimulator.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

using namespace ionbench;

namespace {

Population withCosts(const std::vector<double>& costs) {
    Population pop;
    for (std::size_t i = 0; i < costs.size(); ++i) {
        pop.emplace_back(Eigen::VectorXd::Constant(2, static_cast<double>(i)), costs[i]);
    }
    return pop;
}

double minCost(const Population& pop) {
    return *PopulationOperators::best(pop).cost;
}

class CountingObjective : public IObjectiveFunction {
public:
    double calculate(const Eigen::VectorXd& x) override {
        ++calls;
        return x.sum();
    }
    int numParameters() const override { return 2; }
    int calls = 0;
};

} // anonymous namespace

class PopulationOperatorsTest : public ::testing::Test {
protected:
    std::mt19937 rng{1234u};
    Eigen::VectorXd lower = Eigen::VectorXd::Constant(2, -10.0);
    Eigen::VectorXd upper = Eigen::VectorXd::Constant(2, 10.0);
};

TEST_F(PopulationOperatorsTest, ElitismSurvivesAWorseGeneration) {
    Population pop = withCosts({5.0, 3.0, 8.0, 1.0});
    Population elites = PopulationOperators::getElites(pop, 1);
    ASSERT_EQ(elites.size(), 1u);
    EXPECT_DOUBLE_EQ(*elites[0].cost, 1.0);
    EXPECT_TRUE(elites[0].x.isApprox(pop[3].x));

    Population next = withCosts({9.0, 9.0, 9.0, 9.0});
    PopulationOperators::setElites(next, elites);
    EXPECT_DOUBLE_EQ(minCost(next), 1.0);
    EXPECT_EQ(next.size(), 4u);
    // Ties replace the later individual.
    EXPECT_DOUBLE_EQ(*next[3].cost, 1.0);
}

TEST_F(PopulationOperatorsTest, SetElitesReplacesWorstFirst) {
    Population pop = withCosts({4.0, 7.0, 2.0, 6.0});
    Population elites = withCosts({0.5, 0.7});
    PopulationOperators::setElites(pop, elites);

    EXPECT_DOUBLE_EQ(*pop[1].cost, 0.5);
    EXPECT_DOUBLE_EQ(*pop[3].cost, 0.7);
    EXPECT_DOUBLE_EQ(*pop[0].cost, 4.0);
    EXPECT_DOUBLE_EQ(*pop[2].cost, 2.0);
}

TEST_F(PopulationOperatorsTest, GetElitesIsSortedAndStable) {
    Population pop = withCosts({3.0, 1.0, 3.0, 2.0});
    Population elites = PopulationOperators::getElites(pop, 3);
    ASSERT_EQ(elites.size(), 3u);
    EXPECT_DOUBLE_EQ(*elites[0].cost, 1.0);
    EXPECT_DOUBLE_EQ(*elites[1].cost, 2.0);
    EXPECT_DOUBLE_EQ(*elites[2].cost, 3.0);
    EXPECT_DOUBLE_EQ(elites[2].x[0], 0.0);

    EXPECT_EQ(PopulationOperators::getElites(pop, 10).size(), 4u);
}

TEST_F(PopulationOperatorsTest, UnevaluatedIndividualsAreRejected) {
    Population pop = withCosts({1.0, 2.0});
    pop.emplace_back(Eigen::VectorXd::Zero(2));
    EXPECT_THROW(PopulationOperators::getElites(pop, 1), InvalidParameterException);
    EXPECT_THROW(PopulationOperators::tournamentSelection(pop, rng), InvalidParameterException);
    EXPECT_THROW(PopulationOperators::best(Population{}), InvalidParameterException);

    Population small = withCosts({1.0});
    EXPECT_THROW(PopulationOperators::setElites(small, withCosts({0.0, 0.0})), InvalidParameterException);
}

TEST_F(PopulationOperatorsTest, TournamentNeverSelectsTheWorstOfAnEvenPopulation) {
    Population pop = withCosts({1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    for (int trial = 0; trial < 20; ++trial) {
        Population selected = PopulationOperators::tournamentSelection(pop, rng);
        ASSERT_EQ(selected.size(), pop.size());
        for (const auto& ind : selected) {
            EXPECT_LT(*ind.cost, 6.0);
        }
    }
}

TEST_F(PopulationOperatorsTest, TournamentKeepsOddPopulationSize) {
    Population pop = withCosts({1.0, 2.0, 3.0, 4.0, 5.0});
    Population selected = PopulationOperators::tournamentSelection(pop, rng);
    EXPECT_EQ(selected.size(), 5u);
    EXPECT_TRUE(std::all_of(selected.begin(), selected.end(), [](const Individual& i) { return i.hasCost(); }));
}

TEST_F(PopulationOperatorsTest, CrossoverCopiesTrailingIndividual) {
    Population pop = withCosts({1.0, 2.0, 3.0});
    SinglePointCrossover op(1.0);
    Population offspring = PopulationOperators::crossover(pop, op, lower, upper, rng);

    ASSERT_EQ(offspring.size(), 3u);
    EXPECT_FALSE(offspring[0].hasCost());
    EXPECT_FALSE(offspring[1].hasCost());
    EXPECT_TRUE(offspring[2].hasCost());
    EXPECT_DOUBLE_EQ(*offspring[2].cost, 3.0);
}

TEST_F(PopulationOperatorsTest, UnchangedIndividualsKeepTheirCost) {
    Population pop = withCosts({1.0, 2.0});
    Population same = PopulationOperators::mutate(pop, PolynomialMutation(20.0, 0.0), lower, upper, rng);
    EXPECT_TRUE(same[0].hasCost());
    EXPECT_TRUE(same[1].hasCost());

    Population moved = PopulationOperators::mutate(pop, PolynomialMutation(20.0, 1.0), lower, upper, rng);
    EXPECT_FALSE(moved[0].hasCost());
}

TEST_F(PopulationOperatorsTest, EvaluateOnlyScoresMissingCosts) {
    Population pop = withCosts({1.0});
    pop.emplace_back(Eigen::VectorXd::Constant(2, 2.0));
    CountingObjective objective;

    PopulationOperators::evaluatePopulation(pop, objective);
    EXPECT_EQ(objective.calls, 1);
    EXPECT_DOUBLE_EQ(*pop[0].cost, 1.0);
    EXPECT_DOUBLE_EQ(*pop[1].cost, 4.0);
}

TEST_F(PopulationOperatorsTest, InitializeFromBenchmarker) {
    BenchmarkerConfig config;
    config.name = "test.linear";
    config.defaultParams = Eigen::VectorXd::Constant(2, 1.0);
    config.times = Eigen::VectorXd::LinSpaced(5, 0.0, 4.0);
    config.data = Eigen::VectorXd::Zero(5);
    config.lowerBounds = Eigen::VectorXd::Constant(2, 0.0);
    config.upperBounds = Eigen::VectorXd::Constant(2, 1.2);
    auto simulator = std::make_shared<FunctionSimulator>(
        [](const Eigen::VectorXd& p, const Eigen::VectorXd& t) { return (p[0] * t.array() + p[1]).matrix().eval(); });
    Benchmarker bm(config, simulator);

    Population sampled = PopulationOperators::initialize(bm, std::nullopt, 8);
    EXPECT_EQ(sampled.size(), 8u);

    Eigen::VectorXd x0 = Eigen::VectorXd::Constant(2, 1.0);
    Population around = PopulationOperators::initialize(bm, x0, 8);
    for (const auto& ind : around) {
        EXPECT_FALSE(ind.hasCost());
        EXPECT_TRUE(bm.isFeasible(ind.x));
        EXPECT_GE(ind.x.minCoeff(), 0.5);
        EXPECT_LE(ind.x.maxCoeff(), 1.2);
    }

    EXPECT_THROW(PopulationOperators::initialize(bm, std::nullopt, 0), InvalidParameterException);
    EXPECT_THROW(PopulationOperators::initialize(bm, Eigen::VectorXd(Eigen::VectorXd::Ones(3)), 4),
                 InvalidParameterException);
}
