#include "benchmarker/ParameterTransform.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace ionbench;

class ParameterTransformTest : public ::testing::Test {
protected:
    Eigen::VectorXd defaults;
    Eigen::VectorXd candidate;

    void SetUp() override {
        defaults.resize(3);
        defaults << 2.0, 0.5, -4.0;
        candidate.resize(3);
        candidate << 3.0, 0.25, -1.0;
    }
};

TEST_F(ParameterTransformTest, IdentityByDefault) {
    Eigen::VectorXd d(2);
    d << 1.0, 2.0;
    ParameterTransform transform(d);

    EXPECT_TRUE(transform.isIdentity());
    EXPECT_TRUE(transform.toInput(d).isApprox(d));
    EXPECT_TRUE(transform.toOriginal(d).isApprox(d));
}

TEST_F(ParameterTransformTest, ScaleFactorSingleParameter) {
    Eigen::VectorXd d(1);
    d << 2.0;
    ParameterTransform transform(d, true);

    Eigen::VectorXd expectedInput(1);
    expectedInput << 1.0;
    EXPECT_DOUBLE_EQ(transform.toInput(d)[0], 1.0);
    EXPECT_DOUBLE_EQ(transform.toOriginal(expectedInput)[0], 2.0);
    EXPECT_FALSE(transform.isIdentity());
}

TEST_F(ParameterTransformTest, LogThenScaleOrdering) {
    ParameterTransform transform(defaults, true, {true, true, false});
    Eigen::VectorXd input = transform.toInput(candidate);

    EXPECT_NEAR(input[0], std::log(1.5), 1e-12);
    EXPECT_NEAR(input[1], std::log(0.5), 1e-12);
    EXPECT_NEAR(input[2], 0.25, 1e-12);
}

TEST_F(ParameterTransformTest, RoundTripForEveryFlagCombination) {
    for (int scale = 0; scale < 2; ++scale) {
        for (int mask = 0; mask < 4; ++mask) {
            std::vector<bool> logFlags = {(mask & 1) != 0, (mask & 2) != 0, false};
            ParameterTransform transform(defaults, scale == 1, logFlags);

            Eigen::VectorXd back = transform.toOriginal(transform.toInput(candidate));
            for (int i = 0; i < 3; ++i) {
                EXPECT_NEAR(back[i], candidate[i], 1e-12 * std::abs(candidate[i]))
                    << "scale=" << scale << " mask=" << mask << " index=" << i;
            }
        }
    }
}

TEST_F(ParameterTransformTest, LogOfNonPositiveValueThrows) {
    ParameterTransform transform(defaults, false, {false, false, true});
    EXPECT_THROW(transform.toInput(candidate), TransformDomainException);

    // Scaling by a negative default makes the value positive again.
    ParameterTransform scaled(defaults, true, {false, false, true});
    EXPECT_NO_THROW(scaled.toInput(candidate));
}

TEST_F(ParameterTransformTest, SizeMismatchThrows) {
    ParameterTransform transform(defaults);
    Eigen::VectorXd shortVector(2);
    shortVector << 1.0, 2.0;

    EXPECT_THROW(transform.toInput(shortVector), InvalidParameterException);
    EXPECT_THROW(transform.toOriginal(shortVector), InvalidParameterException);
}

TEST_F(ParameterTransformTest, ZeroDefaultRejectsScaleFactors) {
    Eigen::VectorXd d(2);
    d << 1.0, 0.0;
    EXPECT_THROW(ParameterTransform(d, true), ConfigurationException);

    ParameterTransform transform(d);
    EXPECT_THROW(transform.setUseScaleFactors(true), ConfigurationException);
    EXPECT_FALSE(transform.usesScaleFactors());
}

TEST_F(ParameterTransformTest, WrongLogFlagCountThrows) {
    EXPECT_THROW(ParameterTransform(defaults, false, {true}), ConfigurationException);
}

TEST_F(ParameterTransformTest, BoundsToInputKeepsOrderWithNegativeScale) {
    ParameterTransform transform(defaults, true);
    Eigen::VectorXd lb(3), ub(3);
    lb << 1.0, 0.1, -8.0;
    ub << 4.0, 1.0, -2.0;

    auto bounds = transform.boundsToInput(lb, ub);
    EXPECT_NEAR(bounds.first[0], 0.5, 1e-12);
    EXPECT_NEAR(bounds.second[0], 2.0, 1e-12);
    EXPECT_NEAR(bounds.first[2], 0.5, 1e-12);
    EXPECT_NEAR(bounds.second[2], 2.0, 1e-12);
    EXPECT_TRUE((bounds.first.array() <= bounds.second.array()).all());
}

TEST_F(ParameterTransformTest, BoundsToInputUnderLogTransform) {
    ParameterTransform transform(defaults, false, {true, true, false});
    const double inf = std::numeric_limits<double>::infinity();
    Eigen::VectorXd lb(3), ub(3);
    lb << 0.0, 0.1, -inf;
    ub << 10.0, inf, inf;

    auto bounds = transform.boundsToInput(lb, ub);
    EXPECT_EQ(bounds.first[0], -inf);
    EXPECT_NEAR(bounds.second[0], std::log(10.0), 1e-12);
    EXPECT_NEAR(bounds.first[1], std::log(0.1), 1e-12);
    EXPECT_EQ(bounds.second[1], inf);

    ub[0] = 0.0;
    EXPECT_THROW(transform.boundsToInput(lb, ub), ConfigurationException);
}
