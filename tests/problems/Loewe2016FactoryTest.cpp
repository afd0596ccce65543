#include "problems/Loewe2016Factory.hpp"
#include "exceptions/CSVReadException.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace ionbench;
namespace fs = std::filesystem;

class Loewe2016FactoryTest : public ::testing::Test {
protected:
    static std::unique_ptr<Benchmarker> bm;

    static void SetUpTestSuite() {
        bm = Loewe2016Factory::createIKr();
    }

    static void TearDownTestSuite() {
        bm.reset();
    }
};

std::unique_ptr<Benchmarker> Loewe2016FactoryTest::bm;

TEST_F(Loewe2016FactoryTest, ProblemShape) {
    EXPECT_EQ(bm->name(), "loewe2016.ikr");
    EXPECT_EQ(bm->nParameters(), 12);
    EXPECT_EQ(bm->times().size(), 21320);
    EXPECT_EQ(bm->data().size(), 21320);
    EXPECT_DOUBLE_EQ(bm->times()[1] - bm->times()[0], Loewe2016Factory::SAMPLING_INTERVAL);
    EXPECT_TRUE(bm->bounds().isBounded());
    EXPECT_TRUE(bm->bounds().isRateBounded());
}

TEST_F(Loewe2016FactoryTest, DefaultsAreFeasibleAndFitExactly) {
    const Eigen::VectorXd x = bm->originalToInput(bm->defaultParams());
    EXPECT_TRUE(bm->bounds().inRateBounds(bm->defaultParams()));
    EXPECT_TRUE(bm->isFeasible(x));
    EXPECT_NEAR(bm->cost(x), 0.0, 1e-12);
    EXPECT_TRUE(bm->isConverged());
}

TEST_F(Loewe2016FactoryTest, RateBoundsRejectSlowGates) {
    Eigen::VectorXd p = bm->defaultParams();
    p[0] = 1e-8;
    EXPECT_LT(IKrSimulator::alpha(p, 50.0), Loewe2016Factory::RATE_MIN);
    EXPECT_FALSE(bm->bounds().inRateBounds(p));

    const int solves = bm->tracker().solveCount();
    EXPECT_EQ(bm->cost(bm->originalToInput(p)), std::numeric_limits<double>::infinity());
    EXPECT_EQ(bm->tracker().solveCount(), solves);
}

TEST_F(Loewe2016FactoryTest, StandardBounds) {
    auto bounds = Loewe2016Factory::standardBounds(Loewe2016Factory::ikrDefaultParameters(),
                                                   Loewe2016Factory::ikrAdditiveParameters(), 1.0);
    EXPECT_NEAR(bounds.first[0], 3e-5, 1e-18);
    EXPECT_NEAR(bounds.second[0], 3e-3, 1e-15);
    EXPECT_DOUBLE_EQ(bounds.first[1], 14.1 - 60.0);
    EXPECT_DOUBLE_EQ(bounds.second[1], 14.1 + 60.0);

    auto wide = Loewe2016Factory::standardBounds(Loewe2016Factory::ikrDefaultParameters(),
                                                 Loewe2016Factory::ikrAdditiveParameters(), 2.0);
    EXPECT_DOUBLE_EQ(wide.second[3], 3.3328 + 120.0);
    EXPECT_NEAR(wide.first[2], 0.05, 1e-12);
}

TEST_F(Loewe2016FactoryTest, SamplesRespectParameterBounds) {
    for (const auto& x : bm->sample(20)) {
        EXPECT_TRUE(bm->bounds().inParameterBounds(bm->inputToOriginal(x)));
    }
}

TEST_F(Loewe2016FactoryTest, OptionsFromSettings) {
    Loewe2016Factory::Options options = Loewe2016Factory::Options::fromSettings(
        {{"parameter_space_width", 2.0}, {"bounded", 0.0}, {"log_transform", 1.0}, {"cost_threshold", 0.5}});
    EXPECT_DOUBLE_EQ(options.parameterSpaceWidth, 2.0);
    EXPECT_FALSE(options.useStandardBounds);
    EXPECT_TRUE(options.useRateBounds);
    EXPECT_TRUE(options.useStandardLogTransform);
    EXPECT_FALSE(options.useScaleFactors);
    EXPECT_DOUBLE_EQ(options.costThreshold, 0.5);

    EXPECT_THROW(Loewe2016Factory::Options::fromSettings({{"parameter_space_width", 0.0}}), ConfigurationException);
}

TEST_F(Loewe2016FactoryTest, LogTransformedVariant) {
    Loewe2016Factory::Options options;
    options.useStandardLogTransform = true;
    options.useScaleFactors = true;
    auto logBm = Loewe2016Factory::createIKr(options);

    const Eigen::VectorXd x = logBm->originalToInput(logBm->defaultParams());
    EXPECT_NEAR(x[0], 0.0, 1e-12);
    EXPECT_NEAR(x[1], 1.0, 1e-12);
    EXPECT_LT(logBm->cost(x), 1e-6);

    auto inputBounds = logBm->inputBounds();
    EXPECT_NEAR(inputBounds.first[0], std::log(0.1), 1e-12);
    EXPECT_NEAR(inputBounds.second[0], std::log(10.0), 1e-12);
}

TEST_F(Loewe2016FactoryTest, ReferenceDataFromFile) {
    const fs::path dir = fs::temp_directory_path() / "ionbench_loewe_test";
    fs::create_directories(dir);

    const fs::path good = dir / "data.csv";
    {
        std::ofstream out(good);
        out << "// current\n";
        for (Eigen::Index k = 0; k < bm->data().size(); ++k) {
            out << (k % 2 == 0 ? 0.0 : 1.0) << "\n";
        }
    }
    const fs::path shortFile = dir / "short.csv";
    {
        std::ofstream out(shortFile);
        out << "0.0\n1.0\n";
    }

    Loewe2016Factory::Options options;
    options.dataPath = good.string();
    auto fromFile = Loewe2016Factory::createIKr(options);
    EXPECT_DOUBLE_EQ(fromFile->data()[1], 1.0);

    options.dataPath = shortFile.string();
    EXPECT_THROW(Loewe2016Factory::createIKr(options), CSVReadException);

    fs::remove_all(dir);
}
