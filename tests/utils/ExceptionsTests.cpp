#include "exceptions/CSVReadException.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace ionbench;

TEST(ExceptionsTest, MacroAddsLocationAndCategory) {
    try {
        THROW_CONFIGURATION_ERROR("Benchmarker::validateConfig", "Gradient step must be positive.");
        FAIL() << "Expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("ExceptionsTests.cpp:"), std::string::npos);
        EXPECT_NE(what.find("[Benchmarker::validateConfig] Configuration Error: Gradient step"), std::string::npos);
        EXPECT_EQ(e.functionName(), "Benchmarker::validateConfig");
        EXPECT_EQ(e.category(), "Configuration Error");
    }
}

TEST(ExceptionsTest, PlainConstructorHasNoLocation) {
    SimulationException e("IKrSimulator::simulate", "solver diverged");
    EXPECT_STREQ(e.what(), "[IKrSimulator::simulate] Simulation Error: solver diverged");
    EXPECT_EQ(e.category(), "Simulation Error");
}

TEST(ExceptionsTest, EveryTypeDerivesFromBenchmarkException) {
    EXPECT_THROW(THROW_INVALID_PARAM("f", "m"), BenchmarkException);
    EXPECT_THROW(THROW_SIMULATION_ERROR("f", "m"), BenchmarkException);
    EXPECT_THROW(THROW_DOMAIN_ERROR("f", "m"), BenchmarkException);
    EXPECT_THROW(THROW_OUT_OF_RANGE("f", "m"), std::runtime_error);
    EXPECT_THROW(throw FileIOException("f", "m"), BenchmarkException);
    EXPECT_THROW(throw DataFormatException("f", "m"), BenchmarkException);
    EXPECT_THROW(throw CSVReadException(CSVReadException::ErrorType::NoDataRows, "f", ""), DataFormatException);
}

TEST(ExceptionsTest, CategoriesAreDistinct) {
    EXPECT_EQ(InvalidParameterException("f", "m").category(), "Invalid Parameter");
    EXPECT_EQ(TransformDomainException("f", "m").category(), "Transform Domain Error");
    EXPECT_EQ(OutOfRangeException(__FILE__, __LINE__, "f", "m").category(), "Out Of Range");
    EXPECT_EQ(FileIOException("f", "m").category(), "File IO Error");
    EXPECT_EQ(DataFormatException("f", "m").category(), "Data Format Error");
    CSVReadException csv(CSVReadException::ErrorType::NonFiniteValue, "readVectorFromCSV", "row 3");
    EXPECT_EQ(csv.category(), "Data Format Error");
    EXPECT_NE(std::string(csv.what()).find("Non-finite data value: row 3"), std::string::npos);
}
