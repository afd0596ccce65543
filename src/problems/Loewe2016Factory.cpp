#include "problems/Loewe2016Factory.hpp"
#include "problems/StepProtocol.hpp"
#include "utils/ReadTimeSeries.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace ionbench {

Loewe2016Factory::Options::Options() = default;

Loewe2016Factory::Options Loewe2016Factory::Options::fromSettings(const std::map<std::string, double>& settings) {
    auto get = [&](const std::string& key, double def) {
        auto it = settings.find(key);
        return it != settings.end() ? it->second : def;
    };

    Options options;
    options.parameterSpaceWidth     = get("parameter_space_width", options.parameterSpaceWidth);
    options.useStandardBounds       = get("bounded", 1.0) != 0.0;
    options.useRateBounds           = get("rate_bounded", 1.0) != 0.0;
    options.useScaleFactors         = get("use_scale_factors", 0.0) != 0.0;
    options.useStandardLogTransform = get("log_transform", 0.0) != 0.0;
    options.costThreshold           = get("cost_threshold", options.costThreshold);

    if (!(options.parameterSpaceWidth > 0.0)) {
        THROW_CONFIGURATION_ERROR("Loewe2016Factory::Options::fromSettings", "parameter_space_width must be positive.");
    }
    return options;
}

Eigen::VectorXd Loewe2016Factory::ikrDefaultParameters() {
    Eigen::VectorXd p(IKrSimulator::NUM_PARAMETERS);
    p << 3e-4, 14.1, 5, 3.3328, 5.1237, 1, 14.1, 6.5, 15, 22.4, 0.029411765, 138.994;
    return p;
}

std::vector<bool> Loewe2016Factory::ikrAdditiveParameters() {
    return {false, true, false, true, false, false, true, false, true, false, false, false};
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> Loewe2016Factory::standardBounds(const Eigen::VectorXd& defaults,
                                                                             const std::vector<bool>& additive,
                                                                             double width) {
    if (static_cast<Eigen::Index>(additive.size()) != defaults.size()) {
        THROW_INVALID_PARAM("Loewe2016Factory::standardBounds", "Additive flags and defaults differ in length.");
    }
    Eigen::VectorXd lower(defaults.size());
    Eigen::VectorXd upper(defaults.size());
    for (Eigen::Index i = 0; i < defaults.size(); ++i) {
        if (additive[i]) {
            lower[i] = defaults[i] - 60.0 * width;
            upper[i] = defaults[i] + 60.0 * width;
        } else {
            lower[i] = defaults[i] * std::pow(10.0, -width);
            upper[i] = defaults[i] * std::pow(10.0, width);
        }
    }
    return {lower, upper};
}

std::vector<RateFunction> Loewe2016Factory::ikrRateFunctions(double vLow, double vHigh) {
    RateFunction alpha;
    alpha.name = "alpha_xr";
    alpha.polarity = RatePolarity::POSITIVE;
    alpha.rate = [](const Eigen::VectorXd& p, double V) { return IKrSimulator::alpha(p, V); };
    alpha.voltages = {alpha.extremeVoltage(vLow, vHigh)};

    RateFunction beta;
    beta.name = "beta_xr";
    beta.polarity = RatePolarity::NEGATIVE;
    beta.rate = [](const Eigen::VectorXd& p, double V) { return IKrSimulator::beta(p, V); };
    beta.voltages = {beta.extremeVoltage(vLow, vHigh)};

    return {alpha, beta};
}

BenchmarkerConfig Loewe2016Factory::createIKrConfig(const Options& options, IKrSimulator& simulator) {
    const std::string F_NAME = "Loewe2016Factory::createIKrConfig";
    const StepProtocol& protocol = simulator.protocol();

    BenchmarkerConfig config;
    config.name = "loewe2016.ikr";
    config.defaultParams = ikrDefaultParameters();
    config.trueParams = config.defaultParams;
    config.additiveParams = ikrAdditiveParameters();
    config.parameterSpaceWidth = options.parameterSpaceWidth;
    config.samplingMode = SamplingMode::LogUniformAroundDefault;
    config.costThreshold = options.costThreshold;
    config.useScaleFactors = options.useScaleFactors;

    if (options.useStandardLogTransform) {
        config.logTransformParams.resize(config.additiveParams.size());
        for (std::size_t i = 0; i < config.additiveParams.size(); ++i) {
            config.logTransformParams[i] = !config.additiveParams[i];
        }
    }

    if (options.useStandardBounds) {
        auto bounds = standardBounds(config.defaultParams, config.additiveParams, options.parameterSpaceWidth);
        config.lowerBounds = bounds.first;
        config.upperBounds = bounds.second;
    }

    if (options.useRateBounds) {
        RateBounds rateBounds;
        rateBounds.rateMin = RATE_MIN;
        rateBounds.rateMax = RATE_MAX;
        rateBounds.vLow = protocol.minVoltage();
        rateBounds.vHigh = protocol.maxVoltage();
        rateBounds.functions = ikrRateFunctions(rateBounds.vLow, rateBounds.vHigh);
        config.rateBounds = rateBounds;
    }

    std::vector<double> t = protocol.samplingTimes(SAMPLING_INTERVAL);
    config.times = Eigen::Map<const Eigen::VectorXd>(t.data(), static_cast<Eigen::Index>(t.size()));

    if (options.dataPath.empty()) {
        config.data = simulator.simulate(config.trueParams, config.times);
        Logger::getInstance().info(F_NAME, "Generated " + std::to_string(config.data.size()) +
                                           " reference points from the true parameters.");
    } else {
        config.data = readVectorFromCSV(options.dataPath, static_cast<int>(config.times.size()));
        Logger::getInstance().info(F_NAME, "Loaded reference data from " + options.dataPath);
    }
    return config;
}

std::unique_ptr<Benchmarker> Loewe2016Factory::createIKr(const Options& options, unsigned int seed) {
    auto simulator = std::make_shared<IKrSimulator>(StepProtocol::loewe2016());
    BenchmarkerConfig config = createIKrConfig(options, *simulator);
    return std::make_unique<Benchmarker>(std::move(config), simulator, seed);
}

} // namespace ionbench
