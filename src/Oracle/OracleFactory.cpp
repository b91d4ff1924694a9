/**
 * @file OracleFactory.cpp
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Oracle/OracleFactory.hpp>
#include <Vigil/Oracle/BoolJudgementOracle.hpp>
#include <Vigil/Oracle/InfiniteLoopOracle.hpp>
#include <Vigil/Oracle/OverflowOracle.hpp>
#include <Vigil/Oracle/PrecisionLossOracle.hpp>
#include <Vigil/Oracle/TypeConversionOracle.hpp>
#include <Vigil/Oracle/TypedBugOracle.hpp>

namespace Vigil::Oracle {

std::unique_ptr<OracleRegistry> buildOracleRegistry(const Config::OracleConfig& config) {
    auto registry = std::make_unique<OracleRegistry>();
    const bool on = !config.disableDefects;

    TypedBugOracle::Options typedBug;
    typedBug.mode = config.typedBugMode == Config::TypedBugMode::Event
        ? TypedBugOracle::Mode::EventSignal
        : TypedBugOracle::Mode::AbortCode;
    typedBug.sentinelAbortCode = config.sentinelAbortCode;
    typedBug.markerModule = config.markerModule;
    typedBug.markerEvent = config.markerEvent;

    registry->registerOracle(std::make_unique<BoolJudgementOracle>(config.formulaNodeCap),
                             on && config.boolJudgement);
    registry->registerOracle(std::make_unique<InfiniteLoopOracle>(config.loopThreshold),
                             on && config.infiniteLoop);
    registry->registerOracle(std::make_unique<PrecisionLossOracle>(config.formulaNodeCap),
                             on && config.precisionLoss);
    registry->registerOracle(std::make_unique<TypeConversionOracle>(),
                             on && config.typeConversion);
    registry->registerOracle(std::make_unique<OverflowOracle>(),
                             on && config.overflow);
    registry->registerOracle(std::make_unique<TypedBugOracle>(std::move(typedBug)),
                             on && config.typedBug);
    return registry;
}

} // namespace Vigil::Oracle
