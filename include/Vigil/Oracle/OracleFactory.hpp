/**
 * @file OracleFactory.hpp
 * @brief Builds the default oracle registry from configuration
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#pragma once

#ifndef VIGIL_ORACLE_ORACLE_FACTORY_HPP
#define VIGIL_ORACLE_ORACLE_FACTORY_HPP

#include <Vigil/Core/Config.hpp>
#include <Vigil/Oracle/OracleRegistry.hpp>
#include <memory>

namespace Vigil::Oracle {

/**
 * @brief Registry in the order BoolJudgement, InfiniteLoop, PrecisionLoss,
 *        TypeConversion, Overflow, TypedBug
 *
 * Disabled oracles stay registered (and are skipped) so positions do not
 * depend on configuration.
 */
std::unique_ptr<OracleRegistry> buildOracleRegistry(const Config::OracleConfig& config);

} // namespace Vigil::Oracle

#endif // VIGIL_ORACLE_ORACLE_FACTORY_HPP
