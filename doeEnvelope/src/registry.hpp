/*
 * registry.hpp
 *
 * Closed dispatch from mode and objective names to model builders.
 */

#ifndef REGISTRY_HPP_
#define REGISTRY_HPP_

#include <string>
#include <ostream>

#include "config.hpp"

class DOEmodel;
class instance;

typedef void (*ModelBuilder) (DOEmodel &doe, const instance &data, const DOEparams &params, std::ostream &log);

PowerflowMode	parsePowerflowMode (const std::string &name);
ObjectiveType	parseObjectiveType (const std::string &name);

/* Both throw NotImplementedError for a declared mode without a builder. */
ModelBuilder	selectPowerflowBuilder (PowerflowMode mode);
ModelBuilder	selectObjectiveBuilder (ObjectiveType type);

#endif /* REGISTRY_HPP_ */
