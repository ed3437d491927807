/*
 * registry.cpp
 */

#include "registry.hpp"
#include "constraints.hpp"
#include "objective.hpp"
#include "errors.hpp"

PowerflowMode parsePowerflowMode (const string &name) {
	if ( name == "dc" )	return DC;
	if ( name == "ac" )	return AC;
	throw ConfigurationError("unknown power flow mode '" + name + "'");
}

ObjectiveType parseObjectiveType (const string &name) {
	if ( name == "global_sum" )	return GLOBAL_SUM;
	if ( name == "fairness" )	return FAIRNESS;
	throw ConfigurationError("unknown objective '" + name + "'");
}

ModelBuilder selectPowerflowBuilder (PowerflowMode mode) {
	switch (mode) {
	case DC:
		return &buildDCPowerflow;
	case AC:
		throw NotImplementedError("AC power flow");
	}
	throw ConfigurationError("unknown power flow mode");
}

ModelBuilder selectObjectiveBuilder (ObjectiveType type) {
	switch (type) {
	case GLOBAL_SUM:
		return &buildGlobalSum;
	case FAIRNESS:
		throw NotImplementedError("fairness objective");
	}
	throw ConfigurationError("unknown objective");
}
