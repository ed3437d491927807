/*
 * compute.hpp
 *
 * Single entry point of an envelope computation.
 */

#ifndef COMPUTE_HPP_
#define COMPUTE_HPP_

#include <string>

#include "config.hpp"
#include "solution.hpp"
#include "./powerSys/PowSys.hpp"

/* Validates the inputs, builds the topology of a copy of powSys (restricted to
 * the operational buses when given), the PTDF and the model, solves it and
 * returns the result. Configuration and unimplemented selections throw
 * before a model exists; every solver outcome is a status of the result. */
DOEresult compute (const PowSys &powSys, const std::string &mode, const std::string &objective,
		const DOEparams &params, const SolverConfig &solverCfg);

#endif /* COMPUTE_HPP_ */
