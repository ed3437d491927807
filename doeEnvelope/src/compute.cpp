/*
 * compute.cpp
 */

#include "compute.hpp"
#include "registry.hpp"
#include "constraints.hpp"
#include "DOEmodel.hpp"
#include "instance.hpp"
#include "errors.hpp"

DOEresult compute (const PowSys &powSys, const string &mode, const string &objective,
		const DOEparams &params, const SolverConfig &solverCfg) {

	validateParams(params);

	ModelBuilder powerflowBuilder = selectPowerflowBuilder( parsePowerflowMode(mode) );
	ModelBuilder objectiveBuilder = selectObjectiveBuilder( parseObjectiveType(objective) );

	// the topology is built on a copy, the caller's network stays editable
	PowSys network = params.operationalNodes.empty() ? powSys : powSys.subnetwork(params.operationalNodes);

	instance inst;
	inst.initialize(&network, params, &powSys);
	if ( !solverCfg.logPath.empty() && !inst.openLogFile(solverCfg.logPath) )
		perror(("Warning:: could not open the solver log " + solverCfg.logPath + ", logging is disabled.\n").c_str());

	DOEresult result;
	{
		DOEmodel doe(inst, solverCfg);

		try {
			doe.declareVariables(inst);
			powerflowBuilder(doe, inst, inst.params, inst.out());
			attachSecurityConstraints(doe, inst, inst.params, inst.out());
			objectiveBuilder(doe, inst, inst.params, inst.out());
		}
		catch (IloException &e) {
			throw SolverError(string("model construction failed: ") + e.getMessage());
		}

		result = doe.solve(inst, solverCfg);
	}

	inst.closeLogFile();
	return result;
}
