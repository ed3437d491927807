/*
 * objective.cpp
 */

#include "objective.hpp"
#include "errors.hpp"

void buildGlobalSum (DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log) {
	IloEnv env = doe.env;
	const DOEvariables &vars = doe.vars;

	IloExpr envelope (env);
	for (unsigned int k=0; k<vars.children.size(); k++) {
		int c = vars.childSlot(vars.children[k]);
		envelope += vars.PCmax[c] - vars.PCmin[c];
	}
	envelope -= params.alpha * vars.O;

	if ( doe.gap.getImpl() != NULL ) {
		for (IloInt c=0; c<doe.gap.getSize(); c++)
			envelope -= params.beta * doe.gap[c];
	}

	IloObjective obj = IloMaximize(env, envelope, "globalSum");
	doe.model.add(obj);
	envelope.end();

	log << "Objective global_sum with alpha = " << params.alpha << endl;
}

void buildFairness (DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log) {
	throw NotImplementedError("objective fairness");
}

double checkAbsRelaxationTightness (IloCplex &cplex, const DOEvariables &vars, const instance &data, vector<string> &violations) {
	double maxGap = 0.0;

	for (int n=0; n<vars.numBus; n++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				double gap = cplex.getValue(vars.absE[n][i][j]) - fabs(cplex.getValue(vars.E[n][i][j]));
				maxGap = max(maxGap, gap);
				if ( gap > relaxationTol )
					violations.push_back("absE(" + data.powSys->buses[n].name + ")(" + numToStr(i) + ")(" + numToStr(j) + ")");
			}
		}
	}

	return maxGap;
}
