/*
 * DOEmodel.cpp
 *
 * Variable declaration, solve and solution extraction of the envelope model.
 */

#include "misc.hpp"
#include "errors.hpp"
#include "DOEmodel.hpp"
#include "objective.hpp"

int DOEvariables::parentSlot(int bus) const {
	map<int, int>::const_iterator it = parentPos.find(bus);
	if ( it == parentPos.end() )
		throw ConfigurationError("bus " + numToStr(bus) + " is not a parent of the model");
	return it->second;
}

int DOEvariables::childSlot(int bus) const {
	map<int, int>::const_iterator it = childPos.find(bus);
	if ( it == childPos.end() )
		throw ConfigurationError("bus " + numToStr(bus) + " is not a child of the model");
	return it->second;
}

void DOEvariables::checkBus(int bus) const {
	if ( bus < 0 || bus >= numBus )
		throw ConfigurationError("bus index " + numToStr(bus) + " is not declared in the model");
}

void DOEvariables::checkLine(int line) const {
	if ( line < 0 || line >= numLine )
		throw ConfigurationError("line index " + numToStr(line) + " is not declared in the model");
}

/****************************************************************************
 * DOEmodel
 * - Acquires the CPLEX session. Licence or connection failures are raised as
 * SolverError, the environment is released before leaving.
 ****************************************************************************/
DOEmodel::DOEmodel(instance &inst, const SolverConfig &solverCfg) {

	try {
		model = IloModel(env);
		cplex = IloCplex(model);
	}
	catch (IloException &e) {
		string msg = e.getMessage();
		env.end();
		if ( solverCfg.licenseKey.empty() )
			msg += " (CPLEX_STUDIO_KEY is not set)";
		throw SolverError("could not create the CPLEX session: " + msg);
	}

	cplex.setOut( inst.out() );
	cplex.setWarning( inst.out() );
}

DOEmodel::~DOEmodel() {
	env.end();
}

/****************************************************************************
 * declareVariables
 * - Declares every decision variable over the vertex grid. No constraint is
 * attached here, every limit is a row of a constraint family.
 ****************************************************************************/
void DOEmodel::declareVariables(instance &inst) {
	char elemName[NAMESIZE];
	PowSys *powSys = inst.powSys;

	vars.numBus = powSys->numBus;
	vars.numLine = powSys->numLine;
	vars.numVertP = inst.params.numVertP;
	vars.numVertV = inst.params.numVertV;
	vars.parents = powSys->parents;
	vars.children = powSys->children;

	vars.parentPos.clear();
	vars.childPos.clear();
	for (unsigned int p=0; p<vars.parents.size(); p++)
		vars.parentPos.insert( pair<int, int> (vars.parents[p], p) );
	for (unsigned int c=0; c<vars.children.size(); c++)
		vars.childPos.insert( pair<int, int> (vars.children[c], c) );

	vector<string> busNames, lineNames, parentNames, childNames;
	for (int b=0; b<vars.numBus; b++)
		busNames.push_back(powSys->buses[b].name);
	for (int l=0; l<vars.numLine; l++)
		lineNames.push_back(powSys->lines[l].name);
	for (unsigned int p=0; p<vars.parents.size(); p++)
		parentNames.push_back(powSys->buses[vars.parents[p]].name);
	for (unsigned int c=0; c<vars.children.size(); c++)
		childNames.push_back(powSys->buses[vars.children[c]].name);

	/**** Vertex dependent variables ****/
	declareGrid(vars.theta,	busNames,	-IloInfinity,	"theta");
	declareGrid(vars.V,		busNames,	0,				"V");
	declareGrid(vars.E,		busNames,	-IloInfinity,	"E");
	declareGrid(vars.absE,	busNames,	0,				"absE");
	declareGrid(vars.F,		lineNames,	-IloInfinity,	"F");
	declareGrid(vars.I,		lineNames,	-IloInfinity,	"I");
	declareGrid(vars.Pplus,	parentNames, -IloInfinity,	"Pplus");
	declareGrid(vars.Pminus, childNames, -IloInfinity,	"Pminus");

	/**** Shared variables ****/
	int numChild = (int) vars.children.size();
	vars.PCmin = IloNumVarArray(env, numChild, -IloInfinity, IloInfinity, ILOFLOAT);
	vars.PCmax = IloNumVarArray(env, numChild, -IloInfinity, IloInfinity, ILOFLOAT);
	for (int c=0; c<numChild; c++) {
		snprintf(elemName, NAMESIZE, "PCmin(%s)", childNames[c].c_str());
		vars.PCmin[c].setName(elemName);
		snprintf(elemName, NAMESIZE, "PCmax(%s)", childNames[c].c_str());
		vars.PCmax[c].setName(elemName);
	}
	model.add(vars.PCmin); model.add(vars.PCmax);

	double maxO = inst.params.isSet(inst.params.curtailmentLimit) ? inst.params.curtailmentLimit : IloInfinity;
	vars.O = IloNumVar(env, 0, maxO, ILOFLOAT, "O");
	model.add(vars.O);

	inst.out() << "Declared " << cplex.getNcols() << " variables over a " << vars.numVertP << " x " << vars.numVertV << " vertex grid." << endl;
}//END declareVariables()

void DOEmodel::declareGrid(VarGrid &grid, const vector<string> &labels, double lb, const char *varName) {
	char elemName[NAMESIZE];
	int size = (int) labels.size();

	grid = VarGrid(env, size);
	for (int k=0; k<size; k++) {
		grid[k] = IloArray<IloNumVarArray> (env, vars.numVertP);
		for (int i=0; i<vars.numVertP; i++) {
			grid[k][i] = IloNumVarArray(env, vars.numVertV, lb, IloInfinity, ILOFLOAT);
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "%s(%s)(%d)(%d)", varName, labels[k].c_str(), i, j);
				grid[k][i][j].setName(elemName);
			}
			model.add(grid[k][i]);
		}
	}
}

/****************************************************************************
 * solve
 * - Solves the model and packages the outcome. Every solver outcome, an
 * exception raised by CPLEX included, is reported through the status.
 ****************************************************************************/
DOEresult DOEmodel::solve(instance &inst, const SolverConfig &solverCfg) {
	DOEresult result;

	try {
		if ( solverCfg.timeLimit > 0 )
			cplex.setParam(IloCplex::TiLim, solverCfg.timeLimit);
		cplex.setParam(IloCplex::Threads, solverCfg.threads);
		if ( solverCfg.deterministic )
			cplex.setParam(IloCplex::ParallelMode, IloCplex::Deterministic);
		cplex.setParam(IloCplex::EpOpt, solverCfg.optimalityTol);

		if ( !solverCfg.exportPath.empty() )
			cplex.exportModel(solverCfg.exportPath.c_str());

		result.diagnostics.numRows = cplex.getNrows();
		result.diagnostics.numCols = cplex.getNcols();

		double startTime = get_wall_time();
		bool status = cplex.solve();
		result.diagnostics.solveTime = get_wall_time() - startTime;
		result.diagnostics.iterations = cplex.getNiterations();

		IloCplex::CplexStatus cplexStatus = cplex.getCplexStatus();
		ostringstream ss;
		ss << cplexStatus;
		result.diagnostics.cplexStatus = ss.str();
		result.status = translateStatus(cplex.getStatus(), cplexStatus);

		inst.out() << "Optimization is completed with status " << cplexStatus << endl;

		if ( status && (result.status == OPTIMAL || result.status == FEASIBLE
				|| result.status == TIME_LIMIT || result.status == ITERATION_LIMIT) ) {
			recordSolution(inst, result);
		}
	}
	catch (IloException &e) {
		result.status = SOLVER_FAILURE;
		result.hasSolution = false;
		result.objectiveValue = NaN;
		result.curtailmentReport = NaN;
		result.envelopes.clear();
		result.diagnostics.message = e.getMessage();
		inst.out() << "CPLEX exception: " << e << endl;
	}

	return result;
}//END solve()

SolveStatus DOEmodel::translateStatus(IloAlgorithm::Status algStatus, IloCplex::CplexStatus cplexStatus) const {

	if ( cplexStatus == IloCplex::AbortTimeLim )
		return TIME_LIMIT;
	if ( cplexStatus == IloCplex::AbortItLim )
		return ITERATION_LIMIT;
	if ( cplexStatus == IloCplex::OptimalInfeas || cplexStatus == IloCplex::NumBest )
		return NUMERICAL_FAILURE;

	switch (algStatus) {
	case IloAlgorithm::Optimal:					return OPTIMAL;
	case IloAlgorithm::Feasible:				return FEASIBLE;
	case IloAlgorithm::Infeasible:				return INFEASIBLE;
	case IloAlgorithm::Unbounded:				return UNBOUNDED;
	case IloAlgorithm::InfeasibleOrUnbounded:	return INF_OR_UNBD;
	case IloAlgorithm::Error:					return SOLVER_FAILURE;
	default:
		break;
	}

	if ( cplexStatus == IloCplex::Infeasible )	return INFEASIBLE;
	if ( cplexStatus == IloCplex::Unbounded )	return UNBOUNDED;
	if ( cplexStatus == IloCplex::InfOrUnbd )	return INF_OR_UNBD;

	return NUMERICAL_FAILURE;
}

/****************************************************************************
 * recordSolution
 * - Envelope, curtailment budget and the post-solve checks of the relaxation
 * and of the current definition.
 ****************************************************************************/
void DOEmodel::recordSolution(instance &inst, DOEresult &result) {

	result.hasSolution = true;
	result.objectiveValue = cplex.getObjValue();
	result.curtailmentReport = cplex.getValue(vars.O);

	for (unsigned int c=0; c<vars.children.size(); c++) {
		string childName = inst.powSys->buses[vars.children[c]].name;
		result.envelopes[childName] = make_pair( cplex.getValue(vars.PCmin[c]), cplex.getValue(vars.PCmax[c]) );
	}

	result.diagnostics.maxAbsGap = checkAbsRelaxationTightness(cplex, vars, inst, result.diagnostics.relaxationViolations);
	if ( !result.diagnostics.relaxationViolations.empty() ) {
		inst.out() << "Warning: |E| relaxation is not tight at " << result.diagnostics.relaxationViolations.size()
				<< " entries, largest gap " << result.diagnostics.maxAbsGap << endl;
	}

	currentResiduals(inst, result.diagnostics);
}

/* The current definition is stated for every (bus, line) pair; the residuals
 * are kept apart for endpoint and non-endpoint buses. */
void DOEmodel::currentResiduals(instance &inst, Diagnostics &diag) {
	double incident = 0.0, nonIncident = 0.0;
	bool anyIncident = false, anyNonIncident = false;

	for (int l=0; l<vars.numLine; l++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				double res = fabs( cplex.getValue(vars.I[l][i][j]) * inst.params.voltageVertex(j) - cplex.getValue(vars.F[l][i][j]) );
				for (int n=0; n<vars.numBus; n++) {
					if ( inst.isIncident(n, l) ) {
						incident = max(incident, res);
						anyIncident = true;
					}
					else {
						nonIncident = max(nonIncident, res);
						anyNonIncident = true;
					}
				}
			}
		}
	}

	diag.maxCurrentResidualIncident = anyIncident ? incident : NaN;
	diag.maxCurrentResidualNonIncident = anyNonIncident ? nonIncident : NaN;
}
