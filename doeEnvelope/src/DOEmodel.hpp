/*
 * DOEmodel.hpp
 *
 * Optimization model of a dynamic operating envelope. Owns the CPLEX
 * environment for the lifetime of one computation.
 */

#ifndef DOEMODEL_HPP_
#define DOEMODEL_HPP_

#include <ilcplex/ilocplex.h>

#include "instance.hpp"
#include "solution.hpp"

using namespace std;

#ifndef NAMESIZE
#define NAMESIZE 128
#endif

/* [element][i][j] */
typedef IloArray< IloArray<IloNumVarArray> > VarGrid;

/* Decision variables and index sets of the model. Constraint families read
 * this record and never add to it; the only family owning a variable is the
 * DSO centre gap, which returns it to the caller. */
struct DOEvariables {
	VarGrid	theta;		// bus angle, free
	VarGrid	V;			// bus voltage magnitude, >= 0
	VarGrid	E;			// net bus injection component, free
	VarGrid	absE;		// |E| relaxation, >= 0
	VarGrid	F;			// line flow, free
	VarGrid	I;			// line current, free
	VarGrid	Pplus;		// parent exchange [parent slot][i][j]
	VarGrid	Pminus;		// child exchange [child slot][i][j]

	IloNumVarArray	PCmin;	// envelope per child slot, shared by every vertex
	IloNumVarArray	PCmax;
	IloNumVar		O;		// curtailment budget

	int numBus, numLine, numVertP, numVertV;
	vector<int> parents;	// slot -> bus index
	vector<int> children;

	int		parentSlot (int bus) const;
	int		childSlot (int bus) const;
	void	checkBus (int bus) const;
	void	checkLine (int line) const;

private:
	friend class DOEmodel;
	map<int, int> parentPos;
	map<int, int> childPos;
};

class DOEmodel {

public:
	DOEmodel(instance &inst, const SolverConfig &solverCfg);
	~DOEmodel();

	void		declareVariables(instance &inst);
	DOEresult	solve(instance &inst, const SolverConfig &solverCfg);

	IloEnv		env;
	IloModel	model;
	IloCplex	cplex;

	DOEvariables	vars;
	IloNumVarArray	gap;		// DSO centre gap per child slot, empty unless info_DSO is given

private:
	void		declareGrid(VarGrid &grid, const vector<string> &labels, double lb, const char *varName);
	SolveStatus	translateStatus(IloAlgorithm::Status algStatus, IloCplex::CplexStatus cplexStatus) const;
	void		recordSolution(instance &inst, DOEresult &result);
	void		currentResiduals(instance &inst, Diagnostics &diag);
};

#endif /* DOEMODEL_HPP_ */
