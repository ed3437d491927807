//
//  solution.hpp
//  DOE-Envelope
//

#ifndef solution_hpp
#define solution_hpp

#include <stdio.h>
#include <vector>
#include <map>
#include <string>

#include "misc.hpp"
#include "config.hpp"

enum SolveStatus {
	OPTIMAL,
	FEASIBLE,				// a solution exists, optimality not proven
	INFEASIBLE,
	UNBOUNDED,
	INF_OR_UNBD,
	TIME_LIMIT,
	ITERATION_LIMIT,
	NUMERICAL_FAILURE,
	SOLVER_FAILURE				// CPLEX raised an exception during the solve
};

string statusName (SolveStatus status);

struct Diagnostics {
	Diagnostics () : solveTime(NaN), iterations(0), numRows(0), numCols(0),
		maxAbsGap(NaN), maxCurrentResidualIncident(NaN), maxCurrentResidualNonIncident(NaN) {}

	string	cplexStatus;
	string	message;			// exception text when status == SOLVER_FAILURE
	double	solveTime;			// wall clock seconds
	long	iterations;
	int		numRows;
	int		numCols;

	/* absE - |E| over every (bus, i, j), and the entries above relaxationTol */
	double	maxAbsGap;
	vector<string> relaxationViolations;

	/* |I V_P - F| on constraint rows whose bus is (or is not) an endpoint of the line */
	double	maxCurrentResidualIncident;
	double	maxCurrentResidualNonIncident;
};

/* Outcome of one envelope computation. Filled once by the solve and never
 * changed afterwards. */
struct DOEresult {
	DOEresult () : status(SOLVER_FAILURE), hasSolution(false), objectiveValue(NaN), curtailmentReport(NaN) {}

	SolveStatus	status;
	bool		hasSolution;
	double		objectiveValue;
	map<string, pair<double, double> > envelopes;	// child -> (PCmin, PCmax)
	double		curtailmentReport;				// O
	Diagnostics	diagnostics;

	void printResult (ostream &os) const;
	bool writeEnvelopes (string filepath) const;
};

#endif /* solution_hpp */
