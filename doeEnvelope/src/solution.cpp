//
//  solution.cpp
//  DOE-Envelope
//

#include "solution.hpp"

string statusName (SolveStatus status) {
	switch (status) {
	case OPTIMAL:			return "Optimal";
	case FEASIBLE:			return "Feasible";
	case INFEASIBLE:			return "Infeasible";
	case UNBOUNDED:			return "Unbounded";
	case INF_OR_UNBD:		return "InfeasibleOrUnbounded";
	case TIME_LIMIT:			return "TimeLimit";
	case ITERATION_LIMIT:	return "IterationLimit";
	case NUMERICAL_FAILURE:	return "NumericalFailure";
	case SOLVER_FAILURE:		return "SolverError";
	}
	return "Unknown";
}

void DOEresult::printResult (ostream &os) const {
	os << "------------------------------------------------------------------" << endl;
	os << "Status            : " << statusName(status) << " (" << diagnostics.cplexStatus << ")" << endl;
	if ( !diagnostics.message.empty() )
		os << "Message           : " << diagnostics.message << endl;
	os << "Rows x Cols       : " << diagnostics.numRows << " x " << diagnostics.numCols << endl;
	os << "Iterations        : " << diagnostics.iterations << endl;
	os << "Solve time        : " << setprecision(4) << diagnostics.solveTime << " s" << endl;

	if ( !hasSolution ) {
		os << "No feasible envelope." << endl;
		os << "------------------------------------------------------------------" << endl;
		return;
	}

	os << "Objective value   : " << setprecision(8) << objectiveValue << endl;
	os << "Curtailment (O)   : " << curtailmentReport << endl;
	os << left << setw(20) << "Child" << setw(16) << "PC_min" << setw(16) << "PC_max" << endl;
	for (auto it = envelopes.begin(); it != envelopes.end(); ++it)
		os << left << setw(20) << it->first << setw(16) << it->second.first << setw(16) << it->second.second << endl;
	os << right;

	os << "Relaxation gap    : " << diagnostics.maxAbsGap;
	if ( !diagnostics.relaxationViolations.empty() )
		os << " (" << diagnostics.relaxationViolations.size() << " violations)";
	os << endl;
	os << "I.V - F residual  : " << diagnostics.maxCurrentResidualIncident << " incident, "
			<< diagnostics.maxCurrentResidualNonIncident << " non-incident" << endl;
	os << "------------------------------------------------------------------" << endl;
}

/****************************************************************************
 * writeEnvelopes
 * - child, PC_min, PC_max in CSV. Nothing is written without a solution.
 ****************************************************************************/
bool DOEresult::writeEnvelopes (string filepath) const {
	if ( !hasSolution )
		return false;

	ofstream output;
	if ( !open_file(output, filepath) )
		return false;

	output << "child,PC_min,PC_max" << endl;
	for (auto it = envelopes.begin(); it != envelopes.end(); ++it)
		output << it->first << delimiter << setprecision(10) << it->second.first << delimiter << it->second.second << endl;
	output.close();

	return true;
}
