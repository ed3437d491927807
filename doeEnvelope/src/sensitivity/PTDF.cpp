//
//  PTDF.cpp
//  DOE-Envelope
//

#include "PTDF.hpp"
#include "../errors.hpp"

/****************************************************************************
 * compute
 * - Builds the susceptance-weighted Laplacian B = A' diag(b) A, drops the row
 * and column of the reference bus, factorises the reduced matrix and projects
 * the angle sensitivities on the lines through diag(b) A.
 ****************************************************************************/
PTDF PTDF::compute (const PowSys &powSys) {

	if ( !powSys.frozen )
		throw ConfigurationError("topology must be built before the PTDF");

	PTDF ptdf;
	int numBus  = powSys.numBus;
	int numLine = powSys.numLine;

	for (int b=0; b<numBus; b++)
		ptdf.busIndex.insert( pair<string, int> (powSys.buses[b].name, b) );
	for (int l=0; l<numLine; l++)
		ptdf.lineIndex.insert( pair<string, int> (powSys.lines[l].name, l) );

	ptdf.reference = powSys.referenceBus();
	ptdf.matrix = Eigen::MatrixXd::Zero(numLine, numBus);

	if ( numBus == 1 )
		return ptdf;

	/* Incidence and Laplacian */
	Eigen::MatrixXd A = Eigen::MatrixXd::Zero(numLine, numBus);
	Eigen::VectorXd b(numLine);
	for (int l=0; l<numLine; l++) {
		const Line *lptr = &(powSys.lines[l]);
		A(l, lptr->orig) =  1.0;
		A(l, lptr->dest) = -1.0;
		b(l) = lptr->susceptance;
	}
	Eigen::MatrixXd B = A.transpose() * b.asDiagonal() * A;

	/* Reduced quantities: every bus but the reference */
	vector<int> kept;
	for (int n=0; n<numBus; n++)
		if ( n != ptdf.reference ) kept.push_back(n);

	int numRed = (int) kept.size();
	Eigen::MatrixXd Br(numRed, numRed);
	Eigen::MatrixXd Ar(numLine, numRed);
	for (int r=0; r<numRed; r++) {
		for (int c=0; c<numRed; c++)
			Br(r, c) = B(kept[r], kept[c]);
		for (int l=0; l<numLine; l++)
			Ar(l, r) = A(l, kept[r]);
	}

	Eigen::FullPivLU<Eigen::MatrixXd> lu(Br);
	if ( !lu.isInvertible() )
		throw NumericalError("reduced Laplacian of " + powSys.name + " is singular, the network is not connected");

	Eigen::MatrixXd reduced = b.asDiagonal() * Ar * lu.inverse();
	if ( !reduced.allFinite() )
		throw NumericalError("PTDF of " + powSys.name + " has non-finite entries");

	for (int r=0; r<numRed; r++)
		ptdf.matrix.col(kept[r]) = reduced.col(r);

	return ptdf;
}//END compute()
