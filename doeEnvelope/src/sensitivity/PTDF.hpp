//
//  PTDF.hpp
//  DOE-Envelope
//

#ifndef PTDF_hpp
#define PTDF_hpp

#include <map>
#include <string>

#include <Eigen/Dense>

#include "../powerSys/PowSys.hpp"

using namespace std;

/* Power transfer distribution factors of a frozen network. Entry (l, n) is the
 * flow on line l, oriented from its origin to its destination bus, caused by a
 * unit injection at bus n withdrawn at the reference bus. Rows follow
 * lineIndex and columns follow busIndex, both identical to the PowSys order. */
struct PTDF {

	static PTDF compute (const PowSys &powSys);

	double operator() (int line, int bus) const { return matrix(line, bus); }

	Eigen::MatrixXd	matrix;
	map<string, int> busIndex;
	map<string, int> lineIndex;
	int				 reference;		// slack bus, its column is zero
};

#endif /* PTDF_hpp */
