//
//  config.hpp
//  DOE-Envelope
//

#ifndef config_h
#define config_h

#include <string>
#include <vector>
#include <map>
#include <limits>
#include <cmath>

enum PowerflowMode {
	DC,
	AC
};

enum ObjectiveType {
	GLOBAL_SUM,
	FAIRNESS
};

/* Run parameters of a single envelope computation. Passed explicitly to every
 * stage, nothing reads it through a global. */
struct DOEparams {
	DOEparams ();

	double	alpha;				// weight of the curtailment budget O (required)
	double	beta;				// weight of the DSO centre gap (required)

	double	V_min;				// p.u., child voltage limits
	double	V_max;
	double	I_min;				// p.u., default line current limits
	double	I_max;
	double	theta_min;			// rad
	double	theta_max;
	double	P_min;				// p.u., parent exchange limits
	double	P_max;

	int		numVertP;			// size of the first vertex dimension (i)
	int		numVertV;			// size of the second vertex dimension (j)
	std::vector<double> V_P;	// voltage vertices; empty = spread over [V_min, V_max]

	double	curtailmentLimit;	// upper bound on O, NaN if none
	bool	injectionSignRules;	// keep E between 0 and P at loaded buses

	std::map<std::string, double> infoDSO;	// child name -> DSO reference exchange
	std::vector<std::string> operationalNodes;	// empty = the whole network is operated

	bool	isSet (double val) const { return !std::isnan(val); }
	double	voltageVertex (int j) const;
};

struct SolverConfig {
	SolverConfig ();

	double	timeLimit;			// seconds, <= 0 means no limit
	int		threads;			// 0 lets CPLEX decide
	bool	deterministic;
	double	optimalityTol;
	std::string	exportPath;		// LP file written before the solve, empty = none
	std::string	logPath;		// CPLEX log, empty = none
	std::string	licenseKey;		// read from CPLEX_STUDIO_KEY, never printed
};

const double pi = 3.14159265358979323846;
const double EPSzero = 1e-8;
const double relaxationTol = 1e-6;
const double NaN = std::numeric_limits<double>::quiet_NaN();

const char delimiter = ',';

void readRunfile (std::string path, DOEparams &params, SolverConfig &solverCfg);
void validateParams (const DOEparams &params);
void readLicenseFromEnv (SolverConfig &solverCfg);

#endif /* config_h */
