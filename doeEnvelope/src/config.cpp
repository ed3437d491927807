//
//  config.cpp
//  DOE-Envelope
//

#include "config.hpp"
#include "errors.hpp"
#include "misc.hpp"

DOEparams::DOEparams () {
	alpha = NaN;
	beta  = NaN;

	V_min = 0.9;	V_max = 1.1;
	I_min = -1.0;	I_max = 1.0;
	theta_min = -pi;	theta_max = pi;
	P_min = -1.0;	P_max = 1.0;

	numVertP = 2;
	numVertV = 2;

	curtailmentLimit = NaN;
	injectionSignRules = false;
}

/* Voltage magnitude attached to the j-th vertex of the second grid dimension. */
double DOEparams::voltageVertex (int j) const {
	if ( !V_P.empty() )
		return V_P[j];

	if ( numVertV == 1 )
		return 0.5*(V_min + V_max);

	return V_min + j*(V_max - V_min)/(numVertV - 1);
}

/* Integer run parameters are read as doubles, anything outside [lo, INT_MAX]
 * or with a fractional part is rejected before the conversion. */
static int toCount (const string &field, double value, int lo) {
	if ( !std::isfinite(value) || value < lo || value > (double) numeric_limits<int>::max() || value != floor(value) )
		throw ConfigurationError("run parameter " + field + " must be an integer of at least " + numToStr(lo));
	return (int) value;
}

SolverConfig::SolverConfig () {
	timeLimit = 0;
	threads = 1;
	deterministic = true;
	optimalityTol = 1e-9;
}

/****************************************************************************
 * readRunfile
 * - Sets defaults in params/solverCfg (already done by the constructors) and
 * overrides them with the "key value" lines found in the run file.
 * - Missing file is not an error, the defaults are used.
 ****************************************************************************/
void readRunfile (string path, DOEparams &params, SolverConfig &solverCfg) {
	ifstream fptr;
	string	 line, field1, field2, field3;
	double	 temp;

	if ( open_file(fptr, path) ) {
		while ( safeGetline(fptr, line) ) {
			line = trim(line);
			if ( line.empty() || line[0] == '#' )
				continue;

			istringstream iss(line);
			field3.clear();
			if ( iss >> field1 >> field2 ) {
				iss >> field3;

				if ( field1 == "V_P" ) {
					params.V_P.clear();
					vector<string> tokens = splitString(field2, delimiter);
					for (unsigned int k=0; k<tokens.size(); k++) {
						if ( !parseDouble(tokens[k], temp) )
							throw ConfigurationError("invalid voltage vertex '" + tokens[k] + "'");
						params.V_P.push_back(temp);
					}
					continue;
				}
				if ( field1 == "info_DSO" ) {
					if ( field3.empty() || !parseDouble(field3, temp) )
						throw ConfigurationError("info_DSO expects a child name and a value");
					params.infoDSO[field2] = temp;
					continue;
				}
				if ( field1 == "operational_nodes" ) {
					params.operationalNodes = splitString(field2, delimiter);
					continue;
				}
				if ( field1 == "exportPath" ) { solverCfg.exportPath = field2; continue; }
				if ( field1 == "logPath" )	  { solverCfg.logPath = field2; continue; }

				if ( !parseDouble(field2, temp) )
					throw ConfigurationError("run parameter " + field1 + " has a non-numeric value '" + field2 + "'");

				if ( field1 == "alpha" )
					params.alpha = temp;
				else if ( field1 == "beta" )
					params.beta = temp;
				else if ( field1 == "V_min" )
					params.V_min = temp;
				else if ( field1 == "V_max" )
					params.V_max = temp;
				else if ( field1 == "I_min" )
					params.I_min = temp;
				else if ( field1 == "I_max" )
					params.I_max = temp;
				else if ( field1 == "theta_min" )
					params.theta_min = temp;
				else if ( field1 == "theta_max" )
					params.theta_max = temp;
				else if ( field1 == "P_min" )
					params.P_min = temp;
				else if ( field1 == "P_max" )
					params.P_max = temp;
				else if ( field1 == "numVertP" )
					params.numVertP = toCount(field1, temp, 1);
				else if ( field1 == "numVertV" )
					params.numVertV = toCount(field1, temp, 1);
				else if ( field1 == "curtailment_limit" )
					params.curtailmentLimit = temp;
				else if ( field1 == "injection_sign_rules" )
					params.injectionSignRules = (temp != 0);
				else if ( field1 == "timeLimit" )
					solverCfg.timeLimit = temp;
				else if ( field1 == "threads" )
					solverCfg.threads = toCount(field1, temp, 0);
				else if ( field1 == "deterministic" )
					solverCfg.deterministic = (temp != 0);
				else if ( field1 == "optimalityTol" )
					solverCfg.optimalityTol = temp;
				else {
					perror(("Warning:: Unidentified run parameter " + field1 + " in the file.\n").c_str());
				}
			}
		}
		fptr.close();
	}
	else
		perror("Failed to read the run parameters, using the default parameters.\n");

	readLicenseFromEnv(solverCfg);

	/* Print configuration summary */
	cout << "------------------------------------------------------------------" << endl;
	cout << "alpha = " << params.alpha << "    beta = " << params.beta << endl;
	cout << "Vertex grid      " << params.numVertP << " x " << params.numVertV << endl;
	cout << "Voltage   [" << setprecision(3) << params.V_min << ", " << params.V_max << "] p.u." << endl;
	cout << "Current   [" << params.I_min << ", " << params.I_max << "] p.u." << endl;
	cout << "Angle     [" << params.theta_min << ", " << params.theta_max << "] rad" << endl;
	cout << "Parent    [" << params.P_min << ", " << params.P_max << "] p.u." << endl;
	if (!params.operationalNodes.empty()) cout << "Operational subnetwork of " << params.operationalNodes.size() << " buses" << endl;
	if (params.isSet(params.curtailmentLimit)) cout << "Curtailment budget limited to " << params.curtailmentLimit << " p.u." << endl;
	if (solverCfg.timeLimit > 0) cout << "Time limit = " << solverCfg.timeLimit << " s" << endl;
	cout << "------------------------------------------------------------------" << endl;

}//END readRunfile()

/****************************************************************************
 * validateParams
 * - Throws ConfigurationError on the first inconsistency.
 ****************************************************************************/
void validateParams (const DOEparams &params) {

	if ( !params.isSet(params.alpha) )
		throw ConfigurationError("required parameter alpha is not set");
	if ( !params.isSet(params.beta) )
		throw ConfigurationError("required parameter beta is not set");

	double values[] = {params.alpha, params.beta, params.V_min, params.V_max, params.I_min, params.I_max,
			params.theta_min, params.theta_max, params.P_min, params.P_max};
	for (unsigned int k=0; k < sizeof(values)/sizeof(double); k++) {
		if ( !std::isfinite(values[k]) )
			throw ConfigurationError("run parameters must be finite");
	}

	if ( params.numVertP < 2 )
		throw ConfigurationError("numVertP must be at least 2, both envelope ends are vertices");
	if ( params.numVertV < 1 )
		throw ConfigurationError("numVertV must be at least 1");
	if ( params.V_min > params.V_max )
		throw ConfigurationError("V_min exceeds V_max");
	if ( params.V_min < 0 )
		throw ConfigurationError("V_min must be non-negative");
	if ( params.I_min > params.I_max )
		throw ConfigurationError("I_min exceeds I_max");
	if ( params.theta_min > params.theta_max )
		throw ConfigurationError("theta_min exceeds theta_max");
	if ( params.P_min > params.P_max )
		throw ConfigurationError("P_min exceeds P_max");
	if ( params.isSet(params.curtailmentLimit) && params.curtailmentLimit < 0 )
		throw ConfigurationError("curtailment_limit must be non-negative");

	for (unsigned int k=0; k<params.operationalNodes.size(); k++) {
		if ( params.operationalNodes[k].empty() )
			throw ConfigurationError("operational_nodes contains an empty bus name");
	}

	if ( !params.V_P.empty() ) {
		if ( (int) params.V_P.size() != params.numVertV )
			throw ConfigurationError("expected " + numToStr(params.numVertV) + " voltage vertices, got " + numToStr(params.V_P.size()));
		for (unsigned int j=0; j<params.V_P.size(); j++) {
			if ( !std::isfinite(params.V_P[j]) || params.V_P[j] <= 0 )
				throw ConfigurationError("voltage vertices must be positive");
		}
	}
}//END validateParams()

void readLicenseFromEnv (SolverConfig &solverCfg) {
	const char *key = getenv("CPLEX_STUDIO_KEY");
	if ( key != NULL )
		solverCfg.licenseKey = key;
}
