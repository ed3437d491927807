//
//  main.cpp
//  DOE-Envelope
//

#include "misc.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "solution.hpp"
#include "compute.hpp"
#include "./powerSys/PowSys.hpp"

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &sysName, string &mode, string &objective, string &outputDir);

int main(int argc, const char * argv[]) {
	string inputDir, sysName, mode, objective, outputDir;

	parseCmdLine(argc, argv, inputDir, sysName, mode, objective, outputDir);

	try {
		/* Read the run parameters */
		DOEparams params;
		SolverConfig solverCfg;
		readRunfile(inputDir + sysName + "/runParameters.txt", params, solverCfg);

		/* Read the power system */
		PowSys powSys;
		if ( !powSys.readData(inputDir, sysName) )
			return 1;

		DOEresult result = compute(powSys, mode, objective, params, solverCfg);
		result.printResult(cout);

		if ( result.hasSolution && !result.writeEnvelopes(outputDir + "envelopes.csv") )
			perror("Failed to write the envelopes.\n");

		return result.hasSolution ? 0 : 2;
	}
	catch (DOEerror &e) {
		perror((string(e.what()) + "\n").c_str());
		return 1;
	}
	catch (std::exception &e) {
		perror(("Unexpected failure: " + string(e.what()) + "\n").c_str());
		return 1;
	}
}

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &sysName, string &mode, string &objective, string &outputDir)
{
	if (argc == 5 || argc == 6) {
		inputDir	= argv[1];
		sysName		= argv[2];
		mode		= argv[3];
		objective	= argv[4];
		outputDir	= (argc == 6) ? argv[5] : "./";
	}
	else {
		cout << "Missing inputs. Please provide the following in the given order:\n  (1) input directory path,\n  (2) system name,\n  (3) power flow mode (dc, ac),\n  (4) objective (global_sum, fairness),\n  (5) output directory (optional)." << endl;
		exit(1);
	}

	if ( inputDir.empty() || inputDir[inputDir.size()-1] != '/' )	inputDir += "/";
	if ( outputDir.empty() || outputDir[outputDir.size()-1] != '/' )	outputDir += "/";
}
