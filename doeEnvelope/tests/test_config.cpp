#include <catch2/catch.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "misc.hpp"

static DOEparams validParams () {
	DOEparams params;
	params.alpha = 1.0;
	params.beta = 1.0;
	return params;
}

TEST_CASE("defaults of the run parameters", "[config]") {
	DOEparams params;
	SolverConfig solverCfg;

	REQUIRE(std::isnan(params.alpha));
	REQUIRE(std::isnan(params.beta));
	REQUIRE(params.V_min == Approx(0.9));
	REQUIRE(params.V_max == Approx(1.1));
	REQUIRE(params.theta_min == Approx(-pi));
	REQUIRE(params.theta_max == Approx(pi));
	REQUIRE(params.numVertP == 2);
	REQUIRE(params.numVertV == 2);
	REQUIRE_FALSE(params.injectionSignRules);
	REQUIRE(solverCfg.deterministic);
	REQUIRE(solverCfg.exportPath.empty());
}

TEST_CASE("voltage vertices", "[config]") {
	DOEparams params = validParams();

	SECTION("spread over the voltage range") {
		params.numVertV = 3;
		REQUIRE(params.voltageVertex(0) == Approx(0.9));
		REQUIRE(params.voltageVertex(1) == Approx(1.0));
		REQUIRE(params.voltageVertex(2) == Approx(1.1));
	}
	SECTION("single vertex sits in the middle") {
		params.numVertV = 1;
		REQUIRE(params.voltageVertex(0) == Approx(1.0));
	}
	SECTION("explicit vertices") {
		params.V_P.push_back(0.97);
		params.V_P.push_back(1.02);
		REQUIRE(params.voltageVertex(1) == Approx(1.02));
	}
}

TEST_CASE("required parameters are checked", "[config]") {
	DOEparams params = validParams();
	REQUIRE_NOTHROW(validateParams(params));

	SECTION("alpha unset") {
		params.alpha = NaN;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("beta unset") {
		params.beta = NaN;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("inverted voltage range") {
		params.V_min = 1.2;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("inverted current range") {
		params.I_min = 2.0;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("empty vertex grid") {
		params.numVertV = 0;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("single power vertex cannot hold both envelope ends") {
		params.numVertP = 1;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("empty operational bus name") {
		params.operationalNodes.push_back("");
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("voltage vertices do not match the grid") {
		params.V_P.push_back(1.0);
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("non-finite limit") {
		params.theta_max = INFINITY;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
	SECTION("negative curtailment limit") {
		params.curtailmentLimit = -1.0;
		REQUIRE_THROWS_AS(validateParams(params), ConfigurationError);
	}
}

TEST_CASE("run file is read", "[config][io]") {
	DOEparams params;
	SolverConfig solverCfg;
	readRunfile(string(DATA_DIR) + "radial5/runParameters.txt", params, solverCfg);

	REQUIRE(params.alpha == Approx(0.5));
	REQUIRE(params.beta == Approx(1.0));
	REQUIRE(params.numVertP == 2);
	REQUIRE(params.V_P.size() == 2);
	REQUIRE(params.V_P[1] == Approx(1.05));
	REQUIRE(params.infoDSO.size() == 1);
	REQUIRE(params.infoDSO["n2"] == Approx(0.1));
	REQUIRE(solverCfg.timeLimit == Approx(60));
	REQUIRE_NOTHROW(validateParams(params));
}

TEST_CASE("non-numeric run parameter", "[config][io]") {
	string path = "doe_bad_runParameters.txt";
	ofstream output;
	REQUIRE(open_file(output, path));
	output << "alpha one" << endl;
	output.close();

	DOEparams params;
	SolverConfig solverCfg;
	REQUIRE_THROWS_AS(readRunfile(path, params, solverCfg), ConfigurationError);
	remove(path.c_str());
}

/* writes a one-line run file and reads it back */
static void readSingleParameter (const string &line, DOEparams &params, SolverConfig &solverCfg) {
	string path = "doe_single_runParameters.txt";
	ofstream output;
	REQUIRE(open_file(output, path));
	output << line << endl;
	output.close();

	try {
		readRunfile(path, params, solverCfg);
	}
	catch (ConfigurationError &) {
		remove(path.c_str());
		throw;
	}
	remove(path.c_str());
}

TEST_CASE("integer run parameters are range checked", "[config][io]") {
	DOEparams params;
	SolverConfig solverCfg;

	SECTION("grid size beyond the int range") {
		REQUIRE_THROWS_AS(readSingleParameter("numVertP 1e20", params, solverCfg), ConfigurationError);
	}
	SECTION("fractional grid size") {
		REQUIRE_THROWS_AS(readSingleParameter("numVertV 2.5", params, solverCfg), ConfigurationError);
	}
	SECTION("negative thread count") {
		REQUIRE_THROWS_AS(readSingleParameter("threads -1", params, solverCfg), ConfigurationError);
	}
	SECTION("valid counts") {
		readSingleParameter("numVertP 3", params, solverCfg);
		readSingleParameter("threads 0", params, solverCfg);
		REQUIRE(params.numVertP == 3);
		REQUIRE(solverCfg.threads == 0);
	}
}

TEST_CASE("operational buses from the run file", "[config][io]") {
	DOEparams params;
	SolverConfig solverCfg;
	readSingleParameter("operational_nodes sub,n1,n3", params, solverCfg);

	REQUIRE(params.operationalNodes.size() == 3);
	REQUIRE(params.operationalNodes[1] == "n1");
}

TEST_CASE("licence key comes from the environment", "[config]") {
	SolverConfig solverCfg;
	setenv("CPLEX_STUDIO_KEY", "test-key", 1);
	readLicenseFromEnv(solverCfg);
	unsetenv("CPLEX_STUDIO_KEY");

	REQUIRE(solverCfg.licenseKey == "test-key");
}

TEST_CASE("csv helpers", "[config][misc]") {
	string line = " a , b,c ";
	vector<string> tokens = splitString(line, ',');
	REQUIRE(tokens.size() == 3);
	REQUIRE(tokens[0] == "a");
	REQUIRE(tokens[2] == "c");

	double value = 3.0;
	REQUIRE(parseDouble("", value));
	REQUIRE(value == Approx(3.0));
	REQUIRE(parseDouble(" 1.5 ", value));
	REQUIRE(value == Approx(1.5));
	REQUIRE_FALSE(parseDouble("1.5x", value));
}
