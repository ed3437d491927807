#include <catch2/catch.hpp>

#include <algorithm>

#include "compute.hpp"
#include "constraints.hpp"
#include "objective.hpp"
#include "errors.hpp"

/* parent - child over one line, susceptance 1, current in [0.8, 1.2] */
static void twoBusNetwork (PowSys &powSys) {
	powSys.addBus("parent", 0.0, Bus::PARENT);
	powSys.addBus("child", 0.0, Bus::CHILD);
	powSys.addLine("L", "child", "parent", 1.0, 0.8, 1.2);
}

static DOEparams twoBusParams () {
	DOEparams params;
	params.alpha = 1.0;
	params.beta = 1.0;
	params.numVertP = 2;
	params.numVertV = 1;
	params.V_P.push_back(1.0);
	return params;
}

TEST_CASE("two bus envelope", "[doe][scenario]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	SolverConfig solverCfg;

	DOEresult result = compute(powSys, "dc", "global_sum", twoBusParams(), solverCfg);

	REQUIRE(result.status == OPTIMAL);
	REQUIRE(result.hasSolution);

	// |E| = 0.8 at both ends of the line, the budget covers the whole grid
	REQUIRE(result.curtailmentReport == Approx(1.6).margin(1e-6));
	REQUIRE(result.envelopes.size() == 1);

	// the parent exchange limit caps both ends, symmetric around zero
	double PCmin = result.envelopes["child"].first;
	double PCmax = result.envelopes["child"].second;
	REQUIRE(PCmax == Approx(1.0).margin(1e-6));
	REQUIRE(PCmin == Approx(-PCmax).margin(1e-6));
	REQUIRE(result.objectiveValue == Approx(2.0 - 1.6).margin(1e-6));

	REQUIRE(result.diagnostics.maxAbsGap <= relaxationTol);
	REQUIRE(result.diagnostics.relaxationViolations.empty());
	REQUIRE(result.diagnostics.maxCurrentResidualIncident <= 1e-6);
	REQUIRE(std::isnan(result.diagnostics.maxCurrentResidualNonIncident));
	REQUIRE(result.diagnostics.numRows > 0);
	REQUIRE_FALSE(result.diagnostics.cplexStatus.empty());
}

TEST_CASE("curtailment limit below the required budget", "[doe][scenario]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	DOEparams params = twoBusParams();
	params.curtailmentLimit = 1.0;
	SolverConfig solverCfg;

	DOEresult result = compute(powSys, "dc", "global_sum", params, solverCfg);

	REQUIRE((result.status == INFEASIBLE || result.status == INF_OR_UNBD));
	REQUIRE_FALSE(result.hasSolution);
	REQUIRE(result.envelopes.empty());
	REQUIRE(std::isnan(result.objectiveValue));
	REQUIRE(std::isnan(result.curtailmentReport));
	REQUIRE_FALSE(result.writeEnvelopes("doe_no_envelopes.csv"));
}

TEST_CASE("network without children", "[doe]") {
	PowSys powSys;
	powSys.addBus("parent", 0.0, Bus::PARENT);
	powSys.addBus("feeder", 0.0, Bus::INNER);
	powSys.addLine("L", "parent", "feeder", 1.0);
	SolverConfig solverCfg;

	REQUIRE_THROWS_AS(compute(powSys, "dc", "global_sum", twoBusParams(), solverCfg), ConfigurationError);
}

TEST_CASE("radial feeder envelopes", "[doe][radial]") {
	PowSys powSys;
	REQUIRE(powSys.readData(DATA_DIR, "radial5"));

	DOEparams params;
	SolverConfig solverCfg;
	readRunfile(string(DATA_DIR) + "radial5/runParameters.txt", params, solverCfg);

	DOEresult first = compute(powSys, "dc", "global_sum", params, solverCfg);

	REQUIRE(first.status == OPTIMAL);
	REQUIRE(first.envelopes.size() == 3);
	double width = 0.0;
	for (auto it = first.envelopes.begin(); it != first.envelopes.end(); ++it) {
		REQUIRE(it->second.first <= it->second.second + 1e-9);
		width += it->second.second - it->second.first;
	}

	// sum PCmax <= P_max and sum PCmin >= P_min, the feeder shares a width of 2
	REQUIRE(width == Approx(2.0).margin(1e-6));
	REQUIRE(first.objectiveValue == Approx(2.0).margin(1e-6));
	REQUIRE(first.curtailmentReport == Approx(0.0).margin(1e-6));

	// the current definition holds on every row, endpoint or not
	REQUIRE(first.diagnostics.maxCurrentResidualIncident <= 1e-6);
	REQUIRE(first.diagnostics.maxCurrentResidualNonIncident <= 1e-6);

	SECTION("repeated computation gives the same envelope") {
		DOEresult second = compute(powSys, "dc", "global_sum", params, solverCfg);

		REQUIRE(second.status == first.status);
		REQUIRE(second.objectiveValue == Approx(first.objectiveValue).margin(1e-9));
		for (auto it = first.envelopes.begin(); it != first.envelopes.end(); ++it) {
			REQUIRE(second.envelopes[it->first].first == Approx(it->second.first).margin(1e-9));
			REQUIRE(second.envelopes[it->first].second == Approx(it->second.second).margin(1e-9));
		}
	}

	SECTION("sign rules keep the feeder feasible") {
		params.injectionSignRules = true;
		DOEresult withRules = compute(powSys, "dc", "global_sum", params, solverCfg);
		REQUIRE(withRules.status == OPTIMAL);
	}

	SECTION("DSO reference for an unknown child") {
		params.infoDSO["n1"] = 0.0;
		REQUIRE_THROWS_AS(compute(powSys, "dc", "global_sum", params, solverCfg), ConfigurationError);
	}
}

TEST_CASE("two bus envelope over two voltage vertices", "[doe][scenario]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	DOEparams params = twoBusParams();
	params.numVertV = 2;
	params.V_P.clear();
	params.V_P.push_back(0.9);
	params.V_P.push_back(1.1);
	SolverConfig solverCfg;

	DOEresult result = compute(powSys, "dc", "global_sum", params, solverCfg);

	REQUIRE(result.status == OPTIMAL);

	// F = I V_P[j] with I >= 0.8: sum |E| >= 1.44 at j = 0 and >= 1.76 at j = 1
	REQUIRE(result.curtailmentReport == Approx(1.76).margin(1e-6));
	REQUIRE(result.objectiveValue == Approx(2.0 - 1.76).margin(1e-6));
	REQUIRE(result.envelopes["child"].first == Approx(-1.0).margin(1e-6));
	REQUIRE(result.envelopes["child"].second == Approx(1.0).margin(1e-6));

	// the budget binds at j = 1 only, abs_E may exceed |E| at the j = 0
	// vertices by at most the spare budget
	for (unsigned int k=0; k<result.diagnostics.relaxationViolations.size(); k++) {
		const string &name = result.diagnostics.relaxationViolations[k];
		REQUIRE(name.substr(name.size() - 3) == "(0)");
	}
	REQUIRE(result.diagnostics.maxAbsGap <= 1.76 - 1.44 + 1e-6);
	REQUIRE(result.diagnostics.maxCurrentResidualIncident <= 1e-6);
}

TEST_CASE("slack abs_E is reported", "[doe][scenario]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	DOEparams params = twoBusParams();

	instance inst;
	inst.initialize(&powSys, params);
	SolverConfig solverCfg;
	DOEmodel doe(inst, solverCfg);
	doe.declareVariables(inst);
	buildDCPowerflow(doe, inst, params, inst.out());
	attachSecurityConstraints(doe, inst, params, inst.out());
	buildGlobalSum(doe, inst, params, inst.out());

	// |E| <= 1.2 on the child, so abs_E >= 1.5 cannot be tight there
	IloConstraint loose( doe.vars.absE[1][0][0] >= 1.5 );
	doe.model.add(loose);

	DOEresult result = doe.solve(inst, solverCfg);

	REQUIRE(result.status == OPTIMAL);
	REQUIRE(result.diagnostics.maxAbsGap >= 0.3 - 1e-6);
	REQUIRE(find(result.diagnostics.relaxationViolations.begin(), result.diagnostics.relaxationViolations.end(),
			"absE(child)(0)(0)") != result.diagnostics.relaxationViolations.end());
}

TEST_CASE("roles declared after a computation", "[doe][radial]") {
	PowSys powSys;
	REQUIRE(powSys.readData(DATA_DIR, "radial5"));

	DOEparams params;
	SolverConfig solverCfg;
	readRunfile(string(DATA_DIR) + "radial5/runParameters.txt", params, solverCfg);

	DOEresult before = compute(powSys, "dc", "global_sum", params, solverCfg);
	REQUIRE(before.envelopes.size() == 3);
	REQUIRE_FALSE(powSys.frozen);

	vector<string> children(1, "n2");
	powSys.setChildren(children);
	DOEresult after = compute(powSys, "dc", "global_sum", params, solverCfg);

	REQUIRE(after.status == OPTIMAL);
	REQUIRE(after.envelopes.size() == 1);
	REQUIRE(after.envelopes.count("n2") == 1);
}

TEST_CASE("operational subnetwork of the radial feeder", "[doe][radial]") {
	PowSys powSys;
	REQUIRE(powSys.readData(DATA_DIR, "radial5"));

	DOEparams params;
	SolverConfig solverCfg;
	readRunfile(string(DATA_DIR) + "radial5/runParameters.txt", params, solverCfg);
	params.infoDSO.clear();
	params.operationalNodes.push_back("sub");
	params.operationalNodes.push_back("n1");
	params.operationalNodes.push_back("n3");

	DOEresult result = compute(powSys, "dc", "global_sum", params, solverCfg);

	REQUIRE(result.status == OPTIMAL);
	REQUIRE(result.envelopes.size() == 1);

	// Pminus(n3) = Pplus + 0.3 over [-1, 1], the DSO reference of n3 is
	// P(n3) + P(n4) = -0.2, so the centre 0.3 leaves a gap of 0.5
	REQUIRE(result.envelopes["n3"].first == Approx(-0.7).margin(1e-6));
	REQUIRE(result.envelopes["n3"].second == Approx(1.3).margin(1e-6));
	REQUIRE(result.objectiveValue == Approx(1.5).margin(1e-6));

	SECTION("DSO reference of a bus outside the subnetwork") {
		params.infoDSO["n2"] = 0.1;
		REQUIRE_THROWS_AS(compute(powSys, "dc", "global_sum", params, solverCfg), ConfigurationError);
	}
}

TEST_CASE("constraint families reject undeclared indices", "[doe][constraints]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	DOEparams params = twoBusParams();

	instance inst;
	inst.initialize(&powSys, params);
	SolverConfig solverCfg;
	DOEmodel doe(inst, solverCfg);
	doe.declareVariables(inst);

	REQUIRE_THROWS_AS(doe.vars.childSlot(0), ConfigurationError);
	REQUIRE_THROWS_AS(doe.vars.parentSlot(1), ConfigurationError);
	REQUIRE_THROWS_AS(doe.vars.checkLine(1), ConfigurationError);

	DOEparams mismatch = params;
	mismatch.V_P.push_back(1.1);
	REQUIRE_THROWS_AS(addFixedVoltage(doe.model, doe.vars, inst, mismatch), ConfigurationError);

	PTDF stale = inst.ptdf;
	inst.ptdf.matrix.resize(2, 2);
	REQUIRE_THROWS_AS(addPTDFConsistency(doe.model, doe.vars, inst, params), ConfigurationError);
	inst.ptdf = stale;
}

TEST_CASE("solver session leaves the environment alone", "[doe]") {
	const char *before = getenv("CPLEX_STUDIO_KEY");
	string saved = (before == NULL) ? "" : before;

	PowSys powSys;
	twoBusNetwork(powSys);
	SolverConfig solverCfg;
	solverCfg.licenseKey = "key-of-another-session";

	DOEresult result = compute(powSys, "dc", "global_sum", twoBusParams(), solverCfg);
	REQUIRE(result.hasSolution);

	const char *after = getenv("CPLEX_STUDIO_KEY");
	REQUIRE((after == NULL) == (before == NULL));
	if ( after != NULL )
		REQUIRE(string(after) == saved);
}

TEST_CASE("model export before solve", "[doe]") {
	PowSys powSys;
	twoBusNetwork(powSys);
	SolverConfig solverCfg;
	solverCfg.exportPath = "doe_twoBus.lp";

	DOEresult result = compute(powSys, "dc", "global_sum", twoBusParams(), solverCfg);
	REQUIRE(result.status == OPTIMAL);

	ifstream lp;
	REQUIRE(open_file(lp, solverCfg.exportPath));
	lp.close();
	remove(solverCfg.exportPath.c_str());

	REQUIRE(result.writeEnvelopes("doe_envelopes.csv"));
	ifstream csv;
	REQUIRE(open_file(csv, "doe_envelopes.csv"));
	string header;
	safeGetline(csv, header);
	REQUIRE(header == "child,PC_min,PC_max");
	csv.close();
	remove("doe_envelopes.csv");
}
