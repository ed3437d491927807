#include <catch2/catch.hpp>

#include "registry.hpp"
#include "compute.hpp"
#include "errors.hpp"

TEST_CASE("mode and objective names", "[registry]") {
	REQUIRE(parsePowerflowMode("dc") == DC);
	REQUIRE(parsePowerflowMode("ac") == AC);
	REQUIRE(parseObjectiveType("global_sum") == GLOBAL_SUM);
	REQUIRE(parseObjectiveType("fairness") == FAIRNESS);

	REQUIRE_THROWS_AS(parsePowerflowMode("DC-OPF"), ConfigurationError);
	REQUIRE_THROWS_AS(parseObjectiveType("max_width"), ConfigurationError);
}

TEST_CASE("builders are selected for implemented entries only", "[registry]") {
	REQUIRE(selectPowerflowBuilder(DC) != NULL);
	REQUIRE(selectObjectiveBuilder(GLOBAL_SUM) != NULL);

	REQUIRE_THROWS_AS(selectPowerflowBuilder(AC), NotImplementedError);
	REQUIRE_THROWS_AS(selectObjectiveBuilder(FAIRNESS), NotImplementedError);
}

TEST_CASE("unimplemented selections fail before any model is built", "[registry][compute]") {
	PowSys powSys;
	powSys.addBus("parent", 0.0, Bus::PARENT);
	powSys.addBus("child", 0.0, Bus::CHILD);
	powSys.addLine("L", "child", "parent", 1.0);

	DOEparams params;
	params.alpha = 1.0;
	params.beta = 1.0;
	SolverConfig solverCfg;

	REQUIRE_THROWS_AS(compute(powSys, "ac", "global_sum", params, solverCfg), NotImplementedError);
	REQUIRE_THROWS_AS(compute(powSys, "dc", "fairness", params, solverCfg), NotImplementedError);

	// nothing was built
	REQUIRE_FALSE(powSys.frozen);
}

TEST_CASE("unset weights fail before any model is built", "[registry][compute]") {
	PowSys powSys;
	powSys.addBus("parent", 0.0, Bus::PARENT);
	powSys.addBus("child", 0.0, Bus::CHILD);
	powSys.addLine("L", "child", "parent", 1.0);

	DOEparams params;
	SolverConfig solverCfg;

	REQUIRE_THROWS_AS(compute(powSys, "dc", "global_sum", params, solverCfg), ConfigurationError);
}
