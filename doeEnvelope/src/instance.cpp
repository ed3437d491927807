#include "instance.hpp"
#include "errors.hpp"

instance::instance () {
	powSys = NULL;
}

/****************************************************************************
 * initialize
 * - Freezes the network topology and computes its PTDF. Every error is raised
 * here, before any optimization model exists.
 * - When powSys is the operational subnetwork of fullSys, children without a
 * DSO reference get the injection of the network behind them.
 ****************************************************************************/
void instance::initialize(PowSys *powSys, const DOEparams &params, const PowSys *fullSys) {

	if ( powSys == NULL )
		throw ConfigurationError("no power system given");

	this->powSys = powSys;
	this->params = params;

	powSys->buildTopology();
	checkLimits();

	if ( fullSys != NULL && !params.operationalNodes.empty() )
		deriveDSOReferences(*fullSys);

	for (map<string, double>::const_iterator it = this->params.infoDSO.begin(); it != this->params.infoDSO.end(); ++it) {
		if ( !powSys->isChild( powSys->getBusIndex(it->first) ) )
			throw ConfigurationError("DSO reference given for " + it->first + ", which is not a child");
	}

	ptdf = PTDF::compute(*powSys);

	summary();
}//END initialize()

/* merged per-element limits must leave a non-empty range */
void instance::checkLimits() {
	for (int b=0; b<powSys->numBus; b++) {
		double lo = minVoltage(b), hi = maxVoltage(b);
		if ( !std::isfinite(lo) || !std::isfinite(hi) || lo < 0 || lo > hi )
			throw ConfigurationError("bus " + powSys->buses[b].name + " has voltage limits [" + numToStr(lo) + ", " + numToStr(hi) + "]");
	}

	for (int l=0; l<powSys->numLine; l++) {
		double lo = minCurrent(l), hi = maxCurrent(l);
		if ( !std::isfinite(lo) || !std::isfinite(hi) || lo > hi )
			throw ConfigurationError("line " + powSys->lines[l].name + " has current limits [" + numToStr(lo) + ", " + numToStr(hi) + "]");
	}
}

void instance::deriveDSOReferences(const PowSys &fullSys) {
	set<string> operational (params.operationalNodes.begin(), params.operationalNodes.end());

	for (unsigned int k=0; k<powSys->children.size(); k++) {
		const string &child = powSys->buses[ powSys->children[k] ].name;
		if ( params.infoDSO.find(child) == params.infoDSO.end() )
			params.infoDSO[child] = fullSys.externalInjection(child, operational);
	}
}

double instance::minVoltage(int bus) const {
	double val = powSys->buses[bus].V_min;
	return std::isnan(val) ? params.V_min : val;
}

double instance::maxVoltage(int bus) const {
	double val = powSys->buses[bus].V_max;
	return std::isnan(val) ? params.V_max : val;
}

double instance::minCurrent(int line) const {
	double val = powSys->lines[line].minCurrentLim;
	return std::isnan(val) ? params.I_min : val;
}

double instance::maxCurrent(int line) const {
	double val = powSys->lines[line].maxCurrentLim;
	return std::isnan(val) ? params.I_max : val;
}

bool instance::isIncident(int bus, int line) const {
	return powSys->lines[line].orig == bus || powSys->lines[line].dest == bus;
}

void instance::summary() {
	cout << "------------------------------------------------------------------" << endl;
	printf("%-23s%s%s\n", "Power System", ": ", powSys->name.c_str());
	printf("%-23s%s%d buses, %d lines\n", "Network", ": ", powSys->numBus, powSys->numLine);

	printf("%-23s%s", "Parents", ": ");
	for (auto i = powSys->parents.begin(); i != powSys->parents.end(); ++i)
		std::cout << powSys->buses[*i].name << ' ';
	cout << endl;

	printf("%-23s%s", "Children", ": ");
	for (auto i = powSys->children.begin(); i != powSys->children.end(); ++i)
		std::cout << powSys->buses[*i].name << ' ';
	cout << endl;

	printf("%-23s%s%s\n", "Reference bus", ": ", powSys->buses[ptdf.reference].name.c_str());
	printf("%-23s%s%d x %d\n", "Vertex grid", ": ", params.numVertP, params.numVertV);
	cout << "------------------------------------------------------------------" << endl;

}// summary()

/****************************************************************************
 * out
 * returns the log stream, a closed stream discards everything written to it
 ****************************************************************************/
ofstream& instance::out() {
	return log_stream;
}

/****************************************************************************
 * openLogFile
 * opens a log file with the input name.
 * log files are used to print out model construction and CPLEX logs.
 ****************************************************************************/
bool instance::openLogFile(string filename) {
	return open_file(log_stream, filename);
}

/****************************************************************************
 * closeLogFile
 ****************************************************************************/
void instance::closeLogFile() {
	log_stream.close();
}
