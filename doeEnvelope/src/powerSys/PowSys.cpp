//
//  PowSys.cpp
//  DOE-Envelope
//

#include "PowSys.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <deque>

PowSys::PowSys () {
	numBus = 0;
	numLine = 0;
	frozen = false;
}

bool PowSys::readData(string inputDir, string sysName) {

	bool status;

	name = sysName;
	path = inputDir + sysName + "/";

	// read bus data
	status = readBusData(path);
	if (!status) goto finalize;

	// read line data
	status = readLineData(path);

	finalize:
	if (status) {
		printf("Power system has been read successfully (%d buses, %d lines).\n", numBus, numLine);
	} else {
		printf("Error: Power system could not be read.\n");
	}
	return status;
}

/****************************************************************************
 * readBusData
 * Buses.csv : name, role, P [, V_min, V_max]
 ****************************************************************************/
bool PowSys::readBusData(string inputPath) {

	// open file
	ifstream input;
	bool status = open_file(input, inputPath + "Buses.csv");
	if (!status)  return false;

	string temp_str;

	// skip the headers
	safeGetline(input, temp_str);

	// read data
	while ( safeGetline(input, temp_str) ) {
		if ( trim(temp_str).empty() )
			continue;

		vector<string> fields = splitString(temp_str, delimiter);
		if ( fields.size() < 3 )
			throw ConfigurationError("Buses.csv: expected at least 3 fields in '" + temp_str + "'");

		double P = 0.0;
		if ( !parseDouble(fields[2], P) )
			throw ConfigurationError("Buses.csv: invalid injection for bus " + fields[0]);

		Bus bus;
		bus.name = fields[0];
		bus.setRole(fields[1]);
		addBus(bus.name, P, bus.role);

		// optional voltage limits
		Bus *busPtr = &(buses.back());
		if ( fields.size() > 3 && !parseDouble(fields[3], busPtr->V_min) )
			throw ConfigurationError("Buses.csv: invalid V_min for bus " + fields[0]);
		if ( fields.size() > 4 && !parseDouble(fields[4], busPtr->V_max) )
			throw ConfigurationError("Buses.csv: invalid V_max for bus " + fields[0]);
	}
	input.close();

	return true;
}

/****************************************************************************
 * readLineData
 * Lines.csv : name, from, to, susceptance [, I_min, I_max]
 ****************************************************************************/
bool PowSys::readLineData(string inputPath) {

	// open file
	ifstream input;

	bool status = open_file(input, inputPath + "Lines.csv");
	if (!status)  return false;

	string temp_str;

	// skip the headers
	safeGetline(input, temp_str);

	// read the data
	while ( safeGetline(input, temp_str) ) {
		if ( trim(temp_str).empty() )
			continue;

		vector<string> fields = splitString(temp_str, delimiter);
		if ( fields.size() < 4 )
			throw ConfigurationError("Lines.csv: expected at least 4 fields in '" + temp_str + "'");

		// a missing susceptance stays NaN and is reported by buildTopology
		double b = NaN, minI = NaN, maxI = NaN;
		if ( !parseDouble(fields[3], b) )
			throw ConfigurationError("Lines.csv: invalid susceptance for line " + fields[0]);
		if ( fields.size() > 4 && !parseDouble(fields[4], minI) )
			throw ConfigurationError("Lines.csv: invalid I_min for line " + fields[0]);
		if ( fields.size() > 5 && !parseDouble(fields[5], maxI) )
			throw ConfigurationError("Lines.csv: invalid I_max for line " + fields[0]);

		addLine(fields[0], fields[1], fields[2], b, minI, maxI);
	}
	input.close();

	return true;
}

void PowSys::addBus (string busName, double P, Bus::BusRole role) {
	if ( frozen )
		throw ConfigurationError("cannot add bus " + busName + " after the topology is built");
	if ( mapBusNameToIndex.find(busName) != mapBusNameToIndex.end() )
		throw ConfigurationError("duplicate bus " + busName);
	if ( !std::isfinite(P) )
		throw ConfigurationError("bus " + busName + " has a non-finite injection");

	Bus bus;
	bus.id = numBus;
	bus.name = busName;
	bus.P = P;
	bus.role = role;
	buses.push_back(bus);

	mapBusNameToIndex.insert( pair<string, int> (busName, numBus++) );
}

void PowSys::addLine (string lineName, string from, string to, double susceptance, double minCurrent, double maxCurrent) {
	if ( frozen )
		throw ConfigurationError("cannot add line " + lineName + " after the topology is built");

	Line line;
	line.id = numLine++;
	line.name = lineName;
	line.origName = from;
	line.destName = to;
	line.susceptance = susceptance;
	line.minCurrentLim = minCurrent;
	line.maxCurrentLim = maxCurrent;
	lines.push_back(line);
}

void PowSys::setParents (const vector<string> &names) {
	if ( frozen )
		throw ConfigurationError("cannot declare parents after the topology is built");
	declaredParents = names;
}

void PowSys::setChildren (const vector<string> &names) {
	if ( frozen )
		throw ConfigurationError("cannot declare children after the topology is built");
	declaredChildren = names;
}

int PowSys::getBusIndex (const string &busName) const {
	map<string, int>::const_iterator it = mapBusNameToIndex.find(busName);
	if ( it == mapBusNameToIndex.end() )
		throw ConfigurationError("bus " + busName + " is not in the network");
	return it->second;
}

bool PowSys::isParent (int busId) const {
	return buses[busId].role == Bus::PARENT;
}

bool PowSys::isChild (int busId) const {
	return buses[busId].role == Bus::CHILD;
}

/* The first designated parent resolves the rank deficiency of the Laplacian. */
int PowSys::referenceBus () const {
	if ( parents.empty() )
		throw ConfigurationError("network has no parent node");
	return parents[0];
}

/****************************************************************************
 * buildTopology
 * Resolves bus roles and line endpoints, validates susceptances and fills the
 * neighbour adjacency of each bus. The network is frozen afterwards.
 ****************************************************************************/
void PowSys::buildTopology () {
	if ( frozen )
		return;

	if ( numBus == 0 )
		throw ConfigurationError("network has no bus");

	// explicitly declared roles take precedence over the data file, a declared
	// list replaces every role of that kind read from it
	for (int b=0; b<numBus; b++) {
		if ( (!declaredParents.empty() && buses[b].role == Bus::PARENT)
				|| (!declaredChildren.empty() && buses[b].role == Bus::CHILD) )
			buses[b].role = Bus::INNER;
	}
	for (unsigned int k=0; k<declaredParents.size(); k++) {
		Bus *busPtr = &(buses[ getBusIndex(declaredParents[k]) ]);
		busPtr->role = Bus::PARENT;
	}
	for (unsigned int k=0; k<declaredChildren.size(); k++) {
		Bus *busPtr = &(buses[ getBusIndex(declaredChildren[k]) ]);
		if ( find(declaredParents.begin(), declaredParents.end(), busPtr->name) != declaredParents.end() )
			throw ConfigurationError("bus " + busPtr->name + " is declared both parent and child");
		busPtr->role = Bus::CHILD;
	}

	assignDefaultRoles();

	parents.clear();
	children.clear();
	for (int b=0; b<numBus; b++) {
		if ( buses[b].role == Bus::PARENT )		parents.push_back(b);
		else if ( buses[b].role == Bus::CHILD )	children.push_back(b);
	}

	if ( parents.empty() )
		throw ConfigurationError("network has no parent node");
	if ( children.empty() )
		throw ConfigurationError("network has no child node, no envelope can be computed");

	// lines
	for (int l=0; l<numLine; l++) {
		Line *lptr = &(lines[l]);

		lptr->orig = getBusIndex(lptr->origName);
		lptr->dest = getBusIndex(lptr->destName);

		if ( lptr->orig == lptr->dest )
			throw ConfigurationError("line " + lptr->name + " connects bus " + lptr->origName + " to itself");
		if ( !std::isfinite(lptr->susceptance) || fabs(lptr->susceptance) < EPSzero )
			throw ConfigurationError("line " + lptr->name + " has no usable susceptance");
		if ( !std::isnan(lptr->minCurrentLim) && !std::isnan(lptr->maxCurrentLim) && lptr->minCurrentLim > lptr->maxCurrentLim )
			throw ConfigurationError("line " + lptr->name + " has I_min above I_max");

		Adjacency fromOrig = { l, lptr->dest, lptr->susceptance };
		Adjacency fromDest = { l, lptr->orig, lptr->susceptance };
		buses[lptr->orig].neighbors.push_back(fromOrig);
		buses[lptr->dest].neighbors.push_back(fromDest);
	}

	frozen = true;
}

/****************************************************************************
 * assignDefaultRoles
 * Without any declared role the first bus is the parent and every other bus
 * a child. Buses left unspecified next to declared roles become inner buses.
 ****************************************************************************/
void PowSys::assignDefaultRoles () {
	bool anyDeclared = false;
	for (int b=0; b<numBus; b++) {
		if ( buses[b].role != Bus::UNSPECIFIED ) {
			anyDeclared = true;
			break;
		}
	}

	for (int b=0; b<numBus; b++) {
		if ( buses[b].role != Bus::UNSPECIFIED )
			continue;
		if ( anyDeclared )
			buses[b].role = Bus::INNER;
		else
			buses[b].role = (b == 0) ? Bus::PARENT : Bus::CHILD;
	}
}

/****************************************************************************
 * subnetwork
 * Returns the network induced by the operational buses: those buses with
 * their data and roles, and the lines joining two of them. Declared roles
 * must name operational buses.
 ****************************************************************************/
PowSys PowSys::subnetwork (const vector<string> &operational) const {
	if ( operational.empty() )
		throw ConfigurationError("the operational subnetwork has no bus");

	set<string> inside;
	for (unsigned int k=0; k<operational.size(); k++) {
		getBusIndex(operational[k]);
		inside.insert(operational[k]);
	}

	PowSys sub;
	sub.name = name;
	sub.path = path;

	for (int b=0; b<numBus; b++) {
		if ( inside.count(buses[b].name) == 0 )
			continue;
		sub.addBus(buses[b].name, buses[b].P, buses[b].role);
		sub.buses.back().V_min = buses[b].V_min;
		sub.buses.back().V_max = buses[b].V_max;
	}

	for (int l=0; l<numLine; l++) {
		const Line &line = lines[l];
		getBusIndex(line.origName);
		getBusIndex(line.destName);
		if ( inside.count(line.origName) && inside.count(line.destName) )
			sub.addLine(line.name, line.origName, line.destName, line.susceptance, line.minCurrentLim, line.maxCurrentLim);
	}

	for (unsigned int k=0; k<declaredParents.size(); k++) {
		if ( inside.count(declaredParents[k]) == 0 )
			throw ConfigurationError("parent " + declaredParents[k] + " is outside the operational subnetwork");
	}
	for (unsigned int k=0; k<declaredChildren.size(); k++) {
		if ( inside.count(declaredChildren[k]) == 0 )
			throw ConfigurationError("child " + declaredChildren[k] + " is outside the operational subnetwork");
	}
	sub.declaredParents = declaredParents;
	sub.declaredChildren = declaredChildren;

	return sub;
}

/****************************************************************************
 * externalInjection
 * Injection seen behind a child of the operational subnetwork: its own P plus
 * the P of every outside bus reachable from it without entering the
 * subnetwork again.
 ****************************************************************************/
double PowSys::externalInjection (const string &child, const set<string> &operational) const {
	vector< vector<int> > adjacent (numBus);
	for (int l=0; l<numLine; l++) {
		int o = getBusIndex(lines[l].origName);
		int d = getBusIndex(lines[l].destName);
		adjacent[o].push_back(d);
		adjacent[d].push_back(o);
	}

	vector<bool> inside (numBus, false);
	for (set<string>::const_iterator it = operational.begin(); it != operational.end(); ++it)
		inside[ getBusIndex(*it) ] = true;

	int c = getBusIndex(child);
	double total = buses[c].P;

	vector<bool> seen (numBus, false);
	seen[c] = true;

	deque<int> queue;
	for (unsigned int k=0; k<adjacent[c].size(); k++)
		queue.push_back(adjacent[c][k]);

	while ( !queue.empty() ) {
		int u = queue.front();
		queue.pop_front();
		if ( seen[u] || inside[u] )
			continue;

		seen[u] = true;
		total += buses[u].P;
		for (unsigned int k=0; k<adjacent[u].size(); k++) {
			if ( !seen[adjacent[u][k]] && !inside[adjacent[u][k]] )
				queue.push_back(adjacent[u][k]);
		}
	}

	return total;
}
