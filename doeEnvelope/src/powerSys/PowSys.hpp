//
//  PowSys.hpp
//  DOE-Envelope
//

#ifndef PowSys_hpp
#define PowSys_hpp

#include <stdio.h>
#include <vector>
#include <fstream>
#include <string>
#include <map>
#include <set>

#include "Bus.hpp"
#include "Line.hpp"
#include "../misc.hpp"
#include "../config.hpp"

using namespace std;

/* Network description and its directed multigraph. Filled by readData or by
 * addBus/addLine, frozen by buildTopology. */
class PowSys {

public:
	PowSys ();
	bool readData (string inputDir, string sysName);

	void addBus (string name, double P, Bus::BusRole role = Bus::UNSPECIFIED);
	void addLine (string name, string from, string to, double susceptance, double minCurrent = NaN, double maxCurrent = NaN);
	void setParents (const vector<string> &names);
	void setChildren (const vector<string> &names);

	void buildTopology ();

	/* operational subnetwork and the injection of the network outside it */
	PowSys	subnetwork (const vector<string> &operational) const;
	double	externalInjection (const string &child, const set<string> &operational) const;

	int		getBusIndex (const string &busName) const;
	bool	isParent (int busId) const;
	bool	isChild (int busId) const;
	int		referenceBus () const;

	string	name;
	string	path;

	int numBus;
	int numLine;

	vector<Bus>		buses;
	vector<Line>	lines;
	vector<int>		parents;	// bus indices
	vector<int>		children;	// bus indices

	bool	frozen;

private:

	bool readBusData (string inputPath);
	bool readLineData (string inputPath);
	void assignDefaultRoles ();

	// helpers
	map<string, int> mapBusNameToIndex;
	vector<string>	 declaredParents;
	vector<string>	 declaredChildren;
};

#endif /* PowSys_hpp */
