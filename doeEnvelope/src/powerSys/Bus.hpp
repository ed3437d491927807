//
//  Bus.hpp
//  DOE-Envelope
//

#ifndef Bus_hpp
#define Bus_hpp

#include <stdio.h>
#include <string>
#include <vector>

using namespace std;

/* One line incident to a bus, seen from that bus. */
struct Adjacency {
	int		line;			// line index
	int		neighbor;		// bus at the other end
	double	susceptance;	// p.u.
};

class Bus {

public:
	Bus ();

	enum BusRole {
		UNSPECIFIED,
		PARENT,
		CHILD,
		INNER
	};

	void setRole (string roleName);	// sets bus role given its name

	// bus identifiers
	int id;
	string name;

	// bus characteristics
	BusRole	role;
	double	P;				// base injection (p.u.)
	double	V_min;			// p.u., NaN if the run parameter applies
	double	V_max;

	vector<Adjacency> neighbors;
};

#endif /* Bus_hpp */
