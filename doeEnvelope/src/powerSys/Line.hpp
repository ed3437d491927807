//
//  Line.hpp
//  DOE-Envelope
//

#ifndef Line_hpp
#define Line_hpp

#include <stdio.h>
#include <string>

using namespace std;

class Line {

public:
	Line ();

	// line identifiers
	int id;
	string name;

	// line characteristics
	double minCurrentLim;	// p.u., NaN if the run parameter applies
	double maxCurrentLim;	// p.u.
	double susceptance;		// p.u.

	string origName;
	string destName;
	int orig;				// origin bus index
	int dest;				// destination bus index
};
#endif /* Line_hpp */
