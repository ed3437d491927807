//
//  Line.cpp
//  DOE-Envelope
//

#include "Line.hpp"
#include "../config.hpp"

Line::Line() {
	id = -1;
	minCurrentLim = NaN;
	maxCurrentLim = NaN;
	susceptance = NaN;
	orig = dest = -1;
}
