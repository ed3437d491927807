//
//  Bus.cpp
//  DOE-Envelope
//

#include "Bus.hpp"
#include "../config.hpp"
#include "../errors.hpp"

Bus::Bus() {
	id = -1;
	role = UNSPECIFIED;
	P = 0.0;
	V_min = NaN;
	V_max = NaN;
}

void Bus::setRole(string roleName) {
	if (roleName.compare("parent") == 0)		role = PARENT;
	else if (roleName.compare("child") == 0)	role = CHILD;
	else if (roleName.compare("inner") == 0)	role = INNER;
	else if (roleName.empty())					role = UNSPECIFIED;
	else {
		throw ConfigurationError("unknown role '" + roleName + "' for bus " + name);
	}
}
