/*************************************************

 Instance of a dynamic operating envelope problem

 ************************************************/

#ifndef _INSTANCE_H_
#define _INSTANCE_H_

#include "config.hpp"
#include "./powerSys/PowSys.hpp"
#include "./sensitivity/PTDF.hpp"
#include "misc.hpp"

using namespace std;

class instance {

public:
	instance ();
	void initialize		(PowSys *powSys, const DOEparams &params, const PowSys *fullSys = NULL);

	PowSys		*powSys;
	DOEparams	params;
	PTDF		ptdf;

	/* limits after the per-element data has been merged with the run parameters */
	double	minVoltage (int bus) const;
	double	maxVoltage (int bus) const;
	double	minCurrent (int line) const;
	double	maxCurrent (int line) const;
	bool	isIncident (int bus, int line) const;

	/* log keeping */
	ofstream&	out ();
	bool		openLogFile (string filename);
	void		closeLogFile();

private:
	void checkLimits();
	void deriveDSOReferences(const PowSys &fullSys);
	void summary();

	/* log keeping */
	ofstream	log_stream;
};

#endif
