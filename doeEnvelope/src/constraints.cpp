/*
 * constraints.cpp
 *
 * Physical and security constraints of the envelope model.
 */

#include "constraints.hpp"
#include "errors.hpp"

static void checkVoltageVertices (const DOEvariables &vars, const DOEparams &params) {
	if ( !params.V_P.empty() && (int) params.V_P.size() != vars.numVertV )
		throw ConfigurationError("voltage vertices do not match the vertex grid");
}

/* absE >= E and absE >= -E */
void addAbsValueRelaxation (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];

	for (int n=0; n<vars.numBus; n++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "absPos(%d)(%d)(%d)", n, i, j);
				IloConstraint c1( vars.absE[n][i][j] - vars.E[n][i][j] >= 0 ); c1.setName(elemName); model.add(c1);

				snprintf(elemName, NAMESIZE, "absNeg(%d)(%d)(%d)", n, i, j);
				IloConstraint c2( vars.absE[n][i][j] + vars.E[n][i][j] >= 0 ); c2.setName(elemName); model.add(c2);
			}
		}
	}
}

void addCurrentBounds (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (int l=0; l<vars.numLine; l++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "currentBounds(%s)(%d)(%d)", data.powSys->lines[l].name.c_str(), i, j);
				IloRange r(env, data.minCurrent(l), vars.I[l][i][j], data.maxCurrent(l), elemName);
				model.add(r);
			}
		}
	}
}

/* Voltage magnitude follows the second vertex dimension only. */
void addFixedVoltage (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	checkVoltageVertices(vars, params);

	for (int n=0; n<vars.numBus; n++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "fixedVoltage(%d)(%d)(%d)", n, i, j);
				IloConstraint c( vars.V[n][i][j] == params.voltageVertex(j) ); c.setName(elemName); model.add(c);
			}
		}
	}
}

/****************************************************************************
 * addNodalInjection
 * E[n] = V_P[j]^2 sum_{lines incident to n} b (theta[n] - theta[neighbour])
 ****************************************************************************/
void addNodalInjection (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();
	checkVoltageVertices(vars, params);

	for (int n=0; n<vars.numBus; n++) {
		vars.checkBus(n);
		const vector<Adjacency> &neighbors = data.powSys->buses[n].neighbors;

		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				double vSq = params.voltageVertex(j) * params.voltageVertex(j);

				IloExpr expr (env);
				expr += vars.E[n][i][j];
				for (unsigned int k=0; k<neighbors.size(); k++) {
					vars.checkLine(neighbors[k].line);
					vars.checkBus(neighbors[k].neighbor);
					expr -= vSq * neighbors[k].susceptance * (vars.theta[n][i][j] - vars.theta[neighbors[k].neighbor][i][j]);
				}

				snprintf(elemName, NAMESIZE, "nodalInjection(%d)(%d)(%d)", n, i, j);
				IloConstraint c( expr == 0 ); c.setName(elemName); model.add(c);
				expr.end();
			}
		}
	}
}

/* F[l] = sum_n PTDF(l, n) E[n] */
void addPTDFConsistency (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	if ( data.ptdf.matrix.rows() != vars.numLine || data.ptdf.matrix.cols() != vars.numBus )
		throw ConfigurationError("PTDF dimensions do not match the declared buses and lines");

	for (int l=0; l<vars.numLine; l++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				IloExpr expr (env);
				expr += vars.F[l][i][j];
				for (int n=0; n<vars.numBus; n++) {
					double factor = data.ptdf(l, n);
					if ( factor != 0.0 )
						expr -= factor * vars.E[n][i][j];
				}

				snprintf(elemName, NAMESIZE, "ptdf(%s)(%d)(%d)", data.powSys->lines[l].name.c_str(), i, j);
				IloConstraint c( expr == 0 ); c.setName(elemName); model.add(c);
				expr.end();
			}
		}
	}
}

/* sum_n absE[n] <= O at every vertex */
void addCurtailmentBudget (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (int i=0; i<vars.numVertP; i++) {
		for (int j=0; j<vars.numVertV; j++) {
			IloExpr expr (env);
			for (int n=0; n<vars.numBus; n++)
				expr += vars.absE[n][i][j];
			expr -= vars.O;

			snprintf(elemName, NAMESIZE, "curtailmentBudget(%d)(%d)", i, j);
			IloConstraint c( expr <= 0 ); c.setName(elemName); model.add(c);
			expr.end();
		}
	}
}

void addPhaseBounds (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (int n=0; n<vars.numBus; n++) {
		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "phaseBounds(%d)(%d)(%d)", n, i, j);
				IloRange r(env, params.theta_min, vars.theta[n][i][j], params.theta_max, elemName);
				model.add(r);
			}
		}
	}
}

void addChildVoltageBounds (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (unsigned int k=0; k<vars.children.size(); k++) {
		int bus = vars.children[k];
		vars.checkBus(bus);

		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "childVoltage(%s)(%d)(%d)", data.powSys->buses[bus].name.c_str(), i, j);
				IloRange r(env, data.minVoltage(bus), vars.V[bus][i][j], data.maxVoltage(bus), elemName);
				model.add(r);
			}
		}
	}
}

/****************************************************************************
 * addCurrentDefinition
 * I[l] V_P[j] = F[l], stated once for every (bus, line) pair and not only for
 * the endpoints of the line. The post-solve residuals compare both groups.
 ****************************************************************************/
void addCurrentDefinition (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	checkVoltageVertices(vars, params);

	for (int n=0; n<vars.numBus; n++) {
		for (int l=0; l<vars.numLine; l++) {
			for (int i=0; i<vars.numVertP; i++) {
				for (int j=0; j<vars.numVertV; j++) {
					snprintf(elemName, NAMESIZE, "currentDef(%d)(%d)(%d)(%d)", n, l, i, j);
					IloConstraint c( params.voltageVertex(j) * vars.I[l][i][j] - vars.F[l][i][j] == 0 );
					c.setName(elemName); model.add(c);
				}
			}
		}
	}
}

/* sum_n (P[n] - E[n]) = sum_p Pplus[p] - sum_c Pminus[c] */
void addPowerBalance (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	double sysInjection = 0.0;
	for (int n=0; n<vars.numBus; n++)
		sysInjection += data.powSys->buses[n].P;

	for (int i=0; i<vars.numVertP; i++) {
		for (int j=0; j<vars.numVertV; j++) {
			IloExpr expr (env);
			for (int n=0; n<vars.numBus; n++)
				expr -= vars.E[n][i][j];
			for (unsigned int k=0; k<vars.parents.size(); k++)
				expr -= vars.Pplus[ vars.parentSlot(vars.parents[k]) ][i][j];
			for (unsigned int k=0; k<vars.children.size(); k++)
				expr += vars.Pminus[ vars.childSlot(vars.children[k]) ][i][j];

			snprintf(elemName, NAMESIZE, "powerBalance(%d)(%d)", i, j);
			IloConstraint c( expr == -sysInjection ); c.setName(elemName); model.add(c);
			expr.end();
		}
	}
}

/* PCmin[c] <= Pminus[c] <= PCmax[c] */
void addChildEnvelopeBounds (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];

	for (unsigned int k=0; k<vars.children.size(); k++) {
		int c = vars.childSlot(vars.children[k]);
		const char *name = data.powSys->buses[vars.children[k]].name.c_str();

		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "envelopeLow(%s)(%d)(%d)", name, i, j);
				IloConstraint c1( vars.Pminus[c][i][j] - vars.PCmin[c] >= 0 ); c1.setName(elemName); model.add(c1);

				snprintf(elemName, NAMESIZE, "envelopeUp(%s)(%d)(%d)", name, i, j);
				IloConstraint c2( vars.PCmax[c] - vars.Pminus[c][i][j] >= 0 ); c2.setName(elemName); model.add(c2);
			}
		}
	}
}

void addParentPowerBounds (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (unsigned int k=0; k<vars.parents.size(); k++) {
		int p = vars.parentSlot(vars.parents[k]);

		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "parentPower(%s)(%d)(%d)", data.powSys->buses[vars.parents[k]].name.c_str(), i, j);
				IloRange r(env, params.P_min, vars.Pplus[p][i][j], params.P_max, elemName);
				model.add(r);
			}
		}
	}
}

void addEnvelopeOrdering (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];

	for (unsigned int k=0; k<vars.children.size(); k++) {
		int c = vars.childSlot(vars.children[k]);
		snprintf(elemName, NAMESIZE, "envelopeOrder(%s)", data.powSys->buses[vars.children[k]].name.c_str());
		IloConstraint r( vars.PCmax[c] - vars.PCmin[c] >= 0 ); r.setName(elemName); model.add(r);
	}
}

/****************************************************************************
 * addEnvelopeVertices
 * - The first vertex dimension walks the envelope from PCmax (i = 0) down to
 * PCmin (i = numVertP-1). Both end points are always realised, so at least
 * two vertices are needed.
 ****************************************************************************/
void addEnvelopeVertices (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];

	if ( vars.numVertP < 2 )
		throw ConfigurationError("the envelope needs at least two power vertices");

	for (unsigned int k=0; k<vars.children.size(); k++) {
		int c = vars.childSlot(vars.children[k]);

		for (int i=0; i<vars.numVertP; i++) {
			double w = (double) i / (vars.numVertP - 1);

			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "envelopeVertex(%s)(%d)(%d)", data.powSys->buses[vars.children[k]].name.c_str(), i, j);
				IloConstraint r( vars.Pminus[c][i][j] - (1.0 - w) * vars.PCmax[c] - w * vars.PCmin[c] == 0 );
				r.setName(elemName); model.add(r);
			}
		}
	}
}

/* 0 <= E <= P at injecting buses, P <= E <= 0 at consuming ones */
void addInjectionSignRules (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	for (int n=0; n<vars.numBus; n++) {
		double P = data.powSys->buses[n].P;
		if ( fabs(P) < EPSzero )
			continue;

		for (int i=0; i<vars.numVertP; i++) {
			for (int j=0; j<vars.numVertV; j++) {
				snprintf(elemName, NAMESIZE, "injectionSign(%d)(%d)(%d)", n, i, j);
				IloRange r(env, min(0.0, P), vars.E[n][i][j], max(0.0, P), elemName);
				model.add(r);
			}
		}
	}
}

IloNumVarArray addDSOCenterGap (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params) {
	char elemName[NAMESIZE];
	IloEnv env = model.getEnv();

	// every reference value must belong to a child
	for (map<string, double>::const_iterator it = params.infoDSO.begin(); it != params.infoDSO.end(); ++it)
		vars.childSlot( data.powSys->getBusIndex(it->first) );

	int numChild = (int) vars.children.size();
	IloNumVarArray gap(env, numChild, 0, IloInfinity, ILOFLOAT);

	for (int k=0; k<numChild; k++) {
		int c = vars.childSlot(vars.children[k]);
		const string &name = data.powSys->buses[vars.children[k]].name;

		snprintf(elemName, NAMESIZE, "gap(%s)", name.c_str());
		gap[c].setName(elemName);

		map<string, double>::const_iterator it = params.infoDSO.find(name);
		if ( it == params.infoDSO.end() ) {
			gap[c].setUB(0);
			continue;
		}

		snprintf(elemName, NAMESIZE, "gapPos(%s)", name.c_str());
		IloConstraint c1( gap[c] - 0.5*(vars.PCmin[c] + vars.PCmax[c]) >= -it->second ); c1.setName(elemName); model.add(c1);

		snprintf(elemName, NAMESIZE, "gapNeg(%s)", name.c_str());
		IloConstraint c2( gap[c] + 0.5*(vars.PCmin[c] + vars.PCmax[c]) >= it->second ); c2.setName(elemName); model.add(c2);
	}
	model.add(gap);

	return gap;
}

/****************************************************************************
 * buildDCPowerflow
 * - Linearised power flow: nodal injection, PTDF flows, current definition and
 * the global power balance.
 ****************************************************************************/
void buildDCPowerflow (DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log) {
	addNodalInjection(doe.model, doe.vars, data, params);
	addPTDFConsistency(doe.model, doe.vars, data, params);
	addCurrentDefinition(doe.model, doe.vars, data, params);
	addPowerBalance(doe.model, doe.vars, data, params);

	log << "DC power flow constraints attached." << endl;
}

/****************************************************************************
 * attachSecurityConstraints
 * - Limits and envelope constraints shared by every power flow mode.
 ****************************************************************************/
void attachSecurityConstraints (DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log) {
	addAbsValueRelaxation(doe.model, doe.vars, data, params);
	addCurtailmentBudget(doe.model, doe.vars, data, params);
	addCurrentBounds(doe.model, doe.vars, data, params);
	addPhaseBounds(doe.model, doe.vars, data, params);
	addParentPowerBounds(doe.model, doe.vars, data, params);
	addFixedVoltage(doe.model, doe.vars, data, params);
	addChildVoltageBounds(doe.model, doe.vars, data, params);
	addChildEnvelopeBounds(doe.model, doe.vars, data, params);
	addEnvelopeVertices(doe.model, doe.vars, data, params);
	addEnvelopeOrdering(doe.model, doe.vars, data, params);

	if ( params.injectionSignRules ) {
		addInjectionSignRules(doe.model, doe.vars, data, params);
		log << "Injection sign rules enabled." << endl;
	}

	if ( !params.infoDSO.empty() ) {
		doe.gap = addDSOCenterGap(doe.model, doe.vars, data, params);
		log << "DSO centre gap added for " << params.infoDSO.size() << " children." << endl;
	}

	log << "Security constraints attached." << endl;
}
