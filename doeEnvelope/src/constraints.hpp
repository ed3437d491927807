/*
 * constraints.hpp
 *
 * Constraint families of the envelope model. Every family is replicated over
 * the full vertex grid, reads the variable record and adds rows to the model.
 * A family raises ConfigurationError when it meets an index that the record
 * does not declare.
 */

#ifndef CONSTRAINTS_HPP_
#define CONSTRAINTS_HPP_

#include "DOEmodel.hpp"

void addAbsValueRelaxation	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addCurrentBounds		(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addFixedVoltage		(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addNodalInjection		(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addPTDFConsistency		(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addCurtailmentBudget	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addPhaseBounds			(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addChildVoltageBounds	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addCurrentDefinition	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addPowerBalance		(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addChildEnvelopeBounds	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addParentPowerBounds	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addEnvelopeOrdering	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addEnvelopeVertices	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);
void addInjectionSignRules	(IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);

/* Introduces gap[c] >= |(PCmin[c] + PCmax[c])/2 - info_DSO[c]| and returns it.
 * Children without a reference value get a gap fixed at zero. */
IloNumVarArray addDSOCenterGap (IloModel &model, const DOEvariables &vars, const instance &data, const DOEparams &params);

/* Model builders */
void buildDCPowerflow			(DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log);
void attachSecurityConstraints	(DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log);

#endif /* CONSTRAINTS_HPP_ */
