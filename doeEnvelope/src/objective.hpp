/*
 * objective.hpp
 *
 * Objective builders and the post-solve check of the |E| relaxation.
 */

#ifndef OBJECTIVE_HPP_
#define OBJECTIVE_HPP_

#include "DOEmodel.hpp"

/* maximize sum_c (PCmin[c] + PCmax[c]) - alpha O [- beta sum_c gap[c]] */
void buildGlobalSum	(DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log);
void buildFairness	(DOEmodel &doe, const instance &data, const DOEparams &params, ostream &log);

/* Returns max(absE - |E|) over every (bus, i, j) and lists the entries whose
 * gap exceeds relaxationTol. */
double checkAbsRelaxationTightness (IloCplex &cplex, const DOEvariables &vars, const instance &data, vector<string> &violations);

#endif /* OBJECTIVE_HPP_ */
