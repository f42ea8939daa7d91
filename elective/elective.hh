#ifndef ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ELECTIVE_HH
#define ELECTIVE_ALGEBRA_GUARD_ELECTIVE_ELECTIVE_HH 1

#include <elective/assignment.hh>
#include <elective/conjunction.hh>
#include <elective/elimination.hh>
#include <elective/equation.hh>
#include <elective/exception.hh>
#include <elective/expression.hh>
#include <elective/normalize.hh>
#include <elective/parser.hh>
#include <elective/symbol.hh>
#include <elective/variables.hh>

#endif
