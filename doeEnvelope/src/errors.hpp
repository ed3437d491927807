//
//  errors.hpp
//  DOE-Envelope
//

#ifndef errors_hpp
#define errors_hpp

#include <stdexcept>
#include <string>

class DOEerror : public std::runtime_error {
public:
	explicit DOEerror (const std::string &msg) : std::runtime_error(msg) {}
};

/* Missing or inconsistent input. Raised before any model is built. */
class ConfigurationError : public DOEerror {
public:
	explicit ConfigurationError (const std::string &msg) : DOEerror("Configuration error: " + msg) {}
};

/* A declared mode or objective without an implementation. */
class NotImplementedError : public DOEerror {
public:
	explicit NotImplementedError (const std::string &msg) : DOEerror("Not implemented: " + msg) {}
};

/* Singular or non-finite sensitivity computation. */
class NumericalError : public DOEerror {
public:
	explicit NumericalError (const std::string &msg) : DOEerror("Numerical error: " + msg) {}
};

/* The solver session could not be created (licence, connection). */
class SolverError : public DOEerror {
public:
	explicit SolverError (const std::string &msg) : DOEerror("Solver error: " + msg) {}
};

#endif /* errors_hpp */
