// Created 08-Aug-2011 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_RUNTIME_ERROR
#define WCOSMO_RUNTIME_ERROR

#include <stdexcept>
#include <string>

namespace wcosmo {
    // Signals a configuration error: an invalid grid, an unknown cosmology name
    // or inconsistent inputs. Numerical problems in the formulas themselves are
    // left to floating point semantics and never raise this.
	class RuntimeError : public std::runtime_error {
	public:
		explicit RuntimeError(std::string const &reason);
		virtual ~RuntimeError() throw ();
	private:
	}; // RuntimeError
	
	inline RuntimeError::RuntimeError(std::string const &reason)
	: std::runtime_error(reason) { }

    inline RuntimeError::~RuntimeError() throw () { }
} // wcosmo

#endif // WCOSMO_RUNTIME_ERROR
