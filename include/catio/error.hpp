#pragma once

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

#include <VMUtils/fmt.hpp>
#include <VMUtils/modules.hpp>

VM_BEGIN_MODULE( catio )

using namespace std;

VM_EXPORT
{
	struct IoError : std::runtime_error
	{
		IoError( error_code const &ec, string const &what ) :
		  runtime_error( vm::fmt( "{}: {}", what, ec.message() ) ),
		  ec( ec )
		{
		}

		/* builds an error from a saved errno, EIO when the failing call did
		   not set one */
		static IoError from_errno( int err, string const &what )
		{
			return IoError( error_code( err ? err : EIO, generic_category() ), what );
		}

		error_code const &code() const { return ec; }

	private:
		error_code ec;
	};
}

VM_END_MODULE()
