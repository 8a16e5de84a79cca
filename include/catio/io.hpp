#pragma once

#include <algorithm>
#include <cstring>
#include <istream>
#include <vector>

#include <VMUtils/concepts.hpp>
#include <VMUtils/modules.hpp>
#include "error.hpp"

VM_BEGIN_MODULE( catio )

using namespace std;

VM_EXPORT
{
	/* sequential byte source: fills up to len bytes of dst and returns the
	   number written, 0 once exhausted. failures throw IoError. */
	struct Reader : vm::Dynamic
	{
		virtual size_t read( char *dst, size_t len ) = 0;
	};

	struct SliceReader : Reader
	{
		SliceReader( char const *src, size_t slen ) :
		  src( src ),
		  slen( slen )
		{
		}

		size_t read( char *dst, size_t dlen ) override
		{
			auto nread = std::min( slen - p, dlen );
			memcpy( dst, src + p, nread );
			p += nread;
			return nread;
		}
		size_t remaining() const { return slen - p; }

	private:
		char const *src;
		size_t p = 0;
		size_t slen;
	};

	struct StreamReader : Reader
	{
		StreamReader( istream &is ) :
		  is( is )
		{
		}

		size_t read( char *dst, size_t dlen ) override
		{
			if ( dlen == 0 ) return 0;
			auto nread = size_t( is.read( dst, dlen ).gcount() );
			if ( is.bad() ) {
				throw IoError( make_error_code( errc::io_error ), "stream reader" );
			}
			return nread;
		}

	private:
		istream &is;
	};

	inline void read_exact( Reader &reader, char *dst, size_t len )
	{
		while ( len > 0 ) {
			auto nread = reader.read( dst, len );
			if ( nread == 0 ) {
				throw IoError( make_error_code( errc::io_error ), "failed to fill whole buffer" );
			}
			dst += nread;
			len -= nread;
		}
	}

	inline size_t read_to_end( Reader &reader, vector<char> &dst )
	{
		char buf[ 4096 ];
		size_t total = 0;
		while ( auto nread = reader.read( buf, sizeof( buf ) ) ) {
			dst.insert( dst.end(), buf, buf + nread );
			total += nread;
		}
		return total;
	}
}

VM_END_MODULE()
