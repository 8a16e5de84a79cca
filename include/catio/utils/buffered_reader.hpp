#pragma once

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include <VMUtils/modules.hpp>
#include "../io.hpp"

VM_BEGIN_MODULE( catio )

using namespace std;

VM_EXPORT
{
	template <typename R>
	struct BufferedReader : Reader
	{
		BufferedReader( R &_, size_t capacity = 8192 ) :
		  _( _ ),
		  buf( std::max( capacity, size_t( 1 ) ) )
		{
		}

		size_t read( char *dst, size_t dlen ) override
		{
			if ( beg == end ) {
				if ( dlen >= buf.size() ) return _.read( dst, dlen );
				if ( !fill() ) return 0;
			}
			auto nread = std::min( dlen, end - beg );
			memcpy( dst, buf.data() + beg, nread );
			beg += nread;
			return nread;
		}

		/* appends bytes up to and including the next '\n', returns the number
		   of bytes appended, 0 at the end of the stream */
		size_t read_line( string &line )
		{
			size_t total = 0;
			while ( beg != end || fill() ) {
				auto first = buf.data() + beg;
				auto last = buf.data() + end;
				auto nl = std::find( first, last, '\n' );
				auto n = size_t( nl == last ? last - first : nl - first + 1 );
				line.append( first, n );
				beg += n;
				total += n;
				if ( nl != last ) break;
			}
			return total;
		}

		R &get() { return _; }
		R const &get() const { return _; }
		size_t buffered() const { return end - beg; }
		size_t capacity() const { return buf.size(); }

	private:
		bool fill()
		{
			beg = 0;
			end = 0;
			end = _.read( buf.data(), buf.size() );
			return end != 0;
		}

	private:
		R &_;
		vector<char> buf;
		size_t beg = 0, end = 0;
	};
}

VM_END_MODULE()
