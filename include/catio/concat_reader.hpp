#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <VMUtils/attributes.hpp>
#include <VMUtils/fmt.hpp>
#include <VMUtils/modules.hpp>
#include "io.hpp"
#include "sequence.hpp"

VM_BEGIN_MODULE( catio )

using namespace std;

namespace detail
{
template <typename R, typename = void>
struct has_identity : false_type
{
};

template <typename R>
struct has_identity<R, decltype( void( declval<R const &>().identity() ) )> : true_type
{
};

template <typename R>
string describe( R const &src, size_t idx, true_type )
{
	return vm::fmt( "#{} ({})", idx, src.identity() );
}

template <typename R>
string describe( R const &, size_t idx, false_type )
{
	return vm::fmt( "#{}", idx );
}

}  // namespace detail

VM_EXPORT
{
	struct ConcatOptions
	{
		/* log every source transition to stderr */
		VM_DEFINE_ATTRIBUTE( bool, verbose ) = false;
	};

	/* reads through every source of a sequence as one stream.

	   sources are pulled lazily: nothing is acquired before the first read, and
	   an exhausted source is destroyed before its successor is pulled, so at
	   most one source is alive at a time. a source returning 0 is treated as
	   exhausted and skipped within the same call; the reader itself only
	   returns 0 once the whole sequence is spent. errors thrown by a source
	   propagate unchanged and leave it current. */
	template <typename R = Reader>
	struct ConcatReader : Reader
	{
		ConcatReader( unique_ptr<Sequence<R>> &&seq, ConcatOptions const &opts = {} ) :
		  seq( std::move( seq ) ),
		  opts( opts )
		{
		}

		size_t read( char *dst, size_t len ) override
		{
			if ( len == 0 ) return 0;
			while ( curr || pull() ) {
				if ( auto nread = curr->read( dst, len ) ) {
					return nread;
				}
				curr.reset();
			}
			return 0;
		}

		/* drops the current source and pulls the next one, returns whether a
		   source is current afterwards */
		bool skip()
		{
			curr.reset();
			return pull();
		}

		R *current() const { return curr.get(); }

		/* identity of the source that served the latest read, null when no
		   source is current */
		string const *identity() const
		{
			return curr ? &curr->identity() : nullptr;
		}

		bool exhausted() const { return done; }
		size_t pulled() const { return npulled; }

		friend ostream &operator<<( ostream &os, ConcatReader const &_ )
		{
			if ( _.curr ) {
				vm::fprint( os, "ConcatReader {{ current: {}, exhausted: {} }}",
							detail::describe( *_.curr, _.npulled - 1, detail::has_identity<R>{} ),
							_.done ? "true" : "false" );
			} else {
				vm::fprint( os, "ConcatReader {{ current: none, exhausted: {} }}",
							_.done ? "true" : "false" );
			}
			return os;
		}

	private:
		bool pull()
		{
			if ( done ) return false;
			curr = seq->next();
			if ( !curr ) {
				done = true;
				if ( opts.verbose ) {
					vm::eprintln( "sequence exhausted after {} source(s)", npulled );
				}
				return false;
			}
			if ( opts.verbose ) {
				vm::eprintln( "switched to source {}",
							  detail::describe( *curr, npulled, detail::has_identity<R>{} ) );
			}
			++npulled;
			return true;
		}

	private:
		unique_ptr<Sequence<R>> seq;
		unique_ptr<R> curr;
		ConcatOptions opts;
		size_t npulled = 0;
		bool done = false;
	};

	template <typename R>
	ConcatReader<R> concat( vector<unique_ptr<R>> &&sources, ConcatOptions const &opts = {} )
	{
		return ConcatReader<R>( unique_ptr<Sequence<R>>( new VectorSequence<R>( std::move( sources ) ) ),
								opts );
	}
}

VM_END_MODULE()
