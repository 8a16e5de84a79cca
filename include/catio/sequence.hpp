#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <VMUtils/concepts.hpp>
#include <VMUtils/modules.hpp>
#include "io.hpp"

VM_BEGIN_MODULE( catio )

using namespace std;

VM_EXPORT
{
	/* forward-only producer of sources, a null pointer marks the end */
	template <typename R = Reader>
	struct Sequence : vm::Dynamic
	{
		virtual unique_ptr<R> next() = 0;
	};

	template <typename R = Reader>
	struct VectorSequence : Sequence<R>
	{
		VectorSequence( vector<unique_ptr<R>> &&items ) :
		  items( std::move( items ) )
		{
		}

		unique_ptr<R> next() override
		{
			if ( idx == items.size() ) return nullptr;
			return std::move( items[ idx++ ] );
		}

	private:
		vector<unique_ptr<R>> items;
		size_t idx = 0;
	};

	template <typename R = Reader>
	struct FnSequence : Sequence<R>
	{
		FnSequence( function<unique_ptr<R>()> const &fn ) :
		  fn( fn )
		{
		}

		unique_ptr<R> next() override { return fn(); }

	private:
		function<unique_ptr<R>()> fn;
	};
}

VM_END_MODULE()
