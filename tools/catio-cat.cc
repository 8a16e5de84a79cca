#include <iostream>
#include <string>
#include <VMUtils/cmdline.hpp>
#include <VMUtils/fmt.hpp>
#include <catio/file_reader.hpp>
#include <catio/utils/buffered_reader.hpp>

using namespace std;
using namespace catio;

int main( int argc, char **argv )
{
	cmdline::parser a;
	a.add( "verbose", 'v', "log the file each printed line was read from" );
	a.add( "trace", 't', "log every source switch" );
	a.add<size_t>( "buffer", 'b', "read buffer size in bytes", false, 8192 );
	a.footer( "file..." );

	a.parse_check( argc, argv );

	auto files = a.rest();
	if ( files.empty() ) {
		vm::eprintln( "{}", a.usage() );
		return 1;
	}
	auto verbose = a.exist( "verbose" );

	try {
		auto reader = concat_path( files,
								   FileOptions{},
								   ConcatOptions{}.set_verbose( a.exist( "trace" ) ) );
		BufferedReader<ConcatReader<FileReader>> buffered( reader, a.get<size_t>( "buffer" ) );

		string line, last_path;
		while ( buffered.read_line( line ) ) {
			if ( verbose ) {
				auto path = buffered.get().identity();
				if ( path && *path != last_path ) {
					vm::eprintln( "read from {}", *path );
					last_path = *path;
				}
			}
			cout.write( line.data(), line.size() );
			line.clear();
		}
		cout.flush();
	} catch ( exception &e ) {
		vm::eprintln( "{}", e.what() );
		return 1;
	}
}
