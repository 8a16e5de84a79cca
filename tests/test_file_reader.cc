#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <catio/file_reader.hpp>
#include "utils/sources.hpp"

using namespace catio;
using namespace catio::test;
using namespace std;

namespace
{
string temp_path( string const &name )
{
	auto dir = testing::TempDir();
	if ( !dir.empty() && dir.back() != '/' ) dir += '/';
	return dir + "catio_" + name;
}

string write_file( string const &name, string const &content )
{
	auto path = temp_path( name );
	ofstream os( path, ios::binary | ios::trunc );
	os.write( content.data(), content.size() );
	return path;
}

}  // namespace

TEST( test_file_reader, reads_files_in_order )
{
	auto a = write_file( "a.txt", "some\ntext\n" );
	auto e = write_file( "empty.txt", "" );
	auto b = write_file( "b.txt", "here's more" );
	auto reader = concat_path( { a, e, b } );
	EXPECT_EQ( nullptr, reader.identity() );

	char buf[ 32 ];
	EXPECT_EQ( 10, reader.read( buf, sizeof( buf ) ) );
	EXPECT_EQ( a, *reader.identity() );
	EXPECT_EQ( 11, reader.read( buf, sizeof( buf ) ) );
	EXPECT_EQ( "here's more", string( buf, 11 ) );
	EXPECT_EQ( b, *reader.identity() );
	EXPECT_EQ( 0, reader.read( buf, sizeof( buf ) ) );
	EXPECT_EQ( nullptr, reader.identity() );
	EXPECT_EQ( 3, reader.pulled() );
}

TEST( test_file_reader, opens_on_first_read )
{
	auto missing = temp_path( "never_created.txt" );
	remove( missing.c_str() );

	FileReader file( missing );
	EXPECT_FALSE( file.is_open() );
	EXPECT_EQ( missing, file.identity() );

	auto reader = concat_path( { missing } );
	EXPECT_EQ( nullptr, reader.current() );

	char buf[ 4 ];
	EXPECT_EQ( 0, reader.read( buf, 0 ) );
	EXPECT_EQ( nullptr, reader.current() );

	try {
		reader.read( buf, sizeof( buf ) );
		FAIL() << "expected IoError";
	} catch ( IoError &e ) {
		EXPECT_EQ( make_error_code( errc::no_such_file_or_directory ), e.code() );
		EXPECT_NE( string::npos, string( e.what() ).find( missing ) );
	}
	ASSERT_NE( nullptr, reader.identity() );
	EXPECT_EQ( missing, *reader.identity() );
}

TEST( test_file_reader, retries_open_on_next_read )
{
	auto late = temp_path( "late.txt" );
	remove( late.c_str() );
	auto reader = concat_path( { late } );

	char buf[ 8 ];
	EXPECT_THROW( reader.read( buf, sizeof( buf ) ), IoError );
	write_file( "late.txt", "arrived" );
	EXPECT_EQ( 7, reader.read( buf, sizeof( buf ) ) );
	EXPECT_EQ( "arrived", string( buf, 7 ) );
	EXPECT_TRUE( reader.current()->is_open() );
}

TEST( test_file_reader, fails_on_missing_file )
{
	auto one = write_file( "1byte", "1" );
	auto two = write_file( "2byte", "22" );
	auto missing = temp_path( "404" );
	remove( missing.c_str() );
	auto three = write_file( "3byte", "333" );
	auto four = write_file( "4byte", "4444" );
	auto reader = concat_path( { one, two, missing, three, four } );

	vector<char> out;
	EXPECT_THROW( read_to_end( reader, out ), IoError );
	EXPECT_EQ( "122", string( out.begin(), out.end() ) );
	EXPECT_EQ( missing, *reader.identity() );

	EXPECT_THROW( read_to_end( reader, out ), IoError );
	EXPECT_EQ( missing, *reader.identity() );

	EXPECT_TRUE( reader.skip() );
	EXPECT_EQ( three, *reader.identity() );
	EXPECT_FALSE( reader.current()->is_open() );
	EXPECT_EQ( 7, read_to_end( reader, out ) );
	EXPECT_EQ( "1223334444", string( out.begin(), out.end() ) );
	EXPECT_TRUE( reader.exhausted() );
}

TEST( test_file_reader, custom_buffer_size )
{
	string content;
	for ( int i = 0; i != 1000; ++i ) content += char( 'a' + i % 26 );
	auto big = write_file( "big.bin", content );
	auto small = write_file( "small.bin", "!" );
	auto reader = concat_path( { big, small }, FileOptions{}.set_buffer_size( 16 ) );
	EXPECT_EQ( content + "!", drain( reader, 7 ) );
}

TEST( test_file_reader, sequence_yields_unopened_files )
{
	FileSequence seq( { temp_path( "x" ), temp_path( "y" ) } );
	auto x = seq.next();
	auto y = seq.next();
	ASSERT_NE( nullptr, x.get() );
	ASSERT_NE( nullptr, y.get() );
	EXPECT_EQ( temp_path( "x" ), x->identity() );
	EXPECT_EQ( temp_path( "y" ), y->identity() );
	EXPECT_FALSE( x->is_open() );
	EXPECT_EQ( nullptr, seq.next().get() );
	EXPECT_EQ( nullptr, seq.next().get() );
}
