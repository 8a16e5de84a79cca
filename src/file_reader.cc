#include <cerrno>
#include <fstream>
#include <catio/file_reader.hpp>

VM_BEGIN_MODULE( catio )

using namespace std;

struct FileReaderImpl
{
	FileReaderImpl( FileOptions const &opts ) :
	  buf( opts.buffer_size )
	{
	}

	void open( string const &path )
	{
		if ( !buf.empty() ) {
			is.rdbuf()->pubsetbuf( buf.data(), buf.size() );
		}
		errno = 0;
		is.open( path, ios::in | ios::binary );
		if ( !is.is_open() ) {
			auto err = errno;
			is.clear();
			throw IoError::from_errno( err, vm::fmt( "failed to open {}", path ) );
		}
	}

	ifstream is;
	vector<char> buf;
};

VM_EXPORT
{
	FileReader::FileReader( string const &path, FileOptions const &opts ) :
	  path( path ),
	  _( new FileReaderImpl( opts ) )
	{
	}

	FileReader::~FileReader()
	{
	}

	size_t FileReader::read( char *dst, size_t len )
	{
		if ( len == 0 ) return 0;
		if ( !_->is.is_open() ) {
			_->open( path );
		}
		errno = 0;
		auto nread = size_t( _->is.read( dst, len ).gcount() );
		if ( _->is.bad() ) {
			auto err = errno;
			throw IoError::from_errno( err, vm::fmt( "failed to read {}", path ) );
		}
		return nread;
	}

	bool FileReader::is_open() const
	{
		return _->is.is_open();
	}

	FileSequence::FileSequence( vector<string> const &paths, FileOptions const &opts ) :
	  paths( paths ),
	  opts( opts )
	{
	}

	unique_ptr<FileReader> FileSequence::next()
	{
		if ( idx == paths.size() ) return nullptr;
		return unique_ptr<FileReader>( new FileReader( paths[ idx++ ], opts ) );
	}

	ConcatReader<FileReader> concat_path( vector<string> const &paths,
										  FileOptions const &file_opts,
										  ConcatOptions const &opts )
	{
		return ConcatReader<FileReader>(
		  unique_ptr<Sequence<FileReader>>( new FileSequence( paths, file_opts ) ), opts );
	}
}

VM_END_MODULE()
