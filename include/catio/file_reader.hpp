#pragma once

#include <memory>
#include <string>
#include <vector>

#include <VMUtils/attributes.hpp>
#include <VMUtils/modules.hpp>
#include <VMUtils/nonnull.hpp>
#include "concat_reader.hpp"
#include "io.hpp"
#include "sequence.hpp"

VM_BEGIN_MODULE( catio )

struct FileReaderImpl;

VM_EXPORT
{
	struct FileOptions
	{
		/* size of the per-file stream buffer, 0 keeps the library default */
		VM_DEFINE_ATTRIBUTE( std::size_t, buffer_size ) = 0;
	};

	/* file source identified by its path. the file is opened by the first
	   non-empty read; a failed open throws IoError and is retried by the
	   next read. */
	struct FileReader final : Reader
	{
		FileReader( std::string const &path, FileOptions const &opts = FileOptions{} );
		~FileReader();

		std::size_t read( char *dst, std::size_t len ) override;
		std::string const &identity() const { return path; }
		bool is_open() const;

	private:
		std::string path;
		vm::Box<FileReaderImpl> _;
	};

	struct FileSequence final : Sequence<FileReader>
	{
		FileSequence( std::vector<std::string> const &paths, FileOptions const &opts = FileOptions{} );

		std::unique_ptr<FileReader> next() override;

	private:
		std::vector<std::string> paths;
		std::size_t idx = 0;
		FileOptions opts;
	};

	ConcatReader<FileReader> concat_path( std::vector<std::string> const &paths,
										  FileOptions const &file_opts = FileOptions{},
										  ConcatOptions const &opts = ConcatOptions{} );
}

VM_END_MODULE()
