#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>


namespace bgzfseek
{
inline bool
fileExists( const std::string& filePath )
{
    return std::ifstream( filePath, std::ios_base::in | std::ios_base::binary ).good();
}


inline size_t
fileSize( const std::string& filePath )
{
    return std::filesystem::file_size( filePath );
}


[[nodiscard]] inline size_t
fileSize( int fileDescriptor )
{
    struct stat fileStats{};
    if ( fstat( fileDescriptor, &fileStats ) != 0 ) {
        throw std::runtime_error( "Could not query the size of file descriptor " + std::to_string( fileDescriptor ) );
    }
    return static_cast<size_t>( fileStats.st_size );
}


inline size_t
filePosition( std::FILE* file )
{
    if ( file == nullptr ) {
        throw std::runtime_error( "File pointer to call tell on must not be null!" );
    }

    const auto offset = std::ftell( file );
    if ( offset < 0 ) {
        throw std::runtime_error( "Could not get the file position!" );
    }
    return static_cast<size_t>( offset );
}


inline void
fileSeek( std::FILE*    file,
          long long int offset,
          int           origin )
{
    if ( file == nullptr ) {
        throw std::runtime_error( "File pointer to call seek on must not be null!" );
    }

    if ( offset > static_cast<long long int>( std::numeric_limits<long int>::max() ) ) {
        throw std::out_of_range( "std::fseek only takes long int, try compiling for 64 bit." );
    }

    const auto returnCode = std::fseek( file, static_cast<long int>( offset ), origin );
    if ( returnCode != 0 ) {
        std::stringstream message;
        message << "Seeking to " << offset << " failed with code: " << returnCode << ", " << std::strerror( errno );
        throw std::runtime_error( std::move( message ).str() );
    }
}


using unique_file_ptr = std::unique_ptr<std::FILE, std::function<void ( std::FILE* )> >;

inline unique_file_ptr
make_unique_file_ptr( std::FILE* file )
{
    return {
        file,
        [] ( auto* ownedFile ) {
            if ( ownedFile != nullptr ) {
                std::fclose( ownedFile );  // NOLINT
            }
        }
    };
}


inline unique_file_ptr
make_unique_file_ptr( char const* const filePath,
                      char const* const mode )
{
    if ( ( filePath == nullptr ) || ( mode == nullptr ) || ( std::strlen( filePath ) == 0 ) ) {
        return {};
    }
    return make_unique_file_ptr( std::fopen( filePath, mode ) );  // NOLINT
}


inline unique_file_ptr
make_unique_file_ptr( int         fileDescriptor,
                      char const* mode )
{
    return make_unique_file_ptr( fdopen( fileDescriptor, mode ) );
}


inline unique_file_ptr
throwingOpen( const std::string& filePath,
              const char*        mode )
{
    if ( mode == nullptr ) {
        throw std::invalid_argument( "Mode must be a C-String and not null!" );
    }

    auto file = make_unique_file_ptr( filePath.c_str(), mode );
    if ( file == nullptr ) {
        std::stringstream msg;
        msg << "Opening file '" << filePath << "' with mode '" << mode << "' failed! " << std::strerror( errno );
        throw std::invalid_argument( std::move( msg ).str() );
    }

    return file;
}


inline unique_file_ptr
throwingOpen( int         fileDescriptor,
              const char* mode )
{
    if ( mode == nullptr ) {
        throw std::invalid_argument( "Mode must be a C-String and not null!" );
    }

    auto file = make_unique_file_ptr( fileDescriptor, mode );
    if ( file == nullptr ) {
        std::stringstream msg;
        msg << "Opening file descriptor " << fileDescriptor << " with mode '" << mode << "' failed!";
        throw std::invalid_argument( std::move( msg ).str() );
    }

    return file;
}


template<typename Container = std::vector<char> >
[[nodiscard]] Container
readFile( const std::string& fileName )
{
    Container contents( fileSize( fileName ) );
    const auto file = throwingOpen( fileName, "rb" );
    const auto nBytesRead = std::fread( contents.data(), sizeof( contents[0] ), contents.size(), file.get() );

    if ( nBytesRead != contents.size() ) {
        throw std::logic_error( "Did read less bytes than file is large!" );
    }

    return contents;
}


template<typename Container>
void
writeFile( const std::string& fileName,
           const Container&   contents )
{
    const auto file = throwingOpen( fileName, "wb" );
    const auto nBytesWritten = std::fwrite( contents.data(), sizeof( contents[0] ), contents.size(), file.get() );
    if ( nBytesWritten != contents.size() ) {
        throw std::runtime_error( "Failed to write all data to '" + fileName + "'!" );
    }
}


/**
 * Writes all of the given data to the file descriptor, retrying on partial writes.
 * @return errno or 0 on success.
 */
[[nodiscard]] inline int
writeAllToFd( const int         outputFileDescriptor,
              const void* const dataToWrite,
              const uint64_t    dataToWriteSize )
{
    for ( uint64_t nTotalWritten = 0; nTotalWritten < dataToWriteSize; ) {
        const auto currentBufferPosition =
            reinterpret_cast<const void*>( reinterpret_cast<uintptr_t>( dataToWrite ) + nTotalWritten );
        const auto nBytesWritten = ::write( outputFileDescriptor, currentBufferPosition,
                                            dataToWriteSize - nTotalWritten );
        if ( nBytesWritten <= 0 ) {
            return errno;
        }
        nTotalWritten += static_cast<uint64_t>( nBytesWritten );
    }
    return 0;
}
}  // namespace bgzfseek
