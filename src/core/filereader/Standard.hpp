#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdio>       // fread
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include <common.hpp>
#include <FileUtils.hpp>  // unique_file_ptr, throwingOpen

#include "FileReader.hpp"


namespace bgzfseek
{
class StandardFileReader :
    public FileReader
{
public:
    explicit
    StandardFileReader( std::string filePath ) :
        m_file( throwingOpen( filePath, "rb" ) ),
        m_fileDescriptor( ::fileno( fp() ) ),
        m_filePath( std::move( filePath ) ),
        m_seekable( determineSeekable( m_fileDescriptor ) ),
        m_fileSizeBytes( std::filesystem::file_size( m_filePath ) )
    {
        init();
    }

    explicit
    StandardFileReader( const std::filesystem::path& filePath ) :
        StandardFileReader( filePath.string() )
    {}

    /* Add this to avoid ambiguity for const char*, which would otherwise be the case with only
     * std::string and std::filesystem::path constructors. */
    explicit
    StandardFileReader( const char* filePath ) :
        StandardFileReader( std::string( filePath ) )
    {}

    explicit
    StandardFileReader( int fileDescriptor ) :
        /* Use dup here so that the following fclose will not close the original file descriptor,
         * which probably is still in use by the caller! Note that dup will not guarantee independent
         * file positions though, so restore the previous position after closing. */
        m_file( throwingOpen( dup( fileDescriptor ), "rb" ) ),
        m_fileDescriptor( ::fileno( fp() ) ),
        m_filePath( "/dev/fd/" + std::to_string( fileDescriptor ) ),
        m_seekable( determineSeekable( m_fileDescriptor ) ),
        m_fileSizeBytes( fileSize( m_fileDescriptor ) )
    {
        init();
    }

    ~StandardFileReader() override
    {
        StandardFileReader::close();
    }

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        throw std::invalid_argument( "Cloning file path reader not allowed because the internal file position "
                                     "should not be modified by multiple owners!" );
    }

    /* Copying is simply not allowed because that might interfere with the file position state, use SharedFileReader! */

    void
    close() override
    {
        if ( !m_file ) {
            return;
        }

        /* Try to restore the file position the file had before it was given to us. */
        if ( m_seekable ) {
            std::fsetpos( m_file.get(), &m_initialPosition );
        }

        m_file.reset();
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_file;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_seekable ? m_currentPosition >= m_fileSizeBytes : !m_lastReadSuccessful;
    }

    [[nodiscard]] bool
    fail() const override
    {
        return std::ferror( fp() ) != 0;
    }

    [[nodiscard]] int
    fileno() const override
    {
        if ( m_file ) {
            return m_fileDescriptor;
        }
        throw std::invalid_argument( "Trying to get fileno of an invalid file!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return m_seekable;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        if ( !m_file ) {
            throw std::invalid_argument( "Invalid or file can't be seeked!" );
        }

        if ( nMaxBytesToRead == 0 ) {
            return 0;
        }

        size_t nBytesRead = 0;
        if ( buffer == nullptr ) {
            if ( !seekable() ) {
                throw std::invalid_argument( "Skipping bytes is only supported for seekable files!" );
            }
            nBytesRead = std::min( nMaxBytesToRead, m_fileSizeBytes - std::min( m_currentPosition, m_fileSizeBytes ) );
            fileSeek( m_file.get(), static_cast<long long int>( nBytesRead ), SEEK_CUR );
        } else {
            nBytesRead = std::fread( buffer, /* element size */ 1, nMaxBytesToRead, m_file.get() );
        }

        if ( nBytesRead == 0 ) {
            /* fread returning 0 might traditionally be a valid case if the file position was after the last byte.
             * EOF is only set after reading after the end not when the file position is at the end. */
            m_lastReadSuccessful = false;
            return 0;
        }

        m_currentPosition += nBytesRead;
        m_lastReadSuccessful = nBytesRead == nMaxBytesToRead;

        return nBytesRead;
    }

    /**
     * Uses POSIX pread, which reads at the given offset without touching the file position of the descriptor.
     */
    [[nodiscard]] size_t
    pread( char*  buffer,
           size_t nMaxBytesToRead,
           size_t offset ) override
    {
        if ( !m_file || !m_seekable ) {
            throw std::invalid_argument( "Invalid or file can't be seeked!" );
        }

        size_t nTotalBytesRead = 0;
        while ( nTotalBytesRead < nMaxBytesToRead ) {
            const auto nBytesRead = ::pread( m_fileDescriptor, buffer + nTotalBytesRead,
                                             nMaxBytesToRead - nTotalBytesRead,
                                             static_cast<off_t>( offset + nTotalBytesRead ) );
            if ( nBytesRead < 0 ) {
                if ( errno == EINTR ) {
                    continue;
                }
                std::stringstream message;
                message << "Failed to read " << nMaxBytesToRead << " B at offset " << offset << " from '"
                        << m_filePath << "': " << std::strerror( errno );
                throw std::runtime_error( std::move( message ).str() );
            }
            if ( nBytesRead == 0 ) {
                break;
            }
            nTotalBytesRead += static_cast<size_t>( nBytesRead );
        }
        return nTotalBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( !m_file || !m_seekable ) {
            throw std::invalid_argument( "Invalid or file can't be seeked!" );
        }

        fileSeek( m_file.get(), offset, origin );

        if ( origin == SEEK_SET ) {
            m_currentPosition = static_cast<size_t>( std::max( 0LL, offset ) );
        } else {
            /* Note that the file must be seekable at this point, meaning std::ftell will work! */
            m_currentPosition = filePosition( m_file.get() );
        }

        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_fileSizeBytes;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        if ( m_seekable ) {
            return filePosition( fp() );
        }
        return m_currentPosition;
    }

    void
    clearerr() override
    {
        std::clearerr( fp() );
    }

    [[nodiscard]] const std::string&
    filePath() const noexcept
    {
        return m_filePath;
    }

private:
    void
    init()
    {
        std::fgetpos( fp(), &m_initialPosition );

        if ( m_seekable ) {
            StandardFileReader::seek( 0, SEEK_SET );
        }
    }

    [[nodiscard]] static bool
    determineSeekable( int fileNumber )
    {
        struct stat fileStats{};
        fstat( fileNumber, &fileStats );
        return !S_ISFIFO( fileStats.st_mode );
    }

    [[nodiscard]] FILE*
    fp() const
    {
        if ( m_file ) {
            return m_file.get();
        }
        throw std::invalid_argument( "Operation not allowed on an invalid file!" );
    }

protected:
    unique_file_ptr m_file;
    const int m_fileDescriptor;
    const std::string m_filePath;

    std::fpos_t m_initialPosition{};
    const bool m_seekable;
    const size_t m_fileSizeBytes;

    size_t m_currentPosition{ 0 };  /**< Only necessary for unseekable files. */
    bool m_lastReadSuccessful{ true };
};
}  // namespace bgzfseek
