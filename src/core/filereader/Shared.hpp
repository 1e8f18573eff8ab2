#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include <common.hpp>

#include "FileReader.hpp"
#include "Standard.hpp"


namespace bgzfseek
{
/**
 * Wraps a seekable FileReader so that it can be shared between multiple owners, each with its own independent
 * file position. All reads are positioned reads: either POSIX pread on the file descriptor of a
 * StandardFileReader or a call to @ref FileReader::pread under a mutex for all other file readers.
 */
class SharedFileReader final :
    public FileReader
{
private:
    /**
     * Create a new shared file reader from an existing FileReader. Takes ownership of the given FileReader!
     */
    explicit
    SharedFileReader( FileReader* file ) :
        m_mutex( std::make_shared<std::mutex>() ),
        m_fileSizeBytes( file == nullptr ? std::nullopt : file->size() ),
        m_currentPosition( file == nullptr ? 0 : file->tell() )
    {
        if ( file == nullptr ) {
            throw std::invalid_argument( "File reader may not be null!" );
        }

        if ( !file->seekable() ) {
            delete file;
            throw std::invalid_argument( "This class heavily relies on seeking and won't work with unseekable files!" );
        }

        if ( dynamic_cast<StandardFileReader*>( file ) != nullptr ) {
            m_fileDescriptor = file->fileno();
        }

        m_sharedFile =
            std::shared_ptr<FileReader>(
                file,
                [] ( auto* const p ) {
                    if ( ( p != nullptr ) && !p->closed() ) {
                        p->close();
                    }
                    delete p;
                }
            );
    }

    /**
     * Create a new shared file reader from an existing SharedFileReader by copying shared pointers.
     * The underlying file and mutex are held as a shared_ptr and therefore not copied itself!
     * Make it private because only @ref clone should call this. It cannot be defaulted because the FileReader
     * base class deleted its copy constructor.
     */
    SharedFileReader( const SharedFileReader& other ) :
        m_sharedFile( other.m_sharedFile ),
        m_fileDescriptor( other.m_fileDescriptor ),
        m_mutex( other.m_mutex ),
        m_fileSizeBytes( other.m_fileSizeBytes ),
        m_currentPosition( other.m_currentPosition )
    {}

public:
    explicit
    SharedFileReader( UniqueFileReader file ) :
        SharedFileReader( file.release() )
    {}

    /**
     * Creates a shallow copy of this file reader with an independent file position to access the underlying file.
     */
    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        return UniqueFileReader( new SharedFileReader( *this ) );
    }

    void
    close() override
    {
        /* This is a shared file. Closing the underlying file while it might be used by another owner
         * seems like a bug-prone functionality. It will be closed by the last owner, see the deleter
         * set in the constructor. */
        const std::scoped_lock lock( *m_mutex );
        m_sharedFile.reset();
    }

    [[nodiscard]] bool
    closed() const override
    {
        const std::scoped_lock lock( *m_mutex );
        return !m_sharedFile || m_sharedFile->closed();
    }

    [[nodiscard]] bool
    eof() const override
    {
        /* m_sharedFile->eof() won't work because some other owner might set the EOF bit on the underlying file! */
        return m_fileSizeBytes.has_value() && ( m_currentPosition >= *m_fileSizeBytes );
    }

    [[nodiscard]] bool
    fail() const override
    {
        const std::scoped_lock lock( *m_mutex );
        return !m_sharedFile || m_sharedFile->fail();
    }

    [[nodiscard]] int
    fileno() const override
    {
        if ( m_fileDescriptor >= 0 ) {
            return m_fileDescriptor;
        }

        const std::scoped_lock lock( *m_mutex );
        if ( m_sharedFile ) {
            return m_sharedFile->fileno();
        }
        throw std::invalid_argument( "Invalid or closed SharedFileReader has no associated fileno!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_fileSizeBytes;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        m_currentPosition = effectiveOffset( offset, origin );
        return m_currentPosition;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        const auto nBytesRead = pread( buffer, nMaxBytesToRead, m_currentPosition );
        m_currentPosition += nBytesRead;
        return nBytesRead;
    }

    [[nodiscard]] size_t
    pread( char*  buffer,
           size_t nMaxBytesToRead,
           size_t offset ) override
    {
        if ( buffer == nullptr ) {
            throw std::invalid_argument( "Buffer may not be nullptr!" );
        }

        if ( nMaxBytesToRead == 0 ) {
            return 0;
        }

        if ( m_fileSizeBytes.has_value() ) {
            if ( offset >= *m_fileSizeBytes ) {
                return 0;
            }
            nMaxBytesToRead = std::min( nMaxBytesToRead, *m_fileSizeBytes - offset );
        }

        const std::scoped_lock lock( *m_mutex );
        if ( !m_sharedFile ) {
            throw std::invalid_argument( "Invalid SharedFileReader cannot be read from!" );
        }

        /* StandardFileReader::pread uses POSIX pread, which does not need the lock for correctness,
         * but the lock also guards m_sharedFile against a concurrent close. */
        return m_sharedFile->pread( buffer, nMaxBytesToRead, offset );
    }

    [[nodiscard]] size_t
    tell() const override
    {
        /* Do not use m_sharedFile->tell() because another owner might move that internal file position! */
        return m_currentPosition;
    }

    void
    clearerr() override
    {
        throw std::invalid_argument( "Not implemented because after clearing error another owner might "
                                     "set an error again right away, which makes this interface useless." );
    }

private:
    std::shared_ptr<FileReader> m_sharedFile;
    int m_fileDescriptor{ -1 };
    const std::shared_ptr<std::mutex> m_mutex;

    /** This is only for performance to avoid querying the file. */
    const std::optional<size_t> m_fileSizeBytes;

    /**
     * This is the independent file pointer that this class offers! Each read call will only use this as
     * offset for a positioned read on the underlying file.
     */
    size_t m_currentPosition{ 0 };
};


[[nodiscard]] inline std::unique_ptr<SharedFileReader>
ensureSharedFileReader( UniqueFileReader&& fileReader )
{
    if ( !fileReader ) {
        throw std::invalid_argument( "File reader must not be null!" );
    }

    if ( auto* const casted = dynamic_cast<SharedFileReader*>( fileReader.get() ); casted != nullptr ) {
        fileReader.release();
        return std::unique_ptr<SharedFileReader>( casted );
    }
    return std::make_unique<SharedFileReader>( std::move( fileReader ) );
}
}  // namespace bgzfseek
