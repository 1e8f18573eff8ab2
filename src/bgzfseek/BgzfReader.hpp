#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <BlockMap.hpp>
#include <common.hpp>
#include <filereader/FileReader.hpp>
#include <filereader/Shared.hpp>
#include <filereader/Standard.hpp>

#include "BgzfError.hpp"
#include "BlockCursor.hpp"


namespace bgzfseek
{
/**
 * Random access to the decompressed contents of a BGZF file via the FileReader interface.
 * Only the block containing the current position is kept in memory. Clones share the underlying file
 * and the block offsets found so far but have independent positions and caches.
 */
class BgzfReader :
    public FileReader
{
public:
    struct Statistics
    {
        size_t seeks{ 0 };
        size_t cacheHits{ 0 };
        size_t scannedHeaders{ 0 };
        size_t decodedBlocks{ 0 };
        size_t decodedBytes{ 0 };
        size_t verifiedCRC32s{ 0 };
        double inflateTime{ 0 };
    };

public:
    /**
     * @throws IOError if the given file reader is not usable for random access.
     */
    explicit
    BgzfReader( UniqueFileReader fileReader ) :
        BgzfReader( makeShared( std::move( fileReader ) ), std::shared_ptr<BlockMap>() )
    {}

    /**
     * @throws IOError if the file cannot be opened.
     */
    explicit
    BgzfReader( const std::string& filePath ) :
        BgzfReader( openFile( filePath ) )
    {}

    explicit
    BgzfReader( int fileDescriptor ) :
        BgzfReader( openFile( fileDescriptor ) )
    {}

    ~BgzfReader() override
    {
        if ( m_showProfileOnDestruction && m_cursor ) {
            const auto stats = statistics();
            std::stringstream out;
            out << std::boolalpha;
            out << "[BgzfReader] Statistics:\n";
            out << "    Seeks                     : " << stats.seeks << "\n";
            out << "    Block cache hits          : " << stats.cacheHits << "\n";
            out << "    Scanned block headers     : " << stats.scannedHeaders << "\n";
            out << "    Decoded blocks            : " << stats.decodedBlocks << "\n";
            out << "    Decoded bytes             : " << formatBytes( stats.decodedBytes ) << "\n";
            out << "    Number of verified CRC32s : " << stats.verifiedCRC32s << "\n";
            out << "    CRC32 enabled             : " << m_cursor->codec().crc32Enabled() << "\n";
            out << "    Time spent inflating      : " << stats.inflateTime << " s\n";
            std::cerr << std::move( out ).str();
        }
    }

    /* FileReader overrides */

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        ensureOpen();
        auto result = std::unique_ptr<BgzfReader>(
            new BgzfReader( m_cursor->codec().file().clone(), m_cursor->blockMap() ) );
        result->setCRC32Enabled( m_cursor->codec().crc32Enabled() );
        result->m_showProfileOnDestruction = m_showProfileOnDestruction;
        return UniqueFileReader( std::move( result ) );
    }

    void
    close() override
    {
        m_cursor.reset();
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_cursor;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_cursor && m_cursor->atEndOfStream();
    }

    [[nodiscard]] bool
    fail() const override
    {
        return false;
    }

    [[nodiscard]] int
    fileno() const override
    {
        throw std::logic_error( "This is a virtual file object, which has no corresponding file descriptor!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    /**
     * Reads up to @p nBytesToRead bytes from the current position and advances the position accordingly.
     * If @p outputBuffer is null, the bytes are skipped without decompressing them.
     * @return The number of bytes read, which is only smaller than requested at the end of the stream.
     */
    [[nodiscard]] size_t
    read( char*  outputBuffer,
          size_t nBytesToRead ) override
    {
        ensureOpen();

        if ( outputBuffer == nullptr ) {
            return m_cursor->skip( nBytesToRead );
        }

        size_t nBytesRead = 0;
        while ( nBytesRead < nBytesToRead ) {
            const auto [data, size] = m_cursor->span();
            if ( size == 0 ) {
                break;
            }

            const auto nBytesToCopy = std::min( size, nBytesToRead - nBytesRead );
            std::memcpy( outputBuffer + nBytesRead, data, nBytesToCopy );
            m_cursor->advance( nBytesToCopy );
            nBytesRead += nBytesToCopy;
        }
        return nBytesRead;
    }

    /**
     * @return The new absolute position.
     * @throws OutOfRange if the resulting position is negative or lies after the end of the stream.
     */
    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        ensureOpen();

        long long int base = 0;
        switch ( origin )
        {
        case SEEK_SET:
            break;
        case SEEK_CUR:
            base = static_cast<long long int>( m_cursor->position() );
            break;
        case SEEK_END:
            base = static_cast<long long int>( m_cursor->totalSize() );
            break;
        default:
            throw std::invalid_argument( "Invalid seek origin supplied: " + std::to_string( origin ) );
        }

        const auto position = saturatingAddition( base, offset );
        if ( position < 0 ) {
            std::stringstream message;
            message << "Cannot seek to negative offset " << position << "!";
            throw OutOfRange( std::move( message ).str() );
        }

        m_cursor->seek( static_cast<size_t>( position ) );
        return m_cursor->position();
    }

    /**
     * Scans all block headers on the first call, which is cheap compared to decompressing them.
     */
    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        ensureOpen();
        return m_cursor->totalSize();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        ensureOpen();
        return m_cursor->position();
    }

    void
    clearerr() override
    {}

    /* Simpler file reader interface for Python-like usage */

    /**
     * Fills @p output from the current position and shrinks it to the number of bytes actually read.
     */
    template<typename Container>
    size_t
    readTo( Container& output )
    {
        return readTo( output, output.size() );
    }

    /**
     * Reads @p nBytesToRead bytes from the current position into @p output, which is resized to the number
     * of bytes actually read.
     */
    template<typename Container>
    size_t
    readTo( Container& output,
            size_t     nBytesToRead )
    {
        output.resize( nBytesToRead );
        const auto nBytesRead = read( reinterpret_cast<char*>( output.data() ), nBytesToRead );
        output.resize( nBytesRead );
        return nBytesRead;
    }

    /* Configuration */

    void
    setCRC32Enabled( bool enabled )
    {
        ensureOpen();
        m_cursor->codec().setCRC32Enabled( enabled );
    }

    [[nodiscard]] bool
    crc32Enabled() const
    {
        ensureOpen();
        return m_cursor->codec().crc32Enabled();
    }

    void
    setShowProfileOnDestruction( bool showProfileOnDestruction ) noexcept
    {
        m_showProfileOnDestruction = showProfileOnDestruction;
    }

    /* Introspection */

    /**
     * @return Map of compressed block offsets to the decompressed offsets of the blocks found so far.
     *         Call @ref size beforehand to get all of them.
     */
    [[nodiscard]] std::map<size_t, size_t>
    blockOffsets() const
    {
        ensureOpen();
        return m_cursor->blockMap()->blockOffsets();
    }

    [[nodiscard]] Statistics
    statistics() const
    {
        ensureOpen();
        const auto& cursorStatistics = m_cursor->statistics();
        const auto& codecStatistics = m_cursor->codec().statistics();

        Statistics result;
        result.seeks = cursorStatistics.seeks;
        result.cacheHits = cursorStatistics.cacheHits;
        result.scannedHeaders = cursorStatistics.scannedHeaders;
        result.decodedBlocks = codecStatistics.decodedBlocks;
        result.decodedBytes = codecStatistics.decodedBytes;
        result.verifiedCRC32s = codecStatistics.verifiedCRC32s;
        result.inflateTime = codecStatistics.inflateTime;
        return result;
    }

private:
    BgzfReader( UniqueFileReader          sharedFile,
                std::shared_ptr<BlockMap> blockMap ) :
        m_cursor( std::make_unique<BlockCursor>( std::move( sharedFile ), std::move( blockMap ) ) )
    {}

    void
    ensureOpen() const
    {
        if ( !m_cursor ) {
            throw std::invalid_argument( "Operation not allowed on a closed BgzfReader!" );
        }
    }

    [[nodiscard]] static UniqueFileReader
    makeShared( UniqueFileReader fileReader )
    {
        if ( !fileReader ) {
            throw std::invalid_argument( "File reader may not be null!" );
        }

        try {
            return ensureSharedFileReader( std::move( fileReader ) );
        } catch ( const std::invalid_argument& exception ) {
            throw IOError( std::string( "Cannot use the given file for random access: " ) + exception.what() );
        }
    }

    template<typename File>
    [[nodiscard]] static UniqueFileReader
    openFile( const File& file )
    {
        try {
            return std::make_unique<StandardFileReader>( file );
        } catch ( const std::exception& exception ) {
            std::stringstream message;
            message << "Failed to open " << file << ": " << exception.what();
            throw IOError( std::move( message ).str() );
        }
    }

private:
    /** Mutable state behind a pointer so that size() can scan the block headers. */
    std::unique_ptr<BlockCursor> m_cursor;
    bool m_showProfileOnDestruction{ false };
};
}  // namespace bgzfseek
