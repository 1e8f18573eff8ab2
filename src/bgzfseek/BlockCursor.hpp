#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

#include <BlockMap.hpp>
#include <common.hpp>
#include <filereader/FileReader.hpp>

#include "BgzfError.hpp"
#include "BlockCodec.hpp"


namespace bgzfseek
{
/**
 * Tracks the logical position inside the decompressed stream and caches the one decoded block covering it.
 *
 * Seeking is lazy: it only scans block headers forward as far as necessary to validate the target position
 * and drops the cached block if it does not contain the new position. Decompression happens on the first
 * access via @ref span. All block boundaries found while scanning are stored in a BlockMap, which can be
 * shared between cursors working on the same file, so that backward seeks never need to scan again.
 */
class BlockCursor
{
public:
    /** No block is decoded, e.g., after a seek to a position outside the last decoded block. */
    struct Empty
    {};

    struct Cached
    {
        [[nodiscard]] size_t
        begin() const noexcept
        {
            return decodedOffset;
        }

        [[nodiscard]] size_t
        end() const noexcept
        {
            return decodedOffset + block->size();
        }

        [[nodiscard]] bool
        contains( size_t position ) const noexcept
        {
            return ( begin() <= position ) && ( position < end() );
        }

    public:
        std::shared_ptr<const DecodedBlock> block;
        /** Offset of the first byte of the block in the decompressed stream. */
        size_t decodedOffset{ 0 };
    };

    using State = std::variant<Empty, Cached>;

    struct Statistics
    {
        size_t seeks{ 0 };
        size_t cacheHits{ 0 };
        size_t scannedHeaders{ 0 };
    };

public:
    explicit
    BlockCursor( UniqueFileReader          file,
                 std::shared_ptr<BlockMap> blockMap = {} ) :
        m_codec( std::move( file ) ),
        m_blockMap( blockMap ? std::move( blockMap ) : std::make_shared<BlockMap>() )
    {}

    /**
     * Moves the logical position. Only scans block headers, i.e., nothing is decompressed.
     * Seeking to exactly the total decompressed size is valid and places the cursor at the end of the stream.
     * @throws OutOfRange if @p position lies beyond the end of the stream. The cursor is not modified then.
     */
    void
    seek( const size_t position )
    {
        ++m_statistics.seeks;

        if ( const auto* const cached = std::get_if<Cached>( &m_state ); cached != nullptr ) {
            if ( cached->contains( position ) ) {
                m_position = position;
                return;
            }
        }

        if ( !locate( position ) && ( position != m_blockMap->decodedSize() ) ) {
            std::stringstream message;
            message << "Cannot seek to offset " << position << " in a decompressed stream of size "
                    << m_blockMap->decodedSize() << " B!";
            throw OutOfRange( std::move( message ).str() );
        }

        m_state = Empty{};
        m_position = position;
    }

    /**
     * Decodes the block containing the current position if it is not already cached.
     * @return Pointer to the decompressed data at the current position and the number of bytes that are
     *         available in the current block. The size is 0 at the end of the stream. The returned pointer
     *         is valid until the next call to @ref seek or @ref advance.
     */
    [[nodiscard]] std::pair<const uint8_t*, size_t>
    span()
    {
        if ( const auto* const cached = std::get_if<Cached>( &m_state ); cached != nullptr ) {
            ++m_statistics.cacheHits;
            return { cached->block->data.data() + ( m_position - cached->begin() ), cached->end() - m_position };
        }

        const auto blockInfo = locate( m_position );
        if ( !blockInfo ) {
            return { nullptr, 0 };
        }

        auto block = std::make_shared<DecodedBlock>( m_codec.decode( blockInfo->encodedOffsetInBytes ) );
        if ( block->size() != blockInfo->decodedSizeInBytes ) {
            /* Can only happen if the file was modified after the block headers had been scanned. */
            std::stringstream message;
            message << "Decoded block size " << block->size() << " B differs from the scanned size "
                    << blockInfo->decodedSizeInBytes << " B for block at offset "
                    << blockInfo->encodedOffsetInBytes << "!";
            throw CorruptBlock( Error::LENGTH_MISMATCH, std::move( message ).str() );
        }

        const auto& cached = m_state.emplace<Cached>( Cached{ std::move( block ), blockInfo->decodedOffsetInBytes } );
        return { cached.block->data.data() + ( m_position - cached.begin() ), cached.end() - m_position };
    }

    /**
     * Moves the position forward inside the current span. Leaving the cached block drops it.
     */
    void
    advance( const size_t nBytes )
    {
        const auto* const cached = std::get_if<Cached>( &m_state );
        if ( cached == nullptr ) {
            if ( nBytes > 0 ) {
                throw std::logic_error( "May only advance inside the span of a decoded block!" );
            }
            return;
        }

        if ( nBytes > cached->end() - m_position ) {
            throw std::logic_error( "May not advance past the end of the current span!" );
        }

        m_position += nBytes;
        if ( m_position == cached->end() ) {
            m_state = Empty{};
        }
    }

    /**
     * Moves the position forward by up to @p nBytes without decompressing anything.
     * @return The number of bytes actually skipped, which is less than requested at the end of the stream.
     */
    size_t
    skip( const size_t nBytes )
    {
        const auto target = saturatingAddition( m_position, nBytes );
        const auto newPosition = locate( target ) ? target : std::min( target, totalSize() );
        const auto nBytesSkipped = newPosition - m_position;
        seek( newPosition );
        return nBytesSkipped;
    }

    [[nodiscard]] size_t
    position() const noexcept
    {
        return m_position;
    }

    /**
     * Scans all remaining block headers if necessary.
     * @return The size of the whole decompressed stream.
     */
    [[nodiscard]] size_t
    totalSize()
    {
        while ( !m_blockMap->finalized() ) {
            scanNextBlock();
        }
        return m_blockMap->decodedSize();
    }

    [[nodiscard]] bool
    atEndOfStream() const
    {
        return m_blockMap->finalized() && ( m_position >= m_blockMap->decodedSize() );
    }

    [[nodiscard]] const State&
    state() const noexcept
    {
        return m_state;
    }

    [[nodiscard]] const std::shared_ptr<BlockMap>&
    blockMap() const noexcept
    {
        return m_blockMap;
    }

    [[nodiscard]] BlockCodec&
    codec() noexcept
    {
        return m_codec;
    }

    [[nodiscard]] const BlockCodec&
    codec() const noexcept
    {
        return m_codec;
    }

    [[nodiscard]] const Statistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    /**
     * Scans block headers until the block containing @p position is known or the terminator was reached.
     * @return The non-empty block containing the position or nothing if the position is at or after the end.
     */
    [[nodiscard]] std::optional<BlockMap::BlockInfo>
    locate( const size_t position )
    {
        while ( true ) {
            if ( const auto blockInfo = m_blockMap->findDataOffset( position ); blockInfo && blockInfo->contains( position ) ) {
                return blockInfo;
            }

            if ( m_blockMap->finalized() ) {
                return std::nullopt;
            }

            scanNextBlock();
        }
    }

    void
    scanNextBlock()
    {
        const auto offset = m_blockMap->encodedEnd();
        const auto block = m_codec.readRawBlock( offset );
        ++m_statistics.scannedHeaders;

        m_blockMap->push( offset, block.encodedSize, block.decodedSize() );

        /* Empty blocks in the middle of the stream are skipped. Only the one ending at the physical end of
         * the file terminates the stream. */
        if ( block.isEmpty() && ( block.nextBlockOffset() == m_codec.fileSize() ) && !m_blockMap->finalized() ) {
            m_blockMap->finalize();
        }
    }

private:
    BlockCodec m_codec;
    const std::shared_ptr<BlockMap> m_blockMap;

    State m_state;
    size_t m_position{ 0 };

    Statistics m_statistics;
};
}  // namespace bgzfseek
