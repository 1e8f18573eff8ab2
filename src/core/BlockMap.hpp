#pragma once

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <common.hpp>


namespace bgzfseek
{
/**
 * Stores encoded block offsets and decoded sizes and will do conversions between decoded and encoded offsets!
 *
 * The idea is that any forward seeking is done by scanning the block headers and the scan will push all
 * block information to the BlockMap. Backward seeks can then be resolved without scanning again.
 *
 * This class expects @ref push to be called with monotonically increasing arguments.
 * It is thread-safe so that it can be shared between readers cloned from each other.
 */
class BlockMap
{
public:
    struct BlockInfo
    {
    public:
        [[nodiscard]] bool
        contains( size_t dataOffset ) const
        {
            return ( decodedOffsetInBytes <= dataOffset ) && ( dataOffset < decodedOffsetInBytes + decodedSizeInBytes );
        }

        friend std::ostream&
        operator<<( std::ostream&    out,
                    const BlockInfo& blockInfo )
        {
            out << "BlockInfo{ blockIndex: " << blockInfo.blockIndex
                << ", encodedOffsetInBytes: " << blockInfo.encodedOffsetInBytes
                << ", encodedSizeInBytes: " << blockInfo.encodedSizeInBytes
                << ", decodedOffsetInBytes: " << blockInfo.decodedOffsetInBytes
                << ", decodedSizeInBytes: " << blockInfo.decodedSizeInBytes
                << " }";
            return out;
        }

    public:
        /** Each block in the stream will be given an increasing index number. */
        size_t blockIndex{ 0 };
        size_t encodedOffsetInBytes{ 0 };
        size_t encodedSizeInBytes{ 0 };
        size_t decodedOffsetInBytes{ 0 };
        size_t decodedSizeInBytes{ 0 };
    };

    using BlockOffsets = std::vector<std::pair</* encoded offset in bytes */ size_t,
                                               /* decoded offset in bytes */ size_t> >;

public:
    BlockMap() = default;

    /**
     * @return decoded offset in bytes, i.e., the sum of all previously decoded block data.
     */
    size_t
    push( size_t encodedBlockOffset,
          size_t encodedSize,
          size_t decodedSize )
    {
        const std::scoped_lock lock( m_mutex );

        std::optional<size_t> decodedOffset;
        if ( m_blockToDataOffsets.empty() ) {
            decodedOffset = 0;
        } else if ( encodedBlockOffset > m_blockToDataOffsets.back().first ) {
            if ( encodedBlockOffset != m_blockToDataOffsets.back().first + m_lastBlockEncodedSize ) {
                throw std::invalid_argument( "Blocks must be pushed without gaps between them!" );
            }
            decodedOffset = m_blockToDataOffsets.back().second + m_lastBlockDecodedSize;
        }

        /* If successive value or empty, then simply append */
        if ( decodedOffset ) {
            if ( m_finalized ) {
                throw std::invalid_argument( "May not insert into finalized block map!" );
            }
            m_blockToDataOffsets.emplace_back( encodedBlockOffset, *decodedOffset );
            m_lastBlockDecodedSize = decodedSize;
            m_lastBlockEncodedSize = encodedSize;
            return *decodedOffset;
        }

        /* Generally, block inserted offsets should always be increasing!
         * But do ignore duplicates after confirming that there is no data inconsistency. */
        const auto match = std::lower_bound(
            m_blockToDataOffsets.begin(), m_blockToDataOffsets.end(), std::make_pair( encodedBlockOffset, 0 ),
            [] ( const auto& a, const auto& b ) { return a.first < b.first; } );

        if ( ( match == m_blockToDataOffsets.end() ) || ( match->first != encodedBlockOffset ) ) {
            throw std::invalid_argument( "Inserted block offsets should be strictly increasing!" );
        }

        const auto impliedDecodedSize = std::next( match ) == m_blockToDataOffsets.end()
                                        ? m_lastBlockDecodedSize
                                        : std::next( match )->second - match->second;
        if ( impliedDecodedSize != decodedSize ) {
            throw std::invalid_argument( "Got duplicate block offset with inconsistent size!" );
        }

        /* Quietly ignore duplicate insertions. Note that match->first == encodedBlockOffset. */
        return match->second;
    }

    /**
     * Returns the block containing the given data offset. May return a block which does not contain the given
     * offset. In that case it will be the last block. For empty blocks sharing a decoded offset with the
     * following block, the last one of those is returned, i.e., the one actually containing data.
     */
    [[nodiscard]] std::optional<BlockInfo>
    findDataOffset( size_t dataOffset ) const
    {
        const std::scoped_lock lock( m_mutex );

        /* Find the last block whose decoded offset is <= dataOffset. Values are sorted ascending, so bisect! */
        const auto blockOffset = std::upper_bound(
            m_blockToDataOffsets.begin(), m_blockToDataOffsets.end(), dataOffset,
            [] ( size_t value, const std::pair<size_t, size_t>& entry ) { return value < entry.second; } );

        if ( blockOffset == m_blockToDataOffsets.begin() ) {
            return std::nullopt;
        }

        return get( std::prev( blockOffset ) );
    }

    /**
     * Returns the last pushed block, if any. Scanning for new blocks should continue after it.
     */
    [[nodiscard]] std::optional<BlockInfo>
    lastBlock() const
    {
        const std::scoped_lock lock( m_mutex );

        if ( m_blockToDataOffsets.empty() ) {
            return std::nullopt;
        }
        return get( std::prev( m_blockToDataOffsets.end() ) );
    }

    [[nodiscard]] size_t
    blockCount() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_blockToDataOffsets.size();
    }

    /**
     * Marks the block map as complete. The last pushed block must be the terminator.
     */
    void
    finalize()
    {
        const std::scoped_lock lock( m_mutex );
        m_finalized = true;
    }

    [[nodiscard]] bool
    finalized() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_finalized;
    }

    /**
     * @return Sum of all decoded block sizes pushed so far. Equals the total stream size when finalized.
     */
    [[nodiscard]] size_t
    decodedSize() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_blockToDataOffsets.empty() ? 0 : m_blockToDataOffsets.back().second + m_lastBlockDecodedSize;
    }

    /**
     * @return Encoded offset directly after the last pushed block.
     */
    [[nodiscard]] size_t
    encodedEnd() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_blockToDataOffsets.empty() ? 0 : m_blockToDataOffsets.back().first + m_lastBlockEncodedSize;
    }

    [[nodiscard]] std::map<size_t, size_t>
    blockOffsets() const
    {
        const std::scoped_lock lock( m_mutex );
        return { m_blockToDataOffsets.begin(), m_blockToDataOffsets.end() };
    }

    [[nodiscard]] bool
    empty() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_blockToDataOffsets.empty();
    }

private:
    [[nodiscard]] BlockInfo
    get( const typename BlockOffsets::const_iterator& blockOffset ) const
    {
        BlockInfo result;
        result.encodedOffsetInBytes = blockOffset->first;
        result.decodedOffsetInBytes = blockOffset->second;
        result.blockIndex = static_cast<size_t>( std::distance( m_blockToDataOffsets.begin(), blockOffset ) );

        const auto higherBlock = std::next( blockOffset );
        if ( higherBlock == m_blockToDataOffsets.end() ) {
            result.decodedSizeInBytes = m_lastBlockDecodedSize;
            result.encodedSizeInBytes = m_lastBlockEncodedSize;
        } else {
            if ( higherBlock->second < blockOffset->second ) {
                throw std::logic_error( "Data offsets are not monotonically increasing!" );
            }
            result.decodedSizeInBytes = higherBlock->second - blockOffset->second;
            result.encodedSizeInBytes = higherBlock->first - blockOffset->first;
        }

        return result;
    }

private:
    mutable std::mutex m_mutex;

    /** If finalized, the last block will be of size 0 and indicate the end of stream! */
    BlockOffsets m_blockToDataOffsets;
    bool m_finalized{ false };

    size_t m_lastBlockEncodedSize{ 0 };  /**< Encoded block size of m_blockToDataOffsets.back() */
    size_t m_lastBlockDecodedSize{ 0 };  /**< Decoded block size of m_blockToDataOffsets.back() */
};
}  // namespace bgzfseek
