#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <common.hpp>
#include <Error.hpp>
#include <filereader/FileReader.hpp>

#include "bgzf.hpp"
#include "BgzfError.hpp"
#include "crc32.hpp"
#include "zlib.hpp"


namespace bgzfseek
{
/**
 * Framing information of one BGZF block as read from its header and footer without touching the payload.
 */
struct RawBlock
{
    [[nodiscard]] size_t
    nextBlockOffset() const noexcept
    {
        return encodedOffset + encodedSize;
    }

    [[nodiscard]] size_t
    payloadOffset() const noexcept
    {
        return encodedOffset + header.headerSize();
    }

    [[nodiscard]] size_t
    payloadSize() const noexcept
    {
        return encodedSize - header.headerSize() - bgzf::FOOTER_SIZE;
    }

    [[nodiscard]] size_t
    decodedSize() const noexcept
    {
        return footer.uncompressedSize;
    }

    /** Empty blocks are valid anywhere. An empty block at the physical end of the file is the terminator. */
    [[nodiscard]] bool
    isEmpty() const noexcept
    {
        return footer.uncompressedSize == 0;
    }

public:
    size_t encodedOffset{ 0 };
    /** BSIZE + 1 */
    size_t encodedSize{ 0 };
    bgzf::Header header;
    bgzf::Footer footer;
};


struct DecodedBlock
{
    [[nodiscard]] size_t
    size() const noexcept
    {
        return data.size();
    }

public:
    size_t encodedOffset{ 0 };
    size_t encodedSize{ 0 };
    std::vector<uint8_t> data;
};


/**
 * Reads and decodes single BGZF blocks at given byte offsets in the compressed file.
 * The codec is stateless regarding its position, i.e., each call works only on the given offset.
 */
class BlockCodec
{
public:
    struct Statistics
    {
        size_t readHeaders{ 0 };
        size_t decodedBlocks{ 0 };
        size_t decodedBytes{ 0 };
        size_t verifiedCRC32s{ 0 };
        double inflateTime{ 0 };
    };

public:
    explicit
    BlockCodec( UniqueFileReader file ) :
        m_file( std::move( file ) )
    {
        if ( !m_file ) {
            throw std::invalid_argument( "File reader may not be null!" );
        }
        if ( !m_file->size() ) {
            throw std::invalid_argument( "The file size must be known to detect truncated blocks!" );
        }
    }

    /**
     * Reads and validates the framing of the block starting at @p offset.
     * @throws UnexpectedTerminator if there is no or only a partial block at the offset.
     * @throws CorruptBlock if the header is not a valid BGZF header.
     */
    [[nodiscard]] RawBlock
    readRawBlock( const size_t offset )
    {
        const auto fileSize = this->fileSize();
        if ( offset >= fileSize ) {
            std::stringstream message;
            message << "Reached end of file at offset " << offset << " without encountering the BGZF terminator!";
            throw UnexpectedTerminator( std::move( message ).str() );
        }

        RawBlock block;
        block.encodedOffset = offset;

        bgzf::FixedHeaderBytes fixedHeader{};
        if ( readAt( fixedHeader.data(), fixedHeader.size(), offset ) != fixedHeader.size() ) {
            throw UnexpectedTerminator( formatError( offset, "Truncated gzip header" ), Error::TRUNCATED_BLOCK );
        }

        const auto [header, error] = bgzf::readFixedHeader( fixedHeader );
        if ( error != Error::NONE ) {
            throw CorruptBlock( error, formatError( offset, "Invalid block header" ) );
        }
        block.header = header;

        std::vector<uint8_t> extraField( header.extraLength );
        if ( readAt( extraField.data(), extraField.size(), offset + fixedHeader.size() ) != extraField.size() ) {
            throw UnexpectedTerminator( formatError( offset, "Truncated gzip extra field" ), Error::TRUNCATED_BLOCK );
        }

        const auto blockSize = bgzf::findBlockSize( extraField.data(), extraField.size() );
        if ( !blockSize ) {
            throw CorruptBlock( Error::INVALID_BGZF_EXTRA_FIELD, formatError( offset, "Invalid block header" ) );
        }
        block.header.blockSize = *blockSize;
        block.encodedSize = *blockSize;

        if ( block.encodedSize < block.header.headerSize() + bgzf::FOOTER_SIZE ) {
            std::stringstream message;
            message << "Block size " << block.encodedSize << " B is smaller than its header and footer";
            throw CorruptBlock( Error::INVALID_BLOCK_SIZE, formatError( offset, message.str() ) );
        }

        if ( block.nextBlockOffset() > fileSize ) {
            std::stringstream message;
            message << "Block of size " << block.encodedSize << " B exceeds the file size of " << fileSize << " B";
            throw UnexpectedTerminator( formatError( offset, message.str() ), Error::TRUNCATED_BLOCK );
        }

        bgzf::FooterBytes footer{};
        if ( readAt( footer.data(), footer.size(), block.nextBlockOffset() - footer.size() ) != footer.size() ) {
            throw UnexpectedTerminator( formatError( offset, "Truncated gzip footer" ), Error::TRUNCATED_BLOCK );
        }
        block.footer = bgzf::readFooter( footer );

        if ( block.footer.uncompressedSize > bgzf::MAX_BLOCK_SIZE ) {
            std::stringstream message;
            message << "Uncompressed size " << block.footer.uncompressedSize << " B exceeds the BGZF maximum";
            throw CorruptBlock( Error::INVALID_BLOCK_SIZE, formatError( offset, message.str() ) );
        }

        ++m_statistics.readHeaders;
        return block;
    }

    /**
     * Reads, inflates, and verifies the block starting at @p offset.
     * @throws ChecksumMismatch if CRC32 verification is enabled and the checksum does not match.
     */
    [[nodiscard]] DecodedBlock
    decode( const size_t offset )
    {
        return decode( readRawBlock( offset ) );
    }

    [[nodiscard]] DecodedBlock
    decode( const RawBlock& block )
    {
        std::vector<uint8_t> payload( block.payloadSize() );
        if ( readAt( payload.data(), payload.size(), block.payloadOffset() ) != payload.size() ) {
            throw UnexpectedTerminator( formatError( block.encodedOffset, "Truncated deflate payload" ),
                                        Error::TRUNCATED_BLOCK );
        }

        const auto t0 = now();
        auto [data, error] = m_inflateWrapper.inflate( payload.data(), payload.size(), block.decodedSize() );
        m_statistics.inflateTime += duration( t0 );

        if ( error == Error::LENGTH_MISMATCH ) {
            std::stringstream message;
            message << "Expected " << block.decodedSize() << " B but payload decompresses to "
                    << ( data.size() > block.decodedSize() ? "more" : std::to_string( data.size() ) + " B" );
            throw CorruptBlock( error, formatError( block.encodedOffset, message.str() ) );
        }
        if ( error != Error::NONE ) {
            std::string message = "Failed to inflate payload";
            if ( !m_inflateWrapper.lastMessage().empty() ) {
                message += ": " + m_inflateWrapper.lastMessage();
            }
            throw CorruptBlock( error, formatError( block.encodedOffset, message ) );
        }

        if ( m_crc32Enabled ) {
            const auto crc = crc32( data.data(), data.size() );
            if ( crc != block.footer.crc32 ) {
                std::stringstream message;
                message << "Mismatching CRC32 (0x" << std::hex << std::setw( 8 ) << std::setfill( '0' ) << crc
                        << " <-> stored: 0x" << std::setw( 8 ) << block.footer.crc32 << ")";
                throw ChecksumMismatch( formatError( block.encodedOffset, message.str() ) );
            }
            ++m_statistics.verifiedCRC32s;
        }

        ++m_statistics.decodedBlocks;
        m_statistics.decodedBytes += data.size();

        DecodedBlock result;
        result.encodedOffset = block.encodedOffset;
        result.encodedSize = block.encodedSize;
        result.data = std::move( data );
        return result;
    }

    void
    setCRC32Enabled( bool enabled ) noexcept
    {
        m_crc32Enabled = enabled;
    }

    [[nodiscard]] bool
    crc32Enabled() const noexcept
    {
        return m_crc32Enabled;
    }

    [[nodiscard]] size_t
    fileSize() const
    {
        return *m_file->size();
    }

    [[nodiscard]] const FileReader&
    file() const noexcept
    {
        return *m_file;
    }

    [[nodiscard]] FileReader&
    file() noexcept
    {
        return *m_file;
    }

    [[nodiscard]] const Statistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    [[nodiscard]] size_t
    readAt( uint8_t* const buffer,
            const size_t   size,
            const size_t   offset )
    {
        if ( size == 0 ) {
            return 0;
        }

        try {
            return m_file->pread( reinterpret_cast<char*>( buffer ), size, offset );
        } catch ( const std::runtime_error& exception ) {
            std::stringstream message;
            message << "Failed to read " << size << " B at offset " << offset << ": " << exception.what();
            throw IOError( std::move( message ).str() );
        }
    }

    [[nodiscard]] static std::string
    formatError( const size_t       offset,
                 const std::string& what )
    {
        std::stringstream message;
        message << what << " in BGZF block at offset " << offset << "!";
        return std::move( message ).str();
    }

private:
    const UniqueFileReader m_file;
    ZlibInflateWrapper m_inflateWrapper;
    bool m_crc32Enabled{ true };
    Statistics m_statistics;
};
}  // namespace bgzfseek
