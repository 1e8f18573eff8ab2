#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <zlib.h>

#include <common.hpp>
#include <Error.hpp>
#include <filereader/FileReader.hpp>

#include "crc32.hpp"
#include "zlib.hpp"


/**
 * @see https://www.ietf.org/rfc/rfc1952.txt
 * Each member has the following structure:
 *
 *    +---+---+---+---+---+---+---+---+---+---+
 *    |ID1|ID2|CM |FLG|     MTIME     |XFL|OS | (more-->)
 *    +---+---+---+---+---+---+---+---+---+---+
 *
 * (if FLG.FEXTRA set)
 *
 *    +---+---+=================================+
 *    | XLEN  |...XLEN bytes of "extra field"...| (more-->)
 *    +---+---+=================================+
 *
 * The extra field consists of a series of subfields, each of the form:
 *
 *    +---+---+---+---+==================================+
 *    |SI1|SI2|  LEN  |... LEN bytes of subfield data ...|
 *    +---+---+---+---+==================================+
 *
 * @see http://samtools.github.io/hts-specs/SAMv1.pdf
 *
 * BGZF sets FEXTRA and adds a subfield with ID "BC" and LEN 2 whose payload is a 16-bit little-endian integer
 * giving the size of the containing block minus one. The header is followed by the raw deflate payload and
 * the usual gzip footer:
 *
 *    +---+---+---+---+---+---+---+---+
 *    |     CRC32     |     ISIZE     |
 *    +---+---+---+---+---+---+---+---+
 *
 * A BGZF file ends with an empty block, the 28 B terminator, so that unintended truncation can be detected.
 */
namespace bgzfseek::bgzf
{
using HeaderBytes = std::array<uint8_t, 18>;
using FixedHeaderBytes = std::array<uint8_t, 12>;
using FooterBytes = std::array<uint8_t, 8>;
using TerminatorBytes = std::array<uint8_t, 28>;

/** Gzip header up to and including XLEN. */
static constexpr size_t FIXED_HEADER_SIZE = std::tuple_size_v<FixedHeaderBytes>;
static constexpr size_t FOOTER_SIZE = std::tuple_size_v<FooterBytes>;
/** BSIZE is stored as a 16-bit integer minus one. */
static constexpr size_t MAX_BLOCK_SIZE = 64_Ki;
/** Same as htslib. Incompressible data of this size still fits into one block when stored uncompressed. */
static constexpr size_t DEFAULT_BLOCK_DATA_SIZE = 0xFF00;

static constexpr uint8_t FLAG_TEXT = 1U << 0U;
static constexpr uint8_t FLAG_EXTRA = 1U << 2U;

static constexpr TerminatorBytes TERMINATOR = {
    0x1F, 0x8B, 0x08,                   /* gzip magic bytes */
    0x04,                               /* Flags with FEXTRA set */
    0x00, 0x00, 0x00, 0x00,             /* Modification time (dummy) */
    0x00,                               /* Extra flags */
    0xFF,                               /* Unknown OS */
    0x06, 0x00,                         /* Length of extra field */
    0x42, 0x43, 0x02, 0x00, 0x1B, 0x00, /* Extra field with subfield ID "BC" = 0x42 0x43 */
    0x03,                               /* Fixed Huffman compressed deflate block with final bit set
                                         * and a single EOB character, i.e., no contents. */
    0x00,                               /* Part of EOB (257 == 0b000'0000 (7 bits)) plus byte padding */
    0x00, 0x00, 0x00, 0x00,             /* gzip footer CRC32 */
    0x00, 0x00, 0x00, 0x00              /* gzip footer uncompressed size */
};


struct Header
{
    uint32_t modificationTime{ 0 };
    uint8_t extraFlags{ 0 };
    uint8_t operatingSystem{ 0 };
    /** XLEN */
    uint16_t extraLength{ 0 };
    /** BSIZE + 1, i.e., the size of the whole block including header and footer. */
    uint32_t blockSize{ 0 };

    [[nodiscard]] size_t
    headerSize() const noexcept
    {
        return FIXED_HEADER_SIZE + extraLength;
    }
};


struct Footer
{
    uint32_t crc32{ 0 };
    uint32_t uncompressedSize{ 0 };
};


/**
 * Checks the gzip magic bytes, compression method, and flags and reads the fields up to and including XLEN.
 * The block size is only known after @ref findBlockSize has been called on the extra field.
 */
[[nodiscard]] inline std::pair<Header, Error>
readFixedHeader( const FixedHeaderBytes& bytes )
{
    Header header;

    if ( ( bytes[0] != 0x1F ) || ( bytes[1] != 0x8B ) || ( bytes[2] != Z_DEFLATED ) ) {
        return { header, Error::INVALID_GZIP_HEADER };
    }

    /* FNAME, FCOMMENT, and FHCRC are never written by BGZF compressors and would move the payload. */
    const auto flags = bytes[3];
    if ( ( flags & FLAG_EXTRA ) == 0 ) {
        return { header, Error::INVALID_BGZF_EXTRA_FIELD };
    }
    if ( ( flags & ~static_cast<uint8_t>( FLAG_EXTRA | FLAG_TEXT ) ) != 0 ) {
        return { header, Error::INVALID_GZIP_HEADER };
    }

    header.modificationTime = loadLittleEndian<uint32_t>( bytes.data() + 4 );
    header.extraFlags = bytes[8];
    header.operatingSystem = bytes[9];
    header.extraLength = loadLittleEndian<uint16_t>( bytes.data() + 10 );

    return { header, Error::NONE };
}


/**
 * Searches the gzip extra field for the BGZF subfield.
 * @return BSIZE + 1, i.e., the total block size, or nothing if there is no well-formed "BC" subfield.
 */
[[nodiscard]] inline std::optional<uint32_t>
findBlockSize( const uint8_t* const extraField,
               const size_t         size )
{
    constexpr size_t SUBFIELD_HEADER_SIZE = 4;
    for ( size_t i = 0; i + SUBFIELD_HEADER_SIZE <= size; ) {
        const auto subfieldLength = loadLittleEndian<uint16_t>( extraField + i + 2 );
        if ( i + SUBFIELD_HEADER_SIZE + subfieldLength > size ) {
            return std::nullopt;
        }

        if ( ( extraField[i] == 'B' ) && ( extraField[i + 1] == 'C' ) ) {
            if ( subfieldLength != 2 ) {
                return std::nullopt;
            }
            return static_cast<uint32_t>( loadLittleEndian<uint16_t>( extraField + i + SUBFIELD_HEADER_SIZE ) ) + 1U;
        }

        i += SUBFIELD_HEADER_SIZE + subfieldLength;
    }
    return std::nullopt;
}


[[nodiscard]] inline Footer
readFooter( const FooterBytes& bytes ) noexcept
{
    Footer footer;
    footer.crc32 = loadLittleEndian<uint32_t>( bytes.data() );
    footer.uncompressedSize = loadLittleEndian<uint32_t>( bytes.data() + 4 );
    return footer;
}


/**
 * Checks for the header layout written by all common BGZF compressors, i.e., with "BC" as the only subfield.
 */
[[nodiscard]] inline bool
isBgzfHeader( const HeaderBytes& header )
{
    return    ( header[ 0] == 0x1F )
           && ( header[ 1] == 0x8B )
           && ( header[ 2] == 0x08 )
           && ( ( header[3] & FLAG_EXTRA ) != 0 )
           && ( header[10] == 0x06 )   // length of extra field is 6B
           && ( header[11] == 0x00 )
           && ( header[12] == 'B'  )   // subfield ID "BC"
           && ( header[13] == 'C'  )
           && ( header[14] == 0x02 )   // subfield length is 2B
           && ( header[15] == 0x00 );
}


/**
 * @return True if the file starts with a BGZF header and ends with the BGZF terminator.
 *         Does not modify the file position.
 */
[[nodiscard]] inline bool
isBgzfFile( FileReader& file )
{
    HeaderBytes header;
    const auto nBytesRead = file.pread( reinterpret_cast<char*>( header.data() ), header.size(), 0 );
    if ( ( nBytesRead != header.size() ) || !isBgzfHeader( header ) ) {
        return false;
    }

    const auto fileSize = file.size();
    if ( !fileSize || ( *fileSize < TERMINATOR.size() ) ) {
        return false;
    }

    TerminatorBytes terminator;
    const auto nBytesReadTerminator = file.pread( reinterpret_cast<char*>( terminator.data() ), terminator.size(),
                                                  *fileSize - terminator.size() );
    return ( nBytesReadTerminator == terminator.size() ) && ( terminator == TERMINATOR );
}


/**
 * Appends one BGZF block containing the given data to @p output.
 */
inline void
appendBlock( std::vector<uint8_t>& output,
             const uint8_t* const  data,
             const size_t          size,
             const int             compressionLevel )
{
    constexpr size_t BLOCK_OVERHEAD = std::tuple_size_v<HeaderBytes> + FOOTER_SIZE;

    auto payload = compressWithZlib( data, size, compressionLevel );
    if ( payload.size() + BLOCK_OVERHEAD > MAX_BLOCK_SIZE ) {
        /* Incompressible data. Stored deflate blocks only add a few bytes of overhead. */
        payload = compressWithZlib( data, size, Z_NO_COMPRESSION );
    }
    if ( payload.size() + BLOCK_OVERHEAD > MAX_BLOCK_SIZE ) {
        std::stringstream message;
        message << "Compressed block of size " << payload.size() + BLOCK_OVERHEAD << " B exceeds the maximum "
                << "BGZF block size of " << MAX_BLOCK_SIZE << " B!";
        throw std::invalid_argument( std::move( message ).str() );
    }

    HeaderBytes header{ 0x1F, 0x8B, 0x08, FLAG_EXTRA, 0, 0, 0, 0, 0, 0xFF, 0x06, 0x00, 'B', 'C', 0x02, 0x00, 0, 0 };
    storeLittleEndian<uint16_t>( header.data() + 16, static_cast<uint16_t>( payload.size() + BLOCK_OVERHEAD - 1 ) );

    FooterBytes footer{};
    storeLittleEndian<uint32_t>( footer.data(), bgzfseek::crc32( data, size ) );
    storeLittleEndian<uint32_t>( footer.data() + 4, static_cast<uint32_t>( size ) );

    output.insert( output.end(), header.begin(), header.end() );
    output.insert( output.end(), payload.begin(), payload.end() );
    output.insert( output.end(), footer.begin(), footer.end() );
}


/**
 * Splits the data into blocks of at most @p blockDataSize bytes, compresses each one into a BGZF block,
 * and appends the terminator.
 */
template<typename Container>
[[nodiscard]] std::vector<uint8_t>
compressWithBgzf( const Container& data,
                  const size_t     blockDataSize = DEFAULT_BLOCK_DATA_SIZE,
                  const int        compressionLevel = Z_DEFAULT_COMPRESSION )
{
    if ( ( blockDataSize == 0 ) || ( blockDataSize > DEFAULT_BLOCK_DATA_SIZE ) ) {
        std::stringstream message;
        message << "The uncompressed block size must be in [1, " << DEFAULT_BLOCK_DATA_SIZE << "] but got "
                << blockDataSize << "!";
        throw std::invalid_argument( std::move( message ).str() );
    }

    const auto* const bytes = reinterpret_cast<const uint8_t*>( data.data() );
    const auto size = data.size() * sizeof( *data.data() );

    std::vector<uint8_t> result;
    for ( size_t offset = 0; offset < size; offset += blockDataSize ) {
        appendBlock( result, bytes + offset, std::min( blockDataSize, size - offset ), compressionLevel );
    }
    result.insert( result.end(), TERMINATOR.begin(), TERMINATOR.end() );
    return result;
}
}  // namespace bgzfseek::bgzf
