#pragma once

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

#include <common.hpp>
#include <Error.hpp>


namespace bgzfseek
{
/**
 * Compresses the given data into a single raw deflate stream, i.e., without zlib or gzip header and footer.
 */
[[nodiscard]] inline std::vector<uint8_t>
compressWithZlib( const uint8_t* const data,
                  const size_t         size,
                  const int            compressionLevel = Z_DEFAULT_COMPRESSION )
{
    if ( size > std::numeric_limits<uInt>::max() ) {
        throw std::invalid_argument( "Input is too large to be compressed in one go!" );
    }

    std::vector<uint8_t> output;

    z_stream stream{};
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = static_cast<uInt>( size );
    stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( data ) );
    stream.avail_out = 0;
    stream.next_out = nullptr;

    /* Negative window bits for raw deflate. */
    if ( deflateInit2( &stream, compressionLevel, Z_DEFLATED, -MAX_WBITS, /* memLevel */ 8,
                       Z_DEFAULT_STRATEGY ) != Z_OK ) {
        std::stringstream message;
        message << "Failed to initialize deflate with compression level " << compressionLevel << "!";
        throw std::invalid_argument( std::move( message ).str() );
    }

    /* deflateBound is exact enough so that a single call with Z_FINISH suffices. */
    output.resize( deflateBound( &stream, static_cast<uLong>( size ) ) );
    stream.next_out = reinterpret_cast<Bytef*>( output.data() );
    stream.avail_out = static_cast<uInt>( output.size() );

    const auto status = ::deflate( &stream, Z_FINISH );
    deflateEnd( &stream );

    if ( status != Z_STREAM_END ) {
        std::stringstream message;
        message << "Deflate failed with error code " << status << "!";
        throw std::runtime_error( std::move( message ).str() );
    }

    output.resize( stream.total_out );
    return output;
}


/**
 * This is a small wrapper around zlib's inflate for raw deflate streams whose decompressed size is known
 * beforehand, as is the case for BGZF blocks. The zlib stream is reused between calls to avoid the allocation
 * of the internal state for each block.
 */
class ZlibInflateWrapper
{
public:
    ZlibInflateWrapper()
    {
        /* 2^15 = 32 KiB window buffer and minus signaling raw deflate stream to decode.
         * -n for raw inflate, not looking for zlib/gzip header and not generating a check value! */
        if ( inflateInit2( &m_stream, -MAX_WBITS ) != Z_OK ) {
            throw std::runtime_error( "Failed to initialize zlib inflate!" );
        }
    }

    ~ZlibInflateWrapper()
    {
        inflateEnd( &m_stream );
    }

    ZlibInflateWrapper( const ZlibInflateWrapper& ) = delete;

    ZlibInflateWrapper&
    operator=( const ZlibInflateWrapper& ) = delete;

    /**
     * Inflates exactly one raw deflate stream.
     * @return The decompressed data and Error::NONE on success. Error::INFLATE_FAILED if the deflate data is
     *         invalid or incomplete and Error::LENGTH_MISMATCH if the stream decompresses to more or less than
     *         @p expectedSize bytes.
     */
    [[nodiscard]] std::pair<std::vector<uint8_t>, Error>
    inflate( const uint8_t* const input,
             const size_t         inputSize,
             const size_t         expectedSize )
    {
        if ( inflateReset( &m_stream ) != Z_OK ) {
            throw std::runtime_error( "Failed to reset zlib inflate stream!" );
        }

        /* Reserve one more byte than expected so that a too large result can be detected. This also avoids
         * a null output pointer for empty blocks, which zlib would reject. */
        std::vector<uint8_t> result( expectedSize + 1 );

        m_stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( input ) );
        m_stream.avail_in = static_cast<uInt>( inputSize );
        m_stream.next_out = reinterpret_cast<Bytef*>( result.data() );
        m_stream.avail_out = static_cast<uInt>( result.size() );

        /* == actual zlib inflate call == */
        const auto errorCode = ::inflate( &m_stream, Z_FINISH );
        const auto decodedSize = result.size() - m_stream.avail_out;
        result.resize( decodedSize );

        if ( errorCode == Z_STREAM_END ) {
            return { std::move( result ), decodedSize == expectedSize ? Error::NONE : Error::LENGTH_MISMATCH };
        }

        /* > Z_BUF_ERROR if no progress was possible or if there was not enough room in the output
         * > buffer when Z_FINISH is used */
        if ( ( errorCode == Z_BUF_ERROR ) && ( m_stream.avail_out == 0 ) ) {
            return { std::move( result ), Error::LENGTH_MISMATCH };
        }

        m_lastMessage = m_stream.msg == nullptr ? std::string() : std::string( m_stream.msg );
        return { std::move( result ), Error::INFLATE_FAILED };
    }

    /**
     * @return zlib's message for the last failed @ref inflate call, might be empty.
     */
    [[nodiscard]] const std::string&
    lastMessage() const noexcept
    {
        return m_lastMessage;
    }

private:
    z_stream m_stream{};
    std::string m_lastMessage;
};
}  // namespace bgzfseek
