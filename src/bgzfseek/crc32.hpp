#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <zlib.h>


namespace bgzfseek
{
/* CRC32 according to RFC 1952, i.e., the same checksum that is stored in each gzip footer. */

[[nodiscard]] inline uint32_t
updateCRC32( uint32_t    crc,
             const void* data,
             size_t      size )
{
    const auto* bytes = reinterpret_cast<const Bytef*>( data );
    /* zlib's crc32 only accepts uInt sizes, so feed it in pieces. */
    while ( size > 0 ) {
        const auto chunkSize = static_cast<uInt>( std::min<size_t>( size, std::numeric_limits<uInt>::max() ) );
        crc = static_cast<uint32_t>( ::crc32( crc, bytes, chunkSize ) );
        bytes += chunkSize;
        size -= chunkSize;
    }
    return crc;
}


[[nodiscard]] inline uint32_t
crc32( const void* data,
       size_t      size )
{
    return updateCRC32( 0, data, size );
}


/**
 * @return The CRC32 of the concatenation of two byte sequences given only their CRC32s and the size of the second.
 */
[[nodiscard]] inline uint32_t
combineCRC32( uint32_t crc1,
              uint32_t crc2,
              size_t   size2 )
{
    return static_cast<uint32_t>( ::crc32_combine( crc1, crc2, static_cast<z_off_t>( size2 ) ) );
}


class CRC32Calculator
{
public:
    void
    setEnabled( bool enabled ) noexcept
    {
        m_enabled = enabled;
    }

    [[nodiscard]] constexpr bool
    enabled() const noexcept
    {
        return m_enabled;
    }

    void
    reset() noexcept
    {
        m_crc32 = 0;
        m_streamSizeInBytes = 0;
    }

    [[nodiscard]] uint32_t
    crc32() const noexcept
    {
        return m_crc32;
    }

    [[nodiscard]] uint64_t
    streamSize() const noexcept
    {
        return m_streamSizeInBytes;
    }

    void
    update( const void* data,
            size_t      size )
    {
        if ( enabled() ) {
            m_crc32 = updateCRC32( m_crc32, data, size );
            m_streamSizeInBytes += size;
        }
    }

    /**
     * Throws std::domain_error on mismatch.
     */
    bool  // NOLINT(modernize-use-nodiscard)
    verify( uint32_t crc32ToCompare ) const
    {
        if ( !enabled() || ( crc32() == crc32ToCompare ) ) {
            return true;
        }

        std::stringstream message;
        message << "Mismatching CRC32 (0x" << std::hex << crc32() << " <-> stored: 0x" << crc32ToCompare << ")!";
        throw std::domain_error( std::move( message ).str() );
    }

    void
    append( const CRC32Calculator& toAppend )
    {
        if ( m_enabled != toAppend.m_enabled ) {
            return;
        }
        m_crc32 = combineCRC32( crc32(), toAppend.crc32(), toAppend.streamSize() );
        m_streamSizeInBytes += toAppend.streamSize();
    }

private:
    bool m_enabled{ true };
    uint32_t m_crc32{ 0 };
    uint64_t m_streamSizeInBytes{ 0 };
};
}  // namespace bgzfseek
