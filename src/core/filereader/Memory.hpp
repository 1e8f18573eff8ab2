#pragma once

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include "FileReader.hpp"


namespace bgzfseek
{
class MemoryFileReader :
    public FileReader
{
public:
    explicit
    MemoryFileReader( std::vector<char> data ) :
        m_data( std::move( data ) )
    {}

    template<typename Container>
    explicit
    MemoryFileReader( const Container& data ) :
        m_data( reinterpret_cast<const char*>( data.data() ),
                reinterpret_cast<const char*>( data.data() ) + data.size() * sizeof( data[0] ) )
    {}

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        return std::make_unique<MemoryFileReader>( m_data );
    }

    void
    close() override
    {
        m_closed = true;
        m_currentPosition = 0;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_currentPosition >= m_data.size();
    }

    [[nodiscard]] bool
    fail() const override
    {
        return false;
    }

    [[nodiscard]] int
    fileno() const override
    {
        throw std::invalid_argument( "Trying to get fileno of an in-memory file!" );
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
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
        if ( closed() ) {
            throw std::invalid_argument( "Cannot read from closed file!" );
        }

        if ( offset >= m_data.size() ) {
            return 0;
        }

        const auto nBytesRead = std::min( nMaxBytesToRead, m_data.size() - offset );
        if ( ( buffer != nullptr ) && ( nBytesRead > 0 ) ) {
            std::memcpy( buffer, m_data.data() + offset, nBytesRead );
        }
        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( closed() ) {
            throw std::invalid_argument( "Cannot seek closed file!" );
        }

        m_currentPosition = effectiveOffset( offset, origin );
        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_data.size();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

    void
    clearerr() override
    {}

protected:
    const std::vector<char> m_data;
    bool m_closed{ false };

    size_t m_currentPosition{ 0 };
};
}  // namespace bgzfseek
