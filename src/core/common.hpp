#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <unistd.h>


namespace bgzfseek
{
template<typename U,
         std::enable_if_t<std::is_unsigned_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
}


template<typename U,
         std::enable_if_t<std::is_signed_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    /* Underflow or overflow should only be possible when both values have the same sign! */
    if ( ( a > 0 ) && ( b > 0 ) ) {
        return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
    }

    if ( ( a < 0 ) && ( b < 0 ) ) {
        return a < std::numeric_limits<U>::lowest() - b ? std::numeric_limits<U>::lowest() : a + b;
    }

    return a + b;
}


template<typename S, typename T>
std::ostream&
operator<<( std::ostream&   out,
            std::pair<S, T> pair )
{
    out << "(" << pair.first << "," << pair.second << ")";
    return out;
}


template<typename S, typename T>
[[nodiscard]] constexpr bool
endsWith( const S& fullString,
          const T& suffix,
          bool     caseSensitive = true ) noexcept
{
    if ( fullString.size() < suffix.size() ) {
        return false;
    }

    if ( caseSensitive ) {
        return std::equal( suffix.rbegin(), suffix.rend(), fullString.rbegin() );
    }

    return std::equal( suffix.rbegin(), suffix.rend(), fullString.rbegin(),
                       [] ( auto a, auto b ) { return std::tolower( a ) == std::tolower( b ); } );
}


[[nodiscard]] inline std::string
formatBytes( const uint64_t value )
{
    const std::array<std::pair<std::string_view, uint64_t>, 5U> UNITS{ {
        { "TiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "GiB", 1024ULL * 1024ULL * 1024ULL },
        { "MiB", 1024ULL * 1024ULL },
        { "KiB", 1024ULL },
        { "B", 1ULL },
    } };

    std::stringstream result;
    for ( const auto& [unit, multiplier] : UNITS ) {
        const auto remainder = unit == "TiB" ? value / multiplier : ( value / multiplier ) % 1024ULL;
        if ( remainder != 0 ) {
            if ( result.tellp() > 0 ) {
                result << " ";
            }
            result << remainder << " " << unit;
        }
    }

    if ( result.tellp() == 0 ) {
        return "0 B";
    }
    return std::move( result ).str();
}


[[nodiscard]] inline std::chrono::time_point<std::chrono::high_resolution_clock>
now() noexcept
{
    return std::chrono::high_resolution_clock::now();
}


/**
 * @return duration in seconds
 */
template<typename T>
[[nodiscard]] double
duration( const T& t0,
          const T& t1 = now() ) noexcept
{
    return std::chrono::duration<double>( t1 - t0 ).count();
}


[[nodiscard]] inline uint64_t
unixTimeInNanoseconds() noexcept
{
    const auto currentTime = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>( std::chrono::duration_cast<std::chrono::nanoseconds>( currentTime ).count() );
}


/**
 * Use like this:
 * @verbatim
 * std::cerr << ( ThreadSafeOutput() << "Hello" << i << "there" ).str();
 * @endverbatim
 */
class ThreadSafeOutput
{
public:
    ThreadSafeOutput()
    {
        using namespace std::chrono;
        const auto time = system_clock::now();
        const auto timePoint = system_clock::to_time_t( time );
        const auto subseconds = duration_cast<milliseconds>( time.time_since_epoch() ).count() % 1000;
        m_out << "[" << std::put_time( std::localtime( &timePoint ), "%H:%M:%S" ) << "." << subseconds << "]"
              << "[0x" << std::hex << std::this_thread::get_id() << std::dec << "]";
    }

    template<typename T>
    ThreadSafeOutput&
    operator<<( const T& value )
    {
        m_out << " " << value;
        return *this;
    }

    [[nodiscard]] std::string
    str() const
    {
        return m_out.str() + "\n";
    }

private:
    std::stringstream m_out;
};


inline std::ostream&
operator<<( std::ostream&           out,
            const ThreadSafeOutput& output )
{
    out << output.str();
    return out;
}


/** Reads a little-endian integer of the given type from a byte buffer without alignment requirements. */
template<typename T>
[[nodiscard]] constexpr T
loadLittleEndian( const uint8_t* data ) noexcept
{
    static_assert( std::is_unsigned_v<T>, "Only meant for unsigned integers!" );
    T result{ 0 };
    for ( size_t i = 0; i < sizeof( T ); ++i ) {
        result |= static_cast<T>( static_cast<T>( data[i] ) << ( i * 8U ) );
    }
    return result;
}


template<typename T>
void
storeLittleEndian( uint8_t* data,
                   T        value ) noexcept
{
    static_assert( std::is_unsigned_v<T>, "Only meant for unsigned integers!" );
    for ( size_t i = 0; i < sizeof( T ); ++i ) {
        data[i] = static_cast<uint8_t>( ( value >> ( i * 8U ) ) & 0xFFU );
    }
}


[[nodiscard]] constexpr uint64_t
operator "" _Ki( unsigned long long int value ) noexcept
{
    return value * 1024ULL;
}


[[nodiscard]] constexpr uint64_t
operator "" _Mi( unsigned long long int value ) noexcept
{
    return value * 1024ULL * 1024ULL;
}
}  // namespace bgzfseek
