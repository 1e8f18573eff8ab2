#include <array>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include <common.hpp>
#include <TestHelpers.hpp>


using namespace bgzfseek;


void
testSaturatingAddition()
{
    REQUIRE_EQUAL( saturatingAddition( 0U, 0U ), 0U );
    REQUIRE_EQUAL( saturatingAddition( 1U, 1U ), 2U );

    constexpr auto MAX = std::numeric_limits<uint64_t>::max();
    REQUIRE_EQUAL( saturatingAddition( MAX, uint64_t( 1 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( MAX - 1U, uint64_t( 1 ) ), MAX );
    REQUIRE_EQUAL( saturatingAddition( MAX - 3U, uint64_t( 2 ) ), MAX - 1U );
    REQUIRE_EQUAL( saturatingAddition( MAX, MAX ), MAX );

    REQUIRE_EQUAL( saturatingAddition( -2, 1 ), -1 );
    REQUIRE_EQUAL( saturatingAddition( -1, -2 ), -3 );

    constexpr auto SIGNED_MAX = std::numeric_limits<long long int>::max();
    constexpr auto SIGNED_MIN = std::numeric_limits<long long int>::lowest();
    REQUIRE_EQUAL( saturatingAddition( SIGNED_MAX, 1LL ), SIGNED_MAX );
    REQUIRE_EQUAL( saturatingAddition( SIGNED_MIN, -1LL ), SIGNED_MIN );
    REQUIRE_EQUAL( saturatingAddition( SIGNED_MAX, SIGNED_MIN ), -1LL );
}


void
testFormatBytes()
{
    REQUIRE_EQUAL( formatBytes( 0 ), std::string( "0 B" ) );
    REQUIRE_EQUAL( formatBytes( 1023 ), std::string( "1023 B" ) );
    REQUIRE_EQUAL( formatBytes( 1024 ), std::string( "1 KiB" ) );
    REQUIRE_EQUAL( formatBytes( 64_Ki + 3 ), std::string( "64 KiB 3 B" ) );
    REQUIRE_EQUAL( formatBytes( 2_Mi ), std::string( "2 MiB" ) );
}


void
testEndsWith()
{
    using namespace std::string_literals;

    REQUIRE( endsWith( "file.bgz"s, ".bgz"s ) );
    REQUIRE( !endsWith( "file.bgz"s, ".gz2"s ) );
    REQUIRE( !endsWith( "gz"s, ".bgz"s ) );
    REQUIRE( endsWith( "FILE.BGZ"s, ".bgz"s, /* case sensitive */ false ) );
    REQUIRE( !endsWith( "FILE.BGZ"s, ".bgz"s, /* case sensitive */ true ) );
}


void
testLittleEndian()
{
    const std::array<uint8_t, 4> bytes{ 0x1B, 0x00, 0x03, 0x80 };
    REQUIRE_EQUAL( loadLittleEndian<uint16_t>( bytes.data() ), uint16_t( 0x001B ) );
    REQUIRE_EQUAL( loadLittleEndian<uint16_t>( bytes.data() + 2 ), uint16_t( 0x8003 ) );
    REQUIRE_EQUAL( loadLittleEndian<uint32_t>( bytes.data() ), uint32_t( 0x8003'001BU ) );

    std::array<uint8_t, 4> stored{};
    storeLittleEndian<uint32_t>( stored.data(), 0x8003'001BU );
    REQUIRE( stored == bytes );

    storeLittleEndian<uint16_t>( stored.data(), uint16_t( 0xFFFF ) );
    REQUIRE_EQUAL( static_cast<int>( stored[0] ), 0xFF );
    REQUIRE_EQUAL( static_cast<int>( stored[1] ), 0xFF );
    REQUIRE_EQUAL( static_cast<int>( stored[2] ), 0x03 );
}


int
main()
{
    testSaturatingAddition();
    testFormatBytes();
    testEndsWith();
    testLittleEndian();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
