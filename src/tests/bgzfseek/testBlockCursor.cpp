#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <bgzfseek/bgzf.hpp>
#include <bgzfseek/BgzfError.hpp>
#include <bgzfseek/BlockCursor.hpp>
#include <BlockMap.hpp>
#include <common.hpp>
#include <filereader/Memory.hpp>
#include <TestHelpers.hpp>


using namespace bgzfseek;


[[nodiscard]] std::string
createTestText( size_t size )
{
    std::string result;
    for ( size_t i = 0; result.size() < size; ++i ) {
        result += std::to_string( i ) + ( i % 16 == 15 ? "\n" : " " );
    }
    result.resize( size );
    return result;
}


/**
 * Reads everything from the current position via span and advance.
 */
[[nodiscard]] std::string
readToEnd( BlockCursor& cursor )
{
    std::string result;
    while ( true ) {
        const auto [data, size] = cursor.span();
        if ( size == 0 ) {
            break;
        }
        result.append( reinterpret_cast<const char*>( data ), size );
        cursor.advance( size );
    }
    return result;
}


void
testLazySeek()
{
    /* 10 blocks with 1000 B each. */
    const auto text = createTestText( 10'000 );
    BlockCursor cursor( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 1000 ) ) );

    REQUIRE_EQUAL( cursor.position(), size_t( 0 ) );
    REQUIRE( std::holds_alternative<BlockCursor::Empty>( cursor.state() ) );

    /* Seeking only scans headers up to the target block. */
    cursor.seek( 5500 );
    REQUIRE_EQUAL( cursor.position(), size_t( 5500 ) );
    REQUIRE( std::holds_alternative<BlockCursor::Empty>( cursor.state() ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 0 ) );
    REQUIRE_EQUAL( cursor.statistics().scannedHeaders, size_t( 6 ) );

    /* The first access decodes exactly one block. */
    const auto [data, size] = cursor.span();
    REQUIRE_EQUAL( size, size_t( 500 ) );
    REQUIRE_EQUAL( std::string( reinterpret_cast<const char*>( data ), size ), text.substr( 5500, 500 ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 1 ) );
    REQUIRE( std::holds_alternative<BlockCursor::Cached>( cursor.state() ) );

    /* Seeks inside the cached block neither decode nor drop the cache. */
    for ( const size_t position : { size_t( 5000 ), size_t( 5999 ), size_t( 5001 ), size_t( 5500 ) } ) {
        cursor.seek( position );
        const auto [cachedData, cachedSize] = cursor.span();
        REQUIRE_EQUAL( cachedSize, 6000 - position );
        REQUIRE_EQUAL( static_cast<char>( *cachedData ), text[position] );
    }
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 1 ) );
    REQUIRE_EQUAL( cursor.statistics().cacheHits, size_t( 4 ) );
    REQUIRE_EQUAL( cursor.statistics().scannedHeaders, size_t( 6 ) );

    /* Backward seeks use the block map and do not scan again. */
    cursor.seek( 1234 );
    REQUIRE( std::holds_alternative<BlockCursor::Empty>( cursor.state() ) );
    const auto [backData, backSize] = cursor.span();
    REQUIRE_EQUAL( backSize, size_t( 766 ) );
    REQUIRE_EQUAL( static_cast<char>( *backData ), text[1234] );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 2 ) );
    REQUIRE_EQUAL( cursor.statistics().scannedHeaders, size_t( 6 ) );
}


void
testAdvance()
{
    const auto text = createTestText( 2500 );
    BlockCursor cursor( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 1000 ) ) );

    const auto [data, size] = cursor.span();
    REQUIRE_EQUAL( size, size_t( 1000 ) );
    REQUIRE( data != nullptr );

    cursor.advance( 400 );
    REQUIRE_EQUAL( cursor.position(), size_t( 400 ) );
    REQUIRE_EQUAL( cursor.span().second, size_t( 600 ) );
    REQUIRE_THROWS( cursor.advance( 601 ) );

    /* Reaching the end of the block drops it. */
    cursor.advance( 600 );
    REQUIRE_EQUAL( cursor.position(), size_t( 1000 ) );
    REQUIRE( std::holds_alternative<BlockCursor::Empty>( cursor.state() ) );

    REQUIRE_EQUAL( readToEnd( cursor ), text.substr( 1000 ) );
    REQUIRE_EQUAL( cursor.position(), text.size() );
    REQUIRE( cursor.atEndOfStream() );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 3 ) );
}


void
testEndOfStream()
{
    const auto text = createTestText( 2500 );
    BlockCursor cursor( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 1000 ) ) );

    REQUIRE_EQUAL( cursor.totalSize(), text.size() );
    REQUIRE_EQUAL( cursor.statistics().scannedHeaders, size_t( 4 ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 0 ) );
    REQUIRE( cursor.blockMap()->finalized() );

    /* Seeking to exactly the end is valid. */
    cursor.seek( text.size() );
    REQUIRE_EQUAL( cursor.position(), text.size() );
    REQUIRE( cursor.atEndOfStream() );
    REQUIRE_EQUAL( cursor.span().second, size_t( 0 ) );

    /* Seeking after the end is not and does not modify the cursor. */
    cursor.seek( 100 );
    REQUIRE_EQUAL( cursor.span().second, size_t( 900 ) );
    REQUIRE_THROWS_AS( cursor.seek( text.size() + 1 ), OutOfRange );
    REQUIRE_EQUAL( cursor.position(), size_t( 100 ) );
    REQUIRE( std::holds_alternative<BlockCursor::Cached>( cursor.state() ) );
    REQUIRE_EQUAL( cursor.span().second, size_t( 900 ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 1 ) );
}


void
testOutOfRangeWithoutPriorScan()
{
    const auto text = createTestText( 2500 );
    BlockCursor cursor( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 1000 ) ) );

    REQUIRE_THROWS_AS( cursor.seek( 1'000'000 ), OutOfRange );
    REQUIRE_EQUAL( cursor.position(), size_t( 0 ) );
    REQUIRE_EQUAL( readToEnd( cursor ), text );
}


void
testSkip()
{
    const auto text = createTestText( 2500 );
    BlockCursor cursor( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 1000 ) ) );

    REQUIRE_EQUAL( cursor.skip( 1500 ), size_t( 1500 ) );
    REQUIRE_EQUAL( cursor.position(), size_t( 1500 ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 0 ) );

    REQUIRE_EQUAL( cursor.skip( 5000 ), size_t( 1000 ) );
    REQUIRE_EQUAL( cursor.position(), size_t( 2500 ) );
    REQUIRE_EQUAL( cursor.skip( 1 ), size_t( 0 ) );
    REQUIRE_EQUAL( cursor.codec().statistics().decodedBlocks, size_t( 0 ) );
}


void
testEmptyBlocksInTheMiddle()
{
    /* Concatenated BGZF files contain terminator blocks in the middle, which are simply empty blocks. */
    const auto text1 = createTestText( 1500 );
    const auto text2 = std::string( "Second file contents." );
    auto compressed = bgzf::compressWithBgzf( text1, 1000 );
    const auto compressed2 = bgzf::compressWithBgzf( text2 );
    compressed.insert( compressed.end(), bgzf::TERMINATOR.begin(), bgzf::TERMINATOR.end() );
    compressed.insert( compressed.end(), compressed2.begin(), compressed2.end() );

    BlockCursor cursor( std::make_unique<MemoryFileReader>( compressed ) );
    REQUIRE_EQUAL( readToEnd( cursor ), text1 + text2 );
    REQUIRE_EQUAL( cursor.totalSize(), text1.size() + text2.size() );
    /* 2 + 1 data blocks, 2 empty blocks in the middle, and the terminator. */
    REQUIRE_EQUAL( cursor.blockMap()->blockCount(), size_t( 6 ) );

    cursor.seek( text1.size() );
    const auto [data, size] = cursor.span();
    REQUIRE_EQUAL( std::string( reinterpret_cast<const char*>( data ), size ), text2 );
}


void
testMissingTerminator()
{
    const auto text = createTestText( 2500 );
    auto compressed = bgzf::compressWithBgzf( text, 1000 );
    compressed.resize( compressed.size() - bgzf::TERMINATOR.size() );

    BlockCursor cursor( std::make_unique<MemoryFileReader>( compressed ) );

    /* Data before the truncation is still accessible. */
    cursor.seek( 2000 );
    REQUIRE_EQUAL( cursor.span().second, size_t( 500 ) );
    cursor.advance( 500 );

    REQUIRE_THROWS_AS( (void)cursor.span(), UnexpectedTerminator );
    REQUIRE_THROWS_AS( (void)cursor.totalSize(), UnexpectedTerminator );
    REQUIRE_THROWS_AS( cursor.seek( 2500 ), UnexpectedTerminator );

    BlockCursor cursor2( std::make_unique<MemoryFileReader>( compressed ) );
    REQUIRE_THROWS_AS( cursor2.seek( 10'000 ), UnexpectedTerminator );
}


void
testSharedBlockMap()
{
    const auto text = createTestText( 5000 );
    const auto compressed = bgzf::compressWithBgzf( text, 1000 );

    BlockCursor cursor1( std::make_unique<MemoryFileReader>( compressed ) );
    BlockCursor cursor2( std::make_unique<MemoryFileReader>( compressed ), cursor1.blockMap() );

    REQUIRE_EQUAL( cursor1.totalSize(), text.size() );
    REQUIRE_EQUAL( cursor1.statistics().scannedHeaders, size_t( 6 ) );

    /* The second cursor profits from the scan of the first one. */
    cursor2.seek( 4999 );
    REQUIRE_EQUAL( cursor2.totalSize(), text.size() );
    REQUIRE_EQUAL( cursor2.statistics().scannedHeaders, size_t( 0 ) );

    const auto [data, size] = cursor2.span();
    REQUIRE_EQUAL( size, size_t( 1 ) );
    REQUIRE_EQUAL( static_cast<char>( *data ), text.back() );
    REQUIRE_EQUAL( cursor1.position(), size_t( 0 ) );
}


int
main()
{
    testLazySeek();
    testAdvance();
    testEndOfStream();
    testOutOfRangeWithoutPriorScan();
    testSkip();
    testEmptyBlocksInTheMiddle();
    testMissingTerminator();
    testSharedBlockMap();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
