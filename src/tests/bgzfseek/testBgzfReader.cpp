#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <bgzfseek/bgzf.hpp>
#include <bgzfseek/BgzfError.hpp>
#include <bgzfseek/BgzfReader.hpp>
#include <common.hpp>
#include <filereader/Memory.hpp>
#include <FileUtils.hpp>
#include <TestHelpers.hpp>


using namespace bgzfseek;


const std::string TEST_TEXT =
    "This is just a bgzf test,lets see how it reacts. :). I think it will work fine, but who knows this is still "
    "a software. Unless you have tested it 100% there is no guarantee that it will work. So I am just trying to "
    "test bgzf with this text file. Have a great day software lovers. ";


[[nodiscard]] std::string
createTestText( size_t size )
{
    std::string result;
    for ( size_t i = 0; result.size() < size; ++i ) {
        result += "Line " + std::to_string( i ) + ": " + TEST_TEXT.substr( i % 50, 30 ) + "\n";
    }
    result.resize( size );
    return result;
}


[[nodiscard]] std::string
readString( BgzfReader& reader,
            size_t      nBytesToRead )
{
    std::string result;
    reader.readTo( result, nBytesToRead );
    return result;
}


void
testSmallFile( const std::filesystem::path& folder )
{
    const auto filePath = ( folder / "bgzf_test.bgz" ).string();
    writeFile( filePath, bgzf::compressWithBgzf( TEST_TEXT ) );

    BgzfReader reader( filePath );
    REQUIRE_EQUAL( TEST_TEXT.size(), size_t( 280 ) );
    REQUIRE_EQUAL( reader.size().value_or( 0 ), size_t( 280 ) );
    REQUIRE_EQUAL( reader.tell(), size_t( 0 ) );

    /* Random access */
    REQUIRE_EQUAL( reader.seek( 29 ), size_t( 29 ) );
    REQUIRE_EQUAL( readString( reader, 20 ), std::string( " see how it reacts. " ) );
    REQUIRE_EQUAL( reader.tell(), size_t( 49 ) );

    /* Read from the start */
    reader.seek( 0 );
    std::vector<char> buffer( 10 );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), size_t( 10 ) );
    REQUIRE_EQUAL( std::string( buffer.begin(), buffer.end() ), std::string( "This is ju" ) );

    reader.seek( 20 );
    REQUIRE_EQUAL( readString( reader, 32 ), std::string( "test,lets see how it reacts. :)." ) );

    /* Continue reading with readTo on a container of the requested size. */
    reader.seek( 0 );
    std::vector<char> first( 52 );
    REQUIRE_EQUAL( reader.readTo( first ), size_t( 52 ) );
    REQUIRE_EQUAL( std::string( first.begin(), first.end() ), TEST_TEXT.substr( 0, 52 ) );
    std::vector<char> second( 119 );
    REQUIRE_EQUAL( reader.readTo( second ), size_t( 119 ) );
    REQUIRE_EQUAL( std::string( second.begin(), second.end() ), TEST_TEXT.substr( 52, 119 ) );

    /* Short read at the end of the stream and empty read at the end. */
    reader.seek( 270 );
    REQUIRE_EQUAL( readString( reader, 100 ), TEST_TEXT.substr( 270 ) );
    REQUIRE( reader.eof() );
    REQUIRE_EQUAL( readString( reader, 100 ), std::string() );
    REQUIRE_EQUAL( reader.tell(), size_t( 280 ) );

    /* Seeking relative to the current position and the end */
    REQUIRE_EQUAL( reader.seek( -10, SEEK_END ), size_t( 270 ) );
    REQUIRE_EQUAL( reader.seek( -5, SEEK_CUR ), size_t( 265 ) );
    REQUIRE_EQUAL( readString( reader, 5 ), TEST_TEXT.substr( 265, 5 ) );

    REQUIRE_THROWS_AS( reader.seek( 281 ), OutOfRange );
    REQUIRE_THROWS_AS( reader.seek( -1 ), OutOfRange );
    REQUIRE_THROWS_AS( reader.seek( 1, SEEK_END ), OutOfRange );
    REQUIRE_EQUAL( reader.tell(), size_t( 270 ) );
    REQUIRE_EQUAL( reader.seek( 0, SEEK_END ), size_t( 280 ) );

    const auto offsets = reader.blockOffsets();
    REQUIRE_EQUAL( offsets.size(), size_t( 2 ) );
    REQUIRE_EQUAL( offsets.at( 0 ), size_t( 0 ) );
}


void
testConcreteScenario()
{
    const std::string text = "This is just a bgzf test,lets see how it reacts. :).";
    BgzfReader reader( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text ) ) );

    reader.seek( 29 );
    std::vector<char> buffer( 20 );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), size_t( 20 ) );
    REQUIRE_EQUAL( std::string( buffer.begin(), buffer.end() ), std::string( " see how it reacts. " ) );

    reader.seek( 0 );
    buffer.resize( 52 );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), size_t( 52 ) );
    REQUIRE_EQUAL( std::string( buffer.begin(), buffer.end() ), text );
}


void
testCacheReuse()
{
    const auto text = createTestText( 200'000 );
    BgzfReader reader( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text ) ) );

    /* Two reads inside the same block decode it only once. */
    reader.seek( 100 );
    REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 100, 1000 ) );
    REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 1100, 1000 ) );
    reader.seek( 50 );
    REQUIRE_EQUAL( readString( reader, 10 ), text.substr( 50, 10 ) );
    REQUIRE_EQUAL( reader.statistics().decodedBlocks, size_t( 1 ) );

    /* A read crossing a block boundary decodes both blocks. */
    const auto boundary = bgzf::DEFAULT_BLOCK_DATA_SIZE;
    reader.seek( boundary - 10 );
    REQUIRE_EQUAL( readString( reader, 20 ), text.substr( boundary - 10, 20 ) );
    REQUIRE_EQUAL( reader.statistics().decodedBlocks, size_t( 2 ) );

    /* Idempotent seek */
    reader.seek( 150'000 );
    const auto once = readString( reader, 100 );
    reader.seek( 150'000 );
    reader.seek( 150'000 );
    REQUIRE_EQUAL( readString( reader, 100 ), once );
    REQUIRE_EQUAL( once, text.substr( 150'000, 100 ) );

    /* Skipping does not decode anything. */
    const auto decodedBlocks = reader.statistics().decodedBlocks;
    reader.seek( 0 );
    REQUIRE_EQUAL( reader.read( nullptr, 190'000 ), size_t( 190'000 ) );
    REQUIRE_EQUAL( reader.tell(), size_t( 190'000 ) );
    REQUIRE_EQUAL( reader.read( nullptr, 100'000 ), size_t( 10'000 ) );
    REQUIRE_EQUAL( reader.statistics().decodedBlocks, decodedBlocks );
}


void
testReadEverything()
{
    const auto text = createTestText( 300'000 );
    BgzfReader reader( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 4096 ) ) );

    /* Read in odd chunk sizes so that reads cross block boundaries at various offsets. */
    std::string decoded;
    std::vector<char> buffer( 7777 );
    while ( true ) {
        const auto nBytesRead = reader.read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        decoded.append( buffer.data(), nBytesRead );
    }

    REQUIRE( decoded == text );
    REQUIRE( reader.eof() );
    REQUIRE_EQUAL( reader.statistics().decodedBlocks, ( text.size() + 4095 ) / 4096 );
    REQUIRE_EQUAL( reader.size().value_or( 0 ), text.size() );
}


void
testClone()
{
    const auto text = createTestText( 100'000 );
    BgzfReader reader( std::make_unique<MemoryFileReader>( bgzf::compressWithBgzf( text, 10'000 ) ) );
    reader.seek( 12'345 );

    const auto cloned = reader.clone();
    REQUIRE_EQUAL( cloned->tell(), size_t( 0 ) );

    cloned->seek( 99'000 );
    std::string clonedData( 500, '\0' );
    REQUIRE_EQUAL( cloned->read( clonedData.data(), clonedData.size() ), clonedData.size() );
    REQUIRE_EQUAL( clonedData, text.substr( 99'000, 500 ) );
    REQUIRE_EQUAL( cloned->size().value_or( 0 ), text.size() );

    REQUIRE_EQUAL( reader.tell(), size_t( 12'345 ) );
    REQUIRE_EQUAL( readString( reader, 500 ), text.substr( 12'345, 500 ) );

    /* The clone scanned up to the end, which the original can use. */
    REQUIRE_EQUAL( reader.blockOffsets().size(), size_t( 11 ) );
    REQUIRE_EQUAL( reader.size().value_or( 0 ), text.size() );
    REQUIRE_EQUAL( reader.statistics().scannedHeaders, size_t( 2 ) );

    reader.close();
    REQUIRE( reader.closed() );
    REQUIRE_THROWS( reader.tell() );
    REQUIRE( !cloned->closed() );
    cloned->seek( 0 );
    REQUIRE_EQUAL( cloned->read( clonedData.data(), clonedData.size() ), clonedData.size() );
    REQUIRE_EQUAL( clonedData, text.substr( 0, 500 ) );
}


void
testFileDescriptor( const std::filesystem::path& folder )
{
    const auto text = createTestText( 70'000 );
    const auto filePath = ( folder / "fd.bgz" ).string();
    writeFile( filePath, bgzf::compressWithBgzf( text ) );

    const auto fileDescriptor = ::open( filePath.c_str(), O_RDONLY );
    REQUIRE( fileDescriptor >= 0 );
    {
        BgzfReader reader( fileDescriptor );
        reader.seek( 65'000 );
        REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 65'000, 1000 ) );
    }
    ::close( fileDescriptor );
}


void
testErrors( const std::filesystem::path& folder )
{
    REQUIRE_THROWS_AS( BgzfReader( ( folder / "does-not-exist.bgz" ).string() ), IOError );

    const auto text = createTestText( 10'000 );
    const auto valid = bgzf::compressWithBgzf( text, 1000 );

    /* Missing terminator */
    {
        BgzfReader reader( std::make_unique<MemoryFileReader>(
            std::vector<uint8_t>( valid.begin(), valid.end() - bgzf::TERMINATOR.size() ) ) );
        REQUIRE_EQUAL( readString( reader, 5000 ), text.substr( 0, 5000 ) );
        REQUIRE_THROWS_AS( reader.size(), UnexpectedTerminator );
        reader.seek( 9000 );
        REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 9000 ) );
        REQUIRE_THROWS_AS( readString( reader, 1 ), UnexpectedTerminator );
    }

    /* Checksum mismatch in the second block */
    {
        auto compressed = valid;
        BgzfReader validReader( std::make_unique<MemoryFileReader>( valid ) );
        (void)validReader.size();
        const auto offsets = validReader.blockOffsets();
        const auto secondBlockEnd = std::next( offsets.begin(), 2 )->first;
        compressed[secondBlockEnd - 5] ^= 0x80U;

        BgzfReader reader( std::make_unique<MemoryFileReader>( compressed ) );
        REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 0, 1000 ) );
        REQUIRE_THROWS_AS( readString( reader, 1 ), ChecksumMismatch );

        reader.setCRC32Enabled( false );
        REQUIRE_EQUAL( readString( reader, 1000 ), text.substr( 1000, 1000 ) );
    }

    /* Corrupt header of the third block */
    {
        auto compressed = valid;
        BgzfReader validReader( std::make_unique<MemoryFileReader>( valid ) );
        (void)validReader.size();
        const auto thirdBlockOffset = std::next( validReader.blockOffsets().begin(), 2 )->first;
        compressed[thirdBlockOffset] = 0x00;

        BgzfReader reader( std::make_unique<MemoryFileReader>( compressed ) );
        REQUIRE_EQUAL( readString( reader, 2000 ), text.substr( 0, 2000 ) );
        REQUIRE_THROWS_AS( reader.seek( 2000 ), CorruptBlock );
        REQUIRE_THROWS_AS( reader.size(), CorruptBlock );
        REQUIRE_EQUAL( reader.tell(), size_t( 2000 ) );
    }
}


void
testEmptyStream()
{
    BgzfReader reader( std::make_unique<MemoryFileReader>( bgzf::TERMINATOR ) );
    REQUIRE_EQUAL( reader.size().value_or( 1 ), size_t( 0 ) );
    REQUIRE_EQUAL( reader.seek( 0 ), size_t( 0 ) );
    REQUIRE_EQUAL( readString( reader, 10 ), std::string() );
    REQUIRE( reader.eof() );
    REQUIRE_THROWS_AS( reader.seek( 1 ), OutOfRange );
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "bgzfseek.testBgzfReader" );

    testSmallFile( tmpFolder );
    testConcreteScenario();
    testCacheReuse();
    testReadEverything();
    testClone();
    testFileDescriptor( tmpFolder );
    testErrors( tmpFolder );
    testEmptyStream();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
