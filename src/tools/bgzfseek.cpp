#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <cxxopts.hpp>

#include <bgzfseek/bgzfseek.hpp>
#include <common.hpp>
#include <filereader/Standard.hpp>
#include <FileUtils.hpp>

#include "CLIHelper.hpp"


using namespace bgzfseek;


namespace
{
struct Arguments
{
    std::string inputFilePath;
    std::string outputFilePath;
    size_t offset{ 0 };
    size_t count{ std::numeric_limits<size_t>::max() };
    size_t blockSize{ bgzf::DEFAULT_BLOCK_DATA_SIZE };
    bool crc32Enabled{ true };
    bool verbose{ false };
    bool quiet{ false };
};


/**
 * Owns the output file descriptor. An empty path means standard output, which is not closed.
 */
class OutputFile
{
public:
    explicit
    OutputFile( const std::string& filePath )
    {
        if ( filePath.empty() ) {
            m_fileDescriptor = ::fileno( stdout );
            return;
        }

        m_fileDescriptor = ::open( filePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644 );
        if ( m_fileDescriptor == -1 ) {
            throw std::invalid_argument( "Could not open output file '" + filePath + "': " + std::strerror( errno ) );
        }
        m_ownedFileDescriptor = true;
    }

    ~OutputFile()
    {
        if ( m_ownedFileDescriptor ) {
            ::close( m_fileDescriptor );
        }
    }

    OutputFile( const OutputFile& ) = delete;

    OutputFile&
    operator=( const OutputFile& ) = delete;

    void
    write( const void* data,
           size_t      size ) const
    {
        if ( const auto errorCode = writeAllToFd( m_fileDescriptor, data, size ); errorCode != 0 ) {
            throw std::runtime_error( std::string( "Failed to write to output: " ) + std::strerror( errorCode ) );
        }
    }

private:
    int m_fileDescriptor{ -1 };
    bool m_ownedFileDescriptor{ false };
};


void
printBgzfseekHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "Reads arbitrary ranges from BGZF compressed files, decompressing only the blocks that are needed.\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "Print 100 bytes starting at decompressed offset 1000000:\n"
    << "  bgzfseek --offset 1000000 --count 100 file.bgz\n"
    << "\n"
    << "Print the decompressed size:\n"
    << "  bgzfseek --size file.bgz\n"
    << "\n"
    << "Compress a file into BGZF:\n"
    << "  bgzfseek --compress -o file.bgz file\n"
    << std::endl;
}


int
compressFile( const Arguments& args )
{
    const auto t0 = now();

    const auto contents = readFile<std::vector<uint8_t> >( args.inputFilePath );
    const auto compressed = bgzf::compressWithBgzf( contents, args.blockSize );
    OutputFile( args.outputFilePath ).write( compressed.data(), compressed.size() );

    if ( args.verbose ) {
        std::cerr << ( ThreadSafeOutput() << "Compressed" << formatBytes( contents.size() ) << "to"
                       << formatBytes( compressed.size() ) << "in" << duration( t0 ) << "s" );
    }
    return 0;
}


void
printBlockOffsets( BgzfReader& reader )
{
    [[maybe_unused]] const auto totalSize = reader.size();
    std::cout << "Encoded Offset | Decoded Offset\n";
    for ( const auto& [encodedOffset, decodedOffset] : reader.blockOffsets() ) {
        std::cout << encodedOffset << " | " << decodedOffset << "\n";
    }
}


size_t
copyRange( BgzfReader&       reader,
           const Arguments&  args,
           const OutputFile& output )
{
    reader.seek( static_cast<long long int>( args.offset ) );

    std::vector<char> buffer( 64_Ki );
    size_t totalBytesWritten{ 0 };
    while ( totalBytesWritten < args.count ) {
        const auto nBytesToRead = std::min( buffer.size(), args.count - totalBytesWritten );
        const auto nBytesRead = reader.read( buffer.data(), nBytesToRead );
        if ( nBytesRead == 0 ) {
            break;
        }
        output.write( buffer.data(), nBytesRead );
        totalBytesWritten += nBytesRead;
    }
    return totalBytesWritten;
}
}  // namespace


int
bgzfseekCLI( int                  argc,
             char const * const * argv )
{
    Arguments args;

    cxxopts::Options options( "bgzfseek", "Random access to the decompressed contents of BGZF files." );
    options.add_options( "Input and Output Options" )
        ( "i,input"  , "Input file.", cxxopts::value<std::string>() )
        ( "o,output" , "Output file. If none is given, then will write to standard output.",
          cxxopts::value<std::string>() )
        ( "offset"   , "Decompressed offset in bytes to start reading from.",
          cxxopts::value<size_t>()->default_value( "0" ) )
        ( "count"    , "Number of decompressed bytes to output. By default, outputs everything until the end.",
          cxxopts::value<size_t>() );

    options.add_options( "Advanced" )
        ( "block-size", "Uncompressed size of each block written with --compress in bytes.",
          cxxopts::value<size_t>()->default_value( std::to_string( bgzf::DEFAULT_BLOCK_DATA_SIZE ) ) )
        ( "no-verify" , "Do not verify the CRC32 checksum of each decompressed block. The decompressed block "
                        "size is checked regardless.",
          cxxopts::value( args.crc32Enabled )->implicit_value( "false" ) );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "q,quiet"  , "Suppress noncritical error messages." )
        ( "v,verbose", "Print debug output and profiling statistics." )
        ( "V,version", "Display software version." );

    options.add_options( "Actions" )
        ( "size"    , "Prints the decompressed size." )
        ( "blocks"  , "Prints the compressed and decompressed offsets of all blocks." )
        ( "check"   , "Checks whether the input looks like a BGZF file with terminator." )
        ( "compress", "Compress the input into BGZF instead of decompressing it." );

    options.parse_positional( { "input" } );

    const auto parsedArgs = options.parse( argc, argv );

    args.quiet = parsedArgs["quiet"].as<bool>();
    args.verbose = parsedArgs["verbose"].as<bool>();

    /* Check against simple commands like help and version. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printBgzfseekHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "bgzfseek, CLI to the seekable BGZF reader library bgzfseek version 0.1.0.\n";
        return 0;
    }

    /* Parse input and output file arguments. */

    args.inputFilePath = getFilePath( parsedArgs, "input" );
    if ( args.inputFilePath.empty() ) {
        std::cerr << "An input file must be specified because reading from standard input is not seekable!\n";
        return 1;
    }
    if ( !fileExists( args.inputFilePath ) ) {
        std::cerr << "Input file could not be found! Specified path: " << args.inputFilePath << "\n";
        return 1;
    }

    args.outputFilePath = getFilePath( parsedArgs, "output" );
    args.offset = parsedArgs["offset"].as<size_t>();
    if ( parsedArgs.count( "count" ) > 0 ) {
        args.count = parsedArgs["count"].as<size_t>();
    }
    args.blockSize = parsedArgs["block-size"].as<size_t>();

    if ( args.verbose ) {
        std::cerr << ( ThreadSafeOutput() << "Input:" << args.inputFilePath << "-> Output:"
                       << ( args.outputFilePath.empty() ? "<stdout>" : args.outputFilePath ) );
    }

    /* Actions that do not decompress. */

    if ( parsedArgs.count( "compress" ) > 0 ) {
        if ( !args.quiet && ( parsedArgs.count( "offset" ) + parsedArgs.count( "count" ) > 0 ) ) {
            std::cerr << "[Warning] --offset and --count are ignored when compressing.\n";
        }
        return compressFile( args );
    }

    if ( parsedArgs.count( "check" ) > 0 ) {
        StandardFileReader file( args.inputFilePath );
        const auto isBgzf = bgzf::isBgzfFile( file );
        if ( !args.quiet ) {
            std::cout << args.inputFilePath << ( isBgzf ? " is" : " is not" ) << " a BGZF file with terminator.\n";
        }
        return isBgzf ? 0 : 1;
    }

    /* Actions that read. */

    BgzfReader reader( args.inputFilePath );
    reader.setShowProfileOnDestruction( args.verbose );
    reader.setCRC32Enabled( args.crc32Enabled );

    if ( !args.quiet ) {
        StandardFileReader file( args.inputFilePath );
        if ( !bgzf::isBgzfFile( file ) ) {
            std::cerr << "[Warning] The input does not start with a BGZF header or does not end with the "
                      << "BGZF terminator. Reading will probably fail.\n";
        }
    }

    if ( parsedArgs.count( "size" ) > 0 ) {
        std::cout << reader.size().value_or( 0 ) << "\n";
        return 0;
    }

    if ( parsedArgs.count( "blocks" ) > 0 ) {
        printBlockOffsets( reader );
        return 0;
    }

    const auto t0 = now();
    const OutputFile output( args.outputFilePath );
    const auto totalBytesWritten = copyRange( reader, args, output );

    if ( args.verbose ) {
        std::cerr << ( ThreadSafeOutput() << "Wrote" << totalBytesWritten << "B in" << duration( t0 ) << "s" );
    }

    return 0;
}


int
main( int argc, char** argv )
{
    try
    {
        return bgzfseekCLI( argc, argv );
    }
    catch ( const UnexpectedTerminator& exception )
    {
        std::cerr << "Unexpected end of file. Truncated or invalid BGZF? " << exception.what() << "\n";
        return 1;
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
