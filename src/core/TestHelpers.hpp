#pragma once

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "common.hpp"


namespace bgzfseek
{
int gnTests = 0;  // NOLINT
int gnTestErrors = 0;  // NOLINT


template<typename A,
         typename B>
void
requireEqual( const A&  a,
              const B&  b,
              const int line )
{
    ++gnTests;
    if ( a != b ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << a << " != " << b << "\n";
    }
}


void
require( bool               condition,
         std::string const& conditionString,
         int                line )
{
    ++gnTests;
    if ( !condition ) {
        ++gnTestErrors;
        std::cerr << "[FAIL on line " << line << "] " << conditionString << "\n";
    }
}


#define REQUIRE_EQUAL( a, b ) requireEqual( a, b, __LINE__ )  // NOLINT
#define REQUIRE( condition ) require( condition, #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS( condition ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const std::exception& ) { \
        return true; \
    } \
    return false; \
} (), #condition, __LINE__ )  // NOLINT
#define REQUIRE_THROWS_AS( condition, exceptionType ) require( [&] () { \
    try { \
        (void)condition; \
    } catch ( const exceptionType& ) { \
        return true; \
    } catch ( const std::exception& exception ) { \
        std::cerr << "Caught unexpected exception: " << exception.what() << "\n"; \
    } \
    return false; \
} (), #condition " throws " #exceptionType, __LINE__ )  // NOLINT


class TemporaryDirectory
{
public:
    explicit
    TemporaryDirectory( std::filesystem::path path ) :
        m_path( std::move( path ) )
    {}

    TemporaryDirectory( TemporaryDirectory&& ) = default;

    TemporaryDirectory( const TemporaryDirectory& ) = delete;

    TemporaryDirectory&
    operator=( TemporaryDirectory&& ) = default;

    TemporaryDirectory&
    operator=( const TemporaryDirectory& ) = delete;

    ~TemporaryDirectory()
    {
        if ( !m_path.empty() ) {
            std::error_code errorCode;
            std::filesystem::remove_all( m_path, errorCode );
        }
    }

    [[nodiscard]] operator std::filesystem::path() const
    {
        return m_path;
    }

    [[nodiscard]] const std::filesystem::path&
    path() const
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};


[[nodiscard]] inline TemporaryDirectory
createTemporaryDirectory( const std::string& title = "tmpTest" )
{
    const std::filesystem::path tmpFolderName = std::filesystem::temp_directory_path()
                                                / ( title + "." + std::to_string( unixTimeInNanoseconds() ) );
    std::filesystem::create_directory( tmpFolderName );
    return TemporaryDirectory( tmpFolderName );
}
}  // namespace bgzfseek
