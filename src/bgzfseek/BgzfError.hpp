#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <Error.hpp>


namespace bgzfseek
{
/**
 * Base class for all errors raised while reading a BGZF file. Each subclass corresponds to one failure category
 * and the finer-grained cause is available via @ref error.
 */
class BgzfError :
    public std::runtime_error
{
public:
    BgzfError( Error              error,
               const std::string& message ) :
        std::runtime_error( formatMessage( error, message ) ),
        m_error( error )
    {}

    [[nodiscard]] Error
    error() const noexcept
    {
        return m_error;
    }

private:
    [[nodiscard]] static std::string
    formatMessage( Error              error,
                   const std::string& message )
    {
        std::stringstream result;
        result << message;
        if ( error != Error::NONE ) {
            result << " (" << toString( error ) << ")";
        }
        return std::move( result ).str();
    }

private:
    const Error m_error;
};


/** The underlying file could not be opened or read. */
class IOError :
    public BgzfError
{
public:
    explicit
    IOError( const std::string& message ) :
        BgzfError( Error::IO_ERROR, message )
    {}
};


/** Malformed block framing or a payload that does not inflate to the announced size. */
class CorruptBlock :
    public BgzfError
{
public:
    CorruptBlock( Error              error,
                  const std::string& message ) :
        BgzfError( error, message )
    {}
};


class ChecksumMismatch :
    public BgzfError
{
public:
    explicit
    ChecksumMismatch( const std::string& message ) :
        BgzfError( Error::CHECKSUM_MISMATCH, message )
    {}
};


class OutOfRange :
    public BgzfError
{
public:
    explicit
    OutOfRange( const std::string& message ) :
        BgzfError( Error::OUT_OF_RANGE, message )
    {}
};


/** The file ended before the terminator block, i.e., it probably was truncated. */
class UnexpectedTerminator :
    public BgzfError
{
public:
    explicit
    UnexpectedTerminator( const std::string& message,
                          Error              error = Error::UNEXPECTED_TERMINATOR ) :
        BgzfError( error, message )
    {}
};
}  // namespace bgzfseek
