#pragma once

#include <ostream>
#include <string>


namespace bgzfseek
{
enum class [[nodiscard]] Error
{
    NONE                        = 0x00,
    /* No error, there simply is no data at all for e.g. reading the next block header,
     * which might indicate a valid end of file. */
    END_OF_FILE                 = 0x01,

    IO_ERROR                    = 0x10,

    INVALID_GZIP_HEADER         = 0x20,
    INVALID_BGZF_EXTRA_FIELD    = 0x21,
    INVALID_BLOCK_SIZE          = 0x22,
    INFLATE_FAILED              = 0x23,
    LENGTH_MISMATCH             = 0x24,

    CHECKSUM_MISMATCH           = 0x30,

    OUT_OF_RANGE                = 0x40,

    UNEXPECTED_TERMINATOR       = 0x50,
    TRUNCATED_BLOCK             = 0x51,
};


[[nodiscard]] inline std::string
toString( Error error )
{
    switch ( error )
    {
    case Error::NONE:
        return "No error.";
    case Error::END_OF_FILE:
        return "End of file reached.";
    case Error::IO_ERROR:
        return "Failed to read from the underlying file!";
    case Error::INVALID_GZIP_HEADER:
        return "Invalid gzip magic bytes or flags!";
    case Error::INVALID_BGZF_EXTRA_FIELD:
        return "Missing or malformed BGZF extra field!";
    case Error::INVALID_BLOCK_SIZE:
        return "BGZF block size is inconsistent with the block framing!";
    case Error::INFLATE_FAILED:
        return "Failed to inflate the block payload!";
    case Error::LENGTH_MISMATCH:
        return "Decompressed block size does not match the size stored in the footer!";
    case Error::CHECKSUM_MISMATCH:
        return "CRC32 of the decompressed block does not match the stored checksum!";
    case Error::OUT_OF_RANGE:
        return "Requested position lies beyond the end of the decompressed stream!";
    case Error::UNEXPECTED_TERMINATOR:
        return "Reached the end of the file before the BGZF terminator block!";
    case Error::TRUNCATED_BLOCK:
        return "BGZF block extends beyond the end of the file!";
    }
    return "Unknown error code!";
}


inline std::ostream&
operator<<( std::ostream& out,
            Error         error )
{
    out << toString( error );
    return out;
}
}  // namespace bgzfseek
