/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines helpers for creating scratch input files in unit tests.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_TEST_FILES_H
#define URINGSUM_TEST_FILES_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary A scratch directory that is removed, with its contents, on destruction.
class scratch_dir_t
{
public:
    scratch_dir_t(void);
    ~scratch_dir_t(void);

    scratch_dir_t(scratch_dir_t const &) = delete;
    scratch_dir_t& operator =(scratch_dir_t const &) = delete;

    /// @summary Create a file filled with a deterministic byte pattern.
    /// @param name The file name within the directory.
    /// @param size The file size, in bytes.
    /// @return The absolute path of the file.
    std::string add_file(char const *name, size_t size);

    /// @summary Build a path within the directory without creating anything.
    std::string path_of(char const *name) const;

    std::string const& path(void) const { return Path; }

private:
    std::string              Path;
    std::vector<std::string> Files;
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Generate the byte pattern written by scratch_dir_t::add_file.
/// @param size The number of bytes to generate.
/// @param seed Distinguishes the contents of different files.
std::vector<uint8_t> pattern_bytes(size_t size, uint32_t seed);

/// @summary Compute the lowercase hex MD5 of the contents of a file written by add_file.
std::string expected_md5_hex(std::string const &path);

/// @summary Format a binary digest as lowercase hex.
std::string digest_hex(uint8_t const *digest);

#endif /* !defined(URINGSUM_TEST_FILES_H) */
