/*/////////////////////////////////////////////////////////////////////////////
/// @summary Defines the streaming MD5 accumulator used to checksum file data
/// as it arrives, one chunk at a time, in file order.
///////////////////////////////////////////////////////////////////////////80*/

#ifndef URINGSUM_MD5_H
#define URINGSUM_MD5_H

/*////////////////
//   Includes   //
////////////////*/
#include <stddef.h>
#include <stdint.h>

#include <openssl/evp.h>

/*/////////////////
//   Constants   //
/////////////////*/
/// @summary The size of an MD5 digest, in bytes.
#define MD5_DIGEST_SIZE               16

/// @summary The size of a hex-formatted MD5 digest, including the terminating NULL.
#define MD5_HEX_SIZE                 (MD5_DIGEST_SIZE * 2 + 1)

/*//////////////////
//   Data Types   //
//////////////////*/
/// @summary Accumulates the MD5 digest of a byte stream. Data must be supplied
/// in stream order; the result does not depend on how the stream is split
/// into update() calls. Each instance owns one OpenSSL digest context.
class md5_accumulator_t
{
public:
    md5_accumulator_t(void);
    ~md5_accumulator_t(void);

    md5_accumulator_t(md5_accumulator_t &&other);
    md5_accumulator_t& operator =(md5_accumulator_t &&other);

    md5_accumulator_t(md5_accumulator_t const &) = delete;
    md5_accumulator_t& operator =(md5_accumulator_t const &) = delete;

    /// @summary Restart the accumulator at the empty stream.
    /// @return true if the digest context was (re)initialized.
    bool reset(void);

    /// @summary Append bytes to the stream.
    /// @param data The bytes to append. May be NULL if size is zero.
    /// @param size The number of bytes to append.
    /// @return true if the bytes were accepted.
    bool update(void const *data, size_t size);

    /// @summary Complete the digest. The accumulator must be reset before reuse.
    /// @param digest On return, receives the MD5_DIGEST_SIZE byte digest.
    /// @return true if the digest was produced.
    bool finalize(uint8_t digest[MD5_DIGEST_SIZE]);

    /// @summary Determine whether the accumulator is accepting data.
    bool is_open(void) const { return (Context != NULL) && (Finalized == false); }

private:
    EVP_MD_CTX        *Context;      /// The OpenSSL digest context, or NULL.
    bool               Finalized;    /// true once finalize() has been called.
};

/*////////////////
//   Functions  //
////////////////*/
/// @summary Compute the MD5 digest of a buffer in one call.
/// @param data The bytes to digest.
/// @param size The number of bytes to digest.
/// @param digest On return, receives the MD5_DIGEST_SIZE byte digest.
/// @return true if the digest was produced.
bool md5_buffer(void const *data, size_t size, uint8_t digest[MD5_DIGEST_SIZE]);

/// @summary Format a digest as 32 lowercase hexadecimal characters.
/// @param digest The MD5_DIGEST_SIZE byte digest.
/// @param hex The MD5_HEX_SIZE byte destination buffer.
/// @return The hex pointer.
char* md5_format_hex(uint8_t const digest[MD5_DIGEST_SIZE], char hex[MD5_HEX_SIZE]);

#endif /* !defined(URINGSUM_MD5_H) */
