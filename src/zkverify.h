// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_ZKVERIFY_H
#define ZKVERIFY_ZKVERIFY_H

#include <stddef.h>

#if defined(_WIN32)
  #if defined(HAVE_DEFAULT_VISIBILITY_ATTRIBUTE)
    #define EXPORT_SYMBOL __declspec(dllexport)
  #else
    #define EXPORT_SYMBOL
  #endif
#elif defined(__GNUC__)
  #define EXPORT_SYMBOL __attribute__((visibility("default")))
#else
  #define EXPORT_SYMBOL
#endif

#ifdef __cplusplus
extern "C" {
#endif

#define ZKVERIFY_API_VER 1

typedef enum zkverify_error_t
{
    zkverify_ERR_OK = 0,
    zkverify_ERR_MALFORMED_LENGTH,
    zkverify_ERR_TRAILING_BYTES,
    zkverify_ERR_NON_CANONICAL_ENCODING,
    zkverify_ERR_POINT_NOT_ON_CURVE,
    zkverify_ERR_POINT_NOT_IN_SUBGROUP,
    zkverify_ERR_INPUT_COUNT_MISMATCH,
    zkverify_ERR_INTERNAL,
} zkverify_error;

/// Returns 1 if the Groth16 proof verifies against the verifying key with
/// no public inputs, 0 for anything else: a malformed proof, a malformed
/// key, or a proof that does not verify. Both buffers are only read, and
/// only for the duration of the call.
EXPORT_SYMBOL int verify(const unsigned char *proof, size_t proof_len,
                         const unsigned char *key, size_t key_len);

/// Same as verify(), with public inputs given as a concatenation of 32 byte
/// little-endian scalars. If not nullptr, err will contain an error/success
/// code for the operation. zkverify_ERR_OK means a verification decision
/// was reached, whatever the return value.
EXPORT_SYMBOL int zkverify_verify_proof(const unsigned char *proof, size_t proof_len,
                                        const unsigned char *key, size_t key_len,
                                        const unsigned char *public_inputs, size_t public_inputs_len,
                                        zkverify_error* err);

EXPORT_SYMBOL unsigned int zkverify_version();

/// Enable a log category ("codec", "verify", "abi" or "all") and print log
/// output to stderr. Returns 1 if the category is known.
EXPORT_SYMBOL int zkverify_log_enable(const char *category);

#ifdef __cplusplus
} // extern "C"
#endif

#undef EXPORT_SYMBOL

#ifdef __cplusplus
#include <vector>

/** verify() over byte vectors. Empty vectors are rejected, not dereferenced. */
int VerifyGroth16(const std::vector<unsigned char>& proof, const std::vector<unsigned char>& key);
#endif

#endif // ZKVERIFY_ZKVERIFY_H
