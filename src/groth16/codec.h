// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_GROTH16_CODEC_H
#define ZKVERIFY_GROTH16_CODEC_H

#include <groth16/curve.h>
#include <groth16/types.h>
#include <groth16/validation.h>

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * Points use the ZCash BLS12-381 encoding: big-endian coordinates, with the
 * three most significant bits of the first byte holding the compression,
 * infinity and sort flags. G2 coordinates are written c1 first, then c0.
 *
 * Proofs carry compressed points, verifying keys carry uncompressed ones.
 * Scalars are 32 byte little-endian elements of Fr.
 */

//! A || B || C
constexpr size_t G16_PROOF_SIZE{2 * G16_G1_COMPRESSED_SIZE + G16_G2_COMPRESSED_SIZE};

//! alpha || beta_g1 || beta || gamma || delta_g1 || delta || u32 ic count
constexpr size_t G16_VK_PREFIX_SIZE{3 * G16_G1_UNCOMPRESSED_SIZE + 3 * G16_G2_UNCOMPRESSED_SIZE + 4};

/**
 * Decode a proof from untrusted bytes.
 *
 * Every point is checked for canonical encoding, the curve equation and
 * prime-order subgroup membership before this returns true. On failure
 * @p state holds the reason and @p proof must not be used.
 */
bool DecodeProof(const unsigned char* data, size_t length, Groth16Proof& proof, Groth16ValidationState& state);
bool DecodeProof(const std::vector<unsigned char>& data, Groth16Proof& proof, Groth16ValidationState& state);

/**
 * Decode a verifying key from untrusted bytes.
 *
 * The size of the IC tail is validated against the encoded count before
 * any point is decoded, so a bogus count cannot cause a large allocation.
 */
bool DecodeVerifyingKey(const unsigned char* data, size_t length, Groth16VerifyingKey& vk, Groth16ValidationState& state);
bool DecodeVerifyingKey(const std::vector<unsigned char>& data, Groth16VerifyingKey& vk, Groth16ValidationState& state);

/** Decode one scalar. Values >= r are rejected rather than reduced. */
bool DecodeScalar(const unsigned char* data, size_t length, mclBnFr& scalar, Groth16ValidationState& state);

/** Decode a concatenation of scalars. An empty buffer yields no inputs. */
bool DecodePublicInputs(const unsigned char* data, size_t length, std::vector<mclBnFr>& inputs, Groth16ValidationState& state);
bool DecodePublicInputs(const std::vector<unsigned char>& data, std::vector<mclBnFr>& inputs, Groth16ValidationState& state);

/** Canonical encoders. They append to @p out. */
bool EncodeProof(const Groth16Proof& proof, std::vector<unsigned char>& out);
bool EncodeVerifyingKey(const Groth16VerifyingKey& vk, std::vector<unsigned char>& out);
bool EncodeScalar(const mclBnFr& scalar, std::vector<unsigned char>& out);

#endif // ZKVERIFY_GROTH16_CODEC_H
