// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_GROTH16_CURVE_H
#define ZKVERIFY_GROTH16_CURVE_H

#include <mcl/bn_c384_256.h>

#include <cstddef>

//! Size of an encoded base field element (Fp) of BLS12-381.
constexpr size_t G16_FP_SIZE_BYTES{48};
//! Size of an encoded scalar field element (Fr) of BLS12-381.
constexpr size_t G16_FR_SIZE_BYTES{32};

constexpr size_t G16_G1_COMPRESSED_SIZE{G16_FP_SIZE_BYTES};
constexpr size_t G16_G2_COMPRESSED_SIZE{2 * G16_FP_SIZE_BYTES};
constexpr size_t G16_G1_UNCOMPRESSED_SIZE{2 * G16_FP_SIZE_BYTES};
constexpr size_t G16_G2_UNCOMPRESSED_SIZE{4 * G16_FP_SIZE_BYTES};

/**
 * Initialize the mcl pairing engine for BLS12-381.
 *
 * Runs once per process no matter how many threads call it. No other mcl
 * setting is changed, so a host that uses mcl itself keeps its own
 * mclBn_verifyOrderG1/mclBn_verifyOrderG2 configuration.
 *
 * @return false if mcl could not be initialized. Nothing else in this
 *         library may touch mcl in that case.
 */
bool InitGroth16Curve();

#endif // ZKVERIFY_GROTH16_CURVE_H
