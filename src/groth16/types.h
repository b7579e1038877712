// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_GROTH16_TYPES_H
#define ZKVERIFY_GROTH16_TYPES_H

#include <mcl/bn_c384_256.h>

#include <cstddef>
#include <cstdint>
#include <vector>

// Proof
struct Groth16Proof
{
    mclBnG1 a; // [A]₁
    mclBnG2 b; // [B]₂
    mclBnG1 c; // [C]₁
};

// Verifier Key
struct Groth16VerifyingKey
{
    mclBnG1 alpha;    // [α]₁
    mclBnG1 beta_g1;  // [β]₁
    mclBnG2 beta;     // [β]₂
    mclBnG2 gamma;    // [γ]₂
    mclBnG1 delta_g1; // [δ]₁
    mclBnG2 delta;    // [δ]₂

    /** [ICᵥ]₁: the constant term followed by one element per public input. */
    std::vector<mclBnG1> ic;

    size_t NumPublicInputs() const { return ic.empty() ? 0 : ic.size() - 1; }
};

/**
 * Verifier Key Precomputed Values.
 *
 * The fixed G2 side of the γ and δ pairings is stored as precomputed Miller
 * loop lines (see mclBn_precomputeG2). An empty line buffer stands for the
 * identity, whose pairing with anything is 1.
 */
struct Groth16PreparedVerifyingKey
{
    mclBnGT eAlphaBeta;                 // e(α, β)
    std::vector<uint64_t> gammaNegLines; // -[γ]₂
    std::vector<uint64_t> deltaNegLines; // -[δ]₂
    std::vector<mclBnG1> ic;             // [ICᵥ]₁
};

#endif // ZKVERIFY_GROTH16_TYPES_H
