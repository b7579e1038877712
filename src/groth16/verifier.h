// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_GROTH16_VERIFIER_H
#define ZKVERIFY_GROTH16_VERIFIER_H

#include <groth16/types.h>
#include <groth16/validation.h>

#include <vector>

/** Precompute e(α, β) and the Miller loop lines of -[γ]₂ and -[δ]₂. */
Groth16PreparedVerifyingKey PrepareVerifyingKey(const Groth16VerifyingKey& vk);

/**
 * Check a Groth16 proof against a prepared verifying key.
 *
 * Accepts iff e(A, B) · e(IC, -[γ]₂) · e(C, -[δ]₂) == e(α, β), where
 * IC = IC₀ + Σᵥ publicInputs[v] · ICᵥ₊₁.
 *
 * @return true if the proof is valid. On false, @p state tells apart a
 *         public input count that does not match the key
 *         (INPUT_COUNT_MISMATCH) from a proof that does not verify
 *         (VERIFICATION_FAILED).
 */
bool VerifyProof(const Groth16PreparedVerifyingKey& pvk,
                 const Groth16Proof& proof,
                 const std::vector<mclBnFr>& public_inputs,
                 Groth16ValidationState& state);

bool VerifyProof(const Groth16VerifyingKey& vk,
                 const Groth16Proof& proof,
                 const std::vector<mclBnFr>& public_inputs,
                 Groth16ValidationState& state);

#endif // ZKVERIFY_GROTH16_VERIFIER_H
