// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <groth16/verifier.h>

#include <groth16/curve.h>
#include <logging.h>

namespace {

std::vector<uint64_t> PrecomputeNegG2(const mclBnG2& q)
{
    if (mclBnG2_isZero(&q)) {
        return {};
    }

    mclBnG2 neg;
    mclBnG2_neg(&neg, &q);

    std::vector<uint64_t> lines(mclBn_getUint64NumToPrecompute());
    mclBn_precomputeG2(lines.data(), &neg);
    return lines;
}

/** f *= e'(p, q) for precomputed q, where e' is the Miller loop before final exponentiation. */
void MulPrecomputedMillerLoop(mclBnGT& f, const mclBnG1& p, const std::vector<uint64_t>& q_lines)
{
    if (mclBnG1_isZero(&p) || q_lines.empty()) {
        return;
    }
    mclBnGT tmp;
    mclBn_precomputedMillerLoop(&tmp, &p, q_lines.data());
    mclBnGT_mul(&f, &f, &tmp);
}

} // namespace

Groth16PreparedVerifyingKey PrepareVerifyingKey(const Groth16VerifyingKey& vk)
{
    Groth16PreparedVerifyingKey pvk;

    // pre-compute e(α, β)
    if (mclBnG1_isZero(&vk.alpha) || mclBnG2_isZero(&vk.beta)) {
        mclBnGT_setInt32(&pvk.eAlphaBeta, 1);
    } else {
        mclBn_pairing(&pvk.eAlphaBeta, &vk.alpha, &vk.beta);
    }

    // pre-compute the lines of -[γ]₂ and -[δ]₂
    pvk.gammaNegLines = PrecomputeNegG2(vk.gamma);
    pvk.deltaNegLines = PrecomputeNegG2(vk.delta);

    pvk.ic = vk.ic;
    return pvk;
}

bool VerifyProof(const Groth16PreparedVerifyingKey& pvk,
                 const Groth16Proof& proof,
                 const std::vector<mclBnFr>& public_inputs,
                 Groth16ValidationState& state)
{
    if (!InitGroth16Curve()) {
        return state.Error("groth16-curve-init");
    }
    if (pvk.ic.empty() || public_inputs.size() + 1 != pvk.ic.size()) {
        return state.Invalid(Groth16Result::INPUT_COUNT_MISMATCH, "groth16-input-count",
                             tfm::format("key expects %u public inputs, got %u",
                                         pvk.ic.empty() ? 0 : pvk.ic.size() - 1, public_inputs.size()));
    }

    // [IC₀ + Σᵥ (ICᵥ₊₁ * publicInputs[v])]₁
    mclBnG1 sumICTimesPub = pvk.ic[0];
    mclBnG1 tmpICvTimesPubv;
    for (size_t v = 0; v < public_inputs.size(); ++v) {
        mclBnG1_mul(&tmpICvTimesPubv, &pvk.ic[v + 1], &public_inputs[v]);
        mclBnG1_add(&sumICTimesPub, &sumICTimesPub, &tmpICvTimesPubv);
    }

    // z = e'(A, B) * e'(IC, -[γ]₂) * e'(C, -[δ]₂), Miller loops only
    mclBnGT z;
    mclBnGT_setInt32(&z, 1);

    if (!mclBnG1_isZero(&proof.a) && !mclBnG2_isZero(&proof.b)) {
        mclBn_millerLoop(&z, &proof.a, &proof.b);
    }

    if (!mclBnG1_isZero(&sumICTimesPub) && !pvk.gammaNegLines.empty() &&
        !mclBnG1_isZero(&proof.c) && !pvk.deltaNegLines.empty()) {
        mclBnGT tmp;
        mclBn_precomputedMillerLoop2(&tmp, &sumICTimesPub, pvk.gammaNegLines.data(), &proof.c, pvk.deltaNegLines.data());
        mclBnGT_mul(&z, &z, &tmp);
    } else {
        MulPrecomputedMillerLoop(z, sumICTimesPub, pvk.gammaNegLines);
        MulPrecomputedMillerLoop(z, proof.c, pvk.deltaNegLines);
    }

    // ensure that z is a unique value in GT
    mclBn_finalExp(&z, &z);

    if (!mclBnGT_isEqual(&z, &pvk.eAlphaBeta)) {
        LogPrint(ZKVLog::VERIFY, "Groth16 pairing check failed (%u public inputs)\n", public_inputs.size());
        return state.Invalid(Groth16Result::VERIFICATION_FAILED, "groth16-pairing-check");
    }

    LogPrint(ZKVLog::VERIFY, "Groth16 proof verified (%u public inputs)\n", public_inputs.size());
    return true;
}

bool VerifyProof(const Groth16VerifyingKey& vk,
                 const Groth16Proof& proof,
                 const std::vector<mclBnFr>& public_inputs,
                 Groth16ValidationState& state)
{
    if (!InitGroth16Curve()) {
        return state.Error("groth16-curve-init");
    }
    return VerifyProof(PrepareVerifyingKey(vk), proof, public_inputs, state);
}
