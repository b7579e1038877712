// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <zkverify.h>

#include <groth16/codec.h>
#include <groth16/verifier.h>
#include <logging.h>

#include <exception>
#include <string>
#include <vector>

namespace {

inline int set_error(zkverify_error* ret, zkverify_error serror)
{
    if (ret)
        *ret = serror;
    return 0;
}

zkverify_error ErrorFromState(const Groth16ValidationState& state)
{
    if (state.IsError()) return zkverify_ERR_INTERNAL;

    switch (state.GetResult()) {
    case Groth16Result::MALFORMED_LENGTH:
        return zkverify_ERR_MALFORMED_LENGTH;
    case Groth16Result::TRAILING_BYTES:
        return zkverify_ERR_TRAILING_BYTES;
    case Groth16Result::NON_CANONICAL_ENCODING:
        return zkverify_ERR_NON_CANONICAL_ENCODING;
    case Groth16Result::POINT_NOT_ON_CURVE:
        return zkverify_ERR_POINT_NOT_ON_CURVE;
    case Groth16Result::POINT_NOT_IN_SUBGROUP:
        return zkverify_ERR_POINT_NOT_IN_SUBGROUP;
    case Groth16Result::INPUT_COUNT_MISMATCH:
        return zkverify_ERR_INPUT_COUNT_MISMATCH;
    case Groth16Result::VERIFICATION_FAILED:
        return zkverify_ERR_OK;
    case Groth16Result::RESULT_UNSET:
        break;
    }
    return zkverify_ERR_INTERNAL;
}

/** A buffer is usable if it has a pointer, or if it is empty. */
bool BufferOk(const unsigned char* ptr, size_t len)
{
    return ptr != nullptr || len == 0;
}

} // namespace

int zkverify_verify_proof(const unsigned char *proof, size_t proof_len,
                          const unsigned char *key, size_t key_len,
                          const unsigned char *public_inputs, size_t public_inputs_len,
                          zkverify_error* err)
{
    try {
        if (!BufferOk(proof, proof_len) || !BufferOk(key, key_len) || !BufferOk(public_inputs, public_inputs_len)) {
            return set_error(err, zkverify_ERR_MALFORMED_LENGTH);
        }

        Groth16ValidationState state;
        Groth16Proof tproof;
        if (!DecodeProof(proof, proof_len, tproof, state)) {
            return set_error(err, ErrorFromState(state));
        }

        Groth16VerifyingKey tvk;
        if (!DecodeVerifyingKey(key, key_len, tvk, state)) {
            return set_error(err, ErrorFromState(state));
        }

        std::vector<mclBnFr> inputs;
        if (!DecodePublicInputs(public_inputs, public_inputs_len, inputs, state)) {
            return set_error(err, ErrorFromState(state));
        }

        const Groth16PreparedVerifyingKey tpvk = PrepareVerifyingKey(tvk);
        if (!VerifyProof(tpvk, tproof, inputs, state)) {
            LogPrint(ZKVLog::ABI, "zkverify: proof rejected: %s\n", state.ToString());
            return set_error(err, ErrorFromState(state));
        }

        set_error(err, zkverify_ERR_OK);
        return 1;
    } catch (const std::exception& e) {
        LogPrintf("zkverify: unexpected error: %s\n", e.what());
        return set_error(err, zkverify_ERR_INTERNAL);
    }
}

int verify(const unsigned char *proof, size_t proof_len,
           const unsigned char *key, size_t key_len)
{
    return zkverify_verify_proof(proof, proof_len, key, key_len, nullptr, 0, nullptr);
}

unsigned int zkverify_version()
{
    // Just use the API version for now
    return ZKVERIFY_API_VER;
}

int zkverify_log_enable(const char *category)
{
    if (category == nullptr) return 0;
    try {
        if (!LogInstance().EnableCategory(std::string(category))) {
            return 0;
        }
        LogInstance().m_print_to_console = true;
        return 1;
    } catch (const std::exception&) {
        return 0;
    }
}

int VerifyGroth16(const std::vector<unsigned char>& proof, const std::vector<unsigned char>& key)
{
    return verify(proof.data(), proof.size(), key.data(), key.size());
}
