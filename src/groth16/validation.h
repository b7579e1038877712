// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_GROTH16_VALIDATION_H
#define ZKVERIFY_GROTH16_VALIDATION_H

#include <string>

/** A "reason" why a proof, key or public input was rejected.
 *
 * The decode results are detected before any pairing arithmetic runs.
 * INPUT_COUNT_MISMATCH is a caller error. VERIFICATION_FAILED is the only
 * result that means "well-formed, but the proof does not hold".
 */
enum class Groth16Result {
    RESULT_UNSET = 0,       //!< initial value. Valid or not rejected yet.
    MALFORMED_LENGTH,       //!< buffer size does not match the expected structure size
    TRAILING_BYTES,         //!< more complete elements than the structure declares
    NON_CANONICAL_ENCODING, //!< bad flag bits, or a field element >= its modulus
    POINT_NOT_ON_CURVE,     //!< decoded coordinates do not satisfy the curve equation
    POINT_NOT_IN_SUBGROUP,  //!< on the curve, but outside the prime-order subgroup
    INPUT_COUNT_MISMATCH,   //!< number of public inputs does not match the key
    VERIFICATION_FAILED,    //!< structurally valid, pairing equation does not hold
};

/** Template for capturing information about decode and verification
 * failures. Mirrors the consensus ValidationState: a call either leaves
 * it valid, marks it invalid with a result and reject reason, or marks an
 * error that prevented a decision from being made at all. */
template <typename Result>
class ValidationState
{
private:
    enum class ModeState {
        M_VALID,   //!< everything ok
        M_INVALID, //!< rejected input
        M_ERROR,   //!< run-time error
    } m_mode{ModeState::M_VALID};
    Result m_result{};
    std::string m_reject_reason;
    std::string m_debug_message;

public:
    bool Invalid(Result result,
                 const std::string& reject_reason = "",
                 const std::string& debug_message = "")
    {
        m_result = result;
        m_reject_reason = reject_reason;
        m_debug_message = debug_message;
        if (m_mode != ModeState::M_ERROR) m_mode = ModeState::M_INVALID;
        return false;
    }
    bool Error(const std::string& reject_reason)
    {
        if (m_mode == ModeState::M_VALID)
            m_reject_reason = reject_reason;
        m_mode = ModeState::M_ERROR;
        return false;
    }
    bool IsValid() const { return m_mode == ModeState::M_VALID; }
    bool IsInvalid() const { return m_mode == ModeState::M_INVALID; }
    bool IsError() const { return m_mode == ModeState::M_ERROR; }
    Result GetResult() const { return m_result; }
    std::string GetRejectReason() const { return m_reject_reason; }
    std::string GetDebugMessage() const { return m_debug_message; }
    std::string ToString() const
    {
        if (IsValid()) {
            return "Valid";
        }

        if (!m_debug_message.empty()) {
            return m_reject_reason + ", " + m_debug_message;
        }

        return m_reject_reason;
    }
};

class Groth16ValidationState : public ValidationState<Groth16Result> {};

#endif // ZKVERIFY_GROTH16_VALIDATION_H
