// Copyright (c) 2023 The Bitcoin developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <groth16/codec.h>

#include <logging.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace {

constexpr unsigned char FLAG_COMPRESSED{0x80};
constexpr unsigned char FLAG_INFINITY{0x40};
constexpr unsigned char FLAG_SORT{0x20};
constexpr unsigned char FLAG_MASK{FLAG_COMPRESSED | FLAG_INFINITY | FLAG_SORT};

// BLS12-381 base field modulus p, big-endian.
const unsigned char FP_MODULUS[G16_FP_SIZE_BYTES] = {
    0x1a, 0x01, 0x11, 0xea, 0x39, 0x7f, 0xe6, 0x9a, 0x4b, 0x1b, 0xa7, 0xb6,
    0x43, 0x4b, 0xac, 0xd7, 0x64, 0x77, 0x4b, 0x84, 0xf3, 0x85, 0x12, 0xbf,
    0x67, 0x30, 0xd2, 0xa0, 0xf6, 0xb0, 0xf6, 0x24, 0x1e, 0xab, 0xff, 0xfe,
    0xb1, 0x53, 0xff, 0xff, 0xb9, 0xfe, 0xff, 0xff, 0xff, 0xff, 0xaa, 0xab};

// BLS12-381 group order r, big-endian.
const unsigned char FR_MODULUS[G16_FR_SIZE_BYTES] = {
    0x73, 0xed, 0xa7, 0x53, 0x29, 0x9d, 0x7d, 0x48, 0x33, 0x39, 0xd8, 0x08,
    0x09, 0xa1, 0xd8, 0x05, 0x53, 0xbd, 0xa4, 0x02, 0xff, 0xfe, 0x5b, 0xfe,
    0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x01};

uint32_t ReadBE32(const unsigned char* ptr)
{
    return (static_cast<uint32_t>(ptr[0]) << 24) | (static_cast<uint32_t>(ptr[1]) << 16) |
           (static_cast<uint32_t>(ptr[2]) << 8) | static_cast<uint32_t>(ptr[3]);
}

void WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = static_cast<unsigned char>(x >> 24);
    ptr[1] = static_cast<unsigned char>(x >> 16);
    ptr[2] = static_cast<unsigned char>(x >> 8);
    ptr[3] = static_cast<unsigned char>(x);
}

/** Read a big-endian field element, rejecting anything >= p. */
bool DeserializeFp(mclBnFp& f, const unsigned char* x, bool strip_flags)
{
    unsigned char buf[G16_FP_SIZE_BYTES];
    std::memcpy(buf, x, sizeof(buf));
    if (strip_flags) buf[0] &= ~FLAG_MASK;

    if (std::memcmp(buf, FP_MODULUS, sizeof(buf)) >= 0) {
        return false;
    }

    std::reverse(buf, buf + sizeof(buf));
    return mclBnFp_setLittleEndian(&f, buf, sizeof(buf)) == 0;
}

bool SerializeFp(unsigned char* out, const mclBnFp& f)
{
    unsigned char buf[G16_FP_SIZE_BYTES] = {0};
    if (mclBnFp_getLittleEndian(buf, sizeof(buf), &f) == 0) {
        return false;
    }
    std::reverse_copy(buf, buf + sizeof(buf), out);
    return true;
}

/** y is lexicographically largest if y > (p-1)/2, i.e. y > -y as integers. */
bool IsLexicographicallyLargest(const mclBnFp& y, bool& largest)
{
    mclBnFp neg;
    mclBnFp_neg(&neg, &y);

    unsigned char y_bytes[G16_FP_SIZE_BYTES];
    unsigned char neg_bytes[G16_FP_SIZE_BYTES];
    if (!SerializeFp(y_bytes, y) || !SerializeFp(neg_bytes, neg)) {
        return false;
    }
    largest = std::memcmp(y_bytes, neg_bytes, G16_FP_SIZE_BYTES) > 0;
    return true;
}

bool IsLexicographicallyLargest(const mclBnFp2& y, bool& largest)
{
    if (!mclBnFp_isZero(&y.d[1])) {
        return IsLexicographicallyLargest(y.d[1], largest);
    }
    return IsLexicographicallyLargest(y.d[0], largest);
}

/** The point at infinity must have no bits set besides its flags. */
bool IsCanonicalInfinity(const unsigned char* x, size_t size)
{
    if (x[0] & ~FLAG_MASK) return false;
    for (size_t i = 1; i < size; ++i) {
        if (x[i] != 0) return false;
    }
    return true;
}

bool EncodingError(Groth16ValidationState& state, const std::string& name, const std::string& what)
{
    return state.Invalid(Groth16Result::NON_CANONICAL_ENCODING, "groth16-point-encoding", name + ": " + what);
}

/** Check the flag byte of a point and handle the infinity encoding.
 *  Returns false on error. Sets is_infinity when the point is the identity. */
bool CheckFlags(const unsigned char* x, size_t size, bool compressed, bool& is_infinity,
                const std::string& name, Groth16ValidationState& state)
{
    const unsigned char flags = x[0] & FLAG_MASK;
    if (((flags & FLAG_COMPRESSED) != 0) != compressed) {
        return EncodingError(state, name, compressed ? "compression flag not set" : "compression flag set");
    }

    is_infinity = (flags & FLAG_INFINITY) != 0;
    if (is_infinity) {
        if ((flags & FLAG_SORT) || !IsCanonicalInfinity(x, size)) {
            return EncodingError(state, name, "non-zero point at infinity");
        }
        return true;
    }

    if (!compressed && (flags & FLAG_SORT)) {
        return EncodingError(state, name, "sort flag set on uncompressed point");
    }
    return true;
}

//! x³ + 4
void CurveRhs(mclBnFp& rhs, const mclBnFp& x)
{
    mclBnFp b;
    mclBnFp_sqr(&rhs, &x);
    mclBnFp_mul(&rhs, &rhs, &x);
    mclBnFp_setInt32(&b, 4);
    mclBnFp_add(&rhs, &rhs, &b);
}

//! x³ + 4(u + 1)
void CurveRhs(mclBnFp2& rhs, const mclBnFp2& x)
{
    mclBnFp2 b;
    mclBnFp2_sqr(&rhs, &x);
    mclBnFp2_mul(&rhs, &rhs, &x);
    mclBnFp_setInt32(&b.d[0], 4);
    mclBnFp_setInt32(&b.d[1], 4);
    mclBnFp2_add(&rhs, &rhs, &b);
}

// The curve equation is checked here rather than through mclBnG1_isValid,
// whose result depends on the process-wide mclBn_verifyOrderG1 setting.
bool CheckG1(const mclBnG1& point, const std::string& name, Groth16ValidationState& state)
{
    mclBnFp lhs, rhs;
    mclBnFp_sqr(&lhs, &point.y);
    CurveRhs(rhs, point.x);
    if (!mclBnFp_isEqual(&lhs, &rhs)) {
        return state.Invalid(Groth16Result::POINT_NOT_ON_CURVE, "groth16-point-not-on-curve", name);
    }
    if (!mclBnG1_isValidOrder(&point)) {
        return state.Invalid(Groth16Result::POINT_NOT_IN_SUBGROUP, "groth16-point-not-in-subgroup", name);
    }
    return true;
}

bool CheckG2(const mclBnG2& point, const std::string& name, Groth16ValidationState& state)
{
    mclBnFp2 lhs, rhs;
    mclBnFp2_sqr(&lhs, &point.y);
    CurveRhs(rhs, point.x);
    if (!mclBnFp2_isEqual(&lhs, &rhs)) {
        return state.Invalid(Groth16Result::POINT_NOT_ON_CURVE, "groth16-point-not-on-curve", name);
    }
    if (!mclBnG2_isValidOrder(&point)) {
        return state.Invalid(Groth16Result::POINT_NOT_IN_SUBGROUP, "groth16-point-not-in-subgroup", name);
    }
    return true;
}

void SetAffine(mclBnG1& point, const mclBnFp& x, const mclBnFp& y)
{
    point.x = x;
    point.y = y;
    mclBnFp_setInt32(&point.z, 1);
}

void SetAffine(mclBnG2& point, const mclBnFp2& x, const mclBnFp2& y)
{
    point.x = x;
    point.y = y;
    mclBnFp2_clear(&point.z);
    mclBnFp_setInt32(&point.z.d[0], 1);
}

bool DeserializeG1Compressed(mclBnG1& g1, const unsigned char* x, const std::string& name, Groth16ValidationState& state)
{
    bool is_infinity;
    if (!CheckFlags(x, G16_G1_COMPRESSED_SIZE, /*compressed=*/true, is_infinity, name, state)) {
        return false;
    }
    if (is_infinity) {
        mclBnG1_clear(&g1);
        return true;
    }

    mclBnFp px;
    if (!DeserializeFp(px, x, /*strip_flags=*/true)) {
        return EncodingError(state, name, "x coordinate out of range");
    }

    mclBnFp rhs, py;
    CurveRhs(rhs, px);
    if (mclBnFp_squareRoot(&py, &rhs) != 0) {
        return state.Invalid(Groth16Result::POINT_NOT_ON_CURVE, "groth16-point-not-on-curve", name);
    }

    bool largest;
    if (!IsLexicographicallyLargest(py, largest)) {
        return state.Error("groth16-field-serialize");
    }
    if (largest != ((x[0] & FLAG_SORT) != 0)) {
        mclBnFp_neg(&py, &py);
    }

    SetAffine(g1, px, py);
    return CheckG1(g1, name, state);
}

bool DeserializeG2Compressed(mclBnG2& g2, const unsigned char* x, const std::string& name, Groth16ValidationState& state)
{
    bool is_infinity;
    if (!CheckFlags(x, G16_G2_COMPRESSED_SIZE, /*compressed=*/true, is_infinity, name, state)) {
        return false;
    }
    if (is_infinity) {
        mclBnG2_clear(&g2);
        return true;
    }

    mclBnFp2 px;
    if (!DeserializeFp(px.d[1], x, /*strip_flags=*/true) ||
        !DeserializeFp(px.d[0], x + G16_FP_SIZE_BYTES, /*strip_flags=*/false)) {
        return EncodingError(state, name, "x coordinate out of range");
    }

    mclBnFp2 rhs, py;
    CurveRhs(rhs, px);
    if (mclBnFp2_squareRoot(&py, &rhs) != 0) {
        return state.Invalid(Groth16Result::POINT_NOT_ON_CURVE, "groth16-point-not-on-curve", name);
    }

    bool largest;
    if (!IsLexicographicallyLargest(py, largest)) {
        return state.Error("groth16-field-serialize");
    }
    if (largest != ((x[0] & FLAG_SORT) != 0)) {
        mclBnFp2_neg(&py, &py);
    }

    SetAffine(g2, px, py);
    return CheckG2(g2, name, state);
}

bool DeserializeG1Uncompressed(mclBnG1& g1, const unsigned char* x, const std::string& name, Groth16ValidationState& state)
{
    bool is_infinity;
    if (!CheckFlags(x, G16_G1_UNCOMPRESSED_SIZE, /*compressed=*/false, is_infinity, name, state)) {
        return false;
    }
    if (is_infinity) {
        mclBnG1_clear(&g1);
        return true;
    }

    mclBnFp px, py;
    if (!DeserializeFp(px, x, /*strip_flags=*/true) ||
        !DeserializeFp(py, x + G16_FP_SIZE_BYTES, /*strip_flags=*/false)) {
        return EncodingError(state, name, "coordinate out of range");
    }

    SetAffine(g1, px, py);
    return CheckG1(g1, name, state);
}

bool DeserializeG2Uncompressed(mclBnG2& g2, const unsigned char* x, const std::string& name, Groth16ValidationState& state)
{
    bool is_infinity;
    if (!CheckFlags(x, G16_G2_UNCOMPRESSED_SIZE, /*compressed=*/false, is_infinity, name, state)) {
        return false;
    }
    if (is_infinity) {
        mclBnG2_clear(&g2);
        return true;
    }

    mclBnFp2 px, py;
    if (!DeserializeFp(px.d[1], x, /*strip_flags=*/true) ||
        !DeserializeFp(px.d[0], x + G16_FP_SIZE_BYTES, /*strip_flags=*/false) ||
        !DeserializeFp(py.d[1], x + 2 * G16_FP_SIZE_BYTES, /*strip_flags=*/false) ||
        !DeserializeFp(py.d[0], x + 3 * G16_FP_SIZE_BYTES, /*strip_flags=*/false)) {
        return EncodingError(state, name, "coordinate out of range");
    }

    SetAffine(g2, px, py);
    return CheckG2(g2, name, state);
}

bool SerializeG1(std::vector<unsigned char>& out, const mclBnG1& point, bool compressed)
{
    const size_t size = compressed ? G16_G1_COMPRESSED_SIZE : G16_G1_UNCOMPRESSED_SIZE;
    const size_t offset = out.size();
    out.resize(offset + size, 0);
    unsigned char* x = out.data() + offset;

    if (mclBnG1_isZero(&point)) {
        x[0] = FLAG_INFINITY | (compressed ? FLAG_COMPRESSED : 0);
        return true;
    }

    mclBnG1 affine;
    mclBnG1_normalize(&affine, &point);
    if (!SerializeFp(x, affine.x)) return false;

    if (compressed) {
        bool largest;
        if (!IsLexicographicallyLargest(affine.y, largest)) return false;
        x[0] |= FLAG_COMPRESSED | (largest ? FLAG_SORT : 0);
        return true;
    }
    return SerializeFp(x + G16_FP_SIZE_BYTES, affine.y);
}

bool SerializeG2(std::vector<unsigned char>& out, const mclBnG2& point, bool compressed)
{
    const size_t size = compressed ? G16_G2_COMPRESSED_SIZE : G16_G2_UNCOMPRESSED_SIZE;
    const size_t offset = out.size();
    out.resize(offset + size, 0);
    unsigned char* x = out.data() + offset;

    if (mclBnG2_isZero(&point)) {
        x[0] = FLAG_INFINITY | (compressed ? FLAG_COMPRESSED : 0);
        return true;
    }

    mclBnG2 affine;
    mclBnG2_normalize(&affine, &point);
    if (!SerializeFp(x, affine.x.d[1]) ||
        !SerializeFp(x + G16_FP_SIZE_BYTES, affine.x.d[0])) {
        return false;
    }

    if (compressed) {
        bool largest;
        if (!IsLexicographicallyLargest(affine.y, largest)) return false;
        x[0] |= FLAG_COMPRESSED | (largest ? FLAG_SORT : 0);
        return true;
    }
    return SerializeFp(x + 2 * G16_FP_SIZE_BYTES, affine.y.d[1]) &&
           SerializeFp(x + 3 * G16_FP_SIZE_BYTES, affine.y.d[0]);
}

bool Reject(const char* what, Groth16ValidationState& state)
{
    LogPrint(ZKVLog::CODEC, "Groth16 %s rejected: %s\n", what, state.ToString());
    return false;
}

} // namespace

bool DecodeProof(const unsigned char* data, size_t length, Groth16Proof& proof, Groth16ValidationState& state)
{
    if (!InitGroth16Curve()) {
        return state.Error("groth16-curve-init");
    }
    if (data == nullptr || length != G16_PROOF_SIZE) {
        state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-proof-length",
                      tfm::format("expected %u bytes, got %u", G16_PROOF_SIZE, length));
        return Reject("proof", state);
    }

    const unsigned char* ptr = data;
    if (!DeserializeG1Compressed(proof.a, ptr, "proof.a", state)) return Reject("proof", state);
    ptr += G16_G1_COMPRESSED_SIZE;
    if (!DeserializeG2Compressed(proof.b, ptr, "proof.b", state)) return Reject("proof", state);
    ptr += G16_G2_COMPRESSED_SIZE;
    if (!DeserializeG1Compressed(proof.c, ptr, "proof.c", state)) return Reject("proof", state);

    return true;
}

bool DecodeProof(const std::vector<unsigned char>& data, Groth16Proof& proof, Groth16ValidationState& state)
{
    return DecodeProof(data.data(), data.size(), proof, state);
}

bool DecodeVerifyingKey(const unsigned char* data, size_t length, Groth16VerifyingKey& vk, Groth16ValidationState& state)
{
    if (!InitGroth16Curve()) {
        return state.Error("groth16-curve-init");
    }
    if (data == nullptr || length < G16_VK_PREFIX_SIZE) {
        state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-vk-length",
                      tfm::format("expected at least %u bytes, got %u", G16_VK_PREFIX_SIZE, length));
        return Reject("verifying key", state);
    }

    const uint32_t ic_len = ReadBE32(data + G16_VK_PREFIX_SIZE - 4);
    const size_t tail = length - G16_VK_PREFIX_SIZE;
    if (ic_len == 0) {
        state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-vk-ic-empty");
        return Reject("verifying key", state);
    }
    if (tail % G16_G1_UNCOMPRESSED_SIZE != 0 || tail / G16_G1_UNCOMPRESSED_SIZE < ic_len) {
        state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-vk-length",
                      tfm::format("%u IC elements need %u bytes, %u remain", ic_len, (uint64_t)ic_len * G16_G1_UNCOMPRESSED_SIZE, tail));
        return Reject("verifying key", state);
    }
    if (tail / G16_G1_UNCOMPRESSED_SIZE > ic_len) {
        state.Invalid(Groth16Result::TRAILING_BYTES, "groth16-vk-trailing-bytes",
                      tfm::format("%u IC elements declared, %u present", ic_len, tail / G16_G1_UNCOMPRESSED_SIZE));
        return Reject("verifying key", state);
    }

    const unsigned char* ptr = data;
    if (!DeserializeG1Uncompressed(vk.alpha, ptr, "vk.alpha", state)) return Reject("verifying key", state);
    ptr += G16_G1_UNCOMPRESSED_SIZE;
    if (!DeserializeG1Uncompressed(vk.beta_g1, ptr, "vk.beta_g1", state)) return Reject("verifying key", state);
    ptr += G16_G1_UNCOMPRESSED_SIZE;
    if (!DeserializeG2Uncompressed(vk.beta, ptr, "vk.beta", state)) return Reject("verifying key", state);
    ptr += G16_G2_UNCOMPRESSED_SIZE;
    if (!DeserializeG2Uncompressed(vk.gamma, ptr, "vk.gamma", state)) return Reject("verifying key", state);
    ptr += G16_G2_UNCOMPRESSED_SIZE;
    if (!DeserializeG1Uncompressed(vk.delta_g1, ptr, "vk.delta_g1", state)) return Reject("verifying key", state);
    ptr += G16_G1_UNCOMPRESSED_SIZE;
    if (!DeserializeG2Uncompressed(vk.delta, ptr, "vk.delta", state)) return Reject("verifying key", state);
    ptr += G16_G2_UNCOMPRESSED_SIZE + 4;

    vk.ic.resize(ic_len);
    for (uint32_t i = 0; i < ic_len; ++i) {
        if (!DeserializeG1Uncompressed(vk.ic[i], ptr, tfm::format("vk.ic[%u]", i), state)) {
            return Reject("verifying key", state);
        }
        ptr += G16_G1_UNCOMPRESSED_SIZE;
    }

    LogPrint(ZKVLog::CODEC, "Groth16 verifying key decoded: %u public inputs\n", vk.NumPublicInputs());
    return true;
}

bool DecodeVerifyingKey(const std::vector<unsigned char>& data, Groth16VerifyingKey& vk, Groth16ValidationState& state)
{
    return DecodeVerifyingKey(data.data(), data.size(), vk, state);
}

bool DecodeScalar(const unsigned char* data, size_t length, mclBnFr& scalar, Groth16ValidationState& state)
{
    if (!InitGroth16Curve()) {
        return state.Error("groth16-curve-init");
    }
    if (data == nullptr || length != G16_FR_SIZE_BYTES) {
        return state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-scalar-length",
                             tfm::format("expected %u bytes, got %u", G16_FR_SIZE_BYTES, length));
    }

    unsigned char be[G16_FR_SIZE_BYTES];
    std::reverse_copy(data, data + G16_FR_SIZE_BYTES, be);
    if (std::memcmp(be, FR_MODULUS, sizeof(be)) >= 0) {
        return state.Invalid(Groth16Result::NON_CANONICAL_ENCODING, "groth16-scalar-encoding", "scalar out of range");
    }
    if (mclBnFr_setLittleEndian(&scalar, data, G16_FR_SIZE_BYTES) != 0) {
        return state.Invalid(Groth16Result::NON_CANONICAL_ENCODING, "groth16-scalar-encoding", "scalar rejected by field");
    }
    return true;
}

bool DecodePublicInputs(const unsigned char* data, size_t length, std::vector<mclBnFr>& inputs, Groth16ValidationState& state)
{
    inputs.clear();
    if (length == 0) {
        return true;
    }
    if (data == nullptr || length % G16_FR_SIZE_BYTES != 0) {
        state.Invalid(Groth16Result::MALFORMED_LENGTH, "groth16-inputs-length",
                      tfm::format("%u bytes is not a multiple of %u", length, G16_FR_SIZE_BYTES));
        return Reject("public inputs", state);
    }

    inputs.resize(length / G16_FR_SIZE_BYTES);
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (!DecodeScalar(data + i * G16_FR_SIZE_BYTES, G16_FR_SIZE_BYTES, inputs[i], state)) {
            return Reject("public inputs", state);
        }
    }
    return true;
}

bool DecodePublicInputs(const std::vector<unsigned char>& data, std::vector<mclBnFr>& inputs, Groth16ValidationState& state)
{
    return DecodePublicInputs(data.data(), data.size(), inputs, state);
}

bool EncodeProof(const Groth16Proof& proof, std::vector<unsigned char>& out)
{
    return SerializeG1(out, proof.a, /*compressed=*/true) &&
           SerializeG2(out, proof.b, /*compressed=*/true) &&
           SerializeG1(out, proof.c, /*compressed=*/true);
}

bool EncodeVerifyingKey(const Groth16VerifyingKey& vk, std::vector<unsigned char>& out)
{
    if (!SerializeG1(out, vk.alpha, /*compressed=*/false) ||
        !SerializeG1(out, vk.beta_g1, /*compressed=*/false) ||
        !SerializeG2(out, vk.beta, /*compressed=*/false) ||
        !SerializeG2(out, vk.gamma, /*compressed=*/false) ||
        !SerializeG1(out, vk.delta_g1, /*compressed=*/false) ||
        !SerializeG2(out, vk.delta, /*compressed=*/false)) {
        return false;
    }

    unsigned char count[4];
    WriteBE32(count, (uint32_t)vk.ic.size());
    out.insert(out.end(), count, count + sizeof(count));

    for (const mclBnG1& ic : vk.ic) {
        if (!SerializeG1(out, ic, /*compressed=*/false)) return false;
    }
    return true;
}

bool EncodeScalar(const mclBnFr& scalar, std::vector<unsigned char>& out)
{
    unsigned char buf[G16_FR_SIZE_BYTES] = {0};
    if (mclBnFr_getLittleEndian(buf, sizeof(buf), &scalar) == 0) {
        return false;
    }
    out.insert(out.end(), buf, buf + sizeof(buf));
    return true;
}
