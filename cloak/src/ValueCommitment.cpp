// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "cloak/ValueCommitment.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "crypto/openssl/crypto.hpp"
#include "sha_hash.hpp"
#include "wire.hpp"

#include <openssl/obj_mac.h>

namespace cloak {

using namespace crypto::openssl;

namespace {

const std::string kKindDomain = "cloak.resource.kind";

// The curve and its order. EC_GROUP is only read after construction, so one instance is shared by all threads.
class Secp256k1 {
 public:
  static const Secp256k1& instance() {
    static const Secp256k1 curve;
    return curve;
  }

  const EC_GROUP* group() const { return group_.get(); }
  const BIGNUM* order() const { return EC_GROUP_get0_order(group_.get()); }

  UniqueECPOINT newPoint() const {
    UniqueECPOINT p{EC_POINT_new(group())};
    OpenSSLAssert(p != nullptr, "EC_POINT_new failed");
    return p;
  }

  UniqueECPOINT decode(const ValueCommitment& v, BN_CTX* ctx) const {
    auto p = newPoint();
    if (v.isIdentity()) {
      OpenSSLAssert(EC_POINT_set_to_infinity(group(), p.get()) == OPENSSL_SUCCESS, "EC_POINT_set_to_infinity failed");
      return p;
    }
    if (EC_POINT_oct2point(group(), p.get(), v.data(), v.size(), ctx) != OPENSSL_SUCCESS) {
      clearOpenSSLErrors();
      throw MalformedEncoding("value commitment", "not a point on secp256k1");
    }
    return p;
  }

  ValueCommitment encode(const EC_POINT* p, BN_CTX* ctx) const {
    ValueCommitment::ByteArray out{};
    if (EC_POINT_is_at_infinity(group(), p) == 1) return ValueCommitment{out};
    const size_t len = EC_POINT_point2oct(group(), p, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), ctx);
    OpenSSLAssert(len == out.size(), "EC_POINT_point2oct failed");
    return ValueCommitment{out};
  }

 private:
  Secp256k1() : group_{EC_GROUP_new_by_curve_name(NID_secp256k1)} {
    OpenSSLAssert(group_ != nullptr, "secp256k1 is not available");
  }

  UniqueECGROUP group_;
};

UniqueBNCTX newContext() {
  UniqueBNCTX ctx{BN_CTX_new()};
  OpenSSLAssert(ctx != nullptr, "BN_CTX_new failed");
  return ctx;
}

UniqueBIGNUM toBignum(const Bytes32& b) {
  UniqueBIGNUM bn{BN_bin2bn(b.data(), static_cast<int>(b.size()), nullptr)};
  OpenSSLAssert(bn != nullptr, "BN_bin2bn failed");
  return bn;
}

// A quantity as a scalar. Quantities at or above n would alias a smaller quantity, so they are refused.
UniqueBIGNUM toQuantityScalar(const Bytes32& q, const char* which) {
  auto bn = toBignum(q);
  if (BN_cmp(bn.get(), Secp256k1::instance().order()) >= 0) {
    throw InputValidationError(std::string{which} + " quantity is not below the group order");
  }
  return bn;
}

Bytes32 fromBignum(const BIGNUM* bn) {
  Bytes32::ByteArray out{};
  OpenSSLAssert(BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) == static_cast<int>(out.size()),
                "BN_bn2binpad failed");
  return Bytes32{out};
}

// Try-and-increment: the first x = SHA-256(domain || image_id || label || counter) that is the abscissa of a curve
// point, taking the point with even y.
UniqueECPOINT hashToCurve(const ImageId& image_id, const Bytes32& label, BN_CTX* ctx) {
  const auto& curve = Secp256k1::instance();
  auto point = curve.newPoint();
  for (uint32_t counter = 0;; counter++) {
    Bytes counter_bytes;
    wire::serialize(counter_bytes, counter);
    auto x = toBignum(Bytes32{util::sha256Of(kKindDomain, image_id, label, counter_bytes)});
    if (EC_POINT_set_compressed_coordinates(curve.group(), point.get(), x.get(), 0, ctx) == OPENSSL_SUCCESS) {
      return point;
    }
    clearOpenSSLErrors();
    CloakAssertLT(counter, 1024u);
  }
}

void checkScalar(const Bytes32& rcv) {
  if (!isCanonicalScalar(rcv)) throw InputValidationError("rcv is not a scalar in (0, n)");
}

}  // namespace

ValueCommitment ValueCommitment::fromBuffer(const Bytes& bytes) {
  if (bytes.size() != ByteSize) throw InvalidInputLength("value commitment", ByteSize, bytes.size());
  ByteArray raw;
  std::copy(bytes.begin(), bytes.end(), raw.begin());
  ValueCommitment v{raw};
  auto ctx = newContext();
  Secp256k1::instance().decode(v, ctx.get());
  return v;
}

bool ValueCommitment::isIdentity() const {
  return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
}

std::ostream& operator<<(std::ostream& os, const ValueCommitment& v) { return os << v.toHexString(); }

bool isCanonicalScalar(const Bytes32& s) {
  auto bn = toBignum(s);
  return !BN_is_zero(bn.get()) && BN_cmp(bn.get(), Secp256k1::instance().order()) < 0;
}

bool isValidQuantity(const Bytes32& q) {
  auto bn = toBignum(q);
  return BN_cmp(bn.get(), Secp256k1::instance().order()) < 0;
}

ValueCommitment kindGenerator(const ImageId& image_id, const Bytes32& label) {
  auto ctx = newContext();
  auto k = hashToCurve(image_id, label, ctx.get());
  return Secp256k1::instance().encode(k.get(), ctx.get());
}

ValueCommitment commitRandomness(const Bytes32& rcv) {
  checkScalar(rcv);
  const auto& curve = Secp256k1::instance();
  auto ctx = newContext();
  auto r = toBignum(rcv);
  auto p = curve.newPoint();
  OpenSSLAssert(EC_POINT_mul(curve.group(), p.get(), r.get(), nullptr, nullptr, ctx.get()) == OPENSSL_SUCCESS,
                "EC_POINT_mul failed");
  return curve.encode(p.get(), ctx.get());
}

ValueCommitment computeDelta(const Resource& consumed, const Resource& created, const Bytes32& rcv) {
  checkScalar(rcv);
  const auto& curve = Secp256k1::instance();
  auto ctx = newContext();

  auto r = toBignum(rcv);
  auto q_in = toQuantityScalar(consumed.quantity(), "consumed");
  auto q_out = toQuantityScalar(created.quantity(), "created");
  auto k_in = hashToCurve(consumed.imageId(), consumed.label(), ctx.get());
  auto k_out = hashToCurve(created.imageId(), created.label(), ctx.get());

  // rcv*G + q_in*K_in
  auto delta = curve.newPoint();
  OpenSSLAssert(EC_POINT_mul(curve.group(), delta.get(), r.get(), k_in.get(), q_in.get(), ctx.get()) ==
                    OPENSSL_SUCCESS,
                "EC_POINT_mul failed");
  // - q_out*K_out
  auto out = curve.newPoint();
  OpenSSLAssert(EC_POINT_mul(curve.group(), out.get(), nullptr, k_out.get(), q_out.get(), ctx.get()) ==
                    OPENSSL_SUCCESS,
                "EC_POINT_mul failed");
  OpenSSLAssert(EC_POINT_invert(curve.group(), out.get(), ctx.get()) == OPENSSL_SUCCESS, "EC_POINT_invert failed");
  OpenSSLAssert(EC_POINT_add(curve.group(), delta.get(), delta.get(), out.get(), ctx.get()) == OPENSSL_SUCCESS,
                "EC_POINT_add failed");
  return curve.encode(delta.get(), ctx.get());
}

ValueCommitment sumValueCommitments(const std::vector<ValueCommitment>& commitments) {
  const auto& curve = Secp256k1::instance();
  auto ctx = newContext();
  auto sum = curve.newPoint();
  OpenSSLAssert(EC_POINT_set_to_infinity(curve.group(), sum.get()) == OPENSSL_SUCCESS,
                "EC_POINT_set_to_infinity failed");
  for (const auto& c : commitments) {
    auto p = curve.decode(c, ctx.get());
    OpenSSLAssert(EC_POINT_add(curve.group(), sum.get(), sum.get(), p.get(), ctx.get()) == OPENSSL_SUCCESS,
                  "EC_POINT_add failed");
  }
  return curve.encode(sum.get(), ctx.get());
}

Bytes32 sumScalars(const std::vector<Bytes32>& scalars) {
  auto ctx = newContext();
  UniqueBIGNUM sum{BN_new()};
  OpenSSLAssert(sum != nullptr, "BN_new failed");
  BN_zero(sum.get());
  for (const auto& s : scalars) {
    auto bn = toBignum(s);
    OpenSSLAssert(BN_mod_add(sum.get(), sum.get(), bn.get(), Secp256k1::instance().order(), ctx.get()) ==
                      OPENSSL_SUCCESS,
                  "BN_mod_add failed");
  }
  return fromBignum(sum.get());
}

void serialize(Bytes& output, const ValueCommitment& v) { wire::serialize(output, v.getBytes()); }

void deserialize(const uint8_t*& start, const uint8_t* end, ValueCommitment& v) {
  ValueCommitment::ByteArray raw;
  wire::deserialize(start, end, raw);
  v = ValueCommitment{raw};
}

}  // namespace cloak
