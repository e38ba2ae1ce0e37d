#include <oracle/common/critical.hpp>
#include <oracle/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <memory>

namespace oracle::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bignum_ptr make_bignum() {
  auto value = bignum_ptr{BN_new(), BN_free};
  if (!value) {
    oracle::common::critical("failed to allocate BIGNUM");
  }
  return value;
}

void check(int rc, const char* what) {
  if (rc != 1) {
    oracle::common::critical(what);
  }
}

// Curve constants for -x^2 + y^2 = 1 + d x^2 y^2 over p = 2^255 - 19.
struct curve_constants final {
  bignum_ptr p{make_bignum()};
  bignum_ptr d{make_bignum()};
  bignum_ptr euler_exponent{make_bignum()};
};

curve_constants make_curve_constants(BN_CTX* ctx) {
  auto constants = curve_constants{};
  auto one = make_bignum();
  check(BN_set_word(one.get(), 1), "BN_set_word failed");

  check(BN_set_word(constants.p.get(), 1), "BN_set_word failed");
  check(BN_lshift(constants.p.get(), constants.p.get(), 255),
        "BN_lshift failed");
  check(BN_sub_word(constants.p.get(), 19), "BN_sub_word failed");

  // d = -121665 / 121666 mod p
  auto numerator = make_bignum();
  auto denominator = make_bignum();
  check(BN_set_word(numerator.get(), 121665), "BN_set_word failed");
  check(BN_sub(numerator.get(), constants.p.get(), numerator.get()),
        "BN_sub failed");
  check(BN_set_word(denominator.get(), 121666), "BN_set_word failed");
  if (BN_mod_inverse(denominator.get(), denominator.get(), constants.p.get(),
                     ctx) == nullptr) {
    oracle::common::critical("BN_mod_inverse failed");
  }
  check(BN_mod_mul(constants.d.get(), numerator.get(), denominator.get(),
                   constants.p.get(), ctx),
        "BN_mod_mul failed");

  // (p - 1) / 2
  check(BN_sub(constants.euler_exponent.get(), constants.p.get(), one.get()),
        "BN_sub failed");
  check(BN_rshift1(constants.euler_exponent.get(),
                   constants.euler_exponent.get()),
        "BN_rshift1 failed");
  return constants;
}

}  // namespace

bool available() {
  static const auto available_now = openssl_has_ed25519();
  return available_now;
}

bool verify_signature(const oracle::schema::bytes_view_t& message,
                      const oracle::schema::public_key_t& public_key,
                      const oracle::schema::ed25519_signature_t& signature) {
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

bool is_on_curve(const oracle::schema::hash32_t& compressed) {
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!ctx) {
    oracle::common::critical("failed to allocate BN_CTX");
  }
  auto constants = make_curve_constants(ctx.get());

  // Little-endian y with the x sign bit cleared; BIGNUM wants big-endian.
  auto big_endian = std::array<uint8_t, 32>{};
  std::reverse_copy(std::begin(compressed), std::end(compressed),
                    std::begin(big_endian));
  big_endian[0] &= 0x7f;

  auto y = bignum_ptr{
      BN_bin2bn(big_endian.data(), static_cast<int>(big_endian.size()),
                nullptr),
      BN_free};
  if (!y) {
    oracle::common::critical("BN_bin2bn failed");
  }
  check(BN_nnmod(y.get(), y.get(), constants.p.get(), ctx.get()),
        "BN_nnmod failed");

  auto one = make_bignum();
  check(BN_set_word(one.get(), 1), "BN_set_word failed");

  auto y_squared = make_bignum();
  check(BN_mod_sqr(y_squared.get(), y.get(), constants.p.get(), ctx.get()),
        "BN_mod_sqr failed");

  // x^2 = u / v with u = y^2 - 1, v = d y^2 + 1
  auto u = make_bignum();
  check(BN_mod_sub(u.get(), y_squared.get(), one.get(), constants.p.get(),
                   ctx.get()),
        "BN_mod_sub failed");
  if (BN_is_zero(u.get())) {
    return true;
  }

  auto v = make_bignum();
  check(BN_mod_mul(v.get(), constants.d.get(), y_squared.get(),
                   constants.p.get(), ctx.get()),
        "BN_mod_mul failed");
  check(BN_mod_add(v.get(), v.get(), one.get(), constants.p.get(), ctx.get()),
        "BN_mod_add failed");
  if (BN_is_zero(v.get())) {
    return false;
  }
  if (BN_mod_inverse(v.get(), v.get(), constants.p.get(), ctx.get()) ==
      nullptr) {
    oracle::common::critical("BN_mod_inverse failed");
  }

  auto x_squared = make_bignum();
  check(BN_mod_mul(x_squared.get(), u.get(), v.get(), constants.p.get(),
                   ctx.get()),
        "BN_mod_mul failed");

  auto legendre = make_bignum();
  check(BN_mod_exp(legendre.get(), x_squared.get(),
                   constants.euler_exponent.get(), constants.p.get(),
                   ctx.get()),
        "BN_mod_exp failed");
  return BN_is_one(legendre.get()) == 1;
}

}  // namespace oracle::crypto
