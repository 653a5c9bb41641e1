// Copyright (c) 2009-2013 The Bitcoin developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/key.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

// anonymous namespace with local implementation code (OpenSSL interaction)
namespace {

// ====================================================================

// Perform ECDSA key recovery (see SEC1 4.1.6) for curves over (mod p)-fields.
// recid selects which key is recovered.
// if check is non-zero, additional checks are performed
int ECDSA_SIG_recover_key_GFp(EC_KEY *eckey, const BIGNUM *sigR, const BIGNUM *sigS,
                              const unsigned char *msg, int msglen, int recid, int check)
{
    if (!eckey) return 0;

    int ret = 0;
    BN_CTX *ctx = NULL;

    BIGNUM *x = NULL;
    BIGNUM *e = NULL;
    BIGNUM *order = NULL;
    BIGNUM *sor = NULL;
    BIGNUM *eor = NULL;
    BIGNUM *field = NULL;
    EC_POINT *R = NULL;
    EC_POINT *O = NULL;
    EC_POINT *Q = NULL;
    BIGNUM *rr = NULL;
    BIGNUM *zero = NULL;
    int n = 0;
    int i = recid / 2;

    const EC_GROUP *group = EC_KEY_get0_group(eckey);
    if ((ctx = BN_CTX_new()) == NULL) { ret = -1; goto err; }
    BN_CTX_start(ctx);
    order = BN_CTX_get(ctx);
    if (!EC_GROUP_get_order(group, order, ctx)) { ret = -2; goto err; }
    x = BN_CTX_get(ctx);
    if (!BN_copy(x, order)) { ret=-1; goto err; }
    if (!BN_mul_word(x, i)) { ret=-1; goto err; }
    if (!BN_add(x, x, sigR)) { ret=-1; goto err; }
    field = BN_CTX_get(ctx);
    if (!EC_GROUP_get_curve(group, field, NULL, NULL, ctx)) { ret=-2; goto err; }
    if (BN_cmp(x, field) >= 0) { ret=0; goto err; }
    if ((R = EC_POINT_new(group)) == NULL) { ret = -2; goto err; }
    if (!EC_POINT_set_compressed_coordinates(group, R, x, recid % 2, ctx)) { ret=0; goto err; }
    if (check)
    {
        if ((O = EC_POINT_new(group)) == NULL) { ret = -2; goto err; }
        if (!EC_POINT_mul(group, O, NULL, R, order, ctx)) { ret=-2; goto err; }
        if (!EC_POINT_is_at_infinity(group, O)) { ret = 0; goto err; }
    }
    if ((Q = EC_POINT_new(group)) == NULL) { ret = -2; goto err; }
    n = EC_GROUP_get_degree(group);
    e = BN_CTX_get(ctx);
    if (!BN_bin2bn(msg, msglen, e)) { ret=-1; goto err; }
    if (8*msglen > n) BN_rshift(e, e, 8-(n & 7));
    zero = BN_CTX_get(ctx);
    BN_zero(zero);
    if (!BN_mod_sub(e, zero, e, order, ctx)) { ret=-1; goto err; }
    rr = BN_CTX_get(ctx);
    if (!BN_mod_inverse(rr, sigR, order, ctx)) { ret=-1; goto err; }
    sor = BN_CTX_get(ctx);
    if (!BN_mod_mul(sor, sigS, rr, order, ctx)) { ret=-1; goto err; }
    eor = BN_CTX_get(ctx);
    if (!BN_mod_mul(eor, e, rr, order, ctx)) { ret=-1; goto err; }
    if (!EC_POINT_mul(group, Q, eor, R, sor, ctx)) { ret=-2; goto err; }
    if (!EC_KEY_set_public_key(eckey, Q)) { ret=-2; goto err; }

    ret = 1;

err:
    if (ctx)
    {
        BN_CTX_end(ctx);
        BN_CTX_free(ctx);
    }
    if (R != NULL) EC_POINT_free(R);
    if (O != NULL) EC_POINT_free(O);
    if (Q != NULL) EC_POINT_free(Q);
    return ret;
}

// ====================================================================

class CECKey {
private:
    EC_KEY *pkey;

    CECKey(const CECKey&);
    void operator=(const CECKey&);

public:
    CECKey() {
        pkey = EC_KEY_new_by_curve_name(NID_secp256k1);
        if (pkey == NULL)
            throw std::runtime_error("secp256k1 is not supported by OpenSSL");
        EC_KEY_set_conv_form(pkey, POINT_CONVERSION_COMPRESSED);
    }

    ~CECKey() {
        EC_KEY_free(pkey);
    }

    bool SetSecretBytes(const unsigned char vch[32]) {
        const EC_GROUP *group = EC_KEY_get0_group(pkey);
        BIGNUM *bn = BN_bin2bn(vch, 32, NULL);
        EC_POINT *pub_key = EC_POINT_new(group);
        BN_CTX *ctx = BN_CTX_new();

        bool ok = bn != NULL && pub_key != NULL && ctx != NULL &&
                  EC_POINT_mul(group, pub_key, bn, NULL, NULL, ctx) &&
                  EC_KEY_set_private_key(pkey, bn) &&
                  EC_KEY_set_public_key(pkey, pub_key);

        if (ctx) BN_CTX_free(ctx);
        if (pub_key) EC_POINT_free(pub_key);
        if (bn) BN_clear_free(bn);
        return ok;
    }

    bool GetPubKey(CPubKey &pubkey) {
        unsigned char c[33];
        unsigned char *pbegin = c;
        int nSize = i2o_ECPublicKey(pkey, NULL);
        if (nSize != 33)
            return false;
        if (i2o_ECPublicKey(pkey, &pbegin) != nSize)
            return false;
        pubkey.Set(&c[0], &c[nSize]);
        return pubkey.IsValid();
    }

    bool SetPubKey(const CPubKey &pubkey) {
        const unsigned char* pbegin = pubkey.begin();
        return o2i_ECPublicKey(&pkey, &pbegin, pubkey.size()) != NULL;
    }

    // Produce r and s with s forced into the lower half of the order
    bool Sign(const Hash256 &hash, BIGNUM **rOut, BIGNUM **sOut) {
        ECDSA_SIG *sig = ECDSA_do_sign(hash.begin(), 32, pkey);
        if (sig == NULL)
            return false;

        const BIGNUM *r = NULL;
        const BIGNUM *s = NULL;
        ECDSA_SIG_get0(sig, &r, &s);

        BN_CTX *ctx = BN_CTX_new();
        BIGNUM *order = BN_new();
        BIGNUM *halforder = BN_new();
        BIGNUM *sNorm = BN_dup(s);
        BIGNUM *rCopy = BN_dup(r);

        bool ok = ctx != NULL && order != NULL && halforder != NULL && sNorm != NULL && rCopy != NULL &&
                  EC_GROUP_get_order(EC_KEY_get0_group(pkey), order, ctx) &&
                  BN_rshift1(halforder, order);

        // enforce low S values, by negating the value (modulo the order) if above order/2.
        if (ok && BN_cmp(sNorm, halforder) > 0)
            ok = BN_sub(sNorm, order, sNorm);

        if (ctx) BN_CTX_free(ctx);
        if (order) BN_free(order);
        if (halforder) BN_free(halforder);
        ECDSA_SIG_free(sig);

        if (!ok)
        {
            if (sNorm) BN_free(sNorm);
            if (rCopy) BN_free(rCopy);
            return false;
        }

        *rOut = rCopy;
        *sOut = sNorm;
        return true;
    }

    // Recover the public key for the given recovery id into this key
    bool Recover(const Hash256 &hash, const BIGNUM *r, const BIGNUM *s, int recid) {
        return ECDSA_SIG_recover_key_GFp(pkey, r, s, hash.begin(), 32, recid, 0) == 1;
    }

    bool IsLowS(const BIGNUM *s) {
        BN_CTX *ctx = BN_CTX_new();
        BIGNUM *order = BN_new();
        BIGNUM *halforder = BN_new();

        bool ok = ctx != NULL && order != NULL && halforder != NULL &&
                  EC_GROUP_get_order(EC_KEY_get0_group(pkey), order, ctx) &&
                  BN_rshift1(halforder, order) &&
                  !BN_is_zero(s) && BN_cmp(s, halforder) <= 0;

        if (ctx) BN_CTX_free(ctx);
        if (order) BN_free(order);
        if (halforder) BN_free(halforder);
        return ok;
    }

    bool IsInRange(const BIGNUM *r) {
        BN_CTX *ctx = BN_CTX_new();
        BIGNUM *order = BN_new();

        bool ok = ctx != NULL && order != NULL &&
                  EC_GROUP_get_order(EC_KEY_get0_group(pkey), order, ctx) &&
                  !BN_is_zero(r) && BN_cmp(r, order) < 0;

        if (ctx) BN_CTX_free(ctx);
        if (order) BN_free(order);
        return ok;
    }
};

} // end of anonymous namespace

// ====================================================================

bool ECC_InitSanityCheck()
{
    EC_KEY *pkey = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (pkey == NULL)
        return false;
    EC_KEY_free(pkey);
    return true;
}

// ====================================================================

bool CKey::Check(const unsigned char *vch)
{
    // Do not convert to OpenSSL's data structures for range-checking keys,
    // it's easy enough to do directly.
    static const unsigned char vchMax[32] = {
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,
        0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFF,0xFE,
        0xBA,0xAE,0xDC,0xE6,0xAF,0x48,0xA0,0x3B,
        0xBF,0xD2,0x5E,0x8C,0xD0,0x36,0x41,0x40
    };
    bool fIsZero = true;
    for (int i=0; i<32 && fIsZero; i++)
        if (vch[i] != 0)
            fIsZero = false;
    if (fIsZero)
        return false;
    for (int i=0; i<32; i++) {
        if (vch[i] < vchMax[i])
            return true;
        if (vch[i] > vchMax[i])
            return false;
    }
    return true;
}

void CKey::MakeNewKey()
{
    do {
        if (RAND_bytes(vch, sizeof(vch)) != 1)
            throw std::runtime_error("Could not obtain random bytes for a new key");
    } while (!Check(vch));
    fValid = true;
}

CPubKey CKey::GetPubKey() const
{
    if (!fValid)
        throw std::logic_error("GetPubKey called on an invalid key");

    CECKey key;
    CPubKey pubkey;
    if (!key.SetSecretBytes(vch) || !key.GetPubKey(pubkey))
        throw std::runtime_error("Could not derive public key");
    return pubkey;
}

bool CKey::SignCompact(const Hash256 &hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid)
        return false;

    CECKey key;
    if (!key.SetSecretBytes(vch))
        return false;

    CPubKey expected;
    if (!key.GetPubKey(expected))
        return false;

    BIGNUM *r = NULL;
    BIGNUM *s = NULL;
    if (!key.Sign(hash, &r, &s))
        return false;

    // find the recovery id that yields our own key
    int recid = -1;
    for (int i = 0; i < 2; i++)
    {
        CECKey candidate;
        CPubKey recovered;
        if (candidate.Recover(hash, r, s, i) && candidate.GetPubKey(recovered) && recovered == expected)
        {
            recid = i;
            break;
        }
    }

    bool ok = recid >= 0;
    if (ok)
    {
        vchSig.assign(COMPACT_SIGNATURE_SIZE, 0);
        ok = BN_bn2binpad(r, &vchSig[0], 32) == 32 &&
             BN_bn2binpad(s, &vchSig[32], 32) == 32;
        vchSig[64] = static_cast<unsigned char>(27 + recid);
    }

    BN_free(r);
    BN_free(s);

    if (!ok)
        vchSig.clear();
    return ok;
}

// ====================================================================

bool CPubKey::IsFullyValid() const
{
    if (!IsValid())
        return false;
    CECKey key;
    return key.SetPubKey(*this);
}

bool CPubKey::RecoverCompact(const Hash256 &hash, const std::vector<unsigned char>& vchSig)
{
    Invalidate();

    if (vchSig.size() != COMPACT_SIGNATURE_SIZE)
        return false;

    int recid = vchSig[64] - 27;
    if (recid != 0 && recid != 1)
        return false;

    BIGNUM *r = BN_bin2bn(&vchSig[0], 32, NULL);
    BIGNUM *s = BN_bin2bn(&vchSig[32], 32, NULL);

    CECKey key;
    bool ok = r != NULL && s != NULL &&
              key.IsInRange(r) && key.IsLowS(s) &&
              key.Recover(hash, r, s, recid) &&
              key.GetPubKey(*this);

    if (r) BN_free(r);
    if (s) BN_free(s);

    if (!ok)
        Invalidate();
    return ok;
}
