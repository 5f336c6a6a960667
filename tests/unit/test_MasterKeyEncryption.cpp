#include <gtest/gtest.h>
#include "crypto/MasterKeyEncryption.hpp"
#include "crypto/util/encrypt.hpp"
#include "FakeIkmReader.hpp"
#include "TempDir.hpp"

using namespace kw::crypto;
using namespace kw::types;
using namespace kw::test;

class MasterKeyEncryptionTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<FakeIkmReader> reader = std::make_shared<FakeIkmReader>();

    static InitMaterial sampleMaterial(const int shares = 3) {
        InitMaterial m;
        for (int i = 0; i < shares; ++i) {
            const auto share = util::random_bytes(32);
            m.keys.push_back(util::hex_encode(share));
            m.keys_base64.push_back(util::b64_encode(share));
        }
        m.root_token = "s.root";
        m.secret_threshold = 2;
        m.secret_shares = shares;
        return m;
    }
};

TEST_F(MasterKeyEncryptionTest, DisabledUntilIkmLoaded) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    EXPECT_FALSE(mke.isEncrypting());
    EXPECT_THROW((void)mke.encryptInitMaterial(sampleMaterial()), std::logic_error);

    mke.loadIkm("/usr/bin/ikm-hook");
    EXPECT_TRUE(mke.isEncrypting());
    EXPECT_EQ(reader->lastHandle, "/usr/bin/ikm-hook");
}

TEST_F(MasterKeyEncryptionTest, EncryptReplacesPlaintextShares) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    mke.loadIkm("hook");

    const auto m = sampleMaterial();
    const auto enc = mke.encryptInitMaterial(m);

    EXPECT_TRUE(enc.keys.empty());
    EXPECT_TRUE(enc.keys_base64.empty());
    ASSERT_EQ(enc.encrypted_keys.size(), 3u);
    ASSERT_EQ(enc.nonces.size(), 3u);
    EXPECT_EQ(util::hex_decode(enc.nonces[0]).size(), util::AES_IV_SIZE);
    EXPECT_NE(enc.encrypted_keys[0], m.keys[0]);
    EXPECT_EQ(enc.root_token, m.root_token);
    EXPECT_EQ(enc.secret_threshold, 2);
}

TEST_F(MasterKeyEncryptionTest, DecryptRestoresOriginal) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    mke.loadIkm("hook");

    const auto m = sampleMaterial();
    EXPECT_EQ(mke.decryptInitMaterial(mke.encryptInitMaterial(m)), m);
}

TEST_F(MasterKeyEncryptionTest, DecryptRestoresOnlyTheEncodingsPresentBefore) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    mke.loadIkm("hook");

    auto hexOnly = sampleMaterial();
    hexOnly.keys_base64.clear();
    const auto hexBack = mke.decryptInitMaterial(mke.encryptInitMaterial(hexOnly));
    EXPECT_EQ(hexBack, hexOnly);
    EXPECT_TRUE(hexBack.keys_base64.empty());

    auto base64Only = sampleMaterial();
    base64Only.keys.clear();
    const auto base64Back = mke.decryptInitMaterial(mke.encryptInitMaterial(base64Only));
    EXPECT_EQ(base64Back, base64Only);
    EXPECT_TRUE(base64Back.keys.empty());
}

TEST_F(MasterKeyEncryptionTest, MaterialWithoutEncodingListGetsBothForms) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    mke.loadIkm("hook");

    const auto m = sampleMaterial(2);
    auto enc = mke.encryptInitMaterial(m);
    enc.share_encodings.clear();

    const auto back = mke.decryptInitMaterial(enc);
    EXPECT_EQ(back.keys, m.keys);
    EXPECT_EQ(back.keys_base64, m.keys_base64);
}

TEST_F(MasterKeyEncryptionTest, SaltIsPersistedOwnerOnlyAndReused) {
    const auto m = sampleMaterial(1);
    InitMaterial enc;
    {
        MasterKeyEncryption mke(reader, Kdf(dir.path()));
        mke.loadIkm("hook");
        enc = mke.encryptInitMaterial(m);
    }

    const auto salt = dir / Kdf::SALT_FILE;
    ASSERT_TRUE(std::filesystem::exists(salt));
    EXPECT_EQ(std::filesystem::file_size(salt), Kdf::SALT_SIZE);
    EXPECT_EQ(fileMode(salt), 0600u);

    MasterKeyEncryption second(reader, Kdf(dir.path()));
    second.loadIkm("hook");
    EXPECT_EQ(second.decryptInitMaterial(enc), m);
}

TEST_F(MasterKeyEncryptionTest, WrongIkmFailsAuthentication) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    mke.loadIkm("hook");
    const auto enc = mke.encryptInitMaterial(sampleMaterial(1));

    MasterKeyEncryption other(std::make_shared<FakeIkmReader>(std::vector<uint8_t>(32, 0x11)), Kdf(dir.path()));
    other.loadIkm("hook");
    EXPECT_THROW((void)other.decryptInitMaterial(enc), std::runtime_error);
}

TEST_F(MasterKeyEncryptionTest, LoadFailureLeavesEncryptionDisabled) {
    reader->fail = true;
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    EXPECT_THROW(mke.loadIkm("hook"), std::runtime_error);
    EXPECT_FALSE(mke.isEncrypting());
    EXPECT_TRUE(mke.loadAttempted());
}

TEST_F(MasterKeyEncryptionTest, EmptyIkmIsRejected) {
    MasterKeyEncryption mke(std::make_shared<FakeIkmReader>(std::vector<uint8_t>{}), Kdf(dir.path()));
    EXPECT_THROW(mke.loadIkm("hook"), std::runtime_error);
    EXPECT_FALSE(mke.isEncrypting());
}

TEST_F(MasterKeyEncryptionTest, WipeGuardWipesOnceAfterLoad) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    {
        IkmWipeGuard guard(mke);
        mke.loadIkm("hook");
        EXPECT_FALSE(mke.ikmWiped());
    }
    EXPECT_TRUE(mke.ikmWiped());

    mke.wipeIkm();
    EXPECT_TRUE(mke.ikmWiped());
    EXPECT_THROW((void)mke.encryptInitMaterial(sampleMaterial(1)), std::runtime_error);
}

TEST_F(MasterKeyEncryptionTest, WipeWithoutLoadIsNoOp) {
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    { IkmWipeGuard guard(mke); }
    EXPECT_FALSE(mke.ikmWiped());
    EXPECT_EQ(reader->reads, 0);
}

TEST_F(MasterKeyEncryptionTest, WipeGuardRunsWhenLoadThrows) {
    reader->fail = true;
    MasterKeyEncryption mke(reader, Kdf(dir.path()));
    try {
        IkmWipeGuard guard(mke);
        mke.loadIkm("hook");
        FAIL() << "loadIkm should have thrown";
    } catch (const std::runtime_error&) {}
    EXPECT_TRUE(mke.ikmWiped());
}
