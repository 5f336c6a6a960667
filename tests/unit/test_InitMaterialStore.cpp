#include <gtest/gtest.h>
#include "bootstrap/InitMaterialStore.hpp"
#include "util/files.hpp"
#include "TempDir.hpp"

#include <nlohmann/json.hpp>

using namespace kw::bootstrap;
using namespace kw::types;
using namespace kw::test;

TEST(InitMaterialStoreTest, SaveThenLoadKeepsEveryField) {
    TempDir dir;
    InitMaterialStore store(dir / "assets/resp-init.json");

    InitMaterial m;
    m.root_token = "s.root";
    m.keys = {"aa", "bb"};
    m.keys_base64 = {"qg==", "uw=="};
    m.secret_threshold = 1;
    m.secret_shares = 2;
    store.save(m);

    ASSERT_TRUE(store.exists());
    EXPECT_EQ(fileMode(store.path()), 0600u);
    EXPECT_EQ(store.load(), m);
}

TEST(InitMaterialStoreTest, EmptyRootTokenLoadsAsAbsent) {
    TempDir dir;
    const auto path = dir / "resp-init.json";
    kw::util::writeOwnerOnly(path, std::string(R"({"root_token":"","keys":["aa"],"keys_base64":["qg=="],)"
                                              R"("secret_threshold":1,"secret_shares":1})"));

    const auto m = InitMaterialStore(path).load();
    EXPECT_FALSE(m.root_token.has_value());
    EXPECT_EQ(m.keys, std::vector<std::string>{"aa"});
}

TEST(InitMaterialStoreTest, StrippedMaterialPersistsWithoutToken) {
    TempDir dir;
    InitMaterialStore store(dir / "resp-init.json");

    InitMaterial m;
    m.root_token = "s.root";
    m.keys = {"aa"};
    m.stripRootToken();
    store.save(m);

    const auto j = nlohmann::json::parse(kw::util::readFileToString(store.path()));
    EXPECT_EQ(j["root_token"], "");
    EXPECT_FALSE(j.contains("encrypted_keys"));
}

TEST(InitMaterialStoreTest, MissingFileThrows) {
    TempDir dir;
    InitMaterialStore store(dir / "nope.json");
    EXPECT_FALSE(store.exists());
    EXPECT_THROW((void)store.load(), std::runtime_error);
}

TEST(InitMaterialStoreTest, CorruptFileThrows) {
    TempDir dir;
    const auto path = dir / "resp-init.json";
    kw::util::writeOwnerOnly(path, std::string("{not json"));
    EXPECT_THROW((void)InitMaterialStore(path).load(), std::runtime_error);

    kw::util::writeOwnerOnly(path, std::string(R"({"root_token":"x"})"));
    EXPECT_THROW((void)InitMaterialStore(path).load(), std::runtime_error);
}
