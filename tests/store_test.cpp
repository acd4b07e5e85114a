#include "secrets_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <map>

namespace {

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "secman_store_test_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt";
        std::remove(path_.c_str());
        env_["APP_KEY"] = FernetCipher::generate_key();
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    SecretsStore store(const std::string& fallback = "") {
        auto vars = env_;
        EnvLookup lookup = [vars](const std::string& name) -> std::optional<std::string> {
            auto it = vars.find(name);
            if (it == vars.end()) return std::nullopt;
            return it->second;
        };
        return SecretsStore({path_, "MASTER_KEY_ENV", fallback}, cipher_, lookup);
    }

    std::string path_;
    std::map<std::string, std::string> env_;
    FernetCipher cipher_;
};

const std::string kScenarioA =
    "MASTER_KEY_ENV = \"APP_KEY\"\n"
    "FOO = \"bar\"\n";

} // namespace

TEST_F(StoreTest, EncryptThenDecryptRoundTrip) {
    write_file(path_, kScenarioA);
    EncryptResult enc = store().encrypt_all();
    EXPECT_EQ(enc.encrypted.size(), 1u);

    auto lines = store().load();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].raw, kHeaderDisclaimer);
    EXPECT_EQ(lines[1].kind, LineKind::KeyDeclaration);
    EXPECT_EQ(lines[2].raw, "FOO = \"\"");
    ASSERT_EQ(lines[3].kind, LineKind::SecretEncrypted);
    EXPECT_EQ(lines[3].meta->key_env_name, "APP_KEY");
    EXPECT_EQ(read_file(path_).find("bar"), std::string::npos);

    DecryptResult dec = store().decrypt_all();
    EXPECT_EQ(dec.decrypted.size(), 1u);
    EXPECT_EQ(read_file(path_), std::string(kHeaderDisclaimer) + "\n" + kScenarioA);
}

TEST_F(StoreTest, SecondEncryptIsNoop) {
    write_file(path_, kScenarioA);
    store().encrypt_all();
    std::string once = read_file(path_);
    EncryptResult again = store().encrypt_all();
    EXPECT_TRUE(again.encrypted.empty());
    EXPECT_EQ(read_file(path_), once);
}

TEST_F(StoreTest, DecryptWithoutKeyLeavesFileUntouched) {
    write_file(path_, kScenarioA);
    store().encrypt_all();
    std::string before = read_file(path_);
    env_.clear();
    EXPECT_THROW(store().decrypt_all(), KeyResolutionError);
    EXPECT_EQ(read_file(path_), before);
}

TEST_F(StoreTest, EncryptWithInvalidKeyLeavesFileUntouched) {
    write_file(path_, kScenarioA);
    env_["APP_KEY"] = "supersecretkey";
    EXPECT_THROW(store().encrypt_all(), CryptoError);
    EXPECT_EQ(read_file(path_), kScenarioA);
}

TEST_F(StoreTest, DeleteRemovesPairAndKeepsDeclaration) {
    write_file(path_, kScenarioA);
    store().encrypt_all();
    EXPECT_TRUE(store().remove("FOO"));
    EXPECT_EQ(read_file(path_), std::string(kHeaderDisclaimer) + "\nMASTER_KEY_ENV = \"APP_KEY\"\n");
    EXPECT_FALSE(store().remove("FOO"));
}

TEST_F(StoreTest, KeyEnvNameFallsBackToConfig) {
    write_file(path_, "FOO = \"bar\"\n");
    EXPECT_THROW(store().encrypt_all(), ConfigError);
    EXPECT_EQ(read_file(path_), "FOO = \"bar\"\n");
    EXPECT_EQ(store("APP_KEY").encrypt_all().encrypted.size(), 1u);
}

TEST_F(StoreTest, SetKeyEnvRequiresDeclaration) {
    write_file(path_, "FOO = \"bar\"\n");
    EXPECT_FALSE(store().set_key_env("OTHER_KEY"));
    write_file(path_, kScenarioA);
    EXPECT_TRUE(store().set_key_env("OTHER_KEY"));
    EXPECT_EQ(store().key_env_name(store().load()), "OTHER_KEY");
}

TEST_F(StoreTest, ConvertMovesSecretsToNewKey) {
    env_["NEW_KEY"] = FernetCipher::generate_key();
    write_file(path_, kScenarioA);
    store().encrypt_all();
    ConvertResult r = store().convert("APP_KEY", "NEW_KEY");
    EXPECT_EQ(r.converted.size(), 1u);
    EXPECT_NE(read_file(path_).find("#NEW_KEY,"), std::string::npos);

    env_.erase("APP_KEY");
    store().decrypt_all();
    EXPECT_NE(read_file(path_).find("FOO = \"bar\""), std::string::npos);
}

TEST_F(StoreTest, ListDoesNotWrite) {
    write_file(path_, kScenarioA);
    std::vector<std::string> expected = {"MASTER_KEY_ENV", "FOO"};
    EXPECT_EQ(store().list(), expected);
    EXPECT_EQ(read_file(path_), kScenarioA);
}

TEST_F(StoreTest, InitCreatesFileOnce) {
    store().init("APP_KEY");
    auto lines = store().load();
    EXPECT_EQ(lines.front().raw, kHeaderDisclaimer);
    EXPECT_EQ(store().key_env_name(lines), "APP_KEY");
    EXPECT_THROW(store().init("APP_KEY"), ConfigError);
}

TEST_F(StoreTest, MissingFileIsConfigError) {
    EXPECT_THROW(store().list(), ConfigError);
}

TEST(ResolveKey, RejectsUnsetAndEmpty) {
    EnvLookup env = [](const std::string& name) -> std::optional<std::string> {
        if (name == "EMPTY") return std::string();
        if (name == "SET") return std::string("value");
        return std::nullopt;
    };
    EXPECT_EQ(resolve_key("SET", env), "value");
    EXPECT_THROW(resolve_key("EMPTY", env), KeyResolutionError);
    EXPECT_THROW(resolve_key("UNSET", env), KeyResolutionError);
    EXPECT_THROW(resolve_key("", env), KeyResolutionError);
}

TEST_F(StoreTest, EveryListedSecretNameCanBeDeleted) {
    write_file(path_, kScenarioA);
    store().encrypt_all();
    std::vector<std::string> listed = store().list();
    ASSERT_EQ(listed, (std::vector<std::string>{"MASTER_KEY_ENV", "FOO", "FOO_ENCRYPTED"}));
    EXPECT_TRUE(store().remove("FOO_ENCRYPTED"));
    EXPECT_EQ(store().list(), (std::vector<std::string>{"MASTER_KEY_ENV"}));
    EXPECT_FALSE(store().remove("FOO"));
}
