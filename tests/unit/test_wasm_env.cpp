#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "auth/css_module.h"
#include "auth/index_derivation.h"
#include "auth/module_digest.h"
#include "auth/wasm_env.h"
#include "common/logging.h"

using namespace Nepse::Auth;

namespace {

enum class ModuleVariant { IDENTITY, TRAP_IN_MDX, MISSING_MDX };

// Five (i32 x5) -> i32 functions exported as cdx, rdx, bdx, ndx, mdx.
// Function k returns its k-th parameter.
std::vector<uint8_t> buildModule(ModuleVariant variant) {
    std::vector<uint8_t> m = {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};

    // type section: one type (i32 x5) -> i32
    const uint8_t types[] = {0x01, 0x0A, 0x01, 0x60, 0x05, 0x7F, 0x7F, 0x7F, 0x7F, 0x7F, 0x01, 0x7F};
    m.insert(m.end(), std::begin(types), std::end(types));

    // function section: five functions of type 0
    const uint8_t funcs[] = {0x03, 0x06, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00};
    m.insert(m.end(), std::begin(funcs), std::end(funcs));

    // export section
    const char* names[] = {"cdx", "rdx", "bdx", "ndx", "mdx"};
    const uint8_t export_count = variant == ModuleVariant::MISSING_MDX ? 4 : 5;
    m.push_back(0x07);
    m.push_back(static_cast<uint8_t>(1 + export_count * 6));
    m.push_back(export_count);
    for (uint8_t k = 0; k < export_count; ++k) {
        m.push_back(0x03);
        m.insert(m.end(), names[k], names[k] + 3);
        m.push_back(0x00);  // function export
        m.push_back(k);
    }

    // code section
    std::vector<uint8_t> bodies;
    for (uint8_t k = 0; k < 5; ++k) {
        if (k == 4 && variant == ModuleVariant::TRAP_IN_MDX) {
            const uint8_t trap[] = {0x03, 0x00, 0x00, 0x0B};   // unreachable
            bodies.insert(bodies.end(), std::begin(trap), std::end(trap));
        } else {
            const uint8_t body[] = {0x04, 0x00, 0x20, k, 0x0B};  // local.get k
            bodies.insert(bodies.end(), std::begin(body), std::end(body));
        }
    }
    m.push_back(0x0A);
    m.push_back(static_cast<uint8_t>(1 + bodies.size()));
    m.push_back(0x05);
    m.insert(m.end(), bodies.begin(), bodies.end());
    return m;
}

} // namespace

class WasmEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("logs");
        Common::initLogging("logs/test_wasm_env.log");
        Common::setLogLevel(Common::LogLevel::DEBUG);
        LOG_INFO("=== Starting WasmEnv Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== WasmEnv Test Completed ===");
        Common::shutdownLogging();
    }

    static auto load(ModuleVariant variant, std::unique_ptr<WasmEnv>& env,
                     const char* sha = nullptr) -> AuthStatus {
        const auto bytes = buildModule(variant);
        return WasmEnv::create(bytes.data(), bytes.size(), env, sha);
    }
};

TEST_F(WasmEnvTest, LoadsModuleAndCallsEveryExport) {
    std::unique_ptr<WasmEnv> env;
    const AuthStatus st = load(ModuleVariant::IDENTITY, env);
    ASSERT_TRUE(st.ok()) << st.toString();
    ASSERT_NE(env, nullptr);
    EXPECT_FALSE(env->isClosed());

    const char* names[] = {"cdx", "rdx", "bdx", "ndx", "mdx"};
    for (int k = 0; k < 5; ++k) {
        int32_t result = -1;
        const AuthStatus call = env->call(names[k], 10, 20, 30, 40, 50, result);
        ASSERT_TRUE(call.ok()) << call.toString();
        EXPECT_EQ(result, (k + 1) * 10) << names[k];
    }
}

TEST_F(WasmEnvTest, DerivationThroughRealModuleFollowsPermutations) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::IDENTITY, env).ok());

    DerivedIndices out;
    const AuthStatus st = deriveIndices(*env, Salts{1, 2, 3, 4, 5}, out);
    ASSERT_TRUE(st.ok()) << st.toString();

    EXPECT_EQ(out.access, (IndexSet{1, 2, 4, 3, 5}));
    EXPECT_EQ(out.refresh, (IndexSet{2, 1, 4, 3, 5}));
}

TEST_F(WasmEnvTest, NegativeArgumentsPassThrough) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::IDENTITY, env).ok());

    int32_t result = 0;
    ASSERT_TRUE(env->call("ndx", 0, 0, 0, -12345, 0, result).ok());
    EXPECT_EQ(result, -12345);
}

TEST_F(WasmEnvTest, GarbageBytesFailWithModuleLoad) {
    const uint8_t garbage[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x02, 0x03, 0x04};
    std::unique_ptr<WasmEnv> env;
    const AuthStatus st = WasmEnv::create(garbage, sizeof(garbage), env);
    EXPECT_EQ(st.code, AuthErrc::MODULE_LOAD);
    EXPECT_EQ(env, nullptr);
}

TEST_F(WasmEnvTest, EmptyModuleFailsWithModuleLoad) {
    std::unique_ptr<WasmEnv> env;
    EXPECT_EQ(WasmEnv::create(nullptr, 0, env).code, AuthErrc::MODULE_LOAD);
}

TEST_F(WasmEnvTest, MissingExportFailsWithExportMissing) {
    std::unique_ptr<WasmEnv> env;
    const AuthStatus st = load(ModuleVariant::MISSING_MDX, env);
    EXPECT_EQ(st.code, AuthErrc::EXPORT_MISSING);
    EXPECT_NE(st.message.find("mdx"), std::string::npos);
    EXPECT_EQ(env, nullptr);
}

TEST_F(WasmEnvTest, TrapSurfacesAsCallError) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::TRAP_IN_MDX, env).ok());

    int32_t result = 0;
    EXPECT_TRUE(env->call("cdx", 1, 2, 3, 4, 5, result).ok());

    const AuthStatus st = env->call("mdx", 1, 2, 3, 4, 5, result);
    EXPECT_EQ(st.code, AuthErrc::CALL);

    // Derivation reports the trap as DERIVATION(CALL)
    DerivedIndices out;
    const AuthStatus derived = deriveIndices(*env, Salts{1, 2, 3, 4, 5}, out);
    EXPECT_EQ(derived.code, AuthErrc::DERIVATION);
    EXPECT_EQ(derived.cause, AuthErrc::CALL);
}

TEST_F(WasmEnvTest, UnknownFunctionIsCallError) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::IDENTITY, env).ok());

    int32_t result = 0;
    EXPECT_EQ(env->call("xdx", 1, 2, 3, 4, 5, result).code, AuthErrc::CALL);
}

TEST_F(WasmEnvTest, CloseIsIdempotentAndBlocksFurtherCalls) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::IDENTITY, env).ok());

    EXPECT_TRUE(env->close().ok());
    EXPECT_TRUE(env->isClosed());
    EXPECT_TRUE(env->close().ok());

    int32_t result = 0;
    EXPECT_EQ(env->call("cdx", 1, 2, 3, 4, 5, result).code, AuthErrc::CALL);
    EXPECT_TRUE(env->moduleDigest().empty());
}

TEST_F(WasmEnvTest, PinnedDigestMustMatch) {
    const auto bytes = buildModule(ModuleVariant::IDENTITY);
    std::string digest;
    ASSERT_TRUE(sha256Hex(bytes.data(), bytes.size(), digest));
    ASSERT_EQ(digest.size(), 64u);

    std::string upper = digest;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(WasmEnv::create(bytes.data(), bytes.size(), env, upper.c_str()).ok());
    EXPECT_EQ(env->moduleDigest(), digest);

    std::unique_ptr<WasmEnv> rejected;
    const std::string wrong(64, '0');
    const AuthStatus st = WasmEnv::create(bytes.data(), bytes.size(), rejected, wrong.c_str());
    EXPECT_EQ(st.code, AuthErrc::MODULE_LOAD);
    EXPECT_EQ(rejected, nullptr);
}

TEST_F(WasmEnvTest, KnownSha256Vector) {
    const uint8_t abc[] = {'a', 'b', 'c'};
    std::string digest;
    ASSERT_TRUE(sha256Hex(abc, sizeof(abc), digest));
    EXPECT_EQ(digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_TRUE(digestEquals(digest, "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_FALSE(digestEquals(digest, "ba7816bf"));
    EXPECT_FALSE(digestEquals(digest, nullptr));
}

TEST_F(WasmEnvTest, LoadsModuleFromFile) {
    const std::string path = "logs/test_identity.wasm";
    const auto bytes = buildModule(ModuleVariant::IDENTITY);
    FILE* fp = std::fopen(path.c_str(), "wb");
    ASSERT_NE(fp, nullptr);
    ASSERT_EQ(std::fwrite(bytes.data(), 1, bytes.size(), fp), bytes.size());
    std::fclose(fp);

    std::unique_ptr<WasmEnv> env;
    const AuthStatus st = WasmEnv::createFromFile(path.c_str(), env);
    ASSERT_TRUE(st.ok()) << st.toString();

    int32_t result = 0;
    ASSERT_TRUE(env->call("bdx", 7, 8, 9, 10, 11, result).ok());
    EXPECT_EQ(result, 9);

    std::filesystem::remove(path);
}

TEST_F(WasmEnvTest, MissingFileIsModuleLoad) {
    std::unique_ptr<WasmEnv> env;
    EXPECT_EQ(WasmEnv::createFromFile("logs/does_not_exist.wasm", env).code, AuthErrc::MODULE_LOAD);
}

TEST_F(WasmEnvTest, EmbeddedModuleMatchesBuildConfiguration) {
    std::unique_ptr<WasmEnv> env;
    const AuthStatus st = WasmEnv::createEmbedded(env);
    if (CSS_WASM_SIZE == 0) {
        EXPECT_EQ(st.code, AuthErrc::MODULE_LOAD);
    } else {
        EXPECT_TRUE(st.ok()) << st.toString();
    }
}

TEST_F(WasmEnvTest, ConcurrentCallsAreSerialized) {
    std::unique_ptr<WasmEnv> env;
    ASSERT_TRUE(load(ModuleVariant::IDENTITY, env).ok());

    constexpr int THREADS = 8;
    constexpr int CALLS = 500;
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&env, &mismatches, t] {
            for (int i = 0; i < CALLS; ++i) {
                int32_t result = 0;
                const int32_t expected = t * 100000 + i;
                if (!env->call("rdx", 0, expected, 0, 0, 0, result).ok() || result != expected) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
