// ============================================================================
// wasm_env.cpp - wasm3-backed derivation environment
// ============================================================================

#include "auth/wasm_env.h"
#include "auth/css_module.h"
#include "auth/module_digest.h"
#include "common/logging.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <wasm3.h>

namespace Nepse::Auth {

struct WasmEnv::Runtime {
    std::vector<uint8_t> bytes;   // wasm3 references the module bytes, never copies them
    std::string digest;
    IM3Environment env{nullptr};
    IM3Runtime runtime{nullptr};
    std::array<IM3Function, DERIVATION_EXPORTS.size()> functions{};

    ~Runtime() {
        // Freeing the runtime also frees the loaded module
        if (runtime) {
            m3_FreeRuntime(runtime);
            runtime = nullptr;
        }
        if (env) {
            m3_FreeEnvironment(env);
            env = nullptr;
        }
    }
};

// Builds "<what>: <result> (<detail>)" from the runtime's last error
static auto describeError(IM3Runtime runtime, M3Result result, const char* what) -> std::string {
    std::string message(what);
    message += ": ";
    message += result ? result : "unknown error";
    if (runtime) {
        M3ErrorInfo info;
        std::memset(&info, 0, sizeof(info));
        m3_GetErrorInfo(runtime, &info);
        if (info.message && info.message[0]) {
            message += " (";
            message += info.message;
            message += ')';
        }
    }
    return message;
}

static auto findExport(const char* function) noexcept -> int {
    for (std::size_t i = 0; i < DERIVATION_EXPORTS.size(); ++i) {
        if (std::strcmp(DERIVATION_EXPORTS[i], function) == 0) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

WasmEnv::WasmEnv() noexcept = default;

WasmEnv::~WasmEnv() {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseLocked();
}

auto WasmEnv::create(const uint8_t* bytes, std::size_t len,
                     std::unique_ptr<WasmEnv>& out,
                     const char* expected_sha256) noexcept -> AuthStatus {
    if (!bytes || len == 0) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, "empty wasm module");
    }

    auto rt = std::make_unique<Runtime>();
    rt->bytes.assign(bytes, bytes + len);
    if (!sha256Hex(rt->bytes.data(), rt->bytes.size(), rt->digest)) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, "cannot compute module digest");
    }
    if (expected_sha256 && expected_sha256[0] && !digestEquals(rt->digest, expected_sha256)) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD,
                                 "module digest " + rt->digest + " does not match pinned " + expected_sha256);
    }

    rt->env = m3_NewEnvironment();
    if (!rt->env) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, "m3_NewEnvironment failed");
    }

    rt->runtime = m3_NewRuntime(rt->env, STACK_SIZE_BYTES, nullptr);
    if (!rt->runtime) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, "m3_NewRuntime failed");
    }

    IM3Module module = nullptr;
    M3Result result = m3_ParseModule(rt->env, &module, rt->bytes.data(),
                                     static_cast<uint32_t>(rt->bytes.size()));
    if (result) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, describeError(nullptr, result, "parse module"));
    }

    result = m3_LoadModule(rt->runtime, module);
    if (result) {
        m3_FreeModule(module);
        return AuthStatus::error(AuthErrc::MODULE_LOAD, describeError(rt->runtime, result, "load module"));
    }

    for (std::size_t i = 0; i < DERIVATION_EXPORTS.size(); ++i) {
        const char* name = DERIVATION_EXPORTS[i];
        IM3Function fn = nullptr;
        result = m3_FindFunction(&fn, rt->runtime, name);
        if (result || !fn) {
            return AuthStatus::error(AuthErrc::EXPORT_MISSING,
                                     std::string("export ") + name + " not found: " +
                                     (result ? result : "null function"));
        }

        bool signature_ok = m3_GetArgCount(fn) == 5 && m3_GetRetCount(fn) == 1 &&
                            m3_GetRetType(fn, 0) == c_m3Type_i32;
        for (uint32_t arg = 0; signature_ok && arg < 5; ++arg) {
            signature_ok = m3_GetArgType(fn, arg) == c_m3Type_i32;
        }
        if (!signature_ok) {
            return AuthStatus::error(AuthErrc::EXPORT_MISSING,
                                     std::string("export ") + name + " is not (i32 x5) -> i32");
        }
        rt->functions[i] = fn;
    }

    std::unique_ptr<WasmEnv> env(new WasmEnv());
    env->runtime_ = std::move(rt);
    LOG_INFO("Derivation module loaded (%zu bytes, sha256=%.16s...)", len, env->runtime_->digest.c_str());
    out = std::move(env);
    return AuthStatus::success();
}

auto WasmEnv::createFromFile(const char* path, std::unique_ptr<WasmEnv>& out,
                             const char* expected_sha256) noexcept -> AuthStatus {
    FILE* fp = std::fopen(path, "rb");
    if (!fp) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD,
                                 std::string("cannot open wasm module ") + path + ": " + std::strerror(errno));
    }

    std::vector<uint8_t> bytes;
    uint8_t chunk[4096];
    std::size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0) {
        bytes.insert(bytes.end(), chunk, chunk + n);
    }
    const bool read_error = std::ferror(fp) != 0;
    std::fclose(fp);

    if (read_error) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD, std::string("read error on ") + path);
    }

    LOG_DEBUG("Read wasm module %s (%zu bytes)", path, bytes.size());
    return create(bytes.data(), bytes.size(), out, expected_sha256);
}

auto WasmEnv::createEmbedded(std::unique_ptr<WasmEnv>& out, const char* expected_sha256) noexcept -> AuthStatus {
    if (CSS_WASM_SIZE == 0) {
        return AuthStatus::error(AuthErrc::MODULE_LOAD,
                                 "no derivation module was embedded at build time");
    }
    return create(CSS_WASM_DATA, CSS_WASM_SIZE, out, expected_sha256);
}

auto WasmEnv::call(const char* function,
                   int32_t a, int32_t b, int32_t c, int32_t d, int32_t e,
                   int32_t& result) noexcept -> AuthStatus {
    const int slot = function ? findExport(function) : -1;
    if (slot < 0) {
        return AuthStatus::error(AuthErrc::CALL,
                                 std::string("unknown derivation function ") + (function ? function : "<null>"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!runtime_) {
        return AuthStatus::error(AuthErrc::CALL, std::string("environment closed, cannot call ") + function);
    }

    IM3Function fn = runtime_->functions[static_cast<std::size_t>(slot)];
    const int32_t args[5] = {a, b, c, d, e};
    const void* arg_ptrs[5] = {&args[0], &args[1], &args[2], &args[3], &args[4]};

    M3Result res = m3_Call(fn, 5, arg_ptrs);
    if (res) {
        return AuthStatus::error(AuthErrc::CALL,
                                 describeError(runtime_->runtime, res, (std::string("call ") + function).c_str()));
    }

    int32_t value = 0;
    const void* ret_ptrs[1] = {&value};
    res = m3_GetResults(fn, 1, ret_ptrs);
    if (res) {
        return AuthStatus::error(AuthErrc::CALL,
                                 describeError(runtime_->runtime, res, (std::string("results of ") + function).c_str()));
    }

    result = value;
    return AuthStatus::success();
}

auto WasmEnv::close() noexcept -> AuthStatus {
    std::lock_guard<std::mutex> lock(mutex_);
    if (runtime_) {
        LOG_DEBUG("Releasing derivation module");
    }
    releaseLocked();
    return AuthStatus::success();
}

auto WasmEnv::moduleDigest() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_ ? runtime_->digest : std::string();
}

bool WasmEnv::isClosed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return runtime_ == nullptr;
}

auto WasmEnv::releaseLocked() noexcept -> void {
    runtime_.reset();
}

} // namespace Nepse::Auth
