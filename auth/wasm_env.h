// ============================================================================
// wasm_env.h - wasm3-backed derivation environment
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "auth/bytecode_env.h"

namespace Nepse::Auth {

/**
 * Interprets the derivation module with wasm3.
 *
 * The module bytes are copied and kept alive for the lifetime of the
 * runtime. All five exports are resolved and signature-checked at load, so a
 * successfully created environment can only fail at call time by trapping.
 * wasm3 runtimes are single-threaded; call() holds a mutex.
 */
class WasmEnv final : public BytecodeEnv {
public:
    static constexpr uint32_t STACK_SIZE_BYTES = 64 * 1024;

    // MODULE_LOAD on parse/instantiate failure or digest mismatch,
    // EXPORT_MISSING on a bad export. `expected_sha256` (hex) is optional.
    [[nodiscard]] static auto create(const uint8_t* bytes, std::size_t len,
                                     std::unique_ptr<WasmEnv>& out,
                                     const char* expected_sha256 = nullptr) noexcept -> AuthStatus;

    // Reads the module from disk, then create()
    [[nodiscard]] static auto createFromFile(const char* path,
                                             std::unique_ptr<WasmEnv>& out,
                                             const char* expected_sha256 = nullptr) noexcept -> AuthStatus;

    // Module compiled into the binary
    [[nodiscard]] static auto createEmbedded(std::unique_ptr<WasmEnv>& out,
                                             const char* expected_sha256 = nullptr) noexcept -> AuthStatus;

    // Lowercase hex SHA-256 of the loaded module
    [[nodiscard]] auto moduleDigest() const -> std::string;

    ~WasmEnv() override;

    WasmEnv(const WasmEnv&) = delete;
    WasmEnv& operator=(const WasmEnv&) = delete;

    [[nodiscard]] auto call(const char* function,
                            int32_t a, int32_t b, int32_t c, int32_t d, int32_t e,
                            int32_t& result) noexcept -> AuthStatus override;

    auto close() noexcept -> AuthStatus override;

    [[nodiscard]] bool isClosed() const noexcept override;

private:
    struct Runtime;

    WasmEnv() noexcept;

    auto releaseLocked() noexcept -> void;

    mutable std::mutex mutex_;
    std::unique_ptr<Runtime> runtime_;
};

} // namespace Nepse::Auth
