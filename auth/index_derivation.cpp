#include "auth/index_derivation.h"
#include "common/logging.h"

namespace Nepse::Auth {

namespace {

struct CallPlan {
    const char* function;
    uint8_t args[5];   // zero-based salt positions
};

constexpr CallPlan ACCESS_PLAN[INDEX_COUNT] = {
    {"cdx", {0, 1, 2, 3, 4}},
    {"rdx", {0, 1, 3, 2, 4}},
    {"bdx", {0, 1, 3, 2, 4}},
    {"ndx", {0, 1, 3, 2, 4}},
    {"mdx", {0, 1, 3, 2, 4}},
};

constexpr CallPlan REFRESH_PLAN[INDEX_COUNT] = {
    {"cdx", {1, 0, 2, 4, 3}},
    {"rdx", {1, 0, 2, 3, 4}},
    {"bdx", {1, 0, 3, 2, 4}},
    {"ndx", {1, 0, 3, 2, 4}},
    {"mdx", {1, 0, 3, 2, 4}},
};

auto runPlan(BytecodeEnv& env, const Salts& s, const CallPlan (&plan)[INDEX_COUNT],
             const char* set_name, IndexSet& out) noexcept -> AuthStatus {
    for (std::size_t i = 0; i < INDEX_COUNT; ++i) {
        const CallPlan& p = plan[i];
        int32_t value = 0;
        AuthStatus st = env.call(p.function,
                                 s[p.args[0]], s[p.args[1]], s[p.args[2]], s[p.args[3]], s[p.args[4]],
                                 value);
        if (!st.ok()) {
            return AuthStatus::wrap(AuthErrc::DERIVATION, st,
                                    std::string(set_name) + " index " + std::to_string(i) +
                                    " (" + p.function + ")");
        }
        out[i] = value;
    }
    return AuthStatus::success();
}

} // namespace

auto deriveIndices(BytecodeEnv& env, const Salts& salts, DerivedIndices& out) noexcept -> AuthStatus {
    DerivedIndices result;

    AuthStatus st = runPlan(env, salts, ACCESS_PLAN, "access", result.access);
    if (!st.ok()) {
        return st;
    }
    st = runPlan(env, salts, REFRESH_PLAN, "refresh", result.refresh);
    if (!st.ok()) {
        return st;
    }

    LOG_DEBUG("Derived indices access=[%d,%d,%d,%d,%d] refresh=[%d,%d,%d,%d,%d]",
              result.access[0], result.access[1], result.access[2], result.access[3], result.access[4],
              result.refresh[0], result.refresh[1], result.refresh[2], result.refresh[3], result.refresh[4]);

    out = result;
    return AuthStatus::success();
}

} // namespace Nepse::Auth
