#include "tessera/index/graph_params.hpp"
#include "tessera/core/platform_utils.hpp"

#include <string>

namespace tessera::index {

namespace {

auto read_u32(const char* name, std::uint32_t& out)
    -> std::expected<void, core::error> {
    auto v = core::safe_getenv(name);
    if (!v) return {};
    auto parsed = core::parse_u32(*v);
    if (!parsed) {
        return std::unexpected(core::error{
            core::error_code::config_invalid,
            std::string(name) + " is not a decimal integer: '" + *v + "'",
            "index.graph_params"
        });
    }
    out = *parsed;
    return {};
}

} // namespace

auto validate_graph_params(const GraphParams& params)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (params.m_max < 1) {
        return std::unexpected(error{
            error_code::config_invalid,
            "m_max must be >= 1",
            "index.graph_params"
        });
    }

    if (params.m_max0 < params.m_max) {
        return std::unexpected(error{
            error_code::config_invalid,
            "m_max0 must be >= m_max",
            "index.graph_params"
        });
    }

    return {};
}

auto graph_params_from_env(const GraphParams& base)
    -> std::expected<GraphParams, core::error> {
    GraphParams params = base;

    if (auto r = read_u32("TESSERA_GRAPH_M_MAX", params.m_max); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = read_u32("TESSERA_GRAPH_M_MAX0", params.m_max0); !r) {
        return std::unexpected(r.error());
    }
    if (core::env_flag("TESSERA_GRAPH_DEBUG")) {
        params.debug = true;
    }

    if (auto ok = validate_graph_params(params); !ok) {
        return std::unexpected(ok.error());
    }
    return params;
}

auto graph_debug_from_env() noexcept -> bool {
    static const bool on = core::env_flag("TESSERA_GRAPH_DEBUG");
    return on;
}

} // namespace tessera::index
