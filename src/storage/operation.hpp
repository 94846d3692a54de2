#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pagekv {

// ── Mutations ────────────────────────────────────────────────────────────────
//
// A single-key mutation as recorded in the WAL and applied to the page store.
// Plain structs wrapped in a std::variant so callers can std::visit over it.

enum class OpTag : uint8_t {
    Put    = 1,
    Delete = 2,
};

struct PutOp {
    std::string key;
    std::string value;
};

struct DeleteOp {
    std::string key;
};

using Operation = std::variant<PutOp, DeleteOp>;

[[nodiscard]] inline OpTag op_tag(const Operation& op) {
    return std::holds_alternative<PutOp>(op) ? OpTag::Put : OpTag::Delete;
}

[[nodiscard]] inline const std::string& op_key(const Operation& op) {
    return std::visit([](const auto& o) -> const std::string& { return o.key; }, op);
}

// Value carried by the mutation; empty for a Delete.
[[nodiscard]] inline std::string_view op_value(const Operation& op) {
    if (const auto* put = std::get_if<PutOp>(&op)) return put->value;
    return {};
}

} // namespace pagekv
