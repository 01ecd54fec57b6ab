#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pmatrix::model {

inline constexpr std::string_view kSpecVersion = "pmatrix-3.5";
inline constexpr std::string_view kSchemaVersion = "1.0.0";

enum class operating_mode : std::uint8_t {
    Optimal = 0,
    Normal = 1,
    Caution = 2,
    Alert = 3,
    Halt = 4,
};

enum class risk_class : std::uint8_t {
    L1 = 0,
    L2 = 1,
    L3 = 2,
    L4 = 3,
    L5 = 4,
};

// Canonical ordering; index i of kModes pairs with index i of kRiskLevels.
inline constexpr std::array<operating_mode, 5> kModes = {
    operating_mode::Optimal, operating_mode::Normal, operating_mode::Caution,
    operating_mode::Alert,   operating_mode::Halt,
};

inline constexpr std::array<risk_class, 5> kRiskLevels = {
    risk_class::L1, risk_class::L2, risk_class::L3, risk_class::L4, risk_class::L5,
};

inline constexpr std::array<std::string_view, 8> kRecordFields = {
    "spec_version", "schema_version", "timestamp", "functions",
    "stability_score", "risk_score", "mode", "risk_level",
};

inline constexpr std::array<std::string_view, 4> kFunctionFields = {
    "baseline", "norm", "stability", "meta_control",
};

// The four evaluation inputs, each expected in [0.0, 1.0].
struct Functions {
    double baseline{0.0};
    double norm{0.0};
    double stability{0.0};
    double meta_control{0.0};
};

// Immutable point-in-time snapshot of an agent's runtime posture.
struct RuntimeStateRecord {
    std::string spec_version{kSpecVersion};
    std::string schema_version{kSchemaVersion};
    std::uint64_t timestamp{0};
    Functions functions{};
    double stability_score{0.0};
    double risk_score{0.0};
    operating_mode mode{operating_mode::Optimal};
    risk_class risk_level{risk_class::L1};
};

bool operator==(const Functions& lhs, const Functions& rhs) noexcept;
bool operator!=(const Functions& lhs, const Functions& rhs) noexcept;
bool operator==(const RuntimeStateRecord& lhs, const RuntimeStateRecord& rhs) noexcept;
bool operator!=(const RuntimeStateRecord& lhs, const RuntimeStateRecord& rhs) noexcept;

std::string_view to_string(operating_mode value) noexcept;
std::string_view to_string(risk_class value) noexcept;

std::optional<operating_mode> parse_mode(std::string_view name) noexcept;
std::optional<risk_class> parse_risk_level(std::string_view name) noexcept;

}  // namespace pmatrix::model
