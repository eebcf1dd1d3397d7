#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

namespace cryguard {

enum class Param {
    PRIMARY_CRY_THRESHOLD,
    CRY_THRESHOLD,
    CAT_THRESHOLD,
    CAT_WEIGHT,
    MARGIN_THRESHOLD,
    NON_CRY_WEIGHT,
    CONFIRM_N,
    CONFIRM_M,
    ALERT_COOLDOWN_SECONDS,
};

constexpr std::array<Param, 9> kAllParams{
    Param::PRIMARY_CRY_THRESHOLD, Param::CRY_THRESHOLD,  Param::CAT_THRESHOLD,
    Param::CAT_WEIGHT,            Param::MARGIN_THRESHOLD, Param::NON_CRY_WEIGHT,
    Param::CONFIRM_N,             Param::CONFIRM_M,      Param::ALERT_COOLDOWN_SECONDS,
};

const char* param_name(Param p);
// Case-insensitive, surrounding whitespace ignored.
std::optional<Param> param_from_name(const std::string& name);
bool param_is_integer(Param p);

struct Thresholds {
    double primary_cry_threshold{0.5};
    double cry_threshold{0.45};
    double cat_threshold{0.45};
    double cat_weight{1.0};
    double margin_threshold{0.15};
    double non_cry_weight{1.0};
    int confirm_n{3};
    int confirm_m{5};
    int alert_cooldown_seconds{60};

    double get(Param p) const;
    void set(Param p, double value);
};

using Overrides = std::map<Param, double>;

// Throws ValidationError when a single value is out of its legal range.
void validate_value(Param p, double value);
// Per-value checks plus CONFIRM_N <= CONFIRM_M (ConfigurationError).
void validate_thresholds(const Thresholds& t);
// Parses operator text for p; integers must be whole numbers >= 0.
double parse_param_value(Param p, const std::string& raw);
std::string format_param_value(Param p, double value);

// Base layer from process defaults plus an optional override layer.
class ParameterStore {
public:
    explicit ParameterStore(const Thresholds& base);

    const Thresholds& base() const { return base_; }
    const Overrides& overrides() const { return overrides_; }
    bool has_overrides() const { return !overrides_.empty(); }

    Thresholds effective() const;
    double get(Param p) const;

    // Rejected changes leave the store untouched.
    void set_override(Param p, double value);
    void replace_overrides(const Overrides& overrides);
    void clear_overrides() { overrides_.clear(); }

private:
    static Thresholds apply(const Thresholds& base, const Overrides& overrides);

    Thresholds base_;
    Overrides overrides_;
};

}  // namespace cryguard
