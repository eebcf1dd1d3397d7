#include "cryguard/parameters.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

#include "cryguard/errors.hpp"

namespace cryguard {

namespace {
std::string canonical(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool is_probability(Param p) {
    return p == Param::PRIMARY_CRY_THRESHOLD || p == Param::CRY_THRESHOLD || p == Param::CAT_THRESHOLD;
}
}  // namespace

const char* param_name(Param p) {
    switch (p) {
        case Param::PRIMARY_CRY_THRESHOLD: return "PRIMARY_CRY_THRESHOLD";
        case Param::CRY_THRESHOLD: return "CRY_THRESHOLD";
        case Param::CAT_THRESHOLD: return "CAT_THRESHOLD";
        case Param::CAT_WEIGHT: return "CAT_WEIGHT";
        case Param::MARGIN_THRESHOLD: return "MARGIN_THRESHOLD";
        case Param::NON_CRY_WEIGHT: return "NON_CRY_WEIGHT";
        case Param::CONFIRM_N: return "CONFIRM_N";
        case Param::CONFIRM_M: return "CONFIRM_M";
        case Param::ALERT_COOLDOWN_SECONDS: return "ALERT_COOLDOWN_SECONDS";
    }
    return "UNKNOWN";
}

std::optional<Param> param_from_name(const std::string& name) {
    const std::string key = canonical(name);
    for (Param p : kAllParams) {
        if (key == param_name(p)) return p;
    }
    return std::nullopt;
}

bool param_is_integer(Param p) {
    return p == Param::CONFIRM_N || p == Param::CONFIRM_M || p == Param::ALERT_COOLDOWN_SECONDS;
}

double Thresholds::get(Param p) const {
    switch (p) {
        case Param::PRIMARY_CRY_THRESHOLD: return primary_cry_threshold;
        case Param::CRY_THRESHOLD: return cry_threshold;
        case Param::CAT_THRESHOLD: return cat_threshold;
        case Param::CAT_WEIGHT: return cat_weight;
        case Param::MARGIN_THRESHOLD: return margin_threshold;
        case Param::NON_CRY_WEIGHT: return non_cry_weight;
        case Param::CONFIRM_N: return confirm_n;
        case Param::CONFIRM_M: return confirm_m;
        case Param::ALERT_COOLDOWN_SECONDS: return alert_cooldown_seconds;
    }
    return 0.0;
}

void Thresholds::set(Param p, double value) {
    switch (p) {
        case Param::PRIMARY_CRY_THRESHOLD: primary_cry_threshold = value; break;
        case Param::CRY_THRESHOLD: cry_threshold = value; break;
        case Param::CAT_THRESHOLD: cat_threshold = value; break;
        case Param::CAT_WEIGHT: cat_weight = value; break;
        case Param::MARGIN_THRESHOLD: margin_threshold = value; break;
        case Param::NON_CRY_WEIGHT: non_cry_weight = value; break;
        case Param::CONFIRM_N: confirm_n = static_cast<int>(std::lround(value)); break;
        case Param::CONFIRM_M: confirm_m = static_cast<int>(std::lround(value)); break;
        case Param::ALERT_COOLDOWN_SECONDS: alert_cooldown_seconds = static_cast<int>(std::lround(value)); break;
    }
}

void validate_value(Param p, double value) {
    const std::string name = param_name(p);
    if (!std::isfinite(value)) {
        throw ValidationError(name + " must be a finite number");
    }
    if (is_probability(p) && (value < 0.0 || value > 1.0)) {
        throw ValidationError(name + " must be within [0, 1]");
    }
    if (param_is_integer(p)) {
        if (std::floor(value) != value) {
            throw ValidationError(name + " must be an integer");
        }
        if (value > static_cast<double>(std::numeric_limits<int>::max())) {
            throw ValidationError(name + " must be <= " + std::to_string(std::numeric_limits<int>::max()));
        }
        if ((p == Param::CONFIRM_N || p == Param::CONFIRM_M) && value < 1.0) {
            throw ValidationError(name + " must be >= 1");
        }
        if (p == Param::ALERT_COOLDOWN_SECONDS && value < 0.0) {
            throw ValidationError(name + " must be >= 0");
        }
    }
}

void validate_thresholds(const Thresholds& t) {
    for (Param p : kAllParams) validate_value(p, t.get(p));
    if (t.confirm_n > t.confirm_m) {
        throw ConfigurationError("CONFIRM_N (" + std::to_string(t.confirm_n) +
                                 ") must not exceed CONFIRM_M (" + std::to_string(t.confirm_m) + ")");
    }
}

double parse_param_value(Param p, const std::string& raw) {
    const std::string name = param_name(p);
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        throw ValidationError(name + ": '" + raw + "' is not a number");
    }
    while (used < raw.size() && std::isspace(static_cast<unsigned char>(raw[used]))) ++used;
    if (used != raw.size()) {
        throw ValidationError(name + ": '" + raw + "' is not a number");
    }
    validate_value(p, value);
    return value;
}

std::string format_param_value(Param p, double value) {
    if (param_is_integer(p)) return std::to_string(static_cast<long>(std::lround(value)));
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

ParameterStore::ParameterStore(const Thresholds& base) : base_(base) {
    validate_thresholds(base_);
}

Thresholds ParameterStore::apply(const Thresholds& base, const Overrides& overrides) {
    Thresholds t = base;
    for (const auto& kv : overrides) t.set(kv.first, kv.second);
    return t;
}

Thresholds ParameterStore::effective() const {
    return apply(base_, overrides_);
}

double ParameterStore::get(Param p) const {
    auto it = overrides_.find(p);
    return it != overrides_.end() ? it->second : base_.get(p);
}

void ParameterStore::set_override(Param p, double value) {
    Overrides next = overrides_;
    next[p] = value;
    replace_overrides(next);
}

void ParameterStore::replace_overrides(const Overrides& overrides) {
    for (const auto& kv : overrides) validate_value(kv.first, kv.second);
    validate_thresholds(apply(base_, overrides));
    overrides_ = overrides;
}

}  // namespace cryguard
