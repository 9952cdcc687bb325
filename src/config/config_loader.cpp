#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace llmshield {

// Constexpr config keys (used 2+ times)
static constexpr std::string_view kEnabled = "enabled";
static constexpr std::string_view kAction  = "action";

const char* audit_store_kind_to_string(AuditStoreKind k) {
    switch (k) {
        case AuditStoreKind::CONSOLE: return "console";
        case AuditStoreKind::MEMORY:  return "memory";
        case AuditStoreKind::FILE:    return "file";
    }
    return "console";
}

std::optional<AuditStoreKind> parse_audit_store_kind(std::string_view s) {
    if (s == "console") return AuditStoreKind::CONSOLE;
    if (s == "memory") return AuditStoreKind::MEMORY;
    if (s == "file") return AuditStoreKind::FILE;
    return std::nullopt;
}

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} and ${VAR_NAME:-default} patterns in a string with
 * environment variables. The default applies when the variable is unset or empty.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            std::string var_name = input.substr(i + 2, close - i - 2);
            std::string default_val;
            if (const auto sep = var_name.find(":-"); sep != std::string::npos) {
                default_val = var_name.substr(sep + 2);
                var_name.resize(sep);
            }
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val && *env_val) {
                result += env_val;
            } else {
                result += default_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            } else {
                throw std::runtime_error(std::format("'{}' must be an array of strings", key));
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/// Accepts integer or floating point TOML values
std::optional<double> toml_optional_number(const toml::table& tbl, const std::string_view key) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto v = node.value<double>()) return *v;
    throw std::runtime_error(std::format("'{}' must be a number", key));
}

std::optional<int64_t> toml_optional_int(const toml::table& tbl, const std::string_view key) {
    const auto node = tbl[key];
    if (!node) return std::nullopt;
    if (const auto* v = node.as_integer()) return v->get();
    throw std::runtime_error(std::format("'{}' must be an integer", key));
}

size_t toml_size(const toml::table& tbl, const std::string_view key, size_t default_val) {
    const auto v = toml_optional_int(tbl, key);
    if (!v) return default_val;
    if (*v < 0) throw std::runtime_error(std::format("'{}' must not be negative", key));
    return static_cast<size_t>(*v);
}

template<typename T, typename ParseFn>
T parse_enum(const std::string& value, std::string_view what, ParseFn parse) {
    const auto parsed = parse(value);
    if (!parsed) {
        throw std::runtime_error(std::format("Unknown {} '{}'", what, value));
    }
    return *parsed;
}

// ---- Section extractors ----------------------------------------------------

InjectionConfig extract_injection(const toml::table& root) {
    InjectionConfig cfg;
    const auto* tbl = root["injection"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    if (auto s = toml_optional_string(*tbl, "strictness")) {
        cfg.strictness = parse_enum<InjectionStrictness>(*s, "injection strictness", parse_strictness);
    }
    cfg.threshold = toml_optional_number(*tbl, "threshold");
    if (auto s = toml_optional_string(*tbl, kAction)) {
        const auto action = parse_enum<Decision>(*s, "injection action", parse_decision);
        if (action == Decision::ALLOW) {
            throw std::runtime_error("Injection action must be 'block', 'warn' or 'flag'");
        }
        cfg.action = action;
    }
    cfg.custom_patterns = toml_string_array(*tbl, "custom_patterns");
    return cfg;
}

PiiConfig extract_pii(const toml::table& root) {
    PiiConfig cfg;
    const auto* tbl = root["pii"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    if (auto s = toml_optional_string(*tbl, kAction)) {
        cfg.action = parse_enum<PiiAction>(*s, "PII action", parse_pii_action);
    }
    for (const auto& name : toml_string_array(*tbl, "allowed_types")) {
        cfg.allowed_types.push_back(parse_enum<PiiType>(name, "PII type", parse_pii_type));
    }
    if (const auto* types = (*tbl)["types"].as_table()) {
        for (const auto& [key, val] : *types) {
            const std::string type_name(key.str());
            const auto* action = val.as_string();
            if (!action) {
                throw std::runtime_error(std::format("pii.types.{} must be a string", type_name));
            }
            cfg.types[parse_enum<PiiType>(type_name, "PII type", parse_pii_type)] =
                parse_enum<PiiAction>(std::string(action->get()), "PII action", parse_pii_action);
        }
    }
    return cfg;
}

ToolsConfig extract_tools(const toml::table& root) {
    ToolsConfig cfg;
    const auto* tbl = root["tools"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    cfg.read_only_mode = (*tbl)["read_only_mode"].value_or(false);
    if ((*tbl)["dangerous_patterns"]) {
        cfg.dangerous_patterns = toml_string_array(*tbl, "dangerous_patterns");
    }
    if ((*tbl)["max_chain_depth"]) {
        cfg.max_chain_depth = toml_size(*tbl, "max_chain_depth", 0);
    }

    if (const auto* perms = (*tbl)["permissions"].as_table()) {
        for (const auto& [agent, val] : *perms) {
            const auto* agent_tbl = val.as_table();
            if (!agent_tbl) {
                throw std::runtime_error(
                    std::format("tools.permissions.{} must be a table", agent.str()));
            }
            ToolPermissions p;
            p.allowed = toml_string_array(*agent_tbl, "allowed");
            p.denied = toml_string_array(*agent_tbl, "denied");
            cfg.permissions.emplace(std::string(agent.str()), std::move(p));
        }
    }

    if (const auto* pins = (*tbl)["manifest_pins"].as_array()) {
        for (const auto& elem : *pins) {
            const auto* pin_tbl = elem.as_table();
            if (!pin_tbl) {
                throw std::runtime_error("tools.manifest_pins entries must be tables");
            }
            const auto server_id = toml_optional_string(*pin_tbl, "server_id");
            if (!server_id || server_id->empty()) {
                throw std::runtime_error("tools.manifest_pins entry missing server_id");
            }
            auto pin = pin_manifest(*server_id, toml_string_array(*pin_tbl, "tools"));
            if (auto declared = toml_optional_string(*pin_tbl, "tools_hash")) {
                pin.tools_hash = std::move(*declared);
            }
            cfg.manifest_pins.push_back(std::move(pin));
        }
    }
    return cfg;
}

CostConfig extract_cost(const toml::table& root) {
    CostConfig cfg;
    const auto* tbl = root["cost"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    cfg.apply_preset_budget = (*tbl)["apply_preset_budget"].value_or(false);
    cfg.cascade_to_global = (*tbl)["cascade_to_global"].value_or(true);

    if (const auto* budgets = (*tbl)["budgets"].as_table()) {
        for (const auto& [entity, val] : *budgets) {
            const auto* b = val.as_table();
            if (!b) {
                throw std::runtime_error(
                    std::format("cost.budgets.{} must be a table", entity.str()));
            }
            BudgetConfig budget;
            const auto hard = toml_optional_number(*b, "hard_limit");
            if (!hard) {
                throw std::runtime_error(
                    std::format("cost.budgets.{} missing hard_limit", entity.str()));
            }
            budget.hard_limit = *hard;
            budget.soft_limit = toml_optional_number(*b, "soft_limit").value_or(*hard);
            if (auto p = toml_optional_string(*b, "period")) {
                budget.period = parse_enum<BudgetPeriod>(*p, "budget period", parse_budget_period);
            }
            cfg.budgets.emplace(std::string(entity.str()), budget);
        }
    }

    if (const auto* pricing = (*tbl)["pricing"].as_table()) {
        for (const auto& [model, val] : *pricing) {
            const auto* p = val.as_table();
            if (!p) {
                throw std::runtime_error(
                    std::format("cost.pricing.{} must be a table", model.str()));
            }
            ModelPricing mp;
            mp.input_per_1m = toml_optional_number(*p, "input_per_1m").value_or(0.0);
            mp.output_per_1m = toml_optional_number(*p, "output_per_1m").value_or(0.0);
            cfg.pricing.insert_or_assign(std::string(model.str()), mp);
        }
    }
    return cfg;
}

AuditConfig extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* tbl = root["audit"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    if (auto s = toml_optional_string(*tbl, "store")) {
        cfg.store = parse_enum<AuditStoreKind>(*s, "audit store", parse_audit_store_kind);
    }
    cfg.file_path = toml_optional_string(*tbl, "file_path").value_or(cfg.file_path);
    cfg.batch_size = toml_size(*tbl, "batch_size", cfg.batch_size);
    cfg.flush_interval = std::chrono::milliseconds(
        toml_size(*tbl, "flush_interval_ms", static_cast<size_t>(cfg.flush_interval.count())));
    cfg.retention_days = static_cast<int>(toml_size(*tbl, "retention_days", 0));
    cfg.max_file_size_bytes = toml_size(*tbl, "max_file_size_mb", 100) * 1024 * 1024;
    cfg.max_files = static_cast<int>(toml_size(*tbl, "max_files", 10));
    return cfg;
}

CacheConfig extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* tbl = root["cache"].as_table();
    if (!tbl) return cfg;

    cfg.enabled = (*tbl)[kEnabled].value_or(true);
    cfg.max_size = toml_size(*tbl, "max_size", cfg.max_size);
    cfg.ttl = std::chrono::milliseconds(
        toml_size(*tbl, "ttl_ms", static_cast<size_t>(cfg.ttl.count())));
    return cfg;
}

ShieldConfig extract_config(const toml::table& root) {
    ShieldConfig cfg;
    if (auto p = toml_optional_string(root, "preset")) {
        cfg.preset = parse_enum<PresetName>(*p, "preset", parse_preset);
    }
    cfg.early_exit = root["early_exit"].value_or(true);
    cfg.max_input_bytes = toml_size(root, "max_input_bytes", cfg.max_input_bytes);
    cfg.injection = extract_injection(root);
    cfg.pii = extract_pii(root);
    cfg.tools = extract_tools(root);
    cfg.cost = extract_cost(root);
    cfg.audit = extract_audit(root);
    cfg.cache = extract_cache(root);
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    namespace fs = std::filesystem;
    try {
        if (!fs::exists(config_path)) {
            return LoadResult::error(ErrorCategory::CONFIG_ERROR,
                std::format("Cannot open config file: {}", config_path));
        }
        auto root = toml::parse_file(config_path);

        std::unordered_set<std::string> visited;
        visited.insert(fs::canonical(config_path).string());
        resolve_includes(root, fs::path(config_path).parent_path().string(), visited, 0);

        expand_env_vars_recursive(root);
        return LoadResult::ok(extract_config(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("TOML parse error in {}: {}", config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        expand_env_vars_recursive(root);
        return LoadResult::ok(extract_config(root));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("TOML parse error: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(ErrorCategory::CONFIG_ERROR,
            std::format("Invalid config: {}", e.what()));
    }
}

} // namespace llmshield
