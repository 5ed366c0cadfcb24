#include "config/convert_config.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "common/errors.hpp"

namespace gem2bgef {

    using nlohmann::json;

    // Generic helper: if key exists and is non-null, assign to target (strongly typed).
    template <typename T>
    static void set_if(const json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            try {
                it->get_to(target);
            }
            catch (const json::exception& e) {
                throw ConfigError(std::string("config key '") + key + "': " + e.what());
            }
        }
    }

    // Integer JSON value into an unsigned field, rejecting negatives and overflow.
    template <typename U>
    static void set_if_unsigned(const json& j, const char* key, U& target) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        if (it->is_number_unsigned()) {
            unsigned long long v = it->get<unsigned long long>();
            if (v > (unsigned long long)std::numeric_limits<U>::max()) {
                throw ConfigError(std::string("config key '") + key + "' out of range");
            }
            target = static_cast<U>(v);
        }
        else if (it->is_number_integer()) {
            throw ConfigError(std::string("config key '") + key + "' must not be negative");
        }
        else {
            throw ConfigError(std::string("config key '") + key + "' must be an integer");
        }
    }

    static uint32_t checked_bin_size(long long v) {
        if (v <= 0) throw ConfigError("bin size must be positive, got " + std::to_string(v));
        if (v > (long long)std::numeric_limits<uint32_t>::max()) {
            throw ConfigError("bin size out of range: " + std::to_string(v));
        }
        return (uint32_t)v;
    }

    static long long parse_ll(const std::string& item, const char* what) {
        try {
            size_t idx = 0;
            long long v = std::stoll(item, &idx);
            if (idx != item.size()) throw std::invalid_argument(item);
            return v;
        }
        catch (const std::exception&) {
            throw ConfigError(std::string("invalid integer in ") + what + ": '" + item + "'");
        }
    }

    static std::vector<std::string> split_commas(const std::string& s) {
        std::vector<std::string> out;
        std::stringstream ss(s);
        std::string item;
        while (std::getline(ss, item, ',')) {
            const size_t b = item.find_first_not_of(" \t");
            const size_t e = item.find_last_not_of(" \t");
            out.push_back(b == std::string::npos ? std::string() : item.substr(b, e - b + 1));
        }
        if (!s.empty() && s.back() == ',') out.push_back("");
        return out;
    }

    std::vector<uint32_t> parse_bin_list(const std::string& s) {
        std::vector<uint32_t> bins;
        for (const auto& item : split_commas(s)) {
            if (item.empty()) throw ConfigError("empty item in bin list: '" + s + "'");
            bins.push_back(checked_bin_size(parse_ll(item, "bin list")));
        }
        if (bins.empty()) throw ConfigError("bin list is empty");
        return bins;
    }

    Region parse_region(const std::string& s) {
        auto items = split_commas(s);
        if (items.size() != 4) throw ConfigError("region must be minx,maxx,miny,maxy; got '" + s + "'");
        Region r;
        r.enabled = true;
        r.min_x = parse_ll(items[0], "region");
        r.max_x = parse_ll(items[1], "region");
        r.min_y = parse_ll(items[2], "region");
        r.max_y = parse_ll(items[3], "region");
        return r;
    }

    void apply_convert_config_json(const std::string& json_text, ConvertConfig& cfg) {
        json j;
        try {
            j = json::parse(json_text);
        }
        catch (const std::exception& e) {
            throw ConfigError(std::string("Invalid JSON in config file: ") + e.what());
        }
        if (!j.is_object()) throw ConfigError("config file must hold a JSON object");

        // Strings
        set_if(j, "input", cfg.input_path);
        set_if(j, "output", cfg.output_path);
        set_if(j, "omics", cfg.omics);

        // Numbers
        set_if_unsigned(j, "resolution", cfg.resolution);
        set_if_unsigned(j, "max_consecutive_errors", cfg.max_consecutive_errors);
        set_if_unsigned(j, "error_sample_limit", cfg.error_sample_limit);
        set_if_unsigned(j, "progress_interval", cfg.progress_interval);

        // Booleans
        set_if(j, "verbose", cfg.verbose);

        // Bin list: [1, 20, 50] or "1,20,50"
        auto bins = j.find("bin_sizes");
        if (bins != j.end() && !bins->is_null()) {
            if (bins->is_string()) {
                cfg.bin_sizes = parse_bin_list(bins->get<std::string>());
            }
            else if (bins->is_array()) {
                std::vector<uint32_t> v;
                for (const auto& b : *bins) {
                    if (!b.is_number_integer()) throw ConfigError("bin_sizes must hold integers");
                    v.push_back(checked_bin_size(b.get<long long>()));
                }
                cfg.bin_sizes = std::move(v);
            }
            else {
                throw ConfigError("bin_sizes must be an array or a comma-separated string");
            }
        }

        // Region: [minx, maxx, miny, maxy] or "minx,maxx,miny,maxy"
        auto reg = j.find("region");
        if (reg != j.end() && !reg->is_null()) {
            if (reg->is_string()) {
                cfg.region = parse_region(reg->get<std::string>());
            }
            else if (reg->is_array() && reg->size() == 4) {
                for (const auto& v : *reg) {
                    if (!v.is_number_integer()) throw ConfigError("region must hold integers");
                }
                cfg.region.enabled = true;
                cfg.region.min_x = (*reg)[0].get<int64_t>();
                cfg.region.max_x = (*reg)[1].get<int64_t>();
                cfg.region.min_y = (*reg)[2].get<int64_t>();
                cfg.region.max_y = (*reg)[3].get<int64_t>();
            }
            else {
                throw ConfigError("region must be [minx, maxx, miny, maxy]");
            }
        }
    }

    ConvertConfig load_convert_config(const std::string& json_path) {
        std::ifstream in(json_path);
        if (!in) throw ConfigError("Could not open config file: " + json_path);

        std::stringstream ss;
        ss << in.rdbuf();

        ConvertConfig cfg;
        apply_convert_config_json(ss.str(), cfg);
        return cfg;
    }

    void validate_convert_config(const ConvertConfig& cfg) {
        if (cfg.input_path.empty()) throw ConfigError("no input path given");
        if (cfg.output_path.empty()) throw ConfigError("no output path given");
        if (cfg.input_path == cfg.output_path) throw ConfigError("input and output paths are the same");

        if (cfg.bin_sizes.empty()) throw ConfigError("bin list is empty");
        std::set<uint32_t> seen;
        for (uint32_t b : cfg.bin_sizes) {
            if (b == 0) throw ConfigError("bin size must be positive, got 0");
            if (!seen.insert(b).second) throw ConfigError("duplicate bin size: " + std::to_string(b));
        }

        if (cfg.region.enabled) {
            if (cfg.region.min_x > cfg.region.max_x || cfg.region.min_y > cfg.region.max_y) {
                throw ConfigError("region min must not exceed max");
            }
        }
    }

} // namespace gem2bgef
