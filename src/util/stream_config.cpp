#include "util/stream_config.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace blockflow {

namespace {

Result ConfigError(std::string msg) {
    return Result::Fail(ErrorKind::Config, -1, std::move(msg));
}

// Absent keys are fine; present keys must have the right type.
Result GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, bool& present) {
    present = false;
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        present = true;
        return Result::Ok();
    }
    if (!it->is_number_integer())
        return ConfigError(std::string(key) + " must be an unsigned integer");
    auto v = it->get<long long>();
    if (v < 0)
        return ConfigError(std::string(key) + " must not be negative");
    out = static_cast<std::uint64_t>(v);
    present = true;
    return Result::Ok();
}

Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return ConfigError(std::string(key) + " must be a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result FillFromJson(const nlohmann::json& j, StreamConfig& cfg) {
    if (!j.is_object()) {
        return ConfigError("stream config must be JSON object");
    }

    std::uint64_t v{};
    bool present = false;

    if (auto r = GetU64IfPresent(j, "SaveBufferSize", v, present); !r.ok) return r;
    if (present) {
        if (v == 0 || v > kMaxBlockSize)
            return ConfigError("SaveBufferSize must be within 1.." + std::to_string(kMaxBlockSize));
        cfg.save_buffer_size = static_cast<std::size_t>(v);
    }

    if (auto r = GetU64IfPresent(j, "ReadBlockSize", v, present); !r.ok) return r;
    if (present) {
        if (v == 0 || v > kMaxBlockSize)
            return ConfigError("ReadBlockSize must be within 1.." + std::to_string(kMaxBlockSize));
        cfg.read_block_size = static_cast<std::size_t>(v);
    }

    if (auto r = GetU64IfPresent(j, "SettleDelayMs", v, present); !r.ok) return r;
    if (present) {
        if (v > StreamConfig::kMaxSettleDelayMs)
            return ConfigError("SettleDelayMs must not exceed " + std::to_string(StreamConfig::kMaxSettleDelayMs));
        cfg.settle_delay = std::chrono::milliseconds(static_cast<long long>(v));
    }

    if (auto r = GetU64IfPresent(j, "IoThreads", v, present); !r.ok) return r;
    if (present) {
        if (v == 0 || v > StreamConfig::kMaxIoThreads)
            return ConfigError("IoThreads must be within 1.." + std::to_string(StreamConfig::kMaxIoThreads));
        cfg.io_threads = static_cast<std::size_t>(v);
    }

    if (auto r = GetBoolIfPresent(j, "TruncateOnWrite", cfg.truncate_on_write); !r.ok) return r;
    if (auto r = GetBoolIfPresent(j, "FsyncOnClose", cfg.fsync_on_close); !r.ok) return r;

    auto it = j.find("LogLevel");
    if (it != j.end()) {
        if (!it->is_string())
            return ConfigError("LogLevel must be a string");
        auto lvl = ParseLogLevel(it->get<std::string>());
        if (!lvl)
            return ConfigError("unknown LogLevel: " + it->get<std::string>());
        cfg.log_level = *lvl;
    }

    return Result::Ok();
}

} // namespace

Result StreamConfig::LoadFromString(const std::string& text, StreamConfig& out) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const std::exception& e) {
        return ConfigError(std::string("invalid JSON: ") + e.what());
    }

    StreamConfig cfg;
    auto r = FillFromJson(j, cfg);
    if (r.ok) {
        out = cfg;
    }
    return r;
}

Result StreamConfig::LoadFromFile(const std::string& path, StreamConfig& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return ConfigError("cannot open stream config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return ConfigError(std::string("invalid JSON in ") + path + ": " + e.what());
    }

    StreamConfig cfg;
    auto r = FillFromJson(j, cfg);
    if (!r.ok) {
        r.msg += " (" + path + ")";
        return r;
    }
    out = cfg;
    return r;
}

} // namespace blockflow
