/*
 * gcrdl/src/config/settings.cpp
 */

#include <gcrdl/config/config_helpers.h>
#include <gcrdl/config/settings.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <optional>

namespace gcrdl::config {

namespace {

class SectionReader {
public:
    SectionReader(const ConfigSections& all, std::string name) : name_(std::move(name)) {
        if (auto it = all.find(name_); it != all.end()) {
            values_ = &it->second;
        }
    }

    const std::string* raw(const std::string& key) const {
        if (!values_) {
            return nullptr;
        }
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &it->second;
    }

    void text(const std::string& key, std::string& out) const {
        if (const auto* v = raw(key); v && !v->empty()) {
            out = *v;
        }
    }

    void path(const std::string& key, std::filesystem::path& out) const {
        if (const auto* v = raw(key); v && !v->empty()) {
            out = expand_tilde(*v);
        }
    }

    template <typename T> void integer(const std::string& key, T& out, T minimum = T{}) const {
        const auto* v = raw(key);
        if (!v) {
            return;
        }
        T parsed{};
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec != std::errc{} || ptr != v->data() + v->size() || parsed < minimum) {
            spdlog::warn("Config: ignoring invalid [{}] {} = '{}'", name_, key, *v);
            return;
        }
        out = parsed;
    }

    void real(const std::string& key, double& out, double minimum = 0.0) const {
        const auto* v = raw(key);
        if (!v) {
            return;
        }
        char* end = nullptr;
        const double parsed = std::strtod(v->c_str(), &end);
        if (v->empty() || end != v->c_str() + v->size() || parsed < minimum) {
            spdlog::warn("Config: ignoring invalid [{}] {} = '{}'", name_, key, *v);
            return;
        }
        out = parsed;
    }

    template <typename Rep, typename Period>
    void duration(const std::string& key, std::chrono::duration<Rep, Period>& out) const {
        long long n = out.count();
        integer<long long>(key, n, 0);
        out = std::chrono::duration<Rep, Period>(n);
    }

private:
    std::string name_;
    const std::map<std::string, std::string>* values_{nullptr};
};

} // namespace

Settings loadSettings(const std::filesystem::path& path) {
    Settings s;
    s.dataDir = get_data_dir();

    const auto sections = parse_config_file(path);
    if (sections.empty()) {
        spdlog::debug("Config: no settings at {}, using defaults", path.string());
    }

    SectionReader core(sections, "core");
    core.path("data_dir", s.dataDir);
    core.text("log_level", s.logLevel);

    SectionReader rl(sections, "rate_limit");
    rl.real("capacity", s.rateLimit.capacity, 1.0);
    rl.real("refill_per_second", s.rateLimit.refillPerSecond);
    rl.duration("default_backoff_ms", s.rateLimit.defaultBackoff);
    rl.duration("max_backoff_ms", s.rateLimit.maxBackoff);

    SectionReader cache(sections, "cache");
    cache.integer<std::size_t>("max_entries", s.cache.maxEntries, 1);
    cache.integer<std::size_t>("max_bytes", s.cache.maxBytes, 1);
    {
        long long days = s.cache.maxAge.count() / 24;
        cache.integer<long long>("max_age_days", days, 0);
        s.cache.maxAge = std::chrono::hours(24 * days);
    }

    SectionReader dl(sections, "download");
    dl.integer<int>("max_concurrent", s.download.maxConcurrent, 1);
    dl.integer<int>("max_attempts", s.download.retry.maxAttempts, 1);
    dl.duration("initial_backoff_ms", s.download.retry.initialBackoff);
    dl.real("backoff_multiplier", s.download.retry.multiplier, 1.0);
    dl.duration("max_backoff_ms", s.download.retry.maxBackoff);
    dl.real("jitter", s.download.retry.jitter);
    dl.integer<std::uint64_t>("max_file_bytes", s.download.maxFileBytes, 1);
    dl.integer<std::uint64_t>("warn_file_bytes", s.download.warnFileBytes, 1);
    dl.integer<std::size_t>("offline_queue_max", s.download.maxOfflineQueue, 1);
    dl.integer<int>("offline_max_retries", s.download.maxOfflineRetries, 1);
    dl.duration("request_timeout_ms", s.requestTimeout);
    dl.path("output_dir", s.outputDir);

    SectionReader cat(sections, "catalog");
    cat.text("source", s.catalogSource);
    cat.path("dir", s.catalogDir);
    cat.text("classroom_url", s.classroomUrl);
    if (s.catalogSource != "classroom" && s.catalogSource != "directory") {
        spdlog::warn("Config: unknown [catalog] source '{}', using classroom", s.catalogSource);
        s.catalogSource = "classroom";
    }

    SectionReader auth(sections, "auth");
    auth.text("token_command", s.tokenCommand);
    auth.duration("lifetime_minutes", s.auth.assumedLifetime);
    auth.duration("expiry_buffer_minutes", s.auth.expiryBuffer);
    auth.duration("proactive_refresh_minutes", s.auth.proactiveRefreshInterval);
    auth.duration("min_batch_validity_minutes", s.auth.minBatchValidity);

    if (s.outputDir.empty()) {
        s.outputDir = std::filesystem::current_path();
    }
    return s;
}

} // namespace gcrdl::config
