#include "./logging.hpp"

#include "./environ.hpp"
#include "./error.hpp"

#include <boost/log/keywords/channel.hpp>

#include <atomic>

using namespace sluice;

namespace {

// One past the most severe level. Nothing is emitted.
constexpr int logging_off = static_cast<int>(log_level::fatal) + 1;

std::atomic<int> g_threshold{logging_off};

}  // namespace

void sluice::set_log_level(log_level level) noexcept {
    g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

void sluice::disable_logging() noexcept {
    g_threshold.store(logging_off, std::memory_order_relaxed);
}

bool sluice::log_enabled(log_level level) noexcept {
    return static_cast<int>(level) >= g_threshold.load(std::memory_order_relaxed);
}

logger_type& sluice::detail::logger() noexcept {
    static logger_type lg{boost::log::keywords::channel = std::string(log_channel)};
    return lg;
}

std::optional<log_level> sluice::parse_log_level(std::string_view name) noexcept {
    log_level ret = log_level::info;
    if (boost::log::trivial::from_string(name.data(), name.size(), ret)) {
        return ret;
    }
    return std::nullopt;
}

void sluice::configure_logging_from_environment() {
    auto name = sluice::getenv(log_level_env);
    if (!name || name->empty()) {
        return;
    }
    if (*name == "off") {
        disable_logging();
        return;
    }
    auto parsed = parse_log_level(*name);
    if (!parsed) {
        throw_bad_config(log_level_env,
                         *name,
                         "off, or one of trace, debug, info, warning, error, fatal");
    }
    set_log_level(*parsed);
}
