/**
 * @file prefetch_engine.cpp
 * @brief Implementation of prefetch_engine and the rule factories
 */

#include "medimg/services/cache/prefetch_engine.hpp"

#include "medimg/integration/logger_adapter.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <charconv>
#include <exception>
#include <set>
#include <stdexcept>

namespace medimg::services::cache {

namespace {

auto to_upper(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

/// Parse "YYYY-MM-DD"; std::nullopt for anything else
auto parse_study_day(const std::string& date) -> std::optional<std::chrono::sys_days> {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return std::nullopt;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const auto* base = date.data();
    if (std::from_chars(base, base + 4, y).ec != std::errc{} ||
        std::from_chars(base + 5, base + 7, m).ec != std::errc{} ||
        std::from_chars(base + 8, base + 10, d).ec != std::errc{}) {
        return std::nullopt;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                          std::chrono::day{d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::sys_days{ymd};
}

}  // namespace

// =============================================================================
// Condition factories
// =============================================================================

auto modality_is(std::string modality) -> prefetch_condition {
    return [code = to_upper(std::move(modality))](const core::dicom_metadata& study) {
        return !code.empty() && to_upper(study.series.modality) == code;
    };
}

auto modality_in(std::vector<std::string> modalities) -> prefetch_condition {
    for (auto& code : modalities) {
        code = to_upper(std::move(code));
    }
    return [codes = std::move(modalities)](const core::dicom_metadata& study) {
        const auto modality = to_upper(study.series.modality);
        return !modality.empty() &&
               std::find(codes.begin(), codes.end(), modality) != codes.end();
    };
}

auto study_within(std::chrono::days days, std::chrono::system_clock::time_point reference)
    -> prefetch_condition {
    const auto earliest = std::chrono::floor<std::chrono::days>(reference) - days;
    return [earliest](const core::dicom_metadata& study) {
        const auto day = parse_study_day(study.study.date);
        return day.has_value() && *day >= earliest;
    };
}

auto all_of(std::vector<prefetch_condition> conditions) -> prefetch_condition {
    return [conditions = std::move(conditions)](const core::dicom_metadata& study) {
        return std::all_of(conditions.begin(), conditions.end(),
                           [&](const prefetch_condition& c) { return c && c(study); });
    };
}

auto any_of(std::vector<prefetch_condition> conditions) -> prefetch_condition {
    return [conditions = std::move(conditions)](const core::dicom_metadata& study) {
        return std::any_of(conditions.begin(), conditions.end(),
                           [&](const prefetch_condition& c) { return c && c(study); });
    };
}

auto default_rules() -> std::vector<prefetch_rule> {
    std::vector<prefetch_rule> rules;

    prefetch_rule recent;
    recent.name = "recent_studies";
    recent.condition = study_within(std::chrono::days{7});
    recent.priority = 1;
    recent.max_images = 50;
    rules.push_back(std::move(recent));

    prefetch_rule urgent;
    urgent.name = "urgent_radiology";
    urgent.condition = all_of({modality_in({"CT", "MR", "CR"}),
                               study_within(std::chrono::days{1})});
    urgent.priority = 2;
    urgent.max_images = 20;
    urgent.specialty = "radiology";
    rules.push_back(std::move(urgent));

    return rules;
}

// =============================================================================
// Construction
// =============================================================================

prefetch_engine::prefetch_engine(std::shared_ptr<cache_service> cache,
                                 std::shared_ptr<dicom_handler> handler,
                                 std::shared_ptr<integration::thread_pool_interface> pool,
                                 prefetch_engine_config config,
                                 std::shared_ptr<di::ILogger> logger,
                                 image_loader loader)
    : cache_(std::move(cache)),
      handler_(std::move(handler)),
      pool_(std::move(pool)),
      config_(config),
      logger_(logger ? std::move(logger) : di::null_logger()),
      loader_(std::move(loader)) {
    if (!cache_ || !handler_ || !pool_) {
        throw std::invalid_argument("prefetch_engine requires a cache, a handler and a pool");
    }
    if (config_.max_concurrent_fetches == 0) {
        config_.max_concurrent_fetches = 1;
    }
    if (!loader_) {
        loader_ = [handler = handler_](const std::filesystem::path& path) {
            return handler->read_dicom_file(path);
        };
    }
}

// =============================================================================
// Execution
// =============================================================================

auto prefetch_engine::execute(std::span<const prefetch_rule> rules,
                              std::span<const prefetch_candidate> working_set)
    -> Result<prefetch_result> {
    if (!cache_->config().prefetch_enabled) {
        return medimg_error<prefetch_result>(error_codes::prefetch_disabled,
                                             "Prefetching is disabled in the cache configuration");
    }
    if (!pool_->is_running() && !pool_->start()) {
        return medimg_error<prefetch_result>(error_codes::fetch_failed,
                                             "Prefetch thread pool could not be started");
    }

    const auto started = std::chrono::steady_clock::now();

    std::vector<const prefetch_rule*> ordered;
    ordered.reserve(rules.size());
    for (const auto& rule : rules) {
        ordered.push_back(&rule);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const prefetch_rule* a, const prefetch_rule* b) {
                         return a->priority > b->priority;
                     });

    prefetch_result result;
    for (const auto* rule : ordered) {
        if (!rule->enabled) {
            logger_->debug_fmt("Prefetch rule '{}' is disabled, skipping", rule->name);
            ++result.rules_skipped;
            continue;
        }

        auto report = run_rule(*rule, working_set, result);
        integration::logger_adapter::log_prefetch_run(report.rule_name, report.studies_matched,
                                                      report.images_cached, report.failures);
        result.images_cached += report.images_cached;
        result.failures += report.failures;
        result.rules.push_back(std::move(report));
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    logger_->info_fmt("Prefetch run finished: {} rules, {} skipped, {} images cached, {} failed",
                      result.rules.size(), result.rules_skipped, result.images_cached,
                      result.failures);
    return Result<prefetch_result>::ok(std::move(result));
}

auto prefetch_engine::execute_async(std::vector<prefetch_rule> rules,
                                    std::vector<prefetch_candidate> working_set)
    -> std::future<Result<prefetch_result>> {
    return std::async(std::launch::async,
                      [this, rules = std::move(rules), working_set = std::move(working_set)]() {
                          return execute(rules, working_set);
                      });
}

auto prefetch_engine::run_rule(const prefetch_rule& rule,
                               std::span<const prefetch_candidate> working_set,
                               prefetch_result& totals) -> rule_report {
    rule_report report;
    report.rule_name = rule.name;

    if (!rule.condition) {
        logger_->warn_fmt("Prefetch rule '{}' has no condition and matches nothing", rule.name);
        return report;
    }

    // Collect the images this rule wants, capped at max_images
    std::vector<std::filesystem::path> scheduled;
    std::set<std::filesystem::path> seen;
    for (const auto& candidate : working_set) {
        if (rule.specialty && candidate.specialty != rule.specialty) {
            continue;
        }
        if (!rule.condition(candidate.study)) {
            continue;
        }

        ++report.studies_matched;
        if (config_.cache_study_metadata && !candidate.study.study.instance_uid.empty() &&
            cache_->cache_study_metadata(candidate.study)) {
            ++totals.studies_cached;
        }

        for (const auto& image : candidate.images) {
            if (scheduled.size() >= rule.max_images) {
                break;
            }
            if (seen.insert(image).second) {
                scheduled.push_back(image);
            }
        }
    }
    report.images_scheduled = scheduled.size();
    if (scheduled.size() == rule.max_images && rule.max_images > 0) {
        logger_->debug_fmt("Prefetch rule '{}' reached its limit of {} images", rule.name,
                           rule.max_images);
    }

    // Fetch in bounded batches
    const auto batch_size = config_.max_concurrent_fetches;
    for (std::size_t first = 0; first < scheduled.size(); first += batch_size) {
        const auto last = std::min(first + batch_size, scheduled.size());

        std::atomic<std::size_t> cached{0};
        std::vector<std::pair<std::size_t, std::future<void>>> in_flight;
        in_flight.reserve(last - first);

        for (std::size_t i = first; i < last; ++i) {
            try {
                in_flight.emplace_back(i, pool_->submit([this, &cached, &path = scheduled[i]]() {
                    if (fetch_image(path)) {
                        cached.fetch_add(1, std::memory_order_relaxed);
                    }
                }));
            } catch (const std::exception& e) {
                logger_->error_fmt("Prefetch of {} could not be scheduled: {}",
                                   scheduled[i].string(), e.what());
                ++report.failures;
            }
        }

        std::size_t completed = 0;
        for (auto& [index, pending] : in_flight) {
            try {
                pending.get();
                ++completed;
            } catch (const std::exception& e) {
                logger_->error_fmt("Prefetch of {} failed: {}", scheduled[index].string(),
                                   e.what());
                ++report.failures;
            }
        }

        // Completed fetches that did not cache have already logged their reason
        const auto stored = cached.load();
        report.images_cached += stored;
        report.failures += completed - stored;
    }

    return report;
}

auto prefetch_engine::fetch_image(const std::filesystem::path& path) const -> bool {
    auto bytes = loader_(path);
    if (bytes.is_err()) {
        logger_->warn_fmt("Prefetch could not read {}: {}", path.string(),
                          bytes.error().message);
        return false;
    }

    auto image = handler_->extract_image_data(bytes.value(), path.string());
    if (image.is_err()) {
        logger_->warn_fmt("Prefetch could not decode {}: {}", path.string(),
                          image.error().message);
        return false;
    }

    const auto& sop_uid = image.value().metadata.sop_instance_uid;
    if (sop_uid.empty()) {
        logger_->warn_fmt("Prefetch skipped {}: no SOP Instance UID", path.string());
        return false;
    }

    if (!cache_->cache_image_data(sop_uid, image.value().pixel_data.bytes)) {
        logger_->warn_fmt("Prefetch did not cache {} ({} bytes)", sop_uid,
                          image.value().pixel_data.length);
        return false;
    }
    return true;
}

}  // namespace medimg::services::cache
