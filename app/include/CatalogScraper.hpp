#ifndef CATALOG_SCRAPER_HPP
#define CATALOG_SCRAPER_HPP

#include "Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class RequestExecutor;
namespace spdlog { class logger; }

/**
 * @brief Downloads and parses the public model library listing.
 *
 * The page is HTML meant for browsers, so parsing is deliberately loose:
 * cards are located through their /library/<name> anchors and every other
 * field is optional.
 */
class CatalogScraper {
public:
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultTtl{300};

    CatalogScraper(RequestExecutor& executor,
                   std::string catalog_url,
                   std::chrono::seconds ttl = kDefaultTtl,
                   Now now = [] { return Clock::now(); });

    /**
     * @brief Parses a listing page into unique entries in document order.
     * Never throws for malformed markup; unparseable cards are skipped.
     */
    static std::vector<CatalogEntry> parse(const std::string& html);

    /**
     * @brief Returns the cached listing, downloading it when stale or forced.
     * A failed download is logged and the previous list (possibly empty) is returned.
     */
    std::vector<CatalogEntry> fetch(bool force_refresh = false);

    const std::string& catalog_url() const { return catalog_url_; }

private:
    RequestExecutor& executor_;
    std::string catalog_url_;
    std::chrono::seconds ttl_;
    Now now_;
    mutable std::mutex mutex_;
    std::vector<CatalogEntry> entries_;
    std::optional<Clock::time_point> fetched_at_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Case-insensitive match over name, description, capabilities and sizes.
std::vector<CatalogEntry> filter_catalog(const std::vector<CatalogEntry>& entries, const std::string& query);

std::string format_catalog_entry(const CatalogEntry& entry);

#endif // CATALOG_SCRAPER_HPP
