#include "CatalogScraper.hpp"
#include "GatewayErrors.hpp"
#include "Logger.hpp"
#include "RequestExecutor.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <unordered_set>
#include <utility>

namespace {

constexpr std::size_t kMaxChipChars = 24;
constexpr const char* kLibraryPrefix = "/library/";

const std::vector<std::string>& capability_vocabulary()
{
    static const std::vector<std::string> vocabulary{"vision", "tools", "thinking", "embedding", "cloud"};
    return vocabulary;
}

struct CardAnchor {
    std::size_t position;
    std::string name;
};

std::string decode_entities(const std::string& text)
{
    static const std::vector<std::pair<std::string, std::string>> entities{
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""},
        {"&#39;", "'"}, {"&#x27;", "'"}, {"&nbsp;", " "},
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        if (text[i] == '&') {
            bool replaced = false;
            for (const auto& [entity, value] : entities) {
                if (text.compare(i, entity.size(), entity) == 0) {
                    out += value;
                    i += entity.size();
                    replaced = true;
                    break;
                }
            }
            if (replaced) {
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

std::string collapse_whitespace(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        if (ch == ' ' || ch == '\n' || ch == '\t' || ch == '\r' || ch == '\f' || ch == '\v') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += ch;
    }
    return out;
}

// Replaces every tag with a space so adjacent cells do not run together.
std::string strip_tags(const std::string& html)
{
    std::string out;
    out.reserve(html.size());
    bool in_tag = false;
    for (char ch : html) {
        if (in_tag) {
            if (ch == '>') {
                in_tag = false;
                out += ' ';
            }
        } else if (ch == '<') {
            in_tag = true;
        } else {
            out += ch;
        }
    }
    return collapse_whitespace(decode_entities(out));
}

std::vector<CardAnchor> find_card_anchors(const std::string& html)
{
    std::vector<CardAnchor> anchors;
    std::size_t pos = 0;
    while ((pos = html.find("href=", pos)) != std::string::npos) {
        const std::size_t quote_pos = pos + 5;
        pos = quote_pos;
        if (quote_pos >= html.size() || (html[quote_pos] != '"' && html[quote_pos] != '\'')) {
            continue;
        }
        const char quote = html[quote_pos];
        const std::size_t value_start = quote_pos + 1;
        const std::size_t value_end = html.find(quote, value_start);
        if (value_end == std::string::npos) {
            break;
        }
        const std::string value = html.substr(value_start, value_end - value_start);
        pos = value_end + 1;

        if (value.compare(0, std::char_traits<char>::length(kLibraryPrefix), kLibraryPrefix) != 0) {
            continue;
        }
        std::string name = value.substr(std::char_traits<char>::length(kLibraryPrefix));
        if (name.empty() || name.find_first_of("/?#") != std::string::npos) {
            continue;
        }
        if (!anchors.empty() && anchors.back().name == name) {
            continue;
        }
        const std::size_t tag_start = html.rfind('<', quote_pos);
        anchors.push_back(CardAnchor{tag_start == std::string::npos ? quote_pos : tag_start, std::move(name)});
    }
    return anchors;
}

// Inner HTML of every <tag ...>...</tag> in the segment, in order.
std::vector<std::string> element_contents(const std::string& segment, const std::string& tag)
{
    std::vector<std::string> contents;
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";
    std::size_t pos = 0;
    while ((pos = segment.find(open, pos)) != std::string::npos) {
        const std::size_t after_name = pos + open.size();
        if (after_name >= segment.size()) {
            break;
        }
        const char next = segment[after_name];
        if (next != '>' && next != ' ' && next != '\n' && next != '\t') {
            pos = after_name;
            continue;
        }
        const std::size_t body_start = segment.find('>', after_name);
        if (body_start == std::string::npos) {
            break;
        }
        const std::size_t body_end = segment.find(close, body_start + 1);
        if (body_end == std::string::npos) {
            break;
        }
        contents.push_back(segment.substr(body_start + 1, body_end - body_start - 1));
        pos = body_end + close.size();
    }
    return contents;
}

std::string first_match(const std::string& text, const std::regex& pattern)
{
    std::smatch match;
    if (std::regex_search(text, match, pattern) && match.size() > 1) {
        return Utils::trim(match[1].str());
    }
    return {};
}

std::string remove_spaces(std::string value)
{
    value.erase(std::remove(value.begin(), value.end(), ' '), value.end());
    return value;
}

CatalogEntry parse_card(const std::string& name, const std::string& segment)
{
    static const std::regex size_pattern(R"(^(\d+x)?\d+(\.\d+)?[bmkt]$)", std::regex::ECMAScript | std::regex::icase);
    static const std::regex pulls_pattern(R"(([0-9][0-9.,]*\s*[KMB]?)\s+Pulls)", std::regex::ECMAScript | std::regex::icase);
    static const std::regex tags_pattern(R"(([0-9]+)\s+Tags)", std::regex::ECMAScript | std::regex::icase);
    static const std::regex updated_pattern(
        R"(Updated\s+([0-9]+\s+[A-Za-z]+\s+ago|yesterday|today|[A-Za-z]+\s+[0-9]{1,2},?\s+[0-9]{4}|[0-9]{4}-[0-9]{2}-[0-9]{2}))",
        std::regex::ECMAScript | std::regex::icase);

    CatalogEntry entry;
    entry.name = name;

    const auto paragraphs = element_contents(segment, "p");
    if (!paragraphs.empty()) {
        entry.description = strip_tags(paragraphs.front());
    }

    for (const auto& raw_chip : element_contents(segment, "span")) {
        const std::string chip = Utils::to_lower(strip_tags(raw_chip));
        if (chip.empty() || chip.size() > kMaxChipChars) {
            continue;
        }
        const auto& vocabulary = capability_vocabulary();
        if (std::find(vocabulary.begin(), vocabulary.end(), chip) != vocabulary.end()) {
            if (std::find(entry.capabilities.begin(), entry.capabilities.end(), chip) == entry.capabilities.end()) {
                entry.capabilities.push_back(chip);
            }
        } else if (std::regex_match(chip, size_pattern)) {
            if (std::find(entry.sizes.begin(), entry.sizes.end(), chip) == entry.sizes.end()) {
                entry.sizes.push_back(chip);
            }
        }
    }

    const std::string text = strip_tags(segment);
    entry.pulls = remove_spaces(first_match(text, pulls_pattern));
    if (!entry.pulls.empty()) {
        // "1.2M" pull counts are rendered as chips too.
        const std::string pulls_chip = Utils::to_lower(entry.pulls);
        entry.sizes.erase(std::remove(entry.sizes.begin(), entry.sizes.end(), pulls_chip), entry.sizes.end());
    }
    entry.tag_count = first_match(text, tags_pattern);
    entry.updated = first_match(text, updated_pattern);
    return entry;
}

std::string join(const std::vector<std::string>& values, const char* separator)
{
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += values[i];
    }
    return out;
}

}

CatalogScraper::CatalogScraper(RequestExecutor& executor,
                               std::string catalog_url,
                               std::chrono::seconds ttl,
                               Now now)
    : executor_(executor),
      catalog_url_(std::move(catalog_url)),
      ttl_(ttl),
      now_(std::move(now))
{
    logger_ = Logger::get_logger("core_logger");
}

std::vector<CatalogEntry> CatalogScraper::parse(const std::string& html)
{
    std::vector<CatalogEntry> entries;
    std::unordered_set<std::string> seen;
    const auto anchors = find_card_anchors(html);
    auto logger = Logger::get_logger("core_logger");

    for (std::size_t i = 0; i < anchors.size(); ++i) {
        const auto& anchor = anchors[i];
        if (seen.count(anchor.name) > 0) {
            continue;
        }
        const std::size_t end = (i + 1 < anchors.size()) ? anchors[i + 1].position : html.size();
        try {
            entries.push_back(parse_card(anchor.name, html.substr(anchor.position, end - anchor.position)));
            seen.insert(anchor.name);
        } catch (const std::exception& ex) {
            if (logger) {
                logger->warn("catalog_card_skipped name={} error={}", anchor.name, ex.what());
            }
        }
    }
    return entries;
}

std::vector<CatalogEntry> CatalogScraper::fetch(bool force_refresh)
{
    const auto now = now_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force_refresh && fetched_at_ && (now - *fetched_at_) < ttl_) {
            return entries_;
        }
    }

    std::string html;
    try {
        html = executor_.execute(HttpMethod::Get, catalog_url_, "");
    } catch (const GatewayError& ex) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logger_) {
            logger_->warn("catalog_fetch_failed url={} error={} serving={}", catalog_url_, ex.what(), entries_.size());
        }
        return entries_;
    }

    auto parsed = parse(html);
    if (logger_) {
        logger_->info("catalog_fetched url={} entries={}", catalog_url_, parsed.size());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(parsed);
    fetched_at_ = now;
    return entries_;
}

std::vector<CatalogEntry> filter_catalog(const std::vector<CatalogEntry>& entries, const std::string& query)
{
    const std::string needle = Utils::trim(query);
    if (needle.empty()) {
        return entries;
    }

    std::vector<CatalogEntry> matches;
    for (const auto& entry : entries) {
        const auto in_list = [&needle](const std::vector<std::string>& values) {
            return std::any_of(values.begin(), values.end(), [&needle](const std::string& value) {
                return Utils::contains_ci(value, needle);
            });
        };
        if (Utils::contains_ci(entry.name, needle)
            || Utils::contains_ci(entry.description, needle)
            || in_list(entry.capabilities)
            || in_list(entry.sizes)) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::string format_catalog_entry(const CatalogEntry& entry)
{
    std::string out = entry.name + "\n";
    if (!entry.description.empty()) {
        out += fmt::format("  {}\n", entry.description);
    }
    if (!entry.capabilities.empty()) {
        out += fmt::format("  capabilities: {}\n", join(entry.capabilities, ", "));
    }
    if (!entry.sizes.empty()) {
        out += fmt::format("  sizes: {}\n", join(entry.sizes, ", "));
    }

    std::vector<std::string> stats;
    if (!entry.pulls.empty()) {
        stats.push_back("pulls: " + entry.pulls);
    }
    if (!entry.tag_count.empty()) {
        stats.push_back("tags: " + entry.tag_count);
    }
    if (!entry.updated.empty()) {
        stats.push_back("updated: " + entry.updated);
    }
    if (!stats.empty()) {
        out += fmt::format("  {}\n", join(stats, " | "));
    }
    return out;
}
