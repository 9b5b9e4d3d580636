/**
 *  @file       proc_stat_source.cpp
 *
 *  Implementation of the procfs statistics source.
 */

#include "pipa/collection/proc_stat_source.hpp"

#include "pipa/core/errors.hpp"
#include "pipa/core/logging.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace pipa::collection
{

namespace
{

/**
 *  Trims leading and trailing whitespace from a string view.
 *
 *  @param      str  The string view to trim.
 *  @return     A string view with whitespace removed from both ends.
 */
[[nodiscard]] constexpr auto trim(std::string_view str) noexcept -> std::string_view
{
    const char* whitespace = " \t\n\r";

    auto start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos)
    {
        return {};
    }

    auto end = str.find_last_not_of(whitespace);

    return str.substr(start, end - start + 1);
}

/**
 *  Parses an unsigned integer that must span the whole token.
 *
 *  @param      str  The token.
 *  @return     The value, or std::nullopt if the token is not a number.
 */
[[nodiscard]] auto parseNumber(std::string_view str) noexcept -> std::optional<std::uint64_t>
{
    str = trim(str);

    if (str.empty())
    {
        return std::nullopt;
    }

    std::uint64_t value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    // Fail if parsing error or if input wasn't fully consumed
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }

    return value;
}

/**
 *  Splits a line on spaces and tabs.
 */
[[nodiscard]] auto tokenize(std::string_view line) -> std::vector<std::string_view>
{
    std::vector<std::string_view> tokens;
    const char* separators = " \t";

    std::size_t pos = line.find_first_not_of(separators);
    while (pos != std::string_view::npos)
    {
        auto end = line.find_first_of(separators, pos);
        tokens.push_back(line.substr(pos, end == std::string_view::npos ? end : end - pos));
        pos = line.find_first_not_of(separators, end);
    }

    return tokens;
}

/**
 *  Calls fn for every line of a text.
 */
template <typename Fn>
void forEachLine(std::string_view content, Fn&& fn)
{
    while (!content.empty())
    {
        auto newline = content.find('\n');
        fn(content.substr(0, newline));
        if (newline == std::string_view::npos)
        {
            break;
        }
        content.remove_prefix(newline + 1);
    }
}

/**
 *  Reads the entire contents of a file into a string.
 *
 *  @param      path  The filesystem path to read.
 *  @return     The file contents on success, or ProcStatError indicating
 *              why the read failed.
 */
[[nodiscard]] auto readFileContents(const std::string& path)
    -> std::expected<std::string, core::ProcStatError>
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return std::unexpected(core::ProcStatError::kFileNotFound);
    }

    std::ifstream file{path};
    if (!file.is_open())
    {
        // The file exists, so opening can only fail on access
        return std::unexpected(core::ProcStatError::kPermissionDenied);
    }

    std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    if (file.bad())
    {
        return std::unexpected(core::ProcStatError::kReadFailed);
    }

    return content;
}

// Non-guest CPU time fields, in /proc/stat column order
constexpr std::array kTickFields = {
    &CpuTimes::user,  &CpuTimes::nice, &CpuTimes::system,  &CpuTimes::idle,
    &CpuTimes::iowait, &CpuTimes::irq, &CpuTimes::softirq, &CpuTimes::steal,
};

constexpr std::array kShareFields = {
    &CpuUtilization::user,  &CpuUtilization::nice, &CpuUtilization::system,
    &CpuUtilization::idle,  &CpuUtilization::iowait, &CpuUtilization::irq,
    &CpuUtilization::softirq, &CpuUtilization::steal,
};

static_assert(kTickFields.size() == kShareFields.size());

}  // namespace

auto MemoryStats::usedFraction() const noexcept -> std::optional<double>
{
    if (!total_kb || !available_kb || *total_kb == 0)
    {
        return std::nullopt;
    }
    return 1.0 - (static_cast<double>(*available_kb) / static_cast<double>(*total_kb));
}

auto parseCpuLine(std::string_view line) -> std::optional<CpuTimes>
{
    auto tokens = tokenize(line);
    if (tokens.empty() || !tokens.front().starts_with("cpu"))
    {
        return std::nullopt;
    }

    // "cpu" or "cpu" followed by a CPU number
    auto suffix = tokens.front().substr(3);
    if (!suffix.empty() && !parseNumber(suffix))
    {
        return std::nullopt;
    }

    CpuTimes times;
    auto field = [&tokens](std::size_t index) -> std::optional<std::uint64_t>
    {
        // Token 0 is the label
        if (index + 1 >= tokens.size())
        {
            return std::nullopt;
        }
        return parseNumber(tokens[index + 1]);
    };

    times.user = field(0);
    times.nice = field(1);
    times.system = field(2);
    times.idle = field(3);
    times.iowait = field(4);
    times.irq = field(5);
    times.softirq = field(6);
    times.steal = field(7);
    times.guest = field(8);
    times.guest_nice = field(9);

    return times;
}

auto parseProcStat(std::string_view content) -> ProcStatSnapshot
{
    ProcStatSnapshot snapshot;

    forEachLine(content,
                [&snapshot](std::string_view line)
                {
                    auto tokens = tokenize(line);
                    if (tokens.empty())
                    {
                        return;
                    }

                    auto label = tokens.front();
                    if (label == "cpu")
                    {
                        if (auto times = parseCpuLine(line))
                        {
                            snapshot.cpu = *times;
                        }
                    }
                    else if (label.starts_with("cpu"))
                    {
                        auto index = parseNumber(label.substr(3));
                        auto times = parseCpuLine(line);
                        if (index && times)
                        {
                            snapshot.per_cpu[static_cast<int>(*index)] = *times;
                        }
                    }
                    else if (label == "ctxt" && tokens.size() > 1)
                    {
                        snapshot.context_switches = parseNumber(tokens[1]);
                    }
                    else if (label == "procs_running" && tokens.size() > 1)
                    {
                        snapshot.processes_running = parseNumber(tokens[1]);
                    }
                });

    return snapshot;
}

auto parseMeminfo(std::string_view content) -> MemoryStats
{
    static const std::map<std::string_view, std::optional<std::uint64_t> MemoryStats::*> kKeys = {
        {"MemTotal", &MemoryStats::total_kb},
        {"MemFree", &MemoryStats::free_kb},
        {"MemAvailable", &MemoryStats::available_kb},
        {"Buffers", &MemoryStats::buffers_kb},
        {"Cached", &MemoryStats::cached_kb},
        {"SwapTotal", &MemoryStats::swap_total_kb},
        {"SwapFree", &MemoryStats::swap_free_kb},
    };

    MemoryStats stats;

    forEachLine(content,
                [&stats](std::string_view line)
                {
                    // "MemTotal:       16318412 kB"
                    auto colon = line.find(':');
                    if (colon == std::string_view::npos)
                    {
                        return;
                    }

                    auto key = kKeys.find(trim(line.substr(0, colon)));
                    if (key == kKeys.end())
                    {
                        return;
                    }

                    auto tokens = tokenize(line.substr(colon + 1));
                    if (!tokens.empty())
                    {
                        stats.*(key->second) = parseNumber(tokens.front());
                    }
                });

    return stats;
}

auto computeUtilization(const CpuTimes& previous, const CpuTimes& current)
    -> std::optional<CpuUtilization>
{
    // Only fields present in both readings and not gone backwards contribute
    // to the totals, so every share stays within [0, 1]
    auto progressed = [&](std::size_t i) {
        const auto& before = previous.*kTickFields[i];
        const auto& after = current.*kTickFields[i];
        return before && after && *after >= *before;
    };

    std::uint64_t previous_total = 0;
    std::uint64_t current_total = 0;
    for (std::size_t i = 0; i < kTickFields.size(); ++i)
    {
        if (progressed(i))
        {
            previous_total += *(previous.*kTickFields[i]);
            current_total += *(current.*kTickFields[i]);
        }
    }

    // Counter reset or no time elapsed: discard the interval
    if (current_total <= previous_total)
    {
        return std::nullopt;
    }

    CpuUtilization utilization;
    utilization.total_ticks = current_total - previous_total;
    auto total = static_cast<double>(utilization.total_ticks);

    for (std::size_t i = 0; i < kTickFields.size(); ++i)
    {
        // A counter that went backwards is a discontinuity, not a negative delta
        if (progressed(i))
        {
            auto delta = *(current.*kTickFields[i]) - *(previous.*kTickFields[i]);
            utilization.*kShareFields[i] = static_cast<double>(delta) / total;
        }
    }

    if (utilization.idle)
    {
        double idle_share = *utilization.idle + utilization.iowait.value_or(0.0);
        utilization.busy = std::clamp(1.0 - idle_share, 0.0, 1.0);
    }

    return utilization;
}

ProcStatSource::ProcStatSource(ProcStatPaths paths) noexcept : paths_(std::move(paths)) {}

auto ProcStatSource::create(ProcStatPaths paths)
    -> std::expected<ProcStatSource, core::ProcStatError>
{
    // Fail early if the primary source is unusable
    auto content = readFileContents(paths.stat);
    if (!content)
    {
        PIPA_LOG_ERROR("cannot read {}: {}", paths.stat, core::toString(content.error()));
        return std::unexpected(content.error());
    }

    return ProcStatSource{std::move(paths)};
}

auto ProcStatSource::poll() -> std::expected<ProcStatSample, core::ProcStatError>
{
    auto stat_content = readFileContents(paths_.stat);
    if (!stat_content)
    {
        return std::unexpected(stat_content.error());
    }

    ProcStatSample sample;
    sample.snapshot = parseProcStat(*stat_content);

    if (auto meminfo_content = readFileContents(paths_.meminfo))
    {
        sample.snapshot.memory = parseMeminfo(*meminfo_content);
    }
    else
    {
        PIPA_LOG_DEBUG("cannot read {}: {}", paths_.meminfo,
                       core::toString(meminfo_content.error()));
    }

    if (previous_)
    {
        sample.utilization = computeUtilization(previous_->cpu, sample.snapshot.cpu);
        if (!sample.utilization)
        {
            PIPA_LOG_DEBUG("discarding cpu utilization interval: counters did not advance");
        }

        for (const auto& [cpu, times] : sample.snapshot.per_cpu)
        {
            auto before = previous_->per_cpu.find(cpu);
            if (before == previous_->per_cpu.end())
            {
                continue;
            }
            if (auto utilization = computeUtilization(before->second, times))
            {
                sample.per_cpu_utilization.emplace(cpu, *utilization);
            }
        }
    }

    previous_ = sample.snapshot;
    return sample;
}

void ProcStatSource::reset() noexcept
{
    previous_.reset();
}

auto ProcStatSource::paths() const noexcept -> const ProcStatPaths&
{
    return paths_;
}

}  // namespace pipa::collection
