// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/cli/progress_bar.hpp>
#include <shelf/core/task.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace shelf::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::ostream& out, std::uint64_t total, std::string_view label)
    : out_(out)
    , total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps, bool force) {
    if (finished_) return;

    int percent = total_ == 0
        ? 0
        : static_cast<int>(std::min<std::uint64_t>(current, total_) * 100 / total_);

    // Only redraw if significant progress (every 1%)
    if (!force && percent == last_percent_) return;
    last_percent_ = percent;

    auto line = render(current, speed_bps);

    // Pad over whatever the previous line left behind
    std::string padding;
    if (line.size() < width_) {
        padding.assign(width_ - line.size(), ' ');
    }
    width_ = line.size();

    out_ << '\r' << line << padding << std::flush;
    drawn_ = true;
}

void ProgressBar::finish() {
    if (finished_) return;
    update(total_, 0, true);
    finished_ = true;
    out_ << std::endl;
}

void ProgressBar::clear() {
    if (!drawn_) return;
    out_ << '\r' << std::string(width_, ' ') << '\r' << std::flush;
    drawn_ = false;
    last_percent_ = -1;
}

std::string ProgressBar::render(std::uint64_t current, std::uint64_t speed_bps) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    if (total_ == 0) {
        // Size unknown, no bar
        line += core::format_bytes(current);
    } else {
        current = std::min(current, total_);
        double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
        const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

        line += '[';
        line.append(static_cast<std::size_t>(filled), '=');
        if (filled < BAR_WIDTH) {
            line += '>';
            line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
        }
        line += ']';

        std::ostringstream pct;
        pct << ' ' << std::setw(3) << static_cast<int>(percent) << '%';
        line += pct.str();

        line += " (";
        line += core::format_bytes(current);
        line += '/';
        line += core::format_bytes(total_);
        line += ')';
    }

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);

        if (total_ > current) {
            line += " ETA: ";
            line += format_time((total_ - current) / speed_bps);
        }
    }
    return line;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return core::format_bytes(bps) + "/s";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace shelf::cli
