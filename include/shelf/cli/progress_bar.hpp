// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace shelf::cli {

// Single-line progress bar for the terminal
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out, std::uint64_t total = 0, std::string_view label = {});

    // Redraw when the whole percentage changed, or forced
    void update(std::uint64_t current, std::uint64_t speed_bps = 0, bool force = false);

    // Finish the progress bar
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] std::string render(std::uint64_t current, std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::ostream& out_;
    std::uint64_t total_{0};
    int last_percent_{-1};
    std::string label_;
    bool drawn_{false};
    bool finished_{false};
    std::size_t width_{0};
};

} // namespace shelf::cli
