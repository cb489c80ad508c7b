// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vodfetch/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace vodfetch::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

ProgressBar::ProgressBar(int width) noexcept
    : width_(width) {}

void ProgressBar::update(const core::ProgressState& state) {
    std::string line = render(state);
    if (line == last_line_ && state.percent) {
        return;
    }
    last_line_ = line;
    ++frame_;

    // Pad so a shorter line overwrites the previous one
    std::cout << "\r" << line << std::string(10, ' ') << std::flush;
    drawn_ = true;
}

void ProgressBar::finish() noexcept {
    if (!drawn_) return;
    drawn_ = false;
    last_line_.clear();
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    if (!drawn_) return;
    std::cout << "\r" << std::string(last_line_.size() + 10, ' ') << "\r" << std::flush;
    drawn_ = false;
    last_line_.clear();
}

std::string ProgressBar::render(const core::ProgressState& state) const {
    std::string line;
    if (!state.current_file.empty()) {
        line += state.current_file;
        line += ": ";
    }

    if (state.percent && state.total_bytes > 0) {
        int pct = std::clamp(*state.percent, 0, 100);
        line += render_bar(pct);
        line += ' ';
        if (pct < 100) line += ' ';
        if (pct < 10) line += ' ';
        line += std::to_string(pct) + "%";
        line += " (" + format_mb(state.downloaded_mb()) + "/" + format_mb(state.total_mb()) + " MB)";
    } else {
        line += SPINNER_FRAMES[frame_ % 4];
        line += ' ';
        line += format_mb(state.downloaded_mb()) + " MB";
    }

    line += ' ';
    line += state.status_text();
    if (state.queue_depth > 0) {
        line += " [" + std::to_string(state.queue_depth) + " queued]";
    }
    return line;
}

std::string ProgressBar::render_bar(int percent) const {
    const int filled = static_cast<int>(std::round(width_ * percent / 100.0));
    const int empty = width_ - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(std::max(empty, 0)), ' ');
    bar += ']';
    return bar;
}

std::string ProgressBar::format_mb(double mb) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << mb;
    return ss.str();
}

} // namespace vodfetch::cli
