// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <vodfetch/core/progress.hpp>
#include <cstddef>
#include <string>

namespace vodfetch::cli {

// Single-line terminal rendering of the worker's ProgressState.
// Falls back to a spinner while the total size is unknown.
class ProgressBar {
public:
    explicit ProgressBar(int width = 30) noexcept;

    // Redraw if the visible line changed
    void update(const core::ProgressState& state);

    // Terminate the line so later output starts clean
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::string render(const core::ProgressState& state) const;

private:
    [[nodiscard]] std::string render_bar(int percent) const;
    [[nodiscard]] static std::string format_mb(double mb);

    std::string last_line_;
    std::size_t frame_{0};
    int width_;
    bool drawn_{false};
};

} // namespace vodfetch::cli
