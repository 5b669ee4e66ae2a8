// EN: Terminal progress bar implementation
// FR: Implémentation de la barre de progression terminal

#include "progress/terminal_bar.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace AFP {
namespace Progress {

namespace {
const char kSpinnerFrames[] = {'|', '/', '-', '\\'};
} // namespace

std::string renderBarCells(double fraction, size_t width, char filled, char empty) {
    fraction = std::clamp(fraction, 0.0, 1.0);
    const auto filled_cells = static_cast<size_t>(fraction * static_cast<double>(width));
    return std::string(filled_cells, filled) + std::string(width - filled_cells, empty);
}

TerminalBar::TerminalBar(std::optional<int64_t> total, std::string title, const TerminalBarStyle& style)
    : total_(total), title_(std::move(title)), style_(style) {
    draw();
}

TerminalBar::~TerminalBar() {
    close();
}

void TerminalBar::advance(int64_t count) {
    if (!open_ || count <= 0) {
        return;
    }
    position_ += count;
    if (total_) {
        position_ = std::min(position_, *total_);
    }
    ++frame_;
    draw();
}

void TerminalBar::setText(const std::string& text) {
    if (!open_ || text == text_) {
        return;
    }
    text_ = text;
    draw();
}

void TerminalBar::close() {
    if (!open_) {
        return;
    }
    draw();
    out() << '\n';
    out().flush();
    open_ = false;
}

std::string TerminalBar::renderLine() const {
    std::ostringstream line;
    if (!title_.empty()) {
        line << title_ << ' ';
    }

    if (total_) {
        const double fraction = *total_ > 0
            ? static_cast<double>(position_) / static_cast<double>(*total_)
            : 1.0;
        line << '[' << renderBarCells(fraction, style_.bar_width, style_.filled_char, style_.empty_char) << ']';
        if (style_.show_percentage) {
            line << ' ' << std::fixed << std::setprecision(1) << std::setw(5) << fraction * 100.0 << '%';
        }
        if (style_.show_count) {
            line << ' ' << position_ << '/' << *total_;
        }
    } else {
        line << kSpinnerFrames[frame_ % sizeof(kSpinnerFrames)];
        if (style_.show_count) {
            line << ' ' << position_ << " items";
        }
    }

    if (!text_.empty()) {
        line << ' ' << text_;
    }
    return line.str();
}

// EN: Overwrites the previous frame in place; pads with spaces when the line got shorter.
// FR: Écrase l'image précédente sur place ; complète avec des espaces si la ligne a raccourci.
void TerminalBar::draw() {
    const std::string line = renderLine();
    out() << '\r' << line;
    if (line.size() < last_line_length_) {
        out() << std::string(last_line_length_ - line.size(), ' ');
    }
    out().flush();
    last_line_length_ = line.size();
}

std::ostream& TerminalBar::out() const {
    return style_.output_stream ? *style_.output_stream : std::cerr;
}

} // namespace Progress
} // namespace AFP
