// EN: Terminal progress bar - scoped single-line renderer used by TerminalBarConsumer
// FR: Barre de progression terminal - rendu sur une ligne à portée limitée utilisé par TerminalBarConsumer

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace AFP {
namespace Progress {

// EN: Rendering options for a terminal bar
// FR: Options de rendu d'une barre terminal
struct TerminalBarStyle {
    std::ostream* output_stream = nullptr;  // EN: nullptr means std::cerr / FR: nullptr signifie std::cerr
    size_t bar_width = 40;
    bool show_percentage = true;
    bool show_count = true;
    char filled_char = '#';
    char empty_char = '-';
};

// EN: Build the "#####-----" cell string for a fraction in [0, 1]
// FR: Construit la chaîne de cellules "#####-----" pour une fraction dans [0, 1]
std::string renderBarCells(double fraction, size_t width, char filled = '#', char empty = '-');

// EN: Render handle. Opening draws the first frame, close() draws the last one and ends the line.
//     close() is idempotent and the destructor calls it, so a bar is released exactly once.
// FR: Poignée de rendu. L'ouverture dessine la première image, close() dessine la dernière et termine la ligne.
//     close() est idempotent et le destructeur l'appelle, une barre est donc libérée exactement une fois.
class TerminalBar {
public:
    TerminalBar(std::optional<int64_t> total, std::string title, const TerminalBarStyle& style = {});
    ~TerminalBar();

    TerminalBar(const TerminalBar&) = delete;
    TerminalBar& operator=(const TerminalBar&) = delete;

    void advance(int64_t count = 1);
    void setText(const std::string& text);
    void close();

    int64_t getPosition() const { return position_; }
    std::optional<int64_t> getTotal() const { return total_; }
    bool isOpen() const { return open_; }
    bool isIndeterminate() const { return !total_.has_value(); }
    const std::string& getTitle() const { return title_; }

    // EN: Current frame without the leading carriage return
    // FR: Image courante sans le retour chariot initial
    std::string renderLine() const;

private:
    void draw();
    std::ostream& out() const;

    std::optional<int64_t> total_;
    std::string title_;
    TerminalBarStyle style_;
    std::string text_;
    int64_t position_ = 0;
    size_t frame_ = 0;
    size_t last_line_length_ = 0;
    bool open_ = true;
};

} // namespace Progress
} // namespace AFP
